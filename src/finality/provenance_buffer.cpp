/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "finality/provenance_buffer.hpp"

#include <stdexcept>

#include <boost/assert.hpp>

namespace rollnode::finality {

  ProvenanceBuffer::ProvenanceBuffer(size_t capacity) {
    if (capacity == 0) {
      throw std::invalid_argument(
          "Provenance buffer capacity must be positive");
    }
    slots_.resize(capacity);
  }

  const ProvenanceLink &ProvenanceBuffer::operator[](size_t index) const {
    BOOST_ASSERT(index < size_);
    return slots_[physical(index)];
  }

  const ProvenanceLink &ProvenanceBuffer::front() const {
    BOOST_ASSERT(not empty());
    return slots_[start_];
  }

  const ProvenanceLink &ProvenanceBuffer::back() const {
    BOOST_ASSERT(not empty());
    return slots_[physical(size_ - 1)];
  }

  ProvenanceLink &ProvenanceBuffer::back() {
    BOOST_ASSERT(not empty());
    return slots_[physical(size_ - 1)];
  }

  std::optional<ProvenanceLink> ProvenanceBuffer::push(ProvenanceLink link) {
    std::optional<ProvenanceLink> evicted;
    if (size_ == capacity()) {
      evicted = std::move(slots_[start_]);
      start_ = physical(1);
      --size_;
    }
    slots_[physical(size_)] = std::move(link);
    ++size_;
    return evicted;
  }

  void ProvenanceBuffer::clear() {
    start_ = 0;
    size_ = 0;
  }

  std::vector<ProvenanceLink> ProvenanceBuffer::toVector() const {
    std::vector<ProvenanceLink> links;
    links.reserve(size_);
    forEach([&](const ProvenanceLink &link) { links.push_back(link); });
    return links;
  }

}  // namespace rollnode::finality
