#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkvault::transport {

/*
  Ordered list of upload endpoints.

  Chunk i always goes to endpoints[i % n]; the mapping depends on the
  ordinal alone, never on completion order or endpoint health.
*/
class EndpointPool {
 public:
  // Blank entries are rejected with util::InvalidArgument. An empty pool is
  // allowed here and fails on first use.
  explicit EndpointPool(std::vector<std::string> endpoints);

  // Throws util::EmptyPool.
  const std::string& Assign(uint64_t ordinal) const;

  size_t IndexFor(uint64_t ordinal) const;

  // Throws util::EmptyPool.
  void RequireNonEmpty() const;

  size_t size() const {
    return endpoints_.size();
  }

  bool empty() const {
    return endpoints_.empty();
  }

 private:
  std::vector<std::string> endpoints_;
};

} // namespace chunkvault::transport
