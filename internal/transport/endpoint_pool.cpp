#include "endpoint_pool.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace chunkvault::transport {

EndpointPool::EndpointPool(std::vector<std::string> endpoints) : endpoints_(std::move(endpoints)) {
  for (size_t i = 0; i < endpoints_.size(); ++i) {
    if (endpoints_[i].find_first_not_of(" \t\r\n") == std::string::npos) {
      throw util::InvalidArgument("endpoint #" + std::to_string(i) + " is blank");
    }
  }
}

void EndpointPool::RequireNonEmpty() const {
  if (endpoints_.empty()) {
    throw util::EmptyPool("no upload endpoints configured");
  }
}

size_t EndpointPool::IndexFor(uint64_t ordinal) const {
  RequireNonEmpty();
  return static_cast<size_t>(ordinal % endpoints_.size());
}

const std::string& EndpointPool::Assign(uint64_t ordinal) const {
  return endpoints_[IndexFor(ordinal)];
}

} // namespace chunkvault::transport
