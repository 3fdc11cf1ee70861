#pragma once

#include <memory>

namespace chunkvault::core {
class Vault;
}

namespace chunkvault::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<chunkvault::core::Vault> vault;
};

} // namespace chunkvault::service
