#include "factory.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/vault.hpp"
#include "internal/grpc/vault_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/id_allocator.hpp"
#include "internal/registry/registry.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/vault_service.hpp"
#include "internal/transfer/transfer_engine.hpp"
#include "internal/transport/endpoint_pool.hpp"
#include "internal/transport/http_transport.hpp"

namespace chunkvault::factory {

namespace {

transport::EndpointPool BuildPool(const chunkvault::runtime::config::EndpointConfig& config) {
  std::vector<std::string> urls(config.urls().begin(), config.urls().end());
  if (urls.empty()) {
    CHUNKVAULT_LOG_WARN("No upload endpoints configured; uploads will fail until endpoints.urls is set");
  }
  return transport::EndpointPool(std::move(urls));
}

std::shared_ptr<transport::BlobTransport> BuildTransport(const chunkvault::runtime::config::RuntimeConfig& config) {
  transport::HttpTransportOptions options;
  options.connect_timeout = std::chrono::milliseconds{config.transfer().connect_timeout_ms()};
  options.request_timeout = std::chrono::milliseconds{config.transfer().request_timeout_ms()};
  options.username        = config.endpoints().username();
  return std::make_shared<transport::HttpBlobTransport>(std::move(options));
}

transfer::TransferOptions BuildTransferOptions(const chunkvault::runtime::config::TransferConfig& config) {
  transfer::TransferOptions options;
  options.upload_batch_size    = config.upload_batch_size();
  options.download_concurrency = config.download_concurrency();
  options.retry                = transfer::RetryPolicy::FromConfig(config.retry());
  return options;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const chunkvault::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Registry
  // ------------------------------------------------------------------
  auto registry  = std::make_shared<registry::Registry>(config.registry().path());
  auto allocator = std::shared_ptr<registry::IdAllocator>(registry::MakeIdAllocator(config.ids()));

  const auto existing = registry->Ids();
  CHUNKVAULT_LOG_INFO("Registry loaded", {observability::StringField("path", config.registry().path()),
                                          observability::UintField("files", existing.size())});

  // ------------------------------------------------------------------
  // Transfer
  // ------------------------------------------------------------------
  auto engine = std::make_shared<transfer::TransferEngine>(BuildTransport(config), BuildPool(config.endpoints()),
                                                           BuildTransferOptions(config.transfer()));

  core::VaultOptions vault_options;
  vault_options.work_dir         = config.storage().work_dir();
  vault_options.download_dir     = config.storage().download_dir();
  vault_options.chunk_size_bytes = config.transfer().chunk_size_bytes();

  app.vault = std::make_shared<core::Vault>(registry, allocator, engine, std::move(vault_options));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.vault = app.vault;

  auto vault_service = std::make_shared<service::VaultService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::VaultServer>(vault_service));

  return app;
}

} // namespace chunkvault::factory
