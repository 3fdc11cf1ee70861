#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "chunkvault/v1.hpp"
#include "internal/service/vault_service.hpp"

namespace chunkvault::grpc {

/*
  Thin adapter from VaultService RPCs to service::VaultService.

  Streaming transfers are cancelled when the client goes away.
*/
class VaultServer final : public chunkvault::v1::VaultService::Service {
 public:
  explicit VaultServer(std::shared_ptr<chunkvault::service::VaultService> svc);

  ::grpc::Status Upload(::grpc::ServerContext*, const chunkvault::v1::UploadRequest*,
                        ::grpc::ServerWriter<chunkvault::v1::TransferEvent>*) override;

  ::grpc::Status Download(::grpc::ServerContext*, const chunkvault::v1::DownloadRequest*,
                          ::grpc::ServerWriter<chunkvault::v1::TransferEvent>*) override;

  ::grpc::Status Stat(::grpc::ServerContext*, const chunkvault::v1::StatRequest*, chunkvault::v1::StatResponse*) override;

  ::grpc::Status List(::grpc::ServerContext*, const chunkvault::v1::ListRequest*, chunkvault::v1::ListResponse*) override;

  ::grpc::Status Import(::grpc::ServerContext*, const chunkvault::v1::ImportRequest*, chunkvault::v1::ImportResponse*) override;

  ::grpc::Status Export(::grpc::ServerContext*, const chunkvault::v1::ExportRequest*, chunkvault::v1::ExportResponse*) override;

 private:
  std::shared_ptr<chunkvault::service::VaultService> service_;
};

} // namespace chunkvault::grpc
