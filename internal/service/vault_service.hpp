#pragma once

#include <functional>

#include "chunkvault/v1.hpp"
#include "internal/transfer/cancellation.hpp"
#include "service_context.hpp"

namespace chunkvault::service {

// Receives progress and the final result of a streaming transfer.
using EventSink = std::function<void(const chunkvault::v1::TransferEvent&)>;

class VaultService {
 public:
  explicit VaultService(ServiceContext ctx);

  void Upload(const chunkvault::v1::UploadRequest& req, transfer::CancellationToken& cancel, const EventSink& sink);

  void Download(const chunkvault::v1::DownloadRequest& req, transfer::CancellationToken& cancel, const EventSink& sink);

  chunkvault::v1::StatResponse Stat(const chunkvault::v1::StatRequest& req);

  chunkvault::v1::ListResponse List(const chunkvault::v1::ListRequest& req);

  chunkvault::v1::ImportResponse Import(const chunkvault::v1::ImportRequest& req);

  chunkvault::v1::ExportResponse Export(const chunkvault::v1::ExportRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace chunkvault::service
