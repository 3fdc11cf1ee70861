#include "vault_server.hpp"

#include <mutex>

#include "disconnect_watcher.hpp"
#include "grpc_error.hpp"

namespace chunkvault::grpc {

namespace {

// Progress arrives from transfer worker threads; writes are serialized.
class StreamSink {
 public:
  StreamSink(::grpc::ServerContext* context, ::grpc::ServerWriter<chunkvault::v1::TransferEvent>* writer,
             transfer::CancellationToken& cancel)
      : context_(context), writer_(writer), cancel_(cancel) {
  }

  void operator()(const chunkvault::v1::TransferEvent& event) {
    std::lock_guard lock(mutex_);
    if (cancel_.IsCancelled()) {
      return;
    }
    if (context_->IsCancelled() || !writer_->Write(event)) {
      cancel_.Cancel();
    }
  }

 private:
  ::grpc::ServerContext*                               context_;
  ::grpc::ServerWriter<chunkvault::v1::TransferEvent>* writer_;
  transfer::CancellationToken&                         cancel_;
  std::mutex                                           mutex_;
};

} // namespace

VaultServer::VaultServer(std::shared_ptr<chunkvault::service::VaultService> svc) : service_(std::move(svc)) {
}

::grpc::Status VaultServer::Upload(::grpc::ServerContext* context, const chunkvault::v1::UploadRequest* req,
                                   ::grpc::ServerWriter<chunkvault::v1::TransferEvent>* writer) {
  transfer::CancellationToken cancel;
  StreamSink                  sink(context, writer, cancel);
  DisconnectWatcher           watcher([context] { return context->IsCancelled(); }, cancel);
  try {
    service_->Upload(*req, cancel, [&sink](const chunkvault::v1::TransferEvent& event) { sink(event); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VaultServer::Download(::grpc::ServerContext* context, const chunkvault::v1::DownloadRequest* req,
                                     ::grpc::ServerWriter<chunkvault::v1::TransferEvent>* writer) {
  transfer::CancellationToken cancel;
  StreamSink                  sink(context, writer, cancel);
  DisconnectWatcher           watcher([context] { return context->IsCancelled(); }, cancel);
  try {
    service_->Download(*req, cancel, [&sink](const chunkvault::v1::TransferEvent& event) { sink(event); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VaultServer::Stat(::grpc::ServerContext*, const chunkvault::v1::StatRequest* req, chunkvault::v1::StatResponse* resp) {
  try {
    *resp = service_->Stat(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VaultServer::List(::grpc::ServerContext*, const chunkvault::v1::ListRequest* req, chunkvault::v1::ListResponse* resp) {
  try {
    *resp = service_->List(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VaultServer::Import(::grpc::ServerContext*, const chunkvault::v1::ImportRequest* req,
                                   chunkvault::v1::ImportResponse* resp) {
  try {
    *resp = service_->Import(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VaultServer::Export(::grpc::ServerContext*, const chunkvault::v1::ExportRequest* req,
                                   chunkvault::v1::ExportResponse* resp) {
  try {
    *resp = service_->Export(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace chunkvault::grpc
