#include "client/cpp/vault_client.h"

#include <charconv>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include <grpcpp/client_context.h>

namespace chunkvault::client {

namespace {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
    return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
  }
  if (status.error_code() == grpc::StatusCode::INVALID_ARGUMENT) {
    return arrow::Status::Invalid(std::string(action), " failed: ", status.error_message());
  }
  return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
}

template <typename Reader, typename Extract>
auto DrainTransfer(Reader& reader, std::string_view action, const VaultClient::ProgressHandler& on_progress, Extract&& extract)
    -> arrow::Result<std::decay_t<decltype(extract(std::declval<const chunkvault::v1::TransferEvent&>()))>> {
  using ResultType = std::decay_t<decltype(extract(std::declval<const chunkvault::v1::TransferEvent&>()))>;

  chunkvault::v1::TransferEvent event;
  std::optional<ResultType>     result;
  while (reader->Read(&event)) {
    if (event.has_progress()) {
      if (on_progress) on_progress(event.progress());
      continue;
    }
    result = extract(event);
  }

  ARROW_RETURN_NOT_OK(GrpcToArrow(reader->Finish(), action));
  if (!result) {
    return arrow::Status::IOError(std::string(action), " finished without a result");
  }
  return *std::move(result);
}

arrow::Status ValidateFileId(uint64_t file_id) {
  if (file_id == 0) {
    return arrow::Status::Invalid("file id must be > 0");
  }
  return arrow::Status::OK();
}

} // namespace

arrow::Result<uint64_t> ParseFileId(std::string_view text) {
  if (text.empty()) {
    return arrow::Status::Invalid("file id is empty");
  }
  for (char c : text) {
    if (c < '0' || c > '9') {
      return arrow::Status::Invalid("file id must be decimal digits: ", text);
    }
  }

  uint64_t value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || end != text.data() + text.size()) {
    return arrow::Status::Invalid("file id out of range: ", text);
  }
  if (value == 0) {
    return arrow::Status::Invalid("file id must be > 0");
  }
  return value;
}

arrow::Result<std::string> ResolveLocalPath(const std::string& path) {
  if (path.empty()) {
    return path;
  }
  std::error_code ec;
  auto            absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    return arrow::Status::IOError("cannot resolve path '", path, "': ", ec.message());
  }
  return absolute.lexically_normal().string();
}

VaultClient::VaultClient(std::shared_ptr<grpc::Channel> channel)
    : stub_(chunkvault::v1::VaultService::NewStub(std::move(channel))) {}

arrow::Result<chunkvault::v1::FileRecord> VaultClient::Upload(const std::string& source_path, uint64_t chunk_size_bytes,
                                                              const ProgressHandler& on_progress) const {
  chunkvault::v1::UploadRequest req;
  req.set_source_path(source_path);
  req.set_chunk_size_bytes(chunk_size_bytes);

  grpc::ClientContext ctx;
  auto reader = stub_->Upload(&ctx, req);
  return DrainTransfer(reader, "Upload", on_progress, [](const chunkvault::v1::TransferEvent& event) { return event.uploaded(); });
}

arrow::Result<chunkvault::v1::DownloadResult> VaultClient::Download(uint64_t file_id, const std::string& destination_dir,
                                                                    const ProgressHandler& on_progress) const {
  ARROW_RETURN_NOT_OK(ValidateFileId(file_id));

  chunkvault::v1::DownloadRequest req;
  req.set_file_id(file_id);
  req.set_destination_dir(destination_dir);

  grpc::ClientContext ctx;
  auto reader = stub_->Download(&ctx, req);
  return DrainTransfer(reader, "Download", on_progress, [](const chunkvault::v1::TransferEvent& event) { return event.downloaded(); });
}

arrow::Result<chunkvault::v1::FileRecord> VaultClient::Stat(uint64_t file_id) const {
  ARROW_RETURN_NOT_OK(ValidateFileId(file_id));

  chunkvault::v1::StatRequest req;
  req.set_file_id(file_id);

  chunkvault::v1::StatResponse resp;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Stat(&ctx, req, &resp), "Stat"));
  return resp.record();
}

arrow::Result<std::vector<chunkvault::v1::FileSummary>> VaultClient::List() const {
  chunkvault::v1::ListRequest  req;
  chunkvault::v1::ListResponse resp;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->List(&ctx, req, &resp), "List"));
  return std::vector<chunkvault::v1::FileSummary>(resp.files().begin(), resp.files().end());
}

arrow::Result<std::vector<uint64_t>> VaultClient::Import(const std::string& document_path) const {
  chunkvault::v1::ImportRequest req;
  req.set_document_path(document_path);

  chunkvault::v1::ImportResponse resp;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Import(&ctx, req, &resp), "Import"));
  return std::vector<uint64_t>(resp.file_ids().begin(), resp.file_ids().end());
}

arrow::Result<std::string> VaultClient::Export(const std::string& destination_dir, const std::vector<uint64_t>& file_ids,
                                               const std::string& base_name) const {
  chunkvault::v1::ExportRequest req;
  req.set_destination_dir(destination_dir);
  req.set_base_name(base_name);
  for (auto id : file_ids) {
    ARROW_RETURN_NOT_OK(ValidateFileId(id));
    req.add_file_ids(id);
  }

  chunkvault::v1::ExportResponse resp;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Export(&ctx, req, &resp), "Export"));
  return resp.path();
}

} // namespace chunkvault::client
