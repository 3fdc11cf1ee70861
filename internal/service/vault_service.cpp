#include "vault_service.hpp"

#include <chrono>
#include <optional>
#include <type_traits>
#include <utility>

#include "internal/core/vault.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chunkvault::service {

using namespace chunkvault::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, std::optional<uint64_t> file_id, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&started_at] {
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      CHUNKVAULT_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::IntField("elapsed_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      CHUNKVAULT_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::IntField("elapsed_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    CHUNKVAULT_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                        file_id ? observability::UintField("file_id", *file_id)
                                                : observability::StringField("file_id", ""),
                                        observability::IntField("elapsed_ms", elapsed_ms())});
    throw;
  }
}

registry::FileId RequireFileId(uint64_t value) {
  if (value == 0) {
    throw util::InvalidArgument("file_id must be > 0");
  }
  return value;
}

FileRecord ToProto(const core::StoredFile& file) {
  FileRecord out;
  out.set_id(file.id);
  out.set_filename(file.record.filename);
  out.set_size_bytes(file.record.size);
  for (const auto& url : file.record.urls) {
    out.add_urls(url);
  }
  return out;
}

transfer::ProgressCallback ProgressEvents(const EventSink& sink) {
  if (!sink) {
    return {};
  }
  return [&sink](const transfer::ProgressSnapshot& snapshot) {
    TransferEvent event;
    auto*         progress = event.mutable_progress();
    progress->set_bytes_done(snapshot.bytes_done);
    progress->set_bytes_total(snapshot.bytes_total);
    progress->set_chunks_done(snapshot.chunks_done);
    progress->set_chunks_total(snapshot.chunks_total);
    sink(event);
  };
}

} // namespace

VaultService::VaultService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void VaultService::Upload(const UploadRequest& req, transfer::CancellationToken& cancel, const EventSink& sink) {
  ObserveRpc("Upload", std::nullopt, [&] {
    if (req.source_path().empty()) {
      throw util::InvalidArgument("source_path is required");
    }

    auto stored = ctx_.vault->Upload(req.source_path(), req.chunk_size_bytes(), cancel, ProgressEvents(sink));

    if (sink) {
      TransferEvent event;
      *event.mutable_uploaded() = ToProto(stored);
      sink(event);
    }
  });
}

void VaultService::Download(const DownloadRequest& req, transfer::CancellationToken& cancel, const EventSink& sink) {
  ObserveRpc("Download", req.file_id(), [&] {
    const auto id = RequireFileId(req.file_id());

    auto downloaded = ctx_.vault->Download(id, req.destination_dir(), cancel, ProgressEvents(sink));

    if (sink) {
      TransferEvent event;
      auto*         result = event.mutable_downloaded();
      result->set_path(downloaded.path.string());
      *result->mutable_record() = ToProto(downloaded.file);
      sink(event);
    }
  });
}

StatResponse VaultService::Stat(const StatRequest& req) {
  return ObserveRpc("Stat", req.file_id(), [&] {
    StatResponse resp;
    *resp.mutable_record() = ToProto(ctx_.vault->Stat(RequireFileId(req.file_id())));
    return resp;
  });
}

ListResponse VaultService::List(const ListRequest&) {
  return ObserveRpc("List", std::nullopt, [&] {
    ListResponse resp;
    for (const auto& file : ctx_.vault->List()) {
      auto* summary = resp.add_files();
      summary->set_id(file.id);
      summary->set_filename(file.filename);
      summary->set_size_bytes(file.size_bytes);
      summary->set_chunk_count(static_cast<uint32_t>(file.chunk_count));
    }
    return resp;
  });
}

ImportResponse VaultService::Import(const ImportRequest& req) {
  return ObserveRpc("Import", std::nullopt, [&] {
    if (req.document_path().empty()) {
      throw util::InvalidArgument("document_path is required");
    }

    ImportResponse resp;
    for (auto id : ctx_.vault->Import(req.document_path())) {
      resp.add_file_ids(id);
    }
    return resp;
  });
}

ExportResponse VaultService::Export(const ExportRequest& req) {
  return ObserveRpc("Export", std::nullopt, [&] {
    if (req.destination_dir().empty()) {
      throw util::InvalidArgument("destination_dir is required");
    }

    std::vector<registry::FileId> ids;
    for (auto id : req.file_ids()) {
      ids.push_back(RequireFileId(id));
    }

    ExportResponse resp;
    resp.set_path(ctx_.vault->Export(req.destination_dir(), ids, req.base_name()).string());
    return resp;
  });
}

} // namespace chunkvault::service
