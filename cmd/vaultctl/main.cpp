#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "client/cpp/vault_client.h"

using chunkvault::client::ParseFileId;
using chunkvault::client::ResolveLocalPath;
using chunkvault::client::VaultClient;

namespace {

using Args = std::vector<std::string>;

struct Command {
  std::string_view name;
  std::string_view usage;
  size_t           min_args;
  arrow::Status (*run)(const VaultClient& client, const Args& args);
};

void PrintRecord(const chunkvault::v1::FileRecord& record) {
  std::cout << "id=" << record.id() << "\n";
  std::cout << "filename=" << record.filename() << "\n";
  std::cout << "size=" << record.size_bytes() << "\n";
  std::cout << "chunks=" << record.urls_size() << "\n";
}

void PrintProgress(const chunkvault::v1::TransferProgress& progress) {
  std::cerr << "\r" << progress.bytes_done() << "/" << progress.bytes_total() << " bytes, " << progress.chunks_done() << "/"
            << progress.chunks_total() << " chunks" << std::flush;
}

arrow::Result<uint64_t> ParseChunkSize(const std::string& text) {
  auto parsed = ParseFileId(text);
  if (!parsed.ok()) {
    return arrow::Status::Invalid("chunk size must be a positive byte count: ", text);
  }
  return *parsed;
}

// ------------------------------------------------------------

arrow::Status RunUpload(const VaultClient& client, const Args& args) {
  uint64_t chunk_size = 0;
  if (args.size() >= 2) {
    ARROW_ASSIGN_OR_RAISE(chunk_size, ParseChunkSize(args[1]));
  }

  ARROW_ASSIGN_OR_RAISE(auto source, ResolveLocalPath(args[0]));

  auto record = client.Upload(source, chunk_size, PrintProgress);
  std::cerr << "\n";
  ARROW_RETURN_NOT_OK(record.status());

  PrintRecord(*record);
  return arrow::Status::OK();
}

arrow::Status RunDownload(const VaultClient& client, const Args& args) {
  ARROW_ASSIGN_OR_RAISE(auto id, ParseFileId(args[0]));
  ARROW_ASSIGN_OR_RAISE(auto destination, ResolveLocalPath(args.size() >= 2 ? args[1] : ""));

  auto result = client.Download(id, destination, PrintProgress);
  std::cerr << "\n";
  ARROW_RETURN_NOT_OK(result.status());

  std::cout << "path=" << result->path() << "\n";
  std::cout << "size=" << result->record().size_bytes() << "\n";
  return arrow::Status::OK();
}

arrow::Status RunStat(const VaultClient& client, const Args& args) {
  ARROW_ASSIGN_OR_RAISE(auto id, ParseFileId(args[0]));
  ARROW_ASSIGN_OR_RAISE(auto record, client.Stat(id));

  PrintRecord(record);
  for (int i = 0; i < record.urls_size(); ++i) {
    std::cout << "chunk[" << i << "]=" << record.urls(i) << "\n";
  }
  return arrow::Status::OK();
}

arrow::Status RunList(const VaultClient& client, const Args&) {
  ARROW_ASSIGN_OR_RAISE(auto files, client.List());

  for (const auto& file : files) {
    std::cout << file.id() << "\t" << file.size_bytes() << "\t" << file.chunk_count() << "\t" << file.filename() << "\n";
  }
  return arrow::Status::OK();
}

arrow::Status RunImport(const VaultClient& client, const Args& args) {
  ARROW_ASSIGN_OR_RAISE(auto document, ResolveLocalPath(args[0]));
  ARROW_ASSIGN_OR_RAISE(auto ids, client.Import(document));

  std::cout << "imported=" << ids.size() << "\n";
  for (auto id : ids) {
    std::cout << id << "\n";
  }
  return arrow::Status::OK();
}

arrow::Status RunExport(const VaultClient& client, const Args& args) {
  std::vector<uint64_t> ids;
  for (size_t i = 2; i < args.size(); ++i) {
    ARROW_ASSIGN_OR_RAISE(auto id, ParseFileId(args[i]));
    ids.push_back(id);
  }

  ARROW_ASSIGN_OR_RAISE(auto destination, ResolveLocalPath(args[0]));
  ARROW_ASSIGN_OR_RAISE(auto path, client.Export(destination, ids, args[1]));
  std::cout << "path=" << path << "\n";
  return arrow::Status::OK();
}

const std::vector<Command>& Commands() {
  static const std::vector<Command> kCommands = {
      {"upload", "upload <path> [chunk_size]", 1, RunUpload},
      {"download", "download <id> [dir]", 1, RunDownload},
      {"stat", "stat <id>", 1, RunStat},
      {"list", "list", 0, RunList},
      {"import", "import <path>", 1, RunImport},
      {"export", "export <dir> <base_name> [id...]", 2, RunExport},
  };
  return kCommands;
}

void Usage() {
  std::cout << "Usage:\n";
  for (const auto& command : Commands()) {
    std::cout << "  vaultctl <addr> " << command.usage << "\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string addr = argv[1];
  const std::string name = argv[2];
  const Args        args(argv + 3, argv + argc);

  for (const auto& command : Commands()) {
    if (command.name != name) continue;

    if (args.size() < command.min_args) {
      std::cerr << "usage: vaultctl <addr> " << command.usage << "\n";
      return 1;
    }

    VaultClient client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()));

    auto status = command.run(client, args);
    if (!status.ok()) {
      std::cerr << status.ToString() << "\n";
      return 2;
    }
    return 0;
  }

  std::cerr << "unknown command: " << name << "\n";
  Usage();
  return 1;
}
