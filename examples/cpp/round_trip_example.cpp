#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "client/cpp/vault_client.h"

namespace {

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

int main(int argc, char** argv) {
  // Allow overriding the service endpoint for remote or containerized runs.
  const std::string target = argc > 1 ? argv[1] : "localhost:50061";

  chunkvault::client::VaultClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  // The daemon reads the source from its own filesystem, so this example
  // assumes it runs on the same host.
  const auto source = std::filesystem::temp_directory_path() / "chunkvault-round-trip.bin";
  {
    std::ofstream out(source, std::ios::binary | std::ios::trunc);
    for (int i = 0; i < 3 * 1024 * 1024 + 17; ++i) {
      out.put(static_cast<char>(i & 0xFF));
    }
  }

  // Small chunks force a multi-chunk upload even for a 3 MiB file.
  constexpr uint64_t kChunkSize = 1024 * 1024;
  auto               uploaded   = client.Upload(source.string(), kChunkSize);
  if (!uploaded.ok()) {
    std::cerr << "Upload failed: " << uploaded.status().ToString() << '\n';
    return 1;
  }
  std::cout << "Uploaded id=" << uploaded->id() << " size=" << uploaded->size_bytes() << " chunks=" << uploaded->urls_size() << '\n';

  const auto destination = std::filesystem::temp_directory_path() / "chunkvault-round-trip-out";
  auto       downloaded  = client.Download(uploaded->id(), destination.string());
  if (!downloaded.ok()) {
    std::cerr << "Download failed: " << downloaded.status().ToString() << '\n';
    return 1;
  }

  const bool same = ReadFile(source) == ReadFile(downloaded->path());
  std::cout << "Downloaded to " << downloaded->path() << (same ? " (identical)" : " (MISMATCH)") << '\n';

  std::error_code ec;
  std::filesystem::remove(source, ec);
  return same ? 0 : 1;
}
