#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using chunkvault::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "chunkvault_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestEmptyFileYieldsDefaults() {
  const auto config = ConfigLoader::LoadFromYaml(WriteYaml("empty", "").string());

  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.registry().path() == "files_cache.json");
  assert(config.ids().strategy() == chunkvault::runtime::config::ID_STRATEGY_RANDOM);
  assert(config.ids().min_id() == 1);
  assert(config.ids().max_id() == 99'999'999);
  assert(config.endpoints().urls_size() == 0);
  assert(config.endpoints().username() == "chunkvault");
  assert(config.transfer().chunk_size_bytes() == 24'000'000);
  assert(config.transfer().upload_batch_size() == 4);
  assert(config.transfer().download_concurrency() == 8);
  assert(config.transfer().retry().max_attempts() == 3);
  assert(config.transfer().retry().backoff_multiplier() == 2.0);
  assert(config.storage().work_dir() == "./chunkvault-work");
}

void TestExplicitValuesAreKept() {
  const auto yaml_path = WriteYaml("explicit",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
registry:
  path: "/var/lib/chunkvault/files.json"
ids:
  strategy: ID_STRATEGY_SEQUENTIAL
  min_id: 1
  max_id: 9999
endpoints:
  urls:
    - "https://chat.example/api/webhooks/1/a"
    - "https://chat.example/api/webhooks/2/b"
transfer:
  chunk_size_bytes: 8000000
  upload_batch_size: 2
  download_concurrency: 0
  retry:
    max_attempts: 5
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.registry().path() == "/var/lib/chunkvault/files.json");
  assert(config.ids().strategy() == chunkvault::runtime::config::ID_STRATEGY_SEQUENTIAL);
  assert(config.ids().max_id() == 9999);
  assert(config.endpoints().urls_size() == 2);
  assert(config.endpoints().urls(1) == "https://chat.example/api/webhooks/2/b");
  assert(config.transfer().chunk_size_bytes() == 8'000'000);
  assert(config.transfer().upload_batch_size() == 2);
  // An explicit 0 survives defaulting: fetch every chunk at once.
  assert(config.transfer().has_download_concurrency());
  assert(config.transfer().download_concurrency() == 0);
  assert(config.transfer().retry().max_attempts() == 5);
  assert(config.transfer().retry().initial_backoff_ms() == 500);
}

void TestQuotedScalarStaysString() {
  const auto yaml_path = WriteYaml("quoted_scalar",
                                   R"(endpoints:
  username: "12345"
storage:
  work_dir: "C:\\vault\\\"work\""
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.endpoints().username() == "12345");
  assert(config.storage().work_dir() == "C:\\vault\\\"work\"");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
webhooks: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestInvertedIdRangeIsRejected() {
  const auto yaml_path = WriteYaml("inverted_ids",
                                   R"(ids:
  min_id: 500
  max_id: 10
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const chunkvault::util::InvalidArgument&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject min_id > max_id.");
}

} // namespace

int main() {
  TestEmptyFileYieldsDefaults();
  TestExplicitValuesAreKept();
  TestQuotedScalarStaysString();
  TestUnknownFieldsAreRejected();
  TestInvertedIdRangeIsRejected();

  std::cout << "chunkvault_unit_config_loader: pass\n";
  return 0;
}
