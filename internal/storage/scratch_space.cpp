#include "scratch_space.hpp"

#include <random>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chunkvault::storage {

namespace {

std::string RandomSuffix() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static constexpr char kHex[] = "0123456789abcdef";

  std::string suffix;
  auto value = rng();
  for (int i = 0; i < 16; ++i) {
    suffix.push_back(kHex[value & 0x0F]);
    value >>= 4;
  }
  return suffix;
}

} // namespace

ScratchSpace::ScratchSpace(const std::filesystem::path& work_dir, const std::string& prefix) {
  std::error_code ec;
  std::filesystem::create_directories(work_dir, ec);
  if (ec) {
    throw util::LocalIOError("cannot create work directory: " + ec.message());
  }

  for (int attempt = 0; attempt < 8; ++attempt) {
    auto candidate = work_dir / (prefix + "-" + RandomSuffix());
    if (std::filesystem::create_directory(candidate, ec)) {
      path_ = std::move(candidate);
      return;
    }
    if (ec) {
      throw util::LocalIOError("cannot create scratch directory: " + ec.message());
    }
  }
  throw util::LocalIOError("cannot create a unique scratch directory");
}

ScratchSpace::~ScratchSpace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    CHUNKVAULT_LOG_WARN("Scratch cleanup failed", {observability::StringField("error", ec.message())});
  }
}

} // namespace chunkvault::storage
