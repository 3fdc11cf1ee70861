#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace chunkvault::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Source unreadable on upload or destination unwritable on download.
class LocalIOError : public std::runtime_error {
 public:
  explicit LocalIOError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  One chunk upload/fetch failed.

  http_status is 0 when the request never produced a response
  (connect failure, timeout, reset).
*/
class TransportError : public std::runtime_error {
 public:
  TransportError(const std::string& msg, long http_status, bool retryable)
      : std::runtime_error(msg), http_status_(http_status), retryable_(retryable) {
  }

  long http_status() const {
    return http_status_;
  }

  bool retryable() const {
    return retryable_;
  }

 private:
  long http_status_;
  bool retryable_;
};

// A whole upload or download was aborted.
class OperationFailed : public std::runtime_error {
 public:
  explicit OperationFailed(const std::string& msg, std::optional<uint64_t> ordinal = std::nullopt)
      : std::runtime_error(msg), ordinal_(ordinal) {
  }

  const std::optional<uint64_t>& ordinal() const {
    return ordinal_;
  }

 private:
  std::optional<uint64_t> ordinal_;
};

// Merge could not produce the complete byte sequence.
class IncompleteTransfer : public OperationFailed {
 public:
  explicit IncompleteTransfer(const std::string& msg, std::optional<uint64_t> ordinal = std::nullopt)
      : OperationFailed(msg, ordinal) {
  }
};

class RegistryError : public std::runtime_error {
 public:
  explicit RegistryError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CorruptRegistry : public RegistryError {
 public:
  explicit CorruptRegistry(const std::string& msg) : RegistryError(msg) {
  }
};

class ExhaustedIdSpace : public RegistryError {
 public:
  explicit ExhaustedIdSpace(const std::string& msg) : RegistryError(msg) {
  }
};

class EmptyPool : public std::runtime_error {
 public:
  explicit EmptyPool(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace chunkvault::util
