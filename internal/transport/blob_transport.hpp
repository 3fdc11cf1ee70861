#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "internal/transfer/cancellation.hpp"

namespace chunkvault::transport {

struct TransferContext {
  const transfer::CancellationToken* cancel = nullptr;

  // Bytes moved so far by this request.
  std::function<void(uint64_t)> on_progress;
};

/*
  Storage seam: hand a blob to an endpoint and get back a URL that serves it.

  Implementations throw util::TransportError for failed requests (flagging
  whether a retry can help) and util::Cancelled when ctx.cancel fires
  mid-request.

  Fetch streams the body into `sink` as it arrives and returns the number of
  bytes written. A sink write failure is util::LocalIOError.
*/
class BlobTransport {
 public:
  virtual ~BlobTransport() = default;

  virtual std::string Upload(const std::string& endpoint, const std::string& name,
                             const std::shared_ptr<arrow::Buffer>& data, const TransferContext& ctx) = 0;

  virtual uint64_t Fetch(const std::string& url, arrow::io::OutputStream* sink, const TransferContext& ctx) = 0;
};

} // namespace chunkvault::transport
