#pragma once

#include <chrono>
#include <string>

#include "internal/transport/blob_transport.hpp"

namespace chunkvault::transport {

struct HttpTransportOptions {
  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds request_timeout{120000};

  // Shown as the poster of every chunk message.
  std::string username = "chunkvault";
};

/*
  libcurl transport for chat-webhook endpoints.

  Upload posts the chunk as a multipart attachment with ?wait=true and reads
  the attachment URL from the returned message. Fetch is a plain GET whose
  body is written straight to the caller's sink. Only http and https are
  allowed, including on redirects, and only a 2xx response counts.
  One easy handle per request; safe to use from many threads.
*/
class HttpBlobTransport final : public BlobTransport {
 public:
  explicit HttpBlobTransport(HttpTransportOptions options);

  std::string Upload(const std::string& endpoint, const std::string& name, const std::shared_ptr<arrow::Buffer>& data,
                     const TransferContext& ctx) override;

  uint64_t Fetch(const std::string& url, arrow::io::OutputStream* sink, const TransferContext& ctx) override;

  // Endpoint URL with wait=true added to its query string.
  static std::string UploadUrl(const std::string& endpoint);

  // attachments[0].url of a webhook response; util::TransportError otherwise.
  static std::string ParseUploadResponse(const std::string& body);

  static bool IsRetryableStatus(long status);

  static bool IsSuccessStatus(long status);

 private:
  HttpTransportOptions options_;
  std::string          payload_json_;
};

} // namespace chunkvault::transport
