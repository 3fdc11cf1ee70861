#include "internal/transport/http_transport.hpp"

#include <arpa/inet.h>
#include <arrow/buffer.h>
#include <arrow/io/memory.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "internal/transfer/cancellation.hpp"
#include "internal/util/errors.hpp"

namespace {

using chunkvault::transport::HttpBlobTransport;

// Serves one canned response on a loopback port, then closes.
class OneShotHttpServer {
 public:
  explicit OneShotHttpServer(std::string response) : response_(std::move(response)) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd_ >= 0);

    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port        = 0;

    const int bound = ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(bound == 0);
    const int listening = ::listen(fd_, 1);
    assert(listening == 0);

    socklen_t len  = sizeof(addr);
    const int named = ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    assert(named == 0);
    port_ = ntohs(addr.sin_port);

    thread_ = std::thread([this] { Serve(); });
  }

  ~OneShotHttpServer() {
    thread_.join();
    ::close(fd_);
  }

  OneShotHttpServer(const OneShotHttpServer&)            = delete;
  OneShotHttpServer& operator=(const OneShotHttpServer&) = delete;

  std::string Url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

 private:
  void Serve() {
    const int client = ::accept(fd_, nullptr, nullptr);
    if (client < 0) return;

    std::string request;
    char        buf[1024];
    while (request.find("\r\n\r\n") == std::string::npos) {
      const ssize_t n = ::recv(client, buf, sizeof(buf), 0);
      if (n <= 0) break;
      request.append(buf, static_cast<size_t>(n));
    }
    (void)::send(client, response_.data(), response_.size(), MSG_NOSIGNAL);
    ::close(client);
  }

  std::string response_;
  int         fd_   = -1;
  uint16_t    port_ = 0;
  std::thread thread_;
};

std::shared_ptr<arrow::io::BufferOutputStream> NewSink() {
  auto sink = arrow::io::BufferOutputStream::Create();
  assert(sink.ok());
  return *sink;
}

int64_t SinkSize(const std::shared_ptr<arrow::io::BufferOutputStream>& sink) {
  auto position = sink->Tell();
  assert(position.ok());
  return *position;
}

void TestUploadUrlAddsWait() {
  assert(HttpBlobTransport::UploadUrl("https://chat.example/api/webhooks/1/tok") == "https://chat.example/api/webhooks/1/tok?wait=true");
  assert(HttpBlobTransport::UploadUrl("https://chat.example/hook?thread_id=7") == "https://chat.example/hook?thread_id=7&wait=true");
  assert(HttpBlobTransport::UploadUrl("https://chat.example/hook?") == "https://chat.example/hook?wait=true");
  assert(HttpBlobTransport::UploadUrl("https://chat.example/hook#frag") == "https://chat.example/hook?wait=true#frag");
}

void TestParseUploadResponse() {
  const std::string body =
      R"({"id":"1","content":"","attachments":[{"id":"9","filename":"a.bin.0","url":"https://cdn.example/att/9/a.bin.0"}]})";
  assert(HttpBlobTransport::ParseUploadResponse(body) == "https://cdn.example/att/9/a.bin.0");

  for (const std::string bad : {"not json", "[]", R"({"attachments":[]})", R"({"attachments":[{"id":"9"}]})",
                                R"({"attachments":[{"url":""}]})", R"({"attachments":["x"]})"}) {
    bool threw = false;
    try {
      (void)HttpBlobTransport::ParseUploadResponse(bad);
    } catch (const chunkvault::util::TransportError& e) {
      threw = !e.retryable();
    }
    assert(threw);
  }
}

void TestRetryableStatuses() {
  assert(HttpBlobTransport::IsRetryableStatus(408));
  assert(HttpBlobTransport::IsRetryableStatus(429));
  assert(HttpBlobTransport::IsRetryableStatus(500));
  assert(HttpBlobTransport::IsRetryableStatus(503));
  assert(!HttpBlobTransport::IsRetryableStatus(400));
  assert(!HttpBlobTransport::IsRetryableStatus(401));
  assert(!HttpBlobTransport::IsRetryableStatus(404));
  assert(!HttpBlobTransport::IsRetryableStatus(413));

  assert(HttpBlobTransport::IsSuccessStatus(200));
  assert(HttpBlobTransport::IsSuccessStatus(206));
  assert(!HttpBlobTransport::IsSuccessStatus(0));
  assert(!HttpBlobTransport::IsSuccessStatus(101));
  assert(!HttpBlobTransport::IsSuccessStatus(301));
  assert(!HttpBlobTransport::IsSuccessStatus(404));
}

HttpBlobTransport ShortTimeoutTransport() {
  chunkvault::transport::HttpTransportOptions options;
  options.connect_timeout = std::chrono::milliseconds(2000);
  options.request_timeout = std::chrono::milliseconds(4000);
  return HttpBlobTransport(options);
}

void TestUnreachableEndpointIsRetryable() {
  auto                                      transport = ShortTimeoutTransport();
  chunkvault::transfer::CancellationToken   cancel;
  chunkvault::transport::TransferContext    ctx;
  ctx.cancel = &cancel;

  bool threw = false;
  try {
    (void)transport.Upload("http://127.0.0.1:1/hook", "a.bin.0", arrow::Buffer::FromString("abc"), ctx);
  } catch (const chunkvault::util::TransportError& e) {
    threw = e.retryable() && e.http_status() == 0;
    assert(std::string(e.what()).find("127.0.0.1") == std::string::npos);
  }
  assert(threw);
}

void TestCancelledTokenAbortsRequest() {
  auto                                      transport = ShortTimeoutTransport();
  chunkvault::transfer::CancellationToken   cancel;
  chunkvault::transport::TransferContext    ctx;
  ctx.cancel = &cancel;
  cancel.Cancel();

  auto sink  = NewSink();
  bool threw = false;
  try {
    (void)transport.Fetch("http://127.0.0.1:1/att/1", sink.get(), ctx);
  } catch (const chunkvault::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
}

void TestFetchRejectsNonHttpSchemes() {
  auto                                    transport = ShortTimeoutTransport();
  chunkvault::transport::TransferContext  ctx;

  for (const std::string url : {"file:///etc/passwd", "ftp://127.0.0.1:1/chunk", "dict://127.0.0.1:1/x"}) {
    auto sink  = NewSink();
    bool threw = false;
    try {
      (void)transport.Fetch(url, sink.get(), ctx);
    } catch (const chunkvault::util::TransportError& e) {
      threw = !e.retryable();
    }
    assert(threw);
    assert(SinkSize(sink) == 0);
  }
}

void TestFetchStreamsSuccessfulBody() {
  OneShotHttpServer server("HTTP/1.1 200 OK\r\nContent-Length: 11\r\nConnection: close\r\n\r\nchunk-bytes");
  auto              transport = ShortTimeoutTransport();
  chunkvault::transport::TransferContext ctx;

  auto sink = NewSink();
  assert(transport.Fetch(server.Url("/att/1/a.bin.0"), sink.get(), ctx) == 11);

  auto buffer = sink->Finish();
  assert(buffer.ok());
  assert((*buffer)->ToString() == "chunk-bytes");
}

void TestFetchRejectsRedirectWithoutTarget() {
  OneShotHttpServer server("HTTP/1.1 301 Moved Permanently\r\nContent-Length: 5\r\nConnection: close\r\n\r\nmoved");
  auto              transport = ShortTimeoutTransport();
  chunkvault::transport::TransferContext ctx;

  auto sink  = NewSink();
  bool threw = false;
  try {
    (void)transport.Fetch(server.Url("/att/1/a.bin.0"), sink.get(), ctx);
  } catch (const chunkvault::util::TransportError& e) {
    threw = e.http_status() == 301 && !e.retryable();
  }
  assert(threw);
  assert(SinkSize(sink) == 0);
}

void TestFetchServerErrorKeepsBodyOutOfSink() {
  OneShotHttpServer server("HTTP/1.1 503 Service Unavailable\r\nContent-Length: 4\r\nConnection: close\r\n\r\nbusy");
  auto              transport = ShortTimeoutTransport();
  chunkvault::transport::TransferContext ctx;

  auto sink  = NewSink();
  bool threw = false;
  try {
    (void)transport.Fetch(server.Url("/att/1/a.bin.0"), sink.get(), ctx);
  } catch (const chunkvault::util::TransportError& e) {
    threw = e.http_status() == 503 && e.retryable();
  }
  assert(threw);
  assert(SinkSize(sink) == 0);
}

} // namespace

int main() {
  TestUploadUrlAddsWait();
  TestParseUploadResponse();
  TestRetryableStatuses();
  TestUnreachableEndpointIsRetryable();
  TestCancelledTokenAbortsRequest();
  TestFetchRejectsNonHttpSchemes();
  TestFetchStreamsSuccessfulBody();
  TestFetchRejectsRedirectWithoutTarget();
  TestFetchServerErrorKeepsBodyOutOfSink();

  std::cout << "chunkvault_unit_http_transport: pass\n";
  return 0;
}
