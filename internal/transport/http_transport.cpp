#include "http_transport.hpp"

#include <arrow/status.h>
#include <curl/curl.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <memory>
#include <mutex>
#include <utility>

#include "internal/util/errors.hpp"

namespace chunkvault::transport {

namespace {

void EnsureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] {
    const CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
    if (rc != CURLE_OK) {
      throw util::TransportError(std::string("curl_global_init failed: ") + curl_easy_strerror(rc), 0, false);
    }
  });
}

struct EasyDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

struct MimeDeleter {
  void operator()(curl_mime* mime) const {
    curl_mime_free(mime);
  }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using MimeHandle = std::unique_ptr<curl_mime, MimeDeleter>;

struct ProgressState {
  const TransferContext* ctx;
  bool                   upload;
};

size_t AppendBody(char* data, size_t size, size_t count, void* user) {
  static_cast<std::string*>(user)->append(data, size * count);
  return size * count;
}

struct SinkState {
  CURL*                    handle;
  arrow::io::OutputStream* sink;
  uint64_t                 written = 0;
  arrow::Status            status;
};

// Bodies of non-2xx responses never reach the sink.
size_t WriteToSink(char* data, size_t size, size_t count, void* user) {
  auto*        state = static_cast<SinkState*>(user);
  const size_t bytes = size * count;

  long status = 0;
  curl_easy_getinfo(state->handle, CURLINFO_RESPONSE_CODE, &status);
  if (!HttpBlobTransport::IsSuccessStatus(status)) {
    return bytes;
  }

  state->status = state->sink->Write(data, static_cast<int64_t>(bytes));
  if (!state->status.ok()) {
    return 0;
  }
  state->written += bytes;
  return bytes;
}

int OnTransferInfo(void* user, curl_off_t /*dl_total*/, curl_off_t dl_now, curl_off_t /*ul_total*/, curl_off_t ul_now) {
  const auto* state = static_cast<const ProgressState*>(user);
  if (state->ctx->cancel && state->ctx->cancel->IsCancelled()) {
    return 1;
  }
  if (state->ctx->on_progress) {
    const curl_off_t done = state->upload ? ul_now : dl_now;
    state->ctx->on_progress(done > 0 ? static_cast<uint64_t>(done) : 0);
  }
  return 0;
}

bool IsRetryableCurlCode(CURLcode rc) {
  switch (rc) {
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_URL_MALFORMAT:
    case CURLE_BAD_FUNCTION_ARGUMENT:
    case CURLE_OUT_OF_MEMORY:
    case CURLE_TOO_MANY_REDIRECTS:
    case CURLE_FILESIZE_EXCEEDED:
      return false;
    default:
      return true;
  }
}

EasyHandle NewHandle(const HttpTransportOptions& options, ProgressState* progress, char* error_buffer) {
  EnsureCurlGlobalInit();
  EasyHandle handle(curl_easy_init());
  if (!handle) {
    throw util::TransportError("curl_easy_init failed", 0, true);
  }

  CURL* h = handle.get();
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_USERAGENT, "chunkvault");
  curl_easy_setopt(h, CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout.count()));
  curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(options.request_timeout.count()));
#if LIBCURL_VERSION_NUM >= 0x075500
  curl_easy_setopt(h, CURLOPT_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(h, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
  curl_easy_setopt(h, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
  curl_easy_setopt(h, CURLOPT_REDIR_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
#endif
  curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, OnTransferInfo);
  curl_easy_setopt(h, CURLOPT_XFERINFODATA, progress);
  curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
  return handle;
}

/*
  Runs the request and returns the HTTP status.

  Messages name the chunk, never the URL: webhook URLs embed their token.
*/
long Perform(CURL* handle, const std::string& what, const TransferContext& ctx, const char* error_buffer) {
  const CURLcode rc = curl_easy_perform(handle);
  if (rc == CURLE_ABORTED_BY_CALLBACK || (ctx.cancel && ctx.cancel->IsCancelled())) {
    throw util::Cancelled(what + " cancelled");
  }
  if (rc != CURLE_OK) {
    const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
    throw util::TransportError(what + ": " + detail, 0, IsRetryableCurlCode(rc));
  }

  long status = 0;
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
  return status;
}

void CheckStatus(long status, const std::string& what) {
  if (!HttpBlobTransport::IsSuccessStatus(status)) {
    throw util::TransportError(what + ": HTTP " + std::to_string(status), status, HttpBlobTransport::IsRetryableStatus(status));
  }
}

std::string UsernamePayload(const std::string& username) {
  google::protobuf::Struct payload;
  (*payload.mutable_fields())["username"].set_string_value(username);

  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(payload, &json);
  if (!status.ok()) {
    throw util::InvalidArgument("cannot encode webhook payload: " + status.ToString());
  }
  return json;
}

} // namespace

HttpBlobTransport::HttpBlobTransport(HttpTransportOptions options)
    : options_(std::move(options)), payload_json_(UsernamePayload(options_.username)) {
  EnsureCurlGlobalInit();
}

bool HttpBlobTransport::IsRetryableStatus(long status) {
  return status == 408 || status == 429 || (status >= 500 && status <= 599);
}

bool HttpBlobTransport::IsSuccessStatus(long status) {
  return status >= 200 && status <= 299;
}

std::string HttpBlobTransport::UploadUrl(const std::string& endpoint) {
  auto fragment = endpoint.find('#');
  std::string base   = endpoint.substr(0, fragment);
  std::string suffix = fragment == std::string::npos ? "" : endpoint.substr(fragment);

  if (base.find('?') == std::string::npos) {
    base += "?wait=true";
  } else if (base.back() == '?' || base.back() == '&') {
    base += "wait=true";
  } else {
    base += "&wait=true";
  }
  return base + suffix;
}

std::string HttpBlobTransport::ParseUploadResponse(const std::string& body) {
  google::protobuf::Struct message;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(body, &message, options);
  if (!status.ok()) {
    throw util::TransportError("upload response is not a JSON object", 0, false);
  }

  const auto& fields = message.fields();
  auto attachments   = fields.find("attachments");
  if (attachments == fields.end() || !attachments->second.has_list_value() ||
      attachments->second.list_value().values_size() == 0) {
    throw util::TransportError("upload response carries no attachment", 0, false);
  }

  const auto& first = attachments->second.list_value().values(0);
  if (!first.has_struct_value()) {
    throw util::TransportError("upload response attachment is malformed", 0, false);
  }
  const auto& attachment = first.struct_value().fields();
  auto url               = attachment.find("url");
  if (url == attachment.end() || url->second.kind_case() != google::protobuf::Value::kStringValue ||
      url->second.string_value().empty()) {
    throw util::TransportError("upload response attachment has no url", 0, false);
  }
  return url->second.string_value();
}

std::string HttpBlobTransport::Upload(const std::string& endpoint, const std::string& name,
                                      const std::shared_ptr<arrow::Buffer>& data, const TransferContext& ctx) {
  const std::string what = "upload of " + name;

  std::string   body;
  char          error_buffer[CURL_ERROR_SIZE] = {0};
  ProgressState progress{&ctx, true};
  auto          handle = NewHandle(options_, &progress, error_buffer);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, AppendBody);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &body);

  MimeHandle mime(curl_mime_init(handle.get()));
  if (!mime) {
    throw util::TransportError(what + ": curl_mime_init failed", 0, true);
  }

  curl_mimepart* payload = curl_mime_addpart(mime.get());
  curl_mime_name(payload, "payload_json");
  curl_mime_data(payload, payload_json_.data(), payload_json_.size());
  curl_mime_type(payload, "application/json");

  curl_mimepart* file = curl_mime_addpart(mime.get());
  curl_mime_name(file, "files[0]");
  curl_mime_filename(file, name.c_str());
  curl_mime_data(file, reinterpret_cast<const char*>(data->data()), static_cast<size_t>(data->size()));
  curl_mime_type(file, "application/octet-stream");

  const std::string url = UploadUrl(endpoint);
  curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_MIMEPOST, mime.get());

  CheckStatus(Perform(handle.get(), what, ctx, error_buffer), what);
  return ParseUploadResponse(body);
}

uint64_t HttpBlobTransport::Fetch(const std::string& url, arrow::io::OutputStream* sink, const TransferContext& ctx) {
  const std::string what = "chunk fetch";

  char          error_buffer[CURL_ERROR_SIZE] = {0};
  ProgressState progress{&ctx, false};
  auto          handle = NewHandle(options_, &progress, error_buffer);

  SinkState state{handle.get(), sink};
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, WriteToSink);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &state);
  curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_MAXREDIRS, 5L);

  long status = 0;
  try {
    status = Perform(handle.get(), what, ctx, error_buffer);
  } catch (const util::TransportError&) {
    if (!state.status.ok()) {
      throw util::LocalIOError("cannot store fetched chunk");
    }
    throw;
  }
  CheckStatus(status, what);
  return state.written;
}

} // namespace chunkvault::transport
