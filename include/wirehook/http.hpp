#pragma once

#include <algorithm>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <curl/curl.h>

#include "wirehook/common.hpp"
#include "wirehook/config.hpp"
#include "wirehook/payload.hpp"

namespace wirehook {

struct RequestDescriptor {
  std::string method{"POST"};
  std::string url;
  // Loggable label without credentials, e.g. "POST webhooks/{id}".
  std::string route;
  std::map<std::string, std::string> headers{};
  std::optional<WireBody> body{};
  int timeout_s{30};
};

struct HttpResponse {
  long status{0};
  std::string body;
  std::string error;
  std::map<std::string, std::string> headers{};

  bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

// Executes one request synchronously. Called from the requester's worker thread only.
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse execute(const RequestDescriptor& request) = 0;
};

class HttpClient : public HttpTransport {
 public:
  explicit HttpClient(std::string user_agent = std::string("wirehook/") + kVersion)
      : user_agent_(std::move(user_agent)) {
    ensure_global_init();
    easy_ = curl_easy_init();
  }

  ~HttpClient() override {
    if (easy_) {
      curl_easy_cleanup(easy_);
      easy_ = nullptr;
    }
  }

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  HttpResponse execute(const RequestDescriptor& request) override {
    CURL* curl = ensure_easy();
    if (!curl) {
      return HttpResponse{0, "", "curl init failed"};
    }

    curl_easy_reset(curl);
    std::string response_body;
    std::map<std::string, std::string> response_headers;
    struct curl_slist* header_list = nullptr;
    curl_mime* mime = nullptr;
    std::string flat_body;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response_headers);
    apply_common_options(curl, request.timeout_s);

    if (request.body && request.body->is_multipart()) {
      mime = curl_mime_init(curl);
      if (!mime) {
        return HttpResponse{0, "", "curl mime init failed"};
      }
      for (const auto& p : request.body->parts()) {
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, p.name.c_str());
        curl_mime_data(part, p.data.data(), p.data.size());
        if (p.filename) {
          curl_mime_filename(part, p.filename->c_str());
        }
        if (p.content_type) {
          curl_mime_type(part, p.content_type->c_str());
        }
      }
      curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    } else if (request.body) {
      flat_body = request.body->bytes();
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, flat_body.c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(flat_body.size()));
      header_list = curl_slist_append(header_list, ("Content-Type: " + request.body->content_type()).c_str());
    } else if (request.method == "POST") {
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
    }
    if (request.method != "GET" && request.method != "POST") {
      curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    for (const auto& [k, v] : request.headers) {
      const std::string line = k + ": " + v;
      header_list = curl_slist_append(header_list, line.c_str());
    }
    if (header_list) {
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    const CURLcode rc = curl_easy_perform(curl);

    HttpResponse out;
    if (rc != CURLE_OK) {
      out.error = curl_easy_strerror(rc);
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    out.body = std::move(response_body);
    out.headers = std::move(response_headers);

    if (header_list) {
      curl_slist_free_all(header_list);
    }
    if (mime) {
      curl_mime_free(mime);
    }
    return out;
  }

 private:
  static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto n = size * nmemb;
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, n);
    return n;
  }

  static size_t header_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto n = size * nmemb;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers || !ptr || n == 0) {
      return n;
    }

    std::string line(ptr, n);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
      line.pop_back();
    }

    const auto p = line.find(':');
    if (p == std::string::npos) {
      return n;
    }

    std::string key = trim(line.substr(0, p));
    std::string val = trim(line.substr(p + 1));
    if (key.empty()) {
      return n;
    }
    (*headers)[to_lower(key)] = val;
    return n;
  }

  static void ensure_global_init() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  }

  CURL* ensure_easy() {
    if (!easy_) {
      easy_ = curl_easy_init();
    }
    return easy_;
  }

  void apply_common_options(CURL* curl, int timeout_s) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_s));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>((std::min)(10, (std::max)(1, timeout_s / 3))));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  }

  std::string user_agent_;
  CURL* easy_{nullptr};
};

}  // namespace wirehook
