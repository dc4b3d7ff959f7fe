#pragma once

#include <atomic>
#include <regex>
#include <string>
#include <vector>

#include "wirehook/common.hpp"
#include "wirehook/config.hpp"
#include "wirehook/errors.hpp"
#include "wirehook/message.hpp"
#include "wirehook/payload.hpp"
#include "wirehook/request_future.hpp"
#include "wirehook/requester.hpp"

namespace wirehook {

class WebhookClient {
 public:
  WebhookClient(std::string id, std::string token, Requester& requester, HttpConfig http = {})
      : id_(std::move(id)), token_(std::move(token)), requester_(requester), http_(std::move(http)) {
    checks::not_blank(id_, "Webhook id");
    checks::not_blank(token_, "Webhook token");
    std::string base = trim(http_.api_base);
    while (!base.empty() && base.back() == '/') {
      base.pop_back();
    }
    url_ = base + "/webhooks/" + id_ + "/" + token_;
  }

  // Accepts https://host/api[/vN]/webhooks/{id}/{token}. The API base is taken from the URL.
  static WebhookClient from_url(const std::string& url, Requester& requester, HttpConfig http = {}) {
    static const std::regex kPattern(R"(^(https?://[^/]+/api(?:/v[0-9]+)?)/webhooks/([0-9]+)/([A-Za-z0-9_-]+)/?$)");
    std::smatch m;
    const std::string u = trim(url);
    if (!std::regex_match(u, m, kPattern)) {
      throw InvalidArgument("Invalid webhook url");
    }
    http.api_base = m[1].str();
    return WebhookClient(m[2].str(), m[3].str(), requester, std::move(http));
  }

  const std::string& id() const { return id_; }
  const std::string& url() const { return url_; }

  RequestFuture<json> send(const WebhookMessage& message) {
    if (closed_.load()) {
      return RequestFuture<json>::failed(TransportFailure("webhook client is closed"));
    }

    RequestDescriptor request;
    request.method = "POST";
    request.url = http_.wait ? url_ + "?wait=true" : url_;
    request.route = "POST webhooks/" + id_;
    request.headers = {{"Accept", kMediaTypeJson}};
    request.timeout_s = http_.timeout_s;
    try {
      request.body = encode(message);
    } catch (const TransportFailure& e) {
      return RequestFuture<json>::failed(e);
    }

    return RequestFuture<json>(requester_, std::move(request), [](const HttpResponse& response) {
      if (trim(response.body).empty()) {
        return json(nullptr);
      }
      return json::parse(response.body);
    });
  }

  RequestFuture<json> send(const std::string& content) {
    checks::not_blank(content, "Content");
    WebhookMessageBuilder builder;
    builder.set_content(content);
    return send(builder.build());
  }

  RequestFuture<json> send(std::vector<Embed> embeds) { return send(WebhookMessage::of(std::move(embeds))); }

  RequestFuture<json> send(const std::string& name, const AttachmentData& data) {
    return send(WebhookMessage::files(name, data));
  }

  RequestFuture<json> send_file(const fs::path& path) {
    return send(path.filename().string(), AttachmentData::file(path));
  }

  // Later sends resolve immediately as failed. Requests already queued are unaffected.
  void close() { closed_.store(true); }
  bool is_closed() const { return closed_.load(); }

 private:
  std::string id_;
  std::string token_;
  std::string url_;
  Requester& requester_;
  HttpConfig http_;
  std::atomic<bool> closed_{false};
};

}  // namespace wirehook
