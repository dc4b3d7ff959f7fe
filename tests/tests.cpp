#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "wirehook/attachment.hpp"
#include "wirehook/config.hpp"
#include "wirehook/message.hpp"
#include "wirehook/metrics.hpp"
#include "wirehook/payload.hpp"
#include "wirehook/request_future.hpp"
#include "wirehook/requester.hpp"
#include "wirehook/webhook_client.hpp"

static int fail(const std::string& msg, const char* file, int line) {
  std::cerr << "TEST FAIL: " << msg << " (" << file << ":" << line << ")\n";
  return 1;
}

#define EXPECT_TRUE(x)                     \
  do {                                     \
    if (!(x)) {                            \
      return fail(#x, __FILE__, __LINE__); \
    }                                      \
  } while (0)

#define EXPECT_EQ(a, b)                                                      \
  do {                                                                       \
    const auto _a = (a);                                                     \
    const auto _b = (b);                                                     \
    if (!(_a == _b)) {                                                       \
      std::ostringstream ss;                                                 \
      ss << #a << " == " << #b << " (got '" << _a << "' vs '" << _b << "')"; \
      return fail(ss.str(), __FILE__, __LINE__);                             \
    }                                                                        \
  } while (0)

#define EXPECT_THROWS(ExType, ...)                                                                \
  do {                                                                                            \
    bool _thrown = false;                                                                         \
    try {                                                                                         \
      __VA_ARGS__;                                                                                \
    } catch (const ExType&) {                                                                     \
      _thrown = true;                                                                             \
    } catch (const std::exception& _e) {                                                          \
      return fail(std::string(#__VA_ARGS__) + " threw unexpected: " + _e.what(), __FILE__, __LINE__); \
    }                                                                                             \
    if (!_thrown) {                                                                               \
      return fail(std::string(#__VA_ARGS__) + " did not throw " #ExType, __FILE__, __LINE__);    \
    }                                                                                             \
  } while (0)

#define RUN(test)          \
  do {                     \
    if (test() != 0) {     \
      return 1;            \
    }                      \
  } while (0)

using namespace wirehook;

namespace {

// Records requests and answers with `response`. While blocked, execute() parks the requester thread.
class FakeTransport : public HttpTransport {
 public:
  HttpResponse execute(const RequestDescriptor& request) override {
    std::unique_lock<std::mutex> lock(mu_);
    requests_.push_back(request);
    cv_.notify_all();
    cv_.wait(lock, [this]() { return !blocked_; });
    return response_;
  }

  void set_response(HttpResponse response) {
    std::lock_guard<std::mutex> lock(mu_);
    response_ = std::move(response);
  }

  void block() {
    std::lock_guard<std::mutex> lock(mu_);
    blocked_ = true;
  }

  void release() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      blocked_ = false;
    }
    cv_.notify_all();
  }

  bool wait_for_calls(std::size_t n) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, std::chrono::seconds(5), [&]() { return requests_.size() >= n; });
  }

  std::vector<RequestDescriptor> requests() {
    std::lock_guard<std::mutex> lock(mu_);
    return requests_;
  }

 private:
  std::mutex mu_;
  std::condition_variable cv_;
  std::vector<RequestDescriptor> requests_;
  HttpResponse response_{200, "", "", {}};
  bool blocked_{false};
};

Embed titled(const std::string& title) {
  Embed e;
  e.title = title;
  return e;
}

fs::path write_temp_file(const std::string& content) {
  const fs::path p = fs::temp_directory_path() / ("wirehook_test_" + random_id(10) + ".bin");
  write_text_file(p, content);
  return p;
}

int test_embed_constructor() {
  EXPECT_THROWS(InvalidArgument, WebhookMessage::of(std::vector<Embed>{}));

  const WebhookMessage m = WebhookMessage::of({titled("a"), titled("b")});
  EXPECT_EQ(m.embeds().size(), static_cast<std::size_t>(2));
  EXPECT_TRUE(!m.content().has_value());
  EXPECT_TRUE(!m.is_file());
  EXPECT_TRUE(!m.is_tts());
  return 0;
}

int test_attachment_limits() {
  std::vector<std::pair<std::string, AttachmentData>> files;
  for (std::size_t i = 0; i < limits::kMaxFiles; ++i) {
    files.emplace_back("f" + std::to_string(i), AttachmentData::bytes("x" + std::to_string(i)));
  }
  const WebhookMessage ok = WebhookMessage::files(files);
  EXPECT_TRUE(ok.is_file());
  EXPECT_EQ(ok.attachments()->size(), limits::kMaxFiles);
  for (std::size_t i = 0; i < limits::kMaxFiles; ++i) {
    EXPECT_EQ((*ok.attachments())[i]->name, "f" + std::to_string(i));
  }

  files.emplace_back("one_too_many", AttachmentData::bytes("y"));
  EXPECT_THROWS(InvalidArgument, WebhookMessage::files(files));

  std::map<std::string, AttachmentData> too_many;
  for (std::size_t i = 0; i <= limits::kMaxFiles; ++i) {
    too_many.emplace("m" + std::to_string(i), AttachmentData::bytes("z"));
  }
  EXPECT_THROWS(InvalidArgument, WebhookMessage::files(too_many));
  EXPECT_THROWS(InvalidArgument, WebhookMessage::files(std::map<std::string, AttachmentData>{}));

  std::vector<std::pair<std::string, AttachmentData>> dup = {{"a", AttachmentData::bytes("1")},
                                                             {"a", AttachmentData::bytes("2")}};
  EXPECT_THROWS(InvalidArgument, WebhookMessage::files(dup));

  std::vector<std::pair<std::string, AttachmentData>> blank = {{"  ", AttachmentData::bytes("1")}};
  EXPECT_THROWS(InvalidArgument, WebhookMessage::files(blank));
  return 0;
}

int test_flat_pairs() {
  const WebhookMessage m = WebhookMessage::files("dog", AttachmentData::bytes("woof"),
                                                 {std::string("cat"), AttachmentData::bytes("meow")});
  EXPECT_EQ(m.attachments()->size(), static_cast<std::size_t>(2));
  EXPECT_EQ((*m.attachments())[1]->name, "cat");

  EXPECT_THROWS(InvalidArgument, WebhookMessage::files("dog", AttachmentData::bytes("woof"), {std::string("cat")}));
  EXPECT_THROWS(InvalidArgument, WebhookMessage::files("dog", AttachmentData::bytes("woof"),
                                                       {AttachmentData::bytes("a"), AttachmentData::bytes("b")}));
  EXPECT_THROWS(InvalidArgument, WebhookMessage::files("dog", AttachmentData()));
  EXPECT_THROWS(InvalidArgument, WebhookMessage::files("", AttachmentData::bytes("woof")));

  std::vector<FileArg> rest;
  for (std::size_t i = 0; i < limits::kMaxFiles; ++i) {
    rest.emplace_back("n" + std::to_string(i));
    rest.emplace_back(AttachmentData::bytes("d"));
  }
  EXPECT_THROWS(InvalidArgument, WebhookMessage::files("first", AttachmentData::bytes("d"), rest));
  return 0;
}

int test_attachment_converter() {
  const fs::path missing = fs::temp_directory_path() / ("wirehook_missing_" + random_id(10) + ".png");
  EXPECT_THROWS(InvalidArgument, convert_attachment("dog", AttachmentData::file(missing)));
  EXPECT_THROWS(InvalidArgument, convert_attachment("dir", AttachmentData::file(fs::temp_directory_path())));
  EXPECT_THROWS(InvalidArgument, convert_attachment("null", AttachmentData::stream(nullptr)));
  EXPECT_THROWS(InvalidArgument, convert_attachment(" ", AttachmentData::bytes("x")));

  auto in = std::make_shared<std::istringstream>(std::string("streamed"));
  Attachment a = convert_attachment("s", AttachmentData::stream(in));
  EXPECT_TRUE(!a.data->is_consumed());
  EXPECT_EQ(a.data->read_all(), "streamed");
  EXPECT_TRUE(a.data->is_consumed());
  EXPECT_THROWS(TransportFailure, a.data->read_all());

  const fs::path p = write_temp_file("file-bytes");
  Attachment f = convert_attachment("f", AttachmentData::file(p));
  EXPECT_EQ(f.data->read_all(), "file-bytes");
  f.data->close();
  std::error_code ec;
  fs::remove(p, ec);
  return 0;
}

int test_from_message() {
  const Message received("hello", {titled("t")}, true, {"https://cdn.example/dog.png"});
  const WebhookMessage m = WebhookMessage::from(received);
  EXPECT_EQ(*m.content(), "hello");
  EXPECT_EQ(m.embeds().size(), static_cast<std::size_t>(1));
  EXPECT_TRUE(m.is_tts());
  EXPECT_TRUE(!m.is_file());
  EXPECT_TRUE(!m.username().has_value());
  return 0;
}

int test_builder() {
  WebhookMessageBuilder b;
  EXPECT_TRUE(b.is_empty());
  EXPECT_THROWS(InvalidArgument, b.build());
  EXPECT_THROWS(InvalidArgument, b.set_content(std::string(limits::kMaxContentLength + 1, 'a')));

  // Two bytes per character in UTF-8; the limit counts characters.
  std::string accented;
  for (std::size_t i = 0; i < limits::kMaxContentLength; ++i) {
    accented += "\xc3\xa9";
  }
  b.set_content(accented);
  EXPECT_THROWS(InvalidArgument, b.append("\xc3\xa9"));
  Embed wide;
  wide.description = std::string();
  for (std::size_t i = 0; i < limits::kEmbedMaxLength; ++i) {
    *wide.description += "\xc3\xa9";
  }
  EXPECT_TRUE(wide.is_sendable());

  b.set_content("hi").append(" there").set_username("  ").set_avatar_url("https://img.example/a.png").set_tts(true);
  const WebhookMessage m = b.build();
  EXPECT_EQ(*m.content(), "hi there");
  EXPECT_TRUE(!m.username().has_value());
  EXPECT_EQ(*m.avatar_url(), "https://img.example/a.png");
  EXPECT_TRUE(m.is_tts());
  EXPECT_TRUE(!m.is_file());

  for (std::size_t i = 0; i < limits::kMaxFiles; ++i) {
    b.add_file("f" + std::to_string(i), AttachmentData::bytes("d"));
  }
  EXPECT_THROWS(InvalidArgument, b.add_file("extra", AttachmentData::bytes("d")));
  EXPECT_EQ(b.file_count(), limits::kMaxFiles);
  EXPECT_EQ(b.build().attachments()->size(), limits::kMaxFiles);

  b.reset_files();
  b.add_file("same", AttachmentData::bytes("1"));
  EXPECT_THROWS(InvalidArgument, b.add_file("same", AttachmentData::bytes("2")));

  std::vector<Embed> eleven(limits::kMaxEmbeds + 1, titled("e"));
  EXPECT_THROWS(InvalidArgument, b.add_embeds(eleven));
  EXPECT_THROWS(InvalidArgument, b.add_embeds({Embed{}}));
  Embed huge;
  huge.description = std::string(limits::kEmbedMaxLength + 1, 'x');
  EXPECT_THROWS(InvalidArgument, b.add_embeds({huge}));

  b.reset();
  EXPECT_TRUE(b.is_empty());
  return 0;
}

int test_encode_json() {
  WebhookMessageBuilder b;
  b.set_content("hi");
  const WireBody body = encode(b.build());
  EXPECT_TRUE(!body.is_multipart());
  EXPECT_EQ(body.content_type(), "application/json");
  EXPECT_TRUE(json::parse(body.bytes()) == (json{{"content", "hi"}, {"tts", false}}));

  b.reset().set_username("bot").set_avatar_url("https://a").add_embeds({titled("x")}).set_tts(true);
  const json j = json::parse(encode(b.build()).bytes());
  EXPECT_TRUE(!j.contains("content"));
  EXPECT_EQ(j["username"].get<std::string>(), "bot");
  EXPECT_EQ(j["avatar_url"].get<std::string>(), "https://a");
  EXPECT_EQ(j["embeds"].size(), static_cast<std::size_t>(1));
  EXPECT_EQ(j["embeds"][0]["title"].get<std::string>(), "x");
  EXPECT_TRUE(j["tts"].get<bool>());
  return 0;
}

int test_encode_multipart() {
  std::string raw("\x89PNG\r\n\x1a\n", 8);
  raw.push_back('\0');
  raw += "tail";
  const fs::path p = write_temp_file(raw);

  const WebhookMessage m = WebhookMessage::files("dog", AttachmentData::file(p));
  const WireBody body = encode(m);
  EXPECT_TRUE(body.is_multipart());
  EXPECT_TRUE(body.content_type().rfind("multipart/form-data; boundary=", 0) == 0);
  EXPECT_EQ(body.parts().size(), static_cast<std::size_t>(2));
  EXPECT_EQ(body.parts()[0].name, "file0");
  EXPECT_EQ(body.parts()[1].name, "payload_json");

  const FormPart* file0 = body.find_part("file0");
  EXPECT_TRUE(file0 != nullptr);
  EXPECT_TRUE(file0->data == raw);
  EXPECT_EQ(*file0->filename, "dog");
  EXPECT_EQ(*file0->content_type, "application/octet-stream");
  EXPECT_TRUE(json::parse(body.find_part("payload_json")->data) == (json{{"tts", false}}));

  const std::string bytes = body.bytes();
  EXPECT_TRUE(bytes.find("name=\"file0\"; filename=\"dog\"") != std::string::npos);
  EXPECT_TRUE(bytes.find(raw) != std::string::npos);
  EXPECT_TRUE(bytes.find("--" + body.boundary() + "--\r\n") != std::string::npos);

  EXPECT_TRUE(!(*m.attachments())[0]->data->is_open());
  EXPECT_THROWS(TransportFailure, encode(m));

  std::error_code ec;
  fs::remove(p, ec);
  return 0;
}

int test_encode_stops_at_empty_slot() {
  WebhookMessageBuilder b;
  b.set_content("two files");
  b.add_file("a.txt", AttachmentData::bytes("A")).add_file("b.txt", AttachmentData::bytes("B"));
  const WebhookMessage m = b.build();
  EXPECT_EQ(m.attachments()->size(), limits::kMaxFiles);
  EXPECT_TRUE((*m.attachments())[2] == nullptr);

  const WireBody body = encode(m);
  EXPECT_EQ(body.parts().size(), static_cast<std::size_t>(3));
  EXPECT_EQ(body.parts()[0].name, "file0");
  EXPECT_EQ(body.parts()[1].name, "file1");
  EXPECT_EQ(*body.parts()[1].filename, "b.txt");
  EXPECT_EQ(body.parts()[1].data, "B");
  EXPECT_EQ(body.parts()[2].name, "payload_json");
  EXPECT_TRUE(body.find_part("file2") == nullptr);
  EXPECT_EQ(json::parse(body.parts()[2].data)["content"].get<std::string>(), "two files");
  return 0;
}

int test_invalid_utf8_text() {
  WebhookMessageBuilder b;
  b.set_content(std::string("caf\xe9"));
  EXPECT_THROWS(InvalidArgument, encode(b.build()));
  b.add_file("menu.txt", AttachmentData::bytes("soup"));
  const WebhookMessage with_file = b.build();
  EXPECT_THROWS(InvalidArgument, encode(with_file));
  EXPECT_TRUE(!(*with_file.attachments())[0]->data->is_open());

  auto transport = std::make_shared<FakeTransport>();
  Requester requester(transport);
  requester.start();
  WebhookClient client("1", "tok", requester);
  EXPECT_THROWS(InvalidArgument, client.send(std::string("caf\xe9")));
  Embed bad;
  bad.title = std::string("\xff");
  EXPECT_THROWS(InvalidArgument, client.send(std::vector<Embed>{bad}));
  requester.stop();
  EXPECT_TRUE(transport->requests().empty());
  return 0;
}

int test_resolved_futures() {
  RequestFuture<int> ok = RequestFuture<int>::completed(7);
  EXPECT_TRUE(ok.is_done());
  EXPECT_TRUE(!ok.is_completed_exceptionally());
  EXPECT_EQ(ok.get(), 7);
  EXPECT_TRUE(!ok.cancel(true));
  EXPECT_TRUE(ok.state() == FutureState::kCompleted);

  int seen = 0;
  ok.on_complete([&](const int& v) { seen = v; });
  EXPECT_EQ(seen, 7);

  RequestFuture<int> bad = RequestFuture<int>::failed(TransportFailure("boom", 500));
  EXPECT_TRUE(bad.is_completed_exceptionally());
  EXPECT_TRUE(!bad.is_cancelled());
  EXPECT_THROWS(TransportFailure, bad.get());
  bool failed_called = false;
  bad.on_complete([](const int&) {}, [&](std::exception_ptr) { failed_called = true; });
  EXPECT_TRUE(failed_called);
  EXPECT_TRUE(!bad.cancel(false));
  return 0;
}

int test_share_is_unsupported() {
  RequestFuture<int> done = RequestFuture<int>::completed(1);
  RequestFuture<int> bad = RequestFuture<int>::failed(TransportFailure("x"));
  EXPECT_THROWS(UnsupportedOperation, done.share());
  EXPECT_THROWS(UnsupportedOperation, bad.share());

  auto transport = std::make_shared<FakeTransport>();
  transport->block();
  Requester requester(transport);
  requester.start();
  RequestFuture<int> pending(requester, RequestDescriptor{}, [](const HttpResponse&) { return 1; });
  EXPECT_THROWS(UnsupportedOperation, pending.share());
  EXPECT_TRUE(pending.cancel(true));
  EXPECT_THROWS(UnsupportedOperation, pending.share());
  transport->release();
  requester.stop();
  return 0;
}

int test_cancel_pending() {
  auto transport = std::make_shared<FakeTransport>();
  transport->block();
  Requester requester(transport);
  requester.start();

  const uint64_t cancelled_before = metrics().get("requests.cancelled");

  RequestDescriptor first;
  first.route = "POST first";
  RequestFuture<int> in_flight(requester, first, [](const HttpResponse& r) { return static_cast<int>(r.status); });
  EXPECT_TRUE(transport->wait_for_calls(1));

  RequestDescriptor second;
  second.route = "POST second";
  RequestFuture<int> queued(requester, second, [](const HttpResponse&) { return 2; });

  EXPECT_TRUE(queued.cancel(true));
  EXPECT_TRUE(queued.is_cancelled());
  EXPECT_TRUE(queued.is_done());
  EXPECT_TRUE(!queued.cancel(true));
  EXPECT_TRUE(queued.state() == FutureState::kCancelled);
  EXPECT_THROWS(CancellationError, queued.get());

  // Cancelled while the transport is busy: the late response is ignored.
  EXPECT_TRUE(in_flight.cancel(false));
  transport->release();
  requester.stop();
  EXPECT_TRUE(in_flight.state() == FutureState::kCancelled);
  EXPECT_THROWS(CancellationError, in_flight.get());

  EXPECT_EQ(transport->requests().size(), static_cast<std::size_t>(1));
  EXPECT_EQ(metrics().get("requests.cancelled"), cancelled_before + 1);
  return 0;
}

int test_requester_lifecycle() {
  auto transport = std::make_shared<FakeTransport>();
  Requester stopped(transport);
  RequestFuture<int> rejected(stopped, RequestDescriptor{}, [](const HttpResponse&) { return 0; });
  EXPECT_TRUE(rejected.wait_for(std::chrono::seconds(1)));
  EXPECT_THROWS(TransportFailure, rejected.get());

  transport->block();
  Requester requester(transport);
  requester.start();
  RequestFuture<int> a(requester, RequestDescriptor{}, [](const HttpResponse&) { return 1; });
  EXPECT_TRUE(transport->wait_for_calls(1));
  RequestFuture<int> b(requester, RequestDescriptor{}, [](const HttpResponse&) { return 2; });
  EXPECT_EQ(requester.pending(), static_cast<std::size_t>(1));

  transport->release();
  EXPECT_EQ(a.get(), 1);
  EXPECT_EQ(b.get(), 2);

  transport->block();
  RequestFuture<int> c(requester, RequestDescriptor{}, [](const HttpResponse&) { return 3; });
  EXPECT_TRUE(transport->wait_for_calls(3));
  RequestFuture<int> d(requester, RequestDescriptor{}, [](const HttpResponse&) { return 4; });
  std::thread releaser([&]() {
    while (requester.is_running()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    transport->release();
  });
  requester.stop();
  releaser.join();
  EXPECT_EQ(c.get(), 3);
  EXPECT_THROWS(TransportFailure, d.get());
  return 0;
}

int test_requester_stop_cycles() {
  auto transport = std::make_shared<FakeTransport>();
  for (int i = 0; i < 200; ++i) {
    Requester requester(transport);
    requester.start();
    requester.stop();
    EXPECT_TRUE(!requester.is_running());
  }

  Requester requester(transport);
  for (int i = 0; i < 50; ++i) {
    requester.start();
    requester.stop();
  }
  requester.start();
  RequestFuture<int> f(requester, RequestDescriptor{}, [](const HttpResponse&) { return 5; });
  EXPECT_EQ(f.get(), 5);
  requester.stop();
  return 0;
}

int test_handler_and_http_failures() {
  auto transport = std::make_shared<FakeTransport>();
  Requester requester(transport);
  requester.start();

  transport->set_response(HttpResponse{429, "slow down", "", {}});
  RequestFuture<int> limited(requester, RequestDescriptor{}, [](const HttpResponse&) { return 0; });
  try {
    limited.get();
    return fail("expected TransportFailure", __FILE__, __LINE__);
  } catch (const TransportFailure& e) {
    EXPECT_EQ(e.status(), 429L);
  }

  transport->set_response(HttpResponse{0, "", "Couldn't resolve host name", {}});
  RequestFuture<int> unreachable(requester, RequestDescriptor{}, [](const HttpResponse&) { return 0; });
  EXPECT_THROWS(TransportFailure, unreachable.get());

  transport->set_response(HttpResponse{200, "not json", "", {}});
  RequestFuture<json> garbled(requester, RequestDescriptor{},
                              [](const HttpResponse& r) { return json::parse(r.body); });
  EXPECT_THROWS(json::parse_error, garbled.get());

  requester.stop();
  return 0;
}

int test_webhook_client() {
  auto transport = std::make_shared<FakeTransport>();
  transport->set_response(HttpResponse{200, R"({"id":"42","content":"hi"})", "", {}});
  Requester requester(transport);
  requester.start();

  EXPECT_THROWS(InvalidArgument, WebhookClient::from_url("https://example.com/not/a/webhook", requester));
  WebhookClient client = WebhookClient::from_url("https://discord.com/api/v10/webhooks/123/tok-EN_9", requester);
  EXPECT_EQ(client.id(), "123");
  EXPECT_EQ(client.url(), "https://discord.com/api/v10/webhooks/123/tok-EN_9");

  const json sent = client.send("hi").get();
  EXPECT_EQ(sent["id"].get<std::string>(), "42");

  const auto reqs = transport->requests();
  EXPECT_EQ(reqs.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(reqs[0].method, "POST");
  EXPECT_EQ(reqs[0].url, "https://discord.com/api/v10/webhooks/123/tok-EN_9?wait=true");
  EXPECT_TRUE(reqs[0].route.find("tok-EN_9") == std::string::npos);
  EXPECT_TRUE(json::parse(reqs[0].body->bytes()) == (json{{"content", "hi"}, {"tts", false}}));

  RequestFuture<json> file = client.send("dog", AttachmentData::bytes("woof"));
  file.get();
  const auto with_file = transport->requests().back();
  EXPECT_TRUE(with_file.body->is_multipart());
  EXPECT_EQ(with_file.body->find_part("file0")->data, "woof");

  EXPECT_THROWS(InvalidArgument, client.send(std::vector<Embed>{}));
  EXPECT_THROWS(InvalidArgument, client.send(std::string("   ")));
  const std::size_t before = transport->requests().size();
  EXPECT_THROWS(InvalidArgument, client.send_file(fs::temp_directory_path() / ("nope_" + random_id(8))));
  EXPECT_EQ(transport->requests().size(), before);

  // Byte sources are single use: a resent file message fails through the future.
  const WebhookMessage once = WebhookMessage::files("a", AttachmentData::bytes("1"));
  client.send(once).get();
  RequestFuture<json> again = client.send(once);
  EXPECT_TRUE(again.is_completed_exceptionally());
  EXPECT_THROWS(TransportFailure, again.get());

  transport->set_response(HttpResponse{204, "", "", {}});
  EXPECT_TRUE(client.send("no body").get().is_null());

  client.close();
  RequestFuture<json> closed = client.send("late");
  EXPECT_TRUE(closed.is_done());
  EXPECT_THROWS(TransportFailure, closed.get());

  requester.stop();
  return 0;
}

int test_config() {
  json root = default_config_json();
#ifndef _WIN32
  setenv("WIREHOOK_TEST_URL", "https://discord.com/api/webhooks/1/abc", 1);
  root["webhook"]["url"] = "${WIREHOOK_TEST_URL}";
#else
  root["webhook"]["url"] = "https://discord.com/api/webhooks/1/abc";
#endif
  root["http"]["timeout"] = 12;
  root["http"]["wait"] = false;
  root["log"]["level"] = "debug";

  const fs::path tmp = fs::temp_directory_path() / ("wirehook_test_cfg_" + random_id(10) + ".json");
  EXPECT_TRUE(write_text_file(tmp, root.dump(2)));
  const Config cfg = load_config(tmp);
  std::error_code ec;
  fs::remove(tmp, ec);

  EXPECT_EQ(cfg.webhook_url, "https://discord.com/api/webhooks/1/abc");
  EXPECT_EQ(cfg.http.timeout_s, 12);
  EXPECT_TRUE(!cfg.http.wait);
  EXPECT_EQ(cfg.http.api_base, std::string(kDefaultApiBase));
  EXPECT_EQ(cfg.log.level, "debug");
  EXPECT_TRUE(Logger::parse_level(cfg.log.level) == Logger::Level::kDebug);

  const fs::path broken = write_temp_file("{ not json");
  const Config fallback = load_config(broken);
  fs::remove(broken, ec);
  EXPECT_TRUE(fallback.webhook_url.empty());
  EXPECT_EQ(fallback.http.timeout_s, 30);

  json partial = default_config_json();
  partial["webhook"]["url"] = "https://discord.com/api/webhooks/2/def";
  partial["http"]["timeout"] = "x";
  const fs::path bad_type = write_temp_file(partial.dump());
  const Config kept = load_config(bad_type);
  fs::remove(bad_type, ec);
  EXPECT_TRUE(kept.webhook_url.empty());
  EXPECT_EQ(kept.http.timeout_s, 30);

  const Config missing = load_config(fs::temp_directory_path() / ("wirehook_absent_" + random_id(10)));
  EXPECT_TRUE(missing.http.wait);
  return 0;
}

}  // namespace

int main() {
  Logger::set_min_level(Logger::Level::kError);

  RUN(test_embed_constructor);
  RUN(test_attachment_limits);
  RUN(test_flat_pairs);
  RUN(test_attachment_converter);
  RUN(test_from_message);
  RUN(test_builder);
  RUN(test_encode_json);
  RUN(test_encode_multipart);
  RUN(test_encode_stops_at_empty_slot);
  RUN(test_invalid_utf8_text);
  RUN(test_resolved_futures);
  RUN(test_share_is_unsupported);
  RUN(test_cancel_pending);
  RUN(test_requester_lifecycle);
  RUN(test_requester_stop_cycles);
  RUN(test_handler_and_http_failures);
  RUN(test_webhook_client);
  RUN(test_config);

  std::cout << "OK\n";
  return 0;
}
