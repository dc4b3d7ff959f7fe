#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "wirehook/config.hpp"
#include "wirehook/http.hpp"
#include "wirehook/message.hpp"
#include "wirehook/metrics.hpp"
#include "wirehook/payload.hpp"
#include "wirehook/requester.hpp"
#include "wirehook/webhook_client.hpp"

namespace {

using namespace wirehook;

void print_usage() {
  std::cout
      << "wirehook - webhook message sender\n\n"
      << "Usage:\n"
      << "  wirehook init\n"
      << "  wirehook send [--url URL] [MESSAGE OPTIONS] [--metrics]\n"
      << "  wirehook encode [MESSAGE OPTIONS]\n"
      << "  wirehook --version\n\n"
      << "Message options:\n"
      << "  --content TEXT  --username NAME  --avatar URL  --tts\n"
      << "  --file NAME=PATH (repeatable)  --embed-title TEXT  --embed-description TEXT  --embed-color RGB\n";
}

bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
  return std::find(args.begin(), args.end(), flag) != args.end();
}

std::string get_flag_value(const std::vector<std::string>& args, const std::string& flag,
                           const std::string& fallback = "") {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag) {
      return args[i + 1];
    }
  }
  return fallback;
}

std::vector<std::string> get_flag_values(const std::vector<std::string>& args, const std::string& flag) {
  std::vector<std::string> out;
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag) {
      out.push_back(args[i + 1]);
    }
  }
  return out;
}

std::optional<Embed> embed_from_args(const std::vector<std::string>& args) {
  Embed embed;
  const std::string title = get_flag_value(args, "--embed-title");
  const std::string description = get_flag_value(args, "--embed-description");
  const std::string color = trim(get_flag_value(args, "--embed-color"));
  if (!title.empty()) {
    embed.title = title;
  }
  if (!description.empty()) {
    embed.description = description;
  }
  if (!color.empty()) {
    try {
      embed.color = std::stoi(color, nullptr, 0);
    } catch (const std::exception&) {
      throw InvalidArgument("Invalid --embed-color '" + color + "'");
    }
  }
  if (embed.is_empty()) {
    return std::nullopt;
  }
  return embed;
}

WebhookMessage message_from_args(const std::vector<std::string>& args) {
  WebhookMessageBuilder builder;
  builder.set_content(get_flag_value(args, "--content"));
  builder.set_username(get_flag_value(args, "--username"));
  builder.set_avatar_url(get_flag_value(args, "--avatar"));
  builder.set_tts(has_flag(args, "--tts"));
  if (auto embed = embed_from_args(args)) {
    builder.add_embeds({*embed});
  }
  for (const auto& file_arg : get_flag_values(args, "--file")) {
    const auto eq = file_arg.find('=');
    if (eq == std::string::npos) {
      builder.add_file(fs::path(file_arg));
    } else {
      builder.add_file(file_arg.substr(0, eq), AttachmentData::file(file_arg.substr(eq + 1)));
    }
  }
  return builder.build();
}

int run_init() {
  const fs::path config_path = get_config_path();
  if (fs::exists(config_path)) {
    std::cout << "Config already exists: " << config_path.string() << "\n";
    return 0;
  }
  if (!save_default_config(config_path)) {
    std::cerr << "Failed to write config: " << config_path.string() << "\n";
    return 1;
  }
  std::cout << "Created config: " << config_path.string() << "\n";
  return 0;
}

int run_encode(const std::vector<std::string>& args) {
  try {
    const WireBody body = encode(message_from_args(args));
    std::cout << "Content-Type: " << body.content_type() << "\n\n" << body.bytes();
    if (!body.is_multipart()) {
      std::cout << "\n";
    }
    return 0;
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kError, std::string("Encode failed: ") + e.what());
    return 1;
  }
}

int run_send(const std::vector<std::string>& args, const Config& cfg) {
  const std::string url = trim(get_flag_value(args, "--url", cfg.webhook_url));
  if (url.empty()) {
    std::cerr << "No webhook url. Pass --url or set webhook.url in " << get_config_path().string() << "\n";
    return 1;
  }

  Requester requester(std::make_shared<HttpClient>(cfg.http.user_agent));
  requester.start();

  int rc = 0;
  try {
    WebhookClient client = WebhookClient::from_url(url, requester, cfg.http);
    RequestFuture<json> future = client.send(message_from_args(args));
    if (!future.wait_for(std::chrono::seconds(cfg.http.timeout_s + 5))) {
      future.cancel(true);
      Logger::log(Logger::Level::kError, "Timed out waiting for webhook response");
      rc = 1;
    } else {
      const json sent = future.get();
      std::cout << (sent.is_null() ? "Sent.\n" : sent.dump(2) + "\n");
    }
  } catch (const InvalidArgument& e) {
    std::cerr << "Invalid input: " << e.what() << "\n";
    rc = 2;
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kError, std::string("Send failed: ") + e.what());
    rc = 1;
  }

  requester.stop();
  if (has_flag(args, "--metrics")) {
    std::cout << metrics().to_json().dump(2) << "\n";
  }
  return rc;
}

}  // namespace

int main(int argc, char** argv) {
  const Config cfg = load_config();
  apply_log_config(cfg.log);
  {
    const char* v = std::getenv("WIREHOOK_LOG_JSON");
    if (v && *v && std::string(v) != "0") {
      Logger::set_json(true);
    }
  }

  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  if (args.size() <= 1) {
    print_usage();
    return 0;
  }

  const std::string command = args[1];
  const std::vector<std::string> sub(args.begin() + 2, args.end());

  if (command == "--version" || command == "-v") {
    std::cout << "wirehook v" << kVersion << "\n";
    return 0;
  }
  if (command == "init") {
    return run_init();
  }
  if (command == "encode") {
    return run_encode(sub);
  }
  if (command == "send") {
    return run_send(sub, cfg);
  }

  print_usage();
  return 1;
}
