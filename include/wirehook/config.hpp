#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "wirehook/common.hpp"

namespace wirehook {

namespace limits {

inline constexpr std::size_t kMaxFiles = 20;
inline constexpr std::size_t kMaxContentLength = 2000;
inline constexpr std::size_t kMaxEmbeds = 10;
inline constexpr std::size_t kEmbedMaxLength = 6000;

}  // namespace limits

inline constexpr const char* kVersion = "0.1.0";
inline constexpr const char* kDefaultApiBase = "https://discord.com/api/v10";

struct HttpConfig {
  std::string api_base{kDefaultApiBase};
  std::string user_agent{std::string("wirehook/") + kVersion};
  int timeout_s{30};
  // Append ?wait=true so the endpoint answers with the created message.
  bool wait{true};
};

struct LogConfig {
  bool json{false};
  std::string level{"info"};
};

struct Config {
  std::string webhook_url;
  HttpConfig http{};
  LogConfig log{};
};

inline std::string resolve_env_ref(const std::string& value) {
  if (value.empty()) {
    return "";
  }

  // Supports "$ENV_NAME" and "${ENV_NAME}".
  if (value[0] != '$') {
    return value;
  }

  std::string env_name = value.substr(1);
  if (!env_name.empty() && env_name.front() == '{' && env_name.back() == '}') {
    env_name = env_name.substr(1, env_name.size() - 2);
  }
  if (env_name.empty()) {
    return value;
  }

  const char* v = std::getenv(env_name.c_str());
  return (v && *v) ? std::string(v) : "";
}

inline fs::path get_data_dir() {
  return expand_user_path("~/.wirehook");
}

inline fs::path get_config_path() {
  return get_data_dir() / "config.json";
}

inline json default_config_json() {
  const HttpConfig http{};
  return json{
      {"webhook", {{"url", "$WIREHOOK_URL"}}},
      {"http",
       {
           {"apiBase", http.api_base},
           {"userAgent", http.user_agent},
           {"timeout", http.timeout_s},
           {"wait", http.wait},
       }},
      {"log", {{"json", false}, {"level", "info"}}}};
}

inline Config load_config(const fs::path& path = get_config_path()) {
  Config cfg{};
  const std::string raw = read_text_file(path);
  if (raw.empty()) {
    return cfg;
  }

  try {
    const json root = json::parse(raw);
    Config parsed{};

    if (root.contains("webhook") && root["webhook"].is_object()) {
      parsed.webhook_url = trim(resolve_env_ref(root["webhook"].value("url", "")));
    }

    if (root.contains("http") && root["http"].is_object()) {
      const auto& http = root["http"];
      parsed.http.api_base = http.value("apiBase", parsed.http.api_base);
      parsed.http.user_agent = http.value("userAgent", parsed.http.user_agent);
      parsed.http.timeout_s = (std::max)(1, http.value("timeout", parsed.http.timeout_s));
      parsed.http.wait = http.value("wait", parsed.http.wait);
    }

    if (root.contains("log") && root["log"].is_object()) {
      const auto& log = root["log"];
      parsed.log.json = log.value("json", parsed.log.json);
      parsed.log.level = log.value("level", parsed.log.level);
    }
    cfg = std::move(parsed);
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kWarn, std::string("Failed to parse config: ") + e.what());
  }

  return cfg;
}

inline void apply_log_config(const LogConfig& log) {
  Logger::set_json(log.json);
  Logger::set_min_level(Logger::parse_level(log.level));
}

inline bool save_default_config(const fs::path& path = get_config_path()) {
  return write_text_file(path, default_config_json().dump(2));
}

}  // namespace wirehook
