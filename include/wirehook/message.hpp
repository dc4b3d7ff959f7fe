#pragma once

#include <array>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include "wirehook/attachment.hpp"
#include "wirehook/config.hpp"
#include "wirehook/embed.hpp"
#include "wirehook/errors.hpp"

namespace wirehook {

// A message received from the remote service. Read-only input for WebhookMessage::from.
class Message {
 public:
  Message(std::string content_raw, std::vector<Embed> embeds, bool tts,
          std::vector<std::string> attachment_urls = {})
      : content_raw_(std::move(content_raw)),
        embeds_(std::move(embeds)),
        tts_(tts),
        attachment_urls_(std::move(attachment_urls)) {}

  const std::string& content_raw() const { return content_raw_; }
  const std::vector<Embed>& embeds() const { return embeds_; }
  bool is_tts() const { return tts_; }
  const std::vector<std::string>& attachment_urls() const { return attachment_urls_; }

 private:
  std::string content_raw_;
  std::vector<Embed> embeds_;
  bool tts_;
  std::vector<std::string> attachment_urls_;
};

using AttachmentList = std::vector<std::shared_ptr<Attachment>>;

// Either half of a flat (name, data, name, data, ...) argument list.
using FileArg = std::variant<std::string, AttachmentData>;

class WebhookMessageBuilder;

// Outbound message for a webhook. Supports username/avatar overrides and several embeds at once.
// Copies share the same attachment byte sources.
class WebhookMessage {
 public:
  static WebhookMessage of(std::vector<Embed> embeds) {
    checks::not_empty(embeds, "Embeds");
    return WebhookMessage(std::nullopt, std::nullopt, std::nullopt, std::move(embeds), false, std::nullopt);
  }

  static WebhookMessage of(std::initializer_list<Embed> embeds) { return of(std::vector<Embed>(embeds)); }

  // Attachments in key order. Up to limits::kMaxFiles entries.
  static WebhookMessage files(const std::map<std::string, AttachmentData>& attachments) {
    checks::not_empty(attachments, "Attachments");
    check_file_amount(attachments.size());
    AttachmentList files;
    files.reserve(attachments.size());
    for (const auto& [name, data] : attachments) {
      files.push_back(std::make_shared<Attachment>(convert_attachment(name, data)));
    }
    return WebhookMessage(std::nullopt, std::nullopt, std::nullopt, {}, false, std::move(files));
  }

  // Attachments in the given order. Names must be unique.
  static WebhookMessage files(const std::vector<std::pair<std::string, AttachmentData>>& attachments) {
    checks::not_empty(attachments, "Attachments");
    check_file_amount(attachments.size());
    std::unordered_set<std::string> seen;
    AttachmentList files;
    files.reserve(attachments.size());
    for (const auto& [name, data] : attachments) {
      check_unique(seen, name);
      files.push_back(std::make_shared<Attachment>(convert_attachment(name, data)));
    }
    return WebhookMessage(std::nullopt, std::nullopt, std::nullopt, {}, false, std::move(files));
  }

  // Flat pairs: files("dog", AttachmentData::file("dog.png"), {"cat", AttachmentData::bytes(raw)}).
  // The first pair is mandatory; `rest` must hold an even number of alternating names and data.
  static WebhookMessage files(const std::string& name1, const AttachmentData& data1,
                              const std::vector<FileArg>& rest = {}) {
    checks::not_blank(name1, "Name");
    if (data1.is_null()) {
      throw InvalidArgument("Data may not be null");
    }
    checks::check(rest.size() % 2 == 0, "Must provide even number of arguments");
    check_file_amount(1 + rest.size() / 2);

    std::unordered_set<std::string> seen;
    check_unique(seen, name1);
    AttachmentList files;
    files.reserve(1 + rest.size() / 2);
    files.push_back(std::make_shared<Attachment>(convert_attachment(name1, data1)));
    for (std::size_t i = 0; i < rest.size(); i += 2) {
      const auto* name = std::get_if<std::string>(&rest[i]);
      const auto* data = std::get_if<AttachmentData>(&rest[i + 1]);
      if (!name || !data) {
        throw InvalidArgument("Provided arguments must be pairs for (String, Data)");
      }
      check_unique(seen, *name);
      files.push_back(std::make_shared<Attachment>(convert_attachment(*name, *data)));
    }
    return WebhookMessage(std::nullopt, std::nullopt, std::nullopt, {}, false, std::move(files));
  }

  // Copies content, embeds and the TTS flag. Attachments of `message` are not copied.
  static WebhookMessage from(const Message& message) {
    return WebhookMessage(std::nullopt, std::nullopt, message.content_raw(), message.embeds(), message.is_tts(),
                          std::nullopt);
  }

  const std::optional<std::string>& username() const { return username_; }
  const std::optional<std::string>& avatar_url() const { return avatar_url_; }
  const std::optional<std::string>& content() const { return content_; }
  const std::vector<Embed>& embeds() const { return embeds_; }
  bool is_tts() const { return tts_; }
  // Messages from a builder carry limits::kMaxFiles slots; the filled ones come first.
  const std::optional<AttachmentList>& attachments() const { return attachments_; }

  bool is_file() const { return attachments_.has_value(); }

 private:
  friend class WebhookMessageBuilder;

  WebhookMessage(std::optional<std::string> username, std::optional<std::string> avatar_url,
                 std::optional<std::string> content, std::vector<Embed> embeds, bool tts,
                 std::optional<AttachmentList> attachments)
      : username_(std::move(username)),
        avatar_url_(std::move(avatar_url)),
        content_(std::move(content)),
        embeds_(std::move(embeds)),
        tts_(tts),
        attachments_(std::move(attachments)) {}

  static void check_file_amount(std::size_t n) {
    checks::check(n <= limits::kMaxFiles,
                  "Cannot add more than " + std::to_string(limits::kMaxFiles) + " files to a message");
  }

  static void check_unique(std::unordered_set<std::string>& seen, const std::string& name) {
    checks::check(seen.insert(name).second, "Duplicate attachment name '" + name + "'");
  }

  std::optional<std::string> username_;
  std::optional<std::string> avatar_url_;
  std::optional<std::string> content_;
  std::vector<Embed> embeds_;
  bool tts_;
  std::optional<AttachmentList> attachments_;
};

class WebhookMessageBuilder {
 public:
  WebhookMessageBuilder() = default;

  WebhookMessageBuilder(const WebhookMessageBuilder&) = delete;
  WebhookMessageBuilder& operator=(const WebhookMessageBuilder&) = delete;

  explicit WebhookMessageBuilder(const Message& message) {
    set_content(message.content_raw());
    add_embeds(message.embeds());
    set_tts(message.is_tts());
  }

  ~WebhookMessageBuilder() { close_files(); }

  bool is_empty() const { return content_.empty() && embeds_.empty() && file_index_ == 0; }

  WebhookMessageBuilder& reset() {
    content_.clear();
    embeds_.clear();
    reset_files();
    username_.reset();
    avatar_url_.reset();
    tts_ = false;
    return *this;
  }

  WebhookMessageBuilder& reset_embeds() {
    embeds_.clear();
    return *this;
  }

  WebhookMessageBuilder& reset_files() {
    close_files();
    files_.fill(nullptr);
    file_index_ = 0;
    return *this;
  }

  WebhookMessageBuilder& add_embeds(const std::vector<Embed>& embeds) {
    checks::check(embeds_.size() + embeds.size() <= limits::kMaxEmbeds,
                  "Cannot add more than " + std::to_string(limits::kMaxEmbeds) + " embeds to a message");
    for (const auto& e : embeds) {
      checks::check(e.is_sendable(), "Provided embed is empty or exceeds " +
                                         std::to_string(limits::kEmbedMaxLength) + " characters");
    }
    embeds_.insert(embeds_.end(), embeds.begin(), embeds.end());
    return *this;
  }

  WebhookMessageBuilder& add_embeds(std::initializer_list<Embed> embeds) {
    return add_embeds(std::vector<Embed>(embeds));
  }

  WebhookMessageBuilder& set_content(const std::string& content) {
    check_content_length(utf8_length(content));
    content_ = content;
    return *this;
  }

  WebhookMessageBuilder& append(const std::string& content) {
    check_content_length(utf8_length(content_) + utf8_length(content));
    content_ += content;
    return *this;
  }

  // Blank values clear the override.
  WebhookMessageBuilder& set_username(const std::string& username) {
    username_ = is_blank(username) ? std::nullopt : std::optional<std::string>(username);
    return *this;
  }

  WebhookMessageBuilder& set_avatar_url(const std::string& avatar_url) {
    avatar_url_ = is_blank(avatar_url) ? std::nullopt : std::optional<std::string>(avatar_url);
    return *this;
  }

  WebhookMessageBuilder& set_tts(bool tts) {
    tts_ = tts;
    return *this;
  }

  WebhookMessageBuilder& add_file(const std::string& name, const AttachmentData& data) {
    checks::check(file_index_ < limits::kMaxFiles,
                  "Cannot add more than " + std::to_string(limits::kMaxFiles) + " attachments to a message");
    for (std::size_t i = 0; i < file_index_; ++i) {
      checks::check(files_[i]->name != name, "Duplicate attachment name '" + name + "'");
    }
    files_[file_index_] = std::make_shared<Attachment>(convert_attachment(name, data));
    ++file_index_;
    return *this;
  }

  WebhookMessageBuilder& add_file(const fs::path& path) {
    return add_file(path.filename().string(), AttachmentData::file(path));
  }

  std::size_t file_count() const { return file_index_; }

  // The builder keeps its state. Attachments are shared with the built message, which receives
  // the whole slot array: unused slots stay null after the last file.
  WebhookMessage build() const {
    checks::check(!is_empty(), "Cannot build an empty message");
    std::optional<AttachmentList> files;
    if (file_index_ > 0) {
      files = AttachmentList(files_.begin(), files_.end());
    }
    return WebhookMessage(username_, avatar_url_,
                          content_.empty() ? std::nullopt : std::optional<std::string>(content_), embeds_, tts_,
                          std::move(files));
  }

 private:
  static void check_content_length(std::size_t n) {
    checks::check(n <= limits::kMaxContentLength,
                  "Content may not exceed " + std::to_string(limits::kMaxContentLength) + " characters");
  }

  // Sources already handed to a built message are left for the encoder.
  void close_files() {
    for (std::size_t i = 0; i < file_index_; ++i) {
      if (files_[i] && files_[i].use_count() == 1 && files_[i]->data) {
        files_[i]->data->close();
      }
    }
  }

  std::string content_;
  std::vector<Embed> embeds_;
  std::array<std::shared_ptr<Attachment>, limits::kMaxFiles> files_{};
  std::size_t file_index_{0};
  std::optional<std::string> username_;
  std::optional<std::string> avatar_url_;
  bool tts_{false};
};

}  // namespace wirehook
