#pragma once

#include <optional>
#include <string>
#include <vector>

#include "wirehook/common.hpp"
#include "wirehook/config.hpp"

namespace wirehook {

struct EmbedField {
  std::string name;
  std::string value;
  bool inline_field{false};
};

// Rich content block. Only the parts needed to produce its wire form are modelled.
struct Embed {
  std::optional<std::string> title;
  std::optional<std::string> description;
  std::optional<std::string> url;
  std::optional<int> color;
  std::optional<std::string> timestamp;
  std::optional<std::string> author_name;
  std::optional<std::string> author_url;
  std::optional<std::string> author_icon_url;
  std::optional<std::string> footer_text;
  std::optional<std::string> footer_icon_url;
  std::optional<std::string> image_url;
  std::optional<std::string> thumbnail_url;
  std::vector<EmbedField> fields;

  // Characters counted against limits::kEmbedMaxLength.
  std::size_t length() const {
    std::size_t n = 0;
    n += title ? utf8_length(*title) : 0;
    n += description ? utf8_length(*description) : 0;
    n += author_name ? utf8_length(*author_name) : 0;
    n += footer_text ? utf8_length(*footer_text) : 0;
    for (const auto& f : fields) {
      n += utf8_length(f.name) + utf8_length(f.value);
    }
    return n;
  }

  bool is_empty() const {
    return !title && !description && !url && !color && !timestamp && !author_name && !footer_text &&
           !image_url && !thumbnail_url && fields.empty();
  }

  bool is_sendable() const { return !is_empty() && length() <= limits::kEmbedMaxLength; }

  json to_json() const {
    json j = json::object();
    if (title) {
      j["title"] = *title;
    }
    if (description) {
      j["description"] = *description;
    }
    if (url) {
      j["url"] = *url;
    }
    if (color) {
      j["color"] = *color;
    }
    if (timestamp) {
      j["timestamp"] = *timestamp;
    }
    if (author_name) {
      json author{{"name", *author_name}};
      if (author_url) {
        author["url"] = *author_url;
      }
      if (author_icon_url) {
        author["icon_url"] = *author_icon_url;
      }
      j["author"] = std::move(author);
    }
    if (footer_text) {
      json footer{{"text", *footer_text}};
      if (footer_icon_url) {
        footer["icon_url"] = *footer_icon_url;
      }
      j["footer"] = std::move(footer);
    }
    if (image_url) {
      j["image"] = json{{"url", *image_url}};
    }
    if (thumbnail_url) {
      j["thumbnail"] = json{{"url", *thumbnail_url}};
    }
    if (!fields.empty()) {
      json arr = json::array();
      for (const auto& f : fields) {
        arr.push_back(json{{"name", f.name}, {"value", f.value}, {"inline", f.inline_field}});
      }
      j["fields"] = std::move(arr);
    }
    return j;
  }
};

}  // namespace wirehook
