#pragma once

#include <optional>
#include <string>
#include <vector>

#include "wirehook/common.hpp"
#include "wirehook/errors.hpp"
#include "wirehook/message.hpp"

namespace wirehook {

inline constexpr const char* kMediaTypeJson = "application/json";
inline constexpr const char* kMediaTypeOctet = "application/octet-stream";
inline constexpr const char* kMediaTypeForm = "multipart/form-data";

struct FormPart {
  std::string name;
  std::optional<std::string> filename;
  std::optional<std::string> content_type;
  std::string data;
};

// Exact payload of one outbound request.
class WireBody {
 public:
  static WireBody json_body(std::string text) {
    WireBody body;
    body.content_type_ = kMediaTypeJson;
    body.data_ = std::move(text);
    return body;
  }

  static WireBody multipart(std::vector<FormPart> parts, std::string boundary = "") {
    if (boundary.empty()) {
      boundary = "wirehook-" + random_id(24);
    }
    WireBody body;
    body.content_type_ = std::string(kMediaTypeForm) + "; boundary=" + boundary;
    body.boundary_ = std::move(boundary);
    body.parts_ = std::move(parts);
    return body;
  }

  bool is_multipart() const { return !boundary_.empty(); }
  const std::string& content_type() const { return content_type_; }
  const std::string& boundary() const { return boundary_; }
  const std::vector<FormPart>& parts() const { return parts_; }

  const FormPart* find_part(const std::string& name) const {
    for (const auto& p : parts_) {
      if (p.name == name) {
        return &p;
      }
    }
    return nullptr;
  }

  // Serialized request body. For multipart bodies this is the RFC 7578 framing.
  std::string bytes() const {
    if (!is_multipart()) {
      return data_;
    }
    std::string out;
    for (const auto& p : parts_) {
      out += "--" + boundary_ + "\r\n";
      out += "Content-Disposition: form-data; name=\"" + escape_quoted(p.name) + "\"";
      if (p.filename) {
        out += "; filename=\"" + escape_quoted(*p.filename) + "\"";
      }
      out += "\r\n";
      if (p.content_type) {
        out += "Content-Type: " + *p.content_type + "\r\n";
      }
      out += "\r\n";
      out += p.data;
      out += "\r\n";
    }
    out += "--" + boundary_ + "--\r\n";
    return out;
  }

 private:
  WireBody() = default;

  static std::string escape_quoted(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
      if (c == '"') {
        out += "%22";
      } else if (c == '\r') {
        out += "%0D";
      } else if (c == '\n') {
        out += "%0A";
      } else {
        out.push_back(c);
      }
    }
    return out;
  }

  std::string content_type_;
  std::string boundary_;
  std::string data_;
  std::vector<FormPart> parts_;
};

inline json payload_json(const WebhookMessage& message) {
  json payload = json::object();
  if (message.content()) {
    payload["content"] = *message.content();
  }
  if (!message.embeds().empty()) {
    json array = json::array();
    for (const auto& embed : message.embeds()) {
      array.push_back(embed.to_json());
    }
    payload["embeds"] = std::move(array);
  }
  if (message.avatar_url()) {
    payload["avatar_url"] = *message.avatar_url();
  }
  if (message.username()) {
    payload["username"] = *message.username();
  }
  payload["tts"] = message.is_tts();
  return payload;
}

namespace detail {

inline std::string dump_payload(const json& payload) {
  try {
    return payload.dump();
  } catch (const json::type_error& e) {
    throw InvalidArgument(std::string("Message text is not valid UTF-8: ") + e.what());
  }
}

}  // namespace detail

// Drains every attachment of `message`. All byte sources are closed on return or throw.
inline WireBody encode(const WebhookMessage& message) {
  const json payload = payload_json(message);
  if (!message.is_file()) {
    return WireBody::json_body(detail::dump_payload(payload));
  }

  const AttachmentList& attachments = *message.attachments();
  struct CloseSources {
    const AttachmentList& files;
    ~CloseSources() {
      for (const auto& a : files) {
        if (a && a->data) {
          a->data->close();
        }
      }
    }
  } guard{attachments};
  const std::string payload_text = detail::dump_payload(payload);

  std::vector<FormPart> parts;
  parts.reserve(attachments.size() + 1);
  for (std::size_t i = 0; i < attachments.size(); ++i) {
    const auto& attachment = attachments[i];
    if (!attachment) {
      break;
    }
    if (!attachment->data) {
      throw TransportFailure("attachment '" + attachment->name + "' has no data");
    }
    parts.push_back(FormPart{"file" + std::to_string(i), attachment->name, std::string(kMediaTypeOctet),
                             attachment->data->read_all()});
  }
  parts.push_back(FormPart{"payload_json", std::nullopt, std::nullopt, payload_text});
  return WireBody::multipart(std::move(parts));
}

}  // namespace wirehook
