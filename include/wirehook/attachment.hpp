#pragma once

#include <cstdint>
#include <fstream>
#include <istream>
#include <iterator>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "wirehook/common.hpp"
#include "wirehook/errors.hpp"

namespace wirehook {

struct FileData {
  fs::path path;
};

struct StreamData {
  std::shared_ptr<std::istream> stream;
};

struct BytesData {
  std::vector<std::uint8_t> bytes;
};

// Data half of a (name, data) attachment pair. Default-constructed value is the null state.
class AttachmentData {
 public:
  using Kind = std::variant<std::monostate, FileData, StreamData, BytesData>;

  AttachmentData() = default;

  static AttachmentData file(fs::path path) { return AttachmentData(FileData{std::move(path)}); }

  static AttachmentData stream(std::shared_ptr<std::istream> in) {
    if (!in) {
      return AttachmentData();
    }
    return AttachmentData(StreamData{std::move(in)});
  }

  static AttachmentData bytes(std::vector<std::uint8_t> data) { return AttachmentData(BytesData{std::move(data)}); }

  static AttachmentData bytes(const std::string& data) {
    return AttachmentData(BytesData{std::vector<std::uint8_t>(data.begin(), data.end())});
  }

  bool is_null() const { return std::holds_alternative<std::monostate>(kind_); }
  const Kind& kind() const { return kind_; }

 private:
  explicit AttachmentData(Kind kind) : kind_(std::move(kind)) {}

  Kind kind_;
};

// Readable bytes of one attachment. Opened on construction, drained at most once.
class ByteSource {
 public:
  explicit ByteSource(std::shared_ptr<std::istream> in) : in_(std::move(in)) {}

  ByteSource(const ByteSource&) = delete;
  ByteSource& operator=(const ByteSource&) = delete;

  std::string read_all() {
    std::lock_guard<std::mutex> lock(mu_);
    if (consumed_) {
      throw TransportFailure("byte source was already consumed");
    }
    consumed_ = true;
    if (!in_) {
      throw TransportFailure("byte source is closed");
    }
    std::string out{std::istreambuf_iterator<char>(*in_), std::istreambuf_iterator<char>()};
    if (in_->bad()) {
      in_.reset();
      throw TransportFailure("failed to read attachment data");
    }
    return out;
  }

  void close() {
    std::lock_guard<std::mutex> lock(mu_);
    in_.reset();
  }

  bool is_consumed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return consumed_;
  }

  bool is_open() const {
    std::lock_guard<std::mutex> lock(mu_);
    return in_ != nullptr;
  }

 private:
  mutable std::mutex mu_;
  std::shared_ptr<std::istream> in_;
  bool consumed_{false};
};

struct Attachment {
  std::string name;
  std::shared_ptr<ByteSource> data;
};

namespace detail {

inline std::shared_ptr<std::istream> open_file(const fs::path& path) {
  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    throw InvalidArgument("Cannot attach directory '" + path.string() + "'");
  }
  auto in = std::make_shared<std::ifstream>(path, std::ios::in | std::ios::binary);
  if (!in->is_open()) {
    throw InvalidArgument("Cannot open file '" + path.string() + "' for reading");
  }
  return in;
}

}  // namespace detail

inline Attachment convert_attachment(const std::string& name, const AttachmentData& data) {
  checks::not_blank(name, "Name");
  if (data.is_null()) {
    throw InvalidArgument("Data may not be null");
  }

  std::shared_ptr<std::istream> in = std::visit(
      [](const auto& d) -> std::shared_ptr<std::istream> {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, FileData>) {
          return detail::open_file(d.path);
        } else if constexpr (std::is_same_v<T, StreamData>) {
          return d.stream;
        } else if constexpr (std::is_same_v<T, BytesData>) {
          return std::make_shared<std::istringstream>(std::string(d.bytes.begin(), d.bytes.end()),
                                                      std::ios::in | std::ios::binary);
        } else {
          return nullptr;
        }
      },
      data.kind());

  if (!in) {
    throw InvalidArgument("Data may not be null");
  }
  return Attachment{name, std::make_shared<ByteSource>(std::move(in))};
}

}  // namespace wirehook
