#pragma once

#include <stdexcept>
#include <string>

namespace wirehook {

// Malformed construction input. Always thrown synchronously.
class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) {}
};

class UnsupportedOperation : public std::logic_error {
 public:
  explicit UnsupportedOperation(const std::string& what) : std::logic_error(what) {}
};

// Network, HTTP or byte-source failure. Reaches callers only through a failed RequestFuture.
class TransportFailure : public std::runtime_error {
 public:
  explicit TransportFailure(const std::string& what, long status = 0)
      : std::runtime_error(what), status_(status) {}

  long status() const noexcept { return status_; }

 private:
  long status_;
};

class CancellationError : public std::runtime_error {
 public:
  CancellationError() : std::runtime_error("request was cancelled") {}
};

namespace checks {

inline void check(bool condition, const std::string& message) {
  if (!condition) {
    throw InvalidArgument(message);
  }
}

inline void not_blank(const std::string& value, const std::string& what) {
  if (value.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw InvalidArgument(what + " may not be blank");
  }
}

template <typename Container>
void not_empty(const Container& value, const std::string& what) {
  if (value.empty()) {
    throw InvalidArgument(what + " may not be empty");
  }
}

template <typename Ptr>
void not_null(const Ptr& value, const std::string& what) {
  if (value == nullptr) {
    throw InvalidArgument(what + " may not be null");
  }
}

}  // namespace checks

}  // namespace wirehook
