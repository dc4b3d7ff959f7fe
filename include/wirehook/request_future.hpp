#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "wirehook/common.hpp"
#include "wirehook/errors.hpp"
#include "wirehook/http.hpp"
#include "wirehook/requester.hpp"

namespace wirehook {

enum class FutureState { kPending, kCompleted, kFailed, kCancelled };

inline const char* to_string(FutureState state) {
  switch (state) {
    case FutureState::kPending:
      return "pending";
    case FutureState::kCompleted:
      return "completed";
    case FutureState::kFailed:
      return "failed";
    case FutureState::kCancelled:
    default:
      return "cancelled";
  }
}

namespace detail {

// Single-assignment completion cell shared between a RequestFuture and its Request callbacks.
template <typename T>
class FutureCore {
 public:
  using SuccessCallback = std::function<void(const T&)>;
  using FailureCallback = std::function<void(std::exception_ptr)>;

  bool try_complete(T value) {
    if (!claim()) {
      return false;
    }
    std::vector<Listener> listeners;
    {
      std::lock_guard<std::mutex> lock(mu_);
      value_ = std::move(value);
      state_ = FutureState::kCompleted;
      listeners.swap(listeners_);
    }
    cv_.notify_all();
    notify(listeners);
    return true;
  }

  bool try_fail(std::exception_ptr error) { return resolve_error(FutureState::kFailed, std::move(error)); }

  bool try_cancel() { return resolve_error(FutureState::kCancelled, std::make_exception_ptr(CancellationError())); }

  FutureState state() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_;
  }

  void wait() const {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this]() { return state_ != FutureState::kPending; });
  }

  template <typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [this]() { return state_ != FutureState::kPending; });
  }

  T get() const {
    wait();
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ != FutureState::kCompleted) {
      std::rethrow_exception(error_);
    }
    return *value_;
  }

  // Runs immediately on the calling thread when already resolved.
  void listen(SuccessCallback on_success, FailureCallback on_failure) {
    Listener listener{std::move(on_success), std::move(on_failure)};
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (state_ == FutureState::kPending) {
        listeners_.push_back(std::move(listener));
        return;
      }
    }
    notify({std::move(listener)});
  }

 private:
  struct Listener {
    SuccessCallback on_success;
    FailureCallback on_failure;
  };

  bool claim() {
    bool expected = false;
    return claimed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
  }

  bool resolve_error(FutureState terminal, std::exception_ptr error) {
    if (!claim()) {
      return false;
    }
    std::vector<Listener> listeners;
    {
      std::lock_guard<std::mutex> lock(mu_);
      error_ = std::move(error);
      state_ = terminal;
      listeners.swap(listeners_);
    }
    cv_.notify_all();
    notify(listeners);
    return true;
  }

  void notify(const std::vector<Listener>& listeners) const {
    for (const auto& l : listeners) {
      try {
        if (state() == FutureState::kCompleted) {
          if (l.on_success) {
            std::optional<T> copy;
            {
              std::lock_guard<std::mutex> lock(mu_);
              copy = value_;
            }
            l.on_success(*copy);
          }
        } else if (l.on_failure) {
          std::exception_ptr error;
          {
            std::lock_guard<std::mutex> lock(mu_);
            error = error_;
          }
          l.on_failure(error);
        }
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kError, std::string("RequestFuture callback threw: ") + e.what());
      }
    }
  }

  std::atomic<bool> claimed_{false};
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  FutureState state_{FutureState::kPending};
  std::optional<T> value_;
  std::exception_ptr error_;
  std::vector<Listener> listeners_;
};

}  // namespace detail

// Caller-side handle for one submitted request.
//
// Only the requester's callbacks can resolve it; the handle itself offers waiting, callback
// registration and cancellation, and never hands out a freely completable future.
template <typename T>
class RequestFuture {
 public:
  using Handler = std::function<T(const HttpResponse&)>;

  // Builds the request, wires its callbacks to this future and submits it to `requester`.
  RequestFuture(Requester& requester, RequestDescriptor descriptor, Handler handler)
      : core_(std::make_shared<detail::FutureCore<T>>()) {
    std::weak_ptr<detail::FutureCore<T>> weak = core_;
    request_ = std::make_shared<Request>(
        std::move(descriptor),
        [weak, handler = std::move(handler)](const HttpResponse& response) {
          auto core = weak.lock();
          if (!core) {
            return;
          }
          try {
            core->try_complete(handler(response));
          } catch (const std::exception&) {
            core->try_fail(std::current_exception());
          }
        },
        [weak](std::exception_ptr error) {
          if (auto core = weak.lock()) {
            core->try_fail(std::move(error));
          }
        });
    requester.submit(request_);
  }

  static RequestFuture completed(T value) {
    RequestFuture f;
    f.core_->try_complete(std::move(value));
    return f;
  }

  static RequestFuture failed(std::exception_ptr error) {
    RequestFuture f;
    f.core_->try_fail(std::move(error));
    return f;
  }

  template <typename E>
  static RequestFuture failed(const E& error) {
    return failed(std::make_exception_ptr(error));
  }

  RequestFuture(RequestFuture&&) noexcept = default;
  RequestFuture& operator=(RequestFuture&&) noexcept = default;
  RequestFuture(const RequestFuture&) = delete;
  RequestFuture& operator=(const RequestFuture&) = delete;

  // Returns true only for the call that moved this future to kCancelled.
  bool cancel(bool may_interrupt = true) {
    (void)may_interrupt;
    if (core_->state() != FutureState::kPending) {
      return false;
    }
    if (request_) {
      request_->cancel();
    }
    return core_->try_cancel();
  }

  FutureState state() const { return core_->state(); }
  bool is_done() const { return state() != FutureState::kPending; }
  bool is_cancelled() const { return state() == FutureState::kCancelled; }
  bool is_completed_exceptionally() const {
    const FutureState s = state();
    return s == FutureState::kFailed || s == FutureState::kCancelled;
  }

  // Blocks. Rethrows the failure, or CancellationError when cancelled.
  T get() const { return core_->get(); }

  void wait() const { core_->wait(); }

  template <typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
    return core_->wait_for(timeout);
  }

  // Callbacks run on the requester thread, or immediately when already resolved.
  void on_complete(std::function<void(const T&)> on_success,
                   std::function<void(std::exception_ptr)> on_failure = {}) const {
    core_->listen(std::move(on_success), std::move(on_failure));
  }

  // Always throws. Requester integrity depends on nobody else resolving this future.
  std::shared_future<T> share() const {
    throw UnsupportedOperation("Access to the underlying future is not supported to secure requester integrity");
  }

 private:
  RequestFuture() : core_(std::make_shared<detail::FutureCore<T>>()) {}

  std::shared_ptr<detail::FutureCore<T>> core_;
  std::shared_ptr<Request> request_;
};

}  // namespace wirehook
