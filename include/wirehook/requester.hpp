#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "wirehook/common.hpp"
#include "wirehook/errors.hpp"
#include "wirehook/http.hpp"
#include "wirehook/metrics.hpp"

namespace wirehook {

// One queued network operation. Callbacks are invoked at most once, from the requester thread.
class Request {
 public:
  using SuccessCallback = std::function<void(const HttpResponse&)>;
  using FailureCallback = std::function<void(std::exception_ptr)>;

  Request(RequestDescriptor descriptor, SuccessCallback on_success, FailureCallback on_failure)
      : descriptor_(std::move(descriptor)), on_success_(std::move(on_success)), on_failure_(std::move(on_failure)) {}

  const RequestDescriptor& descriptor() const { return descriptor_; }

  // Best effort. A request already handed to the transport still goes out.
  void cancel() { cancelled_.store(true); }
  bool is_cancelled() const { return cancelled_.load(); }

  void handle_success(const HttpResponse& response) {
    if (!finished_.exchange(true) && on_success_) {
      on_success_(response);
    }
  }

  void handle_failure(std::exception_ptr error) {
    if (!finished_.exchange(true) && on_failure_) {
      on_failure_(std::move(error));
    }
  }

 private:
  RequestDescriptor descriptor_;
  SuccessCallback on_success_;
  FailureCallback on_failure_;
  std::atomic<bool> cancelled_{false};
  std::atomic<bool> finished_{false};
};

// FIFO dispatcher. Executes requests on a single worker thread through an HttpTransport.
class Requester {
 public:
  explicit Requester(std::shared_ptr<HttpTransport> transport) : transport_(std::move(transport)) {}

  ~Requester() { stop(); }

  Requester(const Requester&) = delete;
  Requester& operator=(const Requester&) = delete;

  void start() {
    if (running_.exchange(true)) {
      return;
    }
    worker_ = std::thread([this]() { loop(); });
    Logger::log(Logger::Level::kInfo, "Requester started");
  }

  // Requests still queued are failed with TransportFailure.
  void stop() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (!running_.exchange(false)) {
        return;
      }
    }
    cv_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
    }

    std::deque<std::shared_ptr<Request>> leftover;
    {
      std::lock_guard<std::mutex> lock(mu_);
      leftover.swap(queue_);
    }
    for (const auto& r : leftover) {
      if (!drop_if_cancelled(r)) {
        fail(r, TransportFailure("requester stopped"));
      }
    }
    Logger::log(Logger::Level::kInfo, "Requester stopped");
  }

  // Never throws for transport reasons. A stopped requester fails the request through its callback.
  void submit(std::shared_ptr<Request> request) {
    if (!request) {
      return;
    }
    metrics().inc("requests.submitted");
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (running_.load()) {
        queue_.push_back(std::move(request));
        request = nullptr;
      }
    }
    if (request) {
      fail(request, TransportFailure("requester is not running"));
      return;
    }
    cv_.notify_one();
  }

  std::size_t pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
  }

  bool is_running() const { return running_.load(); }

 private:
  void loop() {
    while (true) {
      std::shared_ptr<Request> next;
      {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this]() { return !running_.load() || !queue_.empty(); });
        if (!running_.load()) {
          break;
        }
        next = std::move(queue_.front());
        queue_.pop_front();
      }
      execute(next);
    }
  }

  bool drop_if_cancelled(const std::shared_ptr<Request>& request) {
    if (!request->is_cancelled()) {
      return false;
    }
    metrics().inc("requests.cancelled");
    Logger::log(Logger::Level::kDebug, "Dropping cancelled request " + request->descriptor().route);
    return true;
  }

  void execute(const std::shared_ptr<Request>& request) {
    if (drop_if_cancelled(request)) {
      return;
    }

    HttpResponse resp;
    try {
      resp = transport_->execute(request->descriptor());
    } catch (const std::exception& e) {
      fail(request, TransportFailure(e.what()));
      return;
    }

    if (!resp.error.empty()) {
      fail(request, TransportFailure(resp.error, resp.status));
      return;
    }
    if (!resp.ok()) {
      fail(request, TransportFailure("HTTP " + std::to_string(resp.status) + ": " + resp.body, resp.status));
      return;
    }

    metrics().inc("requests.completed");
    try {
      request->handle_success(resp);
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kError, std::string("Request success callback failed: ") + e.what());
    }
  }

  void fail(const std::shared_ptr<Request>& request, const TransportFailure& error) {
    metrics().inc("requests.failed");
    Logger::log(Logger::Level::kWarn, "Request " + request->descriptor().route + " failed: " + error.what());
    try {
      request->handle_failure(std::make_exception_ptr(error));
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kError, std::string("Request failure callback failed: ") + e.what());
    }
  }

  std::shared_ptr<HttpTransport> transport_;
  std::atomic<bool> running_{false};
  std::thread worker_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::shared_ptr<Request>> queue_;
};

}  // namespace wirehook
