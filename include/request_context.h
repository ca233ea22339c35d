#pragma once

#include <atomic>
#include <chrono>
#include <functional>

namespace rec {

// Per-request deadline and cancellation shared with every blocking call
// made on behalf of the request (embedding, rerank).
class RequestContext {
public:
  using Clock = std::chrono::steady_clock;

  RequestContext();
  explicit RequestContext(std::chrono::milliseconds timeout);

  RequestContext(const RequestContext&) = delete;
  RequestContext& operator=(const RequestContext&) = delete;

  // Probe returning true once the caller has gone away
  void setDisconnectProbe(std::function<bool()> probe);

  void cancel();
  bool cancelled() const;
  bool expired() const;

  bool hasDeadline() const { return has_deadline_; }
  Clock::time_point deadline() const { return deadline_; }

  // Time left before the deadline, or `fallback` when there is none
  std::chrono::milliseconds remaining(std::chrono::milliseconds fallback) const;

  // Throws RequestCancelled when cancelled or past the deadline
  void throwIfCancelled(const char* stage) const;

private:
  Clock::time_point deadline_;
  bool has_deadline_;
  mutable std::atomic<bool> cancelled_;
  std::function<bool()> disconnect_probe_;
};

} // namespace rec
