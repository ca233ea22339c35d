#include "request_context.h"
#include "errors.h"
#include <algorithm>
#include <string>

namespace rec {

RequestContext::RequestContext()
  : deadline_(Clock::time_point::max()), has_deadline_(false), cancelled_(false) {}

RequestContext::RequestContext(std::chrono::milliseconds timeout)
  : deadline_(Clock::now() + timeout), has_deadline_(true), cancelled_(false) {}

void RequestContext::setDisconnectProbe(std::function<bool()> probe) {
  disconnect_probe_ = std::move(probe);
}

void RequestContext::cancel() {
  cancelled_.store(true);
}

bool RequestContext::cancelled() const {
  if (cancelled_.load()) {
    return true;
  }
  if (disconnect_probe_ && disconnect_probe_()) {
    cancelled_.store(true);
    return true;
  }
  return expired();
}

bool RequestContext::expired() const {
  return has_deadline_ && Clock::now() >= deadline_;
}

std::chrono::milliseconds RequestContext::remaining(std::chrono::milliseconds fallback) const {
  if (!has_deadline_) {
    return fallback;
  }
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now());
  return std::max(left, std::chrono::milliseconds(0));
}

void RequestContext::throwIfCancelled(const char* stage) const {
  if (cancelled_.load() || (disconnect_probe_ && disconnect_probe_())) {
    cancelled_.store(true);
    throw RequestCancelled(std::string("Request cancelled during ") + stage);
  }
  if (expired()) {
    throw RequestCancelled(std::string("Request deadline exceeded during ") + stage);
  }
}

} // namespace rec
