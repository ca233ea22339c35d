#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace rec {

class RequestContext;

struct HttpResponse {
  long status = 0;
  std::string body;
};

class HttpError : public std::runtime_error {
public:
  HttpError(const std::string& message, bool timed_out, bool cancelled)
    : std::runtime_error(message), timed_out_(timed_out), cancelled_(cancelled) {}

  bool timedOut() const { return timed_out_; }
  bool cancelled() const { return cancelled_; }

private:
  bool timed_out_;
  bool cancelled_;
};

// Owns curl_global_init / curl_global_cleanup for the process
class CurlGlobal {
public:
  CurlGlobal();
  ~CurlGlobal();

  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// Blocking JSON POST over libcurl. Every call uses its own easy handle so
// one client is safe to share between worker threads.
class HttpClient {
public:
  HttpResponse postJson(const std::string& url,
                        const std::string& body,
                        const std::vector<std::string>& headers,
                        std::chrono::milliseconds timeout,
                        const RequestContext* context = nullptr) const;
};

} // namespace rec
