#include "http_client.h"
#include "request_context.h"
#include <curl/curl.h>
#include <memory>

namespace rec {

namespace {

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total = size * nmemb;
  static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
  return total;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* context = static_cast<const RequestContext*>(clientp);
  return (context && context->cancelled()) ? 1 : 0;
}

struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct EasyDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

} // namespace

CurlGlobal::CurlGlobal() {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("Failed to initialize libcurl");
  }
}

CurlGlobal::~CurlGlobal() {
  curl_global_cleanup();
}

HttpResponse HttpClient::postJson(const std::string& url,
                                  const std::string& body,
                                  const std::vector<std::string>& headers,
                                  std::chrono::milliseconds timeout,
                                  const RequestContext* context) const {
  if (timeout.count() <= 0) {
    throw HttpError("No time left for request to " + url, true, false);
  }

  std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
  if (!curl) {
    throw HttpError("Failed to initialize CURL handle", false, false);
  }

  curl_slist* raw_headers = curl_slist_append(nullptr, "Content-Type: application/json");
  for (const auto& header : headers) {
    raw_headers = curl_slist_append(raw_headers, header.c_str());
  }
  std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_headers);

  HttpResponse response;

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
  // worker threads: no SIGALRM based resolver timeouts
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, const_cast<RequestContext*>(context));

  CURLcode res = curl_easy_perform(curl.get());
  if (res == CURLE_ABORTED_BY_CALLBACK) {
    throw HttpError("Request to " + url + " cancelled", false, true);
  }
  if (res == CURLE_OPERATION_TIMEDOUT) {
    throw HttpError("Request to " + url + " timed out", true, false);
  }
  if (res != CURLE_OK) {
    throw HttpError("Request to " + url + " failed: " + curl_easy_strerror(res), false, false);
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

} // namespace rec
