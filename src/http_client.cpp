/**
 * @file http_client.cpp
 * @brief libcurl implementation of the HttpClient interface.
 */

#include "http_client.hpp"
#include "log.hpp"
#include <mutex>
#include <sstream>
#include <spdlog/spdlog.h>

namespace prw {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("http");
  }();
  return logger;
}

/**
 * Create a human readable error message for a CURL request.
 *
 * @param verb HTTP verb attempted.
 * @param url Request URL.
 * @param code CURL error code.
 * @param errbuf Optional buffer with extended error text.
 * @return Combined error description.
 */
std::string format_curl_error(const char *verb, const std::string &url,
                              CURLcode code, const char *errbuf) {
  std::ostringstream oss;
  oss << "curl " << verb;
  if (!url.empty()) {
    oss << ' ' << url;
  }
  oss << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

/**
 * libcurl write callback capturing response bodies into a string.
 */
size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t total = size * nmemb;
  std::string *s = static_cast<std::string *>(userp);
  s->append(static_cast<char *>(contents), total);
  return total;
}

/**
 * libcurl header callback collecting response headers.
 */
size_t header_callback(char *buffer, size_t size, size_t nitems,
                       void *userdata) {
  size_t total = size * nitems;
  std::string line(buffer, total);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();
  if (!line.empty()) {
    auto *hdrs = static_cast<std::vector<std::string> *>(userdata);
    hdrs->push_back(line);
  }
  return total;
}

} // namespace

/**
 * Initialize the CURL handle, ensuring global setup occurs once.
 */
CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransportError("Failed to init curl");
  }
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(long timeout_ms) : timeout_ms_(timeout_ms) {}

HttpResponse CurlHttpClient::get(const std::string &url,
                                 const std::vector<std::string> &headers) {
  return perform("GET", url, nullptr, headers);
}

HttpResponse CurlHttpClient::post(const std::string &url,
                                  const std::string &data,
                                  const std::vector<std::string> &headers) {
  return perform("POST", url, &data, headers);
}

/**
 * Execute a request on the shared easy handle.
 *
 * @param verb Verb used for diagnostics.
 * @param url Request URL.
 * @param data Request body for POST, `nullptr` for GET.
 * @param headers Additional request headers.
 * @return Response including non-2xx statuses.
 * @throws TransportError When curl reports a failure.
 */
HttpResponse CurlHttpClient::perform(const char *verb, const std::string &url,
                                     const std::string *data,
                                     const std::vector<std::string> &headers) {
  CURL *curl = curl_.get();
  curl_easy_reset(curl);
  HttpResponse response;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  CurlSlist header_list;
  for (const auto &h : headers) {
    header_list.append(h);
  }
  header_list.append("User-Agent: prwatch");
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
  if (data != nullptr) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(data->size()));
  }
  http_log()->debug("{} {}", verb, url);
  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    std::string msg = format_curl_error(verb, url, res, errbuf);
    http_log()->debug("{}", msg);
    throw TransportError(msg);
  }
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
  http_log()->debug("{} {} -> {}", verb, url, response.status_code);
  return response;
}

std::string escape_path_segment(const std::string &segment) {
  if (segment.empty()) {
    return segment;
  }
  static CurlHandle curl;
  char *escaped = curl_easy_escape(curl.get(), segment.c_str(),
                                   static_cast<int>(segment.size()));
  if (escaped == nullptr) {
    http_log()->warn("Failed to percent-encode path segment {}; using raw "
                     "value",
                     segment);
    return segment;
  }
  std::string encoded(escaped);
  curl_free(escaped);
  return encoded;
}

} // namespace prw
