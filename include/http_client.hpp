/**
 * @file http_client.hpp
 * @brief Minimal HTTP transport used by the GitHub client and webhook sink.
 */

#ifndef PRWATCH_HTTP_CLIENT_HPP
#define PRWATCH_HTTP_CLIENT_HPP

#include <curl/curl.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace prw {

/**
 * Raised when a request could not be completed at the transport level
 * (DNS failure, refused connection, timeout, TLS error).
 */
class TransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers
  long status_code = 0;             ///< HTTP status code

  /// True for 2xx status codes.
  bool ok() const { return status_code >= 200 && status_code < 300; }
};

/**
 * Interface for performing HTTP requests.
 *
 * Implementations return non-2xx responses to the caller instead of throwing
 * so that each caller can classify status codes itself.
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP GET request.
   *
   * @param url Absolute request URL.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Response body, headers and status code.
   * @throws TransportError When no HTTP response was received.
   */
  virtual HttpResponse get(const std::string &url,
                           const std::vector<std::string> &headers) = 0;

  /**
   * Perform a HTTP POST request.
   *
   * @param url Absolute request URL.
   * @param data Request body payload encoded as UTF-8.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Response body, headers and status code.
   * @throws TransportError When no HTTP response was received.
   */
  virtual HttpResponse post(const std::string &url, const std::string &data,
                            const std::vector<std::string> &headers) = 0;
};

using HttpClientPtr = std::shared_ptr<HttpClient>;

/**
 * RAII wrapper for a CURL easy handle ensuring global CURL initialization.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;
  /**
   * Access the underlying CURL easy handle.
   *
   * @return Borrowed pointer to the CURL easy handle managed by the wrapper.
   */
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * CURL-based HTTP client implementation.
 *
 * @note This class is not thread-safe; use one instance per thread or provide
 *       external synchronization.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * Construct a CURL based HTTP client.
   *
   * @param timeout_ms Connect and total timeout in milliseconds applied to
   *        every request.
   */
  explicit CurlHttpClient(long timeout_ms = 15000);

  /// @copydoc HttpClient::get()
  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override;

  /// @copydoc HttpClient::post()
  HttpResponse post(const std::string &url, const std::string &data,
                    const std::vector<std::string> &headers) override;

  /// Per-request timeout in milliseconds.
  long timeout_ms() const { return timeout_ms_; }

private:
  HttpResponse perform(const char *verb, const std::string &url,
                       const std::string *data,
                       const std::vector<std::string> &headers);

  CurlHandle curl_;
  long timeout_ms_;
};

/**
 * Percent-encode a single URL path segment.
 *
 * @param segment Raw segment such as a commit SHA or branch name.
 * @return Encoded segment; the input is returned unchanged when encoding
 *         fails.
 */
std::string escape_path_segment(const std::string &segment);

} // namespace prw

#endif // PRWATCH_HTTP_CLIENT_HPP
