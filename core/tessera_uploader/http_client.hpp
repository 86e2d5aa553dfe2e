// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_HTTP_CLIENT_HPP
#define TESSERA_HTTP_CLIENT_HPP

#include <chrono>
#include <map>
#include <memory>
#include <string>

#include "cancellation_token.hpp"

namespace tessera {
namespace uploader {

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
};

struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;  // Keys lower-cased
  std::string body;

  /**
   * Case-insensitive header lookup, empty when absent
   */
  std::string header(const std::string& name) const;

  bool ok() const { return status_code >= 200 && status_code < 300; }
};

/**
 * Minimal HTTP transport used by the transfer client
 *
 * send() returns any response the server produced, including non-2xx ones.
 * Transport problems are raised:
 * - NetworkError: resolve, connect, TLS or I/O failure
 * - TimeoutError: the whole exchange exceeded timeout
 * - CancellationError: token fired before the exchange finished
 * - ValidationError: malformed URL or method
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  virtual HttpResponse send(
    const HttpRequest& request, std::chrono::milliseconds timeout,
    const CancellationToken& token
  ) = 0;
};

/**
 * HttpClient on Boost.Beast, one connection per request
 *
 * Each request runs on its own io_context, polled in short slices so that a
 * cancellation token interrupts a stalled connect, write or read promptly.
 * HTTPS uses the system CA store with peer verification and SNI.
 */
class BeastHttpClient : public HttpClient {
public:
  struct Config {
    std::string user_agent = "tessera-uploader/1.0";
    bool verify_peer = true;
  };

  BeastHttpClient();
  explicit BeastHttpClient(const Config& config);
  ~BeastHttpClient() override;

  BeastHttpClient(const BeastHttpClient&) = delete;
  BeastHttpClient& operator=(const BeastHttpClient&) = delete;

  HttpResponse send(
    const HttpRequest& request, std::chrono::milliseconds timeout,
    const CancellationToken& token
  ) override;

  /**
   * Parse URL into components
   * Format: http(s)://host(:port)/path?query
   *
   * @return true if the URL was parsed successfully
   */
  static bool parse_url(
    const std::string& url, std::string& host, std::string& port, std::string& target,
    bool& use_ssl
  );

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace uploader
}  // namespace tessera

#endif  // TESSERA_HTTP_CLIENT_HPP
