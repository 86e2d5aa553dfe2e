// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <algorithm>
#include <cctype>
#include <functional>
#include <regex>

#include "upload_errors.hpp"

#define TESSERA_LOG_COMPONENT "http_client"
#include <tessera_log_macros.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace tessera {
namespace uploader {

using logging::kv;

namespace {

constexpr std::chrono::milliseconds kPollSlice{20};
constexpr std::uint64_t kMaxResponseBody = 16ULL * 1024 * 1024;

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string toString(beast::string_view sv) {
  return std::string(sv.data(), sv.size());
}

/**
 * Drives a request's io_context one asynchronous step at a time.
 *
 * Between poll slices the cancellation token and the overall deadline are
 * checked; either one closes the connection and raises.
 */
class Exchange {
public:
  Exchange(
    net::io_context& ioc, std::chrono::steady_clock::time_point deadline,
    const CancellationToken& token, std::function<void()> abort_io
  )
      : ioc_(ioc)
      , deadline_(deadline)
      , token_(token)
      , abort_io_(std::move(abort_io)) {}

  /**
   * Start an operation and block until its handler ran
   *
   * @param step Name of the step for error messages
   * @param initiate Callable receiving the completion handler
   * @return Error code passed to the handler
   */
  template <class Initiate>
  beast::error_code await(const char* step, Initiate&& initiate) {
    bool done = false;
    beast::error_code result;
    initiate([&done, &result](beast::error_code ec, auto&&...) {
      result = ec;
      done = true;
    });
    run(done, step);
    return result;
  }

  void run(const bool& done, const char* step) {
    while (!done) {
      if (token_.isCancelled()) {
        abort_io_();
        throw CancellationError("Request cancelled");
      }
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline_) {
        abort_io_();
        throw TimeoutError(std::string("Request timed out during ") + step);
      }
      if (ioc_.stopped()) {
        ioc_.restart();
      }
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now);
      ioc_.run_for(std::min(remaining + std::chrono::milliseconds(1), kPollSlice));
    }
  }

private:
  net::io_context& ioc_;
  std::chrono::steady_clock::time_point deadline_;
  CancellationToken token_;
  std::function<void()> abort_io_;
};

void handshake(beast::tcp_stream&, Exchange&, const std::string&) {}

void handshake(
  beast::ssl_stream<beast::tcp_stream>& stream, Exchange& exchange, const std::string& host
) {
  auto ec = exchange.await("TLS handshake", [&](auto handler) {
    stream.async_handshake(ssl::stream_base::client, std::move(handler));
  });
  if (ec) {
    throw NetworkError("TLS handshake with " + host + " failed: " + ec.message());
  }
}

void closeGracefully(beast::tcp_stream& stream) {
  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != beast::errc::not_connected) {
    TESSERA_LOG_DEBUG("Socket shutdown warning" << kv("error", ec.message()));
  }
}

void closeGracefully(beast::ssl_stream<beast::tcp_stream>& stream) {
  // The response is already complete, so close_notify is not awaited
  beast::error_code ec;
  beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != net::ssl::error::stream_truncated && ec != beast::errc::not_connected) {
    TESSERA_LOG_DEBUG("SSL shutdown warning" << kv("error", ec.message()));
  }
}

template <class Stream>
HttpResponse performExchange(
  Stream& stream, const tcp::resolver::results_type& endpoints, const std::string& host,
  http::request<http::string_body>& req, Exchange& exchange
) {
  auto ec = exchange.await("connect", [&](auto handler) {
    beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
  });
  if (ec) {
    throw NetworkError("Connect to " + host + " failed: " + ec.message());
  }

  handshake(stream, exchange, host);

  ec = exchange.await("write", [&](auto handler) {
    http::async_write(stream, req, std::move(handler));
  });
  if (ec) {
    throw NetworkError("Sending request to " + host + " failed: " + ec.message());
  }

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(kMaxResponseBody);
  ec = exchange.await("read", [&](auto handler) {
    http::async_read(stream, buffer, parser, std::move(handler));
  });
  if (ec) {
    throw NetworkError("Reading response from " + host + " failed: " + ec.message());
  }

  auto res = parser.release();
  HttpResponse response;
  response.status_code = static_cast<int>(res.result_int());
  for (const auto& field : res) {
    response.headers[toLower(toString(field.name_string()))] = toString(field.value());
  }
  response.body = std::move(res.body());

  closeGracefully(stream);
  return response;
}

}  // namespace

std::string HttpResponse::header(const std::string& name) const {
  auto it = headers.find(toLower(name));
  return it == headers.end() ? std::string() : it->second;
}

class BeastHttpClient::Impl {
public:
  explicit Impl(const Config& cfg)
      : config(cfg)
      , ssl_ctx(ssl::context::tlsv12_client) {
    // Use system's default CA certificates for verification
    ssl_ctx.set_default_verify_paths();
    ssl_ctx.set_verify_mode(config.verify_peer ? ssl::verify_peer : ssl::verify_none);
  }

  Config config;
  ssl::context ssl_ctx;
};

BeastHttpClient::BeastHttpClient()
    : BeastHttpClient(Config{}) {}

BeastHttpClient::BeastHttpClient(const Config& config)
    : impl_(std::make_unique<Impl>(config)) {}

BeastHttpClient::~BeastHttpClient() = default;

bool BeastHttpClient::parse_url(
  const std::string& url, std::string& host, std::string& port, std::string& target,
  bool& use_ssl
) {
  // Note: static regex is compiled once for better performance
  static const std::regex url_regex(R"(^(https?)://([^/:?#]+)(?::(\d+))?(.*)$)", std::regex::icase);
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return false;
  }

  std::string scheme = toLower(match[1].str());
  host = match[2].str();
  std::string port_str = match[3].str();
  target = match[4].str();

  if (target.empty()) {
    target = "/";
  } else if (target[0] == '?') {
    target = "/" + target;
  } else if (target[0] != '/') {
    return false;
  }

  use_ssl = (scheme == "https");
  port = port_str.empty() ? (use_ssl ? "443" : "80") : port_str;
  return true;
}

HttpResponse BeastHttpClient::send(
  const HttpRequest& request, std::chrono::milliseconds timeout, const CancellationToken& token
) {
  std::string host, port, target;
  bool use_ssl = false;
  if (!parse_url(request.url, host, port, target, use_ssl)) {
    throw ValidationError("Invalid URL format");
  }

  http::verb verb = http::string_to_verb(request.method);
  if (verb == http::verb::unknown) {
    throw ValidationError("Unsupported HTTP method: " + request.method);
  }

  if (token.isCancelled()) {
    throw CancellationError("Request cancelled");
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;

  http::request<http::string_body> req{verb, target, 11};
  bool default_port = (use_ssl && port == "443") || (!use_ssl && port == "80");
  req.set(http::field::host, default_port ? host : host + ":" + port);
  req.set(http::field::user_agent, impl_->config.user_agent);
  for (const auto& header : request.headers) {
    req.set(header.first, header.second);
  }
  req.body() = request.body;
  req.prepare_payload();

  net::io_context ioc;
  tcp::resolver resolver(ioc);

  TESSERA_LOG_DEBUG(
    "HTTP request" << kv("method", request.method) << kv("host", host)
                   << kv("bytes", request.body.size())
  );

  // Resolve first; the stream is created afterwards so the abort hook has a single target
  tcp::resolver::results_type endpoints;
  {
    Exchange resolve_step(ioc, deadline, token, [&resolver]() { resolver.cancel(); });
    bool done = false;
    beast::error_code resolve_ec;
    resolver.async_resolve(
      host, port,
      [&](beast::error_code ec, tcp::resolver::results_type results) {
        resolve_ec = ec;
        endpoints = std::move(results);
        done = true;
      }
    );
    resolve_step.run(done, "resolve");
    if (resolve_ec) {
      throw NetworkError("Resolving " + host + " failed: " + resolve_ec.message());
    }
  }

  HttpResponse response;
  if (use_ssl) {
    beast::ssl_stream<beast::tcp_stream> stream(ioc, impl_->ssl_ctx);

    // Set SNI hostname (required for most servers)
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
      beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
      throw NetworkError("SNI hostname failed: " + ec.message());
    }
    if (impl_->config.verify_peer) {
      stream.set_verify_callback(ssl::host_name_verification(host));
    }

    Exchange exchange(ioc, deadline, token, [&stream]() {
      beast::get_lowest_layer(stream).close();
    });
    response = performExchange(stream, endpoints, host, req, exchange);
  } else {
    beast::tcp_stream stream(ioc);
    Exchange exchange(ioc, deadline, token, [&stream]() { stream.close(); });
    response = performExchange(stream, endpoints, host, req, exchange);
  }

  TESSERA_LOG_DEBUG(
    "HTTP response" << kv("host", host) << kv("status", response.status_code)
                    << kv("bytes", response.body.size())
  );
  return response;
}

}  // namespace uploader
}  // namespace tessera
