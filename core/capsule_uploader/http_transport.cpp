// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "http_transport.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <regex>

#define CAPSULE_LOG_COMPONENT "http"
#include <capsule_log_macros.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace capsule {
namespace uploader {

using capsule::logging::kv;

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

template <typename Message>
void apply_headers(Message& req, const HttpHeaders& headers) {
  for (const auto& header : headers) {
    req.set(header.first, header.second);
  }
}

void fill_response(HttpResponse& result, const http::response<http::string_body>& res) {
  result.status_code = static_cast<int>(res.result_int());
  result.body = res.body();
  for (const auto& field : res) {
    result.headers[to_lower(std::string(field.name_string()))] = std::string(field.value());
  }
  result.success = result.status_code >= 200 && result.status_code < 300;
  if (!result.success) {
    result.error_message = "server returned status " + std::to_string(result.status_code);
  }
}

/**
 * Connect, let write_request send the request over the (plain or TLS) stream,
 * then read the full response. write_request receives (stream, host, target).
 */
template <typename Writer>
HttpResponse perform(
  const std::string& url, std::chrono::seconds timeout, Writer&& write_request
) {
  HttpResponse result;

  std::string host, port, target;
  bool use_ssl = false;
  if (!BeastHttpTransport::parse_url(url, host, port, target, use_ssl)) {
    result.error_message = "invalid URL: " + url;
    return result;
  }

  try {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    auto const endpoints = resolver.resolve(host, port);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(16 * 1024 * 1024);

    if (use_ssl) {
      ssl::context ctx(ssl::context::tls_client);
      ctx.set_default_verify_paths();
      ctx.set_verify_mode(ssl::verify_peer);

      beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
      if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        throw beast::system_error{ec};
      }
      stream.set_verify_callback(ssl::host_name_verification(host));

      beast::get_lowest_layer(stream).expires_after(timeout);
      beast::get_lowest_layer(stream).connect(endpoints);
      stream.handshake(ssl::stream_base::client);

      write_request(stream, host, target);

      beast::get_lowest_layer(stream).expires_after(timeout);
      http::read(stream, buffer, parser);

      beast::error_code ec;
      stream.shutdown(ec);
      if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        CAPSULE_LOG_DEBUG("TLS shutdown" << kv("host", host) << kv("error", ec.message()));
      }
    } else {
      beast::tcp_stream stream(ioc);
      stream.expires_after(timeout);
      stream.connect(endpoints);

      write_request(stream, host, target);

      stream.expires_after(timeout);
      http::read(stream, buffer, parser);

      beast::error_code ec;
      stream.socket().shutdown(tcp::socket::shutdown_both, ec);
      if (ec && ec != beast::errc::not_connected) {
        CAPSULE_LOG_DEBUG("Socket shutdown" << kv("host", host) << kv("error", ec.message()));
      }
    }

    fill_response(result, parser.get());
  } catch (const boost::system::system_error& e) {
    result.error_message = e.what();
    result.is_network_error = BeastHttpTransport::is_network_failure(e.code());
  } catch (const std::exception& e) {
    result.error_message = e.what();
  }

  return result;
}

}  // namespace

bool BeastHttpTransport::is_network_failure(const boost::system::error_code& ec) {
  const beast::error_code http_ec = http::error::end_of_stream;
  if (ec.category() == http_ec.category()) {
    // the peer closing the connection mid-message is a socket failure
    return ec == http::error::end_of_stream || ec == http::error::partial_message;
  }
  if (ec.category() == net::error::get_ssl_category()) {
    return false;
  }
  return true;
}

std::string HttpResponse::header(const std::string& name) const {
  auto it = headers.find(to_lower(name));
  return it == headers.end() ? std::string() : it->second;
}

BeastHttpTransport::BeastHttpTransport(const HttpTransportConfig& config)
    : config_(config) {}

bool BeastHttpTransport::parse_url(
  const std::string& url, std::string& host, std::string& port, std::string& target, bool& use_ssl
) {
  static const std::regex url_regex(R"(^(https?)://([^/:]+)(?::(\d+))?(.*)$)", std::regex::icase);
  std::smatch match;
  if (!std::regex_match(url, match, url_regex)) {
    return false;
  }

  use_ssl = to_lower(match[1].str()) == "https";
  host = match[2].str();
  port = match[3].matched ? match[3].str() : (use_ssl ? "443" : "80");
  target = match[4].str();
  if (target.empty()) {
    target = "/";
  }
  return true;
}

HttpResponse BeastHttpTransport::post_json(
  const std::string& url, const std::string& body, const HttpHeaders& headers
) {
  return perform(
    url, config_.request_timeout,
    [&](auto& stream, const std::string& host, const std::string& target) {
      http::request<http::string_body> req{http::verb::post, target, 11};
      req.set(http::field::host, host);
      req.set(http::field::user_agent, config_.user_agent);
      req.set(http::field::content_type, "application/json");
      apply_headers(req, headers);
      req.body() = body;
      req.prepare_payload();
      http::write(stream, req);
    }
  );
}

HttpResponse BeastHttpTransport::delete_request(
  const std::string& url, const HttpHeaders& headers
) {
  return perform(
    url, config_.request_timeout,
    [&](auto& stream, const std::string& host, const std::string& target) {
      http::request<http::empty_body> req{http::verb::delete_, target, 11};
      req.set(http::field::host, host);
      req.set(http::field::user_agent, config_.user_agent);
      apply_headers(req, headers);
      req.prepare_payload();
      http::write(stream, req);
    }
  );
}

HttpResponse BeastHttpTransport::put(
  const std::string& url, const char* data, size_t size, const std::string& content_type,
  const ByteProgressCallback& on_progress
) {
  const auto slice_timeout = config_.put_timeout;
  return perform(
    url, slice_timeout,
    [&](auto& stream, const std::string& host, const std::string& target) {
      http::request<http::buffer_body> req{http::verb::put, target, 11};
      req.set(http::field::host, host);
      req.set(http::field::user_agent, config_.user_agent);
      req.set(http::field::content_type, content_type);
      req.content_length(size);
      req.body().data = nullptr;
      req.body().more = size > 0;

      http::request_serializer<http::buffer_body> sr{req};
      http::write_header(stream, sr);

      uint64_t sent = 0;
      while (sent < size) {
        const size_t n = std::min(kPutSliceBytes, static_cast<size_t>(size - sent));
        req.body().data = const_cast<char*>(data + sent);
        req.body().size = n;
        req.body().more = sent + n < size;

        beast::get_lowest_layer(stream).expires_after(slice_timeout);
        beast::error_code ec;
        http::write(stream, sr, ec);
        if (ec == http::error::need_buffer) {
          ec = {};
        }
        if (ec) {
          throw beast::system_error{ec};
        }

        sent += n;
        if (on_progress) {
          on_progress(sent);
        }
      }

      if (!sr.is_done()) {
        req.body().data = nullptr;
        req.body().size = 0;
        req.body().more = false;
        http::write(stream, sr);
      }
    }
  );
}

}  // namespace uploader
}  // namespace capsule
