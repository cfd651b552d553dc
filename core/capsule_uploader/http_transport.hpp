// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_HTTP_TRANSPORT_HPP
#define CAPSULE_HTTP_TRANSPORT_HPP

#include <boost/system/error_code.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace capsule {
namespace uploader {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * Outcome of one HTTP exchange.
 *
 * success is true only for a 2xx status. When no status was received at all,
 * status_code is 0 and is_network_error tells whether the failure happened on
 * the wire (resolve, connect, timeout, socket).
 */
struct HttpResponse {
  bool success = false;
  int status_code = 0;
  std::string body;
  std::map<std::string, std::string> headers;  // names lowercased
  std::string error_message;
  bool is_network_error = false;

  /**
   * Header value by case-insensitive name, or "" when absent
   */
  std::string header(const std::string& name) const;
};

/**
 * Called with the cumulative number of body bytes written so far
 */
using ByteProgressCallback = std::function<void(uint64_t bytes_sent)>;

/**
 * Blocking HTTP client used by the remote upload API and the chunk PUTs
 */
class IHttpTransport {
public:
  virtual ~IHttpTransport() = default;

  virtual HttpResponse post_json(
    const std::string& url, const std::string& body, const HttpHeaders& headers
  ) = 0;

  virtual HttpResponse delete_request(const std::string& url, const HttpHeaders& headers) = 0;

  /**
   * PUT a body in slices, reporting progress after each slice
   */
  virtual HttpResponse put(
    const std::string& url, const char* data, size_t size, const std::string& content_type,
    const ByteProgressCallback& on_progress
  ) = 0;
};

struct HttpTransportConfig {
  std::chrono::seconds request_timeout{30};
  std::chrono::seconds put_timeout{300};  // per slice, so slow links are not cut off mid-chunk
  std::string user_agent = "capsule-uploader/1.0";
};

/**
 * IHttpTransport over Boost.Beast. https URLs use OpenSSL with SNI and peer
 * verification against the system trust store.
 */
class BeastHttpTransport : public IHttpTransport {
public:
  static constexpr size_t kPutSliceBytes = 64 * 1024;

  explicit BeastHttpTransport(const HttpTransportConfig& config = HttpTransportConfig());
  ~BeastHttpTransport() override = default;

  BeastHttpTransport(const BeastHttpTransport&) = delete;
  BeastHttpTransport& operator=(const BeastHttpTransport&) = delete;

  HttpResponse post_json(
    const std::string& url, const std::string& body, const HttpHeaders& headers
  ) override;

  HttpResponse delete_request(const std::string& url, const HttpHeaders& headers) override;

  HttpResponse put(
    const std::string& url, const char* data, size_t size, const std::string& content_type,
    const ByteProgressCallback& on_progress
  ) override;

  /**
   * Split http(s)://host(:port)/target. Returns false for other schemes.
   */
  static bool parse_url(
    const std::string& url, std::string& host, std::string& port, std::string& target,
    bool& use_ssl
  );

  /**
   * True for resolve, connect, timeout and socket failures. Malformed or
   * oversized HTTP responses and TLS verification failures are not network
   * errors.
   */
  static bool is_network_failure(const boost::system::error_code& ec);

private:
  HttpTransportConfig config_;
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_HTTP_TRANSPORT_HPP
