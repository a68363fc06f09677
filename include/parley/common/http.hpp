#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace parley::common {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool transport_failed() const { return timeout || network_error; }
};

using HttpHeaders = std::unordered_map<std::string, std::string>;
using StreamChunkCallback = std::function<void(std::string_view)>;

/// Outbound HTTP used by the provider adapters. Tests substitute a scripted client.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
  /// Delivers body bytes to `on_chunk` as they arrive. The body is not accumulated.
  [[nodiscard]] virtual HttpResponse post_json_stream(const std::string &url,
                                                      const HttpHeaders &headers,
                                                      const std::string &body,
                                                      std::uint64_t timeout_ms,
                                                      const StreamChunkCallback &on_chunk) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();

  [[nodiscard]] HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body,
                                       std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post_json_stream(const std::string &url, const HttpHeaders &headers,
                                              const std::string &body, std::uint64_t timeout_ms,
                                              const StreamChunkCallback &on_chunk) override;
};

} // namespace parley::common
