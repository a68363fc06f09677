#pragma once

#include "parley/common/result.hpp"
#include "parley/gateway/transport.hpp"

#include <openssl/ssl.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace parley::gateway {

/// Server side of an upgraded RFC 6455 socket. Client frames must be masked and
/// unfragmented; anything else fails the read.
class WebSocketTransport final : public IFrameTransport {
public:
  WebSocketTransport(int fd, SSL *ssl, std::size_t max_payload_bytes);
  ~WebSocketTransport() override;

  WebSocketTransport(const WebSocketTransport &) = delete;
  WebSocketTransport &operator=(const WebSocketTransport &) = delete;

  [[nodiscard]] common::Result<Frame> read_frame() override;
  [[nodiscard]] common::Status write_frame(const Frame &frame) override;
  void close() override;

private:
  int fd_;
  SSL *ssl_;
  std::size_t max_payload_bytes_;
  std::mutex write_mutex_;
  std::atomic<bool> closed_{false};
};

struct UpgradeRequest {
  std::string path;
  std::string device_id;
  std::string remote_address;
};

struct WebSocketOptions {
  std::string host = "0.0.0.0";
  std::uint16_t port = 0;
  std::string path = "/ws";
  std::size_t max_connections = 256;
  bool tls_enabled = false;
  std::string tls_cert_file;
  std::string tls_key_file;
  std::size_t max_frame_bytes = 512 * 1024;
  std::chrono::seconds read_timeout{60};
  std::chrono::seconds write_timeout{10};
  std::vector<std::string> device_tokens;
};

/// Runs on the accepting client thread and owns the connection until it returns.
using ConnectionHandler =
    std::function<void(std::shared_ptr<IFrameTransport>, const UpgradeRequest &)>;
/// Connection count reported by `GET /health`.
using ConnectionCounter = std::function<std::size_t()>;

class WebSocketServer {
public:
  WebSocketServer();
  ~WebSocketServer();

  WebSocketServer(const WebSocketServer &) = delete;
  WebSocketServer &operator=(const WebSocketServer &) = delete;

  [[nodiscard]] common::Status start(const WebSocketOptions &options, ConnectionHandler handler,
                                     ConnectionCounter counter = {});
  /// Closes the listener and every socket, then waits for client threads to finish.
  void stop();

  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] std::size_t upgraded_connections() const;

private:
  [[nodiscard]] common::Status init_tls();
  void accept_loop();
  void client_loop(int fd, std::string remote_address);
  void track(int fd);
  void untrack(int fd);
  [[nodiscard]] bool token_accepted(const std::string &authorization,
                                    const std::string &query_token) const;

  WebSocketOptions options_;
  ConnectionHandler handler_;
  ConnectionCounter counter_;
  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::uint16_t bound_port_ = 0;
  SSL_CTX *tls_ctx_ = nullptr;
  std::atomic<std::size_t> upgraded_{0};

  mutable std::mutex sockets_mutex_;
  std::condition_variable sockets_cv_;
  std::unordered_set<int> sockets_;
  std::size_t client_threads_ = 0;
};

/// Value of `Sec-WebSocket-Accept` for a client key.
[[nodiscard]] std::string websocket_accept_key(const std::string &client_key);
/// Decodes `%XX` escapes and `+` in a query component.
[[nodiscard]] std::string url_decode(const std::string &value);
[[nodiscard]] std::unordered_map<std::string, std::string> parse_query(const std::string &query);

} // namespace parley::gateway
