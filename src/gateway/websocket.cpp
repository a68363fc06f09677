#include "parley/gateway/websocket.hpp"

#include "parley/common/fs.hpp"
#include "parley/common/ids.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <limits>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace parley::gateway {

namespace {

constexpr std::size_t kMaxHandshakeBytes = 8 * 1024;
constexpr int kListenBacklog = 64;
constexpr std::string_view kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

constexpr std::uint8_t kOpContinuation = 0x0u;
constexpr std::uint8_t kOpText = 0x1u;
constexpr std::uint8_t kOpBinary = 0x2u;
constexpr std::uint8_t kOpClose = 0x8u;
constexpr std::uint8_t kOpPing = 0x9u;
constexpr std::uint8_t kOpPong = 0xAu;

enum class IoResult { Ok, Closed, TimedOut, Failed };

ssize_t write_bytes(const int fd, SSL *ssl, const std::uint8_t *data, const std::size_t size) {
  if (ssl != nullptr) {
    return static_cast<ssize_t>(SSL_write(ssl, data, static_cast<int>(size)));
  }
  return send(fd, data, size, MSG_NOSIGNAL);
}

ssize_t read_bytes(const int fd, SSL *ssl, std::uint8_t *data, const std::size_t size) {
  if (ssl != nullptr) {
    return static_cast<ssize_t>(SSL_read(ssl, data, static_cast<int>(size)));
  }
  return recv(fd, data, size, 0);
}

bool send_all(const int fd, SSL *ssl, const std::uint8_t *data, const std::size_t size) {
  std::size_t sent = 0;
  while (sent < size) {
    const ssize_t n = write_bytes(fd, ssl, data + sent, size - sent);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

IoResult recv_exact(const int fd, SSL *ssl, std::uint8_t *data, const std::size_t size) {
  std::size_t received = 0;
  while (received < size) {
    const ssize_t n = read_bytes(fd, ssl, data + received, size - received);
    if (n == 0) {
      return IoResult::Closed;
    }
    if (n < 0) {
      return (errno == EAGAIN || errno == EWOULDBLOCK) ? IoResult::TimedOut : IoResult::Failed;
    }
    received += static_cast<std::size_t>(n);
  }
  return IoResult::Ok;
}

common::Result<Frame> io_failure(const IoResult result) {
  switch (result) {
  case IoResult::Closed:
    return common::Result<Frame>::failure("peer closed the connection");
  case IoResult::TimedOut:
    return common::Result<Frame>::failure("read timed out");
  default:
    return common::Result<Frame>::failure("socket read failed");
  }
}

void close_socket(const int fd, SSL *ssl) {
  if (ssl != nullptr) {
    SSL_shutdown(ssl);
    SSL_free(ssl);
  }
  if (fd >= 0) {
    shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
}

void set_socket_timeout(const int fd, const int option, const std::chrono::seconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout.count());
  (void)setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv));
}

std::string lower_trimmed(const std::string &value) { return common::to_lower(common::trim(value)); }

std::unordered_map<std::string, std::string> parse_headers(const std::string &request) {
  std::unordered_map<std::string, std::string> headers;
  std::istringstream lines(request);
  std::string line;
  bool first = true;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      break;
    }
    if (first) {
      headers[":request-line"] = line;
      first = false;
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    headers[lower_trimmed(line.substr(0, colon))] = common::trim(line.substr(colon + 1));
  }
  return headers;
}

std::string openssl_error_string() {
  const auto code = ERR_get_error();
  if (code == 0) {
    return "unknown openssl error";
  }
  std::array<char, 256> buffer{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  return std::string(buffer.data());
}

bool send_http_response(const int fd, SSL *ssl, const int status, const std::string &status_text,
                        const std::vector<std::pair<std::string, std::string>> &headers,
                        const std::string &body = "") {
  std::ostringstream response;
  response << "HTTP/1.1 " << status << " " << status_text << "\r\n";
  for (const auto &[k, v] : headers) {
    response << k << ": " << v << "\r\n";
  }
  if (status != 101) {
    response << "Content-Length: " << body.size() << "\r\n";
    response << "Connection: close\r\n";
  }
  response << "\r\n";
  response << body;
  const std::string text = response.str();
  return send_all(fd, ssl, reinterpret_cast<const std::uint8_t *>(text.data()), text.size());
}

bool send_json_error(const int fd, SSL *ssl, const int status, const std::string &status_text,
                     const std::string &error) {
  return send_http_response(fd, ssl, status, status_text, {{"Content-Type", "application/json"}},
                            "{\"error\":\"" + error + "\"}");
}

std::vector<std::uint8_t> encode_frame(const std::uint8_t opcode, const std::string &payload) {
  std::vector<std::uint8_t> frame;
  frame.reserve(payload.size() + 16);
  frame.push_back(static_cast<std::uint8_t>(0x80u | (opcode & 0x0Fu)));

  const auto size = payload.size();
  if (size <= 125u) {
    frame.push_back(static_cast<std::uint8_t>(size));
  } else if (size <= 65535u) {
    frame.push_back(126u);
    frame.push_back(static_cast<std::uint8_t>((size >> 8u) & 0xFFu));
    frame.push_back(static_cast<std::uint8_t>(size & 0xFFu));
  } else {
    frame.push_back(127u);
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<std::uint8_t>((size >> static_cast<std::size_t>(shift)) & 0xFFu));
    }
  }
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

std::uint8_t opcode_for(const FrameKind kind) {
  switch (kind) {
  case FrameKind::Text:
    return kOpText;
  case FrameKind::Binary:
    return kOpBinary;
  case FrameKind::Ping:
    return kOpPing;
  case FrameKind::Pong:
    return kOpPong;
  case FrameKind::Close:
    return kOpClose;
  }
  return kOpText;
}

} // namespace

std::string websocket_accept_key(const std::string &client_key) {
  const std::string source = client_key + std::string(kWebSocketGuid);
  std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
  SHA1(reinterpret_cast<const unsigned char *>(source.data()), source.size(), digest.data());

  const int output_len = 4 * static_cast<int>((digest.size() + 2) / 3);
  std::string output(static_cast<std::size_t>(output_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()), digest.data(),
                  static_cast<int>(digest.size()));
  return output;
}

std::string url_decode(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (ch == '+') {
      out.push_back(' ');
    } else if (ch == '%' && i + 2 < value.size() &&
               std::isxdigit(static_cast<unsigned char>(value[i + 1])) != 0 &&
               std::isxdigit(static_cast<unsigned char>(value[i + 2])) != 0) {
      out.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> parse_query(const std::string &query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t start = 0;
  while (start <= query.size()) {
    std::size_t end = query.find('&', start);
    if (end == std::string::npos) {
      end = query.size();
    }
    const std::string pair = query.substr(start, end - start);
    if (!pair.empty()) {
      const auto eq = pair.find('=');
      const std::string key = url_decode(pair.substr(0, eq));
      const std::string value = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
      if (!key.empty() && params.count(key) == 0) {
        params[key] = value;
      }
    }
    start = end + 1;
  }
  return params;
}

WebSocketTransport::WebSocketTransport(const int fd, SSL *ssl, const std::size_t max_payload_bytes)
    : fd_(fd), ssl_(ssl), max_payload_bytes_(max_payload_bytes) {}

WebSocketTransport::~WebSocketTransport() {
  close();
  if (ssl_ != nullptr) {
    SSL_free(ssl_);
    ssl_ = nullptr;
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

common::Result<Frame> WebSocketTransport::read_frame() {
  if (closed_) {
    return common::Result<Frame>::failure("transport closed");
  }
  std::array<std::uint8_t, 2> header{};
  if (const auto io = recv_exact(fd_, ssl_, header.data(), header.size()); io != IoResult::Ok) {
    return io_failure(io);
  }

  const bool fin = (header[0] & 0x80u) != 0;
  const auto opcode = static_cast<std::uint8_t>(header[0] & 0x0Fu);
  const bool masked = (header[1] & 0x80u) != 0;
  std::uint64_t payload_len = static_cast<std::uint64_t>(header[1] & 0x7Fu);

  if (!fin || opcode == kOpContinuation) {
    return common::Result<Frame>::failure("fragmented frames are not supported");
  }
  if (!masked) {
    return common::Result<Frame>::failure("client frames must be masked");
  }

  if (payload_len == 126u) {
    std::array<std::uint8_t, 2> ext{};
    if (const auto io = recv_exact(fd_, ssl_, ext.data(), ext.size()); io != IoResult::Ok) {
      return io_failure(io);
    }
    payload_len = (static_cast<std::uint64_t>(ext[0]) << 8u) | static_cast<std::uint64_t>(ext[1]);
  } else if (payload_len == 127u) {
    std::array<std::uint8_t, 8> ext{};
    if (const auto io = recv_exact(fd_, ssl_, ext.data(), ext.size()); io != IoResult::Ok) {
      return io_failure(io);
    }
    payload_len = 0;
    for (const auto byte : ext) {
      payload_len = (payload_len << 8u) | static_cast<std::uint64_t>(byte);
    }
  }

  if (payload_len > max_payload_bytes_ ||
      payload_len > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max())) {
    return common::Result<Frame>::failure("frame of " + std::to_string(payload_len) +
                                          " bytes exceeds the limit of " +
                                          std::to_string(max_payload_bytes_));
  }

  std::array<std::uint8_t, 4> mask{};
  if (const auto io = recv_exact(fd_, ssl_, mask.data(), mask.size()); io != IoResult::Ok) {
    return io_failure(io);
  }

  std::string payload(static_cast<std::size_t>(payload_len), '\0');
  if (!payload.empty()) {
    if (const auto io = recv_exact(fd_, ssl_, reinterpret_cast<std::uint8_t *>(payload.data()),
                                   payload.size());
        io != IoResult::Ok) {
      return io_failure(io);
    }
  }
  for (std::size_t i = 0; i < payload.size(); ++i) {
    payload[i] = static_cast<char>(static_cast<std::uint8_t>(payload[i]) ^ mask[i % mask.size()]);
  }

  Frame frame;
  frame.payload = std::move(payload);
  switch (opcode) {
  case kOpText:
    frame.kind = FrameKind::Text;
    break;
  case kOpBinary:
    frame.kind = FrameKind::Binary;
    break;
  case kOpClose:
    frame.kind = FrameKind::Close;
    break;
  case kOpPing:
    frame.kind = FrameKind::Ping;
    break;
  case kOpPong:
    frame.kind = FrameKind::Pong;
    break;
  default:
    return common::Result<Frame>::failure("unsupported opcode " + std::to_string(opcode));
  }
  return common::Result<Frame>::success(std::move(frame));
}

common::Status WebSocketTransport::write_frame(const Frame &frame) {
  if (closed_) {
    return common::Status::error("transport closed");
  }
  const auto bytes = encode_frame(opcode_for(frame.kind), frame.payload);
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (!send_all(fd_, ssl_, bytes.data(), bytes.size())) {
    return common::Status::error("socket write failed");
  }
  return common::Status::success();
}

void WebSocketTransport::close() {
  if (closed_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    const auto bytes = encode_frame(kOpClose, std::string("\x03\xe8", 2));
    (void)send_all(fd_, ssl_, bytes.data(), bytes.size());
  }
  if (fd_ >= 0) {
    shutdown(fd_, SHUT_RDWR);
  }
}

WebSocketServer::WebSocketServer() = default;

WebSocketServer::~WebSocketServer() { stop(); }

common::Status WebSocketServer::start(const WebSocketOptions &options, ConnectionHandler handler,
                                      ConnectionCounter counter) {
  if (running_) {
    return common::Status::error("websocket server already running");
  }
  if (!handler) {
    return common::Status::error("websocket server needs a connection handler");
  }
  if (common::trim(options.host).empty()) {
    return common::Status::error("websocket host is empty");
  }
  if (options.path.empty() || options.path.front() != '/') {
    return common::Status::error("websocket path must start with '/'");
  }

  options_ = options;
  handler_ = std::move(handler);
  counter_ = std::move(counter);

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create websocket listen socket");
  }
  int reuse = 1;
  (void)setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options_.port);
  std::string bind_host = common::trim(options_.host);
  if (lower_trimmed(bind_host) == "localhost") {
    bind_host = "127.0.0.1";
  }
  if (inet_pton(AF_INET, bind_host.c_str(), &addr.sin_addr) != 1) {
    ::close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("invalid websocket bind host: " + bind_host);
  }
  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string message = std::strerror(errno);
    ::close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("websocket bind failed: " + message);
  }
  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string message = std::strerror(errno);
    ::close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("websocket listen failed: " + message);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options_.port;
  }

  if (options_.tls_enabled) {
    const auto tls = init_tls();
    if (!tls.ok()) {
      ::close(listen_fd_);
      listen_fd_ = -1;
      bound_port_ = 0;
      return tls;
    }
  }

  running_ = true;
  accept_thread_ = std::thread([this]() { accept_loop(); });
  return common::Status::success();
}

common::Status WebSocketServer::init_tls() {
  if (options_.tls_cert_file.empty() || options_.tls_key_file.empty()) {
    return common::Status::error("websocket TLS requires cert and key file paths");
  }
  tls_ctx_ = SSL_CTX_new(TLS_server_method());
  if (tls_ctx_ == nullptr) {
    return common::Status::error("failed to initialize websocket TLS context: " +
                                 openssl_error_string());
  }
  SSL_CTX_set_min_proto_version(tls_ctx_, TLS1_2_VERSION);

  std::string failure;
  if (SSL_CTX_use_certificate_file(tls_ctx_, options_.tls_cert_file.c_str(), SSL_FILETYPE_PEM) <=
      0) {
    failure = "failed loading websocket TLS certificate: " + openssl_error_string();
  } else if (SSL_CTX_use_PrivateKey_file(tls_ctx_, options_.tls_key_file.c_str(),
                                         SSL_FILETYPE_PEM) <= 0) {
    failure = "failed loading websocket TLS private key: " + openssl_error_string();
  } else if (SSL_CTX_check_private_key(tls_ctx_) != 1) {
    failure = "websocket TLS private key does not match certificate: " + openssl_error_string();
  }
  if (!failure.empty()) {
    SSL_CTX_free(tls_ctx_);
    tls_ctx_ = nullptr;
    return common::Status::error(failure);
  }
  return common::Status::success();
}

void WebSocketServer::stop() {
  if (!running_ && listen_fd_ < 0 && tls_ctx_ == nullptr) {
    return;
  }
  running_ = false;

  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }

  {
    std::unique_lock<std::mutex> lock(sockets_mutex_);
    for (const int fd : sockets_) {
      shutdown(fd, SHUT_RDWR);
    }
    sockets_cv_.wait(lock, [this] { return client_threads_ == 0; });
  }

  if (tls_ctx_ != nullptr) {
    SSL_CTX_free(tls_ctx_);
    tls_ctx_ = nullptr;
  }
  bound_port_ = 0;
}

bool WebSocketServer::is_running() const { return running_.load(); }

std::uint16_t WebSocketServer::port() const { return bound_port_; }

std::size_t WebSocketServer::upgraded_connections() const { return upgraded_.load(); }

void WebSocketServer::track(const int fd) {
  std::lock_guard<std::mutex> lock(sockets_mutex_);
  sockets_.insert(fd);
}

void WebSocketServer::untrack(const int fd) {
  std::lock_guard<std::mutex> lock(sockets_mutex_);
  sockets_.erase(fd);
}

bool WebSocketServer::token_accepted(const std::string &authorization,
                                     const std::string &query_token) const {
  if (options_.device_tokens.empty()) {
    return true;
  }
  std::string presented = query_token;
  const std::string bearer = "bearer ";
  if (common::to_lower(authorization.substr(0, bearer.size())) == bearer) {
    presented = common::trim(authorization.substr(bearer.size()));
  }
  if (presented.empty()) {
    return false;
  }
  bool accepted = false;
  for (const auto &token : options_.device_tokens) {
    accepted = common::constant_time_equals(presented, token) || accepted;
  }
  return accepted;
}

void WebSocketServer::accept_loop() {
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client_fd = accept(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len);
    if (client_fd < 0) {
      if (!running_) {
        break;
      }
      continue;
    }

    std::array<char, INET_ADDRSTRLEN> address{};
    inet_ntop(AF_INET, &client_addr.sin_addr, address.data(), address.size());
    std::string remote = std::string(address.data()) + ":" + std::to_string(ntohs(client_addr.sin_port));

    {
      std::lock_guard<std::mutex> lock(sockets_mutex_);
      sockets_.insert(client_fd);
      ++client_threads_;
    }
    std::thread([this, client_fd, remote = std::move(remote)]() mutable {
      client_loop(client_fd, std::move(remote));
      std::lock_guard<std::mutex> lock(sockets_mutex_);
      --client_threads_;
      sockets_cv_.notify_all();
    }).detach();
  }
}

void WebSocketServer::client_loop(const int fd, std::string remote_address) {
  set_socket_timeout(fd, SO_RCVTIMEO, options_.write_timeout);
  set_socket_timeout(fd, SO_SNDTIMEO, options_.write_timeout);

  SSL *ssl = nullptr;
  if (tls_ctx_ != nullptr) {
    ssl = SSL_new(tls_ctx_);
    if (ssl == nullptr) {
      untrack(fd);
      close_socket(fd, nullptr);
      return;
    }
    SSL_set_fd(ssl, fd);
    if (SSL_accept(ssl) <= 0) {
      std::cerr << "[gateway] TLS handshake failed from " << remote_address << ": "
                << openssl_error_string() << "\n";
      untrack(fd);
      close_socket(fd, ssl);
      return;
    }
  }

  const auto reject = [&](const int status, const std::string &text, const std::string &error) {
    (void)send_json_error(fd, ssl, status, text, error);
    untrack(fd);
    close_socket(fd, ssl);
  };

  std::string request;
  request.reserve(1024);
  std::array<char, 1024> buf{};
  while (request.size() < kMaxHandshakeBytes && request.find("\r\n\r\n") == std::string::npos) {
    const ssize_t n =
        read_bytes(fd, ssl, reinterpret_cast<std::uint8_t *>(buf.data()), buf.size());
    if (n <= 0) {
      untrack(fd);
      close_socket(fd, ssl);
      return;
    }
    request.append(buf.data(), static_cast<std::size_t>(n));
  }
  if (request.find("\r\n\r\n") == std::string::npos) {
    reject(400, "Bad Request", "invalid_handshake");
    return;
  }

  const auto headers = parse_headers(request);
  const auto request_line_it = headers.find(":request-line");
  if (request_line_it == headers.end() || request_line_it->second.rfind("GET ", 0) != 0) {
    reject(405, "Method Not Allowed", "method_not_allowed");
    return;
  }
  const std::string &request_line = request_line_it->second;
  const auto target_end = request_line.find(' ', 4);
  const std::string target = request_line.substr(4, target_end == std::string::npos
                                                        ? std::string::npos
                                                        : target_end - 4);
  const auto query_pos = target.find('?');
  const std::string path = target.substr(0, query_pos);
  const auto query =
      parse_query(query_pos == std::string::npos ? "" : target.substr(query_pos + 1));

  if (path == "/health") {
    const std::size_t connections = counter_ ? counter_() : upgraded_.load();
    (void)send_http_response(fd, ssl, 200, "OK", {{"Content-Type", "application/json"}},
                             "{\"status\":\"ok\",\"connections\":" +
                                 std::to_string(connections) + "}");
    untrack(fd);
    close_socket(fd, ssl);
    return;
  }
  if (path != options_.path) {
    reject(404, "Not Found", "not_found");
    return;
  }

  const auto header = [&headers](const std::string &name) -> std::string {
    const auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
  };
  const std::string key = common::trim(header("sec-websocket-key"));
  if (lower_trimmed(header("upgrade")) != "websocket" ||
      common::to_lower(header("connection")).find("upgrade") == std::string::npos ||
      common::trim(header("sec-websocket-version")) != "13" || key.empty()) {
    reject(400, "Bad Request", "missing_websocket_headers");
    return;
  }

  const auto device_it = query.find("device_id");
  const std::string device_id =
      device_it == query.end() ? std::string() : common::trim(device_it->second);
  if (device_id.empty()) {
    reject(400, "Bad Request", "missing_device_id");
    return;
  }

  const auto token_it = query.find("token");
  if (!token_accepted(header("authorization"),
                      token_it == query.end() ? std::string() : token_it->second)) {
    std::cerr << "[gateway] rejected device " << device_id << " from " << remote_address
              << ": bad token\n";
    reject(401, "Unauthorized", "unauthorized");
    return;
  }

  if (upgraded_.fetch_add(1) >= options_.max_connections) {
    upgraded_.fetch_sub(1);
    reject(503, "Service Unavailable", "too_many_connections");
    return;
  }

  if (!send_http_response(fd, ssl, 101, "Switching Protocols",
                          {{"Upgrade", "websocket"},
                           {"Connection", "Upgrade"},
                           {"Sec-WebSocket-Accept", websocket_accept_key(key)}})) {
    upgraded_.fetch_sub(1);
    untrack(fd);
    close_socket(fd, ssl);
    return;
  }

  set_socket_timeout(fd, SO_RCVTIMEO, options_.read_timeout);
  auto transport = std::make_shared<WebSocketTransport>(fd, ssl, options_.max_frame_bytes);
  handler_(transport, UpgradeRequest{.path = path,
                                     .device_id = device_id,
                                     .remote_address = std::move(remote_address)});
  transport->close();
  untrack(fd);
  upgraded_.fetch_sub(1);
}

} // namespace parley::gateway
