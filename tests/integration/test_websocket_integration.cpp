#include "test_framework.hpp"

#include "parley/common/json_util.hpp"
#include "parley/gateway/websocket.hpp"
#include "parley/runtime/app.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <array>
#include <cstring>
#include <memory>
#include <optional>
#include <string>

#ifndef _WIN32
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#endif

namespace {

namespace gw = parley::gateway;
namespace t = parley::testing;
using parley::tests::require;

#ifndef _WIN32
int connect_localhost(std::uint16_t port) {
  int sock = socket(AF_INET, SOCK_STREAM, 0);
  if (sock < 0) {
    return -1;
  }
  timeval timeout{};
  timeout.tv_sec = 5;
  setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  if (connect(sock, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    close(sock);
    return -1;
  }
  return sock;
}

bool send_raw(int sock, const std::string &data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t n = send(sock, data.data() + sent, data.size() - sent, 0);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

bool recv_exact(int sock, char *out, std::size_t size) {
  std::size_t got = 0;
  while (got < size) {
    const ssize_t n = recv(sock, out + got, size - got, 0);
    if (n <= 0) {
      return false;
    }
    got += static_cast<std::size_t>(n);
  }
  return true;
}

std::string http_request(std::uint16_t port, const std::string &request) {
  const int sock = connect_localhost(port);
  if (sock < 0) {
    return "";
  }
  (void)send_raw(sock, request);
  std::string response;
  char buffer[1024] = {0};
  while (true) {
    const ssize_t n = recv(sock, buffer, sizeof(buffer), 0);
    if (n <= 0) {
      break;
    }
    response.append(buffer, static_cast<std::size_t>(n));
  }
  close(sock);
  return response;
}

std::string upgrade_request(const std::string &target, const std::string &extra_headers = "") {
  return "GET " + target +
         " HTTP/1.1\r\nHost: localhost\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n"
         "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\nSec-WebSocket-Version: 13\r\n" +
         extra_headers + "\r\n";
}

/// Minimal masking client for one upgraded socket.
class TestClient {
public:
  ~TestClient() {
    if (sock_ >= 0) {
      close(sock_);
    }
  }

  bool open(std::uint16_t port, const std::string &target) {
    sock_ = connect_localhost(port);
    if (sock_ < 0 || !send_raw(sock_, upgrade_request(target))) {
      return false;
    }
    std::string response;
    char c = 0;
    while (response.find("\r\n\r\n") == std::string::npos) {
      if (!recv_exact(sock_, &c, 1)) {
        return false;
      }
      response.push_back(c);
    }
    handshake_ = response;
    return response.rfind("HTTP/1.1 101", 0) == 0;
  }

  [[nodiscard]] const std::string &handshake() const { return handshake_; }

  bool send_frame(std::uint8_t opcode, const std::string &payload) {
    std::string frame;
    frame.push_back(static_cast<char>(0x80u | opcode));
    if (payload.size() <= 125u) {
      frame.push_back(static_cast<char>(0x80u | payload.size()));
    } else {
      frame.push_back(static_cast<char>(0x80u | 126u));
      frame.push_back(static_cast<char>((payload.size() >> 8u) & 0xFFu));
      frame.push_back(static_cast<char>(payload.size() & 0xFFu));
    }
    const std::array<std::uint8_t, 4> mask{0x12, 0x34, 0x56, 0x78};
    for (const auto byte : mask) {
      frame.push_back(static_cast<char>(byte));
    }
    for (std::size_t i = 0; i < payload.size(); ++i) {
      frame.push_back(static_cast<char>(static_cast<std::uint8_t>(payload[i]) ^ mask[i % 4]));
    }
    return send_raw(sock_, frame);
  }

  bool send_text(const std::string &json) { return send_frame(0x1, json); }
  bool send_binary(std::size_t bytes) { return send_frame(0x2, std::string(bytes, '\x01')); }

  struct ServerFrame {
    std::uint8_t opcode = 0;
    std::string payload;
  };

  std::optional<ServerFrame> read() {
    std::array<char, 2> header{};
    if (!recv_exact(sock_, header.data(), header.size())) {
      return std::nullopt;
    }
    ServerFrame frame;
    frame.opcode = static_cast<std::uint8_t>(header[0]) & 0x0Fu;
    std::uint64_t length = static_cast<std::uint8_t>(header[1]) & 0x7Fu;
    if (length == 126u) {
      std::array<char, 2> ext{};
      if (!recv_exact(sock_, ext.data(), ext.size())) {
        return std::nullopt;
      }
      length = (static_cast<std::uint64_t>(static_cast<std::uint8_t>(ext[0])) << 8u) |
               static_cast<std::uint8_t>(ext[1]);
    } else if (length == 127u) {
      std::array<char, 8> ext{};
      if (!recv_exact(sock_, ext.data(), ext.size())) {
        return std::nullopt;
      }
      length = 0;
      for (const auto byte : ext) {
        length = (length << 8u) | static_cast<std::uint8_t>(byte);
      }
    }
    frame.payload.resize(static_cast<std::size_t>(length));
    if (length > 0 && !recv_exact(sock_, frame.payload.data(), frame.payload.size())) {
      return std::nullopt;
    }
    return frame;
  }

  /// Next text frame, skipping pings and audio; collects audio bytes on the way.
  std::optional<std::string> read_text(std::size_t *audio_bytes = nullptr) {
    while (true) {
      auto frame = read();
      if (!frame.has_value() || frame->opcode == 0x8) {
        return std::nullopt;
      }
      if (frame->opcode == 0x1) {
        return frame->payload;
      }
      if (frame->opcode == 0x2 && audio_bytes != nullptr) {
        *audio_bytes += frame->payload.size();
      }
    }
  }

private:
  int sock_ = -1;
  std::string handshake_;
};

std::uint16_t free_port() {
  int sock = socket(AF_INET, SOCK_STREAM, 0);
  if (sock < 0) {
    return 0;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = 0;
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  std::uint16_t port = 0;
  if (bind(sock, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0) {
    socklen_t len = sizeof(addr);
    if (getsockname(sock, reinterpret_cast<sockaddr *>(&addr), &len) == 0) {
      port = ntohs(addr.sin_port);
    }
  }
  close(sock);
  return port;
}
#endif

} // namespace

void register_websocket_integration_tests(std::vector<parley::tests::TestCase> &tests) {
#ifndef _WIN32
  tests.push_back({"websocket_handshake_rejections", [] {
                     gw::WebSocketServer server;
                     gw::WebSocketOptions options;
                     options.host = "127.0.0.1";
                     options.port = 0;
                     options.device_tokens = {"secret-token"};
                     const auto started = server.start(
                         options,
                         [](std::shared_ptr<gw::IFrameTransport> transport, const gw::UpgradeRequest &) {
                           transport->close();
                         },
                         [] { return std::size_t{7}; });
                     require(started.ok(), started.error());
                     require(server.port() != 0, "ephemeral port bound");

                     const auto health = http_request(
                         server.port(), "GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n");
                     require(health.find("200 OK") != std::string::npos, "health ok");
                     require(health.find("\"connections\":7") != std::string::npos,
                             "health reports live connections: " + health);

                     const auto missing = http_request(
                         server.port(), "GET /nope HTTP/1.1\r\nHost: localhost\r\n\r\n");
                     require(missing.find("404") != std::string::npos, "unknown path");

                     const auto post = http_request(
                         server.port(), "POST /ws HTTP/1.1\r\nHost: localhost\r\nContent-Length: 0\r\n\r\n");
                     require(post.find("405") != std::string::npos, "method rejected");

                     const auto plain = http_request(
                         server.port(), "GET /ws?device_id=toy HTTP/1.1\r\nHost: localhost\r\n\r\n");
                     require(plain.find("missing_websocket_headers") != std::string::npos,
                             "plain GET rejected");

                     const auto no_device = http_request(server.port(), upgrade_request("/ws?token=secret-token"));
                     require(no_device.find("400") != std::string::npos &&
                                 no_device.find("missing_device_id") != std::string::npos,
                             "device id required");

                     const auto bad_token = http_request(server.port(), upgrade_request("/ws?device_id=toy&token=wrong"));
                     require(bad_token.find("401") != std::string::npos, "bad token rejected");

                     TestClient anonymous;
                     require(!anonymous.open(server.port(), "/ws?device_id=toy"),
                             "a token is required once tokens are configured");
                     server.stop();
                   }});

  tests.push_back({"websocket_bearer_token_upgrade", [] {
                     gw::WebSocketServer server;
                     gw::WebSocketOptions options;
                     options.host = "127.0.0.1";
                     options.port = 0;
                     options.device_tokens = {"secret-token"};
                     const auto started = server.start(
                         options, [](std::shared_ptr<gw::IFrameTransport> transport,
                                     const gw::UpgradeRequest &request) {
                           (void)transport->write_frame(
                               gw::Frame{gw::FrameKind::Text, request.device_id});
                           transport->close();
                         });
                     require(started.ok(), started.error());

                     const int sock = connect_localhost(server.port());
                     require(sock >= 0, "connect");
                     require(send_raw(sock, upgrade_request("/ws?device_id=toy%2D9",
                                                            "Authorization: Bearer secret-token\r\n")),
                             "send handshake");
                     std::string response;
                     char buffer[512] = {0};
                     while (response.find("toy-9") == std::string::npos) {
                       const ssize_t n = recv(sock, buffer, sizeof(buffer), 0);
                       if (n <= 0) {
                         break;
                       }
                       response.append(buffer, static_cast<std::size_t>(n));
                     }
                     close(sock);
                     require(response.rfind("HTTP/1.1 101", 0) == 0, "upgraded: " + response);
                     require(response.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=") !=
                                 std::string::npos,
                             "accept key");
                     require(response.find("toy-9") != std::string::npos, "decoded device id");
                     server.stop();
                   }});

  tests.push_back({"websocket_voice_exchange_end_to_end", [] {
                     auto config = t::mock_config();
                     std::unique_ptr<parley::runtime::VoiceServer> server;
                     for (int attempt = 0; attempt < 5 && server == nullptr; ++attempt) {
                       config.server.port = free_port();
                       auto candidate = std::make_unique<parley::runtime::VoiceServer>(
                           parley::runtime::RuntimeContext(config));
                       if (candidate->start().ok()) {
                         server = std::move(candidate);
                       }
                     }
                     require(server != nullptr, "voice server should start");

                     TestClient client;
                     require(client.open(server->port(), "/ws?device_id=toy-e2e"), "upgrade");
                     require(t::wait_for([&] { return server->hub()->size() == 1; }),
                             "device registered");

                     require(client.send_text(
                                 R"({"type":"listening_start","timestamp":1700000000,"sample_rate":16000})"),
                             "send listening_start");
                     const auto ready = client.read_text();
                     require(ready.has_value(), "listening_start reply");
                     require(parley::common::json_get_string(*ready, "status") == "ready", *ready);
                     const auto session_id = parley::common::json_get_string(*ready, "session_id");

                     for (int i = 0; i < 4; ++i) {
                       require(client.send_binary(1500), "send audio");
                     }
                     require(client.send_text(R"({"type":"listening_end"})"), "send listening_end");

                     const auto ack = client.read_text();
                     require(ack.has_value() &&
                                 parley::common::json_get_string(*ack, "transcript") == "Halo, apa kabar?",
                             "transcript ack");
                     const auto speaking = client.read_text();
                     require(speaking.has_value() &&
                                 parley::common::json_get_string(*speaking, "type") == "speaking_start",
                             "speaking_start");
                     std::size_t audio_bytes = 0;
                     const auto done = client.read_text(&audio_bytes);
                     require(done.has_value() &&
                                 parley::common::json_get_string(*done, "type") == "speaking_end",
                             "speaking_end");
                     require(audio_bytes > 0 && audio_bytes % 2 == 0, "PCM reply audio");

                     const auto stored = server->store()->get(session_id);
                     require(stored.ok() && stored.value().has_value() &&
                                 stored.value()->turns().size() == 2,
                             "exchange persisted");
                     server->stop();
                   }});
#else
  (void)tests;
#endif
}
