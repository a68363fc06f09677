#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "parley/common/json_util.hpp"
#include "parley/gateway/device_connection.hpp"
#include "parley/gateway/hub.hpp"
#include "parley/gateway/outbound_queue.hpp"
#include "parley/gateway/protocol.hpp"
#include "parley/gateway/websocket.hpp"

#include <memory>
#include <thread>

namespace {

namespace gw = parley::gateway;
namespace t = parley::testing;

std::shared_ptr<gw::DeviceConnection> idle_connection(const std::string &device,
                                                      std::shared_ptr<t::LoopbackTransport> transport) {
  return std::make_shared<gw::DeviceConnection>(device, std::move(transport),
                                                gw::ConnectionServices{}, gw::ConnectionSettings{});
}

} // namespace

void register_gateway_tests(std::vector<parley::tests::TestCase> &tests) {
  using parley::tests::require;
  using parley::common::ErrorCode;

  tests.push_back({"gateway_parse_listening_start_fields", [] {
                     const auto parsed = gw::parse_client_message(
                         R"({"type":"listening_start","timestamp":1700000000,"sample_rate":16000,)"
                         R"("encoding":"LINEAR16","language":"en-US"})");
                     require(parsed.ok(), parsed.error());
                     const auto &message = parsed.value();
                     require(message.type == gw::MessageType::ListeningStart, "type");
                     require(message.timestamp == 1700000000, "timestamp");
                     require(message.listening.sample_rate == 16000, "sample_rate");
                     require(message.listening.encoding == std::optional<std::string>("LINEAR16"),
                             "encoding");
                     require(message.listening.language == std::optional<std::string>("en-US"),
                             "language");

                     const auto bare = gw::parse_client_message(R"({"type":"listening_start"})");
                     require(bare.ok(), bare.error());
                     require(!bare.value().listening.sample_rate.has_value(),
                             "omitted fields stay unset");
                   }});

  tests.push_back({"gateway_parse_rejects_invalid_messages", [] {
                     const std::vector<std::string> invalid = {
                         "not json",
                         "[]",
                         R"({"timestamp":1})",
                         R"({"type":""})",
                         R"({"type":42})",
                         R"({"type":"dance"})",
                         R"({"type":"speaking_start"})",
                         R"({"type":"error"})",
                         R"({"type":"ping","timestamp":-5})",
                         R"({"type":"listening_start","sample_rate":4000})",
                         R"({"type":"listening_start","sample_rate":96000})",
                         R"({"type":"listening_start","sample_rate":16000.5})",
                         R"({"type":"listening_start","sample_rate":"16000"})",
                         R"({"type":"listening_start","encoding":"linear16"})",
                         R"({"type":"listening_start","encoding":""})",
                         R"({"type":"listening_start","language":"en US"})",
                     };
                     for (const auto &json : invalid) {
                       require(!gw::parse_client_message(json).ok(), "should reject: " + json);
                     }
                     require(gw::parse_client_message(R"({"type":"listening_end"})").ok(),
                             "listening_end");
                     require(gw::parse_client_message(R"( {"type":"ping"} )").ok(),
                             "whitespace around object");
                   }});

  tests.push_back({"gateway_server_message_json", [] {
                     gw::ServerMessage ready{.type = gw::MessageType::ListeningStart,
                                            .timestamp = 12,
                                            .session_id = "abc",
                                            .status = "ready",
                                            .audio = parley::speech::AudioConfig{}};
                     const auto json = ready.to_json();
                     require(parley::common::json_get_string(json, "type") == "listening_start",
                             "type");
                     require(parley::common::json_get_string(json, "status") == "ready", "status");
                     require(parley::common::json_get_number(json, "sample_rate") == "48000",
                             "sample_rate");
                     require(parley::common::json_get_string(json, "language") == "id-ID",
                             "language");
                     require(json.find("\"code\"") == std::string::npos, "no error fields");

                     const auto error = gw::error_message(
                         parley::common::Error{ErrorCode::ContentRejected, "kata \"kasar\""})
                                            .to_json();
                     require(parley::common::json_get_string(error, "type") == "error", "type");
                     require(parley::common::json_get_string(error, "code") == "content_rejected",
                             "code");
                     require(parley::common::json_get_string(error, "message") == "kata \"kasar\"",
                             "message escaped");

                     require(gw::to_string(gw::MessageType::SpeakingEnd) == "speaking_end", "name");
                     require(gw::parse_message_type("pong") == gw::MessageType::Pong, "parse");
                     require(gw::is_server_only(gw::MessageType::Error), "error is server only");
                     require(!gw::is_server_only(gw::MessageType::Ping), "ping is shared");
                   }});

  tests.push_back({"gateway_outbound_queue_bounds_and_drains", [] {
                     gw::OutboundQueue queue(2);
                     require(queue.push({gw::FrameKind::Text, "a"}), "push a");
                     require(queue.push({gw::FrameKind::Text, "b"}), "push b");
                     require(!queue.push({gw::FrameKind::Text, "c"}), "full queue rejects");

                     const auto soon = std::chrono::steady_clock::now() + std::chrono::milliseconds(10);
                     auto first = queue.pop_until(soon);
                     require(first.status == gw::OutboundQueue::PopStatus::Frame &&
                                 first.frame->payload == "a",
                             "fifo order");
                     queue.close();
                     require(!queue.push({gw::FrameKind::Text, "d"}), "closed queue rejects");
                     auto second = queue.pop_until(soon);
                     require(second.status == gw::OutboundQueue::PopStatus::Frame,
                             "queued frames survive close");
                     auto third = queue.pop_until(soon);
                     require(third.status == gw::OutboundQueue::PopStatus::Closed, "closed");

                     gw::OutboundQueue idle(1);
                     const auto timed = idle.pop_until(std::chrono::steady_clock::now() +
                                                       std::chrono::milliseconds(5));
                     require(timed.status == gw::OutboundQueue::PopStatus::Timeout, "timeout");
                   }});

  tests.push_back({"gateway_outbound_queue_push_wait_blocks_for_room", [] {
                     gw::OutboundQueue queue(1);
                     require(queue.push({gw::FrameKind::Binary, "a"}), "first fits");
                     const auto soon = std::chrono::steady_clock::now() + std::chrono::milliseconds(20);
                     require(!queue.push_wait({gw::FrameKind::Binary, "b"}, soon),
                             "full queue times out");
                     require(queue.size() == 1, "timed out frame not queued");

                     std::thread drainer([&queue] {
                       std::this_thread::sleep_for(std::chrono::milliseconds(30));
                       (void)queue.pop_until(std::chrono::steady_clock::now());
                     });
                     const auto later = std::chrono::steady_clock::now() + std::chrono::seconds(2);
                     require(queue.push_wait({gw::FrameKind::Binary, "c"}, later),
                             "room made by the writer is used");
                     drainer.join();
                     const auto popped = queue.pop_until(std::chrono::steady_clock::now());
                     require(popped.frame.has_value() && popped.frame->payload == "c", "c queued");

                     require(queue.push({gw::FrameKind::Binary, "d"}), "refill");
                     std::thread closer([&queue] {
                       std::this_thread::sleep_for(std::chrono::milliseconds(30));
                       queue.close();
                     });
                     require(!queue.push_wait({gw::FrameKind::Binary, "e"}, later),
                             "close releases a waiting producer");
                     closer.join();
                   }});

  tests.push_back({"gateway_hub_register_replace_unregister", [] {
                     auto hub = std::make_shared<gw::Hub>();
                     hub->start();
                     auto first_transport = std::make_shared<t::LoopbackTransport>();
                     auto first = idle_connection("toy-1", first_transport);
                     hub->register_connection(first).wait();
                     require(hub->size() == 1, "one connection");
                     require(hub->find("toy-1") == first, "find registered");

                     auto second_transport = std::make_shared<t::LoopbackTransport>();
                     auto second = idle_connection("toy-1", second_transport);
                     hub->register_connection(second).wait();
                     require(hub->size() == 1, "still one connection per device");
                     require(hub->find("toy-1") == second, "newest wins");
                     require(first->closed() && first_transport->is_closed(),
                             "replaced connection closed");
                     require(!second->closed(), "new connection open");

                     // the stale connection's unregister must not evict its replacement
                     hub->unregister_connection(first).wait();
                     require(hub->find("toy-1") == second, "replacement kept");

                     auto other = idle_connection("toy-2", std::make_shared<t::LoopbackTransport>());
                     hub->register_connection(other).wait();
                     require(hub->size() == 2, "two devices");
                     hub->unregister_connection(second).wait();
                     require(hub->find("toy-1") == nullptr, "unregistered");
                     require(hub->size() == 1, "one left");

                     hub->stop();
                     auto late = idle_connection("toy-3", std::make_shared<t::LoopbackTransport>());
                     const auto status = hub->register_connection(late).wait_for(std::chrono::seconds(1));
                     require(status == std::future_status::ready, "post after stop resolves");
                     require(hub->find("toy-3") == nullptr, "stopped hub ignores commands");
                   }});

  tests.push_back({"gateway_hub_close_all", [] {
                     gw::Hub hub;
                     hub.start();
                     auto transport_a = std::make_shared<t::LoopbackTransport>();
                     auto transport_b = std::make_shared<t::LoopbackTransport>();
                     hub.register_connection(idle_connection("a", transport_a)).wait();
                     hub.register_connection(idle_connection("b", transport_b)).wait();
                     hub.close_all();
                     require(transport_a->is_closed() && transport_b->is_closed(),
                             "close_all closes every socket");
                     hub.stop();
                   }});

  tests.push_back({"gateway_websocket_helpers", [] {
                     require(gw::websocket_accept_key("dGhlIHNhbXBsZSBub25jZQ==") ==
                                 "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=",
                             "RFC 6455 accept key");
                     require(gw::url_decode("toy%2D1+a%zz") == "toy-1 a%zz", "url decode");
                     const auto query = gw::parse_query("device_id=toy%201&token=abc&flag");
                     require(query.at("device_id") == "toy 1", "device id decoded");
                     require(query.at("token") == "abc", "token");
                     require(query.count("flag") == 1 && query.at("flag").empty(), "bare key");
                   }});
}
