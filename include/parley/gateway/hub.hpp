#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace parley::gateway {

class DeviceConnection;

/// Registry of live device connections, one per device id.
///
/// Registration changes are commands applied in order by the hub's own loop
/// thread; the returned futures resolve once a command has taken effect.
/// Commands posted after stop() resolve without touching the registry.
class Hub {
public:
  Hub();
  ~Hub();

  Hub(const Hub &) = delete;
  Hub &operator=(const Hub &) = delete;

  void start();
  /// Applies commands already queued, then joins the loop thread.
  void stop();

  /// Replaces and closes any connection already registered for the same device.
  [[nodiscard]] std::future<void> register_connection(std::shared_ptr<DeviceConnection> connection);
  /// No-op for the registry unless `connection` is the current one for its device;
  /// its outbound queue is closed either way.
  [[nodiscard]] std::future<void>
  unregister_connection(std::shared_ptr<DeviceConnection> connection);

  [[nodiscard]] std::shared_ptr<DeviceConnection> find(const std::string &device_id) const;
  [[nodiscard]] std::size_t size() const;
  void close_all();

private:
  enum class CommandKind { Register, Unregister };

  struct Command {
    CommandKind kind = CommandKind::Register;
    std::shared_ptr<DeviceConnection> connection;
    std::promise<void> done;
  };

  [[nodiscard]] std::future<void> post(CommandKind kind,
                                       std::shared_ptr<DeviceConnection> connection);
  void loop();
  void apply(Command &command);

  std::mutex commands_mutex_;
  std::condition_variable commands_cv_;
  std::deque<Command> commands_;
  bool running_ = false;
  std::thread thread_;

  mutable std::shared_mutex connections_mutex_;
  std::unordered_map<std::string, std::shared_ptr<DeviceConnection>> connections_;
};

} // namespace parley::gateway
