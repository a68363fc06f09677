#include "parley/gateway/hub.hpp"

#include "parley/gateway/device_connection.hpp"
#include "parley/observability/global.hpp"

#include <iostream>
#include <vector>

namespace parley::gateway {

Hub::Hub() = default;

Hub::~Hub() { stop(); }

void Hub::start() {
  std::lock_guard<std::mutex> lock(commands_mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this] { loop(); });
}

void Hub::stop() {
  {
    std::lock_guard<std::mutex> lock(commands_mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
    commands_cv_.notify_all();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
}

std::future<void> Hub::register_connection(std::shared_ptr<DeviceConnection> connection) {
  return post(CommandKind::Register, std::move(connection));
}

std::future<void> Hub::unregister_connection(std::shared_ptr<DeviceConnection> connection) {
  return post(CommandKind::Unregister, std::move(connection));
}

std::future<void> Hub::post(const CommandKind kind, std::shared_ptr<DeviceConnection> connection) {
  Command command;
  command.kind = kind;
  command.connection = std::move(connection);
  auto future = command.done.get_future();

  std::unique_lock<std::mutex> lock(commands_mutex_);
  if (!running_) {
    lock.unlock();
    if (kind == CommandKind::Unregister && command.connection != nullptr) {
      command.connection->close_outbound();
    }
    command.done.set_value();
    return future;
  }
  commands_.push_back(std::move(command));
  commands_cv_.notify_one();
  return future;
}

void Hub::loop() {
  while (true) {
    Command command;
    {
      std::unique_lock<std::mutex> lock(commands_mutex_);
      commands_cv_.wait(lock, [this] { return !running_ || !commands_.empty(); });
      if (commands_.empty()) {
        return;
      }
      command = std::move(commands_.front());
      commands_.pop_front();
    }
    apply(command);
    command.done.set_value();
  }
}

void Hub::apply(Command &command) {
  const auto &connection = command.connection;
  if (connection == nullptr) {
    return;
  }
  const std::string &device_id = connection->device_id();

  std::shared_ptr<DeviceConnection> replaced;
  std::size_t count = 0;
  bool removed = false;
  {
    std::unique_lock<std::shared_mutex> lock(connections_mutex_);
    auto it = connections_.find(device_id);
    if (command.kind == CommandKind::Register) {
      if (it != connections_.end() && it->second != connection) {
        replaced = it->second;
      }
      connections_[device_id] = connection;
    } else if (it != connections_.end() && it->second == connection) {
      connections_.erase(it);
      removed = true;
    }
    count = connections_.size();
  }

  if (command.kind == CommandKind::Register) {
    if (replaced != nullptr) {
      std::cerr << "[hub] replacing existing connection for device " << device_id << "\n";
      replaced->close();
      observability::record_connection(device_id, "replaced");
    }
    observability::record_connection(device_id, "registered");
  } else {
    connection->close_outbound();
    if (removed) {
      observability::record_connection(device_id, "unregistered");
    }
  }
  observability::record_metric(observability::ActiveConnectionsMetric{count});
}

std::shared_ptr<DeviceConnection> Hub::find(const std::string &device_id) const {
  std::shared_lock<std::shared_mutex> lock(connections_mutex_);
  const auto it = connections_.find(device_id);
  return it == connections_.end() ? nullptr : it->second;
}

std::size_t Hub::size() const {
  std::shared_lock<std::shared_mutex> lock(connections_mutex_);
  return connections_.size();
}

void Hub::close_all() {
  std::vector<std::shared_ptr<DeviceConnection>> open;
  {
    std::shared_lock<std::shared_mutex> lock(connections_mutex_);
    open.reserve(connections_.size());
    for (const auto &[device_id, connection] : connections_) {
      (void)device_id;
      open.push_back(connection);
    }
  }
  for (const auto &connection : open) {
    connection->close();
  }
}

} // namespace parley::gateway
