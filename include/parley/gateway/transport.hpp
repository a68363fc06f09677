#pragma once

#include "parley/common/result.hpp"

#include <string>

namespace parley::gateway {

enum class FrameKind { Text, Binary, Ping, Pong, Close };

struct Frame {
  FrameKind kind = FrameKind::Text;
  std::string payload;
};

/// One upgraded device socket. Reads happen on one thread and writes on another;
/// `close()` may be called from any thread and unblocks a pending read.
class IFrameTransport {
public:
  virtual ~IFrameTransport() = default;

  /// Fails on I/O errors, protocol violations and read timeouts.
  [[nodiscard]] virtual common::Result<Frame> read_frame() = 0;
  [[nodiscard]] virtual common::Status write_frame(const Frame &frame) = 0;
  virtual void close() = 0;
};

} // namespace parley::gateway
