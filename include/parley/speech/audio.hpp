#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace parley::speech {

using AudioChunk = std::vector<std::uint8_t>;

/// Negotiated at `listening_start`. Defaults match what toys send when they omit fields.
struct AudioConfig {
  int sample_rate = 48000;
  std::string encoding = "LINEAR16";
  std::string language = "id-ID";
};

} // namespace parley::speech
