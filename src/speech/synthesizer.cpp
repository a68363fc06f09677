#include "parley/speech/synthesizer.hpp"

#include <algorithm>

namespace parley::speech {

BufferedAudioStream::BufferedAudioStream(std::deque<AudioChunk> chunks)
    : chunks_(std::move(chunks)) {}

common::Result<std::optional<AudioChunk>> BufferedAudioStream::next() {
  if (chunks_.empty()) {
    return common::Result<std::optional<AudioChunk>>::success(std::nullopt);
  }
  AudioChunk chunk = std::move(chunks_.front());
  chunks_.pop_front();
  return common::Result<std::optional<AudioChunk>>::success(std::move(chunk));
}

Rechunker::Rechunker(const std::size_t chunk_bytes) : chunk_bytes_(std::max<std::size_t>(1, chunk_bytes)) {
  pending_.reserve(chunk_bytes_);
}

void Rechunker::append(const std::string_view bytes) {
  total_bytes_ += bytes.size();
  std::size_t offset = 0;
  while (offset < bytes.size()) {
    const std::size_t take = std::min(chunk_bytes_ - pending_.size(), bytes.size() - offset);
    const auto *begin = reinterpret_cast<const std::uint8_t *>(bytes.data() + offset);
    pending_.insert(pending_.end(), begin, begin + take);
    offset += take;
    if (pending_.size() == chunk_bytes_) {
      chunks_.push_back(std::move(pending_));
      pending_ = AudioChunk();
      pending_.reserve(chunk_bytes_);
    }
  }
}

std::deque<AudioChunk> Rechunker::finish() {
  if (!pending_.empty()) {
    chunks_.push_back(std::move(pending_));
    pending_ = AudioChunk();
  }
  return std::move(chunks_);
}

} // namespace parley::speech
