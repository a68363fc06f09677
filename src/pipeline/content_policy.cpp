#include "parley/pipeline/content_policy.hpp"

#include "parley/common/fs.hpp"

#include <cctype>

namespace parley::pipeline {

namespace {

bool is_word_byte(const char ch) {
  const auto byte = static_cast<unsigned char>(ch);
  return byte >= 0x80 || std::isalnum(byte) != 0;
}

bool contains_word(const std::string &haystack, const std::string &term) {
  std::size_t pos = haystack.find(term);
  while (pos != std::string::npos) {
    const bool left_ok = pos == 0 || !is_word_byte(haystack[pos - 1]);
    const std::size_t end = pos + term.size();
    const bool right_ok = end >= haystack.size() || !is_word_byte(haystack[end]);
    if (left_ok && right_ok) {
      return true;
    }
    pos = haystack.find(term, pos + 1);
  }
  return false;
}

} // namespace

KeywordContentPolicy::KeywordContentPolicy(std::vector<std::string> blocked_terms) {
  for (auto &term : blocked_terms) {
    std::string normalized = common::to_lower(common::trim(term));
    if (!normalized.empty()) {
      terms_.push_back(std::move(normalized));
    }
  }
}

common::Status KeywordContentPolicy::check(const std::string &text) const {
  if (terms_.empty()) {
    return common::Status::success();
  }
  const std::string lowered = common::to_lower(text);
  for (const auto &term : terms_) {
    if (contains_word(lowered, term)) {
      return common::Status::error("utterance contains blocked term '" + term + "'");
    }
  }
  return common::Status::success();
}

} // namespace parley::pipeline
