#pragma once

#include "parley/common/result.hpp"

#include <string>
#include <vector>

namespace parley::pipeline {

class IContentPolicy {
public:
  virtual ~IContentPolicy() = default;
  /// Success when the text may be answered.
  [[nodiscard]] virtual common::Status check(const std::string &text) const = 0;
};

/// Rejects text containing a blocked term as a whole word, ignoring ASCII case.
/// Multi-word terms match as a phrase. An empty term list accepts everything.
class KeywordContentPolicy final : public IContentPolicy {
public:
  explicit KeywordContentPolicy(std::vector<std::string> blocked_terms);

  [[nodiscard]] common::Status check(const std::string &text) const override;

private:
  std::vector<std::string> terms_;
};

} // namespace parley::pipeline
