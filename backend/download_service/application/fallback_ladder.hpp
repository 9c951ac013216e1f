#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace download_service {

struct LadderRung {
  std::string label;              // quality label reported to clients
  std::string format_expression;  // passed to the extractor
};

// Ordered quality selectors tried until one succeeds: the user's choice
// first, then the configured fallbacks. Rungs whose format expression
// repeats an earlier one are skipped.
class FallbackLadder {
public:
  FallbackLadder();
  explicit FallbackLadder(std::vector<std::string> fallbacks);

  std::vector<LadderRung> build(std::string_view user_quality) const;

  const std::vector<std::string>& fallbacks() const { return fallbacks_; }

private:
  std::vector<std::string> fallbacks_;
};

}
