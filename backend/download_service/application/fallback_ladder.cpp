#include "fallback_ladder.hpp"
#include "domain/quality.hpp"
#include <algorithm>

namespace download_service {

FallbackLadder::FallbackLadder() : FallbackLadder({"480p", "720p", "lowest"}) {}

FallbackLadder::FallbackLadder(std::vector<std::string> fallbacks)
  : fallbacks_(std::move(fallbacks)) {}

std::vector<LadderRung> FallbackLadder::build(std::string_view user_quality) const {
  std::vector<LadderRung> rungs;
  auto push = [&rungs](std::string_view quality) {
    auto spec = parseQuality(quality);
    if (spec.label.empty()) {
      return;
    }
    bool seen = std::any_of(rungs.begin(), rungs.end(), [&spec](const LadderRung& rung) {
      return rung.format_expression == spec.format_expression;
    });
    if (!seen) {
      rungs.push_back({spec.label, spec.format_expression});
    }
  };

  push(user_quality);
  for (const auto& fallback : fallbacks_) {
    push(fallback);
  }
  return rungs;
}

}
