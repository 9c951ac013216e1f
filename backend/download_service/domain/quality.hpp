#pragma once
#include <string>
#include <string_view>

namespace download_service {

enum class QualityKind {
  Best,      // "best"
  Simple,    // "simple": best up to 1080p with audio, stepping down
  Lowest,    // "lowest" / "worst"
  Height,    // "720p"
  FormatId   // explicit extractor format id or expression
};

struct QualitySpec {
  QualityKind kind{QualityKind::Best};
  int height{0};
  std::string label;              // normalized selector
  std::string format_expression;  // what the extractor is asked for
};

// Trims, and lower-cases the preset names and height labels. Explicit
// format ids keep their case.
std::string normalizeQuality(std::string_view quality);

QualitySpec parseQuality(std::string_view quality);

} // namespace download_service
