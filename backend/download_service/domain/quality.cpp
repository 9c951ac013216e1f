#include "quality.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace download_service {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

// "720p" -> 720, anything else -> 0
int parseHeightLabel(std::string_view lowered) {
  if (lowered.size() < 2 || lowered.back() != 'p') {
    return 0;
  }
  auto digits = lowered.substr(0, lowered.size() - 1);
  int height = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), height);
  if (ec != std::errc{} || ptr != digits.data() + digits.size() || height <= 0) {
    return 0;
  }
  return height;
}

} // namespace

std::string normalizeQuality(std::string_view quality) {
  auto trimmed = trim(quality);
  std::string lowered(trimmed);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "best" || lowered == "simple" || lowered == "lowest" || lowered == "worst" ||
      parseHeightLabel(lowered) > 0) {
    return lowered == "worst" ? "lowest" : lowered;
  }
  return std::string(trimmed);
}

QualitySpec parseQuality(std::string_view quality) {
  QualitySpec spec;
  spec.label = normalizeQuality(quality);

  if (spec.label == "best") {
    spec.kind = QualityKind::Best;
    spec.format_expression = "bestvideo+bestaudio/best";
  } else if (spec.label == "simple") {
    spec.kind = QualityKind::Simple;
    spec.format_expression =
      "best[height<=1080]+bestaudio/best[height<=720]+bestaudio/best[height<=480]+bestaudio/best";
  } else if (spec.label == "lowest") {
    spec.kind = QualityKind::Lowest;
    spec.format_expression = "worstvideo+worstaudio/worst";
  } else if (int height = parseHeightLabel(spec.label); height > 0) {
    spec.kind = QualityKind::Height;
    spec.height = height;
    auto h = std::to_string(height);
    spec.format_expression = "bestvideo[height<=" + h + "]+bestaudio/best[height<=" + h + "]";
  } else {
    spec.kind = QualityKind::FormatId;
    spec.format_expression = spec.label;
  }
  return spec;
}

} // namespace download_service
