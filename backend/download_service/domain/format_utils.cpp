#include "format_utils.hpp"
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace download_service {

std::string formatBytes(uint64_t bytes) {
  if (bytes == 0) {
    return "0 B";
  }
  static constexpr std::array<const char*, 5> kUnits = {"B", "KB", "MB", "GB", "TB"};
  double value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < kUnits.size()) {
    value /= 1024.0;
    ++unit;
  }

  char buf[32];
  if (unit == 0) {
    std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
  } else {
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, kUnits[unit]);
  }
  return buf;
}

std::string formatSpeed(std::optional<double> bytes_per_second) {
  if (!bytes_per_second || !std::isfinite(*bytes_per_second) || *bytes_per_second <= 0) {
    return "0 B/s";
  }
  return formatBytes(static_cast<uint64_t>(*bytes_per_second)) + "/s";
}

std::string formatDuration(std::optional<int64_t> seconds) {
  if (!seconds || *seconds <= 0) {
    return "Unknown";
  }
  auto hours = *seconds / 3600;
  auto minutes = (*seconds % 3600) / 60;
  auto secs = *seconds % 60;

  char buf[32];
  if (hours > 0) {
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld",
                  static_cast<long long>(hours), static_cast<long long>(minutes),
                  static_cast<long long>(secs));
  } else {
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld",
                  static_cast<long long>(minutes), static_cast<long long>(secs));
  }
  return buf;
}

std::string formatEta(std::optional<double> seconds) {
  if (!seconds || !std::isfinite(*seconds) || *seconds < 0) {
    return "Unknown";
  }
  auto whole = static_cast<int64_t>(*seconds);
  if (whole == 0) {
    return "00:00";
  }
  return formatDuration(whole);
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
  auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
  std::time_t t = std::chrono::system_clock::to_time_t(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%s.%03lldZ", date, static_cast<long long>(millis));
  return buf;
}

std::string sanitizeFilename(std::string_view name) {
  // full-width colon, comma, exclamation and question marks
  static constexpr std::array<std::string_view, 4> kFullWidth = {
    "\xEF\xBC\x9A", "\xEF\xBC\x8C", "\xEF\xBC\x81", "\xEF\xBC\x9F"
  };

  std::string out;
  out.reserve(name.size());
  for (size_t i = 0; i < name.size();) {
    bool skipped = false;
    for (auto fw : kFullWidth) {
      if (name.substr(i).starts_with(fw)) {
        i += fw.size();
        skipped = true;
        break;
      }
    }
    if (skipped) {
      continue;
    }

    unsigned char c = static_cast<unsigned char>(name[i]);
    switch (c) {
      case '<': case '>': case ':': case '"': case '/':
      case '\\': case '|': case '?': case '*':
        break;
      default:
        if (c >= 0x20 && c != 0x7f) {
          out.push_back(static_cast<char>(c));
        }
    }
    ++i;
  }

  auto first = out.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return {};
  }
  auto last = out.find_last_not_of(" \t.");
  if (last == std::string::npos || last < first) {
    return {};
  }
  return out.substr(first, last - first + 1);
}

std::string contentTypeForExtension(std::string_view ext) {
  if (ext == "mp4" || ext == "m4v") return "video/mp4";
  if (ext == "webm") return "video/webm";
  if (ext == "mkv") return "video/x-matroska";
  if (ext == "mov") return "video/quicktime";
  if (ext == "m4a") return "audio/mp4";
  if (ext == "mp3") return "audio/mpeg";
  if (ext == "opus" || ext == "ogg") return "audio/ogg";
  return "application/octet-stream";
}

} // namespace download_service
