#include "ytdlp_resolver.hpp"
#include "domain/format_utils.hpp"
#include <algorithm>
#include <array>
#include <iostream>

namespace download_service {

namespace {

constexpr std::array<int, 5> kCommonHeights = {1080, 720, 480, 360, 240};

std::optional<int64_t> numberField(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_number()) {
    return std::nullopt;
  }
  return static_cast<int64_t>(it->get<double>());
}

std::string stringField(const nlohmann::json& obj, const char* key, const std::string& fallback) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<std::string>();
}

std::optional<uint64_t> fileSize(const nlohmann::json& format) {
  for (const char* key : {"filesize", "filesize_approx"}) {
    if (auto size = numberField(format, key); size && *size > 0) {
      return static_cast<uint64_t>(*size);
    }
  }
  return std::nullopt;
}

std::string resolutionString(const nlohmann::json& format) {
  auto height = numberField(format, "height");
  if (height && *height > 0) {
    return std::to_string(*height) + "p";
  }
  auto width = numberField(format, "width");
  if (width && height) {
    return std::to_string(*width) + "x" + std::to_string(*height);
  }
  return stringField(format, "format_note", "Unknown");
}

bool isPlayableVideo(const nlohmann::json& format) {
  auto ext = stringField(format, "ext", "");
  return stringField(format, "vcodec", "none") != "none" && (ext == "mp4" || ext == "webm");
}

int heightOf(const VideoFormat& format) {
  if (format.resolution.size() > 1 && format.resolution.back() == 'p') {
    try {
      return std::stoi(format.resolution.substr(0, format.resolution.size() - 1));
    } catch (const std::exception&) {
      return 0;
    }
  }
  return 0;
}

} // namespace

VideoInfo summarizeVideoInfo(const nlohmann::json& info) {
  VideoInfo result;
  result.title = stringField(info, "title", "Unknown Title");
  result.duration = formatDuration(numberField(info, "duration"));
  result.thumbnail = stringField(info, "thumbnail", "");

  static const nlohmann::json kEmpty = nlohmann::json::array();
  auto formats_it = info.find("formats");
  const auto& formats = (formats_it != info.end() && formats_it->is_array()) ? *formats_it : kEmpty;

  for (int height : kCommonHeights) {
    const nlohmann::json* best = nullptr;
    for (const auto& f : formats) {
      if (numberField(f, "height") != height || !isPlayableVideo(f)) {
        continue;
      }
      if (!best || fileSize(f).value_or(0) > fileSize(*best).value_or(0)) {
        best = &f;
      }
    }
    if (!best) {
      continue;
    }
    result.formats.push_back(VideoFormat{
      .format_id = "best[height<=" + std::to_string(height) + "]",
      .ext = stringField(*best, "ext", "mp4"),
      .resolution = resolutionString(*best),
      .filesize = fileSize(*best),
      .vcodec = stringField(*best, "vcodec", "unknown"),
      .acodec = "bestaudio"   // merged during download
    });
  }

  if (result.formats.empty()) {
    for (const auto& f : formats) {
      if (!isPlayableVideo(f)) {
        continue;
      }
      result.formats.push_back(VideoFormat{
        .format_id = stringField(f, "format_id", "best"),
        .ext = stringField(f, "ext", "mp4"),
        .resolution = resolutionString(f),
        .filesize = fileSize(f),
        .vcodec = stringField(f, "vcodec", "unknown"),
        .acodec = "bestaudio"
      });
      break;
    }
  }

  std::stable_sort(result.formats.begin(), result.formats.end(),
                   [](const VideoFormat& a, const VideoFormat& b) {
    auto ha = heightOf(a), hb = heightOf(b);
    if (ha != hb) {
      return ha > hb;
    }
    return (a.ext == "mp4" ? 0 : 1) < (b.ext == "mp4" ? 0 : 1);
  });
  return result;
}

YtDlpResolver::YtDlpResolver(YtDlpOptions options) : options_(std::move(options)) {}

std::expected<VideoInfo, std::string> YtDlpResolver::resolve(const std::string& url) {
  auto args = baseArguments(options_);
  args.insert(args.end(), {"--dump-single-json", "--no-playlist", "--no-warnings", "--", url});

  std::string json_line;
  auto outcome = runYtDlp(options_, args, [&json_line](std::string_view line) {
    if (!line.empty() && line.front() == '{') {
      json_line = std::string(line);
    }
  });
  if (!outcome) {
    return std::unexpected(outcome.error());
  }
  if (outcome->exit_code != 0 || json_line.empty()) {
    auto reason = outcome->last_error.empty()
      ? "yt-dlp exited with code " + std::to_string(outcome->exit_code)
      : outcome->last_error;
    return std::unexpected("Failed to extract video info: " + reason);
  }

  try {
    return summarizeVideoInfo(nlohmann::json::parse(json_line));
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected("Failed to parse video info: " + std::string(e.what()));
  }
}

} // namespace download_service
