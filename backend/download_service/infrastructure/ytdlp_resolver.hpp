#pragma once
#include <string>
#include <expected>
#include <nlohmann/json.hpp>
#include "domain/media_resolver.hpp"
#include "infrastructure/ytdlp_command.hpp"

namespace download_service {

// Reduces yt-dlp's full format list to one option per common height
// (1080/720/480/360/240) that exists as mp4 or webm video, largest file
// wins. Falls back to the first mp4/webm video format when none match.
VideoInfo summarizeVideoInfo(const nlohmann::json& info);

class YtDlpResolver : public MediaResolver {
public:
  explicit YtDlpResolver(YtDlpOptions options);

  std::expected<VideoInfo, std::string> resolve(const std::string& url) override;

private:
  YtDlpOptions options_;
};
}
