#pragma once
#include <optional>
#include <string_view>
#include "domain/media_fetcher.hpp"
#include "infrastructure/ytdlp_command.hpp"

namespace download_service {

// Parses a "[progress] downloaded total estimate speed eta" line emitted by
// our progress template. yt-dlp prints NA or None for unknown fields.
std::optional<FetchProgress> parseProgressLine(std::string_view line);

// Parses the "[file] /path" line printed after the final move.
std::optional<std::string> parseFileLine(std::string_view line);

class YtDlpFetcher : public MediaFetcher {
public:
  explicit YtDlpFetcher(YtDlpOptions options);

  std::expected<std::filesystem::path, std::string> fetch(
    const FetchRequest& request,
    ProgressCallback progress_callback,
    std::stop_token stop
  ) override;

private:
  YtDlpOptions options_;
};
}
