#include "ytdlp_fetcher.hpp"
#include <iostream>
#include <sstream>
#include <vector>

namespace download_service {

namespace {

constexpr std::string_view kProgressTag = "[progress]";
constexpr std::string_view kFileTag = "[file]";

constexpr const char* kProgressTemplate =
  "download:[progress] %(progress.downloaded_bytes)s %(progress.total_bytes)s "
  "%(progress.total_bytes_estimate)s %(progress.speed)s %(progress.eta)s";

std::optional<double> parseNumber(const std::string& token) {
  if (token.empty() || token == "NA" || token == "None") {
    return std::nullopt;
  }
  try {
    size_t used = 0;
    double value = std::stod(token, &used);
    if (used != token.size() || value < 0) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

// Largest regular file left in the scratch directory.
std::optional<std::filesystem::path> largestFile(const std::filesystem::path& dir) {
  std::error_code ec;
  std::optional<std::filesystem::path> best;
  uintmax_t best_size = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    auto name = entry.path().filename().string();
    if (name.ends_with(".part") || name.ends_with(".ytdl")) {
      continue;
    }
    auto size = entry.file_size(ec);
    if (!ec && (!best || size > best_size)) {
      best = entry.path();
      best_size = size;
    }
  }
  return best;
}

} // namespace

std::optional<FetchProgress> parseProgressLine(std::string_view line) {
  auto pos = line.find(kProgressTag);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }

  std::istringstream fields(std::string(line.substr(pos + kProgressTag.size())));
  std::vector<std::string> tokens;
  std::string token;
  while (fields >> token) {
    tokens.push_back(token);
  }
  if (tokens.size() < 5) {
    return std::nullopt;
  }

  auto downloaded = parseNumber(tokens[0]);
  if (!downloaded) {
    return std::nullopt;
  }

  FetchProgress progress;
  progress.downloaded_bytes = static_cast<uint64_t>(*downloaded);
  auto total = parseNumber(tokens[1]);
  if (!total || *total <= 0) {
    total = parseNumber(tokens[2]);
  }
  if (total && *total > 0) {
    progress.total_bytes = static_cast<uint64_t>(*total);
  }
  progress.speed = parseNumber(tokens[3]);
  progress.eta_seconds = parseNumber(tokens[4]);
  return progress;
}

std::optional<std::string> parseFileLine(std::string_view line) {
  if (!line.starts_with(kFileTag)) {
    return std::nullopt;
  }
  auto path = line.substr(kFileTag.size());
  auto first = path.find_first_not_of(' ');
  if (first == std::string_view::npos) {
    return std::nullopt;
  }
  return std::string(path.substr(first));
}

YtDlpFetcher::YtDlpFetcher(YtDlpOptions options) : options_(std::move(options)) {}

std::expected<std::filesystem::path, std::string> YtDlpFetcher::fetch(
  const FetchRequest& request,
  ProgressCallback progress_callback,
  std::stop_token stop) {

  auto args = baseArguments(options_);
  args.insert(args.end(), {
    "--newline", "--progress", "--no-playlist", "--no-part",
    "--progress-template", kProgressTemplate,
    "-f", request.format_selector,
    "--merge-output-format", "mp4",
    "-P", request.work_dir.string(),
    "-o", "%(title)s.%(ext)s",
    "--print", "after_move:[file] %(filepath)s",
    "--", request.url
  });

  std::optional<std::string> produced;
  auto outcome = runYtDlp(options_, args, [&](std::string_view line) {
    if (auto progress = parseProgressLine(line)) {
      if (progress_callback) {
        progress_callback(*progress);
      }
    } else if (auto file = parseFileLine(line)) {
      produced = std::move(*file);
    }
  }, stop);

  if (!outcome) {
    return std::unexpected(outcome.error());
  }
  if (outcome->stopped) {
    return std::unexpected("Download cancelled");
  }
  if (outcome->exit_code != 0) {
    if (!outcome->last_error.empty()) {
      return std::unexpected(outcome->last_error);
    }
    return std::unexpected("yt-dlp exited with code " + std::to_string(outcome->exit_code));
  }

  std::error_code ec;
  if (produced && std::filesystem::is_regular_file(*produced, ec)) {
    return std::filesystem::path(*produced);
  }
  if (auto fallback = largestFile(request.work_dir)) {
    std::cout << "[YtDlp] Output path not reported, using " << fallback->filename() << std::endl;
    return *fallback;
  }
  return std::unexpected("yt-dlp finished but produced no file");
}

} // namespace download_service
