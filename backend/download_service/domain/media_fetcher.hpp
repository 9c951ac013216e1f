#pragma once
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>

namespace download_service {

// Raw sample reported by the extractor while bytes are moving.
struct FetchProgress {
  uint64_t downloaded_bytes{0};
  std::optional<uint64_t> total_bytes;
  std::optional<double> speed;        // bytes per second
  std::optional<double> eta_seconds;
};

struct FetchRequest {
  std::string url;
  std::string format_selector;        // extractor format expression
  std::filesystem::path work_dir;     // scratch directory owned by this attempt
};

class MediaFetcher {
public:
  using ProgressCallback = std::function<void(const FetchProgress&)>;
  virtual ~MediaFetcher() = default;

  // Downloads into request.work_dir and returns the produced file. Must
  // return promptly with an error once `stop` is requested.
  virtual std::expected<std::filesystem::path, std::string> fetch(
    const FetchRequest& request,
    ProgressCallback progress_callback,
    std::stop_token stop
  ) = 0;
};
}
