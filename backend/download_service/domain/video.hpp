#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace download_service {

// One selectable encoding offered to the user.
struct VideoFormat {
  std::string format_id;   // selector accepted by a download request
  std::string ext;         // container like "mp4", "webm"
  std::string resolution;  // "720p", "1280x720" or a format note
  std::optional<uint64_t> filesize;
  std::string vcodec;
  std::string acodec;
};

struct VideoInfo {
  std::string title;
  std::string duration;    // "MM:SS", "HH:MM:SS" or "Unknown"
  std::string thumbnail;
  std::vector<VideoFormat> formats;
};

} // namespace download_service
