#pragma once
#include <string>
#include <expected>
#include "domain/video.hpp"

namespace download_service {
class MediaResolver {
public:
  virtual ~MediaResolver() = default;

  // Title, duration, thumbnail and the selectable formats for `url`.
  virtual std::expected<VideoInfo, std::string> resolve(const std::string& url) = 0;
};
}
