#pragma once
#include <nlohmann/json.hpp>
#include "domain/task.hpp"
#include "domain/video.hpp"

namespace download_service {

nlohmann::json taskToJson(const Task& task);

// Wire form of a progress event: {status, progress, download_id, ...}.
// Keepalives carry nothing but their status.
nlohmann::json eventToJson(const ProgressEvent& event);

nlohmann::json videoInfoToJson(const VideoInfo& info);

} // namespace download_service
