#include "json_mapping.hpp"
#include "domain/format_utils.hpp"
#include <cmath>
#include <filesystem>

namespace download_service {

namespace {

double roundPercent(double percent) {
  return std::round(percent * 10.0) / 10.0;
}

} // namespace

nlohmann::json taskToJson(const Task& task) {
  nlohmann::json json = {
    {"download_id", task.id},
    {"url", task.source_url},
    {"canonical_url", task.canonical_url},
    {"quality", task.quality},
    {"state", std::string(toString(task.state))},
    {"status", std::string(wireStatus(task.state))},
    {"progress", roundPercent(task.progress_percent)},
    {"speed", task.speed},
    {"eta", task.eta},
    {"downloaded_bytes", task.downloaded_bytes},
    {"total_bytes", task.total_bytes},
    {"attempt", task.attempt},
    {"attempt_quality", task.attempt_quality},
    {"created_at", formatTimestamp(task.created_at)},
    {"updated_at", formatTimestamp(task.updated_at)}
  };
  if (task.result_path) {
    json["filename"] = std::filesystem::path(*task.result_path).filename().string();
  }
  if (task.error_detail) {
    json["error"] = *task.error_detail;
  }
  return json;
}

nlohmann::json eventToJson(const ProgressEvent& event) {
  if (event.keepalive) {
    return {{"status", "keepalive"}};
  }

  nlohmann::json json = {
    {"status", std::string(wireStatus(event.state))},
    {"progress", roundPercent(event.progress_percent)},
    {"download_id", event.task_id},
    {"speed", event.speed},
    {"eta", event.eta},
    {"downloaded_bytes", event.downloaded_bytes},
    {"total_bytes", event.total_bytes},
    {"attempt", event.attempt},
    {"quality", event.quality},
    {"sequence", event.sequence},
    {"updated_at", formatTimestamp(event.timestamp)}
  };
  if (event.filename) {
    json["filename"] = *event.filename;
  }
  if (event.error) {
    json["error"] = *event.error;
  }
  return json;
}

nlohmann::json videoInfoToJson(const VideoInfo& info) {
  nlohmann::json formats = nlohmann::json::array();
  for (const auto& f : info.formats) {
    nlohmann::json entry = {
      {"format_id", f.format_id},
      {"ext", f.ext},
      {"resolution", f.resolution},
      {"vcodec", f.vcodec},
      {"acodec", f.acodec}
    };
    entry["filesize"] = f.filesize ? nlohmann::json(*f.filesize) : nlohmann::json(nullptr);
    formats.push_back(std::move(entry));
  }

  return {
    {"title", info.title},
    {"duration", info.duration},
    {"thumbnail", info.thumbnail},
    {"formats", std::move(formats)}
  };
}

} // namespace download_service
