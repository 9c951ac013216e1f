#include "task.hpp"
#include <filesystem>

namespace download_service {

std::string_view toString(TaskState state) {
  switch (state) {
    case TaskState::Queued: return "queued";
    case TaskState::Running: return "running";
    case TaskState::Completed: return "completed";
    case TaskState::Failed: return "failed";
    case TaskState::Cancelled: return "cancelled";
  }
  return "unknown";
}

bool isTerminal(TaskState state) {
  return state == TaskState::Completed ||
         state == TaskState::Failed ||
         state == TaskState::Cancelled;
}

std::string_view wireStatus(TaskState state) {
  switch (state) {
    case TaskState::Queued:
    case TaskState::Running:
      return "downloading";
    default:
      return toString(state);
  }
}

std::string_view toString(TaskError error) {
  switch (error) {
    case TaskError::NotFound: return "Download not found";
    case TaskError::AlreadyTerminal: return "Download already finished";
    case TaskError::InvalidTransition: return "Invalid state transition";
    case TaskError::InvalidRequest: return "Invalid request";
    case TaskError::NotReady: return "Download has not completed";
  }
  return "Unknown error";
}

ProgressEvent makeEvent(const Task& task) {
  ProgressEvent event;
  event.task_id = task.id;
  event.epoch = task.epoch;
  event.state = task.state;
  event.progress_percent = task.progress_percent;
  event.speed = task.speed;
  event.eta = task.eta;
  event.downloaded_bytes = task.downloaded_bytes;
  event.total_bytes = task.total_bytes;
  event.attempt = task.attempt;
  event.quality = task.attempt_quality.empty() ? task.quality : task.attempt_quality;
  event.timestamp = task.updated_at;

  if (task.state == TaskState::Completed && task.result_path) {
    event.filename = std::filesystem::path(*task.result_path).filename().string();
  }
  if (task.state == TaskState::Failed) {
    event.error = task.error_detail.value_or("Unknown error");
  }
  return event;
}

ProgressEvent makeKeepalive(const std::string& task_id) {
  ProgressEvent event;
  event.task_id = task_id;
  event.keepalive = true;
  event.timestamp = Clock::now();
  return event;
}

} // namespace download_service
