#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace download_service {

enum class TaskState {
  Queued,
  Running,
  Completed,
  Failed,
  Cancelled
};

std::string_view toString(TaskState state);
bool isTerminal(TaskState state);

// Status as it appears on the progress stream; Queued and Running both
// read as "downloading".
std::string_view wireStatus(TaskState state);

enum class TaskError {
  NotFound,
  AlreadyTerminal,
  InvalidTransition,
  InvalidRequest,
  NotReady          // no deliverable file yet
};

std::string_view toString(TaskError error);

using Clock = std::chrono::system_clock;

struct Task {
  std::string id;              // fingerprint, also the external download id
  std::string source_url;      // as submitted
  std::string canonical_url;
  std::string quality;         // normalized selector the user asked for
  uint64_t epoch{0};           // bumped when a terminal task is resubmitted

  TaskState state{TaskState::Queued};
  double progress_percent{0.0};
  std::string speed{"0 B/s"};
  std::string eta{"Unknown"};
  uint64_t downloaded_bytes{0};
  uint64_t total_bytes{0};

  size_t attempt{0};           // index into the fallback ladder
  std::string attempt_quality; // label of the rung in use

  std::optional<std::string> result_path;   // Completed only
  std::optional<std::string> error_detail;  // Failed only

  Clock::time_point created_at{};
  Clock::time_point updated_at{};
};

// Fields a worker may change alongside (or without) a state change.
struct TaskUpdate {
  std::optional<double> progress_percent;
  std::optional<std::string> speed;
  std::optional<std::string> eta;
  std::optional<uint64_t> downloaded_bytes;
  std::optional<uint64_t> total_bytes;
  std::optional<size_t> attempt;
  std::optional<std::string> attempt_quality;
  std::optional<std::string> result_path;
  std::optional<std::string> error_detail;
};

struct ProgressEvent {
  std::string task_id;
  uint64_t epoch{0};
  uint64_t sequence{0};        // assigned by the broker, per task
  TaskState state{TaskState::Queued};
  bool keepalive{false};

  double progress_percent{0.0};
  std::string speed;
  std::string eta;
  uint64_t downloaded_bytes{0};
  uint64_t total_bytes{0};
  size_t attempt{0};
  std::string quality;

  // terminal-only
  std::optional<std::string> filename;
  std::optional<std::string> error;

  Clock::time_point timestamp{};

  bool terminal() const { return !keepalive && isTerminal(state); }
};

// Snapshot of a task's current fields as an event.
ProgressEvent makeEvent(const Task& task);
ProgressEvent makeKeepalive(const std::string& task_id);

} // namespace download_service
