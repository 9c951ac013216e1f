#include "task_registry.hpp"
#include "domain/fingerprint.hpp"
#include <algorithm>
#include <iostream>

namespace download_service {

std::expected<TaskRegistry::Acquired, std::string> TaskRegistry::getOrCreate(
  std::string_view url, std::string_view quality) {

  auto fp = fingerprint(url, quality);
  if (!fp) {
    return std::unexpected(fp.error());
  }

  std::unique_lock<std::shared_mutex> map_lock{map_mutex_};

  uint64_t epoch = 0;
  if (auto it = entries_.find(fp->id); it != entries_.end()) {
    std::lock_guard<std::mutex> lock{it->second->mutex};
    const auto& existing = it->second->task;
    if (!isTerminal(existing.state)) {
      std::cout << "[Registry] " << fp->id.substr(0, 8) << " already "
                << toString(existing.state) << ", reusing" << std::endl;
      return Acquired{existing, false, it->second->stop.get_token()};
    }
    epoch = existing.epoch + 1;
  }

  auto entry = std::make_shared<Entry>();
  auto now = Clock::now();
  entry->task.id = fp->id;
  entry->task.source_url = std::string(url);
  entry->task.canonical_url = fp->canonical_url;
  entry->task.quality = fp->quality;
  entry->task.attempt_quality = fp->quality;
  entry->task.epoch = epoch;
  entry->task.created_at = now;
  entry->task.updated_at = now;

  Acquired acquired{entry->task, true, entry->stop.get_token()};
  entries_[fp->id] = std::move(entry);

  std::cout << "[Registry] Created " << fp->id.substr(0, 8) << " (" << fp->quality
            << ", epoch " << epoch << ") for " << fp->canonical_url << std::endl;
  return acquired;
}

std::shared_ptr<TaskRegistry::Entry> TaskRegistry::find(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock{map_mutex_};
  auto it = entries_.find(id);
  return it == entries_.end() ? nullptr : it->second;
}

std::expected<Task, TaskError> TaskRegistry::get(const std::string& id) const {
  auto entry = find(id);
  if (!entry) {
    return std::unexpected(TaskError::NotFound);
  }
  std::lock_guard<std::mutex> lock{entry->mutex};
  return entry->task;
}

bool TaskRegistry::allowed(TaskState from, TaskState to) {
  switch (from) {
    case TaskState::Queued:
      return to == TaskState::Running || to == TaskState::Failed || to == TaskState::Cancelled;
    case TaskState::Running:
      return to == TaskState::Running || to == TaskState::Completed ||
             to == TaskState::Failed || to == TaskState::Cancelled;
    default:
      return false;
  }
}

void TaskRegistry::apply(Task& task, const TaskUpdate& fields) {
  if (fields.progress_percent) {
    auto clamped = std::clamp(*fields.progress_percent, 0.0, 100.0);
    task.progress_percent = std::max(task.progress_percent, clamped);
  }
  if (fields.speed) task.speed = *fields.speed;
  if (fields.eta) task.eta = *fields.eta;
  if (fields.downloaded_bytes) task.downloaded_bytes = *fields.downloaded_bytes;
  if (fields.total_bytes) task.total_bytes = *fields.total_bytes;
  if (fields.attempt) task.attempt = *fields.attempt;
  if (fields.attempt_quality) task.attempt_quality = *fields.attempt_quality;
  if (fields.result_path) task.result_path = *fields.result_path;
  if (fields.error_detail) task.error_detail = *fields.error_detail;
}

std::expected<Task, TaskError> TaskRegistry::transition(const std::string& id, uint64_t epoch,
                                                        TaskState next, const TaskUpdate& fields) {
  auto entry = find(id);
  if (!entry) {
    return std::unexpected(TaskError::NotFound);
  }

  std::lock_guard<std::mutex> lock{entry->mutex};
  auto& task = entry->task;
  if (task.epoch != epoch || !allowed(task.state, next)) {
    std::cerr << "[Registry] Rejected transition " << toString(task.state) << " -> "
              << toString(next) << " for " << id.substr(0, 8)
              << " (epoch " << epoch << ", current " << task.epoch << ")" << std::endl;
    return std::unexpected(TaskError::InvalidTransition);
  }

  apply(task, fields);
  task.state = next;
  switch (next) {
    case TaskState::Completed:
      task.progress_percent = 100.0;
      task.eta = "00:00";
      task.error_detail.reset();
      break;
    case TaskState::Failed:
      task.result_path.reset();
      if (!task.error_detail) {
        task.error_detail = "Unknown error";
      }
      break;
    case TaskState::Cancelled:
      task.result_path.reset();
      task.error_detail.reset();
      break;
    default:
      break;
  }
  task.updated_at = Clock::now();
  return task;
}

std::expected<Task, TaskError> TaskRegistry::update(const std::string& id, uint64_t epoch,
                                                    const TaskUpdate& fields) {
  auto entry = find(id);
  if (!entry) {
    return std::unexpected(TaskError::NotFound);
  }

  std::lock_guard<std::mutex> lock{entry->mutex};
  auto& task = entry->task;
  if (task.epoch != epoch) {
    return std::unexpected(TaskError::InvalidTransition);
  }
  if (isTerminal(task.state)) {
    return std::unexpected(TaskError::AlreadyTerminal);
  }

  TaskUpdate progress_only = fields;
  progress_only.result_path.reset();
  progress_only.error_detail.reset();
  apply(task, progress_only);
  task.updated_at = Clock::now();
  return task;
}

std::expected<Task, TaskError> TaskRegistry::cancel(const std::string& id) {
  auto entry = find(id);
  if (!entry) {
    return std::unexpected(TaskError::NotFound);
  }

  std::lock_guard<std::mutex> lock{entry->mutex};
  auto& task = entry->task;
  if (isTerminal(task.state)) {
    return std::unexpected(TaskError::AlreadyTerminal);
  }

  task.state = TaskState::Cancelled;
  task.result_path.reset();
  task.error_detail.reset();
  task.updated_at = Clock::now();
  entry->stop.request_stop();

  std::cout << "[Registry] Cancelled " << id.substr(0, 8) << std::endl;
  return task;
}

std::vector<Task> TaskRegistry::cancelAll() {
  std::vector<std::string> ids;
  {
    std::shared_lock<std::shared_mutex> lock{map_mutex_};
    ids.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
      ids.push_back(id);
    }
  }

  std::vector<Task> cancelled;
  for (const auto& id : ids) {
    if (auto task = cancel(id)) {
      cancelled.push_back(std::move(*task));
    }
  }
  return cancelled;
}

std::vector<Task> TaskRegistry::list() const {
  std::vector<std::shared_ptr<Entry>> snapshot;
  {
    std::shared_lock<std::shared_mutex> lock{map_mutex_};
    snapshot.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
      snapshot.push_back(entry);
    }
  }

  std::vector<Task> tasks;
  tasks.reserve(snapshot.size());
  for (const auto& entry : snapshot) {
    std::lock_guard<std::mutex> lock{entry->mutex};
    tasks.push_back(entry->task);
  }
  std::sort(tasks.begin(), tasks.end(), [](const Task& a, const Task& b) {
    return a.created_at < b.created_at;
  });
  return tasks;
}

size_t TaskRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock{map_mutex_};
  return entries_.size();
}

} // namespace download_service
