#pragma once

#include <expected>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "domain/task.hpp"

namespace download_service {

// In-memory map from fingerprint to task state. At most one task exists per
// fingerprint; a terminal task is replaced by a fresh one (next epoch) on
// resubmission. The map lock only guards membership, every task has its own
// mutex, so updates to unrelated tasks never serialize on each other.
// Nothing survives a restart.
class TaskRegistry {
public:
  struct Acquired {
    Task task;
    bool is_new{false};
    std::stop_token stop;   // cancellation token of the returned task
  };

  TaskRegistry() = default;
  TaskRegistry(const TaskRegistry&) = delete;
  TaskRegistry& operator=(const TaskRegistry&) = delete;

  // Returns the live task for this request, or creates a Queued one.
  // Fails only when the request cannot be fingerprinted.
  std::expected<Acquired, std::string> getOrCreate(std::string_view url, std::string_view quality);

  std::expected<Task, TaskError> get(const std::string& id) const;

  // Atomic state change for the given epoch. Leaving a terminal state, or a
  // stale epoch, is rejected with InvalidTransition.
  std::expected<Task, TaskError> transition(const std::string& id, uint64_t epoch,
                                            TaskState next, const TaskUpdate& fields = {});

  // Field update without a state change; progress never moves backwards.
  std::expected<Task, TaskError> update(const std::string& id, uint64_t epoch,
                                        const TaskUpdate& fields);

  // Marks the task Cancelled and signals its stop token. The worker stops
  // at its next check, not immediately.
  std::expected<Task, TaskError> cancel(const std::string& id);

  // Cancels every non-terminal task; used at shutdown.
  std::vector<Task> cancelAll();

  std::vector<Task> list() const;
  size_t size() const;

private:
  struct Entry {
    mutable std::mutex mutex;
    Task task;
    std::stop_source stop;
  };

  std::shared_ptr<Entry> find(const std::string& id) const;
  static bool allowed(TaskState from, TaskState to);
  static void apply(Task& task, const TaskUpdate& fields);

  mutable std::shared_mutex map_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace download_service
