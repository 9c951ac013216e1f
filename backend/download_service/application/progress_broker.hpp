#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "domain/task.hpp"

namespace download_service {

class TaskRegistry;

// A live subscriber to one task's progress. Events arrive in publish order;
// the queue is bounded and sheds its oldest non-terminal event when full, so
// a slow reader never holds up the publisher.
class Observer {
public:
  Observer(std::string task_id, size_t queue_limit);

  Observer(const Observer&) = delete;
  Observer& operator=(const Observer&) = delete;

  const std::string& taskId() const { return task_id_; }

  // Next queued event without waiting.
  std::optional<ProgressEvent> poll();

  // Waits up to `timeout`; nullopt on timeout or once finished.
  std::optional<ProgressEvent> next(std::chrono::milliseconds timeout);

  // The terminal event has been taken, or the observer was closed.
  bool finished() const;

  // Called (without the observer lock held) after every enqueue.
  void setNotifier(std::function<void()> notifier);

  size_t dropped() const;

private:
  friend class ProgressBroker;

  bool deliver(const ProgressEvent& event);
  void close();
  std::chrono::steady_clock::time_point lastDelivery() const;

  const std::string task_id_;
  const size_t queue_limit_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ProgressEvent> queue_;
  std::function<void()> notifier_;
  bool accepting_{true};
  bool terminal_taken_{false};
  bool detached_{false};
  size_t dropped_{0};
  std::chrono::steady_clock::time_point last_delivery_;
};

struct BrokerOptions {
  std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(30)};
  size_t observer_queue_limit{256};
  size_t event_log_limit{1024};
};

// Per-task append-only event log plus fan-out to observers. New observers
// get the latest event replayed first; a terminal event closes every
// observer of that task and the log accepts nothing after it.
class ProgressBroker {
public:
  ProgressBroker(const TaskRegistry& registry, BrokerOptions options);
  ~ProgressBroker();

  ProgressBroker(const ProgressBroker&) = delete;
  ProgressBroker& operator=(const ProgressBroker&) = delete;

  // Appends and fans out. Returns false when the event was discarded
  // because it belongs to an older epoch or the task already ended.
  bool publish(const ProgressEvent& event);

  std::expected<std::shared_ptr<Observer>, TaskError> subscribe(const std::string& task_id);
  void unsubscribe(const std::shared_ptr<Observer>& observer);

  std::vector<ProgressEvent> history(const std::string& task_id) const;
  std::optional<ProgressEvent> latest(const std::string& task_id) const;
  size_t observerCount(const std::string& task_id) const;

  // Stops the heartbeat and closes every observer.
  void shutdown();

private:
  struct Channel {
    mutable std::mutex mutex;
    uint64_t epoch{0};
    uint64_t next_sequence{0};
    bool started{false};
    bool terminal{false};
    std::deque<ProgressEvent> log;
    std::vector<std::shared_ptr<Observer>> observers;
  };

  std::shared_ptr<Channel> channelFor(const std::string& task_id, bool create) const;
  void resetLocked(Channel& channel, uint64_t epoch);
  void appendLocked(Channel& channel, ProgressEvent event);
  void heartbeatLoop(std::stop_token stop);

  const TaskRegistry& registry_;
  const BrokerOptions options_;

  mutable std::mutex map_mutex_;
  mutable std::unordered_map<std::string, std::shared_ptr<Channel>> channels_;

  std::mutex heartbeat_mutex_;
  std::condition_variable_any heartbeat_cv_;
  std::jthread heartbeat_thread_;
};

} // namespace download_service
