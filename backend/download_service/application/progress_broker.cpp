#include "progress_broker.hpp"
#include "task_registry.hpp"
#include <algorithm>
#include <iostream>

namespace download_service {

// Observer

Observer::Observer(std::string task_id, size_t queue_limit)
  : task_id_(std::move(task_id)),
    queue_limit_(queue_limit < 2 ? 2 : queue_limit),
    last_delivery_(std::chrono::steady_clock::now()) {}

bool Observer::deliver(const ProgressEvent& event) {
  std::function<void()> notifier;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (!accepting_) {
      return false;
    }

    if (event.keepalive) {
      // nothing is stale if something is already waiting to be read
      if (!queue_.empty()) {
        return true;
      }
    } else if (queue_.size() >= queue_limit_) {
      auto victim = std::find_if(queue_.begin(), queue_.end(),
                                 [](const ProgressEvent& e) { return !e.terminal(); });
      if (victim != queue_.end()) {
        queue_.erase(victim);
        ++dropped_;
      }
    }

    queue_.push_back(event);
    if (event.terminal()) {
      accepting_ = false;
    }
    last_delivery_ = std::chrono::steady_clock::now();
    notifier = notifier_;
  }
  cv_.notify_all();
  if (notifier) {
    notifier();
  }
  return true;
}

std::optional<ProgressEvent> Observer::poll() {
  std::lock_guard<std::mutex> lock{mutex_};
  if (queue_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(queue_.front());
  queue_.pop_front();
  if (event.terminal()) {
    terminal_taken_ = true;
  }
  return event;
}

std::optional<ProgressEvent> Observer::next(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock{mutex_};
  cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || !accepting_; });
  if (queue_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(queue_.front());
  queue_.pop_front();
  if (event.terminal()) {
    terminal_taken_ = true;
  }
  return event;
}

bool Observer::finished() const {
  std::lock_guard<std::mutex> lock{mutex_};
  return terminal_taken_ || detached_ || (!accepting_ && queue_.empty());
}

void Observer::setNotifier(std::function<void()> notifier) {
  std::function<void()> current;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    notifier_ = std::move(notifier);
    if (!queue_.empty() || !accepting_) {
      current = notifier_;
    }
  }
  // events queued before the notifier was installed (the replay) still count
  if (current) {
    current();
  }
}

size_t Observer::dropped() const {
  std::lock_guard<std::mutex> lock{mutex_};
  return dropped_;
}

void Observer::close() {
  std::function<void()> notifier;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    accepting_ = false;
    detached_ = true;
    queue_.clear();
    notifier = std::move(notifier_);
    notifier_ = nullptr;
  }
  cv_.notify_all();
  // let the reader see that the stream is over
  if (notifier) {
    notifier();
  }
}

std::chrono::steady_clock::time_point Observer::lastDelivery() const {
  std::lock_guard<std::mutex> lock{mutex_};
  return last_delivery_;
}

// ProgressBroker

ProgressBroker::ProgressBroker(const TaskRegistry& registry, BrokerOptions options)
  : registry_(registry), options_(options),
    heartbeat_thread_([this](std::stop_token stop) { heartbeatLoop(stop); }) {}

ProgressBroker::~ProgressBroker() {
  shutdown();
}

std::shared_ptr<ProgressBroker::Channel> ProgressBroker::channelFor(
  const std::string& task_id, bool create) const {
  std::lock_guard<std::mutex> lock{map_mutex_};
  auto it = channels_.find(task_id);
  if (it != channels_.end()) {
    return it->second;
  }
  if (!create) {
    return nullptr;
  }
  auto channel = std::make_shared<Channel>();
  channels_.emplace(task_id, channel);
  return channel;
}

void ProgressBroker::resetLocked(Channel& channel, uint64_t epoch) {
  for (auto& observer : channel.observers) {
    observer->close();
  }
  channel.observers.clear();
  channel.log.clear();
  channel.epoch = epoch;
  channel.next_sequence = 0;
  channel.terminal = false;
  channel.started = true;
}

void ProgressBroker::appendLocked(Channel& channel, ProgressEvent event) {
  event.sequence = channel.next_sequence++;
  channel.log.push_back(event);
  while (channel.log.size() > options_.event_log_limit && channel.log.size() > 1) {
    channel.log.pop_front();
  }

  for (auto& observer : channel.observers) {
    observer->deliver(event);
  }

  if (event.terminal()) {
    channel.terminal = true;
    channel.observers.clear();
    // late subscribers only ever replay the terminal event
    channel.log.erase(channel.log.begin(), channel.log.end() - 1);
  }
}

bool ProgressBroker::publish(const ProgressEvent& event) {
  if (event.keepalive) {
    return false;
  }

  auto channel = channelFor(event.task_id, true);
  std::lock_guard<std::mutex> lock{channel->mutex};

  if (!channel->started || event.epoch > channel->epoch) {
    resetLocked(*channel, event.epoch);
  } else if (event.epoch < channel->epoch) {
    return false;
  }

  if (channel->terminal) {
    std::cerr << "[Broker] Dropping " << wireStatus(event.state) << " event for "
              << event.task_id.substr(0, 8) << " after terminal event" << std::endl;
    return false;
  }

  appendLocked(*channel, event);
  return true;
}

std::expected<std::shared_ptr<Observer>, TaskError> ProgressBroker::subscribe(
  const std::string& task_id) {
  auto task = registry_.get(task_id);
  if (!task) {
    return std::unexpected(task.error());
  }

  auto channel = channelFor(task_id, true);
  auto observer = std::make_shared<Observer>(task_id, options_.observer_queue_limit);

  std::lock_guard<std::mutex> lock{channel->mutex};
  if (!channel->started || task->epoch > channel->epoch || channel->log.empty()) {
    if (!channel->started || task->epoch > channel->epoch) {
      resetLocked(*channel, task->epoch);
    }
    // nothing published yet for this epoch: seed from the registry snapshot
    appendLocked(*channel, makeEvent(*task));
  }

  const auto& last = channel->log.back();
  observer->deliver(last);
  if (!last.terminal()) {
    channel->observers.push_back(observer);
  }

  std::cout << "[Broker] Observer subscribed to " << task_id.substr(0, 8)
            << " (" << channel->observers.size() << " live)" << std::endl;
  return observer;
}

void ProgressBroker::unsubscribe(const std::shared_ptr<Observer>& observer) {
  if (!observer) {
    return;
  }
  observer->close();

  auto channel = channelFor(observer->taskId(), false);
  if (!channel) {
    return;
  }
  std::lock_guard<std::mutex> lock{channel->mutex};
  std::erase(channel->observers, observer);
}

std::vector<ProgressEvent> ProgressBroker::history(const std::string& task_id) const {
  auto channel = channelFor(task_id, false);
  if (!channel) {
    return {};
  }
  std::lock_guard<std::mutex> lock{channel->mutex};
  return {channel->log.begin(), channel->log.end()};
}

std::optional<ProgressEvent> ProgressBroker::latest(const std::string& task_id) const {
  auto channel = channelFor(task_id, false);
  if (!channel) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock{channel->mutex};
  if (channel->log.empty()) {
    return std::nullopt;
  }
  return channel->log.back();
}

size_t ProgressBroker::observerCount(const std::string& task_id) const {
  auto channel = channelFor(task_id, false);
  if (!channel) {
    return 0;
  }
  std::lock_guard<std::mutex> lock{channel->mutex};
  return channel->observers.size();
}

void ProgressBroker::heartbeatLoop(std::stop_token stop) {
  auto tick = std::max(options_.heartbeat_interval / 4, std::chrono::milliseconds(5));

  while (!stop.stop_requested()) {
    {
      std::unique_lock<std::mutex> lock{heartbeat_mutex_};
      heartbeat_cv_.wait_for(lock, stop, tick, [] { return false; });
    }
    if (stop.stop_requested()) {
      break;
    }

    std::vector<std::shared_ptr<Channel>> channels;
    {
      std::lock_guard<std::mutex> lock{map_mutex_};
      channels.reserve(channels_.size());
      for (const auto& [id, channel] : channels_) {
        channels.push_back(channel);
      }
    }

    auto now = std::chrono::steady_clock::now();
    for (const auto& channel : channels) {
      std::vector<std::shared_ptr<Observer>> idle;
      {
        std::lock_guard<std::mutex> lock{channel->mutex};
        for (const auto& observer : channel->observers) {
          if (now - observer->lastDelivery() >= options_.heartbeat_interval) {
            idle.push_back(observer);
          }
        }
      }
      for (const auto& observer : idle) {
        observer->deliver(makeKeepalive(observer->taskId()));
      }
    }
  }
}

void ProgressBroker::shutdown() {
  if (heartbeat_thread_.joinable()) {
    heartbeat_thread_.request_stop();
    heartbeat_cv_.notify_all();
    heartbeat_thread_.join();
  }

  std::lock_guard<std::mutex> lock{map_mutex_};
  for (auto& [id, channel] : channels_) {
    std::lock_guard<std::mutex> channel_lock{channel->mutex};
    for (auto& observer : channel->observers) {
      observer->close();
    }
    channel->observers.clear();
  }
}

} // namespace download_service
