#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include "application/progress_broker.hpp"
#include "common/restful/event_source.hpp"

namespace download_service {

// Feeds one broker observer into an SSE session as JSON payloads.
class ProgressEventSource : public common::EventSource {
public:
  ProgressEventSource(std::shared_ptr<Observer> observer,
                      std::function<void(const std::shared_ptr<Observer>&)> release);
  ~ProgressEventSource() override;

  void setNotifier(std::function<void()> notifier) override;
  std::optional<std::string> poll() override;
  bool exhausted() const override;
  void close() override;

private:
  std::shared_ptr<Observer> observer_;
  std::function<void(const std::shared_ptr<Observer>&)> release_;
  std::atomic_bool closed_{false};
};

} // namespace download_service
