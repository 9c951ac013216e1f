#include "progress_event_source.hpp"
#include "interface/json_mapping.hpp"

namespace download_service {

ProgressEventSource::ProgressEventSource(
  std::shared_ptr<Observer> observer,
  std::function<void(const std::shared_ptr<Observer>&)> release)
  : observer_(std::move(observer)), release_(std::move(release)) {}

ProgressEventSource::~ProgressEventSource() {
  close();
}

void ProgressEventSource::setNotifier(std::function<void()> notifier) {
  observer_->setNotifier(std::move(notifier));
}

std::optional<std::string> ProgressEventSource::poll() {
  auto event = observer_->poll();
  if (!event) {
    return std::nullopt;
  }
  // yt-dlp output is not guaranteed to be valid UTF-8
  return eventToJson(*event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool ProgressEventSource::exhausted() const {
  return observer_->finished();
}

void ProgressEventSource::close() {
  if (closed_.exchange(true)) {
    return;
  }
  // Detaching drops the notifier too, so the session can be released.
  if (release_) {
    release_(observer_);
  }
}

} // namespace download_service
