#pragma once
#include <functional>
#include <optional>
#include <string>

namespace common {

// Producer side of a server-sent event stream. Payloads are handed out in
// order; the session frames each one as a single `data:` event.
class EventSource {
public:
  virtual ~EventSource() = default;

  // Called from any thread when new payloads may be ready.
  virtual void setNotifier(std::function<void()> notifier) = 0;

  // Next ready payload, or nullopt if nothing is queued right now.
  virtual std::optional<std::string> poll() = 0;

  // True once the final payload has been handed out by poll().
  virtual bool exhausted() const = 0;

  // Releases the subscription. Safe to call more than once.
  virtual void close() = 0;
};

}
