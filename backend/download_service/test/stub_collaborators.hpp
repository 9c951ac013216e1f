#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "domain/media_fetcher.hpp"
#include "domain/media_resolver.hpp"

namespace download_service::test_support {

// Fetcher whose outcome is scripted per format expression. Counts every
// invocation so tests can check that no rung is fetched twice.
class ScriptedFetcher : public MediaFetcher {
public:
  enum class Outcome {
    Succeed,
    Fail,
    Block      // reports some progress, then waits for release() or stop
  };

  explicit ScriptedFetcher(Outcome fallback = Outcome::Succeed);

  void script(const std::string& format_expression, Outcome outcome);

  // Unblocks every blocked fetch; they then succeed.
  void release();

  std::vector<std::string> calls() const;
  size_t callCount() const;
  bool waitForCalls(size_t count, std::chrono::milliseconds timeout) const;

  // Returned by every fetch scripted to fail.
  void setFailureMessage(std::string message);

  std::expected<std::filesystem::path, std::string> fetch(
    const FetchRequest& request,
    ProgressCallback progress_callback,
    std::stop_token stop
  ) override;

private:
  std::expected<std::filesystem::path, std::string> produce(
    const FetchRequest& request, const ProgressCallback& progress_callback);

  const Outcome fallback_;
  mutable std::mutex mutex_;
  mutable std::condition_variable_any cv_;
  std::map<std::string, Outcome> script_;
  std::vector<std::string> calls_;
  bool released_{false};
  std::string failure_message_{"Requested format is not available"};
};

class StubResolver : public MediaResolver {
public:
  std::expected<VideoInfo, std::string> resolve(const std::string& url) override;

  std::optional<VideoInfo> info;
  std::string error{"Video unavailable"};
  size_t calls{0};
};

// Polls `predicate` until it holds or `timeout` expires.
bool waitUntil(const std::function<bool()>& predicate,
               std::chrono::milliseconds timeout = std::chrono::seconds(5));

// Fresh directory under the system temp dir, removed by the caller.
std::filesystem::path makeTempDir(const std::string& prefix);

} // namespace download_service::test_support
