#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <stop_token>
#include <string>
#include "application/fallback_ladder.hpp"
#include "application/progress_broker.hpp"
#include "application/task_registry.hpp"
#include "domain/media_fetcher.hpp"

namespace download_service {

struct WorkerOptions {
  std::filesystem::path download_dir;
  std::string partial_dir{".partial"};
  // Minimum spacing between published progress samples; 0 publishes all.
  std::chrono::milliseconds progress_interval{200};
};

// Shared collaborators every worker runs against.
struct WorkerEnvironment {
  TaskRegistry& registry;
  ProgressBroker& broker;
  std::shared_ptr<MediaFetcher> fetcher;
  FallbackLadder ladder;
  WorkerOptions options;
};

// Drives one task (one epoch of one fingerprint) to a terminal state.
// Every read and write of task fields goes through the registry; events
// are published from the committed snapshot.
class DownloadWorker {
public:
  DownloadWorker(const WorkerEnvironment& env, std::string task_id, uint64_t epoch,
                 std::stop_token stop);

  void run();

private:
  void publish(const std::expected<Task, TaskError>& task);
  void onProgress(const FetchProgress& progress);
  void finishCancelled();

  std::expected<std::filesystem::path, std::string> makeScratchDir() const;
  std::expected<std::filesystem::path, std::string> placeResult(
    const std::filesystem::path& produced, const LadderRung& rung) const;

  const WorkerEnvironment& env_;
  const std::string task_id_;
  const uint64_t epoch_;
  std::stop_token stop_;
  std::string short_id_;
  std::chrono::steady_clock::time_point last_publish_{};
  double last_published_percent_{-1.0};
};

} // namespace download_service
