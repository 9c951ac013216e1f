#pragma once

#include <atomic>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "application/download_worker.hpp"
#include "application/fallback_ladder.hpp"
#include "application/progress_broker.hpp"
#include "application/task_registry.hpp"
#include "common/thread_pool.hpp"
#include "domain/media_fetcher.hpp"
#include "domain/media_resolver.hpp"
#include "domain/video.hpp"

namespace download_service {

struct OrchestratorOptions {
  WorkerOptions worker;
  BrokerOptions broker;
  std::vector<std::string> fallback_ladder{"480p", "720p", "lowest"};
  unsigned int worker_threads{4};
};

// Result of a submission. AlreadyRunning carries the live task so callers
// can report its id and progress instead of resetting their view.
struct SubmitCreated { Task task; };
struct SubmitAlreadyRunning { Task task; };
struct SubmitRejected { std::string reason; };
using SubmitOutcome = std::variant<SubmitCreated, SubmitAlreadyRunning, SubmitRejected>;

struct LookupError {
  enum class Kind { InvalidRequest, ResolutionFailed };
  Kind kind;
  std::string message;
};

struct ResultFile {
  std::filesystem::path path;
  std::string download_name;
  std::string content_type;
};

// Entry point for the HTTP surface: owns the registry, the broker and the
// worker pool. Submissions return as soon as the dedup check is done and
// a worker is queued.
class DownloadOrchestrator {
public:
  DownloadOrchestrator(std::shared_ptr<MediaResolver> resolver,
                       std::shared_ptr<MediaFetcher> fetcher,
                       OrchestratorOptions options);
  ~DownloadOrchestrator();

  DownloadOrchestrator(const DownloadOrchestrator&) = delete;
  DownloadOrchestrator& operator=(const DownloadOrchestrator&) = delete;

  SubmitOutcome submit(const std::string& url, const std::string& quality);

  // NotFound for unknown ids, AlreadyTerminal for finished tasks.
  std::expected<Task, TaskError> cancel(const std::string& id);

  std::expected<Task, TaskError> getTask(const std::string& id) const;
  std::vector<Task> listTasks() const;

  std::expected<std::shared_ptr<Observer>, TaskError> subscribe(const std::string& id);
  void unsubscribe(const std::shared_ptr<Observer>& observer);

  std::expected<VideoInfo, LookupError> videoInfo(const std::string& url);

  // NotReady until the task has Completed.
  std::expected<ResultFile, TaskError> resultFile(const std::string& id) const;

  // Cancels all live tasks and joins the workers. Idempotent.
  void shutdown();

  const TaskRegistry& registry() const { return registry_; }
  const ProgressBroker& broker() const { return broker_; }

private:
  void launch(const Task& task, std::stop_token stop);

  TaskRegistry registry_;
  ProgressBroker broker_;
  std::shared_ptr<MediaResolver> resolver_;
  WorkerEnvironment env_;
  std::atomic_bool stopped_{false};
  common::ThreadPool pool_;
};

} // namespace download_service
