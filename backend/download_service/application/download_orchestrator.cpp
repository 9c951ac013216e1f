#include "download_orchestrator.hpp"
#include "domain/fingerprint.hpp"
#include "domain/format_utils.hpp"
#include <iostream>

namespace download_service {

DownloadOrchestrator::DownloadOrchestrator(std::shared_ptr<MediaResolver> resolver,
                                           std::shared_ptr<MediaFetcher> fetcher,
                                           OrchestratorOptions options)
  : broker_(registry_, options.broker),
    resolver_(std::move(resolver)),
    env_{registry_, broker_, std::move(fetcher),
         FallbackLadder(options.fallback_ladder), options.worker},
    pool_(options.worker_threads) {
  if (!env_.fetcher) {
    throw std::invalid_argument("DownloadOrchestrator requires a media fetcher");
  }
  if (!resolver_) {
    throw std::invalid_argument("DownloadOrchestrator requires a media resolver");
  }
}

DownloadOrchestrator::~DownloadOrchestrator() {
  shutdown();
}

SubmitOutcome DownloadOrchestrator::submit(const std::string& url, const std::string& quality) {
  if (stopped_.load(std::memory_order_acquire)) {
    return SubmitRejected{"Service is shutting down"};
  }

  auto acquired = registry_.getOrCreate(url, quality);
  if (!acquired) {
    return SubmitRejected{acquired.error()};
  }

  if (!acquired->is_new) {
    return SubmitAlreadyRunning{std::move(acquired->task)};
  }

  broker_.publish(makeEvent(acquired->task));
  launch(acquired->task, acquired->stop);
  return SubmitCreated{std::move(acquired->task)};
}

void DownloadOrchestrator::launch(const Task& task, std::stop_token stop) {
  auto id = task.id;
  auto epoch = task.epoch;

  try {
    pool_.commit([this, id, epoch, stop]() {
      try {
        DownloadWorker worker(env_, id, epoch, stop);
        worker.run();
      } catch (const std::exception& e) {
        std::cerr << "[Worker] " << id.substr(0, 8) << " aborted: " << e.what() << std::endl;
        auto failed = registry_.transition(id, epoch, TaskState::Failed,
                                           {.error_detail = std::string("Internal error: ") + e.what()});
        if (failed) {
          broker_.publish(makeEvent(*failed));
        }
      }
    });
  } catch (const std::exception& e) {
    std::cerr << "[Orchestrator] Could not schedule " << id.substr(0, 8) << ": " << e.what() << std::endl;
    auto failed = registry_.transition(id, epoch, TaskState::Failed, {.error_detail = e.what()});
    if (failed) {
      broker_.publish(makeEvent(*failed));
    }
  }
}

std::expected<Task, TaskError> DownloadOrchestrator::cancel(const std::string& id) {
  auto cancelled = registry_.cancel(id);
  if (cancelled) {
    broker_.publish(makeEvent(*cancelled));
  }
  return cancelled;
}

std::expected<Task, TaskError> DownloadOrchestrator::getTask(const std::string& id) const {
  return registry_.get(id);
}

std::vector<Task> DownloadOrchestrator::listTasks() const {
  return registry_.list();
}

std::expected<std::shared_ptr<Observer>, TaskError> DownloadOrchestrator::subscribe(
  const std::string& id) {
  return broker_.subscribe(id);
}

void DownloadOrchestrator::unsubscribe(const std::shared_ptr<Observer>& observer) {
  broker_.unsubscribe(observer);
}

std::expected<VideoInfo, LookupError> DownloadOrchestrator::videoInfo(const std::string& url) {
  if (auto canonical = canonicalizeUrl(url); !canonical) {
    return std::unexpected(LookupError{LookupError::Kind::InvalidRequest, canonical.error()});
  }

  std::cout << "[Orchestrator] Resolving formats for " << url << std::endl;
  auto info = resolver_->resolve(url);
  if (!info) {
    std::cerr << "[Orchestrator] Resolution failed: " << info.error() << std::endl;
    return std::unexpected(LookupError{LookupError::Kind::ResolutionFailed, info.error()});
  }
  std::cout << "[Orchestrator] " << info->title << ": " << info->formats.size()
            << " format options" << std::endl;
  return std::move(*info);
}

std::expected<ResultFile, TaskError> DownloadOrchestrator::resultFile(const std::string& id) const {
  auto task = registry_.get(id);
  if (!task) {
    return std::unexpected(task.error());
  }
  if (task->state != TaskState::Completed || !task->result_path) {
    return std::unexpected(TaskError::NotReady);
  }

  std::filesystem::path path(*task->result_path);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::unexpected(TaskError::NotFound);
  }

  auto ext = path.extension().string();
  if (!ext.empty() && ext.front() == '.') {
    ext.erase(0, 1);
  }
  return ResultFile{path, path.filename().string(), contentTypeForExtension(ext)};
}

void DownloadOrchestrator::shutdown() {
  if (stopped_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  auto cancelled = registry_.cancelAll();
  for (const auto& task : cancelled) {
    broker_.publish(makeEvent(task));
  }
  if (!cancelled.empty()) {
    std::cout << "[Orchestrator] Cancelled " << cancelled.size()
              << " in-flight downloads on shutdown" << std::endl;
  }

  pool_.shutdown();
  broker_.shutdown();
}

} // namespace download_service
