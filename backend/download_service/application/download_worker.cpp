#include "download_worker.hpp"
#include "domain/format_utils.hpp"
#include <iostream>
#include <system_error>
#include <uuid/uuid.h>

namespace download_service {

namespace fs = std::filesystem;

DownloadWorker::DownloadWorker(const WorkerEnvironment& env, std::string task_id,
                               uint64_t epoch, std::stop_token stop)
  : env_(env), task_id_(std::move(task_id)), epoch_(epoch), stop_(std::move(stop)),
    short_id_(task_id_.substr(0, 8)) {}

void DownloadWorker::publish(const std::expected<Task, TaskError>& task) {
  if (task) {
    env_.broker.publish(makeEvent(*task));
  }
}

void DownloadWorker::run() {
  auto snapshot = env_.registry.get(task_id_);
  if (!snapshot || snapshot->epoch != epoch_) {
    return;
  }
  if (stop_.stop_requested()) {
    return finishCancelled();
  }

  const auto rungs = env_.ladder.build(snapshot->quality);
  if (rungs.empty()) {
    publish(env_.registry.transition(task_id_, epoch_, TaskState::Failed,
                                     {.error_detail = "No usable quality selector"}));
    return;
  }

  std::string last_error = "No attempt was made";
  for (size_t attempt = 0; attempt < rungs.size(); ++attempt) {
    const auto& rung = rungs[attempt];
    if (stop_.stop_requested()) {
      return finishCancelled();
    }

    auto running = env_.registry.transition(task_id_, epoch_, TaskState::Running, {
      .speed = "0 B/s",
      .eta = "Unknown",
      .attempt = attempt,
      .attempt_quality = rung.label
    });
    if (!running) {
      // cancelled (or superseded) between the check and the transition
      return finishCancelled();
    }
    publish(running);
    last_publish_ = {};

    std::cout << "[Worker] " << short_id_ << " attempt " << attempt + 1 << "/" << rungs.size()
              << ": " << rung.label << " (" << rung.format_expression << ")" << std::endl;

    auto scratch = makeScratchDir();
    if (!scratch) {
      last_error = scratch.error();
      std::cerr << "[Worker] " << short_id_ << " " << last_error << std::endl;
      continue;
    }

    std::expected<fs::path, std::string> fetched = std::unexpected(std::string{});
    try {
      fetched = env_.fetcher->fetch(
        FetchRequest{running->source_url, rung.format_expression, *scratch},
        [this](const FetchProgress& progress) { onProgress(progress); },
        stop_);
    } catch (const std::exception& e) {
      fetched = std::unexpected(std::string("Extractor raised: ") + e.what());
    }

    if (stop_.stop_requested()) {
      std::error_code ec;
      fs::remove_all(*scratch, ec);
      return finishCancelled();
    }

    if (fetched) {
      auto placed = placeResult(*fetched, rung);
      std::error_code ec;
      fs::remove_all(*scratch, ec);

      if (placed) {
        auto completed = env_.registry.transition(task_id_, epoch_, TaskState::Completed, {
          .result_path = placed->string()
        });
        if (!completed) {
          // lost a race with cancellation; the file is not handed out
          fs::remove(*placed, ec);
          return finishCancelled();
        }
        publish(completed);
        std::cout << "[Worker] " << short_id_ << " completed: " << placed->filename().string()
                  << std::endl;
        return;
      }
      last_error = placed.error();
    } else {
      last_error = fetched.error();
      std::error_code ec;
      fs::remove_all(*scratch, ec);
    }

    std::cerr << "[Worker] " << short_id_ << " extraction failed on " << rung.label
              << ": " << last_error << std::endl;
  }

  auto failed = env_.registry.transition(task_id_, epoch_, TaskState::Failed, {
    .error_detail = last_error
  });
  if (!failed) {
    return finishCancelled();
  }
  publish(failed);
  std::cerr << "[Worker] " << short_id_ << " all formats exhausted: " << last_error << std::endl;
}

void DownloadWorker::onProgress(const FetchProgress& progress) {
  if (stop_.stop_requested()) {
    return;
  }

  TaskUpdate update;
  update.downloaded_bytes = progress.downloaded_bytes;
  if (progress.total_bytes && *progress.total_bytes > 0) {
    update.total_bytes = *progress.total_bytes;
    update.progress_percent = static_cast<double>(progress.downloaded_bytes) /
                              static_cast<double>(*progress.total_bytes) * 100.0;
  }
  update.speed = formatSpeed(progress.speed);

  auto eta = progress.eta_seconds;
  if (!eta && progress.speed && *progress.speed > 0 && progress.total_bytes &&
      *progress.total_bytes >= progress.downloaded_bytes) {
    eta = static_cast<double>(*progress.total_bytes - progress.downloaded_bytes) / *progress.speed;
  }
  update.eta = formatEta(eta);

  auto now = std::chrono::steady_clock::now();
  double percent = update.progress_percent.value_or(last_published_percent_);
  bool due = last_publish_ == std::chrono::steady_clock::time_point{} ||
             now - last_publish_ >= env_.options.progress_interval ||
             percent - last_published_percent_ >= 1.0;
  if (!due) {
    return;
  }

  auto task = env_.registry.update(task_id_, epoch_, update);
  if (task) {
    last_publish_ = now;
    last_published_percent_ = task->progress_percent;
    publish(task);
  }
}

void DownloadWorker::finishCancelled() {
  auto current = env_.registry.get(task_id_);
  if (!current || current->epoch != epoch_ || isTerminal(current->state)) {
    // whoever made it terminal already published the terminal event
    return;
  }

  auto cancelled = env_.registry.transition(task_id_, epoch_, TaskState::Cancelled);
  publish(cancelled);
  std::cout << "[Worker] " << short_id_ << " cancelled" << std::endl;
}

std::expected<fs::path, std::string> DownloadWorker::makeScratchDir() const {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse(uuid, uuid_str);

  auto dir = env_.options.download_dir / env_.options.partial_dir / uuid_str;
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    return std::unexpected("Failed to create scratch directory " + dir.string() + ": " + ec.message());
  }
  return dir;
}

std::expected<fs::path, std::string> DownloadWorker::placeResult(
  const fs::path& produced, const LadderRung& rung) const {

  std::error_code ec;
  if (!fs::is_regular_file(produced, ec)) {
    return std::unexpected("Extractor reported " + produced.string() + " but no file was written");
  }

  auto title = sanitizeFilename(produced.stem().string());
  if (title.empty()) {
    title = "video";
  }
  auto label = sanitizeFilename(rung.label);
  auto ext = produced.extension().string();
  auto stem = label.empty() ? title : title + "_" + label;

  fs::create_directories(env_.options.download_dir, ec);
  auto target = env_.options.download_dir / (stem + ext);
  for (int n = 1; fs::exists(target, ec); ++n) {
    target = env_.options.download_dir / (stem + " (" + std::to_string(n) + ")" + ext);
  }

  fs::rename(produced, target, ec);
  if (ec) {
    // scratch and target may sit on different filesystems
    ec.clear();
    fs::copy_file(produced, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      return std::unexpected("Failed to move result into place: " + ec.message());
    }
    fs::remove(produced, ec);
  }
  return target;
}

} // namespace download_service
