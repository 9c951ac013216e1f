#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <algorithm>
#include <fstream>
#include <thread>
#include "application/download_worker.hpp"
#include "domain/quality.hpp"
#include "stub_collaborators.hpp"

using testing::ElementsAre;
using testing::Eq;
using testing::HasSubstr;
using testing::IsEmpty;

using namespace download_service;
using download_service::test_support::ScriptedFetcher;
using download_service::test_support::makeTempDir;

namespace fs = std::filesystem;

namespace {

constexpr const char* kUrl = "https://youtu.be/abc";

std::string expr(const std::string& quality) {
  return parseQuality(quality).format_expression;
}

class DownloadWorkerTest : public ::testing::Test {
protected:
  DownloadWorkerTest()
    : dir_(makeTempDir("worker-test")),
      broker_(registry_, BrokerOptions{}),
      fetcher_(std::make_shared<ScriptedFetcher>()),
      env_{registry_, broker_, fetcher_, FallbackLadder(),
           WorkerOptions{.download_dir = dir_, .progress_interval = std::chrono::milliseconds(0)}} {}

  ~DownloadWorkerTest() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  TaskRegistry::Acquired submit(const std::string& quality) {
    auto acquired = registry_.getOrCreate(kUrl, quality);
    EXPECT_TRUE(acquired.has_value());
    broker_.publish(makeEvent(acquired->task));
    return *acquired;
  }

  Task runToEnd(const TaskRegistry::Acquired& acquired) {
    DownloadWorker worker(env_, acquired.task.id, acquired.task.epoch, acquired.stop);
    worker.run();
    return *registry_.get(acquired.task.id);
  }

  size_t terminalEvents(const std::string& id) const {
    auto history = broker_.history(id);
    return std::count_if(history.begin(), history.end(),
                         [](const ProgressEvent& e) { return e.terminal(); });
  }

  bool partialDirEmpty() const {
    std::error_code ec;
    auto partial = dir_ / ".partial";
    return !fs::exists(partial, ec) || fs::is_empty(partial, ec);
  }

  fs::path dir_;
  TaskRegistry registry_;
  ProgressBroker broker_;
  std::shared_ptr<ScriptedFetcher> fetcher_;
  WorkerEnvironment env_;
};

TEST_F(DownloadWorkerTest, CompletesOnFirstRung) {
  auto acquired = submit("best");
  auto task = runToEnd(acquired);

  EXPECT_THAT(task.state, Eq(TaskState::Completed));
  EXPECT_THAT(task.attempt, Eq(0u));
  EXPECT_THAT(task.progress_percent, Eq(100.0));
  ASSERT_TRUE(task.result_path.has_value());
  EXPECT_THAT(fs::path(*task.result_path).filename().string(), Eq("Sample Video_best.mp4"));
  EXPECT_TRUE(fs::exists(*task.result_path));
  EXPECT_TRUE(partialDirEmpty());

  EXPECT_THAT(fetcher_->calls(), ElementsAre(expr("best")));
  EXPECT_THAT(terminalEvents(task.id), Eq(1u));
  EXPECT_THAT(broker_.latest(task.id)->filename.value_or(""), Eq("Sample Video_best.mp4"));
}

TEST_F(DownloadWorkerTest, FallsBackUntilARungSucceeds) {
  fetcher_->script("137", ScriptedFetcher::Outcome::Fail);
  fetcher_->script(expr("480p"), ScriptedFetcher::Outcome::Fail);

  auto acquired = submit("137");
  auto task = runToEnd(acquired);

  EXPECT_THAT(task.state, Eq(TaskState::Completed));
  EXPECT_THAT(task.attempt, Eq(2u));
  EXPECT_THAT(task.attempt_quality, Eq("720p"));
  EXPECT_THAT(fetcher_->calls(), ElementsAre("137", expr("480p"), expr("720p")));
  EXPECT_THAT(fs::path(*task.result_path).filename().string(), Eq("Sample Video_720p.mp4"));
  EXPECT_THAT(terminalEvents(task.id), Eq(1u));
  EXPECT_TRUE(partialDirEmpty());
}

TEST_F(DownloadWorkerTest, FailsWhenEveryRungFails) {
  auto failing = std::make_shared<ScriptedFetcher>(ScriptedFetcher::Outcome::Fail);
  env_.fetcher = failing;

  auto acquired = submit("1080p");
  auto task = runToEnd(acquired);

  EXPECT_THAT(task.state, Eq(TaskState::Failed));
  EXPECT_THAT(task.error_detail.value_or(""), HasSubstr("not available"));
  EXPECT_FALSE(task.result_path.has_value());
  EXPECT_THAT(failing->callCount(), Eq(4u));

  auto last = broker_.latest(task.id);
  ASSERT_TRUE(last);
  EXPECT_TRUE(last->terminal());
  EXPECT_THAT(last->error.value_or(""), HasSubstr("not available"));
  EXPECT_THAT(terminalEvents(task.id), Eq(1u));
  EXPECT_TRUE(partialDirEmpty());
}

TEST_F(DownloadWorkerTest, ProgressNeverMovesBackwardsAcrossRungs) {
  fetcher_->script(expr("480p"), ScriptedFetcher::Outcome::Fail);
  auto acquired = submit("480p");
  auto observer = broker_.subscribe(acquired.task.id);
  ASSERT_TRUE(observer);
  runToEnd(acquired);

  double previous = 0.0;
  size_t seen = 0;
  while (auto event = (*observer)->poll()) {
    EXPECT_GE(event->progress_percent, previous);
    previous = event->progress_percent;
    ++seen;
  }
  EXPECT_GT(seen, 2u);
  EXPECT_THAT(previous, Eq(100.0));
}

TEST_F(DownloadWorkerTest, CancelledBeforeStartNeverFetches) {
  auto acquired = submit("best");
  auto cancelled = registry_.cancel(acquired.task.id);
  ASSERT_TRUE(cancelled);
  broker_.publish(makeEvent(*cancelled));

  auto task = runToEnd(acquired);
  EXPECT_THAT(task.state, Eq(TaskState::Cancelled));
  EXPECT_THAT(fetcher_->calls(), IsEmpty());
  EXPECT_THAT(terminalEvents(task.id), Eq(1u));
}

TEST_F(DownloadWorkerTest, CancelDuringFetchStopsTheLadder) {
  auto blocking = std::make_shared<ScriptedFetcher>(ScriptedFetcher::Outcome::Block);
  env_.fetcher = blocking;

  auto acquired = submit("best");
  std::thread runner([&]() { runToEnd(acquired); });

  ASSERT_TRUE(blocking->waitForCalls(1, std::chrono::seconds(5)));
  auto cancelled = registry_.cancel(acquired.task.id);
  ASSERT_TRUE(cancelled);
  broker_.publish(makeEvent(*cancelled));
  runner.join();

  auto task = registry_.get(acquired.task.id);
  EXPECT_THAT(task->state, Eq(TaskState::Cancelled));
  EXPECT_THAT(blocking->callCount(), Eq(1u));
  EXPECT_THAT(terminalEvents(acquired.task.id), Eq(1u));
  EXPECT_TRUE(broker_.latest(acquired.task.id)->terminal());
  EXPECT_TRUE(partialDirEmpty());
}

TEST_F(DownloadWorkerTest, ExistingFileIsNotOverwritten) {
  {
    std::ofstream existing(dir_ / "Sample Video_best.mp4");
    existing << "earlier download";
  }

  auto acquired = submit("best");
  auto task = runToEnd(acquired);
  ASSERT_THAT(task.state, Eq(TaskState::Completed));
  EXPECT_THAT(fs::path(*task.result_path).filename().string(), Eq("Sample Video_best (1).mp4"));
}

TEST_F(DownloadWorkerTest, StaleEpochWorkerDoesNothing) {
  auto acquired = submit("best");
  DownloadWorker worker(env_, acquired.task.id, acquired.task.epoch + 1, acquired.stop);
  worker.run();

  EXPECT_THAT(fetcher_->calls(), IsEmpty());
  EXPECT_THAT(registry_.get(acquired.task.id)->state, Eq(TaskState::Queued));
}

} // namespace
