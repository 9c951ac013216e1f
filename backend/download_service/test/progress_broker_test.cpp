#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "application/progress_broker.hpp"
#include "application/task_registry.hpp"

using testing::Eq;
using testing::DoubleEq;

using namespace download_service;

namespace {

constexpr const char* kUrl = "https://youtu.be/abc";

class ProgressBrokerTest : public ::testing::Test {
protected:
  ProgressBrokerTest() : broker_(registry_, BrokerOptions{}) {}

  Task createRunning() {
    auto acquired = registry_.getOrCreate(kUrl, "best");
    EXPECT_TRUE(acquired.has_value());
    auto running = registry_.transition(acquired->task.id, acquired->task.epoch, TaskState::Running);
    EXPECT_TRUE(running.has_value());
    return *running;
  }

  Task progress(const Task& task, double percent) {
    auto updated = registry_.update(task.id, task.epoch, {.progress_percent = percent});
    EXPECT_TRUE(updated.has_value());
    broker_.publish(makeEvent(*updated));
    return *updated;
  }

  TaskRegistry registry_;
  ProgressBroker broker_;
};

TEST_F(ProgressBrokerTest, UnknownTaskIsNotFound) {
  auto observer = broker_.subscribe("missing");
  ASSERT_FALSE(observer);
  EXPECT_THAT(observer.error(), Eq(TaskError::NotFound));
}

TEST_F(ProgressBrokerTest, NewObserverGetsLatestStateFirst) {
  auto task = createRunning();
  broker_.publish(makeEvent(task));
  progress(task, 30.0);
  progress(task, 55.0);

  auto observer = broker_.subscribe(task.id);
  ASSERT_TRUE(observer);
  auto replay = (*observer)->poll();
  ASSERT_TRUE(replay);
  EXPECT_THAT(replay->progress_percent, DoubleEq(55.0));
  EXPECT_FALSE((*observer)->poll());

  progress(task, 80.0);
  auto live = (*observer)->poll();
  ASSERT_TRUE(live);
  EXPECT_THAT(live->progress_percent, DoubleEq(80.0));
  EXPECT_THAT(live->sequence, Eq(replay->sequence + 1));
}

TEST_F(ProgressBrokerTest, SubscribeBeforeAnyPublishSeedsFromRegistry) {
  auto acquired = registry_.getOrCreate(kUrl, "720p");
  ASSERT_TRUE(acquired);

  auto observer = broker_.subscribe(acquired->task.id);
  ASSERT_TRUE(observer);
  auto seeded = (*observer)->poll();
  ASSERT_TRUE(seeded);
  EXPECT_THAT(seeded->state, Eq(TaskState::Queued));
  EXPECT_THAT(broker_.history(acquired->task.id).size(), Eq(1u));
}

TEST_F(ProgressBrokerTest, TerminalEventClosesObserversAndLog) {
  auto task = createRunning();
  broker_.publish(makeEvent(task));
  auto observer = broker_.subscribe(task.id);
  ASSERT_TRUE(observer);

  auto done = registry_.transition(task.id, task.epoch, TaskState::Completed, {.result_path = "/tmp/a.mp4"});
  ASSERT_TRUE(done);
  EXPECT_TRUE(broker_.publish(makeEvent(*done)));
  EXPECT_THAT(broker_.observerCount(task.id), Eq(0u));

  // late progress from a slow worker is discarded
  auto late = makeEvent(task);
  EXPECT_FALSE(broker_.publish(late));

  std::vector<ProgressEvent> seen;
  while (auto event = (*observer)->poll()) {
    seen.push_back(*event);
  }
  ASSERT_THAT(seen.size(), Eq(2u));
  EXPECT_TRUE(seen.back().terminal());
  EXPECT_THAT(seen.back().filename.value_or(""), Eq("a.mp4"));
  EXPECT_TRUE((*observer)->finished());
}

TEST_F(ProgressBrokerTest, SubscribeAfterTerminalReplaysTerminalOnly) {
  auto task = createRunning();
  auto cancelled = registry_.cancel(task.id);
  ASSERT_TRUE(cancelled);
  broker_.publish(makeEvent(*cancelled));

  auto observer = broker_.subscribe(task.id);
  ASSERT_TRUE(observer);
  auto event = (*observer)->poll();
  ASSERT_TRUE(event);
  EXPECT_THAT(event->state, Eq(TaskState::Cancelled));
  EXPECT_TRUE((*observer)->finished());
  EXPECT_THAT(broker_.observerCount(task.id), Eq(0u));
}

TEST_F(ProgressBrokerTest, TerminalEventTrimsTheLog) {
  auto task = createRunning();
  broker_.publish(makeEvent(task));
  for (int i = 1; i <= 1000; ++i) {
    task = progress(task, i / 10.0);
  }
  EXPECT_THAT(broker_.history(task.id).size(), Eq(1001u));

  auto cancelled = registry_.cancel(task.id);
  ASSERT_TRUE(cancelled);
  EXPECT_TRUE(broker_.publish(makeEvent(*cancelled)));

  auto history = broker_.history(task.id);
  ASSERT_THAT(history.size(), Eq(1u));
  EXPECT_THAT(history.front().state, Eq(TaskState::Cancelled));
  EXPECT_THAT(history.front().sequence, Eq(1001u));

  auto observer = broker_.subscribe(task.id);
  ASSERT_TRUE(observer);
  auto replay = (*observer)->poll();
  ASSERT_TRUE(replay);
  EXPECT_THAT(replay->state, Eq(TaskState::Cancelled));
  EXPECT_FALSE((*observer)->poll());
}

TEST_F(ProgressBrokerTest, NewEpochStartsAFreshLog) {
  auto task = createRunning();
  auto failed = registry_.transition(task.id, task.epoch, TaskState::Failed, {.error_detail = "x"});
  ASSERT_TRUE(failed);
  broker_.publish(makeEvent(*failed));

  auto retry = registry_.getOrCreate(kUrl, "best");
  ASSERT_TRUE(retry && retry->is_new);
  EXPECT_TRUE(broker_.publish(makeEvent(retry->task)));

  auto history = broker_.history(task.id);
  ASSERT_THAT(history.size(), Eq(1u));
  EXPECT_THAT(history.front().epoch, Eq(1u));
  EXPECT_THAT(history.front().sequence, Eq(0u));

  // stragglers from the old epoch are ignored
  EXPECT_FALSE(broker_.publish(makeEvent(task)));
}

TEST_F(ProgressBrokerTest, SlowObserverShedsOldestProgressButKeepsTerminal) {
  BrokerOptions options;
  options.observer_queue_limit = 3;
  ProgressBroker broker(registry_, options);

  auto task = createRunning();
  broker.publish(makeEvent(task));
  auto observer = broker.subscribe(task.id);
  ASSERT_TRUE(observer);

  for (double p = 10; p <= 60; p += 10) {
    auto updated = registry_.update(task.id, task.epoch, {.progress_percent = p});
    ASSERT_TRUE(updated);
    broker.publish(makeEvent(*updated));
  }
  auto done = registry_.transition(task.id, task.epoch, TaskState::Completed, {.result_path = "/tmp/v.mp4"});
  ASSERT_TRUE(done);
  broker.publish(makeEvent(*done));

  std::vector<ProgressEvent> seen;
  while (auto event = (*observer)->poll()) {
    seen.push_back(*event);
  }
  ASSERT_THAT(seen.size(), Eq(3u));
  EXPECT_TRUE(seen.back().terminal());
  EXPECT_GT((*observer)->dropped(), 0u);
  for (size_t i = 1; i < seen.size(); ++i) {
    EXPECT_GE(seen[i].progress_percent, seen[i - 1].progress_percent);
  }
}

TEST_F(ProgressBrokerTest, NotifierFiresForQueuedReplay) {
  auto task = createRunning();
  broker_.publish(makeEvent(task));
  auto observer = broker_.subscribe(task.id);
  ASSERT_TRUE(observer);

  std::atomic<int> notified{0};
  (*observer)->setNotifier([&notified]() { ++notified; });
  EXPECT_THAT(notified.load(), Eq(1));

  progress(task, 10.0);
  EXPECT_THAT(notified.load(), Eq(2));

  broker_.unsubscribe(*observer);
  EXPECT_TRUE((*observer)->finished());
  EXPECT_THAT(broker_.observerCount(task.id), Eq(0u));
}

TEST(ProgressBrokerHeartbeatTest, IdleObserverReceivesKeepalive) {
  TaskRegistry registry;
  BrokerOptions options;
  options.heartbeat_interval = std::chrono::milliseconds(40);
  ProgressBroker broker(registry, options);

  auto acquired = registry.getOrCreate(kUrl, "best");
  ASSERT_TRUE(acquired);
  auto observer = broker.subscribe(acquired->task.id);
  ASSERT_TRUE(observer);
  ASSERT_TRUE((*observer)->poll());   // replay

  auto event = (*observer)->next(std::chrono::seconds(2));
  ASSERT_TRUE(event);
  EXPECT_TRUE(event->keepalive);
  EXPECT_FALSE(event->terminal());
  EXPECT_FALSE((*observer)->finished());
}

TEST(ProgressBrokerHeartbeatTest, KeepalivesAreNotLogged) {
  TaskRegistry registry;
  ProgressBroker broker(registry, BrokerOptions{});
  auto acquired = registry.getOrCreate(kUrl, "best");
  ASSERT_TRUE(acquired);

  EXPECT_FALSE(broker.publish(makeKeepalive(acquired->task.id)));
  EXPECT_TRUE(broker.history(acquired->task.id).empty());
}

} // namespace
