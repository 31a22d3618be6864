#include "../include/delayedupgrade.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "../include/workloadadapters.hpp"
#include "testsupport.hpp"

using namespace std::chrono_literals;
using Coalescer = DelayedUpgradeCoalescer;

class DelayedUpgradeTest : public ::testing::Test {
 protected:
  void SetUp() override { adapter_ = std::make_shared<DeploymentAdapter>(); }

  Coalescer::FlushHandler recordingHandler() {
    return [this](const Coalescer::FlushRequest &request) {
      std::lock_guard<std::mutex> lock(mutex_);
      flushes_.push_back(request);
      flushedAt_.push_back(std::chrono::steady_clock::now());
      cv_.notify_all();
    };
  }

  bool waitForFlushes(std::size_t count,
                      std::chrono::milliseconds timeout = 5s) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout,
                        [&] { return flushes_.size() >= count; });
  }

  WorkloadItem workload(const std::string &name) {
    return WorkloadItem{testsupport::deployment(name, "prod")};
  }

  ChangeConfig secretChange(const std::string &name, const std::string &hash) {
    return ChangeConfig::create(keys_, ResourceKind::Secret, name, "prod",
                                hash);
  }

  AnnotationKeys keys_;
  std::shared_ptr<DeploymentAdapter> adapter_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<Coalescer::FlushRequest> flushes_;
  std::vector<std::chrono::steady_clock::time_point> flushedAt_;
};

TEST_F(DelayedUpgradeTest, RejectsInvalidConstruction) {
  EXPECT_THROW(Coalescer(1s, Coalescer::FlushHandler{}),
               std::invalid_argument);
  EXPECT_THROW(Coalescer(-1ms, recordingHandler()), std::invalid_argument);
}

// Сценарий D в уменьшенном масштабе: db-secret в t=0, tls-secret в t=100мс,
// одно срабатывание по окончании окна с обоими изменениями
TEST_F(DelayedUpgradeTest, ChangesWithinWindowAreFlushedTogether) {
  Coalescer coalescer(300ms, recordingHandler());
  const auto started = std::chrono::steady_clock::now();

  EXPECT_EQ(coalescer.enqueue(adapter_, workload("web"),
                              secretChange("db-secret", "h1")),
            Coalescer::EnqueueResult::Created);
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(coalescer.enqueue(adapter_, workload("web"),
                              secretChange("tls-secret", "h2")),
            Coalescer::EnqueueResult::Merged);
  EXPECT_EQ(coalescer.state("Deployment/prod/web"),
            Coalescer::BatchState::Pending);

  ASSERT_TRUE(waitForFlushes(1));
  coalescer.shutdown();

  std::lock_guard<std::mutex> lock(mutex_);
  ASSERT_EQ(flushes_.size(), 1u);
  const auto &request = flushes_.front();
  EXPECT_EQ(request.itemId, "Deployment/prod/web");
  EXPECT_EQ(request.namespaceName, "prod");
  EXPECT_EQ(request.adapter, adapter_);
  ASSERT_EQ(request.configs.size(), 2u);
  EXPECT_EQ(request.configs[0].resourceName, "db-secret");
  EXPECT_EQ(request.configs[1].resourceName, "tls-secret");
  // Окно отсчитывается от первого изменения, второе его не продлевает
  EXPECT_GE(flushedAt_.front() - started, 300ms);
  EXPECT_EQ(coalescer.batchCount(), 0u);
}

TEST_F(DelayedUpgradeTest, RepeatedResourceKeepsLatestHash) {
  Coalescer coalescer(200ms, recordingHandler());

  coalescer.enqueue(adapter_, workload("web"), secretChange("db-secret", "h1"));
  EXPECT_EQ(coalescer.enqueue(adapter_, workload("web"),
                              secretChange("db-secret", "h2")),
            Coalescer::EnqueueResult::Collapsed);

  ASSERT_TRUE(waitForFlushes(1));
  coalescer.shutdown();

  std::lock_guard<std::mutex> lock(mutex_);
  ASSERT_EQ(flushes_.front().configs.size(), 1u);
  EXPECT_EQ(flushes_.front().configs[0].contentHash, "h2");
}

TEST_F(DelayedUpgradeTest, DifferentWorkloadsGetSeparateBatches) {
  Coalescer coalescer(100ms, recordingHandler());

  coalescer.enqueue(adapter_, workload("web"), secretChange("db-secret", "h1"));
  EXPECT_EQ(coalescer.enqueue(adapter_, workload("api"),
                              secretChange("db-secret", "h1")),
            Coalescer::EnqueueResult::Created);
  EXPECT_EQ(coalescer.batchCount(), 2u);

  ASSERT_TRUE(waitForFlushes(2));
  coalescer.shutdown();
  EXPECT_EQ(coalescer.batchCount(), 0u);
}

TEST_F(DelayedUpgradeTest, ArrivalWhileFiringIsDropped) {
  std::mutex gateMutex;
  std::condition_variable gate;
  bool firing = false;
  bool release = false;
  int calls = 0;

  Coalescer coalescer(50ms, [&](const Coalescer::FlushRequest &) {
    std::unique_lock<std::mutex> lock(gateMutex);
    ++calls;
    firing = true;
    gate.notify_all();
    gate.wait(lock, [&] { return release; });
  });

  coalescer.enqueue(adapter_, workload("web"), secretChange("db-secret", "h1"));
  {
    std::unique_lock<std::mutex> lock(gateMutex);
    ASSERT_TRUE(gate.wait_for(lock, 5s, [&] { return firing; }));
  }

  EXPECT_EQ(coalescer.state("Deployment/prod/web"),
            Coalescer::BatchState::Firing);
  EXPECT_EQ(coalescer.enqueue(adapter_, workload("web"),
                              secretChange("tls-secret", "h2")),
            Coalescer::EnqueueResult::DroppedWhileFiring);

  {
    std::lock_guard<std::mutex> lock(gateMutex);
    release = true;
  }
  gate.notify_all();
  coalescer.shutdown();

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(coalescer.batchCount(), 0u);
}

TEST_F(DelayedUpgradeTest, ShutdownFlushesPendingBatchesEarly) {
  Coalescer coalescer(1h, recordingHandler());
  coalescer.enqueue(adapter_, workload("web"), secretChange("db-secret", "h1"));

  const auto started = std::chrono::steady_clock::now();
  coalescer.shutdown();

  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_EQ(flushes_.size(), 1u);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
  coalescer.shutdown();
}

TEST_F(DelayedUpgradeTest, FailingHandlerStillRemovesBatch) {
  Coalescer coalescer(10ms, [](const Coalescer::FlushRequest &) {
    throw std::runtime_error("api unavailable");
  });
  coalescer.enqueue(adapter_, workload("web"), secretChange("db-secret", "h1"));
  coalescer.shutdown();

  EXPECT_EQ(coalescer.batchCount(), 0u);
  EXPECT_FALSE(coalescer.state("Deployment/prod/web").has_value());
}

TEST(DelayedUpgradeNamesTest, EnqueueResultNames) {
  EXPECT_EQ(toString(Coalescer::EnqueueResult::Created), "Created");
  EXPECT_EQ(toString(Coalescer::EnqueueResult::DroppedWhileFiring),
            "DroppedWhileFiring");
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
