#include <gtest/gtest.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

#include "rld/SignalRouter.hpp"

using namespace std::chrono_literals;

TEST(SignalRouterTest, RejectsInvalidSignals) {
  auto& router = rld::SignalRouter::instance();
  EXPECT_THROW(router.registerHandler(0, [](int) {}), std::invalid_argument);
  EXPECT_THROW(router.registerHandler(SIGKILL, [](int) {}),
               std::invalid_argument);
  EXPECT_THROW(router.registerHandler(SIGSTOP, [](int) {}),
               std::invalid_argument);
  EXPECT_THROW(router.registerHandler(SIGUSR2, nullptr),
               std::invalid_argument);
}

// Сигнал, отправленный процессу, доходит до всех обработчиков по порядку
TEST(SignalRouterTest, DispatchesToRegisteredHandlers) {
  auto& router = rld::SignalRouter::instance();

  std::mutex mutex;
  std::condition_variable cv;
  int calls = 0;
  std::atomic<int> lastSignal{0};

  auto handler = [&](int signum) {
    std::lock_guard lock(mutex);
    ++calls;
    lastSignal = signum;
    cv.notify_all();
  };
  router.registerHandler(SIGUSR1, handler);
  router.registerHandler(SIGUSR1, handler);
  router.start();

  ASSERT_EQ(kill(getpid(), SIGUSR1), 0);

  std::unique_lock lock(mutex);
  EXPECT_TRUE(cv.wait_for(lock, 3s, [&] { return calls == 2; }));
  EXPECT_EQ(lastSignal.load(), SIGUSR1);
  lock.unlock();

  router.unregisterHandler(SIGUSR1);
  router.stop();
  EXPECT_FALSE(router.isRunning());
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
