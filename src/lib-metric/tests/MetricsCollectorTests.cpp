#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "rld/MetricsCollector.hpp"

using namespace rld;

class MetricsCollectorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    collector_ = &MetricsCollector::instance();
    // Сброс состояния перед каждым тестом
    collector_->reset();
  }

  MetricsCollector* collector_;
};

// 1. Тест базовой функциональности счетчиков
TEST_F(MetricsCollectorTest, CounterBasicOperations) {
  EXPECT_NO_THROW(collector_->registerCounter("requests", "Total requests"));

  collector_->incrementCounter("requests");
  collector_->incrementCounter("requests", 4.5);

  std::string metrics = collector_->exportPrometheus();
  EXPECT_NE(metrics.find("requests 5.5\n"), std::string::npos);
  EXPECT_NE(metrics.find("# HELP requests Total requests\n"),
            std::string::npos);
  EXPECT_NE(metrics.find("# TYPE requests counter\n"), std::string::npos);
}

// 2. Серии с метками учитываются независимо
TEST_F(MetricsCollectorTest, LabelledSeriesAreIndependent) {
  collector_->registerCounter("reloader_reloaded_total");

  collector_->incrementCounter("reloader_reloaded_total", {{"success", "true"}});
  collector_->incrementCounter("reloader_reloaded_total", {{"success", "true"}});
  collector_->incrementCounter("reloader_reloaded_total",
                               {{"success", "false"}});

  EXPECT_DOUBLE_EQ(collector_->counterValue("reloader_reloaded_total",
                                            {{"success", "true"}}),
                   2.0);
  EXPECT_DOUBLE_EQ(collector_->counterValue("reloader_reloaded_total",
                                            {{"success", "false"}}),
                   1.0);

  std::string metrics = collector_->exportPrometheus();
  EXPECT_NE(metrics.find("reloader_reloaded_total{success=\"true\"} 2\n"),
            std::string::npos);
}

// 3. Метки экспортируются в алфавитном порядке
TEST_F(MetricsCollectorTest, LabelsExportedSorted) {
  collector_->registerCounter("by_namespace");
  collector_->incrementCounter("by_namespace",
                               {{"success", "true"}, {"namespace", "prod"}});

  std::string metrics = collector_->exportPrometheus();
  EXPECT_NE(
      metrics.find("by_namespace{namespace=\"prod\",success=\"true\"} 1\n"),
      std::string::npos);
}

// 4. Тест обработки ошибок
TEST_F(MetricsCollectorTest, ErrorHandling) {
  collector_->registerCounter("errors");
  EXPECT_THROW(collector_->registerCounter("errors"), std::runtime_error);
  EXPECT_THROW(collector_->registerCounter(""), std::invalid_argument);
  EXPECT_THROW(collector_->registerCounter("1bad"), std::invalid_argument);

  EXPECT_NO_THROW(collector_->incrementCounter("unknown_metric"));
  EXPECT_FALSE(collector_->isRegistered("unknown_metric"));
  EXPECT_DOUBLE_EQ(collector_->counterValue("unknown_metric"), 0.0);
}

// 5. Тест работы с временем выполнения задач
TEST_F(MetricsCollectorTest, TaskTimeRecording) {
  collector_->recordTaskTime("rolling_upgrade_ms",
                             std::chrono::milliseconds(150));
  collector_->recordTaskTime("rolling_upgrade_ms",
                             std::chrono::milliseconds(350));

  std::string metrics = collector_->exportPrometheus();
  EXPECT_NE(metrics.find("rolling_upgrade_ms_sum 500\n"), std::string::npos);
  EXPECT_NE(metrics.find("rolling_upgrade_ms_count 2\n"), std::string::npos);
}

// 6. Тест многопоточной работы
TEST_F(MetricsCollectorTest, ConcurrentAccess) {
  constexpr int THREADS = 4;
  constexpr int ITERATIONS = 10000;

  collector_->registerCounter("concurrent_counter");

  auto worker = [this]() {
    for (int i = 0; i < ITERATIONS; ++i) {
      collector_->incrementCounter("concurrent_counter",
                                   {{"namespace", "default"}});
    }
  };

  std::vector<std::thread> threads;
  for (int i = 0; i < THREADS; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_DOUBLE_EQ(
      collector_->counterValue("concurrent_counter", {{"namespace", "default"}}),
      THREADS * ITERATIONS);
}

// 7. Экранирование значений меток
TEST_F(MetricsCollectorTest, EscapesLabelValues) {
  collector_->registerCounter("escaped");
  collector_->incrementCounter("escaped", {{"namespace", "a\"b"}});

  std::string metrics = collector_->exportPrometheus();
  EXPECT_NE(metrics.find("escaped{namespace=\"a\\\"b\"} 1\n"),
            std::string::npos);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
