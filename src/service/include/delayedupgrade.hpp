/**
 * @file delayedupgrade.hpp
 * @brief Коалесцирование изменений для workload'ов с отложенным rollout
 *
 * @details
 * Для каждого workload'а (kind/namespace/name) хранится не более одного
 * пакета (DelayedBatch). Первое изменение создаёт пакет и поток-таймер;
 * изменения, пришедшие до срабатывания, добавляются в тот же пакет.
 * По истечении окна пакет переходит в Firing, изменения снимаются копией,
 * а обработчик вызывается уже без блокировки реестра.
 *
 * Жизненный цикл пакета: Pending -> Firing -> Done (удалён из реестра).
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "changeconfig.hpp"
#include "resourceadapter.hpp"

/**
 * @class DelayedUpgradeCoalescer
 * @brief Реестр отложенных пакетов изменений с таймерами
 */
class DelayedUpgradeCoalescer {
 public:
  /// Done соответствует удалению пакета: state() возвращает std::nullopt
  enum class BatchState { Pending, Firing, Done };

  /// Результат постановки изменения в очередь
  enum class EnqueueResult {
    Created,            ///< Создан новый пакет и таймер
    Merged,             ///< Ресурс добавлен в ожидающий пакет
    Collapsed,          ///< Ресурс уже был в пакете, хеш заменён
    DroppedWhileFiring  ///< Пакет уже срабатывает, изменение отброшено
  };

  /// Снимок пакета, передаваемый обработчику при срабатывании
  struct FlushRequest {
    std::string itemId;
    std::string namespaceName;
    std::shared_ptr<ResourceAdapter> adapter;
    std::vector<ChangeConfig> configs;
  };

  using FlushHandler = std::function<void(const FlushRequest &)>;

  /**
   * @param[in] window  Окно ожидания от первого изменения до срабатывания
   * @param[in] handler Вызывается из потока таймера вне блокировки
   */
  DelayedUpgradeCoalescer(std::chrono::milliseconds window,
                          FlushHandler handler);

  /// Срабатывает все ожидающие пакеты и дожидается потоков
  ~DelayedUpgradeCoalescer();

  DelayedUpgradeCoalescer(const DelayedUpgradeCoalescer &) = delete;
  DelayedUpgradeCoalescer &operator=(const DelayedUpgradeCoalescer &) = delete;

  /**
   * @brief Добавляет изменение в пакет workload'а
   * @param[in] adapter Адаптер kind, используемый при срабатывании
   * @param[in] item    Workload (используются kind/namespace/name)
   * @param[in] config  Изменение
   */
  EnqueueResult enqueue(std::shared_ptr<ResourceAdapter> adapter,
                        const WorkloadItem &item, const ChangeConfig &config);

  /**
   * @brief Будит все таймеры для немедленного срабатывания и ждёт потоки
   *
   * Повторный вызов безопасен.
   */
  void shutdown();

  /// Количество пакетов в реестре
  std::size_t batchCount() const;

  /// Состояние пакета или std::nullopt, если пакета нет
  std::optional<BatchState> state(const std::string &itemId) const;

  std::chrono::milliseconds window() const noexcept { return window_; }

 private:
  struct DelayedBatch {
    std::string itemId;
    std::string namespaceName;
    std::map<std::string, ChangeConfig> pendingConfigs;  ///< По имени ресурса
    std::chrono::steady_clock::time_point fireAt;
    BatchState state = BatchState::Pending;
    std::shared_ptr<ResourceAdapter> adapter;
  };

  struct Timer {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void runTimer(const std::string &itemId,
                std::shared_ptr<std::atomic<bool>> done);

  /// Присоединяет завершившиеся потоки; вызывается под mutex_
  void reapFinishedTimers();

  const std::chrono::milliseconds window_;
  FlushHandler handler_;

  mutable std::mutex mutex_;
  std::condition_variable wakeup_;
  bool stopping_ = false;
  std::map<std::string, DelayedBatch> batches_;
  std::vector<Timer> timers_;
};

std::string toString(DelayedUpgradeCoalescer::EnqueueResult result);
