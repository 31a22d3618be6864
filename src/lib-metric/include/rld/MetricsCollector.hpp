/**
 * @file MetricsCollector.hpp
 * @brief Сбор метрик контроллера в формате Prometheus
 *
 * @author Artem Ulyanov
 * @date Май 2025
 * @version 1.1
 * @license MIT
 *
 * @details Реализует потокобезопасный сбор:
 * - Счетчиков (Counter) с набором меток (success, namespace, ...)
 * - Времени выполнения задач (Summary: sum/count)
 * - Экспорт в Prometheus-совместимом текстовом формате
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rld {

/// Набор меток одной серии счетчика; упорядочен для стабильного экспорта
using MetricLabels = std::map<std::string, std::string>;

/**
 * @class MetricsCollector
 * @brief Потокобезопасный сборщик метрик с поддержкой Prometheus
 *
 * @note Реализованные паттерны:
 * - Singleton (единственный экземпляр)
 * - Thread-safe (блокировки для конкурентного доступа)
 *
 * @warning
 * - Серии счетчика создаются при первом инкременте с новым набором меток
 * - Нет встроенной сериализации метрик на диск
 */
class MetricsCollector {
 public:
  /**
   * @brief Получить экземпляр MetricsCollector
   * @return Единственный экземпляр класса
   *
   * @code
   * auto& metrics = MetricsCollector::instance();
   * @endcode
   */
  static MetricsCollector& instance();

  /**
   * @brief Зарегистрировать новый счетчик
   * @param name Уникальное имя счетчика
   * @param help Описание метрики (для Prometheus)
   * @throw std::invalid_argument Если имя не соответствует
   *        [a-zA-Z_][a-zA-Z0-9_]*
   * @throw std::runtime_error Если счетчик уже зарегистрирован
   */
  void registerCounter(const std::string& name, const std::string& help = "");

  /**
   * @brief Проверить, зарегистрирован ли счетчик
   */
  bool isRegistered(const std::string& name) const;

  /**
   * @brief Увеличить значение счетчика без меток
   * @param name Имя зарегистрированного счетчика
   * @param value Значение для инкремента (по умолчанию 1.0)
   *
   * @warning Не вызывает исключений для незарегистрированных счетчиков
   */
  void incrementCounter(const std::string& name, double value = 1.0);

  /**
   * @brief Увеличить значение серии счетчика с метками
   * @param name Имя зарегистрированного счетчика
   * @param labels Метки серии, например {{"success","true"}}
   * @param value Значение для инкремента
   *
   * @code
   * metrics.incrementCounter("reloader_reloaded_total", {{"success", "true"}});
   * @endcode
   */
  void incrementCounter(const std::string& name, const MetricLabels& labels,
                        double value = 1.0);

  /**
   * @brief Текущее значение серии (0, если серия не создавалась)
   */
  double counterValue(const std::string& name,
                      const MetricLabels& labels = {}) const;

  /**
   * @brief Записать время выполнения задачи
   * @param name Имя метрики
   * @param duration Время выполнения в миллисекундах
   *
   * @note Агрегирует сумму и количество наблюдений для summary
   */
  void recordTaskTime(const std::string& name,
                      std::chrono::milliseconds duration);

  /**
   * @brief Экспорт метрик в формате Prometheus
   * @return Строка с метриками в Prometheus text-based формате
   */
  std::string exportPrometheus() const;

  /**
   * @brief Удалить все счетчики и замеры (для тестов и переинициализации)
   */
  void reset();

 private:
  MetricsCollector() = default;

  /// Внутренняя структура для хранения счетчика и его серий
  struct Counter {
    std::string help;                       ///< Описание для Prometheus
    std::map<MetricLabels, double> series;  ///< Значения по наборам меток
  };

  /// Агрегат времени выполнения задачи
  struct TaskTime {
    std::uint64_t sumMs = 0;
    std::uint64_t count = 0;
  };

  static std::string formatLabels(const MetricLabels& labels);

  mutable std::mutex mutex_;  ///< Мьютекс для потокобезопасности
  std::map<std::string, Counter> counters_;  ///< Регистр счетчиков
  std::unordered_map<std::string, TaskTime> taskTimes_;  ///< Времена задач
};

}  // namespace rld
