/**
 * @file service_controller.hpp
 * @brief Управление жизненным циклом контроллера перезагрузки
 *
 * @details
 * ServiceController связывает все компоненты процесса:
 *  - разбор командной строки и загрузка конфигурации;
 *  - настройка логирования и регистрация метрик;
 *  - создание клиента API-сервера, стратегии, адаптеров, отчётности,
 *    TriggerEvaluator и ResourceWatcher;
 *  - обработка SIGTERM/SIGINT через rld::SignalRouter.
 *
 * Главный цикл (опрос ConfigMap/Secret) выполняется в потоке, вызвавшем
 * run(). При завершении ожидающие отложенные пакеты применяются досрочно.
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>

#include "alertnotifier.hpp"
#include "argumentparser.hpp"
#include "changeconfig.hpp"
#include "kubeclient.hpp"
#include "reloaderoptions.hpp"
#include "resourcewatcher.hpp"
#include "triggerevaluator.hpp"

class ServiceController {
 public:
  /**
   * @brief Точка входа сервиса
   * @return EXIT_SUCCESS или EXIT_FAILURE
   */
  int run(int argc, char **argv);

 private:
  /// Консольный логгер с настройками по умолчанию, до чтения конфигурации
  void attachConsoleLogger();
  void initLogger(const ParsedArgs &args, const ReloaderOptions &options);
  void registerSignalHandlers();
  void initialize(const ReloaderOptions &options);
  void mainLoop();
  void handleShutdown();

  /// Реакция на изменение ConfigMap/Secret
  void handleChange(const ChangeConfig &config);

  void printHelp();
  void printVersion();

  ReloaderOptions options_;
  std::shared_ptr<KubeClient> client_;
  std::shared_ptr<AlertNotifier> notifier_;
  std::unique_ptr<TriggerEvaluator> evaluator_;
  std::unique_ptr<ResourceWatcher> watcher_;

  std::mutex componentsMutex_;  ///< Защищает watcher_ от обработчика сигналов
  std::atomic<bool> shutdown_requested_{false};
};
