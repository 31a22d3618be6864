/**
 * @file service_controller.cpp
 * @brief Реализация методов ServiceController
 *
 * @details
 * Порядок запуска важен: обработчики сигналов регистрируются до создания
 * любых потоков (таймеры отложенных пакетов, поток signalfd), чтобы маска
 * заблокированных сигналов унаследовалась всеми потоками процесса.
 */

#include "../include/service_controller.hpp"

#include <curl/curl.h>
#include <signal.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "../include/AdapterFactory.hpp"
#include "../include/configmanager.hpp"
#include "../include/outcomereporter.hpp"
#include "../include/updatestrategy.hpp"
#include "rld/compositelogger.hpp"
#include "rld/consolelogger.hpp"
#include "rld/SignalRouter.hpp"

namespace {

/// Освобождает глобальное состояние libcurl при выходе из run()
class CurlGlobalGuard {
 public:
  CurlGlobalGuard() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("Failed to initialize libcurl");
    }
  }
  ~CurlGlobalGuard() { curl_global_cleanup(); }

  CurlGlobalGuard(const CurlGlobalGuard &) = delete;
  CurlGlobalGuard &operator=(const CurlGlobalGuard &) = delete;
};

}  // namespace

int ServiceController::run(int argc, char **argv) {
  attachConsoleLogger();
  try {
    ArgumentParser parser;
    ParsedArgs args = parser.parse(argc, argv);

    if (args.help_message) {
      printHelp();
      return EXIT_SUCCESS;
    }
    if (args.version_message) {
      printVersion();
      return EXIT_SUCCESS;
    }

    auto &config = ConfigManager::instance();
    config.initialize(args.config_path);
    if (!args.overrides.empty()) config.applyCliOverrides(args.overrides);
    options_ = ReloaderOptions::fromJson(config.getMergedConfig(args.environment));

    initLogger(args, options_);
    rld::CompositeLogger::instance().info(
        "Configuration loaded from '" + args.config_path +
        "', environment '" + args.environment + "'");

    CurlGlobalGuard curl;
    registerSignalHandlers();
    rld::SignalRouter::instance().start();

    initialize(options_);
    mainLoop();

    evaluator_->shutdown();
    rld::SignalRouter::instance().stop();
    rld::CompositeLogger::instance().info("Reloader stopped");
    rld::CompositeLogger::instance().flush();
    return EXIT_SUCCESS;
  } catch (const std::exception &e) {
    rld::CompositeLogger::instance().critical(e.what());
    rld::SignalRouter::instance().stop();
    return EXIT_FAILURE;
  }
}

void ServiceController::attachConsoleLogger() {
  auto &composite_logger = rld::CompositeLogger::instance();

  // Синглтон живёт до конца процесса, удалять его нельзя
  std::shared_ptr<rld::ILogger> console(&rld::ConsoleLogger::instance(),
                                        [](rld::ILogger *) {});
  composite_logger.clear();
  composite_logger.addLogger(console);
}

void ServiceController::initLogger(const ParsedArgs &args,
                                   const ReloaderOptions &options) {
  const rld::LogLevel level =
      rld::stringToLogLevel(args.log_level.value_or(options.logLevel));

  auto &console = rld::ConsoleLogger::instance();
  console.setFormat(rld::stringToLogFormat(options.logFormat));
  console.setLogLevel(level);
  rld::CompositeLogger::instance().setLogLevel(level);
}

void ServiceController::registerSignalHandlers() {
  auto &router = rld::SignalRouter::instance();
  rld::CompositeLogger::instance().debug(
      "Service controller: Registering signal handlers ...");

  router.registerHandler(SIGTERM, [this](int sig_num) {
    rld::CompositeLogger::instance().info(
        "SIGTERM received (signal " + std::to_string(sig_num) +
        "), shutting down");
    handleShutdown();
  });
  router.registerHandler(SIGINT, [this](int sig_num) {
    rld::CompositeLogger::instance().info(
        "SIGINT received (signal " + std::to_string(sig_num) +
        "), shutting down");
    handleShutdown();
  });
}

void ServiceController::initialize(const ReloaderOptions &options) {
  auto &logger = rld::CompositeLogger::instance();

  OutcomeReporter::registerMetrics();

  client_ = std::make_shared<CurlKubeClient>(options.kubernetes);
  notifier_ = std::make_shared<AlertNotifier>(options.alert);

  std::shared_ptr<UpdateStrategy> strategy =
      createUpdateStrategy(options.reloadStrategy);
  auto adapters = AdapterFactory::instance().createActiveAdapters(
      options.isOpenshift, options.isArgoRollouts, options.annotations);
  auto recorder = std::make_shared<KubeEventRecorder>(client_);
  auto reporter = std::make_shared<OutcomeReporter>(recorder, notifier_);

  evaluator_ = std::make_unique<TriggerEvaluator>(
      client_, std::move(adapters), strategy, reporter, options.annotations,
      options.evaluatorOptions());

  {
    std::lock_guard<std::mutex> lock(componentsMutex_);
    watcher_ = std::make_unique<ResourceWatcher>(
        client_, options.annotations, options.watchOptions(),
        [this](const ChangeConfig &change) { handleChange(change); });
    if (shutdown_requested_) watcher_->stop();
  }

  logger.info("Reload strategy: " + strategy->name());
  if (options.ignoreConfigMaps) logger.info("ConfigMaps are ignored");
  if (options.ignoreSecrets) logger.info("Secrets are ignored");
  if (!options.webhookUrl.empty()) {
    logger.info("Webhook URL is set, rollouts are replaced by webhook calls");
  }
  if (options.namespaces.empty()) {
    logger.info("Watching all namespaces");
  } else {
    for (const auto &ns : options.namespaces) {
      logger.info("Watching namespace '" + ns + "'");
    }
  }
}

void ServiceController::mainLoop() {
  rld::CompositeLogger::instance().info(
      "Service controller: Service main loop started");
  watcher_->run();
  rld::CompositeLogger::instance().info(
      "Service controller: Service main loop ended");
}

void ServiceController::handleShutdown() {
  shutdown_requested_.store(true, std::memory_order_release);

  std::lock_guard<std::mutex> lock(componentsMutex_);
  if (watcher_) watcher_->stop();
}

void ServiceController::handleChange(const ChangeConfig &config) {
  if (!options_.webhookUrl.empty()) {
    rld::CompositeLogger::instance().info(
        "Changes detected in '" + config.resourceName + "' of type '" +
        config.typeName() + "' in namespace '" + config.namespaceName +
        "', Sending webhook to '" + options_.webhookUrl + "'");
    notifier_->sendUpgradeWebhook(options_.webhookUrl);
    return;
  }

  try {
    evaluator_->performRollingUpgrade(config);
  } catch (const UpdateError &e) {
    // Ошибка уже залогирована и учтена в метриках; опрос продолжается
    rld::CompositeLogger::instance().debug(
        "Rolling upgrade for '" + config.resourceName + "' aborted: " +
        e.what());
  }
}

void ServiceController::printHelp() {
  std::cout << "Reloader: rolling restarts on ConfigMap/Secret changes\n\n"
            << "Usage:\n"
            << " reloader [options]\n\n"
            << "Options:\n"
            << " --help, -h             Show this help message\n"
            << " --version, -v          Show version info\n"
            << " --config-file=FILE     Configuration file path "
               "(default: config.json)\n"
            << " --environment=NAME     Configuration environment "
               "(default: production)\n"
            << " --override=KEY:VAL     Override config parameter, "
               "e.g. alert.sink:slack\n"
            << " --log-level=LEVEL      Logging level "
               "[debug|info|warning|error|critical]\n";
}

void ServiceController::printVersion() {
  std::cout << "Reloader v1.0.0\n";
}
