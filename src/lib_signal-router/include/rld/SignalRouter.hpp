/**
 * @file SignalRouter.hpp
 * @author Artem Ulyanov
 * @date May 2025
 * @brief Маршрутизация POSIX-сигналов в обработчики через signalfd
 *
 * @details
 * Сигналы блокируются в вызывающем потоке при регистрации обработчика и
 * читаются из signalfd в отдельном потоке, поэтому обработчики выполняются
 * в обычном контексте (можно логировать, брать мьютексы).
 *
 * @warning Регистрировать обработчики нужно до запуска остальных потоков
 * процесса: маска сигналов наследуется создаваемыми потоками.
 */
#pragma once

#include <signal.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace rld {

class SignalRouter {
 public:
  using Handler = std::function<void(int)>;  ///< Тип обработчика сигналов

  static SignalRouter& instance();

  SignalRouter(const SignalRouter&) = delete;
  SignalRouter& operator=(const SignalRouter&) = delete;

  /**
   * @brief Регистрирует обработчик сигнала
   * @param[in] signum Номер сигнала (SIGTERM, SIGINT, ...)
   * @param[in] handler Обработчик; несколько обработчиков вызываются по
   *            порядку регистрации
   * @throw std::invalid_argument Некорректный номер, SIGKILL или SIGSTOP
   * @throw std::system_error Ошибка sigprocmask/signalfd
   */
  void registerHandler(int signum, Handler handler);

  /// Удаляет все обработчики сигнала (сигнал остаётся заблокированным)
  void unregisterHandler(int signum);

  /// Запускает поток чтения signalfd; повторный вызов игнорируется
  void start();

  /// Останавливает поток чтения; безопасно вызывать из обработчика
  void stop() noexcept;

  bool isRunning() const noexcept { return running_.load(); }

 private:
  SignalRouter();
  ~SignalRouter();

  void processSignals();
  void dispatch(int signum);

  std::unordered_map<int, std::vector<Handler>> handlers_;
  std::mutex handlers_mutex_;
  std::atomic<bool> running_{false};
  std::thread worker_thread_;
  int signal_fd_ = -1;
  sigset_t original_mask_{};
  sigset_t blocked_mask_{};
};

}  // namespace rld
