#include "rld/SignalRouter.hpp"

#include <poll.h>
#include <pthread.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cerrno>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace rld {

SignalRouter& SignalRouter::instance() {
  static SignalRouter router;
  return router;
}

SignalRouter::SignalRouter() {
  sigemptyset(&blocked_mask_);
  if (int rc = pthread_sigmask(SIG_SETMASK, nullptr, &original_mask_);
      rc != 0) {
    throw std::system_error(rc, std::system_category(),
                            "pthread_sigmask(GET) failed");
  }
  signal_fd_ = signalfd(-1, &blocked_mask_, SFD_NONBLOCK | SFD_CLOEXEC);
  if (signal_fd_ == -1) {
    throw std::system_error(errno, std::system_category(),
                            "signalfd create failed");
  }
}

SignalRouter::~SignalRouter() {
  stop();
  if (signal_fd_ != -1) close(signal_fd_);
  pthread_sigmask(SIG_SETMASK, &original_mask_, nullptr);
}

void SignalRouter::registerHandler(int signum, Handler handler) {
  if (signum <= 0 || signum >= NSIG || signum == SIGKILL ||
      signum == SIGSTOP) {
    throw std::invalid_argument("Invalid signal number: " +
                                std::to_string(signum));
  }
  if (!handler) {
    throw std::invalid_argument("Signal handler cannot be empty");
  }

  std::lock_guard lock(handlers_mutex_);

  sigaddset(&blocked_mask_, signum);
  if (int rc = pthread_sigmask(SIG_BLOCK, &blocked_mask_, nullptr);
      rc != 0) {
    throw std::system_error(rc, std::system_category(),
                            "pthread_sigmask(BLOCK) failed");
  }
  if (signalfd(signal_fd_, &blocked_mask_, 0) == -1) {
    throw std::system_error(errno, std::system_category(),
                            "signalfd configure failed");
  }

  handlers_[signum].push_back(std::move(handler));
}

void SignalRouter::unregisterHandler(int signum) {
  std::lock_guard lock(handlers_mutex_);
  handlers_.erase(signum);
}

void SignalRouter::start() {
  if (running_.exchange(true)) return;
  worker_thread_ = std::thread(&SignalRouter::processSignals, this);
}

void SignalRouter::stop() noexcept {
  running_ = false;
  if (worker_thread_.joinable() &&
      worker_thread_.get_id() != std::this_thread::get_id()) {
    worker_thread_.join();
  }
}

void SignalRouter::processSignals() {
  pollfd pfd{};
  pfd.fd = signal_fd_;
  pfd.events = POLLIN;

  while (running_) {
    int ready = poll(&pfd, 1, 200);
    if (ready <= 0) continue;  // таймаут или EINTR

    signalfd_siginfo info{};
    while (read(signal_fd_, &info, sizeof(info)) ==
           static_cast<ssize_t>(sizeof(info))) {
      dispatch(static_cast<int>(info.ssi_signo));
    }
  }
}

void SignalRouter::dispatch(int signum) {
  std::vector<Handler> handlers;
  {
    std::lock_guard lock(handlers_mutex_);
    if (auto it = handlers_.find(signum); it != handlers_.end()) {
      handlers = it->second;
    }
  }
  for (auto& handler : handlers) {
    try {
      handler(signum);
    } catch (const std::exception& e) {
      std::cerr << "SignalRouter: handler for signal " << signum
                << " failed: " << e.what() << std::endl;
    }
  }
}

}  // namespace rld
