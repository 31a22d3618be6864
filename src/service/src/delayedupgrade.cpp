/**
 * @file delayedupgrade.cpp
 * @brief Реализация реестра отложенных пакетов
 */

#include "../include/delayedupgrade.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "rld/compositelogger.hpp"

DelayedUpgradeCoalescer::DelayedUpgradeCoalescer(
    std::chrono::milliseconds window, FlushHandler handler)
    : window_(window), handler_(std::move(handler)) {
  if (!handler_) {
    throw std::invalid_argument("Delayed upgrade flush handler is empty");
  }
  if (window_.count() < 0) {
    throw std::invalid_argument("Delayed upgrade window must not be negative");
  }
}

DelayedUpgradeCoalescer::~DelayedUpgradeCoalescer() { shutdown(); }

DelayedUpgradeCoalescer::EnqueueResult DelayedUpgradeCoalescer::enqueue(
    std::shared_ptr<ResourceAdapter> adapter, const WorkloadItem &item,
    const ChangeConfig &config) {
  auto &logger = rld::CompositeLogger::instance();
  const std::string itemId = workloadIdentity(adapter->kind(), item);

  std::lock_guard<std::mutex> lock(mutex_);
  reapFinishedTimers();

  if (auto it = batches_.find(itemId); it != batches_.end()) {
    auto &batch = it->second;
    if (batch.state != BatchState::Pending) {
      logger.warning("Delayed upgrade for '" + itemId +
                     "' is already in progress, dropping change of '" +
                     config.resourceName + "'");
      return EnqueueResult::DroppedWhileFiring;
    }

    if (!batch.pendingConfigs.insert_or_assign(config.resourceName, config)
             .second) {
      logger.info("Config '" + config.resourceName +
                  "' is already part of the delayed upgrade for '" + itemId +
                  "', keeping latest hash");
      return EnqueueResult::Collapsed;
    }
    logger.info("Added config '" + config.resourceName +
                "' to the delayed upgrade for '" + itemId + "'");
    return EnqueueResult::Merged;
  }

  DelayedBatch batch;
  batch.itemId = itemId;
  batch.namespaceName = config.namespaceName;
  batch.pendingConfigs.emplace(config.resourceName, config);
  batch.fireAt = std::chrono::steady_clock::now() + window_;
  batch.adapter = std::move(adapter);
  batches_.emplace(itemId, std::move(batch));

  auto done = std::make_shared<std::atomic<bool>>(false);
  try {
    timers_.push_back(Timer{
        std::thread(&DelayedUpgradeCoalescer::runTimer, this, itemId, done),
        done});
  } catch (const std::system_error &e) {
    batches_.erase(itemId);
    throw std::runtime_error("Failed to start delayed upgrade timer for '" +
                             itemId + "': " + e.what());
  }

  logger.info("Creating new delayed upgrade for '" + itemId +
              "' for config '" + config.resourceName + "'");
  return EnqueueResult::Created;
}

void DelayedUpgradeCoalescer::runTimer(const std::string &itemId,
                                       std::shared_ptr<std::atomic<bool>> done) {
  auto &logger = rld::CompositeLogger::instance();
  FlushRequest request;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = batches_.find(itemId);
    if (it == batches_.end()) {
      *done = true;
      return;
    }
    const auto fireAt = it->second.fireAt;
    wakeup_.wait_until(lock, fireAt, [this] { return stopping_; });

    it = batches_.find(itemId);
    if (it == batches_.end()) {
      *done = true;
      return;
    }
    auto &batch = it->second;
    batch.state = BatchState::Firing;
    request.itemId = batch.itemId;
    request.namespaceName = batch.namespaceName;
    request.adapter = batch.adapter;
    for (const auto &[name, config] : batch.pendingConfigs) {
      request.configs.push_back(config);
    }
  }

  logger.info("Timer fired for delayed upgrade for '" + itemId + "' with " +
              std::to_string(request.configs.size()) + " config(s)");
  try {
    handler_(request);
  } catch (const std::exception &e) {
    logger.error("Delayed upgrade for '" + itemId + "' failed: " + e.what());
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    batches_.erase(itemId);
  }
  *done = true;
}

void DelayedUpgradeCoalescer::reapFinishedTimers() {
  auto finished = std::partition(
      timers_.begin(), timers_.end(),
      [](const Timer &timer) { return !timer.done->load(); });
  for (auto it = finished; it != timers_.end(); ++it) {
    if (it->thread.joinable()) it->thread.join();
  }
  timers_.erase(finished, timers_.end());
}

void DelayedUpgradeCoalescer::shutdown() {
  std::vector<Timer> timers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    timers.swap(timers_);
  }
  wakeup_.notify_all();

  for (auto &timer : timers) {
    if (timer.thread.joinable()) timer.thread.join();
  }
}

std::size_t DelayedUpgradeCoalescer::batchCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return batches_.size();
}

std::optional<DelayedUpgradeCoalescer::BatchState>
DelayedUpgradeCoalescer::state(const std::string &itemId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = batches_.find(itemId);
  if (it == batches_.end()) return std::nullopt;
  return it->second.state;
}

std::string toString(DelayedUpgradeCoalescer::EnqueueResult result) {
  using Result = DelayedUpgradeCoalescer::EnqueueResult;
  switch (result) {
    case Result::Created:
      return "Created";
    case Result::Merged:
      return "Merged";
    case Result::Collapsed:
      return "Collapsed";
    case Result::DroppedWhileFiring:
      return "DroppedWhileFiring";
  }
  return "Unknown";
}
