#pragma once

#include "events/validation_events.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace fluentcheck::events {

/**
 * @brief Observer that forwards each validation event to many observers.
 *
 * One dispatcher can be handed to any number of validators, on any thread.
 * Observers are notified in registration order, outside the internal lock,
 * so an observer may itself run a validator wired to this dispatcher or
 * register further observers.
 */
class ValidationEventDispatcher : public IValidationObserver {
public:
  ValidationEventDispatcher() = default;
  ~ValidationEventDispatcher() override = default;

  // Validators hold a plain pointer to the dispatcher
  ValidationEventDispatcher(const ValidationEventDispatcher &) = delete;
  ValidationEventDispatcher &
  operator=(const ValidationEventDispatcher &) = delete;
  ValidationEventDispatcher(ValidationEventDispatcher &&) = delete;
  ValidationEventDispatcher &operator=(ValidationEventDispatcher &&) = delete;

  // Expired observers are skipped when an event is forwarded.
  void registerObserver(std::weak_ptr<IValidationObserver> observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
  }

  void onCheckFailed(const CheckFailedEvent &event) noexcept override {
    try {
      for (const auto &observer : liveObservers()) {
        observer->onCheckFailed(event);
      }
    } catch (const std::exception &ex) {
      std::cerr << "Failed to dispatch check failure: " << ex.what()
                << std::endl;
    }
  }

  void onValidationCompleted(
      const ValidationCompletedEvent &event) noexcept override {
    try {
      for (const auto &observer : liveObservers()) {
        observer->onValidationCompleted(event);
      }
    } catch (const std::exception &ex) {
      std::cerr << "Failed to dispatch validation result: " << ex.what()
                << std::endl;
    }
  }

private:
  std::vector<std::shared_ptr<IValidationObserver>> liveObservers() {
    std::vector<std::shared_ptr<IValidationObserver>> live;
    std::lock_guard<std::mutex> lock(mutex_);
    live.reserve(observers_.size());
    for (const auto &weakObserver : observers_) {
      if (auto observer = weakObserver.lock()) {
        live.push_back(std::move(observer));
      }
    }
    return live;
  }

  std::mutex mutex_;
  std::vector<std::weak_ptr<IValidationObserver>> observers_;
};

} // namespace fluentcheck::events
