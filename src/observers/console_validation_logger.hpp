#pragma once

#include "events/validation_events.hpp"

#include <iostream>
#include <ostream>
#include <string>
#include <utility>

namespace fluentcheck::observers {

/**
 * @brief Writes validation events as single lines on the console.
 *
 * Failures go to the error stream, successful evaluations to the output
 * stream when Config::logSuccess is set.
 */
class ConsoleValidationLogger : public events::IValidationObserver {
public:
  struct Config {
    std::string tag = "validation";
    bool logSuccess = false;
  };

  ConsoleValidationLogger() = default;
  explicit ConsoleValidationLogger(Config config,
                                   std::ostream &out = std::cout,
                                   std::ostream &err = std::cerr)
      : config_(std::move(config)), out_(&out), err_(&err) {}

  void onCheckFailed(const events::CheckFailedEvent &event) noexcept override;
  void onValidationCompleted(
      const events::ValidationCompletedEvent &event) noexcept override;

private:
  Config config_;
  std::ostream *out_ = &std::cout;
  std::ostream *err_ = &std::cerr;
};

} // namespace fluentcheck::observers
