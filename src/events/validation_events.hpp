#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "validation/validation_types.hpp"

namespace fluentcheck::events {

// Emitted every time a check records a failure, including the automatic
// "value is null" failure. Under run-all validation one validator may emit
// several of these; only the last one is kept as its error.
struct CheckFailedEvent {
  std::size_t checkIndex;
  std::string code;
  std::string message;
};

// Emitted once per terminal evaluation.
struct ValidationCompletedEvent {
  bool valid;
  std::optional<validation::ValidationError> error;
};

class IValidationObserver {
public:
  virtual ~IValidationObserver() = default;

  virtual void onCheckFailed(const CheckFailedEvent &event) noexcept = 0;
  virtual void
  onValidationCompleted(const ValidationCompletedEvent &event) noexcept = 0;
};

} // namespace fluentcheck::events
