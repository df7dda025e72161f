#include "observers/console_validation_logger.hpp"

#include <exception>
#include <string>

namespace fluentcheck::observers {

namespace {

std::string describe(const std::string &code, const std::string &message) {
  if (code == validation::kNoErrorCode) {
    return message;
  }
  return message + " (" + code + ")";
}

// Last resort when the configured stream rejects a line. std::cerr keeps its
// default exception mask, so this write cannot throw.
void reportLoggingFailure(const std::exception &ex) noexcept {
  std::cerr << "Validation logger failed to write: " << ex.what()
            << std::endl;
}

} // namespace

void ConsoleValidationLogger::onCheckFailed(
    const events::CheckFailedEvent &event) noexcept {
  try {
    *err_ << "[" << config_.tag << "] check #" << event.checkIndex
          << " failed: " << describe(event.code, event.message) << std::endl;
  } catch (const std::exception &ex) {
    reportLoggingFailure(ex);
  }
}

void ConsoleValidationLogger::onValidationCompleted(
    const events::ValidationCompletedEvent &event) noexcept {
  try {
    if (event.valid || !event.error) {
      if (config_.logSuccess) {
        *out_ << "[" << config_.tag << "] validation passed" << std::endl;
      }
      return;
    }

    *err_ << "[" << config_.tag << "] validation failed: "
          << describe(event.error->code, event.error->message) << std::endl;
  } catch (const std::exception &ex) {
    reportLoggingFailure(ex);
  }
}

} // namespace fluentcheck::observers
