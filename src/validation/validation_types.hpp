#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace fluentcheck::events {
class IValidationObserver;
} // namespace fluentcheck::events

namespace fluentcheck::validation {

// Error code used when a check is attached without a business code.
inline constexpr std::string_view kNoErrorCode = "NO_ERROR_CODE";

// Message recorded when the subject of a validator is absent.
inline constexpr std::string_view kNullValueMessage = "value is null";

inline constexpr std::string_view kNullErrorCodeMessage =
    "The null value error code must not be null.";

struct ValidationError {
  std::string code;
  std::string message;

  bool hasCode() const { return code != kNoErrorCode; }

  bool operator==(const ValidationError &) const = default;
};

/**
 * @brief Construction settings of a validator.
 *
 * An empty nullValueCode is a programming error and is rejected when the
 * validator is created.
 */
struct ValidatorOptions {
  std::optional<std::string> nullValueCode = std::string(kNoErrorCode);
  bool fastValidate = false;
  events::IValidationObserver *observer = nullptr;
};

} // namespace fluentcheck::validation
