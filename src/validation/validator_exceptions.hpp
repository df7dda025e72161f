#pragma once

#include <stdexcept>
#include <string>

namespace fluentcheck::validation {

/**
 * @brief Base of every error raised when the validator API is misused.
 *
 * These are never turned into validation failures: they signal a bug in
 * the calling code, not invalid input data.
 */
class ValidatorMisuseError : public std::logic_error {
public:
  explicit ValidatorMisuseError(const std::string &message);
};

// A validator was created with a null "value is null" error code.
class NullErrorCodeException : public ValidatorMisuseError {
public:
  NullErrorCodeException();
};

// onSuccess was called a second time on the same validator.
class DuplicateSuccessHandlerException : public ValidatorMisuseError {
public:
  DuplicateSuccessHandlerException();
};

// onFailure was called before any success handler was attached.
class MissingSuccessHandlerException : public ValidatorMisuseError {
public:
  MissingSuccessHandlerException();
};

} // namespace fluentcheck::validation
