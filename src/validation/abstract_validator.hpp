#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "events/validation_events.hpp"
#include "validation/absent_value.hpp"
#include "validation/validation_types.hpp"
#include "validation/validator_exceptions.hpp"

namespace fluentcheck::validation {

/**
 * @brief Validity state shared by every concrete validator.
 *
 * Holds the subject, the fail-fast policy and a single error slot. Each
 * check returns the concrete validator (Derived) so that checks can be
 * chained. A failure is never undone: later failures only overwrite the
 * recorded error, and only when fast validation is off.
 *
 * A validator is meant to be built, evaluated and dropped within one call
 * on one thread. It does no locking.
 *
 * @tparam T The type of the validated value.
 * @tparam Derived The concrete validator type returned by the checks.
 */
template <typename T, typename Derived> class AbstractValidator {
public:
  /**
   * @brief Fails when the value derived by @p mapper is absent.
   * @param mapper Extracts a property from the value; not called when the
   * value itself is absent.
   * @param errorMsg Message recorded on failure.
   * @param errorCode Code recorded on failure.
   * @return The validator, for chaining.
   */
  template <typename Mapper>
  Derived &notNull(Mapper &&mapper, std::string_view errorMsg,
                   std::string_view errorCode = kNoErrorCode) {
    beginCheck();
    if (keepValidating() && !isAbsent(value_) &&
        isAbsent(std::invoke(std::forward<Mapper>(mapper),
                             std::as_const(value_)))) {
      setError(errorCode, errorMsg);
    }
    return self();
  }

  /**
   * @brief Fails when @p predicate holds.
   *
   * The predicate describes the failing condition, not the passing one.
   */
  template <typename Predicate>
  Derived &on(Predicate &&predicate, std::string_view errorMsg,
              std::string_view errorCode = kNoErrorCode) {
    beginCheck();
    if (keepValidating() && !isAbsent(value_) &&
        std::invoke(std::forward<Predicate>(predicate),
                    std::as_const(value_))) {
      setError(errorCode, errorMsg);
    }
    return self();
  }

  /**
   * @brief Fails when both @p condition and @p predicate hold.
   *
   * The predicate is only evaluated when the condition holds, which lets a
   * check be skipped when it does not apply to the value.
   */
  template <typename Predicate, typename Condition>
  Derived &onIf(Predicate &&predicate, std::string_view errorMsg,
                Condition &&condition) {
    return onIf(std::forward<Predicate>(predicate), errorMsg, kNoErrorCode,
                std::forward<Condition>(condition));
  }

  template <typename Predicate, typename Condition>
  Derived &onIf(Predicate &&predicate, std::string_view errorMsg,
                std::string_view errorCode, Condition &&condition) {
    beginCheck();
    if (keepValidating() && !isAbsent(value_) &&
        std::invoke(std::forward<Condition>(condition),
                    std::as_const(value_)) &&
        std::invoke(std::forward<Predicate>(predicate),
                    std::as_const(value_))) {
      setError(errorCode, errorMsg);
    }
    return self();
  }

protected:
  AbstractValidator(T value, std::string nullValueCode, bool fastValidate,
                    events::IValidationObserver *observer)
      : value_(std::move(value)), nullValueCode_(std::move(nullValueCode)),
        fastValidate_(fastValidate), observer_(observer) {}

  // Rejects a null "value is null" error code before any validator exists.
  static std::string
  requireNullValueCode(std::optional<std::string> nullValueCode) {
    if (!nullValueCode) {
      throw NullErrorCodeException();
    }
    return std::move(*nullValueCode);
  }

  // Records the null failure once when the value is absent.
  void checkValue() {
    if (isValid() && isAbsent(value_)) {
      setError(nullValueCode_, kNullValueMessage);
    }
  }

  bool keepValidating() const { return !fastValidate_ || isValid(); }

  // Last writer wins.
  void setError(std::string_view code, std::string_view message) {
    error_ = ValidationError{std::string(code), std::string(message)};
    if (observer_ != nullptr) {
      observer_->onCheckFailed({.checkIndex = checkCount_,
                                .code = error_->code,
                                .message = error_->message});
    }
  }

  bool isValid() const { return !error_.has_value(); }

  const std::string &getErrMsg() const {
    static const std::string kEmpty;
    return error_ ? error_->message : kEmpty;
  }

  const std::string &getErrCode() const {
    static const std::string kEmpty;
    return error_ ? error_->code : kEmpty;
  }

  const std::optional<ValidationError> &error() const { return error_; }

  void notifyCompleted() {
    if (observer_ != nullptr) {
      observer_->onValidationCompleted({.valid = isValid(), .error = error_});
    }
  }

  const T &value() const { return value_; }

private:
  void beginCheck() {
    ++checkCount_;
    checkValue();
  }

  Derived &self() { return static_cast<Derived &>(*this); }

  T value_;
  std::string nullValueCode_;
  bool fastValidate_;
  events::IValidationObserver *observer_;
  std::optional<ValidationError> error_;
  std::size_t checkCount_ = 0;
};

} // namespace fluentcheck::validation
