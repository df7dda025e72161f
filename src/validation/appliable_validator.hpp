#pragma once

#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "validation/abstract_validator.hpp"

namespace fluentcheck::validation {

/**
 * @brief Validator whose evaluation produces a value of type U.
 *
 * A success handler must be attached with onSuccess() before the chain is
 * evaluated by onFailure(). Exactly one of the two handlers runs and its
 * result is the result of the chain:
 *
 * @code
 * const int doubled = AppliableValidator<int, int>::create(42)
 *                         .on([](int v) { return v < 0; },
 *                             "must be non-negative")
 *                         .onSuccess([](int v) { return v * 2; })
 *                         .onFailure([](int, const std::string &) {
 *                           return -1;
 *                         });
 * @endcode
 *
 * @tparam T The type of the validated value.
 * @tparam U The result type of the success and failure handlers.
 */
template <typename T, typename U>
class AppliableValidator
    : public AbstractValidator<T, AppliableValidator<T, U>> {
  using Base = AbstractValidator<T, AppliableValidator<T, U>>;

public:
  using SuccessHandler = std::function<U(const T &)>;

  static AppliableValidator create(T value) {
    return create(std::move(value), false);
  }

  static AppliableValidator create(T value, bool fastValidate) {
    return create(std::move(value), std::string(kNoErrorCode), fastValidate);
  }

  // A lone error code would otherwise convert to the fastValidate flag.
  static AppliableValidator create(T value,
                                   const char *nullValueCode) = delete;

  /**
   * @throws NullErrorCodeException when @p nullValueCode is empty.
   */
  static AppliableValidator create(T value,
                                   std::optional<std::string> nullValueCode,
                                   bool fastValidate) {
    return create(std::move(value),
                  ValidatorOptions{.nullValueCode = std::move(nullValueCode),
                                   .fastValidate = fastValidate});
  }

  static AppliableValidator create(T value, ValidatorOptions options) {
    return AppliableValidator(
        std::move(value),
        Base::requireNullValueCode(std::move(options.nullValueCode)),
        options.fastValidate, options.observer);
  }

  /**
   * @brief Sets the handler that maps a valid value to the result.
   * @throws DuplicateSuccessHandlerException if a handler is already set.
   */
  AppliableValidator &onSuccess(SuccessHandler successHandler) {
    if (successHandler_) {
      throw DuplicateSuccessHandlerException();
    }
    successHandler_ = std::move(successHandler);
    return *this;
  }

  /**
   * @brief Evaluates the chain.
   *
   * @param errorHandler Called with the value and the recorded error
   * message, or with the value and the whole ValidationError when it
   * accepts one, if the value is not valid.
   * @return The result of whichever handler ran.
   * @throws MissingSuccessHandlerException if onSuccess() was never called.
   */
  template <typename ErrorHandler> U onFailure(ErrorHandler &&errorHandler) {
    if (!successHandler_) {
      throw MissingSuccessHandlerException();
    }
    this->checkValue();
    this->notifyCompleted();
    if (this->isValid()) {
      return successHandler_(this->value());
    }
    if constexpr (std::is_invocable_v<ErrorHandler, const T &,
                                      const std::string &>) {
      return std::invoke(std::forward<ErrorHandler>(errorHandler),
                         this->value(), this->getErrMsg());
    } else {
      return std::invoke(std::forward<ErrorHandler>(errorHandler),
                         this->value(), *this->error());
    }
  }

private:
  AppliableValidator(T value, std::string nullValueCode, bool fastValidate,
                     events::IValidationObserver *observer)
      : Base(std::move(value), std::move(nullValueCode), fastValidate,
             observer) {}

  SuccessHandler successHandler_;
};

} // namespace fluentcheck::validation
