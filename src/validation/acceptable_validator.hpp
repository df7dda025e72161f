#pragma once

#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "validation/abstract_validator.hpp"

namespace fluentcheck::validation {

/**
 * @brief Validator that consumes the value instead of mapping it.
 *
 * Same checks and construction rules as AppliableValidator, but the
 * success and failure handlers return nothing. onFailure() runs exactly
 * one of them.
 */
template <typename T>
class AcceptableValidator
    : public AbstractValidator<T, AcceptableValidator<T>> {
  using Base = AbstractValidator<T, AcceptableValidator<T>>;

public:
  using SuccessConsumer = std::function<void(const T &)>;

  static AcceptableValidator create(T value) {
    return create(std::move(value), false);
  }

  static AcceptableValidator create(T value, bool fastValidate) {
    return create(std::move(value), std::string(kNoErrorCode), fastValidate);
  }

  // A lone error code would otherwise convert to the fastValidate flag.
  static AcceptableValidator create(T value,
                                    const char *nullValueCode) = delete;

  static AcceptableValidator create(T value,
                                    std::optional<std::string> nullValueCode,
                                    bool fastValidate) {
    return create(std::move(value),
                  ValidatorOptions{.nullValueCode = std::move(nullValueCode),
                                   .fastValidate = fastValidate});
  }

  static AcceptableValidator create(T value, ValidatorOptions options) {
    return AcceptableValidator(
        std::move(value),
        Base::requireNullValueCode(std::move(options.nullValueCode)),
        options.fastValidate, options.observer);
  }

  AcceptableValidator &onSuccess(SuccessConsumer successConsumer) {
    if (successConsumer_) {
      throw DuplicateSuccessHandlerException();
    }
    successConsumer_ = std::move(successConsumer);
    return *this;
  }

  template <typename ErrorConsumer>
  void onFailure(ErrorConsumer &&errorConsumer) {
    if (!successConsumer_) {
      throw MissingSuccessHandlerException();
    }
    this->checkValue();
    this->notifyCompleted();
    if (this->isValid()) {
      successConsumer_(this->value());
    } else if constexpr (std::is_invocable_v<ErrorConsumer, const T &,
                                             const std::string &>) {
      std::invoke(std::forward<ErrorConsumer>(errorConsumer), this->value(),
                  this->getErrMsg());
    } else {
      std::invoke(std::forward<ErrorConsumer>(errorConsumer), this->value(),
                  *this->error());
    }
  }

private:
  AcceptableValidator(T value, std::string nullValueCode, bool fastValidate,
                      events::IValidationObserver *observer)
      : Base(std::move(value), std::move(nullValueCode), fastValidate,
             observer) {}

  SuccessConsumer successConsumer_;
};

} // namespace fluentcheck::validation
