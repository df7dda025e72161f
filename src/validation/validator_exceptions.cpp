#include "validation/validator_exceptions.hpp"

#include "validation/validation_types.hpp"

namespace fluentcheck::validation {

ValidatorMisuseError::ValidatorMisuseError(const std::string &message)
    : std::logic_error(message) {}

NullErrorCodeException::NullErrorCodeException()
    : ValidatorMisuseError(std::string(kNullErrorCodeMessage)) {}

DuplicateSuccessHandlerException::DuplicateSuccessHandlerException()
    : ValidatorMisuseError("The success handler must be unique.") {}

MissingSuccessHandlerException::MissingSuccessHandlerException()
    : ValidatorMisuseError("The success handler must not be null.") {}

} // namespace fluentcheck::validation
