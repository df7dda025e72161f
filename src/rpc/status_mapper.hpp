#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <grpcpp/grpcpp.h>

#include "validation/validation_types.hpp"

namespace fluentcheck::rpc {

/**
 * @brief Maps recorded validation errors onto gRPC statuses.
 *
 * Lets a validation chain end an RPC handler directly:
 *
 * @code
 * return AppliableValidator<Request, grpc::Status>::create(request)
 *     .on(...)
 *     .onSuccess(handle)
 *     .onFailure(mapper.failureHandler<Request>());
 * @endcode
 */
class StatusMapper {
public:
  struct Config {
    // Business error code -> status code.
    std::unordered_map<std::string, grpc::StatusCode> codes;
    // Used for unknown codes and for checks without a code.
    grpc::StatusCode fallback = grpc::StatusCode::INVALID_ARGUMENT;
  };

  StatusMapper() = default;
  explicit StatusMapper(Config config) : config_(std::move(config)) {}

  grpc::StatusCode toStatusCode(std::string_view errorCode) const;

  grpc::Status toStatus(const validation::ValidationError &error) const;

  // Failure handler for AppliableValidator<T, grpc::Status>. The mapper must
  // outlive the evaluation of the chain.
  template <typename T> auto failureHandler() const {
    return [this](const T &, const validation::ValidationError &error) {
      return toStatus(error);
    };
  }

private:
  Config config_;
};

} // namespace fluentcheck::rpc
