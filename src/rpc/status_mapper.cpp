#include "rpc/status_mapper.hpp"

namespace fluentcheck::rpc {

grpc::StatusCode StatusMapper::toStatusCode(std::string_view errorCode) const {
  if (errorCode == validation::kNoErrorCode) {
    return config_.fallback;
  }

  const auto it = config_.codes.find(std::string(errorCode));
  if (it == config_.codes.end()) {
    return config_.fallback;
  }
  return it->second;
}

grpc::Status
StatusMapper::toStatus(const validation::ValidationError &error) const {
  return grpc::Status(toStatusCode(error.code), error.message);
}

} // namespace fluentcheck::rpc
