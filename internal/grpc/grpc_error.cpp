#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace acp::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace acp::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const Unauthorized*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const PreconditionFailed*>(&e)) {
    return {::grpc::StatusCode::OUT_OF_RANGE, e.what()};
  }
  if (dynamic_cast<const CustodyTransferFailed*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace acp::grpc
