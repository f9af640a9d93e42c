#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace acp::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

// Runs a service call and maps any exception it throws to a status.
template <typename Fn>
::grpc::Status Dispatch(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace acp::grpc
