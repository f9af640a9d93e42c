#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace acp::service {

inline bool IsCallerError(const std::exception& ex) {
  return dynamic_cast<const util::InvalidArgument*>(&ex) || dynamic_cast<const util::NotFound*>(&ex) ||
         dynamic_cast<const util::Unauthorized*>(&ex) || dynamic_cast<const util::InvalidState*>(&ex) ||
         dynamic_cast<const util::PreconditionFailed*>(&ex) || dynamic_cast<const util::CustodyTransferFailed*>(&ex);
}

/*
  Runs one service call, logging failures with route, caller and
  latency. Exceptions are rethrown unchanged for the transport layer.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view caller, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    return fn();
  } catch (const std::exception& ex) {
    const auto elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();
    if (IsCallerError(ex)) {
      ACP_LOG_WARN("RPC rejected", {observability::StringField("route", route), observability::StringField("caller", caller),
                                    observability::StringField("error", ex.what()), observability::IntField("latency_ms", elapsed_ms)});
    } else {
      ACP_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("caller", caller),
                                   observability::StringField("error", ex.what()), observability::IntField("latency_ms", elapsed_ms)});
    }
    throw;
  }
}

} // namespace acp::service
