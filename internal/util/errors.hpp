#pragma once

#include <stdexcept>
#include <string>

namespace acp::util {

/*
  Central error types.

  Raised by the core, translated later to gRPC status codes.
  Every one of them aborts the enclosing ledger operation.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unauthorized : public std::runtime_error {
 public:
  explicit Unauthorized(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PreconditionFailed : public std::runtime_error {
 public:
  explicit PreconditionFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Token pull or push returned false (balance or allowance too low).
class CustodyTransferFailed : public std::runtime_error {
 public:
  explicit CustodyTransferFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace acp::util
