#include "core/result.hpp"

namespace ledger {
namespace core {

std::string toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::VALIDATION_FAILED: return "ValidationFailed";
    case ErrorCode::NOT_FOUND: return "NotFound";
    case ErrorCode::CONFLICT: return "Conflict";
    case ErrorCode::INVALID_STATE: return "InvalidState";
    case ErrorCode::INTERNAL_FAILURE: return "InternalFailure";
  }
  return "Unknown";
}

Error Error::validationFailed(std::vector<Violation> violations) {
  Error error;
  error.code = ErrorCode::VALIDATION_FAILED;
  error.message = violations.empty() ? "Validation failed" : violations.front().message;
  error.violations = std::move(violations);
  return error;
}

Error Error::notFound(const std::string& message) {
  return Error{ErrorCode::NOT_FOUND, message, {}};
}

Error Error::conflict(const std::string& message) {
  return Error{ErrorCode::CONFLICT, message, {}};
}

Error Error::invalidState(const std::string& message) {
  return Error{ErrorCode::INVALID_STATE, message, {}};
}

Error Error::internalFailure(const std::string& message) {
  return Error{ErrorCode::INTERNAL_FAILURE, message, {}};
}

}  // namespace core
}  // namespace ledger
