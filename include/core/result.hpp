#ifndef CORE_RESULT_HPP_
#define CORE_RESULT_HPP_

#include "core/validation.hpp"

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ledger {
namespace core {

/**
 * Failure taxonomy returned by every ledger operation.
 */
enum class ErrorCode {
  VALIDATION_FAILED,
  NOT_FOUND,
  CONFLICT,
  INVALID_STATE,
  INTERNAL_FAILURE
};

std::string toString(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::INTERNAL_FAILURE;
  std::string message;
  // Populated for VALIDATION_FAILED only.
  std::vector<Violation> violations;

  static Error validationFailed(std::vector<Violation> violations);
  static Error notFound(const std::string& message = "Account not found");
  static Error conflict(const std::string& message);
  static Error invalidState(const std::string& message);
  static Error internalFailure(const std::string& message = "Internal failure");
};

/**
 * Either a value or an Error. There is no default value: a Result is always
 * built from one or the other.
 */
template <typename T>
class Result {
 public:
  Result(T value) : state_(std::move(value)) {}
  Result(Error error) : state_(std::move(error)) {}

  bool ok() const { return std::holds_alternative<T>(state_); }
  explicit operator bool() const { return ok(); }

  const T& value() const& { return std::get<T>(state_); }
  T& value() & { return std::get<T>(state_); }
  T&& value() && { return std::get<T>(std::move(state_)); }

  const Error& error() const { return std::get<Error>(state_); }

  const T& operator*() const& { return value(); }
  const T* operator->() const { return &value(); }

 private:
  std::variant<T, Error> state_;
};

}  // namespace core
}  // namespace ledger

#endif  // CORE_RESULT_HPP_
