#ifndef LANLINK_CORE_RESULT_H
#define LANLINK_CORE_RESULT_H

#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>

#include "lanlink/core/compat.h"

namespace lanlink {

// Error codes reported by protocol-level operations
namespace ErrorCode {
constexpr int MalformedMessage = 1;
constexpr int NotConnected = 2;
constexpr int InvalidAddress = 3;
constexpr int NotStarted = 4;
constexpr int SendFailed = 5;
}  // namespace ErrorCode

struct Error {
  int code{0};
  std::string message;

  Error() = default;
  Error(int c, const std::string& m) : code(c), message(m) {}
};

// Result of an operation that either yields a value or an Error
template <typename T>
using Result = variant<T, Error>;

using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) {
  return VoidResult(error);
}

template <typename T>
Result<typename std::decay<T>::type> makeSuccess(T&& value) {
  return Result<typename std::decay<T>::type>(std::forward<T>(value));
}

template <typename T>
Result<T> makeError(const Error& error) {
  return Result<T>(error);
}

template <typename T>
Result<T> makeError(int code, const std::string& message) {
  return Result<T>(Error(code, message));
}

template <typename T>
bool isError(const Result<T>& result) {
  return holds_alternative<Error>(result);
}

template <typename T>
const Error* getError(const Result<T>& result) {
  return get_if<Error>(&result);
}

}  // namespace lanlink

#endif  // LANLINK_CORE_RESULT_H
