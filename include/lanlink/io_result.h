#ifndef LANLINK_IO_RESULT_H
#define LANLINK_IO_RESULT_H

#include <cstddef>
#include <cstring>
#include <string>
#include <utility>

#include "lanlink/core/compat.h"

namespace lanlink {

// errno captured from a failed socket call, with its strerror text
struct SystemError {
  int error_code;
  std::string message;
};

namespace detail {

template <typename Derived>
class IoStatus {
 public:
  static Derived error(int code, const std::string& msg = "") {
    Derived result;
    result.error_info = SystemError{code, msg};
    return result;
  }
  static Derived from_errno(int err) { return error(err, std::strerror(err)); }

  int error_code() const { return error_info ? error_info->error_code : 0; }
  std::string error_message() const {
    return error_info ? error_info->message : std::string();
  }

  optional<SystemError> error_info;
};

}  // namespace detail

/**
 * Outcome of a socket system call. Socket code reports failures through
 * these values rather than exceptions; callers check ok() before reading
 * the value.
 */
template <typename T>
struct IoResult : detail::IoStatus<IoResult<T>> {
  optional<T> value;

  bool ok() const { return value.has_value(); }
  const T& operator*() const { return *value; }

  static IoResult success(T val) {
    IoResult result;
    result.value = std::move(val);
    return result;
  }
};

// No value; success is the absence of an error
template <>
struct IoResult<std::nullptr_t> : detail::IoStatus<IoResult<std::nullptr_t>> {
  bool ok() const { return !error_info.has_value(); }

  static IoResult success() { return IoResult(); }
};

using IoCallResult = IoResult<size_t>;     // bytes transferred
using IoVoidResult = IoResult<std::nullptr_t>;

}  // namespace lanlink

#endif  // LANLINK_IO_RESULT_H
