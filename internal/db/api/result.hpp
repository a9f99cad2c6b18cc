#pragma once

#include <string>
#include <string_view>

namespace danmaku::db {

/*
  Backend-neutral outcome of one store statement.

  LifecycleStore implementations log these; nothing above the store sees
  sqlite return codes.
*/
enum class ErrorCode {
  OK = 0,
  Busy,
  ConstraintViolation,
  IOError,
  Corruption,
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      break;
  }
  return "internal_error";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  // Busy is the only code worth retrying; the store does not retry itself.
  bool IsTransient() const {
    return code == ErrorCode::Busy;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace danmaku::db
