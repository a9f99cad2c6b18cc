#pragma once

#include <stdexcept>
#include <string>

namespace danmaku::util {

/*
  Central error types.

  ApiError and its subclasses are raised by the API client only; the
  submission orchestrator translates them into classified results.
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

class ApiError : public std::runtime_error {
 public:
  ApiError(int code, const std::string& msg, bool is_network_error = false)
      : std::runtime_error("provider error [code " + std::to_string(code) + "]: " + msg),
        code_(code),
        message_(msg),
        is_network_error_(is_network_error) {
  }

  int Code() const {
    return code_;
  }

  const std::string& Message() const {
    return message_;
  }

  bool IsNetworkError() const {
    return is_network_error_;
  }

 private:
  int         code_;
  std::string message_;
  bool        is_network_error_;
};

// Synthetic codes reserved for transport failures. Must match the classifier table.
inline constexpr int kParseErrorCode      = -9994;
inline constexpr int kHttpErrorCode       = -9995;
inline constexpr int kConnectionErrorCode = -9996;
inline constexpr int kTimeoutErrorCode    = -9997;
inline constexpr int kUnknownErrorCode    = -9998;
inline constexpr int kNetworkErrorCode    = -9999;

class TimeoutError : public ApiError {
 public:
  explicit TimeoutError(const std::string& msg) : ApiError(kTimeoutErrorCode, msg, true) {
  }
};

class ConnectionError : public ApiError {
 public:
  explicit ConnectionError(const std::string& msg) : ApiError(kConnectionErrorCode, msg, true) {
  }
};

class HttpError : public ApiError {
 public:
  HttpError(long status, const std::string& msg) : ApiError(kHttpErrorCode, msg, true), status_(status) {
  }

  long Status() const {
    return status_;
  }

 private:
  long status_;
};

class RequestError : public ApiError {
 public:
  explicit RequestError(const std::string& msg) : ApiError(kNetworkErrorCode, msg, true) {
  }
};

class ResponseParseError : public ApiError {
 public:
  explicit ResponseParseError(const std::string& msg) : ApiError(kParseErrorCode, msg, false) {
  }
};

} // namespace danmaku::util
