#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace excode {

enum class ErrorCode {
  InvalidArgument,  // bad command line or misuse of an API
  IoError,          // output or reserved-code file could not be used
  Stalled,          // --max-failures reached before a group filled up
  Internal,
};

constexpr std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::InvalidArgument:
      return "invalid argument";
    case ErrorCode::IoError:
      return "i/o error";
    case ErrorCode::Stalled:
      return "stalled";
    case ErrorCode::Internal:
      return "internal error";
  }
  return "unknown";
}

class Error : public std::exception {
 public:
  Error() = default;
  Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

  const char* what() const noexcept override { return message_.c_str(); }

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }

 private:
  ErrorCode code_{ErrorCode::Internal};
  std::string message_{};
};

}  // namespace excode
