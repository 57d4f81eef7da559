#include "toastkit/utils/ErrorHandling.hh"
#include "toastkit/core/Log.hh"

namespace toastkit {

ToastkitException::ToastkitException(const std::string &message)
    : message(message) {}

const char *ToastkitException::what() const noexcept { return message.c_str(); }

void throwError(const std::string &message) {
  TOASTKIT_LOG_ERROR("ToastkitException: {}", message);
  throw ToastkitException(message);
}

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::Internal:
    return "Internal";
  }
  return "Unknown";
}

} // namespace toastkit
