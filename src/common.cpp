#include "pxid/common.hpp"

#include <sstream>

namespace pxid {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kMachineIdUnavailable:
      return "Machine ID unavailable";
    case ErrorCode::kProcessIdUnavailable:
      return "Process ID unavailable";
    case ErrorCode::kPrefixTooLong:
      return "Prefix too long";
    case ErrorCode::kInvalidPrefixEncoding:
      return "Invalid prefix encoding";
    case ErrorCode::kInvalidLength:
      return "Invalid length";
    case ErrorCode::kInvalidCharacter:
      return "Invalid character";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

bool isIdentityError(ErrorCode code) noexcept {
  return code == ErrorCode::kMachineIdUnavailable ||
         code == ErrorCode::kProcessIdUnavailable;
}

bool isDecodeError(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kInvalidLength:
    case ErrorCode::kInvalidCharacter:
    case ErrorCode::kPrefixTooLong:
    case ErrorCode::kInvalidPrefixEncoding:
      return true;
    default:
      return false;
  }
}

std::string Error::describe() const {
  std::ostringstream oss;
  oss << errorCodeToString(code_) << ": " << message_;
  return oss.str();
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef PXID_VERSION_MAJOR
  return Version{PXID_VERSION_MAJOR, PXID_VERSION_MINOR, PXID_VERSION_PATCH, ""};
#else
  return Version{1, 0, 0, "dev"};
#endif
}

}  // namespace pxid
