#include "ReefError.hpp"

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::MalformedInventory:  return "MalformedInventory";
        case ErrorCode::DuplicateHost:       return "DuplicateHost";
        case ErrorCode::HostNotFound:        return "HostNotFound";
        case ErrorCode::UnknownOption:       return "UnknownOption";
        case ErrorCode::TypeMismatch:        return "TypeMismatch";
        case ErrorCode::ConstraintViolation: return "ConstraintViolation";
        case ErrorCode::MalformedConfig:     return "MalformedConfig";
        case ErrorCode::PersistFailure:      return "PersistFailure";
        case ErrorCode::TargetBusy:          return "TargetBusy";
        case ErrorCode::LaunchFailed:        return "LaunchFailed";
        default:                             return "Unknown";
    }
}

ReefError::ReefError(ErrorCode code, const std::string& message, const std::string& key)
    : std::runtime_error(std::string(to_string(code)) + ": " + message),
      code_(code),
      key_(key) {
}
