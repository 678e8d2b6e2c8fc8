#pragma once

#include <stdexcept>
#include <string>

// Recoverable error categories surfaced by the engine
enum class ErrorCode {
    MalformedInventory,
    DuplicateHost,
    HostNotFound,
    UnknownOption,
    TypeMismatch,
    ConstraintViolation,
    MalformedConfig,
    PersistFailure,
    TargetBusy,
    LaunchFailed
};

const char* to_string(ErrorCode code);

class ReefError : public std::runtime_error {
public:
    ReefError(ErrorCode code, const std::string& message, const std::string& key = {});

    ErrorCode code() const noexcept { return code_; }

    // Offending key, host or target; empty when not applicable
    const std::string& key() const noexcept { return key_; }

private:
    ErrorCode code_;
    std::string key_;
};

// Malformed schema declaration: a programming error, fatal at startup
class SchemaDeclarationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};
