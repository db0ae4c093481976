#pragma once

#include <stdexcept>
#include <string>

namespace audit_gate {

class AuditGateError : public std::runtime_error {
public:
    explicit AuditGateError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public AuditGateError {
public:
    explicit ConfigError(const std::string& message)
        : AuditGateError("Config error: " + message) {}
};

class ValidationError : public AuditGateError {
public:
    explicit ValidationError(const std::string& message)
        : AuditGateError("Validation error: " + message) {}
};

class IOError : public AuditGateError {
public:
    explicit IOError(const std::string& message)
        : AuditGateError("I/O error: " + message) {}
};

class DecodeError : public IOError {
public:
    explicit DecodeError(const std::string& message)
        : IOError("Decode error: " + message) {}
};

class OracleError : public AuditGateError {
public:
    explicit OracleError(const std::string& message)
        : AuditGateError("Oracle error: " + message) {}
};

class StopRequested : public AuditGateError {
public:
    StopRequested() : AuditGateError("Stop requested by caller") {}
};

} // namespace audit_gate
