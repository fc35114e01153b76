#pragma once

#include <stdexcept>
#include <string>

namespace arbx {

class ArbxException : public std::runtime_error {
public:
    explicit ArbxException(const std::string& message) : std::runtime_error(message) {}
    explicit ArbxException(const char* message) : std::runtime_error(message) {}
};

// Bad setup parameters, fatal for initialization
class ConfigurationError : public ArbxException {
public:
    explicit ConfigurationError(const std::string& message)
        : ArbxException("Configuration Error: " + message) {}
};

// Caller is not the operator, or a callback came from the wrong party
class AuthorizationError : public ArbxException {
public:
    explicit AuthorizationError(const std::string& message)
        : ArbxException("Authorization Error: " + message) {}
};

// Paused, over the gas ceiling, ineligible token, attempt already running
class RiskRejection : public ArbxException {
public:
    explicit RiskRejection(const std::string& message)
        : ArbxException("Risk Rejection: " + message) {}
};

// Non-positive or stale price / gas reading
class OracleError : public ArbxException {
public:
    explicit OracleError(const std::string& message)
        : ArbxException("Oracle Error: " + message) {}
};

// Router or lending pool failed, reverted or returned unacceptable output
class CollaboratorError : public ArbxException {
public:
    explicit CollaboratorError(const std::string& message)
        : ArbxException("Collaborator Error: " + message) {}
};

class TradingError : public ArbxException {
public:
    explicit TradingError(const std::string& message)
        : ArbxException("Trading Error: " + message) {}
};

class ValidationError : public ArbxException {
public:
    explicit ValidationError(const std::string& message)
        : ArbxException("Validation Error: " + message) {}
};

} // namespace arbx
