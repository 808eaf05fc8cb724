#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace shroud {

enum class ErrorCode : uint8_t {
    // authorisation
    NOT_OWNER = 1,
    NOT_AUTHORIZED_EXECUTOR,
    NOT_GOVERNANCE,
    NOT_POOL_MANAGER,
    UNAUTHORIZED,
    // state
    STRATEGY_ALREADY_EXISTS,
    STRATEGY_NOT_FOUND,
    STRATEGY_INACTIVE,
    ALREADY_VOTED,
    NOT_GOVERNANCE_STRATEGY,
    INVALID_PARAMETER,
    INVALID_CIPHERTEXT,
    // readiness
    NOT_READY_FOR_EXECUTION,
    COOLDOWN_NOT_MET,
    MEV_PROTECTION_VIOLATION,
    EXECUTION_IN_PROGRESS,
    // coprocessor
    FHE_OPERATION_FAILED
};

inline const char* errorCodeToString(ErrorCode c) {
    switch (c) {
        case ErrorCode::NOT_OWNER:                return "NOT_OWNER";
        case ErrorCode::NOT_AUTHORIZED_EXECUTOR:  return "NOT_AUTHORIZED_EXECUTOR";
        case ErrorCode::NOT_GOVERNANCE:           return "NOT_GOVERNANCE";
        case ErrorCode::NOT_POOL_MANAGER:         return "NOT_POOL_MANAGER";
        case ErrorCode::UNAUTHORIZED:             return "UNAUTHORIZED";
        case ErrorCode::STRATEGY_ALREADY_EXISTS:  return "STRATEGY_ALREADY_EXISTS";
        case ErrorCode::STRATEGY_NOT_FOUND:       return "STRATEGY_NOT_FOUND";
        case ErrorCode::STRATEGY_INACTIVE:        return "STRATEGY_INACTIVE";
        case ErrorCode::ALREADY_VOTED:            return "ALREADY_VOTED";
        case ErrorCode::NOT_GOVERNANCE_STRATEGY:  return "NOT_GOVERNANCE_STRATEGY";
        case ErrorCode::INVALID_PARAMETER:        return "INVALID_PARAMETER";
        case ErrorCode::INVALID_CIPHERTEXT:       return "INVALID_CIPHERTEXT";
        case ErrorCode::NOT_READY_FOR_EXECUTION:  return "NOT_READY_FOR_EXECUTION";
        case ErrorCode::COOLDOWN_NOT_MET:         return "COOLDOWN_NOT_MET";
        case ErrorCode::MEV_PROTECTION_VIOLATION: return "MEV_PROTECTION_VIOLATION";
        case ErrorCode::EXECUTION_IN_PROGRESS:    return "EXECUTION_IN_PROGRESS";
        case ErrorCode::FHE_OPERATION_FAILED:     return "FHE_OPERATION_FAILED";
        default:                                  return "UNKNOWN";
    }
}

// Aborts the public operation that raised it. The engine rolls back any
// state touched before the throw.
class RebalanceError : public std::runtime_error {
public:
    RebalanceError(ErrorCode code, const std::string& detail)
        : std::runtime_error(
              std::string(errorCodeToString(code)) +
              (detail.empty() ? "" : ": " + detail)),
          error_code(code) {}

    explicit RebalanceError(ErrorCode code)
        : RebalanceError(code, "") {}

    ErrorCode code() const { return error_code; }

private:
    ErrorCode error_code;
};

}
