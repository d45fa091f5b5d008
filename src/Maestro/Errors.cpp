// =================================================================
// src/Maestro/Errors.cpp
// =================================================================
// String conversion and classification of error codes.

#include "Maestro/Errors.hpp"

namespace Maestro {

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "none";
        case ErrorCode::INVALID_QUERY: return "invalid_query";
        case ErrorCode::CLASSIFICATION_ERROR: return "classification_error";
        case ErrorCode::REMOTE_TRANSIENT: return "remote_transient";
        case ErrorCode::REMOTE_PERMANENT: return "remote_permanent";
        case ErrorCode::CIRCUIT_OPEN: return "circuit_open";
        case ErrorCode::SYNTHESIS_FAILURE: return "synthesis_failure";
        case ErrorCode::TIMEOUT: return "timeout";
        case ErrorCode::CANCELLED: return "cancelled";
        case ErrorCode::RATE_LIMITED: return "rate_limited";
        case ErrorCode::CONFIG_ERROR: return "config_error";
        default: return "unknown";
    }
}

bool isClientError(ErrorCode code) {
    return code == ErrorCode::INVALID_QUERY || code == ErrorCode::RATE_LIMITED;
}

} // namespace Maestro
