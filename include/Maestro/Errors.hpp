// =================================================================
// include/Maestro/Errors.hpp
// =================================================================
// Error codes and exception types shared across the router.

#pragma once

#include <stdexcept>
#include <string>

namespace Maestro {

/**
 * @brief Stable error codes carried by every user-visible failure
 */
enum class ErrorCode {
    NONE,                   ///< No error
    INVALID_QUERY,          ///< Empty or unparseable input
    CLASSIFICATION_ERROR,   ///< Routing produced no eligible plan
    REMOTE_TRANSIENT,       ///< Network, timeout or 5xx failure
    REMOTE_PERMANENT,       ///< Auth or validation failure
    CIRCUIT_OPEN,           ///< Model skipped because its circuit is open
    SYNTHESIS_FAILURE,      ///< Every model in the plan failed
    TIMEOUT,                ///< Global deadline exceeded
    CANCELLED,              ///< Caller cancelled the request
    RATE_LIMITED,           ///< Caller refused by the rate limiter
    CONFIG_ERROR            ///< Invalid configuration
};

/**
 * @brief Convert an error code to its stable string form
 * @param code Error code
 * @return Lowercase identifier (e.g. "remote_transient")
 */
std::string errorCodeToString(ErrorCode code);

/**
 * @brief Whether the code describes a problem with the request itself
 *
 * Client errors should not be retried unchanged; everything else reflects
 * backend availability and may succeed later.
 */
bool isClientError(ErrorCode code);

/**
 * @brief Base class for all router exceptions
 */
class MaestroError : public std::runtime_error {
public:
    MaestroError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), m_code(code) {}

    ErrorCode code() const { return m_code; }

private:
    ErrorCode m_code;
};

class InvalidQueryError : public MaestroError {
public:
    explicit InvalidQueryError(const std::string& message)
        : MaestroError(ErrorCode::INVALID_QUERY, message) {}
};

class ClassificationError : public MaestroError {
public:
    explicit ClassificationError(const std::string& message)
        : MaestroError(ErrorCode::CLASSIFICATION_ERROR, message) {}
};

class ConfigError : public MaestroError {
public:
    explicit ConfigError(const std::string& message)
        : MaestroError(ErrorCode::CONFIG_ERROR, message) {}
};

/**
 * @brief Whether a remote failure is worth retrying
 */
enum class RemoteErrorKind {
    TRANSIENT,  ///< Network, timeout, 429 or 5xx
    PERMANENT   ///< Authentication or request validation
};

/**
 * @brief Failure reported by a model client
 */
class RemoteError : public MaestroError {
public:
    RemoteError(RemoteErrorKind kind, const std::string& message, int http_status = 0)
        : MaestroError(kind == RemoteErrorKind::TRANSIENT ? ErrorCode::REMOTE_TRANSIENT
                                                          : ErrorCode::REMOTE_PERMANENT,
                       message),
          m_kind(kind), m_http_status(http_status) {}

    RemoteErrorKind kind() const { return m_kind; }
    bool isTransient() const { return m_kind == RemoteErrorKind::TRANSIENT; }
    int httpStatus() const { return m_http_status; }

private:
    RemoteErrorKind m_kind;
    int m_http_status;
};

/**
 * @brief A credential reference could not be resolved
 *
 * Always permanent for the model that needed it.
 */
class CredentialError : public RemoteError {
public:
    explicit CredentialError(const std::string& message)
        : RemoteError(RemoteErrorKind::PERMANENT, message) {}
};

/**
 * @brief Raised by a client that stopped because its token was cancelled
 */
class CancelledError : public MaestroError {
public:
    explicit CancelledError(const std::string& message = "operation cancelled")
        : MaestroError(ErrorCode::CANCELLED, message) {}
};

} // namespace Maestro
