/**
 * @file Errors.hpp
 * @brief Exception types raised by broker, transport and reconciliation code
 */

#pragma once

#include <stdexcept>
#include <string>

namespace OptionsScalper {

/**
 * @class ApiError
 * @brief Base class for any failed broker interaction
 */
class ApiError : public std::runtime_error {
public:
    explicit ApiError(const std::string& message, int statusCode = 0)
        : std::runtime_error(message), m_statusCode(statusCode) {}

    /**
     * @brief HTTP status of the failed call, 0 when no response was received
     */
    int getStatusCode() const { return m_statusCode; }

private:
    int m_statusCode;
};

/**
 * @class TransientApiError
 * @brief Network failure, timeout, rate limit or 5xx; worth retrying later
 */
class TransientApiError : public ApiError {
public:
    using ApiError::ApiError;
};

/**
 * @class RejectedOrderError
 * @brief The broker refused an order (validation, margin, RMS)
 */
class RejectedOrderError : public ApiError {
public:
    using ApiError::ApiError;
};

/**
 * @class StaleConnectionError
 * @brief The tick stream stopped delivering data while connected
 */
class StaleConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ReconciliationConflictError
 * @brief Local optimistic state disagrees with the broker
 */
class ReconciliationConflictError : public std::runtime_error {
public:
    ReconciliationConflictError(const std::string& symbol, const std::string& message)
        : std::runtime_error(symbol + ": " + message), m_symbol(symbol) {}

    const std::string& getSymbol() const { return m_symbol; }

private:
    std::string m_symbol;
};

}  // namespace OptionsScalper
