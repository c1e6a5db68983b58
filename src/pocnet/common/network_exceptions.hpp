/**
 * @file network_exceptions.hpp
 */
#pragma once
#include "pocnet/common/common.hpp"

namespace pocnet
{

/**
 * @brief Error codes for structural failures of the analysis engine.
 *
 * @details
 * Only conditions that must abort the current operation are represented here.
 * Expected outcomes such as "no path found" or "no pair found" are returned as
 * empty optionals, and per-path semantic problems are reported as
 * `ValidationError` records.
 */
enum class NetworkErrorCode
{
    InvalidConfiguration,
    NodeNotFound,
    GraphNotLoaded,
    InvalidState,
    BackingStoreUnavailable
};

/**
 * @brief Get the symbolic name of an error code.
 */
inline const char* to_string(NetworkErrorCode code) noexcept
{
    switch (code)
    {
        case NetworkErrorCode::InvalidConfiguration:
            return "InvalidConfiguration";
        case NetworkErrorCode::NodeNotFound:
            return "NodeNotFound";
        case NetworkErrorCode::GraphNotLoaded:
            return "GraphNotLoaded";
        case NetworkErrorCode::InvalidState:
            return "InvalidState";
        case NetworkErrorCode::BackingStoreUnavailable:
            return "BackingStoreUnavailable";
    }
    return "Unknown";
}

/**
 * @brief Exception class for engine errors.
 *
 * @details
 * `NetworkError` is thrown when a traversal, sampling or coverage operation
 * cannot proceed: the configuration is invalid, the graph has not been loaded,
 * or the backing store failed. Each exception carries an error code and a
 * descriptive message.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class NetworkError : public std::exception
{
public:
    /**
     * @brief Construct a NetworkError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    NetworkError(NetworkErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    NetworkErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    NetworkErrorCode m_code;
    std::string m_message;
};

} // namespace pocnet
