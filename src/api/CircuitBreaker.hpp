/**
 * @file CircuitBreaker.hpp
 * @brief Failure-counting guard for one category of broker calls
 */

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include "../utils/Clock.hpp"
#include "../utils/Logger.hpp"

namespace OptionsScalper {

/**
 * @enum BreakerState
 * @brief Circuit breaker states
 */
enum class BreakerState {
    CLOSED,     ///< Calls flow normally
    OPEN,       ///< Calls are refused until the cooldown elapses
    HALF_OPEN   ///< One probing call is allowed
};

std::string toString(BreakerState state);

/**
 * @class CircuitBreaker
 * @brief CLOSED -> OPEN after threshold consecutive failures, OPEN -> HALF_OPEN
 *        once the cooldown has elapsed since the last failure
 *
 * A success in any state closes the breaker and resets the count. A failure
 * while HALF_OPEN reopens it immediately and restarts the cooldown.
 */
class CircuitBreaker {
public:
    /**
     * @brief Constructor
     * @param name Call category, used in log lines
     * @param failureThreshold Consecutive failures that open the breaker
     * @param cooldown Time after the last failure before probing again
     * @param clock Time source
     * @param logger Logger instance
     */
    CircuitBreaker(std::string name,
                   int failureThreshold,
                   std::chrono::seconds cooldown,
                   std::shared_ptr<Clock> clock,
                   std::shared_ptr<Logger> logger);

    /**
     * @brief Whether a call may go out now; moves OPEN to HALF_OPEN after the cooldown
     */
    bool canExecute();

    void recordSuccess();
    void recordFailure();

    BreakerState getState() const;
    int getFailureCount() const;
    const std::string& getName() const { return m_name; }

private:
    const std::string m_name;
    const int m_failureThreshold;
    const std::chrono::seconds m_cooldown;
    std::shared_ptr<Clock> m_clock;
    std::shared_ptr<Logger> m_logger;

    BreakerState m_state = BreakerState::CLOSED;
    int m_failureCount = 0;
    Clock::TimePoint m_lastFailure{};

    mutable std::mutex m_mutex;
};

}  // namespace OptionsScalper
