/**
 * @file CircuitBreaker.cpp
 * @brief Implementation of the CircuitBreaker class
 */

#include "../api/CircuitBreaker.hpp"

namespace OptionsScalper {

std::string toString(BreakerState state) {
    switch (state) {
        case BreakerState::CLOSED:    return "CLOSED";
        case BreakerState::OPEN:      return "OPEN";
        case BreakerState::HALF_OPEN: return "HALF_OPEN";
        default:                      return "UNKNOWN";
    }
}

CircuitBreaker::CircuitBreaker(std::string name,
                               int failureThreshold,
                               std::chrono::seconds cooldown,
                               std::shared_ptr<Clock> clock,
                               std::shared_ptr<Logger> logger)
    : m_name(std::move(name)),
      m_failureThreshold(failureThreshold < 1 ? 1 : failureThreshold),
      m_cooldown(cooldown),
      m_clock(clock),
      m_logger(logger) {
}

bool CircuitBreaker::canExecute() {
    std::lock_guard<std::mutex> lock(m_mutex);

    switch (m_state) {
        case BreakerState::CLOSED:
        case BreakerState::HALF_OPEN:
            return true;
        case BreakerState::OPEN:
            if (m_clock->now() - m_lastFailure >= m_cooldown) {
                m_state = BreakerState::HALF_OPEN;
                m_logger->info("Circuit breaker '{}' HALF_OPEN, probing", m_name);
                return true;
            }
            return false;
    }
    return false;
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != BreakerState::CLOSED) {
        m_logger->info("Circuit breaker '{}' CLOSED after successful call", m_name);
    }
    m_failureCount = 0;
    m_state = BreakerState::CLOSED;
}

void CircuitBreaker::recordFailure() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failureCount++;
    m_lastFailure = m_clock->now();

    if (m_state == BreakerState::HALF_OPEN) {
        m_state = BreakerState::OPEN;
        m_logger->warn("Circuit breaker '{}' trial call failed, OPEN again", m_name);
        return;
    }

    if (m_state == BreakerState::CLOSED && m_failureCount >= m_failureThreshold) {
        m_state = BreakerState::OPEN;
        m_logger->warn("Circuit breaker '{}' OPEN after {} failures", m_name, m_failureCount);
    }
}

BreakerState CircuitBreaker::getState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

int CircuitBreaker::getFailureCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failureCount;
}

}  // namespace OptionsScalper
