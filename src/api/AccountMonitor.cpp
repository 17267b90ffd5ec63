/**
 * @file AccountMonitor.cpp
 * @brief Implementation of the AccountMonitor class
 */

#include "../api/AccountMonitor.hpp"

namespace OptionsScalper {

AccountMonitor::AccountMonitor(std::shared_ptr<ExecutionClient> client,
                               const TerminalSettings& settings,
                               std::shared_ptr<Clock> clock,
                               std::shared_ptr<Logger> logger)
    : m_client(client),
      m_logger(logger),
      m_profileBreaker("profile", settings.breakerFailureThreshold,
                       std::chrono::seconds(settings.breakerCooldownSeconds), clock, logger),
      m_marginsBreaker("margins", settings.breakerFailureThreshold,
                       std::chrono::seconds(settings.breakerCooldownSeconds), clock, logger) {
}

void AccountMonitor::checkHealth() {
    refreshProfile();
    refreshMargins();

    if (isDegraded()) {
        m_logger->warn("API issues, serving cached account data (user {}, balance {:.2f})",
                       getUserId(), getBalance());
    }
}

bool AccountMonitor::refreshProfile() {
    if (!m_profileBreaker.canExecute()) {
        m_logger->debug("Profile fetch skipped, breaker OPEN");
        return false;
    }

    try {
        UserProfile profile = m_client->getProfile();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_userId = profile.userId.empty() ? "Unknown" : profile.userId;
        }
        m_profileBreaker.recordSuccess();
        return true;
    } catch (const std::exception& e) {
        m_logger->warn("Profile fetch failed: {}", e.what());
        m_profileBreaker.recordFailure();
    }
    return false;
}

bool AccountMonitor::refreshMargins() {
    if (!m_marginsBreaker.canExecute()) {
        m_logger->debug("Margins fetch skipped, breaker OPEN");
        return false;
    }

    try {
        MarginSnapshot margins = m_client->getMargins();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_lastMargins = margins;
            m_balance = margins.totalNet();
        }
        m_marginsBreaker.recordSuccess();
        m_logger->debug("Margins fetch successful. Balance: {:.2f}", margins.totalNet());
        return true;
    } catch (const std::exception& e) {
        m_logger->error("Margins fetch failed: {}", e.what());
        m_marginsBreaker.recordFailure();
    }
    return false;
}

std::string AccountMonitor::getUserId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_userId;
}

double AccountMonitor::getBalance() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_balance;
}

MarginSnapshot AccountMonitor::getLastMargins() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastMargins;
}

bool AccountMonitor::isDegraded() const {
    return m_profileBreaker.getState() == BreakerState::OPEN ||
           m_marginsBreaker.getState() == BreakerState::OPEN;
}

bool AccountMonitor::isRecovering() const {
    return m_profileBreaker.getState() == BreakerState::HALF_OPEN ||
           m_marginsBreaker.getState() == BreakerState::HALF_OPEN;
}

}  // namespace OptionsScalper
