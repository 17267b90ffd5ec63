/**
 * @file AccountMonitor.hpp
 * @brief Breaker-guarded polling of account profile and funds
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include "../api/CircuitBreaker.hpp"
#include "../config/ConfigManager.hpp"
#include "../trading/ExecutionClient.hpp"
#include "../utils/Clock.hpp"
#include "../utils/Logger.hpp"

namespace OptionsScalper {

/**
 * @class AccountMonitor
 * @brief Keeps the last known user id and balance fresh without hammering a failing API
 *
 * Profile and margins each sit behind their own breaker. While a breaker is
 * OPEN the cached values keep being served and isDegraded() reports true.
 */
class AccountMonitor {
public:
    AccountMonitor(std::shared_ptr<ExecutionClient> client,
                   const TerminalSettings& settings,
                   std::shared_ptr<Clock> clock,
                   std::shared_ptr<Logger> logger);

    /**
     * @brief Poll profile and margins, each only if its breaker allows
     */
    void checkHealth();

    /**
     * @brief Poll the profile endpoint
     * @return True if a fresh value was obtained
     */
    bool refreshProfile();

    /**
     * @brief Poll the margins endpoint
     * @return True if a fresh value was obtained
     */
    bool refreshMargins();

    std::string getUserId() const;

    /**
     * @brief Equity net plus commodity net from the last good margins call
     */
    double getBalance() const;

    MarginSnapshot getLastMargins() const;

    /**
     * @brief True while any breaker is OPEN
     */
    bool isDegraded() const;

    /**
     * @brief True while any breaker is probing in HALF_OPEN
     */
    bool isRecovering() const;

    CircuitBreaker& getProfileBreaker() { return m_profileBreaker; }
    CircuitBreaker& getMarginsBreaker() { return m_marginsBreaker; }

private:
    std::shared_ptr<ExecutionClient> m_client;
    std::shared_ptr<Logger> m_logger;

    CircuitBreaker m_profileBreaker;
    CircuitBreaker m_marginsBreaker;

    mutable std::mutex m_mutex;         ///< Guards the cached values
    std::string m_userId = "Unknown";
    double m_balance = 0.0;
    MarginSnapshot m_lastMargins;
};

}  // namespace OptionsScalper
