/**
 * @file PnlJournal.hpp
 * @brief Realized P&L per calendar day
 */

#pragma once

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include "../utils/Clock.hpp"
#include "../utils/Logger.hpp"

namespace OptionsScalper {

/**
 * @class PnlJournal
 * @brief Accumulates realized P&L in pnl_history_<mode>.json as {"YYYY-MM-DD": total}
 */
class PnlJournal {
public:
    PnlJournal(const std::string& dataDir, const std::string& mode, std::shared_ptr<Logger> logger);

    /**
     * @brief Add a realized amount to the date's running total
     */
    bool logPnl(const Date& date, double pnl);

    double getPnlForDate(const Date& date) const;
    std::map<std::string, double> getAllPnl() const;

    const std::string& getPath() const { return m_path; }

private:
    bool load();
    bool save() const;

    std::string m_path;
    std::shared_ptr<Logger> m_logger;
    std::map<std::string, double> m_daily;
    bool m_writable = true;             ///< False if an unreadable file could not be moved aside
    mutable std::mutex m_mutex;
};

}  // namespace OptionsScalper
