/**
 * @file TradeJournal.hpp
 * @brief Mode-specific trade history keyed by order id
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include "../utils/Clock.hpp"
#include "../utils/Logger.hpp"

namespace OptionsScalper {

/**
 * @struct TradeRecord
 * @brief One completed trade as stored in the journal
 */
struct TradeRecord {
    std::string orderId;
    std::string timestamp;          ///< "YYYY-MM-DD HH:MM:SS"
    std::string tradingSymbol;
    std::string transactionType;    ///< "BUY" or "SELL"
    int quantity = 0;
    double averagePrice = 0.0;
    std::string status;
    std::string product;
    double pnl = 0.0;               ///< Realized P&L, 0 for entries

    nlohmann::json toJson() const;
    static TradeRecord fromJson(const nlohmann::json& data);
};

/**
 * @class TradeJournal
 * @brief Upserts trade records into trade_history_<mode>.json
 *
 * The whole document is rewritten after each change. Writing a record with
 * an order id already present replaces the earlier record.
 */
class TradeJournal {
public:
    TradeJournal(const std::string& dataDir, const std::string& mode, std::shared_ptr<Logger> logger);

    /**
     * @brief Insert or replace the record for its order id
     * @return false when the record has no order id or the file cannot be written
     */
    bool logTrade(const TradeRecord& record);

    /**
     * @brief All records, most recent first
     */
    std::vector<TradeRecord> getAllTrades() const;

    std::vector<TradeRecord> getTradesForDate(const Date& date) const;

    std::size_t size() const;
    const std::string& getPath() const { return m_path; }

private:
    bool load();
    bool save() const;

    std::string m_path;
    std::shared_ptr<Logger> m_logger;
    nlohmann::json m_trades;
    bool m_writable = true;
    mutable std::mutex m_mutex;
};

}  // namespace OptionsScalper
