/**
 * @file TradeJournal.cpp
 * @brief Implementation of the TradeJournal class
 */

#include "../storage/TradeJournal.hpp"
#include "../storage/CorruptFile.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace OptionsScalper {

using json = nlohmann::json;

json TradeRecord::toJson() const {
    return {
        {"orderId", orderId},
        {"timestamp", timestamp},
        {"tradingSymbol", tradingSymbol},
        {"transactionType", transactionType},
        {"quantity", quantity},
        {"averagePrice", averagePrice},
        {"status", status},
        {"product", product},
        {"pnl", pnl}
    };
}

TradeRecord TradeRecord::fromJson(const json& data) {
    TradeRecord record;
    record.orderId = data.value("orderId", std::string());
    record.timestamp = data.value("timestamp", std::string());
    record.tradingSymbol = data.value("tradingSymbol", std::string());
    record.transactionType = data.value("transactionType", std::string());
    record.quantity = data.value("quantity", 0);
    record.averagePrice = data.value("averagePrice", 0.0);
    record.status = data.value("status", std::string());
    record.product = data.value("product", std::string());
    record.pnl = data.value("pnl", 0.0);
    return record;
}

TradeJournal::TradeJournal(const std::string& dataDir, const std::string& mode, std::shared_ptr<Logger> logger)
    : m_path((std::filesystem::path(dataDir) / ("trade_history_" + mode + ".json")).string()),
      m_logger(logger),
      m_trades(json::object()) {

    m_logger->info("Trade history for '{}' mode at {}", mode, m_path);
    load();
}

bool TradeJournal::logTrade(const TradeRecord& record) {
    if (record.orderId.empty()) {
        m_logger->warn("Attempted to log a trade without an order id, skipping");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_trades[record.orderId] = record.toJson();

    if (!save()) {
        return false;
    }
    m_logger->info("Logged trade for order {} with P&L {:.2f}", record.orderId, record.pnl);
    return true;
}

std::vector<TradeRecord> TradeJournal::getAllTrades() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<TradeRecord> trades;
    for (const auto& item : m_trades.items()) {
        trades.push_back(TradeRecord::fromJson(item.value()));
    }
    std::stable_sort(trades.begin(), trades.end(),
                     [](const TradeRecord& a, const TradeRecord& b) { return a.timestamp > b.timestamp; });
    return trades;
}

std::vector<TradeRecord> TradeJournal::getTradesForDate(const Date& date) const {
    std::string prefix = date.toString();
    std::vector<TradeRecord> trades = getAllTrades();
    trades.erase(std::remove_if(trades.begin(), trades.end(),
                                [&prefix](const TradeRecord& trade) {
                                    return trade.timestamp.compare(0, prefix.size(), prefix) != 0;
                                }),
                 trades.end());
    return trades;
}

std::size_t TradeJournal::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_trades.size();
}

bool TradeJournal::load() {
    json document;
    bool readable = true;
    {
        std::ifstream file(m_path);
        if (!file.is_open()) {
            return false;
        }
        try {
            file >> document;
        } catch (const std::exception& e) {
            m_logger->error("Failed to read trade history {}: {}", m_path, e.what());
            readable = false;
        }
    }

    if (readable && !document.is_object()) {
        m_logger->error("Trade history {} is not an object", m_path);
        readable = false;
    }
    if (!readable) {
        m_writable = moveAsideCorruptFile(m_path, *m_logger);
        return false;
    }

    m_trades = document;
    m_logger->debug("Loaded {} trade records", m_trades.size());
    return true;
}

bool TradeJournal::save() const {
    if (!m_writable) {
        m_logger->error("Trade history {} could not be moved aside, not overwriting it", m_path);
        return false;
    }
    try {
        std::filesystem::path path(m_path);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(m_path, std::ios::trunc);
        if (!file.is_open()) {
            m_logger->error("Failed to open trade history for writing: {}", m_path);
            return false;
        }
        file << m_trades.dump(4);
        return true;
    } catch (const std::exception& e) {
        m_logger->error("Failed to write trade history {}: {}", m_path, e.what());
        return false;
    }
}

}  // namespace OptionsScalper
