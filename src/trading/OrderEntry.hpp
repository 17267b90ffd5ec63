/**
 * @file OrderEntry.hpp
 * @brief Entry orders with fill confirmation and bracket placement
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "../config/ConfigManager.hpp"
#include "../models/InstrumentModel.hpp"
#include "../models/OrderModel.hpp"
#include "../positions/PositionStore.hpp"
#include "../risk/OcoLegManager.hpp"
#include "../storage/TradeJournal.hpp"
#include "../trading/ExecutionClient.hpp"
#include "../utils/Logger.hpp"

namespace OptionsScalper {

/**
 * @enum EntryStatus
 * @brief How an entry request ended
 */
enum class EntryStatus {
    FILLED,        ///< Confirmed COMPLETE, position added
    WORKING,       ///< Accepted and resting; the next refresh picks it up
    REJECTED,      ///< Refused by the broker
    UNCONFIRMED,   ///< Placed but no usable status within the retry budget
    FAILED         ///< Not placed
};

std::string toString(EntryStatus status);

/**
 * @struct EntryResult
 * @brief Outcome of OrderEntry::buy
 */
struct EntryResult {
    EntryStatus status = EntryStatus::FAILED;
    std::string orderId;
    std::string message;
};

/**
 * @class OrderEntry
 * @brief Opens long option positions
 */
class OrderEntry {
public:
    OrderEntry(const TerminalSettings& settings,
               std::shared_ptr<ExecutionClient> client,
               std::shared_ptr<PositionStore> store,
               std::shared_ptr<OcoLegManager> legManager,
               std::shared_ptr<TradeJournal> tradeJournal,
               std::shared_ptr<Logger> logger);

    /**
     * @brief Buy a contract and protect the fill
     *
     * The order is confirmed by polling the order list. On COMPLETE the
     * position is added, a trade record written and bracket legs placed.
     * A fill in a symbol already held is netted into that position and its
     * legs are replaced by a pair sized for the netted quantity; protection
     * not given here is taken from the held position.
     *
     * @param limitPrice Required when orderType is LIMIT
     * @param stopLoss Stop-loss price, ignored unless positive
     * @param target Target price, ignored unless positive
     * @param trailingDistance Trailing-stop distance, ignored unless positive
     */
    EntryResult buy(const Contract& contract,
                    int quantity,
                    ProductType product,
                    OrderType orderType = OrderType::MARKET,
                    std::optional<double> limitPrice = std::nullopt,
                    std::optional<double> stopLoss = std::nullopt,
                    std::optional<double> target = std::nullopt,
                    std::optional<double> trailingDistance = std::nullopt);

    /**
     * @brief Poll the order list until the order shows a decisive status
     * @return The order, empty if it never did within the retry budget
     */
    std::optional<RawOrder> confirmOrder(const std::string& orderId);

private:
    int m_confirmRetries;
    int m_confirmDelayMs;
    std::shared_ptr<ExecutionClient> m_client;
    std::shared_ptr<PositionStore> m_store;
    std::shared_ptr<OcoLegManager> m_legManager;
    std::shared_ptr<TradeJournal> m_tradeJournal;
    std::shared_ptr<Logger> m_logger;
};

}  // namespace OptionsScalper
