/**
 * @file PositionStore.hpp
 * @brief Reconciles broker positions with locally held risk state
 */

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../models/InstrumentModel.hpp"
#include "../models/OrderModel.hpp"
#include "../models/PositionModel.hpp"
#include "../positions/StoreObserver.hpp"
#include "../storage/PnlJournal.hpp"
#include "../storage/TradeJournal.hpp"
#include "../trading/ExecutionClient.hpp"
#include "../utils/Clock.hpp"
#include "../utils/Logger.hpp"

namespace OptionsScalper {

/**
 * @struct RefreshStatus
 * @brief Snapshot of the reconciliation loop for status displays
 */
struct RefreshStatus {
    std::optional<Clock::TimePoint> lastRefresh;
    bool inProgress = false;
    std::size_t positionCount = 0;
};

/**
 * @class PositionStore
 * @brief Open positions and working orders, merged from broker and local state
 *
 * The broker is authoritative for which positions exist and their size.
 * Protective parameters, leg order ids, the exit flag and tick-driven prices
 * are local and survive each reconciliation pass.
 *
 * The internal mutex covers in-memory work only and is never held across a
 * broker call or an observer callback.
 */
class PositionStore {
public:
    PositionStore(std::shared_ptr<ExecutionClient> client,
                  std::shared_ptr<InstrumentRegistry> instruments,
                  std::shared_ptr<TradeJournal> tradeJournal,
                  std::shared_ptr<PnlJournal> pnlJournal,
                  std::shared_ptr<Clock> clock,
                  std::shared_ptr<Logger> logger);

    /**
     * @brief Register an observer; call before the session starts
     */
    void addObserver(std::shared_ptr<StoreObserver> observer);

    /**
     * @brief Set the hook that checks protective legs on each refresh
     */
    void setLegReconciler(std::weak_ptr<LegReconciler> reconciler);

    /**
     * @brief Fetch positions and orders and reconcile local state against them
     * @return False if a refresh was already running or the broker call failed
     */
    bool refreshFromBroker();

    /**
     * @brief Build a Position from a broker payload
     *
     * Unknown symbols get a placeholder contract (token 0) and a data
     * integrity warning. Empty only when the payload has no trading symbol.
     */
    std::optional<Position> convertBrokerPosition(const RawPosition& raw) const;

    /**
     * @brief Replace the position set, realizing P&L of positions that vanished
     */
    void synchronize(const std::map<std::string, Position>& newPositions);

    /**
     * @brief Insert a filled position, netting it into one already held
     *
     * Quantities are summed. Adding to the same side averages the prices, a
     * reduction keeps the held average and a flip takes the incoming one.
     * Protective parameters, leg ids and the entry order id of the held
     * position are kept. A position netted to zero is removed.
     */
    void addPosition(const Position& position);
    void removePosition(const std::string& tradingSymbol);

    std::vector<Position> getAllPositions() const;
    std::optional<Position> getPosition(const std::string& tradingSymbol) const;
    std::vector<PendingOrder> getPendingOrders() const;
    double getTotalFloatingPnl() const;
    double getRealizedPnlToday() const;
    bool hasOpenPositions() const;
    std::size_t getPositionCount() const;
    RefreshStatus getRefreshStatus() const;

    /**
     * @brief Drop positions whose symbol encodes an expiry before today
     * @return Number of positions removed
     */
    int removeExpiredPositions();

    /**
     * @brief Mark a position to a new last price
     * @param changed Set when the price moved by more than 1e-9
     * @return Updated position, empty if absent or exiting
     */
    std::optional<Position> applyPrice(const std::string& tradingSymbol, double ltp, bool& changed);

    /**
     * @brief Set the exit flag if it is clear
     * @return True if this caller now owns the exit
     */
    bool tryBeginExit(const std::string& tradingSymbol);

    void abortExit(const std::string& tradingSymbol);

    /**
     * @brief Optimistically remove an exited position, realizing its P&L
     *
     * The exit stays pending until the broker drops the position. If the
     * broker reports the exit order REJECTED or CANCELLED, or never lists it
     * within kExitConfirmPasses refreshes, the position is released: its
     * protection is restored, the exit flag cleared and the P&L un-realized.
     *
     * @param exitPrice Price to realize at; the last price is used when not positive
     */
    bool completeExit(const std::string& tradingSymbol, const std::string& orderId, double exitPrice);

    /**
     * @brief Move the stop loss locally
     * @param trailingSteps New trailing step count, unchanged when empty
     */
    bool setStopLoss(const std::string& tradingSymbol, double price,
                     std::optional<int> trailingSteps = std::nullopt);

    /**
     * @brief Overwrite protective parameters; resets the trailing step count
     */
    bool setProtection(const std::string& tradingSymbol,
                       std::optional<double> stopLoss,
                       std::optional<double> target,
                       std::optional<double> trailingDistance);

    bool setLegOrderIds(const std::string& tradingSymbol,
                        std::optional<std::string> stopLossOrderId,
                        std::optional<std::string> targetOrderId);

    void notifyPositionsChanged();

    /// Refreshes an unlisted exit order may miss before the exit is released
    static constexpr int kExitConfirmPasses = 3;

private:
    struct PendingExit {
        std::string orderId;
        double pnl = 0.0;
        Date date;                  ///< Day the P&L was folded into
        Position snapshot;          ///< Local state at the time of the exit
        TradeRecord record;
        int unlistedPasses = 0;
    };

    struct ReleasedExit {
        std::string tradingSymbol;
        std::string reason;
        PendingExit exit;
    };

    /**
     * @brief Decide whether a pending exit failed, given the broker's orders
     * @return Failure reason, empty while the exit may still go through
     */
    std::optional<std::string> checkPendingExit(PendingExit& exit,
                                                const std::map<std::string, OrderStatus>& orderStatuses) const;
    void foldRealizedPnl(double pnl);
    void notifyRemoved(const std::vector<std::string>& symbols);

    std::shared_ptr<ExecutionClient> m_client;
    std::shared_ptr<InstrumentRegistry> m_instruments;
    std::shared_ptr<TradeJournal> m_tradeJournal;
    std::shared_ptr<PnlJournal> m_pnlJournal;
    std::shared_ptr<Clock> m_clock;
    std::shared_ptr<Logger> m_logger;

    std::map<std::string, Position> m_positions;
    std::vector<PendingOrder> m_pendingOrders;
    std::map<std::string, PendingExit> m_pendingExits;     ///< Exited locally, P&L already folded
    double m_realizedPnlToday = 0.0;
    Date m_realizedDate;
    std::optional<Clock::TimePoint> m_lastRefresh;
    std::atomic<bool> m_refreshInProgress{false};

    std::vector<std::shared_ptr<StoreObserver>> m_observers;
    std::weak_ptr<LegReconciler> m_legReconciler;
    mutable std::mutex m_mutex;
};

}  // namespace OptionsScalper
