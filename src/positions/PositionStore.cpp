/**
 * @file PositionStore.cpp
 * @brief Implementation of the PositionStore class
 */

#include "../positions/PositionStore.hpp"
#include <cmath>
#include "../market/ExpiryParser.hpp"
#include "../utils/Errors.hpp"

namespace OptionsScalper {

namespace {

// Resets the in-progress flag however the refresh ends
class RefreshGuard {
public:
    explicit RefreshGuard(std::atomic<bool>& flag) : m_flag(flag) {}
    ~RefreshGuard() { m_flag = false; }

private:
    std::atomic<bool>& m_flag;
};

}  // namespace

PositionStore::PositionStore(std::shared_ptr<ExecutionClient> client,
                             std::shared_ptr<InstrumentRegistry> instruments,
                             std::shared_ptr<TradeJournal> tradeJournal,
                             std::shared_ptr<PnlJournal> pnlJournal,
                             std::shared_ptr<Clock> clock,
                             std::shared_ptr<Logger> logger)
    : m_client(client),
      m_instruments(instruments),
      m_tradeJournal(tradeJournal),
      m_pnlJournal(pnlJournal),
      m_clock(clock),
      m_logger(logger) {

    m_realizedDate = m_clock->today();
    if (m_pnlJournal) {
        m_realizedPnlToday = m_pnlJournal->getPnlForDate(m_realizedDate);
    }
    m_logger->info("PositionStore initialized, realized P&L today {:.2f}", m_realizedPnlToday);
}

void PositionStore::addObserver(std::shared_ptr<StoreObserver> observer) {
    m_observers.push_back(observer);
}

void PositionStore::setLegReconciler(std::weak_ptr<LegReconciler> reconciler) {
    m_legReconciler = reconciler;
}

bool PositionStore::refreshFromBroker() {
    bool expected = false;
    if (!m_refreshInProgress.compare_exchange_strong(expected, true)) {
        m_logger->debug("Refresh already in progress, skipping");
        return false;
    }
    RefreshGuard guard(m_refreshInProgress);

    std::vector<RawPosition> brokerPositions;
    std::vector<RawOrder> brokerOrders;
    try {
        brokerPositions = m_client->getPositions();
        brokerOrders = m_client->getOrders();
    } catch (const std::exception& e) {
        m_logger->error("Broker refresh failed: {}", e.what());
        for (const auto& observer : m_observers) {
            observer->onApiError(e.what());
        }
        for (const auto& observer : m_observers) {
            observer->onRefreshCompleted(false);
        }
        return false;
    }

    if (auto reconciler = m_legReconciler.lock()) {
        reconciler->reconcileLegs(brokerOrders);
    }

    std::map<std::string, Position> current;
    for (const auto& raw : brokerPositions) {
        if (raw.quantity == 0) {
            continue;
        }
        std::optional<Position> converted = convertBrokerPosition(raw);
        if (converted) {
            current[converted->tradingSymbol] = *converted;
        }
    }

    std::map<std::string, OrderStatus> orderStatuses;
    for (const auto& order : brokerOrders) {
        orderStatuses[order.orderId] = order.status;
    }

    std::vector<ReleasedExit> released;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& entry : current) {
            Position& pos = entry.second;
            auto existing = m_positions.find(entry.first);
            auto pendingExit = m_pendingExits.find(entry.first);

            if (existing != m_positions.end()) {
                const Position& local = existing->second;
                pos.stopLoss = local.stopLoss;
                pos.target = local.target;
                pos.trailingDistance = local.trailingDistance;
                pos.trailingSteps = local.trailingSteps;
                pos.stopLossOrderId = local.stopLossOrderId;
                pos.targetOrderId = local.targetOrderId;
                pos.entryOrderId = local.entryOrderId;
                pos.exitInProgress = local.exitInProgress;

                // Tick-driven prices are fresher than the broker's snapshot
                if (local.lastPrice > 0.0) {
                    pos.lastPrice = local.lastPrice;
                    pos.pnl = pos.pnlAt(local.lastPrice);
                }
            } else if (pendingExit != m_pendingExits.end()) {
                ReconciliationConflictError conflict(
                    entry.first, "exited locally but still reported open by the broker");
                m_logger->warn("Reconciliation conflict, {}. Keeping broker state", conflict.what());

                const Position& local = pendingExit->second.snapshot;
                pos.stopLoss = local.stopLoss;
                pos.target = local.target;
                pos.trailingDistance = local.trailingDistance;
                pos.trailingSteps = local.trailingSteps;
                pos.entryOrderId = local.entryOrderId;
                if (pos.instrumentToken == 0) {
                    pos.instrumentToken = local.instrumentToken;
                }
            }

            if (pendingExit == m_pendingExits.end()) {
                continue;
            }

            std::optional<std::string> failure = checkPendingExit(pendingExit->second, orderStatuses);
            if (!failure) {
                // The exit order is still in flight; do not let a tick submit another
                pos.exitInProgress = true;
                continue;
            }

            // Legs were cancelled with the exit; only the local triggers remain
            pos.exitInProgress = false;
            pos.stopLossOrderId.reset();
            pos.targetOrderId.reset();
            if (pendingExit->second.date == m_realizedDate) {
                m_realizedPnlToday -= pendingExit->second.pnl;
            }
            released.push_back({entry.first, *failure, pendingExit->second});
            m_pendingExits.erase(pendingExit);
        }
    }

    for (const auto& release : released) {
        m_logger->warn("Exit order {} for {} is {}, position released and {:.2f} un-realized",
                       release.exit.orderId, release.tradingSymbol, release.reason, release.exit.pnl);
        if (m_pnlJournal) {
            m_pnlJournal->logPnl(release.exit.date, -release.exit.pnl);
        }
        if (m_tradeJournal) {
            TradeRecord record = release.exit.record;
            record.status = release.reason;
            record.pnl = 0.0;
            m_tradeJournal->logTrade(record);
        }
    }

    synchronize(current);

    std::vector<PendingOrder> pending;
    for (const auto& order : brokerOrders) {
        if (PendingOrder::isPendingStatus(order.status)) {
            pending.push_back(PendingOrder::fromRaw(order));
        }
    }

    std::vector<Position> positions;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pendingOrders = pending;
        m_lastRefresh = m_clock->now();
        for (const auto& entry : m_positions) {
            positions.push_back(entry.second);
        }
    }

    m_logger->debug("Refresh complete: {} positions, {} pending orders", positions.size(), pending.size());

    for (const auto& observer : m_observers) {
        observer->onPositionsChanged(positions);
    }
    for (const auto& observer : m_observers) {
        observer->onPendingOrdersChanged(pending);
    }
    for (const auto& observer : m_observers) {
        observer->onRefreshCompleted(true);
    }
    return true;
}

std::optional<Position> PositionStore::convertBrokerPosition(const RawPosition& raw) const {
    if (raw.tradingSymbol.empty()) {
        return std::nullopt;
    }

    Position pos;
    pos.tradingSymbol = raw.tradingSymbol;
    pos.quantity = raw.quantity;
    pos.averagePrice = raw.averagePrice;
    pos.lastPrice = raw.lastPrice;
    pos.pnl = raw.pnl;
    pos.exchange = raw.exchange.empty() ? "NFO" : raw.exchange;
    if (raw.product != ProductType::UNKNOWN) {
        pos.product = raw.product;
    }

    const Contract* contract = m_instruments ? m_instruments->findBySymbol(raw.tradingSymbol) : nullptr;
    if (contract) {
        pos.instrumentToken = contract->instrumentToken;
    } else {
        pos.instrumentToken = 0;
        m_logger->warn("DataIntegrityWarning: no instrument details for {}, live P&L will not update",
                       raw.tradingSymbol);
    }

    return pos;
}

void PositionStore::synchronize(const std::map<std::string, Position>& newPositions) {
    std::vector<std::string> removed;
    std::vector<double> folded;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        for (const auto& entry : m_positions) {
            if (newPositions.count(entry.first) > 0) {
                continue;
            }
            if (m_pendingExits.erase(entry.first) > 0) {
                m_logger->info("{} closed at the broker, P&L was already realized", entry.first);
            } else {
                folded.push_back(entry.second.pnl);
                foldRealizedPnl(entry.second.pnl);
            }
            removed.push_back(entry.first);
        }

        // The broker agrees these are gone
        for (auto it = m_pendingExits.begin(); it != m_pendingExits.end();) {
            if (newPositions.count(it->first) == 0) {
                it = m_pendingExits.erase(it);
            } else {
                ++it;
            }
        }

        m_positions = newPositions;
    }

    if (m_pnlJournal) {
        Date today = m_clock->today();
        for (double pnl : folded) {
            m_pnlJournal->logPnl(today, pnl);
        }
    }
    notifyRemoved(removed);

    if (removeExpiredPositions() > 0) {
        notifyPositionsChanged();
    }
}

void PositionStore::addPosition(const Position& position) {
    if (position.quantity == 0 || position.tradingSymbol.empty()) {
        m_logger->warn("Ignoring position with zero quantity or no symbol");
        return;
    }

    Position merged = position;
    bool netted = false;
    bool closed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pendingExits.erase(position.tradingSymbol);

        auto it = m_positions.find(position.tradingSymbol);
        if (it == m_positions.end()) {
            m_positions[position.tradingSymbol] = position;
        } else {
            netted = true;
            const Position& held = it->second;
            int total = held.quantity + position.quantity;

            if (total == 0) {
                closed = true;
                m_positions.erase(it);
            } else {
                merged = held;
                merged.quantity = total;
                if ((held.quantity > 0) == (position.quantity > 0)) {
                    merged.averagePrice = (held.averagePrice * std::abs(held.quantity) +
                                           position.averagePrice * std::abs(position.quantity)) /
                                          std::abs(total);
                } else if ((total > 0) != (held.quantity > 0)) {
                    merged.averagePrice = position.averagePrice;
                }

                if (!merged.stopLoss) merged.stopLoss = position.stopLoss;
                if (!merged.target) merged.target = position.target;
                if (!merged.trailingDistance) merged.trailingDistance = position.trailingDistance;
                if (!merged.entryOrderId) merged.entryOrderId = position.entryOrderId;
                if (merged.instrumentToken == 0) merged.instrumentToken = position.instrumentToken;
                if (position.lastPrice > 0.0) merged.lastPrice = position.lastPrice;
                merged.pnl = merged.pnlAt(merged.lastPrice);

                it->second = merged;
            }
        }
    }

    if (closed) {
        m_logger->info("Position {} netted to zero", position.tradingSymbol);
        notifyRemoved({position.tradingSymbol});
        notifyPositionsChanged();
        return;
    }

    if (netted) {
        m_logger->info("Position netted: {} x{} @ {:.2f}", merged.tradingSymbol, merged.quantity,
                       merged.averagePrice);
    } else {
        m_logger->info("Position added: {} x{} @ {:.2f}", position.tradingSymbol, position.quantity,
                       position.averagePrice);
        for (const auto& observer : m_observers) {
            observer->onPositionAdded(position);
        }
    }
    notifyPositionsChanged();
}

void PositionStore::removePosition(const std::string& tradingSymbol) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_positions.erase(tradingSymbol) == 0) {
            return;
        }
    }

    notifyRemoved({tradingSymbol});
    notifyPositionsChanged();
}

std::vector<Position> PositionStore::getAllPositions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Position> positions;
    positions.reserve(m_positions.size());
    for (const auto& entry : m_positions) {
        positions.push_back(entry.second);
    }
    return positions;
}

std::optional<Position> PositionStore::getPosition(const std::string& tradingSymbol) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_positions.find(tradingSymbol);
    if (it == m_positions.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PendingOrder> PositionStore::getPendingOrders() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pendingOrders;
}

double PositionStore::getTotalFloatingPnl() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    double total = 0.0;
    for (const auto& entry : m_positions) {
        total += entry.second.pnl;
    }
    return total;
}

double PositionStore::getRealizedPnlToday() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_realizedDate == m_clock->today() ? m_realizedPnlToday : 0.0;
}

bool PositionStore::hasOpenPositions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& entry : m_positions) {
        if (entry.second.quantity != 0) {
            return true;
        }
    }
    return false;
}

std::size_t PositionStore::getPositionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_positions.size();
}

RefreshStatus PositionStore::getRefreshStatus() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    RefreshStatus status;
    status.lastRefresh = m_lastRefresh;
    status.inProgress = m_refreshInProgress.load();
    status.positionCount = m_positions.size();
    return status;
}

int PositionStore::removeExpiredPositions() {
    std::vector<std::string> expired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Date today = m_clock->today();

        for (auto it = m_positions.begin(); it != m_positions.end();) {
            std::optional<Date> expiry = ExpiryParser::parse(it->first);
            if (!expiry) {
                m_logger->debug("Could not derive an expiry from {}", it->first);
                ++it;
                continue;
            }
            if (*expiry < today) {
                m_logger->info("Removing expired position: {} (expired {})", it->first, expiry->toString());
                expired.push_back(it->first);
                it = m_positions.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (!expired.empty()) {
        m_logger->info("Auto-removed {} expired positions", expired.size());
        notifyRemoved(expired);
    }
    return static_cast<int>(expired.size());
}

std::optional<Position> PositionStore::applyPrice(const std::string& tradingSymbol, double ltp, bool& changed) {
    changed = false;
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_positions.find(tradingSymbol);
    if (it == m_positions.end() || it->second.exitInProgress) {
        return std::nullopt;
    }

    Position& pos = it->second;
    if (std::abs(pos.lastPrice - ltp) > 1e-9) {
        pos.lastPrice = ltp;
        pos.pnl = pos.pnlAt(ltp);
        changed = true;
    }
    return pos;
}

bool PositionStore::tryBeginExit(const std::string& tradingSymbol) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_positions.find(tradingSymbol);
    if (it == m_positions.end() || it->second.exitInProgress) {
        return false;
    }
    it->second.exitInProgress = true;
    return true;
}

void PositionStore::abortExit(const std::string& tradingSymbol) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_positions.find(tradingSymbol);
    if (it != m_positions.end()) {
        it->second.exitInProgress = false;
    }
}

bool PositionStore::completeExit(const std::string& tradingSymbol, const std::string& orderId, double exitPrice) {
    Position exited;
    PendingExit pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_positions.find(tradingSymbol);
        if (it == m_positions.end()) {
            m_logger->warn("completeExit: no position for {}", tradingSymbol);
            return false;
        }
        exited = it->second;
        if (exitPrice <= 0.0) {
            exitPrice = exited.lastPrice;
        }

        pending.orderId = orderId;
        pending.pnl = exitPrice > 0.0 ? exited.pnlAt(exitPrice) : exited.pnl;
        pending.snapshot = exited;
        pending.record.orderId = orderId;
        pending.record.timestamp = formatDateTime(m_clock->now());
        pending.record.tradingSymbol = tradingSymbol;
        pending.record.transactionType = toString(closingSide(exited.quantity));
        pending.record.quantity = std::abs(exited.quantity);
        pending.record.averagePrice = exitPrice;
        pending.record.status = toString(OrderStatus::COMPLETE);
        pending.record.product = toString(exited.product);
        pending.record.pnl = pending.pnl;

        m_positions.erase(it);
        foldRealizedPnl(pending.pnl);
        pending.date = m_realizedDate;
        m_pendingExits[tradingSymbol] = pending;
    }

    m_logger->info("Exited {} x{} @ {:.2f}, realized P&L {:.2f}", tradingSymbol, exited.quantity, exitPrice,
                   pending.pnl);

    if (m_pnlJournal) {
        m_pnlJournal->logPnl(pending.date, pending.pnl);
    }
    if (m_tradeJournal) {
        m_tradeJournal->logTrade(pending.record);
    }

    notifyRemoved({tradingSymbol});
    notifyPositionsChanged();
    return true;
}

bool PositionStore::setStopLoss(const std::string& tradingSymbol, double price, std::optional<int> trailingSteps) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_positions.find(tradingSymbol);
    if (it == m_positions.end()) {
        return false;
    }
    it->second.stopLoss = price;
    if (trailingSteps) {
        it->second.trailingSteps = *trailingSteps;
    }
    return true;
}

bool PositionStore::setProtection(const std::string& tradingSymbol,
                                  std::optional<double> stopLoss,
                                  std::optional<double> target,
                                  std::optional<double> trailingDistance) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_positions.find(tradingSymbol);
    if (it == m_positions.end()) {
        return false;
    }
    Position& pos = it->second;
    pos.stopLoss = (stopLoss && *stopLoss > 0.0) ? stopLoss : std::nullopt;
    pos.target = (target && *target > 0.0) ? target : std::nullopt;
    pos.trailingDistance = (trailingDistance && *trailingDistance > 0.0) ? trailingDistance : std::nullopt;
    pos.trailingSteps = 0;
    return true;
}

bool PositionStore::setLegOrderIds(const std::string& tradingSymbol,
                                   std::optional<std::string> stopLossOrderId,
                                   std::optional<std::string> targetOrderId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_positions.find(tradingSymbol);
    if (it == m_positions.end()) {
        return false;
    }
    it->second.stopLossOrderId = std::move(stopLossOrderId);
    it->second.targetOrderId = std::move(targetOrderId);
    return true;
}

void PositionStore::notifyPositionsChanged() {
    std::vector<Position> positions = getAllPositions();
    for (const auto& observer : m_observers) {
        observer->onPositionsChanged(positions);
    }
}

std::optional<std::string> PositionStore::checkPendingExit(
        PendingExit& exit, const std::map<std::string, OrderStatus>& orderStatuses) const {
    auto it = orderStatuses.find(exit.orderId);
    if (it == orderStatuses.end()) {
        ++exit.unlistedPasses;
        m_logger->debug("Exit order {} not listed by the broker ({}/{})", exit.orderId, exit.unlistedPasses,
                        kExitConfirmPasses);
        if (exit.unlistedPasses >= kExitConfirmPasses) {
            return std::string("UNCONFIRMED");
        }
        return std::nullopt;
    }

    exit.unlistedPasses = 0;
    if (it->second == OrderStatus::REJECTED || it->second == OrderStatus::CANCELLED) {
        return toString(it->second);
    }
    return std::nullopt;
}

void PositionStore::foldRealizedPnl(double pnl) {
    Date today = m_clock->today();
    if (today != m_realizedDate) {
        m_realizedDate = today;
        m_realizedPnlToday = 0.0;
    }
    m_realizedPnlToday += pnl;
}

void PositionStore::notifyRemoved(const std::vector<std::string>& symbols) {
    for (const auto& symbol : symbols) {
        for (const auto& observer : m_observers) {
            observer->onPositionRemoved(symbol);
        }
    }
}

}  // namespace OptionsScalper
