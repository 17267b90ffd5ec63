/**
 * @file RiskTriggerEngine.cpp
 * @brief Implementation of the RiskTriggerEngine class
 */

#include "../risk/RiskTriggerEngine.hpp"
#include <cmath>
#include <cstdlib>
#include <unordered_map>

namespace OptionsScalper {

RiskTriggerEngine::RiskTriggerEngine(std::shared_ptr<PositionStore> store,
                                     std::shared_ptr<ExecutionClient> client,
                                     std::shared_ptr<Logger> logger)
    : m_store(store), m_client(client), m_logger(logger) {
}

void RiskTriggerEngine::onTicks(const std::vector<Tick>& ticks) {
    if (ticks.empty()) {
        return;
    }

    std::unordered_map<uint32_t, double> latest;
    for (const auto& tick : ticks) {
        latest[tick.instrumentToken] = tick.lastPrice;
    }

    bool anyChanged = false;
    for (const auto& snapshot : m_store->getAllPositions()) {
        if (snapshot.instrumentToken == 0 || snapshot.exitInProgress) {
            continue;
        }
        auto it = latest.find(snapshot.instrumentToken);
        if (it == latest.end()) {
            continue;
        }

        bool changed = false;
        std::optional<Position> updated = m_store->applyPrice(snapshot.tradingSymbol, it->second, changed);
        if (!updated) {
            continue;
        }
        anyChanged = anyChanged || changed;
        evaluate(*updated, it->second);
    }

    if (anyChanged) {
        m_store->notifyPositionsChanged();
    }
}

bool RiskTriggerEngine::exitPosition(const std::string& tradingSymbol) {
    std::optional<Position> position = m_store->getPosition(tradingSymbol);
    if (!position) {
        m_logger->warn("Exit requested for unknown position {}", tradingSymbol);
        return false;
    }
    return submitExit(*position, position->lastPrice, "manual exit");
}

int RiskTriggerEngine::exitAllPositions() {
    std::vector<Position> positions = m_store->getAllPositions();
    m_logger->info("Exiting all {} positions", positions.size());

    int exited = 0;
    for (const auto& position : positions) {
        if (position.quantity != 0 && submitExit(position, position.lastPrice, "exit all")) {
            ++exited;
        }
    }

    if (exited < static_cast<int>(positions.size())) {
        m_logger->warn("Exit all incomplete: {} of {} exit orders accepted", exited, positions.size());
    }
    return exited;
}

void RiskTriggerEngine::evaluate(const Position& position, double ltp) {
    // +1 for long, -1 for short; all comparisons are made in the position's favour
    const double direction = position.isLong() ? 1.0 : -1.0;

    if (position.stopLoss && direction * (ltp - *position.stopLoss) <= 0.0) {
        m_logger->info("Stop loss hit for {}: ltp {:.2f}, stop {:.2f}", position.tradingSymbol, ltp, *position.stopLoss);
        submitExit(position, ltp, "stop loss");
        return;
    }

    if (position.target && direction * (ltp - *position.target) >= 0.0) {
        m_logger->info("Target hit for {}: ltp {:.2f}, target {:.2f}", position.tradingSymbol, ltp, *position.target);
        submitExit(position, ltp, "target");
        return;
    }

    if (position.trailingDistance && position.stopLoss && *position.trailingDistance > 0.0) {
        double favourable = direction * (ltp - position.averagePrice);
        if (favourable <= 0.0) {
            return;
        }

        const double distance = *position.trailingDistance;
        int steps = static_cast<int>(std::floor(favourable / distance));
        if (steps > position.trailingSteps) {
            double newStop = *position.stopLoss + direction * (steps - position.trailingSteps) * distance;
            m_store->setStopLoss(position.tradingSymbol, newStop, steps);
            m_logger->info("Trailing stop for {} moved {:.2f} -> {:.2f}", position.tradingSymbol,
                           *position.stopLoss, newStop);
        }
    }
}

bool RiskTriggerEngine::submitExit(const Position& position, double exitPrice, const std::string& reason) {
    const std::string& symbol = position.tradingSymbol;
    if (!m_store->tryBeginExit(symbol)) {
        m_logger->debug("Exit for {} already in progress", symbol);
        return false;
    }

    OrderRequest request = OrderRequest::market(position.exchange, symbol, closingSide(position.quantity),
                                                std::abs(position.quantity), position.product);
    std::string orderId;
    try {
        orderId = m_client->placeOrder(request);
    } catch (const std::exception& e) {
        m_logger->error("Exit order for {} ({}) failed: {}", symbol, reason, e.what());
        m_store->abortExit(symbol);
        return false;
    }

    m_logger->info("Exit order {} placed for {} x{} ({})", orderId, symbol, std::abs(position.quantity), reason);
    m_store->completeExit(symbol, orderId, exitPrice);
    cancelLegs(position);
    return true;
}

void RiskTriggerEngine::cancelLegs(const Position& position) {
    for (const auto& legId : {position.stopLossOrderId, position.targetOrderId}) {
        if (!legId) {
            continue;
        }
        try {
            CancelResult result = m_client->cancelOrder(Variety::REGULAR, *legId);
            if (result != CancelResult::CANCELLED) {
                m_logger->info("Protective leg {} for {} not cancelled: {}", *legId, position.tradingSymbol,
                               toString(result));
            }
        } catch (const std::exception& e) {
            m_logger->warn("Failed to cancel protective leg {} for {}: {}", *legId, position.tradingSymbol,
                           e.what());
        }
    }
}

}  // namespace OptionsScalper
