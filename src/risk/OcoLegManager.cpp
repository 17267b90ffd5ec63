/**
 * @file OcoLegManager.cpp
 * @brief Implementation of the OcoLegManager class
 */

#include "../risk/OcoLegManager.hpp"
#include <cstdlib>
#include <unordered_map>

namespace OptionsScalper {

OcoLegManager::OcoLegManager(std::shared_ptr<PositionStore> store,
                             std::shared_ptr<ExecutionClient> client,
                             std::shared_ptr<Logger> logger)
    : m_store(store), m_client(client), m_logger(logger) {
}

bool OcoLegManager::placeBracketOrder(const std::string& tradingSymbol) {
    std::optional<Position> position = m_store->getPosition(tradingSymbol);
    if (!position) {
        m_logger->warn("Cannot place bracket for {}: position not found", tradingSymbol);
        return false;
    }

    const TransactionType side = closingSide(position->quantity);
    const int quantity = std::abs(position->quantity);

    std::optional<std::string> stopLossOrderId;
    std::optional<std::string> targetOrderId;

    if (position->stopLoss) {
        try {
            stopLossOrderId = m_client->placeOrder(OrderRequest::stopLossMarket(
                position->exchange, tradingSymbol, side, quantity, position->product, *position->stopLoss));
            m_logger->info("Stop-loss leg {} placed for {} at trigger {:.2f}",
                           *stopLossOrderId, tradingSymbol, *position->stopLoss);
        } catch (const std::exception& e) {
            m_logger->error("Failed to place stop-loss leg for {}: {}", tradingSymbol, e.what());
        }
    }

    if (position->target) {
        try {
            targetOrderId = m_client->placeOrder(OrderRequest::limit(
                position->exchange, tradingSymbol, side, quantity, position->product, *position->target));
            m_logger->info("Target leg {} placed for {} at {:.2f}", *targetOrderId, tradingSymbol, *position->target);
        } catch (const std::exception& e) {
            m_logger->error("Failed to place target leg for {}: {}", tradingSymbol, e.what());
        }
    }

    if (!stopLossOrderId && !targetOrderId) {
        return false;
    }

    m_store->setLegOrderIds(tradingSymbol, stopLossOrderId, targetOrderId);
    return true;
}

void OcoLegManager::reconcileLegs(const std::vector<RawOrder>& brokerOrders) {
    std::unordered_map<std::string, OrderStatus> statusById;
    for (const auto& order : brokerOrders) {
        statusById[order.orderId] = order.status;
    }

    auto statusOf = [&statusById](const std::optional<std::string>& orderId) {
        if (!orderId) {
            return OrderStatus::UNKNOWN;
        }
        auto it = statusById.find(*orderId);
        return it != statusById.end() ? it->second : OrderStatus::UNKNOWN;
    };

    for (const auto& position : m_store->getAllPositions()) {
        if (!position.hasLegs()) {
            continue;
        }

        std::optional<std::string> stopLossId = position.stopLossOrderId;
        std::optional<std::string> targetId = position.targetOrderId;
        const OrderStatus stopLossStatus = statusOf(stopLossId);
        const OrderStatus targetStatus = statusOf(targetId);

        if (stopLossId && stopLossStatus == OrderStatus::COMPLETE && targetId) {
            m_logger->info("Stop-loss leg {} filled for {}, cancelling target leg {}",
                           *stopLossId, position.tradingSymbol, *targetId);
            cancelLeg(*targetId, position.tradingSymbol);
            targetId.reset();
        } else if (targetId && targetStatus == OrderStatus::COMPLETE && stopLossId) {
            m_logger->info("Target leg {} filled for {}, cancelling stop-loss leg {}",
                           *targetId, position.tradingSymbol, *stopLossId);
            cancelLeg(*stopLossId, position.tradingSymbol);
            stopLossId.reset();
        }

        if (stopLossId && (stopLossStatus == OrderStatus::CANCELLED || stopLossStatus == OrderStatus::REJECTED)) {
            m_logger->warn("Stop-loss leg {} for {} is {}", *stopLossId, position.tradingSymbol,
                           toString(stopLossStatus));
            stopLossId.reset();
        }
        if (targetId && (targetStatus == OrderStatus::CANCELLED || targetStatus == OrderStatus::REJECTED)) {
            m_logger->warn("Target leg {} for {} is {}", *targetId, position.tradingSymbol, toString(targetStatus));
            targetId.reset();
        }

        if (stopLossId != position.stopLossOrderId || targetId != position.targetOrderId) {
            m_store->setLegOrderIds(position.tradingSymbol, stopLossId, targetId);
        }
    }
}

bool OcoLegManager::updateProtection(const std::string& tradingSymbol,
                                     std::optional<double> stopLoss,
                                     std::optional<double> target,
                                     std::optional<double> trailingDistance) {
    std::optional<Position> position = m_store->getPosition(tradingSymbol);
    if (!position) {
        m_logger->warn("Cannot update protection for {}: position not found", tradingSymbol);
        return false;
    }

    if (position->stopLossOrderId) {
        cancelLeg(*position->stopLossOrderId, tradingSymbol);
    }
    if (position->targetOrderId) {
        cancelLeg(*position->targetOrderId, tradingSymbol);
    }

    m_store->setLegOrderIds(tradingSymbol, std::nullopt, std::nullopt);
    if (!m_store->setProtection(tradingSymbol, stopLoss, target, trailingDistance)) {
        m_logger->warn("Position {} disappeared while updating protection", tradingSymbol);
        return false;
    }

    placeBracketOrder(tradingSymbol);
    m_store->notifyPositionsChanged();
    return true;
}

void OcoLegManager::cancelLeg(const std::string& orderId, const std::string& tradingSymbol) {
    try {
        CancelResult result = m_client->cancelOrder(Variety::REGULAR, orderId);
        if (result == CancelResult::CANCELLED) {
            m_logger->info("Cancelled leg {} for {}", orderId, tradingSymbol);
        } else {
            m_logger->info("Leg {} for {} not cancelled: {}", orderId, tradingSymbol, toString(result));
        }
    } catch (const std::exception& e) {
        m_logger->error("Failed to cancel leg {} for {}: {}", orderId, tradingSymbol, e.what());
    }
}

}  // namespace OptionsScalper
