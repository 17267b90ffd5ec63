/**
 * @file OrderEntry.cpp
 * @brief Implementation of the OrderEntry class
 */

#include "../trading/OrderEntry.hpp"
#include <chrono>
#include <thread>
#include "../utils/Errors.hpp"

namespace OptionsScalper {

namespace {

std::optional<double> positiveOrEmpty(std::optional<double> value) {
    if (value && *value > 0.0) {
        return value;
    }
    return std::nullopt;
}

}  // namespace

std::string toString(EntryStatus status) {
    switch (status) {
        case EntryStatus::FILLED:      return "FILLED";
        case EntryStatus::WORKING:     return "WORKING";
        case EntryStatus::REJECTED:    return "REJECTED";
        case EntryStatus::UNCONFIRMED: return "UNCONFIRMED";
        case EntryStatus::FAILED:      return "FAILED";
        default:                       return "UNKNOWN";
    }
}

OrderEntry::OrderEntry(const TerminalSettings& settings,
                       std::shared_ptr<ExecutionClient> client,
                       std::shared_ptr<PositionStore> store,
                       std::shared_ptr<OcoLegManager> legManager,
                       std::shared_ptr<TradeJournal> tradeJournal,
                       std::shared_ptr<Logger> logger)
    : m_confirmRetries(settings.orderConfirmRetries),
      m_confirmDelayMs(settings.orderConfirmDelayMs),
      m_client(client),
      m_store(store),
      m_legManager(legManager),
      m_tradeJournal(tradeJournal),
      m_logger(logger) {
}

EntryResult OrderEntry::buy(const Contract& contract,
                            int quantity,
                            ProductType product,
                            OrderType orderType,
                            std::optional<double> limitPrice,
                            std::optional<double> stopLoss,
                            std::optional<double> target,
                            std::optional<double> trailingDistance) {
    EntryResult result;

    if (quantity <= 0 || contract.tradingSymbol.empty()) {
        result.message = "Missing contract or quantity for the order";
        m_logger->error("{}", result.message);
        return result;
    }
    if (orderType == OrderType::LIMIT && !positiveOrEmpty(limitPrice)) {
        result.message = "Limit order for " + contract.tradingSymbol + " has no price";
        m_logger->error("{}", result.message);
        return result;
    }

    OrderRequest request = orderType == OrderType::LIMIT
        ? OrderRequest::limit(contract.exchange, contract.tradingSymbol, TransactionType::BUY,
                              quantity, product, *limitPrice)
        : OrderRequest::market(contract.exchange, contract.tradingSymbol, TransactionType::BUY,
                               quantity, product);

    try {
        result.orderId = m_client->placeOrder(request);
    } catch (const RejectedOrderError& e) {
        result.status = EntryStatus::REJECTED;
        result.message = e.what();
        m_logger->error("Order for {} rejected: {}", contract.tradingSymbol, e.what());
        return result;
    } catch (const std::exception& e) {
        result.message = e.what();
        m_logger->error("Order placement for {} failed: {}", contract.tradingSymbol, e.what());
        return result;
    }

    m_logger->info("Entry order {} placed: BUY {} x{}", result.orderId, contract.tradingSymbol, quantity);

    std::optional<RawOrder> confirmed = confirmOrder(result.orderId);
    if (!confirmed) {
        result.status = EntryStatus::UNCONFIRMED;
        result.message = "Order placed but status not confirmed";
        return result;
    }

    if (confirmed->status == OrderStatus::REJECTED || confirmed->status == OrderStatus::CANCELLED) {
        result.status = EntryStatus::REJECTED;
        result.message = confirmed->statusMessage;
        m_logger->warn("Entry order {} was {}: {}", result.orderId, toString(confirmed->status),
                       confirmed->statusMessage);
        return result;
    }

    if (confirmed->status != OrderStatus::COMPLETE) {
        result.status = EntryStatus::WORKING;
        m_logger->info("Entry order {} is {}, leaving it to reconciliation", result.orderId,
                       toString(confirmed->status));
        return result;
    }

    Position position;
    position.tradingSymbol = contract.tradingSymbol;
    position.quantity = confirmed->filledQuantity > 0 ? confirmed->filledQuantity : quantity;
    position.averagePrice = confirmed->averagePrice > 0.0 ? confirmed->averagePrice : limitPrice.value_or(0.0);
    position.lastPrice = position.averagePrice;
    position.pnl = 0.0;
    position.instrumentToken = contract.instrumentToken;
    position.exchange = contract.exchange;
    position.product = product;
    position.stopLoss = positiveOrEmpty(stopLoss);
    position.target = positiveOrEmpty(target);
    position.trailingDistance = positiveOrEmpty(trailingDistance);
    position.entryOrderId = result.orderId;

    std::optional<Position> held = m_store->getPosition(contract.tradingSymbol);
    m_store->addPosition(position);

    TradeRecord record;
    record.orderId = result.orderId;
    record.timestamp = formatDateTime(confirmed->orderTime);
    record.tradingSymbol = contract.tradingSymbol;
    record.transactionType = toString(TransactionType::BUY);
    record.quantity = position.quantity;
    record.averagePrice = position.averagePrice;
    record.status = toString(OrderStatus::COMPLETE);
    record.product = toString(product);
    record.pnl = 0.0;
    m_tradeJournal->logTrade(record);

    if (held) {
        // Legs sized for the held quantity are re-issued for the netted one
        std::optional<double> newStopLoss = position.stopLoss ? position.stopLoss : held->stopLoss;
        std::optional<double> newTarget = position.target ? position.target : held->target;
        std::optional<double> newTrailing = position.trailingDistance ? position.trailingDistance
                                                                      : held->trailingDistance;
        if (newStopLoss || newTarget || held->hasLegs()) {
            m_legManager->updateProtection(contract.tradingSymbol, newStopLoss, newTarget, newTrailing);
        }
    } else if (position.stopLoss || position.target) {
        m_legManager->placeBracketOrder(contract.tradingSymbol);
    }

    result.status = EntryStatus::FILLED;
    m_logger->info("Bought {} x{} @ {:.2f}", contract.tradingSymbol, position.quantity, position.averagePrice);
    return result;
}

std::optional<RawOrder> OrderEntry::confirmOrder(const std::string& orderId) {
    for (int attempt = 1; attempt <= m_confirmRetries; ++attempt) {
        try {
            for (const auto& order : m_client->getOrders()) {
                if (order.orderId != orderId) {
                    continue;
                }
                m_logger->debug("Order {} found with status {}", orderId, toString(order.status));
                if (order.status == OrderStatus::COMPLETE || order.status == OrderStatus::REJECTED ||
                    order.status == OrderStatus::CANCELLED || PendingOrder::isPendingStatus(order.status) ||
                    order.status == OrderStatus::PENDING_EXECUTION) {
                    if (order.status == OrderStatus::COMPLETE && order.filledQuantity == 0) {
                        m_logger->warn("Order {} is COMPLETE but reports no filled quantity", orderId);
                    }
                    return order;
                }
                break;
            }
            m_logger->debug("Order {} not decisive yet, retry {}/{}", orderId, attempt, m_confirmRetries);
        } catch (const std::exception& e) {
            m_logger->warn("Error fetching status of order {} on retry {}: {}", orderId, attempt, e.what());
        }

        if (attempt < m_confirmRetries && m_confirmDelayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(m_confirmDelayMs));
        }
    }

    m_logger->error("Order {} confirmation failed after {} retries", orderId, m_confirmRetries);
    return std::nullopt;
}

}  // namespace OptionsScalper
