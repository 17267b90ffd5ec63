/**
 * @file OrderModel.hpp
 * @brief Order vocabulary and the broker order boundary struct
 */

#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace OptionsScalper {

/**
 * @enum OrderType
 * @brief Types of orders
 */
enum class OrderType {
    UNKNOWN,
    MARKET,
    LIMIT,
    STOP_LOSS,
    STOP_LOSS_MARKET
};

/**
 * @enum TransactionType
 * @brief Types of transactions
 */
enum class TransactionType {
    UNKNOWN,
    BUY,
    SELL
};

/**
 * @enum OrderStatus
 * @brief Status of an order as reported by the broker
 */
enum class OrderStatus {
    UNKNOWN,
    OPEN,
    TRIGGER_PENDING,
    AMO_REQ_RECEIVED,    // After-market order waiting for the open
    PENDING_EXECUTION,   // Paper only: market order waiting for a first price
    COMPLETE,
    REJECTED,
    CANCELLED
};

/**
 * @enum ProductType
 * @brief Product types for orders
 */
enum class ProductType {
    UNKNOWN,
    CNC,     // Cash and Carry
    NRML,    // Normal (carry forward)
    MIS      // Margin Intraday Square-off
};

/**
 * @enum Variety
 * @brief Order variety
 */
enum class Variety {
    UNKNOWN,
    REGULAR,
    AMO,     // After Market Order
    CO       // Cover Order
};

std::string toString(OrderType type);
std::string toString(TransactionType type);
std::string toString(OrderStatus status);
std::string toString(ProductType type);
std::string toString(Variety variety);

OrderType orderTypeFromString(const std::string& typeStr);
TransactionType transactionTypeFromString(const std::string& typeStr);
OrderStatus orderStatusFromString(const std::string& statusStr);
ProductType productTypeFromString(const std::string& typeStr);
Variety varietyFromString(const std::string& varietyStr);

/**
 * @brief Side that closes a position of the given sign
 * @param quantity Signed position quantity
 */
inline TransactionType closingSide(int quantity) {
    return quantity > 0 ? TransactionType::SELL : TransactionType::BUY;
}

/**
 * @brief Whether the status means the order can no longer change
 */
inline bool isTerminal(OrderStatus status) {
    return status == OrderStatus::COMPLETE || status == OrderStatus::REJECTED ||
           status == OrderStatus::CANCELLED;
}

/**
 * @struct RawOrder
 * @brief Broker order payload with named fields
 */
struct RawOrder {
    std::string orderId;                             ///< Unique order ID
    std::string exchangeOrderId;                     ///< Exchange order ID
    std::string tradingSymbol;                       ///< Trading symbol
    std::string exchange;                            ///< Exchange
    uint32_t instrumentToken = 0;                    ///< Instrument token

    TransactionType transactionType = TransactionType::UNKNOWN;
    OrderType orderType = OrderType::UNKNOWN;
    ProductType product = ProductType::UNKNOWN;
    Variety variety = Variety::UNKNOWN;

    int quantity = 0;                                ///< Order quantity
    int filledQuantity = 0;                          ///< Filled quantity
    int pendingQuantity = 0;                         ///< Pending quantity

    double price = 0.0;                              ///< Limit price
    double triggerPrice = 0.0;                       ///< Trigger price for SL orders
    double averagePrice = 0.0;                       ///< Average execution price

    OrderStatus status = OrderStatus::UNKNOWN;       ///< Order status
    std::string statusMessage;                       ///< Rejection or status message
    std::chrono::system_clock::time_point orderTime; ///< Time of order placement
    std::string tag;                                 ///< User-defined tag
};

/**
 * @struct PendingOrder
 * @brief Non-terminal order shown as working at the broker
 */
struct PendingOrder {
    std::string orderId;
    std::string tradingSymbol;
    TransactionType transactionType = TransactionType::UNKNOWN;
    OrderType orderType = OrderType::UNKNOWN;
    int quantity = 0;
    double price = 0.0;
    double triggerPrice = 0.0;
    OrderStatus status = OrderStatus::UNKNOWN;

    /**
     * @brief Whether a broker status belongs in the pending set
     *        (OPEN, TRIGGER PENDING or AMO REQ RECEIVED)
     */
    static bool isPendingStatus(OrderStatus status);

    static PendingOrder fromRaw(const RawOrder& raw);
};

}  // namespace OptionsScalper
