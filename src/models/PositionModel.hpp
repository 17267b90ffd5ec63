/**
 * @file PositionModel.hpp
 * @brief Open position state and the broker position boundary struct
 */

#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include "../models/OrderModel.hpp"

namespace OptionsScalper {

/**
 * @struct RawPosition
 * @brief Broker net-position payload with named fields
 */
struct RawPosition {
    std::string tradingSymbol;
    std::string exchange;
    uint32_t instrumentToken = 0;
    ProductType product = ProductType::UNKNOWN;
    int quantity = 0;                 ///< Signed net quantity
    double averagePrice = 0.0;
    double lastPrice = 0.0;
    double pnl = 0.0;                 ///< Broker-computed P&L
};

/**
 * @struct Position
 * @brief One open position, keyed by trading symbol
 *
 * Quantity is never zero while the position exists. At most one stop-loss
 * leg id and one target leg id are live at a time.
 */
struct Position {
    std::string tradingSymbol;
    int quantity = 0;                            ///< Signed, positive is long
    double averagePrice = 0.0;
    double lastPrice = 0.0;
    double pnl = 0.0;                            ///< Floating P&L at lastPrice
    uint32_t instrumentToken = 0;                ///< 0 for a placeholder contract
    std::string exchange = "NFO";
    ProductType product = ProductType::NRML;

    std::optional<double> stopLoss;              ///< Stop-loss price
    std::optional<double> target;                ///< Target price
    std::optional<double> trailingDistance;      ///< Trailing-stop distance
    int trailingSteps = 0;                       ///< Trailing steps already applied to stopLoss

    std::optional<std::string> stopLossOrderId;  ///< Live SL leg
    std::optional<std::string> targetOrderId;    ///< Live target leg
    std::optional<std::string> entryOrderId;     ///< Order that opened the position

    bool exitInProgress = false;

    bool isLong() const { return quantity > 0; }
    bool hasLegs() const { return stopLossOrderId.has_value() || targetOrderId.has_value(); }

    /**
     * @brief Floating P&L for a given price, (price - average) * quantity
     */
    double pnlAt(double price) const { return (price - averagePrice) * quantity; }
};

}  // namespace OptionsScalper
