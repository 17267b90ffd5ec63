/**
 * @file ExecutionClient.hpp
 * @brief Broker-facing execution interface shared by live and paper trading
 */

#pragma once

#include <string>
#include <optional>
#include <vector>
#include "../models/OrderModel.hpp"
#include "../models/PositionModel.hpp"

namespace OptionsScalper {

/**
 * @enum CancelResult
 * @brief Outcome of a cancellation request
 */
enum class CancelResult {
    CANCELLED,          ///< The order was working and is now cancelled
    ALREADY_TERMINAL,   ///< The order had already completed, been rejected or cancelled
    NOT_FOUND           ///< The broker does not know the order id
};

inline std::string toString(CancelResult result) {
    switch (result) {
        case CancelResult::CANCELLED:        return "CANCELLED";
        case CancelResult::ALREADY_TERMINAL: return "ALREADY_TERMINAL";
        case CancelResult::NOT_FOUND:        return "NOT_FOUND";
        default:                             return "UNKNOWN";
    }
}

/**
 * @struct MarginSnapshot
 * @brief Account funds as reported by the broker
 */
struct MarginSnapshot {
    double equityNet = 0.0;
    double commodityNet = 0.0;
    double utilised = 0.0;
    double available = 0.0;

    double totalNet() const { return equityNet + commodityNet; }
};

/**
 * @struct UserProfile
 * @brief Identity of the logged-in account
 */
struct UserProfile {
    std::string userId;
    std::string userName;
    std::string email;
    std::string broker;
};

/**
 * @struct OrderRequest
 * @brief Parameters of a new order
 */
struct OrderRequest {
    Variety variety = Variety::REGULAR;
    std::string exchange = "NFO";
    std::string tradingSymbol;
    TransactionType side = TransactionType::UNKNOWN;
    int quantity = 0;
    ProductType product = ProductType::NRML;
    OrderType orderType = OrderType::MARKET;
    std::optional<double> price;          ///< Required for LIMIT and SL
    std::optional<double> triggerPrice;   ///< Required for SL and SL-M
    std::string tag;

    static OrderRequest market(const std::string& exchange, const std::string& tradingSymbol,
                               TransactionType side, int quantity, ProductType product) {
        OrderRequest request;
        request.exchange = exchange;
        request.tradingSymbol = tradingSymbol;
        request.side = side;
        request.quantity = quantity;
        request.product = product;
        request.orderType = OrderType::MARKET;
        return request;
    }

    static OrderRequest limit(const std::string& exchange, const std::string& tradingSymbol,
                              TransactionType side, int quantity, ProductType product, double price) {
        OrderRequest request = market(exchange, tradingSymbol, side, quantity, product);
        request.orderType = OrderType::LIMIT;
        request.price = price;
        return request;
    }

    static OrderRequest stopLossMarket(const std::string& exchange, const std::string& tradingSymbol,
                                       TransactionType side, int quantity, ProductType product,
                                       double triggerPrice) {
        OrderRequest request = market(exchange, tradingSymbol, side, quantity, product);
        request.orderType = OrderType::STOP_LOSS_MARKET;
        request.triggerPrice = triggerPrice;
        return request;
    }
};

/**
 * @class ExecutionClient
 * @brief Order placement and account queries against a broker or a simulator
 *
 * Every call may throw ApiError or one of its subclasses. Callers in the
 * trading core catch at the call site and turn failures into notifications.
 */
class ExecutionClient {
public:
    virtual ~ExecutionClient() = default;

    /**
     * @brief Submit an order
     * @return Broker order id
     */
    virtual std::string placeOrder(const OrderRequest& request) = 0;

    virtual CancelResult cancelOrder(Variety variety, const std::string& orderId) = 0;

    /**
     * @brief Net positions, including closed ones with zero quantity
     */
    virtual std::vector<RawPosition> getPositions() = 0;

    /**
     * @brief All orders of the trading day
     */
    virtual std::vector<RawOrder> getOrders() = 0;

    virtual MarginSnapshot getMargins() = 0;
    virtual UserProfile getProfile() = 0;

    /**
     * @brief "live" or "paper"; selects the journal files
     */
    virtual std::string getModeName() const = 0;
};

}  // namespace OptionsScalper
