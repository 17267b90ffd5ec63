/**
 * @file OrderModel.cpp
 * @brief String conversions for the order vocabulary
 */

#include "../models/OrderModel.hpp"

namespace OptionsScalper {

std::string toString(OrderType type) {
    switch (type) {
        case OrderType::MARKET:            return "MARKET";
        case OrderType::LIMIT:             return "LIMIT";
        case OrderType::STOP_LOSS:         return "SL";
        case OrderType::STOP_LOSS_MARKET:  return "SL-M";
        default:                           return "UNKNOWN";
    }
}

OrderType orderTypeFromString(const std::string& typeStr) {
    if (typeStr == "MARKET")   return OrderType::MARKET;
    if (typeStr == "LIMIT")    return OrderType::LIMIT;
    if (typeStr == "SL")       return OrderType::STOP_LOSS;
    if (typeStr == "SL-M")     return OrderType::STOP_LOSS_MARKET;
    return OrderType::UNKNOWN;
}

std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::BUY:  return "BUY";
        case TransactionType::SELL: return "SELL";
        default:                    return "UNKNOWN";
    }
}

TransactionType transactionTypeFromString(const std::string& typeStr) {
    if (typeStr == "BUY")  return TransactionType::BUY;
    if (typeStr == "SELL") return TransactionType::SELL;
    return TransactionType::UNKNOWN;
}

std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::OPEN:              return "OPEN";
        case OrderStatus::TRIGGER_PENDING:   return "TRIGGER PENDING";
        case OrderStatus::AMO_REQ_RECEIVED:  return "AMO REQ RECEIVED";
        case OrderStatus::PENDING_EXECUTION: return "PENDING EXECUTION";
        case OrderStatus::COMPLETE:          return "COMPLETE";
        case OrderStatus::REJECTED:          return "REJECTED";
        case OrderStatus::CANCELLED:         return "CANCELLED";
        default:                             return "UNKNOWN";
    }
}

OrderStatus orderStatusFromString(const std::string& statusStr) {
    if (statusStr == "OPEN")               return OrderStatus::OPEN;
    if (statusStr == "TRIGGER PENDING")    return OrderStatus::TRIGGER_PENDING;
    if (statusStr == "AMO REQ RECEIVED")   return OrderStatus::AMO_REQ_RECEIVED;
    if (statusStr == "PENDING EXECUTION")  return OrderStatus::PENDING_EXECUTION;
    if (statusStr == "COMPLETE")           return OrderStatus::COMPLETE;
    if (statusStr == "REJECTED")           return OrderStatus::REJECTED;
    if (statusStr == "CANCELLED")          return OrderStatus::CANCELLED;
    return OrderStatus::UNKNOWN;
}

std::string toString(ProductType type) {
    switch (type) {
        case ProductType::CNC:  return "CNC";
        case ProductType::NRML: return "NRML";
        case ProductType::MIS:  return "MIS";
        default:                return "UNKNOWN";
    }
}

ProductType productTypeFromString(const std::string& typeStr) {
    if (typeStr == "CNC")  return ProductType::CNC;
    if (typeStr == "NRML") return ProductType::NRML;
    if (typeStr == "MIS")  return ProductType::MIS;
    return ProductType::UNKNOWN;
}

std::string toString(Variety variety) {
    switch (variety) {
        case Variety::REGULAR: return "regular";
        case Variety::AMO:     return "amo";
        case Variety::CO:      return "co";
        default:               return "unknown";
    }
}

Variety varietyFromString(const std::string& varietyStr) {
    if (varietyStr == "regular") return Variety::REGULAR;
    if (varietyStr == "amo")     return Variety::AMO;
    if (varietyStr == "co")      return Variety::CO;
    return Variety::UNKNOWN;
}

bool PendingOrder::isPendingStatus(OrderStatus status) {
    return status == OrderStatus::OPEN || status == OrderStatus::TRIGGER_PENDING ||
           status == OrderStatus::AMO_REQ_RECEIVED;
}

PendingOrder PendingOrder::fromRaw(const RawOrder& raw) {
    PendingOrder order;
    order.orderId = raw.orderId;
    order.tradingSymbol = raw.tradingSymbol;
    order.transactionType = raw.transactionType;
    order.orderType = raw.orderType;
    order.quantity = raw.quantity;
    order.price = raw.price;
    order.triggerPrice = raw.triggerPrice;
    order.status = raw.status;
    return order;
}

}  // namespace OptionsScalper
