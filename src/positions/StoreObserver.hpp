/**
 * @file StoreObserver.hpp
 * @brief Notifications published by the position store
 */

#pragma once

#include <string>
#include <vector>
#include "../models/OrderModel.hpp"
#include "../models/PositionModel.hpp"

namespace OptionsScalper {

/**
 * @class StoreObserver
 * @brief Receives store notifications; every handler defaults to a no-op
 *
 * Handlers run on the thread that mutated the store, after its lock is
 * released, so they may call back into the store.
 */
class StoreObserver {
public:
    virtual ~StoreObserver() = default;

    virtual void onPositionsChanged(const std::vector<Position>& /*positions*/) {}
    virtual void onPendingOrdersChanged(const std::vector<PendingOrder>& /*orders*/) {}
    virtual void onPositionAdded(const Position& /*position*/) {}
    virtual void onPositionRemoved(const std::string& /*tradingSymbol*/) {}
    virtual void onRefreshCompleted(bool /*success*/) {}
    virtual void onApiError(const std::string& /*message*/) {}
};

/**
 * @class LegReconciler
 * @brief Hook run against the broker order list during each refresh
 */
class LegReconciler {
public:
    virtual ~LegReconciler() = default;
    virtual void reconcileLegs(const std::vector<RawOrder>& brokerOrders) = 0;
};

}  // namespace OptionsScalper
