/**
 * @file OcoLegManager.hpp
 * @brief One-cancels-other handling of protective stop-loss and target legs
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../models/OrderModel.hpp"
#include "../positions/PositionStore.hpp"
#include "../positions/StoreObserver.hpp"
#include "../trading/ExecutionClient.hpp"
#include "../utils/Logger.hpp"

namespace OptionsScalper {

/**
 * @class OcoLegManager
 * @brief Places protective legs and cancels the survivor once one fills
 *
 * A position carries at most one stop-loss leg (SL-M at the stop price) and
 * one target leg (LIMIT at the target price), both on the closing side.
 * Cancellation problems are logged and never escalated.
 */
class OcoLegManager : public LegReconciler {
public:
    OcoLegManager(std::shared_ptr<PositionStore> store,
                  std::shared_ptr<ExecutionClient> client,
                  std::shared_ptr<Logger> logger);

    /**
     * @brief Place legs for the position's stop loss and target
     * @return True if at least one leg was placed
     */
    bool placeBracketOrder(const std::string& tradingSymbol);

    /**
     * @brief Cancel the opposite leg of any leg the broker reports COMPLETE
     *
     * Leg ids the broker reports CANCELLED or REJECTED are cleared.
     */
    void reconcileLegs(const std::vector<RawOrder>& brokerOrders) override;

    /**
     * @brief Replace protection: cancel legs, overwrite parameters, re-issue legs
     *
     * Empty or non-positive values clear the corresponding parameter.
     */
    bool updateProtection(const std::string& tradingSymbol,
                          std::optional<double> stopLoss,
                          std::optional<double> target,
                          std::optional<double> trailingDistance);

private:
    void cancelLeg(const std::string& orderId, const std::string& tradingSymbol);

    std::shared_ptr<PositionStore> m_store;
    std::shared_ptr<ExecutionClient> m_client;
    std::shared_ptr<Logger> m_logger;
};

}  // namespace OptionsScalper
