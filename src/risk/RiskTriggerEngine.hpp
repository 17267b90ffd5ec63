/**
 * @file RiskTriggerEngine.hpp
 * @brief Per-tick stop-loss, target and trailing-stop evaluation
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "../market/TickerTransport.hpp"
#include "../models/PositionModel.hpp"
#include "../positions/PositionStore.hpp"
#include "../trading/ExecutionClient.hpp"
#include "../utils/Logger.hpp"

namespace OptionsScalper {

/**
 * @class RiskTriggerEngine
 * @brief Marks positions to market on every tick batch and exits on a trigger
 *
 * Triggers are checked in the order stop loss, target, trailing stop, and
 * evaluation of a position stops once it exits. The trailing stop is local:
 * it only ever ratchets the stored stop loss in the position's favour.
 */
class RiskTriggerEngine {
public:
    RiskTriggerEngine(std::shared_ptr<PositionStore> store,
                      std::shared_ptr<ExecutionClient> client,
                      std::shared_ptr<Logger> logger);

    /**
     * @brief Process one tick batch to completion
     */
    void onTicks(const std::vector<Tick>& ticks);

    /**
     * @brief Exit one position at market
     * @return True if the exit order was accepted
     */
    bool exitPosition(const std::string& tradingSymbol);

    /**
     * @brief Exit every open position at market
     * @return Number of positions whose exit order was accepted
     */
    int exitAllPositions();

private:
    void evaluate(const Position& position, double ltp);
    bool submitExit(const Position& position, double exitPrice, const std::string& reason);
    void cancelLegs(const Position& position);

    std::shared_ptr<PositionStore> m_store;
    std::shared_ptr<ExecutionClient> m_client;
    std::shared_ptr<Logger> m_logger;
};

}  // namespace OptionsScalper
