/**
 * @file TradingSession.hpp
 * @brief Wires the trading core and runs its single processing loop
 */

#pragma once

#include <atomic>
#include <memory>
#include <set>
#include <vector>
#include "../api/AccountMonitor.hpp"
#include "../config/ConfigManager.hpp"
#include "../market/StreamSupervisor.hpp"
#include "../market/TickerTransport.hpp"
#include "../models/InstrumentModel.hpp"
#include "../positions/PositionStore.hpp"
#include "../risk/OcoLegManager.hpp"
#include "../risk/RiskTriggerEngine.hpp"
#include "../storage/PnlJournal.hpp"
#include "../storage/TradeJournal.hpp"
#include "../trading/ExecutionClient.hpp"
#include "../trading/OrderEntry.hpp"
#include "../trading/PaperTrader.hpp"
#include "../utils/Clock.hpp"
#include "../utils/Logger.hpp"

namespace OptionsScalper {

/**
 * @class TradingSession
 * @brief Owns every trading component of one account
 *
 * runOnce() is the only place where tick batches, supervisor timers,
 * reconciliation and account checks are processed, so each tick batch runs
 * to completion before the next one starts.
 */
class TradingSession {
public:
    TradingSession(const TerminalSettings& settings,
                   std::shared_ptr<ExecutionClient> client,
                   std::shared_ptr<TickerTransport> transport,
                   std::shared_ptr<InstrumentRegistry> instruments,
                   std::shared_ptr<Clock> clock,
                   std::shared_ptr<Logger> logger);

    ~TradingSession();

    TradingSession(const TradingSession&) = delete;
    TradingSession& operator=(const TradingSession&) = delete;

    /**
     * @brief Connect the stream and run the first reconciliation
     */
    void start();

    /**
     * @brief One loop iteration: drain ticks, run timers, refresh when due
     */
    void runOnce();

    /**
     * @brief Loop until running turns false, then shut down
     */
    void run(const std::atomic<bool>& running);

    /**
     * @brief Stop supervisor timers and close the transport
     *
     * In-flight trading calls are not cancelled.
     */
    void shutdown();

    /**
     * @brief Buy a contract, protecting and netting the fill as OrderEntry does
     *
     * A WORKING result leaves the order to reconciliation; its instrument is
     * streamed from the next loop iteration.
     */
    EntryResult buy(const Contract& contract,
                    int quantity,
                    ProductType product,
                    OrderType orderType = OrderType::MARKET,
                    std::optional<double> limitPrice = std::nullopt,
                    std::optional<double> stopLoss = std::nullopt,
                    std::optional<double> target = std::nullopt,
                    std::optional<double> trailingDistance = std::nullopt);

    /**
     * @brief Replace a position's protection and re-issue its legs
     */
    bool updateProtection(const std::string& tradingSymbol,
                          std::optional<double> stopLoss,
                          std::optional<double> target,
                          std::optional<double> trailingDistance);

    bool exitPosition(const std::string& tradingSymbol);
    int exitAllPositions();

    std::shared_ptr<PositionStore> getStore() const { return m_store; }
    std::shared_ptr<RiskTriggerEngine> getRiskEngine() const { return m_riskEngine; }
    std::shared_ptr<OcoLegManager> getLegManager() const { return m_legManager; }
    std::shared_ptr<OrderEntry> getOrderEntry() const { return m_orderEntry; }
    std::shared_ptr<AccountMonitor> getAccountMonitor() const { return m_accountMonitor; }
    StreamSupervisor& getSupervisor() { return *m_supervisor; }

private:
    class SubscriptionObserver;

    void onTicks(const std::vector<Tick>& ticks);
    void updateSubscriptions();

    TerminalSettings m_settings;
    std::shared_ptr<ExecutionClient> m_client;
    std::shared_ptr<PaperTrader> m_paperTrader;     ///< Set in paper mode only
    std::shared_ptr<InstrumentRegistry> m_instruments;
    std::shared_ptr<Clock> m_clock;
    std::shared_ptr<Logger> m_logger;

    std::shared_ptr<TradeJournal> m_tradeJournal;
    std::shared_ptr<PnlJournal> m_pnlJournal;
    std::shared_ptr<PositionStore> m_store;
    std::shared_ptr<OcoLegManager> m_legManager;
    std::shared_ptr<RiskTriggerEngine> m_riskEngine;
    std::shared_ptr<OrderEntry> m_orderEntry;
    std::shared_ptr<AccountMonitor> m_accountMonitor;
    std::unique_ptr<StreamSupervisor> m_supervisor;
    std::shared_ptr<SubscriptionObserver> m_subscriptionObserver;

    Clock::TimePoint m_nextRefresh{};
    Clock::TimePoint m_nextAccountCheck{};
    bool m_started = false;
};

}  // namespace OptionsScalper
