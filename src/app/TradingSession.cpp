/**
 * @file TradingSession.cpp
 * @brief Implementation of the TradingSession class
 */

#include "../app/TradingSession.hpp"
#include <chrono>
#include <thread>

namespace OptionsScalper {

// Marks the subscription set dirty whenever the position set changes
class TradingSession::SubscriptionObserver : public StoreObserver {
public:
    void onPositionsChanged(const std::vector<Position>&) override { m_dirty = true; }
    void onPositionAdded(const Position&) override { m_dirty = true; }
    void onPositionRemoved(const std::string&) override { m_dirty = true; }

    void markDirty() { m_dirty = true; }
    bool takeDirty() { return m_dirty.exchange(false); }

private:
    std::atomic<bool> m_dirty{true};
};

TradingSession::TradingSession(const TerminalSettings& settings,
                               std::shared_ptr<ExecutionClient> client,
                               std::shared_ptr<TickerTransport> transport,
                               std::shared_ptr<InstrumentRegistry> instruments,
                               std::shared_ptr<Clock> clock,
                               std::shared_ptr<Logger> logger)
    : m_settings(settings),
      m_client(client),
      m_paperTrader(std::dynamic_pointer_cast<PaperTrader>(client)),
      m_instruments(instruments),
      m_clock(clock),
      m_logger(logger) {

    const std::string mode = m_client->getModeName();
    m_logger->info("Creating {} trading session", mode);

    m_tradeJournal = std::make_shared<TradeJournal>(settings.dataDir, mode, logger->forComponent("TradeJournal"));
    m_pnlJournal = std::make_shared<PnlJournal>(settings.dataDir, mode, logger->forComponent("PnlJournal"));

    m_store = std::make_shared<PositionStore>(m_client, m_instruments, m_tradeJournal, m_pnlJournal,
                                              m_clock, logger->forComponent("PositionStore"));
    m_legManager = std::make_shared<OcoLegManager>(m_store, m_client, logger->forComponent("OcoLegManager"));
    m_store->setLegReconciler(m_legManager);

    m_riskEngine = std::make_shared<RiskTriggerEngine>(m_store, m_client, logger->forComponent("RiskTriggerEngine"));
    m_orderEntry = std::make_shared<OrderEntry>(settings, m_client, m_store, m_legManager, m_tradeJournal,
                                                logger->forComponent("OrderEntry"));
    m_accountMonitor = std::make_shared<AccountMonitor>(m_client, settings, m_clock,
                                                        logger->forComponent("AccountMonitor"));

    SupervisorTimings timings;
    timings.heartbeatInterval = std::chrono::seconds(settings.heartbeatIntervalSeconds);
    timings.staleAfter = std::chrono::seconds(settings.staleAfterSeconds);
    timings.reconnectDelay = std::chrono::seconds(settings.reconnectDelaySeconds);
    m_supervisor = std::make_unique<StreamSupervisor>(transport, timings, settings.eventQueueCapacity,
                                                      settings.tickerMode, m_clock,
                                                      logger->forComponent("StreamSupervisor"));
    m_supervisor->setStateListener([this](ConnectionState state) {
        m_logger->info("Market data: {}", toString(state));
    });

    m_subscriptionObserver = std::make_shared<SubscriptionObserver>();
    m_store->addObserver(m_subscriptionObserver);

    if (m_paperTrader) {
        std::weak_ptr<SubscriptionObserver> observer = m_subscriptionObserver;
        m_paperTrader->setOrderUpdateListener([observer](const RawOrder&) {
            if (auto strong = observer.lock()) {
                strong->markDirty();
            }
        });
    }
}

TradingSession::~TradingSession() {
    shutdown();
}

void TradingSession::start() {
    if (m_started) {
        return;
    }
    m_started = true;

    m_supervisor->start();
    m_accountMonitor->checkHealth();
    m_store->refreshFromBroker();
    updateSubscriptions();

    Clock::TimePoint now = m_clock->now();
    m_nextRefresh = now + std::chrono::milliseconds(m_settings.refreshIntervalMs);
    m_nextAccountCheck = now + std::chrono::milliseconds(m_settings.accountCheckIntervalMs);

    m_logger->info("Session started for {} ({} positions)", m_accountMonitor->getUserId(),
                   m_store->getPositionCount());
}

void TradingSession::runOnce() {
    m_supervisor->pumpEvents([this](const std::vector<Tick>& ticks) { onTicks(ticks); });
    m_supervisor->poll();

    Clock::TimePoint now = m_clock->now();

    if (now >= m_nextRefresh) {
        m_nextRefresh = now + std::chrono::milliseconds(m_settings.refreshIntervalMs);
        m_store->refreshFromBroker();
    }

    if (now >= m_nextAccountCheck) {
        m_nextAccountCheck = now + std::chrono::milliseconds(m_settings.accountCheckIntervalMs);
        m_accountMonitor->checkHealth();
        if (m_accountMonitor->isDegraded()) {
            m_logger->warn("Account API degraded, serving cached balance {:.2f}", m_accountMonitor->getBalance());
        }
    }

    updateSubscriptions();
}

void TradingSession::run(const std::atomic<bool>& running) {
    start();

    m_logger->info("Entering session loop");
    while (running) {
        try {
            runOnce();
        } catch (const std::exception& e) {
            m_logger->error("Exception in session loop: {}", e.what());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(m_settings.loopIntervalMs));
    }
    m_logger->info("Session loop terminated");

    shutdown();
}

void TradingSession::shutdown() {
    if (!m_started) {
        return;
    }
    m_started = false;

    m_logger->info("Shutting down trading session");
    m_supervisor->stop();

    if (m_paperTrader) {
        m_paperTrader->saveLedger();
    }

    m_logger->info("Realized P&L today {:.2f}, floating {:.2f}", m_store->getRealizedPnlToday(),
                   m_store->getTotalFloatingPnl());
    m_logger->flush();
}

EntryResult TradingSession::buy(const Contract& contract,
                                int quantity,
                                ProductType product,
                                OrderType orderType,
                                std::optional<double> limitPrice,
                                std::optional<double> stopLoss,
                                std::optional<double> target,
                                std::optional<double> trailingDistance) {
    EntryResult result = m_orderEntry->buy(contract, quantity, product, orderType, limitPrice,
                                           stopLoss, target, trailingDistance);
    if (result.status == EntryStatus::WORKING) {
        m_subscriptionObserver->markDirty();
    }
    return result;
}

bool TradingSession::updateProtection(const std::string& tradingSymbol,
                                      std::optional<double> stopLoss,
                                      std::optional<double> target,
                                      std::optional<double> trailingDistance) {
    return m_legManager->updateProtection(tradingSymbol, stopLoss, target, trailingDistance);
}

bool TradingSession::exitPosition(const std::string& tradingSymbol) {
    return m_riskEngine->exitPosition(tradingSymbol);
}

int TradingSession::exitAllPositions() {
    int exited = m_riskEngine->exitAllPositions();
    m_logger->info("Exit all: {} exit orders accepted", exited);
    return exited;
}

void TradingSession::onTicks(const std::vector<Tick>& ticks) {
    if (m_paperTrader) {
        m_paperTrader->onTicks(ticks);
    }
    m_riskEngine->onTicks(ticks);
}

void TradingSession::updateSubscriptions() {
    if (!m_subscriptionObserver->takeDirty()) {
        return;
    }

    std::set<uint32_t> tokens;
    for (const auto& position : m_store->getAllPositions()) {
        if (position.instrumentToken != 0) {
            tokens.insert(position.instrumentToken);
        }
    }
    // Resting paper orders need prices to match against
    if (m_paperTrader) {
        for (const auto& order : m_paperTrader->getOrders()) {
            if (!isTerminal(order.status) && order.instrumentToken != 0) {
                tokens.insert(order.instrumentToken);
            }
        }
    }

    m_supervisor->setSubscriptions(tokens);
}

}  // namespace OptionsScalper
