/**
 * @file PaperTrader.hpp
 * @brief Simulated execution against the live tick stream
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <map>
#include <functional>
#include "../utils/Clock.hpp"
#include "../utils/Logger.hpp"
#include "../config/ConfigManager.hpp"
#include "../market/TickerTransport.hpp"
#include "../models/InstrumentModel.hpp"
#include "../models/OrderModel.hpp"
#include "../trading/ExecutionClient.hpp"

namespace OptionsScalper {

/**
 * @struct PaperPosition
 * @brief Simulated net position as stored in the ledger
 */
struct PaperPosition {
    int quantity = 0;                        ///< Signed net quantity
    double averagePrice = 0.0;               ///< Weighted average entry
    std::string exchange = "NFO";
    ProductType product = ProductType::NRML;
    double lastPrice = 0.0;                  ///< Last mark
    double pnl = 0.0;                        ///< Floating P&L at lastPrice
};

/**
 * @class PaperTrader
 * @brief Execution client that matches orders against last traded prices
 *
 * Orders are kept in memory for the day; the balance and the net positions
 * are persisted to a JSON ledger that is rewritten after every fill.
 *
 * Matching rules:
 * - MARKET fills at the last price, or waits in PENDING EXECUTION for one
 * - LIMIT buys fill once the price is at or below the limit, sells at or above
 * - SL-M waits in TRIGGER PENDING until the trigger is crossed, then fills at
 *   the last price
 * - SL waits the same way and then rests as a limit order at its price
 */
class PaperTrader : public ExecutionClient {
public:
    using OrderUpdateListener = std::function<void(const RawOrder&)>;

    /**
     * @brief Constructor, loads the ledger if one exists
     * @param settings Session settings (starting balance, data directory)
     * @param instruments Registry used to map tick tokens to trading symbols
     * @param clock Time source for order timestamps
     * @param logger Logger instance
     */
    PaperTrader(const TerminalSettings& settings,
                std::shared_ptr<InstrumentRegistry> instruments,
                std::shared_ptr<Clock> clock,
                std::shared_ptr<Logger> logger);

    ~PaperTrader() override = default;

    std::string placeOrder(const OrderRequest& request) override;
    CancelResult cancelOrder(Variety variety, const std::string& orderId) override;
    std::vector<RawPosition> getPositions() override;
    std::vector<RawOrder> getOrders() override;
    MarginSnapshot getMargins() override;
    UserProfile getProfile() override;
    std::string getModeName() const override { return "paper"; }

    /**
     * @brief Record prices from a tick batch and match working orders
     */
    void onTicks(const std::vector<Tick>& ticks);

    /**
     * @brief Record a price for one trading symbol and match its working orders
     */
    void updateLastPrice(const std::string& tradingSymbol, double price);

    /**
     * @brief Callback fired after an order is created, filled or cancelled
     */
    void setOrderUpdateListener(OrderUpdateListener listener);

    bool loadLedger();
    bool saveLedger() const;

    double getBalance() const;
    std::string getLedgerPath() const { return m_ledgerPath; }

private:
    void matchOrders(const std::string& tradingSymbol, std::vector<RawOrder>& updates);
    bool tryMatch(RawOrder& order, double ltp, bool atPlacement);
    void executeFill(RawOrder& order, double price);
    bool saveLedgerLocked() const;
    void resetUnreadableLedgerLocked();
    std::string nextOrderId();
    void notify(const std::vector<RawOrder>& updates);

    std::shared_ptr<InstrumentRegistry> m_instruments;
    std::shared_ptr<Clock> m_clock;
    std::shared_ptr<Logger> m_logger;

    std::string m_ledgerPath;
    bool m_ledgerWritable = true;
    double m_startingBalance;

    double m_balance;
    std::map<std::string, PaperPosition> m_positions;
    std::vector<RawOrder> m_orders;
    std::map<std::string, double> m_lastPrices;     ///< By trading symbol
    uint64_t m_orderSequence = 0;

    OrderUpdateListener m_listener;
    mutable std::mutex m_mutex;
};

}  // namespace OptionsScalper
