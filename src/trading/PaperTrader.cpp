/**
 * @file PaperTrader.cpp
 * @brief Implementation of the PaperTrader class
 */

#include "../trading/PaperTrader.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "../storage/CorruptFile.hpp"
#include "../utils/Errors.hpp"

namespace OptionsScalper {

PaperTrader::PaperTrader(const TerminalSettings& settings,
                         std::shared_ptr<InstrumentRegistry> instruments,
                         std::shared_ptr<Clock> clock,
                         std::shared_ptr<Logger> logger)
    : m_instruments(instruments),
      m_clock(clock),
      m_logger(logger),
      m_ledgerPath((std::filesystem::path(settings.dataDir) / "paper_ledger.json").string()),
      m_startingBalance(settings.paperStartingBalance),
      m_balance(settings.paperStartingBalance) {

    m_logger->info("Initializing PaperTrader with ledger {}", m_ledgerPath);
    loadLedger();
}

std::string PaperTrader::placeOrder(const OrderRequest& request) {
    if (request.quantity <= 0) {
        throw RejectedOrderError("Quantity must be positive");
    }
    if (request.side == TransactionType::UNKNOWN) {
        throw RejectedOrderError("Transaction type is required");
    }
    if ((request.orderType == OrderType::LIMIT || request.orderType == OrderType::STOP_LOSS) &&
        (!request.price || *request.price <= 0.0)) {
        throw RejectedOrderError("Price is required for " + toString(request.orderType) + " orders");
    }
    if ((request.orderType == OrderType::STOP_LOSS || request.orderType == OrderType::STOP_LOSS_MARKET) &&
        (!request.triggerPrice || *request.triggerPrice <= 0.0)) {
        throw RejectedOrderError("Trigger price is required for " + toString(request.orderType) + " orders");
    }
    if (request.orderType == OrderType::UNKNOWN) {
        throw RejectedOrderError("Unsupported order type");
    }

    std::vector<RawOrder> updates;
    std::string orderId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        RawOrder order;
        order.orderId = nextOrderId();
        order.tradingSymbol = request.tradingSymbol;
        order.exchange = request.exchange;
        order.transactionType = request.side;
        order.orderType = request.orderType;
        order.product = request.product;
        order.variety = request.variety;
        order.quantity = request.quantity;
        order.pendingQuantity = request.quantity;
        order.price = request.price.value_or(0.0);
        order.triggerPrice = request.triggerPrice.value_or(0.0);
        order.orderTime = m_clock->now();
        order.tag = request.tag;
        if (m_instruments) {
            if (const Contract* contract = m_instruments->findBySymbol(request.tradingSymbol)) {
                order.instrumentToken = contract->instrumentToken;
            }
        }

        switch (order.orderType) {
            case OrderType::MARKET:
                order.status = OrderStatus::PENDING_EXECUTION;
                break;
            case OrderType::LIMIT:
                order.status = OrderStatus::OPEN;
                break;
            default:
                order.status = OrderStatus::TRIGGER_PENDING;
                break;
        }

        auto priceIt = m_lastPrices.find(order.tradingSymbol);
        if (priceIt != m_lastPrices.end() && priceIt->second > 0.0) {
            tryMatch(order, priceIt->second, true);
        }

        m_logger->info("Paper order {}: {} {} {} x{} -> {}",
                       order.orderId, toString(order.transactionType), toString(order.orderType),
                       order.tradingSymbol, order.quantity, toString(order.status));

        orderId = order.orderId;
        m_orders.push_back(order);
        updates.push_back(order);
    }

    notify(updates);
    return orderId;
}

CancelResult PaperTrader::cancelOrder(Variety, const std::string& orderId) {
    std::vector<RawOrder> updates;
    CancelResult result = CancelResult::NOT_FOUND;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = std::find_if(m_orders.begin(), m_orders.end(),
                               [&orderId](const RawOrder& order) { return order.orderId == orderId; });
        if (it == m_orders.end()) {
            m_logger->warn("Paper cancel: unknown order {}", orderId);
            return CancelResult::NOT_FOUND;
        }

        if (isTerminal(it->status)) {
            m_logger->info("Paper cancel: order {} is already {}", orderId, toString(it->status));
            return CancelResult::ALREADY_TERMINAL;
        }

        it->status = OrderStatus::CANCELLED;
        it->pendingQuantity = 0;
        m_logger->info("Paper order {} cancelled", orderId);
        updates.push_back(*it);
        result = CancelResult::CANCELLED;
    }

    notify(updates);
    return result;
}

std::vector<RawPosition> PaperTrader::getPositions() {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<RawPosition> positions;
    positions.reserve(m_positions.size());

    for (auto& entry : m_positions) {
        PaperPosition& pos = entry.second;
        auto priceIt = m_lastPrices.find(entry.first);
        if (priceIt != m_lastPrices.end() && priceIt->second > 0.0) {
            pos.lastPrice = priceIt->second;
            pos.pnl = (pos.lastPrice - pos.averagePrice) * pos.quantity;
        }

        RawPosition raw;
        raw.tradingSymbol = entry.first;
        raw.exchange = pos.exchange;
        raw.product = pos.product;
        raw.quantity = pos.quantity;
        raw.averagePrice = pos.averagePrice;
        raw.lastPrice = pos.lastPrice;
        raw.pnl = pos.pnl;
        if (m_instruments) {
            if (const Contract* contract = m_instruments->findBySymbol(entry.first)) {
                raw.instrumentToken = contract->instrumentToken;
            }
        }
        positions.push_back(raw);
    }

    return positions;
}

std::vector<RawOrder> PaperTrader::getOrders() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_orders;
}

MarginSnapshot PaperTrader::getMargins() {
    std::lock_guard<std::mutex> lock(m_mutex);

    double used = 0.0;
    for (const auto& entry : m_positions) {
        used += std::abs(entry.second.quantity * entry.second.averagePrice);
    }

    MarginSnapshot margins;
    margins.equityNet = m_balance;
    margins.commodityNet = 0.0;
    margins.utilised = used;
    margins.available = m_balance - used;
    return margins;
}

UserProfile PaperTrader::getProfile() {
    UserProfile profile;
    profile.userId = "PAPER";
    profile.userName = "Paper Trader";
    profile.broker = "PAPER";
    return profile;
}

void PaperTrader::onTicks(const std::vector<Tick>& ticks) {
    if (!m_instruments) {
        return;
    }

    std::vector<RawOrder> updates;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& tick : ticks) {
            if (tick.lastPrice <= 0.0) {
                continue;
            }
            const Contract* contract = m_instruments->findByToken(tick.instrumentToken);
            if (!contract) {
                continue;
            }
            m_lastPrices[contract->tradingSymbol] = tick.lastPrice;
            matchOrders(contract->tradingSymbol, updates);
        }
    }

    notify(updates);
}

void PaperTrader::updateLastPrice(const std::string& tradingSymbol, double price) {
    if (price <= 0.0) {
        return;
    }

    std::vector<RawOrder> updates;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastPrices[tradingSymbol] = price;
        matchOrders(tradingSymbol, updates);
    }

    notify(updates);
}

void PaperTrader::setOrderUpdateListener(OrderUpdateListener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

double PaperTrader::getBalance() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_balance;
}

void PaperTrader::matchOrders(const std::string& tradingSymbol, std::vector<RawOrder>& updates) {
    double ltp = m_lastPrices[tradingSymbol];

    for (auto& order : m_orders) {
        if (order.tradingSymbol != tradingSymbol || isTerminal(order.status)) {
            continue;
        }
        OrderStatus before = order.status;
        tryMatch(order, ltp, false);
        if (order.status != before) {
            updates.push_back(order);
        }
    }
}

bool PaperTrader::tryMatch(RawOrder& order, double ltp, bool atPlacement) {
    bool isBuy = order.transactionType == TransactionType::BUY;

    if (order.status == OrderStatus::TRIGGER_PENDING) {
        // Buy stops trigger on a rise through the trigger, sell stops on a fall
        bool triggered = isBuy ? ltp >= order.triggerPrice : ltp <= order.triggerPrice;
        if (!triggered) {
            return false;
        }
        m_logger->info("Paper order {} triggered at {}", order.orderId, ltp);
        if (order.orderType == OrderType::STOP_LOSS_MARKET) {
            executeFill(order, ltp);
            return true;
        }
        order.status = OrderStatus::OPEN;
    }

    if (order.status == OrderStatus::PENDING_EXECUTION) {
        executeFill(order, ltp);
        return true;
    }

    if (order.status == OrderStatus::OPEN) {
        bool marketable = isBuy ? ltp <= order.price : ltp >= order.price;
        if (marketable) {
            executeFill(order, atPlacement ? ltp : order.price);
            return true;
        }
    }

    return false;
}

void PaperTrader::executeFill(RawOrder& order, double price) {
    int delta = order.transactionType == TransactionType::BUY ? order.quantity : -order.quantity;
    double tradeValue = order.quantity * price;

    if (delta > 0) {
        m_balance -= tradeValue;
    } else {
        m_balance += tradeValue;
    }

    auto it = m_positions.find(order.tradingSymbol);
    if (it == m_positions.end()) {
        PaperPosition pos;
        pos.exchange = order.exchange;
        pos.product = order.product;
        it = m_positions.emplace(order.tradingSymbol, pos).first;
    }
    PaperPosition& pos = it->second;

    double realized = 0.0;
    if (pos.quantity == 0 || (pos.quantity > 0) == (delta > 0)) {
        int newQuantity = pos.quantity + delta;
        pos.averagePrice = (std::abs(pos.quantity) * pos.averagePrice + order.quantity * price) /
                           std::abs(newQuantity);
        pos.quantity = newQuantity;
    } else {
        int closing = std::min(std::abs(pos.quantity), std::abs(delta));
        realized = (price - pos.averagePrice) * closing * (pos.quantity > 0 ? 1 : -1);
        int newQuantity = pos.quantity + delta;
        if (newQuantity != 0 && (newQuantity > 0) != (pos.quantity > 0)) {
            // Flipped through flat, the remainder opens at the fill price
            pos.averagePrice = price;
        }
        pos.quantity = newQuantity;
    }

    pos.lastPrice = price;
    pos.pnl = (price - pos.averagePrice) * pos.quantity;

    order.status = OrderStatus::COMPLETE;
    order.averagePrice = price;
    order.filledQuantity = order.quantity;
    order.pendingQuantity = 0;

    m_logger->info("Paper trade executed: {} {} {} @ {:.2f}, realized {:.2f}, balance {:.2f}",
                   toString(order.transactionType), order.quantity, order.tradingSymbol,
                   price, realized, m_balance);

    if (pos.quantity == 0) {
        m_positions.erase(it);
    }

    saveLedgerLocked();
}

bool PaperTrader::loadLedger() {
    std::lock_guard<std::mutex> lock(m_mutex);

    json ledger;
    try {
        std::ifstream file(m_ledgerPath);
        if (!file.is_open()) {
            m_logger->info("No paper ledger at {}, starting with balance {:.2f}", m_ledgerPath, m_startingBalance);
            return false;
        }
        file >> ledger;
    } catch (const std::exception& e) {
        m_logger->error("Could not load paper ledger {}: {}", m_ledgerPath, e.what());
        resetUnreadableLedgerLocked();
        return false;
    }

    try {
        m_balance = ledger.value("balance", m_startingBalance);
        m_positions.clear();

        if (ledger.contains("positions") && ledger["positions"].is_object()) {
            for (auto it = ledger["positions"].begin(); it != ledger["positions"].end(); ++it) {
                const json& entry = it.value();
                PaperPosition pos;
                pos.quantity = entry.value("quantity", 0);
                pos.averagePrice = entry.value("averagePrice", 0.0);
                pos.exchange = entry.value("exchange", std::string("NFO"));
                pos.product = productTypeFromString(entry.value("product", std::string("NRML")));
                pos.lastPrice = entry.value("lastPrice", 0.0);
                pos.pnl = entry.value("pnl", 0.0);
                if (pos.quantity != 0) {
                    m_positions[it.key()] = pos;
                }
            }
        }

        m_logger->info("Paper ledger loaded: balance {:.2f}, {} positions", m_balance, m_positions.size());
        return true;
    } catch (const std::exception& e) {
        m_logger->error("Could not load paper ledger {}: {}", m_ledgerPath, e.what());
        resetUnreadableLedgerLocked();
        return false;
    }
}

void PaperTrader::resetUnreadableLedgerLocked() {
    m_balance = m_startingBalance;
    m_positions.clear();
    m_ledgerWritable = moveAsideCorruptFile(m_ledgerPath, *m_logger);
}

bool PaperTrader::saveLedger() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return saveLedgerLocked();
}

bool PaperTrader::saveLedgerLocked() const {
    if (!m_ledgerWritable) {
        m_logger->error("Paper ledger {} could not be moved aside, not overwriting it", m_ledgerPath);
        return false;
    }
    try {
        std::filesystem::path path(m_ledgerPath);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        json ledger;
        ledger["balance"] = m_balance;
        ledger["positions"] = json::object();
        for (const auto& entry : m_positions) {
            const PaperPosition& pos = entry.second;
            ledger["positions"][entry.first] = {
                {"quantity", pos.quantity},
                {"averagePrice", pos.averagePrice},
                {"exchange", pos.exchange},
                {"product", toString(pos.product)},
                {"lastPrice", pos.lastPrice},
                {"pnl", pos.pnl}
            };
        }

        std::ofstream file(m_ledgerPath, std::ios::trunc);
        if (!file.is_open()) {
            m_logger->error("Failed to open paper ledger for writing: {}", m_ledgerPath);
            return false;
        }
        file << ledger.dump(4);
        return true;
    } catch (const std::exception& e) {
        m_logger->error("Could not save paper ledger {}: {}", m_ledgerPath, e.what());
        return false;
    }
}

std::string PaperTrader::nextOrderId() {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        m_clock->now().time_since_epoch()).count();
    return "paper_" + std::to_string(millis) + "_" + std::to_string(++m_orderSequence);
}

void PaperTrader::notify(const std::vector<RawOrder>& updates) {
    OrderUpdateListener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        listener = m_listener;
    }
    if (!listener) {
        return;
    }
    for (const auto& order : updates) {
        listener(order);
    }
}

}  // namespace OptionsScalper
