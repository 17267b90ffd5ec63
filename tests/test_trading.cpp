// =============================================================================
// test_trading.cpp
// =============================================================================
// Unit tests for order execution.
//
// Validates:
//   - PaperTrader matching for MARKET, LIMIT, SL-M and SL orders
//   - Signed netting, balance movement and ledger persistence
//   - Paper cancellation outcomes and order-update callbacks
//   - KiteClient failure mapping and payload parsing
//   - OrderEntry confirmation, position creation and bracket placement
//
// Design: every test that touches disk gets its own TempDir.
// =============================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>

#include "TestSupport.hpp"
#include "auth/AuthManager.hpp"
#include "positions/PositionStore.hpp"
#include "risk/OcoLegManager.hpp"
#include "storage/PnlJournal.hpp"
#include "storage/TradeJournal.hpp"
#include "trading/KiteClient.hpp"
#include "trading/OrderEntry.hpp"
#include "trading/PaperTrader.hpp"
#include "utils/HttpClient.hpp"

using namespace OptionsScalper;
using namespace OptionsScalper::test;

namespace {

const char* const kSymbol = "NIFTY24DEC24000CE";

OrderRequest paperRequest(TransactionType side, int quantity, OrderType type,
                          std::optional<double> price = std::nullopt,
                          std::optional<double> trigger = std::nullopt) {
    OrderRequest request = OrderRequest::market("NFO", kSymbol, side, quantity, ProductType::NRML);
    request.orderType = type;
    request.price = price;
    request.triggerPrice = trigger;
    return request;
}

}  // namespace

// =============================================================================
// PaperTrader
// =============================================================================

class PaperTraderTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.dataDir = dir.path();
        settings.paperStartingBalance = 100000.0;
        instruments = std::make_shared<InstrumentRegistry>(quietLogger());

        Contract contract;
        contract.underlying = "NIFTY";
        contract.tradingSymbol = kSymbol;
        contract.instrumentToken = 1001;
        contract.strike = 24000;
        contract.optionType = OptionType::CALL;
        instruments->add(contract);

        trader = std::make_unique<PaperTrader>(settings, instruments, clock, quietLogger());
    }

    RawOrder orderById(const std::string& orderId) {
        for (const auto& order : trader->getOrders()) {
            if (order.orderId == orderId) {
                return order;
            }
        }
        ADD_FAILURE() << "order " << orderId << " not found";
        return RawOrder{};
    }

    std::optional<RawPosition> position() {
        for (const auto& pos : trader->getPositions()) {
            if (pos.tradingSymbol == kSymbol) {
                return pos;
            }
        }
        return std::nullopt;
    }

    TempDir dir;
    TerminalSettings settings;
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<InstrumentRegistry> instruments;
    std::unique_ptr<PaperTrader> trader;
};

// -----------------------------------------------------------------------------
// 1. A market order without a price waits, then fills on the first tick.
// -----------------------------------------------------------------------------
TEST_F(PaperTraderTest, MarketOrderWaitsForFirstPrice) {
    std::string id = trader->placeOrder(paperRequest(TransactionType::BUY, 50, OrderType::MARKET));
    EXPECT_EQ(id.rfind("paper_", 0), 0u);
    EXPECT_EQ(orderById(id).status, OrderStatus::PENDING_EXECUTION);

    trader->onTicks({Tick{1001, 100.0}});

    RawOrder filled = orderById(id);
    EXPECT_EQ(filled.status, OrderStatus::COMPLETE);
    EXPECT_DOUBLE_EQ(filled.averagePrice, 100.0);
    EXPECT_EQ(filled.filledQuantity, 50);

    auto pos = position();
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->quantity, 50);
    EXPECT_DOUBLE_EQ(pos->averagePrice, 100.0);
    EXPECT_EQ(pos->instrumentToken, 1001u);
    EXPECT_DOUBLE_EQ(trader->getBalance(), 95000.0);
}

TEST_F(PaperTraderTest, MarketOrderFillsAtKnownPrice) {
    trader->updateLastPrice(kSymbol, 120.0);
    std::string id = trader->placeOrder(paperRequest(TransactionType::BUY, 25, OrderType::MARKET));

    EXPECT_EQ(orderById(id).status, OrderStatus::COMPLETE);
    EXPECT_DOUBLE_EQ(orderById(id).averagePrice, 120.0);
}

// -----------------------------------------------------------------------------
// 2. LIMIT: marketable at placement fills at the last price; a resting limit
//    fills at its own price once crossed.
// -----------------------------------------------------------------------------
TEST_F(PaperTraderTest, LimitOrderFillsAtLimitOnceCrossed) {
    trader->updateLastPrice(kSymbol, 100.0);
    std::string id = trader->placeOrder(paperRequest(TransactionType::BUY, 10, OrderType::LIMIT, 95.0));
    EXPECT_EQ(orderById(id).status, OrderStatus::OPEN);

    trader->updateLastPrice(kSymbol, 96.0);
    EXPECT_EQ(orderById(id).status, OrderStatus::OPEN);

    trader->updateLastPrice(kSymbol, 94.0);
    EXPECT_EQ(orderById(id).status, OrderStatus::COMPLETE);
    EXPECT_DOUBLE_EQ(orderById(id).averagePrice, 95.0);
}

TEST_F(PaperTraderTest, MarketableLimitFillsAtLastPrice) {
    trader->updateLastPrice(kSymbol, 100.0);
    std::string id = trader->placeOrder(paperRequest(TransactionType::BUY, 10, OrderType::LIMIT, 105.0));
    EXPECT_EQ(orderById(id).status, OrderStatus::COMPLETE);
    EXPECT_DOUBLE_EQ(orderById(id).averagePrice, 100.0);
}

// -----------------------------------------------------------------------------
// 3. SL-M sells trigger on a fall through the trigger and fill at market.
// -----------------------------------------------------------------------------
TEST_F(PaperTraderTest, StopLossMarketTriggersOnFall) {
    trader->updateLastPrice(kSymbol, 100.0);
    trader->placeOrder(paperRequest(TransactionType::BUY, 10, OrderType::MARKET));

    std::string stop = trader->placeOrder(
        paperRequest(TransactionType::SELL, 10, OrderType::STOP_LOSS_MARKET, std::nullopt, 90.0));
    EXPECT_EQ(orderById(stop).status, OrderStatus::TRIGGER_PENDING);

    trader->updateLastPrice(kSymbol, 95.0);
    EXPECT_EQ(orderById(stop).status, OrderStatus::TRIGGER_PENDING);

    trader->updateLastPrice(kSymbol, 89.0);
    EXPECT_EQ(orderById(stop).status, OrderStatus::COMPLETE);
    EXPECT_DOUBLE_EQ(orderById(stop).averagePrice, 89.0);
    EXPECT_FALSE(position().has_value());
}

TEST_F(PaperTraderTest, StopLossLimitRestsAfterTrigger) {
    trader->updateLastPrice(kSymbol, 100.0);
    std::string stop = trader->placeOrder(
        paperRequest(TransactionType::SELL, 10, OrderType::STOP_LOSS, 92.0, 90.0));

    trader->updateLastPrice(kSymbol, 89.0);
    EXPECT_EQ(orderById(stop).status, OrderStatus::OPEN);

    trader->updateLastPrice(kSymbol, 93.0);
    EXPECT_EQ(orderById(stop).status, OrderStatus::COMPLETE);
    EXPECT_DOUBLE_EQ(orderById(stop).averagePrice, 92.0);
}

// -----------------------------------------------------------------------------
// 4. Signed netting: partial close keeps the average, a flip reopens at the
//    fill price; the balance follows every fill.
// -----------------------------------------------------------------------------
TEST_F(PaperTraderTest, NettingAndBalance) {
    trader->updateLastPrice(kSymbol, 100.0);
    trader->placeOrder(paperRequest(TransactionType::BUY, 50, OrderType::MARKET));

    trader->updateLastPrice(kSymbol, 110.0);
    trader->placeOrder(paperRequest(TransactionType::SELL, 30, OrderType::MARKET));
    auto pos = position();
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->quantity, 20);
    EXPECT_DOUBLE_EQ(pos->averagePrice, 100.0);

    trader->updateLastPrice(kSymbol, 120.0);
    trader->placeOrder(paperRequest(TransactionType::SELL, 40, OrderType::MARKET));
    pos = position();
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->quantity, -20);
    EXPECT_DOUBLE_EQ(pos->averagePrice, 120.0);

    EXPECT_DOUBLE_EQ(trader->getBalance(), 100000.0 - 5000.0 + 3300.0 + 4800.0);
}

TEST_F(PaperTraderTest, PositionsAreMarkedToLastPrice) {
    trader->updateLastPrice(kSymbol, 100.0);
    trader->placeOrder(paperRequest(TransactionType::BUY, 10, OrderType::MARKET));
    trader->updateLastPrice(kSymbol, 104.5);

    auto pos = position();
    ASSERT_TRUE(pos.has_value());
    EXPECT_DOUBLE_EQ(pos->lastPrice, 104.5);
    EXPECT_DOUBLE_EQ(pos->pnl, 45.0);

    MarginSnapshot margins = trader->getMargins();
    EXPECT_DOUBLE_EQ(margins.equityNet, 99000.0);
    EXPECT_DOUBLE_EQ(margins.utilised, 1000.0);
    EXPECT_DOUBLE_EQ(margins.available, 98000.0);
}

// -----------------------------------------------------------------------------
// 5. Cancellation outcomes
// -----------------------------------------------------------------------------
TEST_F(PaperTraderTest, CancelOutcomes) {
    trader->updateLastPrice(kSymbol, 100.0);
    std::string resting = trader->placeOrder(paperRequest(TransactionType::BUY, 10, OrderType::LIMIT, 90.0));
    std::string filled = trader->placeOrder(paperRequest(TransactionType::BUY, 10, OrderType::MARKET));

    EXPECT_EQ(trader->cancelOrder(Variety::REGULAR, resting), CancelResult::CANCELLED);
    EXPECT_EQ(orderById(resting).status, OrderStatus::CANCELLED);
    EXPECT_EQ(trader->cancelOrder(Variety::REGULAR, resting), CancelResult::ALREADY_TERMINAL);
    EXPECT_EQ(trader->cancelOrder(Variety::REGULAR, filled), CancelResult::ALREADY_TERMINAL);
    EXPECT_EQ(trader->cancelOrder(Variety::REGULAR, "paper_0_999"), CancelResult::NOT_FOUND);

    // A cancelled limit never fills
    trader->updateLastPrice(kSymbol, 80.0);
    EXPECT_EQ(orderById(resting).status, OrderStatus::CANCELLED);
}

TEST_F(PaperTraderTest, InvalidOrdersAreRejected) {
    EXPECT_THROW(trader->placeOrder(paperRequest(TransactionType::BUY, 0, OrderType::MARKET)),
                 RejectedOrderError);
    EXPECT_THROW(trader->placeOrder(paperRequest(TransactionType::BUY, 10, OrderType::LIMIT)),
                 RejectedOrderError);
    EXPECT_THROW(trader->placeOrder(paperRequest(TransactionType::SELL, 10, OrderType::STOP_LOSS_MARKET)),
                 RejectedOrderError);
    EXPECT_TRUE(trader->getOrders().empty());
}

TEST_F(PaperTraderTest, ListenerSeesCreationAndFill) {
    std::vector<OrderStatus> seen;
    trader->setOrderUpdateListener([&seen](const RawOrder& order) { seen.push_back(order.status); });

    trader->placeOrder(paperRequest(TransactionType::BUY, 10, OrderType::MARKET));
    trader->updateLastPrice(kSymbol, 100.0);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], OrderStatus::PENDING_EXECUTION);
    EXPECT_EQ(seen[1], OrderStatus::COMPLETE);
}

// -----------------------------------------------------------------------------
// 6. The ledger survives a restart.
// -----------------------------------------------------------------------------
TEST_F(PaperTraderTest, LedgerReloadsBalanceAndPositions) {
    trader->updateLastPrice(kSymbol, 100.0);
    trader->placeOrder(paperRequest(TransactionType::BUY, 30, OrderType::MARKET));
    ASSERT_TRUE(std::ifstream(trader->getLedgerPath()).good());

    PaperTrader reopened(settings, instruments, clock, quietLogger());
    EXPECT_DOUBLE_EQ(reopened.getBalance(), 97000.0);

    std::vector<RawPosition> positions = reopened.getPositions();
    ASSERT_EQ(positions.size(), 1u);
    EXPECT_EQ(positions[0].tradingSymbol, kSymbol);
    EXPECT_EQ(positions[0].quantity, 30);
    EXPECT_DOUBLE_EQ(positions[0].averagePrice, 100.0);
    EXPECT_TRUE(reopened.getOrders().empty());
}

TEST_F(PaperTraderTest, CorruptLedgerFallsBackToStartingBalance) {
    {
        std::ofstream file(trader->getLedgerPath());
        file << "{broken";
    }
    PaperTrader reopened(settings, instruments, clock, quietLogger());
    EXPECT_DOUBLE_EQ(reopened.getBalance(), 100000.0);
    EXPECT_TRUE(reopened.getPositions().empty());

    // The unreadable ledger is kept for inspection, not overwritten
    std::ifstream aside(trader->getLedgerPath() + ".corrupt");
    ASSERT_TRUE(aside.is_open());
    std::string content((std::istreambuf_iterator<char>(aside)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "{broken");

    ASSERT_TRUE(reopened.saveLedger());
    EXPECT_TRUE(std::filesystem::exists(trader->getLedgerPath()));
}

// =============================================================================
// KiteClient
// =============================================================================

namespace {

class CannedHttpClient : public HttpClient {
public:
    CannedHttpClient() : HttpClient(quietLogger()) {}

    HttpResponse request(HttpMethod method, const std::string& url,
                         const std::unordered_map<std::string, std::string>& headers,
                         const std::string& body) override {
        lastMethod = method;
        lastUrl = url;
        lastHeaders = headers;
        lastBody = body;
        return response;
    }

    void respond(int status, const std::string& body) {
        response = HttpResponse{};
        response.statusCode = status;
        response.body = body;
    }

    HttpResponse response;
    HttpMethod lastMethod = HttpMethod::GET;
    std::string lastUrl;
    std::unordered_map<std::string, std::string> lastHeaders;
    std::string lastBody;
};

}  // namespace

class KiteClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.apiKey = "kite_key";
        settings.accessToken = "kite_token";
        http = std::make_shared<CannedHttpClient>();
        auth = std::make_shared<AuthManager>(settings, http, std::make_shared<ManualClock>(), quietLogger());
        client = std::make_unique<KiteClient>(settings, auth, http, quietLogger());
    }

    OrderRequest buyRequest() const {
        return OrderRequest::market("NFO", kSymbol, TransactionType::BUY, 50, ProductType::NRML);
    }

    TerminalSettings settings;
    std::shared_ptr<CannedHttpClient> http;
    std::shared_ptr<AuthManager> auth;
    std::unique_ptr<KiteClient> client;
};

TEST_F(KiteClientTest, PlaceOrderPostsFormAndReturnsId) {
    http->respond(200, R"({"status":"success","data":{"order_id":"151220000000000"}})");

    EXPECT_EQ(client->placeOrder(buyRequest()), "151220000000000");
    EXPECT_EQ(http->lastMethod, HttpMethod::POST);
    EXPECT_EQ(http->lastUrl, "https://api.kite.trade/orders/regular");
    EXPECT_EQ(http->lastHeaders["Authorization"], "token kite_key:kite_token");
    EXPECT_EQ(http->lastHeaders["X-Kite-Version"], "3");
    EXPECT_NE(http->lastBody.find("tradingsymbol=NIFTY24DEC24000CE"), std::string::npos);
    EXPECT_NE(http->lastBody.find("transaction_type=BUY"), std::string::npos);
}

TEST_F(KiteClientTest, ServerErrorsAndNetworkFailuresAreTransient) {
    http->respond(503, "<html>Service Unavailable</html>");
    EXPECT_THROW(client->getOrders(), TransientApiError);

    http->respond(429, R"({"status":"error","error_type":"NetworkException","message":"Too many requests"})");
    EXPECT_THROW(client->getPositions(), TransientApiError);

    http->respond(0, "");
    EXPECT_THROW(client->getMargins(), TransientApiError);
}

TEST_F(KiteClientTest, OrderValidationErrorsAreRejections) {
    http->respond(400, R"({"status":"error","error_type":"MarginException","message":"Insufficient funds"})");
    try {
        client->placeOrder(buyRequest());
        FAIL() << "expected RejectedOrderError";
    } catch (const RejectedOrderError& e) {
        EXPECT_STREQ(e.what(), "Insufficient funds");
        EXPECT_EQ(e.getStatusCode(), 400);
    }
}

TEST_F(KiteClientTest, TokenErrorsInvalidateTheSession) {
    http->respond(403, R"({"status":"error","error_type":"TokenException","message":"Invalid session"})");
    EXPECT_THROW(client->getProfile(), ApiError);
    EXPECT_FALSE(auth->isAccessTokenValid());

    // Further calls fail before reaching the network
    http->respond(200, R"({"status":"success","data":{}})");
    EXPECT_THROW(client->getProfile(), ApiError);
}

TEST_F(KiteClientTest, CancelOfFinishedOrderIsAlreadyTerminal) {
    http->respond(400, R"({"status":"error","error_type":"InputException",
                          "message":"Order cannot be cancelled as it is COMPLETE."})");
    EXPECT_EQ(client->cancelOrder(Variety::REGULAR, "1512"), CancelResult::ALREADY_TERMINAL);
    EXPECT_EQ(http->lastMethod, HttpMethod::DELETE);
    EXPECT_EQ(http->lastUrl, "https://api.kite.trade/orders/regular/1512");

    http->respond(400, R"({"status":"error","error_type":"InputException","message":"Something odd"})");
    EXPECT_THROW(client->cancelOrder(Variety::REGULAR, "1512"), ApiError);
}

TEST_F(KiteClientTest, ParsesPositionsAndOrders) {
    http->respond(200, R"({"status":"success","data":{"net":[
        {"tradingsymbol":"NIFTY24DEC24000CE","exchange":"NFO","instrument_token":1001,
         "product":"NRML","quantity":-75,"average_price":112.5,"last_price":110.0,"pnl":187.5}
    ],"day":[]}})");

    std::vector<RawPosition> positions = client->getPositions();
    ASSERT_EQ(positions.size(), 1u);
    EXPECT_EQ(positions[0].quantity, -75);
    EXPECT_EQ(positions[0].product, ProductType::NRML);
    EXPECT_DOUBLE_EQ(positions[0].pnl, 187.5);

    http->respond(200, R"({"status":"success","data":[
        {"order_id":"1","tradingsymbol":"X","status":"TRIGGER PENDING","order_type":"SL-M",
         "transaction_type":"SELL","quantity":75,"trigger_price":95.0,"variety":"regular"}
    ]})");
    std::vector<RawOrder> orders = client->getOrders();
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].status, OrderStatus::TRIGGER_PENDING);
    EXPECT_EQ(orders[0].orderType, OrderType::STOP_LOSS_MARKET);
    EXPECT_DOUBLE_EQ(orders[0].triggerPrice, 95.0);
}

TEST(KiteClientStaticTest, StopLossMarketBodyCarriesTriggerOnly) {
    OrderRequest request = OrderRequest::stopLossMarket("NFO", kSymbol, TransactionType::SELL, 50,
                                                        ProductType::NRML, 95.5);
    std::string body = KiteClient::buildOrderRequestBody(request);

    EXPECT_NE(body.find("order_type=SL-M"), std::string::npos);
    EXPECT_NE(body.find("trigger_price=95.5"), std::string::npos);
    EXPECT_EQ(body.find("&price="), std::string::npos);
    EXPECT_NE(body.find("validity=DAY"), std::string::npos);
}

TEST(KiteClientStaticTest, CancelFailureClassification) {
    EXPECT_EQ(KiteClient::classifyCancelFailure("Order is already cancelled"), CancelResult::ALREADY_TERMINAL);
    EXPECT_EQ(KiteClient::classifyCancelFailure("Order was REJECTED by RMS"), CancelResult::ALREADY_TERMINAL);
    EXPECT_EQ(KiteClient::classifyCancelFailure("Order not found"), CancelResult::NOT_FOUND);
    EXPECT_FALSE(KiteClient::classifyCancelFailure("Gateway timeout").has_value());
}

// =============================================================================
// OrderEntry
// =============================================================================

class OrderEntryTest : public ::testing::Test {
protected:
    void SetUp() override {
        client = std::make_shared<FakeExecutionClient>();
        tradeJournal = std::make_shared<TradeJournal>(dir.path(), "paper", quietLogger());
        auto pnlJournal = std::make_shared<PnlJournal>(dir.path(), "paper", quietLogger());
        store = std::make_shared<PositionStore>(client, nullptr, tradeJournal, pnlJournal, clock, quietLogger());
        legs = std::make_shared<OcoLegManager>(store, client, quietLogger());

        settings.orderConfirmRetries = 3;
        settings.orderConfirmDelayMs = 0;
        entry = std::make_unique<OrderEntry>(settings, client, store, legs, tradeJournal, quietLogger());

        contract.tradingSymbol = kSymbol;
        contract.instrumentToken = 1001;
        contract.exchange = "NFO";
    }

    TempDir dir;
    TerminalSettings settings;
    Contract contract;
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<FakeExecutionClient> client;
    std::shared_ptr<TradeJournal> tradeJournal;
    std::shared_ptr<PositionStore> store;
    std::shared_ptr<OcoLegManager> legs;
    std::unique_ptr<OrderEntry> entry;
};

// -----------------------------------------------------------------------------
// 7. A confirmed fill adds the position, journals it and places both legs.
// -----------------------------------------------------------------------------
TEST_F(OrderEntryTest, FilledEntryIsProtected) {
    client->autoCompleteAt = 100.0;

    EntryResult result = entry->buy(contract, 50, ProductType::NRML, OrderType::MARKET,
                                    std::nullopt, 90.0, 120.0, 5.0);
    EXPECT_EQ(result.status, EntryStatus::FILLED);
    EXPECT_EQ(result.orderId, "order_1");

    auto pos = store->getPosition(kSymbol);
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->quantity, 50);
    EXPECT_DOUBLE_EQ(pos->averagePrice, 100.0);
    EXPECT_EQ(pos->instrumentToken, 1001u);
    EXPECT_EQ(pos->entryOrderId, std::optional<std::string>("order_1"));
    EXPECT_EQ(pos->trailingDistance, std::optional<double>(5.0));

    ASSERT_EQ(client->placed.size(), 3u);
    EXPECT_EQ(client->placed[1].orderType, OrderType::STOP_LOSS_MARKET);
    EXPECT_EQ(client->placed[1].side, TransactionType::SELL);
    EXPECT_EQ(client->placed[1].triggerPrice, std::optional<double>(90.0));
    EXPECT_EQ(client->placed[2].orderType, OrderType::LIMIT);
    EXPECT_EQ(client->placed[2].price, std::optional<double>(120.0));
    EXPECT_EQ(pos->stopLossOrderId, std::optional<std::string>("order_2"));
    EXPECT_EQ(pos->targetOrderId, std::optional<std::string>("order_3"));

    std::vector<TradeRecord> trades = tradeJournal->getAllTrades();
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_EQ(trades[0].orderId, "order_1");
    EXPECT_EQ(trades[0].transactionType, "BUY");
    EXPECT_DOUBLE_EQ(trades[0].pnl, 0.0);
}

TEST_F(OrderEntryTest, SecondBuyNetsAndReissuesLegs) {
    client->autoCompleteAt = 100.0;
    ASSERT_EQ(entry->buy(contract, 50, ProductType::NRML, OrderType::MARKET,
                         std::nullopt, 90.0, 120.0).status, EntryStatus::FILLED);

    client->autoCompleteAt = 110.0;
    EntryResult result = entry->buy(contract, 50, ProductType::NRML, OrderType::MARKET,
                                    std::nullopt, 90.0, 120.0);
    EXPECT_EQ(result.status, EntryStatus::FILLED);
    EXPECT_EQ(result.orderId, "order_4");

    auto pos = store->getPosition(kSymbol);
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->quantity, 100);
    EXPECT_DOUBLE_EQ(pos->averagePrice, 105.0);
    EXPECT_EQ(pos->entryOrderId, std::optional<std::string>("order_1"));

    // The first pair is cancelled and a pair for the full size replaces it
    EXPECT_EQ(client->cancelled, (std::vector<std::string>{"order_2", "order_3"}));
    ASSERT_EQ(client->placed.size(), 6u);
    EXPECT_EQ(client->placed[4].orderType, OrderType::STOP_LOSS_MARKET);
    EXPECT_EQ(client->placed[4].quantity, 100);
    EXPECT_EQ(client->placed[5].orderType, OrderType::LIMIT);
    EXPECT_EQ(client->placed[5].quantity, 100);
    EXPECT_EQ(pos->stopLossOrderId, std::optional<std::string>("order_5"));
    EXPECT_EQ(pos->targetOrderId, std::optional<std::string>("order_6"));

    EXPECT_EQ(tradeJournal->size(), 2u);
}

TEST_F(OrderEntryTest, UnprotectedTopUpKeepsHeldProtection) {
    client->autoCompleteAt = 100.0;
    entry->buy(contract, 25, ProductType::NRML, OrderType::MARKET, std::nullopt, 90.0);
    entry->buy(contract, 25, ProductType::NRML);

    auto pos = store->getPosition(kSymbol);
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->quantity, 50);
    EXPECT_EQ(pos->stopLoss, std::optional<double>(90.0));
    EXPECT_EQ(client->cancelled, (std::vector<std::string>{"order_2"}));
    ASSERT_EQ(client->placed.size(), 4u);
    EXPECT_EQ(client->placed[3].quantity, 50);
    EXPECT_EQ(pos->stopLossOrderId, std::optional<std::string>("order_4"));
}

TEST_F(OrderEntryTest, UnprotectedEntryPlacesNoLegs) {
    client->autoCompleteAt = 100.0;
    EntryResult result = entry->buy(contract, 25, ProductType::MIS);
    EXPECT_EQ(result.status, EntryStatus::FILLED);
    EXPECT_EQ(client->placed.size(), 1u);
    EXPECT_FALSE(store->getPosition(kSymbol)->hasLegs());
}

TEST_F(OrderEntryTest, BrokerRejectionAddsNothing) {
    client->rejectOrders = true;
    EntryResult result = entry->buy(contract, 50, ProductType::NRML);
    EXPECT_EQ(result.status, EntryStatus::REJECTED);
    EXPECT_EQ(result.message, "Insufficient funds");
    EXPECT_FALSE(store->hasOpenPositions());
}

TEST_F(OrderEntryTest, RestingOrderIsLeftWorking) {
    RawOrder resting;
    resting.orderId = "order_1";
    resting.status = OrderStatus::OPEN;
    client->orders.push_back(resting);

    EntryResult result = entry->buy(contract, 50, ProductType::NRML, OrderType::LIMIT, 95.0);
    EXPECT_EQ(result.status, EntryStatus::WORKING);
    EXPECT_FALSE(store->hasOpenPositions());
}

TEST_F(OrderEntryTest, MissingOrderIsUnconfirmedAfterRetries) {
    EntryResult result = entry->buy(contract, 50, ProductType::NRML);
    EXPECT_EQ(result.status, EntryStatus::UNCONFIRMED);
    EXPECT_EQ(client->orderCalls, 3);
    EXPECT_FALSE(store->hasOpenPositions());
}

TEST_F(OrderEntryTest, LimitWithoutPriceIsNotPlaced) {
    EntryResult result = entry->buy(contract, 50, ProductType::NRML, OrderType::LIMIT);
    EXPECT_EQ(result.status, EntryStatus::FAILED);
    EXPECT_TRUE(client->placed.empty());
}
