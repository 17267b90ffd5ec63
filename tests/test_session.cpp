// =============================================================================
// test_session.cpp
// =============================================================================
// End-to-end check of the trading session in paper mode.
//
// Validates:
//   - Entry fills are inserted, subscribed and marked to market from ticks
//   - A manual exit realizes P&L and the next refresh agrees with it
//   - Protection updates and exit-all are reachable from the session
//   - Shutdown closes the stream and persists the paper ledger
// =============================================================================

#include <gtest/gtest.h>

#include <filesystem>

#include "TestSupport.hpp"
#include "app/TradingSession.hpp"

using namespace OptionsScalper;
using namespace OptionsScalper::test;

namespace {

const char* const kSymbol = "NIFTY24DEC24000CE";
const uint32_t kToken = 1001;

}  // namespace

class TradingSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.dataDir = dir.path();
        settings.paperStartingBalance = 100000.0;
        settings.orderConfirmDelayMs = 0;

        contract.underlying = "NIFTY";
        contract.tradingSymbol = kSymbol;
        contract.instrumentToken = kToken;
        contract.strike = 24000;
        contract.optionType = OptionType::CALL;
        contract.lotSize = 25;

        instruments = std::make_shared<InstrumentRegistry>(quietLogger());
        instruments->add(contract);

        paper = std::make_shared<PaperTrader>(settings, instruments, clock, quietLogger());
        transport = std::make_shared<FakeTransport>();
        session = std::make_unique<TradingSession>(settings, paper, transport, instruments, clock, quietLogger());
    }

    void ticks(double price) {
        transport->emit(StreamEvent::tickBatch({Tick{kToken, price}}));
        session->runOnce();
    }

    TempDir dir;
    TerminalSettings settings;
    Contract contract;
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<InstrumentRegistry> instruments;
    std::shared_ptr<PaperTrader> paper;
    std::shared_ptr<FakeTransport> transport;
    std::unique_ptr<TradingSession> session;
};

TEST_F(TradingSessionTest, EntryTickExitAndShutdown) {
    session->start();
    EXPECT_EQ(transport->connectCalls, 1);
    EXPECT_EQ(session->getAccountMonitor()->getUserId(), "PAPER");

    transport->emit(StreamEvent::connected());
    paper->updateLastPrice(kSymbol, 100.0);

    EntryResult entry = session->buy(contract, 50, ProductType::NRML);
    ASSERT_EQ(entry.status, EntryStatus::FILLED);

    session->runOnce();
    EXPECT_EQ(session->getSupervisor().getState(), ConnectionState::CONNECTED);
    ASSERT_FALSE(transport->subscribed.empty());
    EXPECT_EQ(transport->subscribed.back(), (std::vector<uint32_t>{kToken}));

    ticks(110.0);
    auto pos = session->getStore()->getPosition(kSymbol);
    ASSERT_TRUE(pos.has_value());
    EXPECT_DOUBLE_EQ(pos->lastPrice, 110.0);
    EXPECT_DOUBLE_EQ(pos->pnl, 500.0);

    ASSERT_TRUE(session->exitPosition(kSymbol));
    EXPECT_DOUBLE_EQ(session->getStore()->getRealizedPnlToday(), 500.0);

    // Next reconciliation sees the flat paper book and folds nothing twice
    clock->advance(std::chrono::seconds(3));
    session->runOnce();
    EXPECT_FALSE(session->getStore()->hasOpenPositions());
    EXPECT_DOUBLE_EQ(session->getStore()->getRealizedPnlToday(), 500.0);
    ASSERT_FALSE(transport->unsubscribed.empty());
    EXPECT_EQ(transport->unsubscribed.back(), (std::vector<uint32_t>{kToken}));

    EXPECT_DOUBLE_EQ(paper->getMargins().available, 100500.0);

    session->shutdown();
    EXPECT_GE(transport->closeCalls, 1);
    EXPECT_TRUE(std::filesystem::exists(dir.file("paper_ledger.json")));
}

TEST_F(TradingSessionTest, RestingEntryIsPickedUpByReconciliation) {
    session->start();
    transport->emit(StreamEvent::connected());

    // No price yet: the market order waits in the paper book
    EntryResult entry = session->buy(contract, 25, ProductType::NRML);
    EXPECT_EQ(entry.status, EntryStatus::WORKING);
    EXPECT_FALSE(session->getStore()->hasOpenPositions());

    // The resting order's instrument is streamed so it can fill
    session->runOnce();
    ASSERT_FALSE(transport->subscribed.empty());
    EXPECT_EQ(transport->subscribed.back(), (std::vector<uint32_t>{kToken}));

    ticks(80.0);
    clock->advance(std::chrono::seconds(3));
    session->runOnce();

    auto pos = session->getStore()->getPosition(kSymbol);
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->quantity, 25);
    EXPECT_DOUBLE_EQ(pos->averagePrice, 80.0);
    EXPECT_EQ(pos->instrumentToken, kToken);
}

TEST_F(TradingSessionTest, ProtectionAndExitAllThroughTheSession) {
    session->start();
    transport->emit(StreamEvent::connected());
    paper->updateLastPrice(kSymbol, 100.0);

    ASSERT_EQ(session->buy(contract, 25, ProductType::NRML).status, EntryStatus::FILLED);
    ASSERT_TRUE(session->updateProtection(kSymbol, 90.0, 130.0, std::nullopt));

    auto pos = session->getStore()->getPosition(kSymbol);
    ASSERT_TRUE(pos.has_value());
    EXPECT_TRUE(pos->hasLegs());
    ASSERT_TRUE(pos->stopLoss.has_value());
    EXPECT_DOUBLE_EQ(*pos->stopLoss, 90.0);
    EXPECT_FALSE(session->updateProtection("NIFTY24DEC24500CE", 1.0, 2.0, std::nullopt));

    ticks(105.0);
    EXPECT_EQ(session->exitAllPositions(), 1);
    EXPECT_FALSE(session->getStore()->hasOpenPositions());
    EXPECT_DOUBLE_EQ(session->getStore()->getRealizedPnlToday(), 125.0);
    EXPECT_EQ(session->exitAllPositions(), 0);
}
