// =============================================================================
// TestSupport.hpp
// =============================================================================
// Hand-written collaborators shared by the unit tests:
//   - ManualClock: a Clock that only moves when the test says so
//   - FakeExecutionClient: scripted broker that records every call
//   - FakeTransport: TickerTransport that records commands and lets the test
//     publish events as if they came from the socket thread
//   - RecordingObserver: counts StoreObserver callbacks
//   - TempDir: scratch directory removed when the test ends
// =============================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "config/ConfigManager.hpp"
#include "market/TickerTransport.hpp"
#include "positions/StoreObserver.hpp"
#include "trading/ExecutionClient.hpp"
#include "utils/Clock.hpp"
#include "utils/Errors.hpp"
#include "utils/Logger.hpp"

namespace OptionsScalper {
namespace test {

inline std::shared_ptr<Logger> quietLogger() {
    return std::make_shared<Logger>("", false, LogLevel::FATAL);
}

class ManualClock : public Clock {
public:
    // 10:00 local time on a Monday, well before any expiry the tests use
    ManualClock() : m_now(parseDateTime("2024-06-03 10:00:00")) {}

    TimePoint now() const override { return m_now; }

    void advance(std::chrono::seconds delta) { m_now += delta; }
    void set(TimePoint timePoint) { m_now = timePoint; }

private:
    TimePoint m_now;
};

class FakeExecutionClient : public ExecutionClient {
public:
    std::string placeOrder(const OrderRequest& request) override {
        placed.push_back(request);
        if (placeFailures > 0) {
            --placeFailures;
            throw TransientApiError("simulated network failure");
        }
        if (rejectOrders) {
            throw RejectedOrderError("Insufficient funds");
        }
        std::string orderId = "order_" + std::to_string(placed.size());
        if (autoCompleteAt) {
            RawOrder order;
            order.orderId = orderId;
            order.tradingSymbol = request.tradingSymbol;
            order.transactionType = request.side;
            order.orderType = request.orderType;
            order.quantity = request.quantity;
            order.filledQuantity = request.quantity;
            order.averagePrice = *autoCompleteAt;
            order.status = OrderStatus::COMPLETE;
            orders.push_back(order);
        }
        return orderId;
    }

    CancelResult cancelOrder(Variety, const std::string& orderId) override {
        cancelled.push_back(orderId);
        auto it = cancelResults.find(orderId);
        return it != cancelResults.end() ? it->second : CancelResult::CANCELLED;
    }

    std::vector<RawPosition> getPositions() override {
        ++positionCalls;
        if (failFetches) {
            throw TransientApiError("positions unavailable", 503);
        }
        return positions;
    }

    std::vector<RawOrder> getOrders() override {
        ++orderCalls;
        if (failFetches) {
            throw TransientApiError("orders unavailable", 503);
        }
        return orders;
    }

    MarginSnapshot getMargins() override {
        if (failAccount) {
            throw TransientApiError("margins unavailable", 503);
        }
        return margins;
    }

    UserProfile getProfile() override {
        if (failAccount) {
            throw TransientApiError("profile unavailable", 503);
        }
        return profile;
    }

    std::string getModeName() const override { return "paper"; }

    // Scripted responses
    std::vector<RawPosition> positions;
    std::vector<RawOrder> orders;
    MarginSnapshot margins;
    UserProfile profile;
    std::map<std::string, CancelResult> cancelResults;
    int placeFailures = 0;
    bool rejectOrders = false;
    bool failFetches = false;
    bool failAccount = false;
    std::optional<double> autoCompleteAt;   ///< Placed orders show up COMPLETE at this price

    // Recorded calls
    std::vector<OrderRequest> placed;
    std::vector<std::string> cancelled;
    int positionCalls = 0;
    int orderCalls = 0;
};

class FakeTransport : public TickerTransport {
public:
    void setEventSink(EventSink sink) override { m_sink = std::move(sink); }

    void connect() override { ++connectCalls; }

    void close() override {
        ++closeCalls;
        connected = false;
    }

    bool isConnected() const override { return connected; }

    void subscribe(const std::vector<uint32_t>& tokens) override { subscribed.push_back(tokens); }
    void unsubscribe(const std::vector<uint32_t>& tokens) override { unsubscribed.push_back(tokens); }

    void setMode(const std::string& mode, const std::vector<uint32_t>& tokens) override {
        modes.push_back({mode, tokens});
    }

    // Simulates a callback from the I/O thread
    void emit(StreamEvent event) {
        if (event.type == StreamEvent::Type::CONNECTED) {
            connected = true;
        } else if (event.type != StreamEvent::Type::TICKS) {
            connected = false;
        }
        if (m_sink) {
            m_sink(std::move(event));
        }
    }

    bool connected = false;
    int connectCalls = 0;
    int closeCalls = 0;
    std::vector<std::vector<uint32_t>> subscribed;
    std::vector<std::vector<uint32_t>> unsubscribed;
    std::vector<std::pair<std::string, std::vector<uint32_t>>> modes;

private:
    EventSink m_sink;
};

class RecordingObserver : public StoreObserver {
public:
    void onPositionsChanged(const std::vector<Position>& positions) override {
        ++changedCount;
        lastPositions = positions;
    }
    void onPendingOrdersChanged(const std::vector<PendingOrder>& orders) override { lastPending = orders; }
    void onPositionAdded(const Position& position) override { added.push_back(position.tradingSymbol); }
    void onPositionRemoved(const std::string& tradingSymbol) override { removed.push_back(tradingSymbol); }
    void onRefreshCompleted(bool success) override { refreshResults.push_back(success); }
    void onApiError(const std::string& message) override { apiErrors.push_back(message); }

    int changedCount = 0;
    std::vector<Position> lastPositions;
    std::vector<PendingOrder> lastPending;
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<bool> refreshResults;
    std::vector<std::string> apiErrors;
};

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        m_path = std::filesystem::temp_directory_path() /
                 ("options_scalper_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return m_path.string(); }
    std::string file(const std::string& name) const { return (m_path / name).string(); }

private:
    std::filesystem::path m_path;
};

}  // namespace test
}  // namespace OptionsScalper
