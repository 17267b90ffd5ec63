/**
 * @file StreamSupervisor.hpp
 * @brief Keeps the tick stream connected, subscribed and fresh
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "../market/TickerTransport.hpp"
#include "../utils/BoundedQueue.hpp"
#include "../utils/Clock.hpp"
#include "../utils/Logger.hpp"

namespace OptionsScalper {

/**
 * @enum ConnectionState
 * @brief Lifecycle of the streaming connection
 */
enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    RECONNECTING
};

std::string toString(ConnectionState state);

/**
 * @struct SupervisorTimings
 * @brief Heartbeat, staleness and reconnect periods
 */
struct SupervisorTimings {
    std::chrono::seconds heartbeatInterval{15};
    std::chrono::seconds staleAfter{30};
    std::chrono::seconds reconnectDelay{5};
};

/**
 * @class StreamSupervisor
 * @brief Owns the connection state machine around a TickerTransport
 *
 * Transport callbacks only push into a bounded channel. The session loop
 * drains it with pumpEvents() and drives timers with poll(); all state is
 * mutated on that one thread.
 *
 * Disconnected -> Connecting -> Connected; a close or error drops back to
 * Disconnected, and after the reconnect delay the supervisor passes through
 * Reconnecting into Connecting again. A connected stream with subscriptions
 * that has been silent longer than staleAfter is closed and reconnected at
 * once.
 */
class StreamSupervisor {
public:
    using TickHandler = std::function<void(const std::vector<Tick>&)>;
    using StateListener = std::function<void(ConnectionState)>;

    StreamSupervisor(std::shared_ptr<TickerTransport> transport,
                     SupervisorTimings timings,
                     std::size_t queueCapacity,
                     std::string mode,
                     std::shared_ptr<Clock> clock,
                     std::shared_ptr<Logger> logger);

    ~StreamSupervisor();

    StreamSupervisor(const StreamSupervisor&) = delete;
    StreamSupervisor& operator=(const StreamSupervisor&) = delete;

    /**
     * @brief Begin connecting; no-op while already running
     */
    void start();

    /**
     * @brief Stop timers and close the transport
     */
    void stop();

    /**
     * @brief Change the desired subscription set
     * @param tokens Tokens to subscribe
     * @param append Merge into the current set instead of replacing it
     *
     * While connected only the difference is sent; offline the set is
     * stored and subscribed in full on the next connect.
     */
    void setSubscriptions(const std::set<uint32_t>& tokens, bool append = false);

    /**
     * @brief Drain the event channel, handing each tick batch to onTicks in order
     * @return Number of events processed
     */
    std::size_t pumpEvents(const TickHandler& onTicks);

    /**
     * @brief Run the heartbeat and reconnect timers against the clock
     */
    void poll();

    void setStateListener(StateListener listener) { m_stateListener = std::move(listener); }

    ConnectionState getState() const { return m_state; }
    const std::set<uint32_t>& getSubscriptions() const { return m_subscriptions; }
    int getReconnectAttempts() const { return m_reconnectAttempts; }
    bool isRunning() const { return m_running; }
    Clock::TimePoint getLastTickTime() const { return m_lastTickTime; }
    std::size_t getDroppedEvents() const { return m_droppedEvents.load(); }

private:
    void beginConnect();
    void handleConnected();
    void handleDisconnected(const std::string& reason);
    void setState(ConnectionState state);

    std::shared_ptr<TickerTransport> m_transport;
    SupervisorTimings m_timings;
    std::string m_mode;
    std::shared_ptr<Clock> m_clock;
    std::shared_ptr<Logger> m_logger;

    BoundedQueue<StreamEvent> m_events;          ///< Transport to session-loop channel
    std::atomic<std::size_t> m_droppedEvents{0};

    ConnectionState m_state = ConnectionState::DISCONNECTED;
    std::set<uint32_t> m_subscriptions;          ///< Desired and, when connected, active set
    bool m_running = false;
    int m_reconnectAttempts = 0;
    Clock::TimePoint m_lastTickTime{};
    Clock::TimePoint m_nextHeartbeat{};
    bool m_reconnectPending = false;
    Clock::TimePoint m_reconnectDue{};

    StateListener m_stateListener;
};

}  // namespace OptionsScalper
