/**
 * @file StreamSupervisor.cpp
 * @brief Implementation of the StreamSupervisor class
 */

#include "../market/StreamSupervisor.hpp"
#include <algorithm>
#include <iterator>
#include "../utils/Errors.hpp"

namespace OptionsScalper {

std::string toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "Disconnected";
        case ConnectionState::CONNECTING:   return "Connecting";
        case ConnectionState::CONNECTED:    return "Connected";
        case ConnectionState::RECONNECTING: return "Reconnecting";
        default:                            return "Unknown";
    }
}

StreamSupervisor::StreamSupervisor(std::shared_ptr<TickerTransport> transport,
                                   SupervisorTimings timings,
                                   std::size_t queueCapacity,
                                   std::string mode,
                                   std::shared_ptr<Clock> clock,
                                   std::shared_ptr<Logger> logger)
    : m_transport(transport),
      m_timings(timings),
      m_mode(std::move(mode)),
      m_clock(clock),
      m_logger(logger),
      m_events(queueCapacity) {

    m_transport->setEventSink([this](StreamEvent event) {
        if (!m_events.tryPush(std::move(event))) {
            m_droppedEvents++;
        }
    });
}

StreamSupervisor::~StreamSupervisor() {
    m_transport->setEventSink(nullptr);
}

void StreamSupervisor::start() {
    if (m_running) {
        m_logger->warn("Stream supervisor is already running");
        return;
    }

    m_logger->info("Stream supervisor starting");
    m_running = true;
    m_reconnectPending = false;
    beginConnect();
}

void StreamSupervisor::stop() {
    m_logger->info("Stopping stream supervisor");
    m_running = false;
    m_reconnectPending = false;
    m_transport->close();
    setState(ConnectionState::DISCONNECTED);
}

void StreamSupervisor::setSubscriptions(const std::set<uint32_t>& tokens, bool append) {
    std::set<uint32_t> desired = tokens;
    if (append) {
        desired.insert(m_subscriptions.begin(), m_subscriptions.end());
    }

    if (m_state != ConnectionState::CONNECTED || !m_transport->isConnected()) {
        m_logger->debug("Stream not connected, storing {} tokens for when it connects", desired.size());
        m_subscriptions = std::move(desired);
        return;
    }

    std::vector<uint32_t> toAdd;
    std::set_difference(desired.begin(), desired.end(),
                        m_subscriptions.begin(), m_subscriptions.end(),
                        std::back_inserter(toAdd));

    std::vector<uint32_t> toRemove;
    if (!append) {
        std::set_difference(m_subscriptions.begin(), m_subscriptions.end(),
                            desired.begin(), desired.end(),
                            std::back_inserter(toRemove));
    }

    if (!toAdd.empty()) {
        m_transport->subscribe(toAdd);
        m_transport->setMode(m_mode, toAdd);
        m_logger->info("Subscribed to {} new tokens", toAdd.size());
    }

    if (!toRemove.empty()) {
        m_transport->unsubscribe(toRemove);
        m_logger->info("Unsubscribed from {} tokens", toRemove.size());
    }

    m_subscriptions = std::move(desired);
}

std::size_t StreamSupervisor::pumpEvents(const TickHandler& onTicks) {
    std::size_t processed = 0;

    std::size_t dropped = m_droppedEvents.exchange(0);
    if (dropped > 0) {
        m_logger->warn("Event channel full, dropped {} transport events", dropped);
    }

    while (auto event = m_events.tryPop()) {
        ++processed;
        switch (event->type) {
            case StreamEvent::Type::CONNECTED:
                handleConnected();
                break;
            case StreamEvent::Type::TICKS:
                if (m_state == ConnectionState::CONNECTED) {
                    m_lastTickTime = m_clock->now();
                }
                if (onTicks && !event->ticks.empty()) {
                    onTicks(event->ticks);
                }
                break;
            case StreamEvent::Type::CLOSED:
                m_logger->warn("Stream closed. Code: {}, Reason: {}", event->code, event->reason);
                handleDisconnected(event->reason);
                break;
            case StreamEvent::Type::ERROR:
                m_logger->error("Stream error. Code: {}, Reason: {}", event->code, event->reason);
                handleDisconnected(event->reason);
                break;
        }
    }

    return processed;
}

void StreamSupervisor::poll() {
    if (!m_running) {
        return;
    }

    Clock::TimePoint now = m_clock->now();

    if (m_state == ConnectionState::CONNECTED && now >= m_nextHeartbeat) {
        m_nextHeartbeat = now + m_timings.heartbeatInterval;

        if (!m_subscriptions.empty() && now - m_lastTickTime > m_timings.staleAfter) {
            StaleConnectionError stale("No ticks received within the staleness window");
            m_logger->warn("Heartbeat: {}. Forcing reconnect", stale.what());
            m_transport->close();
            setState(ConnectionState::DISCONNECTED);
            m_reconnectAttempts++;
            setState(ConnectionState::RECONNECTING);
            beginConnect();
            return;
        }
    }

    if (m_reconnectPending && now >= m_reconnectDue) {
        m_reconnectPending = false;
        m_reconnectAttempts++;
        m_logger->info("Attempting to reconnect (attempt #{})", m_reconnectAttempts);
        setState(ConnectionState::RECONNECTING);
        beginConnect();
    }
}

void StreamSupervisor::beginConnect() {
    setState(ConnectionState::CONNECTING);
    m_transport->connect();
}

void StreamSupervisor::handleConnected() {
    if (!m_running) {
        m_transport->close();
        return;
    }

    Clock::TimePoint now = m_clock->now();
    setState(ConnectionState::CONNECTED);
    m_reconnectAttempts = 0;
    m_reconnectPending = false;
    m_lastTickTime = now;
    m_nextHeartbeat = now + m_timings.heartbeatInterval;

    if (!m_subscriptions.empty()) {
        std::vector<uint32_t> tokens(m_subscriptions.begin(), m_subscriptions.end());
        m_transport->subscribe(tokens);
        m_transport->setMode(m_mode, tokens);
        m_logger->info("Stream connected, subscribed to {} tokens", tokens.size());
    } else {
        m_logger->info("Stream connected");
    }
}

void StreamSupervisor::handleDisconnected(const std::string& reason) {
    if (m_state == ConnectionState::DISCONNECTED && m_reconnectPending) {
        return;
    }

    setState(ConnectionState::DISCONNECTED);
    if (!m_running) {
        return;
    }

    m_reconnectPending = true;
    m_reconnectDue = m_clock->now() + m_timings.reconnectDelay;
    m_logger->info("Reconnecting in {}s after: {}", m_timings.reconnectDelay.count(), reason);
}

void StreamSupervisor::setState(ConnectionState state) {
    if (m_state == state) {
        return;
    }
    m_logger->debug("Stream state {} -> {}", toString(m_state), toString(state));
    m_state = state;
    if (m_stateListener) {
        m_stateListener(state);
    }
}

}  // namespace OptionsScalper
