/**
 * @file TickerTransport.hpp
 * @brief Market-data transport interface and the events it publishes
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace OptionsScalper {

/**
 * @struct Tick
 * @brief Last traded price of one instrument
 */
struct Tick {
    uint32_t instrumentToken = 0;
    double lastPrice = 0.0;
};

/**
 * @struct StreamEvent
 * @brief One transport callback, delivered through the supervisor's channel
 */
struct StreamEvent {
    enum class Type {
        CONNECTED,
        TICKS,
        CLOSED,
        ERROR
    };

    Type type = Type::TICKS;
    std::vector<Tick> ticks;   ///< Set for TICKS
    int code = 0;              ///< Close or error code
    std::string reason;        ///< Close or error text

    static StreamEvent connected() {
        StreamEvent event;
        event.type = Type::CONNECTED;
        return event;
    }

    static StreamEvent tickBatch(std::vector<Tick> ticks) {
        StreamEvent event;
        event.type = Type::TICKS;
        event.ticks = std::move(ticks);
        return event;
    }

    static StreamEvent closed(int code, std::string reason) {
        StreamEvent event;
        event.type = Type::CLOSED;
        event.code = code;
        event.reason = std::move(reason);
        return event;
    }

    static StreamEvent error(int code, std::string reason) {
        StreamEvent event;
        event.type = Type::ERROR;
        event.code = code;
        event.reason = std::move(reason);
        return event;
    }
};

/**
 * @class TickerTransport
 * @brief Streaming connection to the broker's tick feed
 *
 * connect() is asynchronous: the outcome arrives as a CONNECTED, ERROR or
 * CLOSED event through the sink, possibly on another thread. A close()
 * requested by the caller publishes no event.
 */
class TickerTransport {
public:
    using EventSink = std::function<void(StreamEvent)>;

    virtual ~TickerTransport() = default;

    /**
     * @brief Install the callback that receives every event
     */
    virtual void setEventSink(EventSink sink) = 0;

    virtual void connect() = 0;
    virtual void close() = 0;
    virtual bool isConnected() const = 0;

    virtual void subscribe(const std::vector<uint32_t>& tokens) = 0;
    virtual void unsubscribe(const std::vector<uint32_t>& tokens) = 0;

    /**
     * @brief Set the streaming mode ("ltp", "quote" or "full") for tokens
     */
    virtual void setMode(const std::string& mode, const std::vector<uint32_t>& tokens) = 0;
};

}  // namespace OptionsScalper
