/**
 * @file KiteTicker.hpp
 * @brief Kite streaming quotes over a TLS websocket
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include "../auth/AuthManager.hpp"
#include "../config/ConfigManager.hpp"
#include "../market/TickerTransport.hpp"
#include "../utils/Logger.hpp"

namespace OptionsScalper {

/**
 * @class KiteTicker
 * @brief TickerTransport implementation for wss://ws.kite.trade
 *
 * All socket work happens on one internal io_context thread. Public calls
 * post onto that thread, so they are safe from any caller. Binary frames
 * are decoded into Tick batches; one-byte heartbeat frames are ignored.
 */
class KiteTicker : public TickerTransport {
public:
    KiteTicker(const TerminalSettings& settings,
               std::shared_ptr<AuthManager> authManager,
               std::shared_ptr<Logger> logger);

    ~KiteTicker() override;

    KiteTicker(const KiteTicker&) = delete;
    KiteTicker& operator=(const KiteTicker&) = delete;

    void setEventSink(EventSink sink) override;
    void connect() override;
    void close() override;
    bool isConnected() const override { return m_connected.load(); }

    void subscribe(const std::vector<uint32_t>& tokens) override;
    void unsubscribe(const std::vector<uint32_t>& tokens) override;
    void setMode(const std::string& mode, const std::vector<uint32_t>& tokens) override;

    /**
     * @brief Decode one binary message into ticks
     *
     * Layout: 2-byte packet count, then per packet a 2-byte length and the
     * packet. Bytes 0-4 of a packet are the token and bytes 4-8 the last
     * price in paise (or the segment's smaller unit), all big-endian.
     */
    static std::vector<Tick> decodeFrame(const std::string& frame);

    /**
     * @brief Price divisor for a token's segment
     */
    static double priceDivisor(uint32_t token);

    /**
     * @brief {"a": action, "v": [tokens]}
     */
    static std::string buildCommand(const std::string& action, const std::vector<uint32_t>& tokens);

    /**
     * @brief {"a": "mode", "v": [mode, [tokens]]}
     */
    static std::string buildModeCommand(const std::string& mode, const std::vector<uint32_t>& tokens);

private:
    using WebSocket = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

    struct Connection {
        Connection(boost::asio::io_context& ioc, boost::asio::ssl::context& ctx)
            : resolver(ioc), ws(ioc, ctx) {}

        boost::asio::ip::tcp::resolver resolver;
        WebSocket ws;
        boost::beast::flat_buffer buffer;
        std::deque<std::string> outbox;  ///< Pending text commands, front is in flight
        bool closing = false;
    };

    void doConnect();
    void doClose();
    void send(std::string message);
    void doWrite(std::shared_ptr<Connection> conn);
    void startRead(std::shared_ptr<Connection> conn);
    void fail(const std::shared_ptr<Connection>& conn, StreamEvent event);
    bool isCurrent(const std::shared_ptr<Connection>& conn) const;
    void publish(StreamEvent event);

    std::shared_ptr<AuthManager> m_authManager;
    std::shared_ptr<Logger> m_logger;
    std::string m_host;
    std::string m_port;

    boost::asio::io_context m_ioc;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> m_work;
    boost::asio::ssl::context m_sslCtx;
    std::thread m_ioThread;

    std::shared_ptr<Connection> m_connection;    ///< Touched on the io thread only
    std::atomic<bool> m_connected{false};

    std::mutex m_sinkMutex;
    EventSink m_sink;
};

}  // namespace OptionsScalper
