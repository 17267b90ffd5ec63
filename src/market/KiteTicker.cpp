/**
 * @file KiteTicker.cpp
 * @brief Implementation of the KiteTicker class
 */

#include "../market/KiteTicker.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <openssl/ssl.h>

namespace asio      = boost::asio;
namespace ssl       = asio::ssl;
namespace beast     = boost::beast;
namespace websocket = beast::websocket;
using json = nlohmann::json;

namespace OptionsScalper {

namespace {

// Kite exchange segment ids carried in the low byte of a token
constexpr uint32_t kSegmentCds = 3;
constexpr uint32_t kSegmentBcd = 6;

uint32_t readUint32(const std::string& data, std::size_t offset) {
    return (static_cast<uint32_t>(static_cast<unsigned char>(data[offset])) << 24) |
           (static_cast<uint32_t>(static_cast<unsigned char>(data[offset + 1])) << 16) |
           (static_cast<uint32_t>(static_cast<unsigned char>(data[offset + 2])) << 8) |
           static_cast<uint32_t>(static_cast<unsigned char>(data[offset + 3]));
}

uint16_t readUint16(const std::string& data, std::size_t offset) {
    return static_cast<uint16_t>(
        (static_cast<unsigned char>(data[offset]) << 8) |
        static_cast<unsigned char>(data[offset + 1]));
}

}  // namespace

KiteTicker::KiteTicker(const TerminalSettings& settings,
                       std::shared_ptr<AuthManager> authManager,
                       std::shared_ptr<Logger> logger)
    : m_authManager(authManager),
      m_logger(logger),
      m_port("443"),
      m_work(asio::make_work_guard(m_ioc)),
      m_sslCtx(ssl::context::tls_client) {

    std::string url = settings.tickerUrl;
    const std::string scheme = "wss://";
    if (url.compare(0, scheme.size(), scheme) == 0) {
        url = url.substr(scheme.size());
    }
    std::size_t slash = url.find('/');
    if (slash != std::string::npos) {
        url = url.substr(0, slash);
    }
    std::size_t colon = url.find(':');
    if (colon != std::string::npos) {
        m_port = url.substr(colon + 1);
        url = url.substr(0, colon);
    }
    m_host = url;

    m_sslCtx.set_default_verify_paths();
    m_sslCtx.set_verify_mode(ssl::verify_peer);

    m_ioThread = std::thread([this]() { m_ioc.run(); });
}

KiteTicker::~KiteTicker() {
    asio::post(m_ioc, [this]() {
        doClose();
        m_ioc.stop();
    });
    m_work.reset();
    if (m_ioThread.joinable()) {
        m_ioThread.join();
    }
}

void KiteTicker::setEventSink(EventSink sink) {
    std::lock_guard<std::mutex> lock(m_sinkMutex);
    m_sink = std::move(sink);
}

void KiteTicker::connect() {
    asio::post(m_ioc, [this]() { doConnect(); });
}

void KiteTicker::close() {
    m_connected = false;
    asio::post(m_ioc, [this]() { doClose(); });
}

void KiteTicker::subscribe(const std::vector<uint32_t>& tokens) {
    send(buildCommand("subscribe", tokens));
}

void KiteTicker::unsubscribe(const std::vector<uint32_t>& tokens) {
    send(buildCommand("unsubscribe", tokens));
}

void KiteTicker::setMode(const std::string& mode, const std::vector<uint32_t>& tokens) {
    send(buildModeCommand(mode, tokens));
}

void KiteTicker::doConnect() {
    doClose();

    auto conn = std::make_shared<Connection>(m_ioc, m_sslCtx);
    m_connection = conn;
    m_logger->info("Connecting to {}:{}", m_host, m_port);

    conn->resolver.async_resolve(m_host, m_port,
        [this, conn](beast::error_code ec, asio::ip::tcp::resolver::results_type results) {
            if (!isCurrent(conn)) return;
            if (ec) return fail(conn, StreamEvent::error(ec.value(), "resolve: " + ec.message()));

            beast::get_lowest_layer(conn->ws).expires_after(std::chrono::seconds(10));
            beast::get_lowest_layer(conn->ws).async_connect(results,
                [this, conn](beast::error_code ec, asio::ip::tcp::endpoint) {
                    if (!isCurrent(conn)) return;
                    if (ec) return fail(conn, StreamEvent::error(ec.value(), "connect: " + ec.message()));

                    if (!SSL_set_tlsext_host_name(conn->ws.next_layer().native_handle(), m_host.c_str())) {
                        return fail(conn, StreamEvent::error(0, "Failed to set SNI host name"));
                    }
                    conn->ws.next_layer().set_verify_callback(ssl::host_name_verification(m_host));

                    conn->ws.next_layer().async_handshake(ssl::stream_base::client,
                        [this, conn](beast::error_code ec) {
                            if (!isCurrent(conn)) return;
                            if (ec) return fail(conn, StreamEvent::error(ec.value(), "tls: " + ec.message()));

                            beast::get_lowest_layer(conn->ws).expires_never();
                            conn->ws.set_option(
                                websocket::stream_base::timeout::suggested(beast::role_type::client));

                            std::string target = "/?api_key=" + HttpClient::urlEncode(m_authManager->getApiKey()) +
                                                 "&access_token=" + HttpClient::urlEncode(m_authManager->getAccessToken());

                            conn->ws.async_handshake(m_host, target,
                                [this, conn](beast::error_code ec) {
                                    if (!isCurrent(conn)) return;
                                    if (ec) return fail(conn, StreamEvent::error(ec.value(), "websocket: " + ec.message()));

                                    m_connected = true;
                                    m_logger->info("Ticker websocket connected");
                                    publish(StreamEvent::connected());
                                    startRead(conn);
                                });
                        });
                });
        });
}

void KiteTicker::doClose() {
    if (!m_connection) {
        return;
    }

    auto conn = m_connection;
    m_connection.reset();
    conn->closing = true;
    m_connected = false;

    conn->resolver.cancel();
    beast::get_lowest_layer(conn->ws).close();
}

void KiteTicker::send(std::string message) {
    asio::post(m_ioc, [this, message = std::move(message)]() mutable {
        auto conn = m_connection;
        if (!conn || !m_connected) {
            m_logger->debug("Ticker not connected, dropping command {}", message);
            return;
        }
        conn->outbox.push_back(std::move(message));
        if (conn->outbox.size() == 1) {
            doWrite(conn);
        }
    });
}

void KiteTicker::doWrite(std::shared_ptr<Connection> conn) {
    conn->ws.text(true);
    conn->ws.async_write(asio::buffer(conn->outbox.front()),
        [this, conn](beast::error_code ec, std::size_t) {
            if (!isCurrent(conn)) return;
            if (ec) return fail(conn, StreamEvent::closed(ec.value(), "write: " + ec.message()));

            conn->outbox.pop_front();
            if (!conn->outbox.empty()) {
                doWrite(conn);
            }
        });
}

void KiteTicker::startRead(std::shared_ptr<Connection> conn) {
    conn->ws.async_read(conn->buffer,
        [this, conn](beast::error_code ec, std::size_t) {
            if (!isCurrent(conn)) return;
            if (ec) {
                int code = ec == websocket::error::closed ? static_cast<int>(conn->ws.reason().code) : ec.value();
                return fail(conn, StreamEvent::closed(code, ec.message()));
            }

            std::string message = beast::buffers_to_string(conn->buffer.data());
            conn->buffer.consume(conn->buffer.size());

            if (conn->ws.got_binary()) {
                std::vector<Tick> ticks = decodeFrame(message);
                if (!ticks.empty()) {
                    publish(StreamEvent::tickBatch(std::move(ticks)));
                }
            } else {
                try {
                    json payload = json::parse(message);
                    std::string type = payload.value("type", std::string());
                    if (type == "error") {
                        m_logger->error("Ticker error message: {}", payload.value("data", std::string()));
                    } else {
                        m_logger->debug("Ticker text message of type {}", type);
                    }
                } catch (const std::exception& e) {
                    m_logger->warn("Unparseable ticker text message: {}", e.what());
                }
            }

            startRead(conn);
        });
}

void KiteTicker::fail(const std::shared_ptr<Connection>& conn, StreamEvent event) {
    if (conn->closing) {
        return;
    }
    m_logger->warn("Ticker connection lost: {}", event.reason);
    conn->closing = true;
    m_connection.reset();
    m_connected = false;

    beast::get_lowest_layer(conn->ws).close();
    publish(std::move(event));
}

bool KiteTicker::isCurrent(const std::shared_ptr<Connection>& conn) const {
    return conn == m_connection && !conn->closing;
}

void KiteTicker::publish(StreamEvent event) {
    std::lock_guard<std::mutex> lock(m_sinkMutex);
    if (m_sink) {
        m_sink(std::move(event));
    }
}

std::vector<Tick> KiteTicker::decodeFrame(const std::string& frame) {
    std::vector<Tick> ticks;
    if (frame.size() < 2) {
        return ticks;
    }

    uint16_t packetCount = readUint16(frame, 0);
    std::size_t offset = 2;

    for (uint16_t i = 0; i < packetCount; ++i) {
        if (offset + 2 > frame.size()) {
            break;
        }
        uint16_t length = readUint16(frame, offset);
        offset += 2;
        if (offset + length > frame.size()) {
            break;
        }

        if (length >= 8) {
            Tick tick;
            tick.instrumentToken = readUint32(frame, offset);
            int32_t rawPrice = static_cast<int32_t>(readUint32(frame, offset + 4));
            tick.lastPrice = rawPrice / priceDivisor(tick.instrumentToken);
            ticks.push_back(tick);
        }

        offset += length;
    }

    return ticks;
}

double KiteTicker::priceDivisor(uint32_t token) {
    uint32_t segment = token & 0xff;
    if (segment == kSegmentCds) {
        return 10000000.0;
    }
    if (segment == kSegmentBcd) {
        return 10000.0;
    }
    return 100.0;
}

std::string KiteTicker::buildCommand(const std::string& action, const std::vector<uint32_t>& tokens) {
    json command = {{"a", action}, {"v", tokens}};
    return command.dump();
}

std::string KiteTicker::buildModeCommand(const std::string& mode, const std::vector<uint32_t>& tokens) {
    json command = {{"a", "mode"}, {"v", json::array({mode, tokens})}};
    return command.dump();
}

}  // namespace OptionsScalper
