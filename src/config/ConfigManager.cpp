/**
 * @file ConfigManager.cpp
 * @brief Implementation of the ConfigManager class
 */

#include "../config/ConfigManager.hpp"
#include <fstream>

namespace OptionsScalper {

ConfigManager::ConfigManager(const std::string& configFilePath, std::shared_ptr<Logger> logger)
    : m_configFilePath(configFilePath), m_config(json::object()), m_logger(logger) {
    m_logger->debug("ConfigManager initialized with config file: {}", configFilePath);
}

bool ConfigManager::loadConfig() {
    try {
        std::ifstream configFile(m_configFilePath);
        if (!configFile.is_open()) {
            m_logger->error("Failed to open configuration file: {}", m_configFilePath);
            return false;
        }

        configFile >> m_config;

        m_logger->info("Configuration loaded successfully from {}", m_configFilePath);
        return true;
    } catch (const std::exception& e) {
        m_logger->error("Exception while loading configuration: {}", e.what());
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& content) {
    try {
        m_config = json::parse(content);
        return true;
    } catch (const std::exception& e) {
        m_logger->error("Exception while parsing configuration: {}", e.what());
        return false;
    }
}

std::string ConfigManager::getStringValue(const std::string& key, const std::string& defaultValue) const {
    return getValue<std::string>(key, defaultValue, "string");
}

int ConfigManager::getIntValue(const std::string& key, int defaultValue) const {
    return getValue<int>(key, defaultValue, "int");
}

double ConfigManager::getDoubleValue(const std::string& key, double defaultValue) const {
    return getValue<double>(key, defaultValue, "double");
}

bool ConfigManager::getBoolValue(const std::string& key, bool defaultValue) const {
    return getValue<bool>(key, defaultValue, "bool");
}

json ConfigManager::getSection(const std::string& sectionKey) const {
    return getValue<json>(sectionKey, json::object(), "section");
}

TerminalSettings ConfigManager::getSettings() const {
    TerminalSettings s;

    s.apiKey = getStringValue("api/key", s.apiKey);
    s.apiSecret = getStringValue("api/secret", s.apiSecret);
    s.accessToken = getStringValue("api/access_token", s.accessToken);
    s.apiBaseUrl = getStringValue("api/base_url", s.apiBaseUrl);
    s.loginUrl = getStringValue("api/login_url", s.loginUrl);
    s.tickerUrl = getStringValue("api/ticker_url", s.tickerUrl);
    s.connectTimeoutMs = getIntValue("api/connect_timeout_ms", static_cast<int>(s.connectTimeoutMs));
    s.requestTimeoutMs = getIntValue("api/request_timeout_ms", static_cast<int>(s.requestTimeoutMs));

    s.paperTrading = getBoolValue("trading/paper_trading", s.paperTrading);
    s.defaultProduct = getStringValue("trading/default_product", s.defaultProduct);
    s.exchange = getStringValue("trading/exchange", s.exchange);
    s.orderConfirmRetries = getIntValue("trading/order_confirm_retries", s.orderConfirmRetries);
    s.orderConfirmDelayMs = getIntValue("trading/order_confirm_delay_ms", s.orderConfirmDelayMs);

    s.refreshIntervalMs = getIntValue("session/refresh_interval_ms", s.refreshIntervalMs);
    s.accountCheckIntervalMs = getIntValue("session/account_check_interval_ms", s.accountCheckIntervalMs);
    s.loopIntervalMs = getIntValue("session/loop_interval_ms", s.loopIntervalMs);

    s.breakerFailureThreshold = getIntValue("circuit_breaker/failure_threshold", s.breakerFailureThreshold);
    s.breakerCooldownSeconds = getIntValue("circuit_breaker/cooldown_seconds", s.breakerCooldownSeconds);

    s.heartbeatIntervalSeconds = getIntValue("ticker/heartbeat_interval_seconds", s.heartbeatIntervalSeconds);
    s.staleAfterSeconds = getIntValue("ticker/stale_after_seconds", s.staleAfterSeconds);
    s.reconnectDelaySeconds = getIntValue("ticker/reconnect_delay_seconds", s.reconnectDelaySeconds);
    s.eventQueueCapacity = static_cast<std::size_t>(
        getIntValue("ticker/event_queue_capacity", static_cast<int>(s.eventQueueCapacity)));
    s.tickerMode = getStringValue("ticker/mode", s.tickerMode);

    s.paperStartingBalance = getDoubleValue("paper/starting_balance", s.paperStartingBalance);
    s.dataDir = getStringValue("storage/data_dir", s.dataDir);
    s.instrumentSnapshot = getStringValue("instruments/snapshot", s.instrumentSnapshot);

    s.logFile = getStringValue("logging/file", s.logFile);
    s.logLevel = getStringValue("logging/level", s.logLevel);
    s.logToConsole = getBoolValue("logging/console", s.logToConsole);

    if (s.breakerFailureThreshold < 1) {
        m_logger->warn("circuit_breaker/failure_threshold must be >= 1, using 1");
        s.breakerFailureThreshold = 1;
    }
    if (s.eventQueueCapacity == 0) {
        m_logger->warn("ticker/event_queue_capacity must be positive, using 4096");
        s.eventQueueCapacity = 4096;
    }

    return s;
}

}  // namespace OptionsScalper
