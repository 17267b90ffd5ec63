/**
 * @file ConfigManager.hpp
 * @brief Manages configuration settings for the trading terminal
 */

#pragma once

#include <string>
#include <memory>
#include <nlohmann/json.hpp>
#include "../utils/Logger.hpp"

namespace OptionsScalper {

using json = nlohmann::json;

/**
 * @struct TerminalSettings
 * @brief Typed snapshot of every tunable the session reads at start-up
 */
struct TerminalSettings {
    // api
    std::string apiKey;                            ///< Kite API key
    std::string apiSecret;                         ///< Kite API secret
    std::string accessToken;                       ///< Access token for this trading day
    std::string apiBaseUrl = "https://api.kite.trade";
    std::string loginUrl = "https://kite.zerodha.com/connect/login";
    std::string tickerUrl = "wss://ws.kite.trade";
    long connectTimeoutMs = 10000;
    long requestTimeoutMs = 30000;

    // trading
    bool paperTrading = true;                      ///< Use the paper matching engine
    std::string defaultProduct = "NRML";
    std::string exchange = "NFO";
    int orderConfirmRetries = 5;
    int orderConfirmDelayMs = 700;

    // session
    int refreshIntervalMs = 2000;                  ///< Reconciliation period
    int accountCheckIntervalMs = 10000;            ///< Profile/margin poll period
    int loopIntervalMs = 50;                       ///< Session loop sleep

    // circuit breaker
    int breakerFailureThreshold = 3;
    int breakerCooldownSeconds = 30;

    // ticker
    int heartbeatIntervalSeconds = 15;
    int staleAfterSeconds = 30;
    int reconnectDelaySeconds = 5;
    std::size_t eventQueueCapacity = 4096;
    std::string tickerMode = "quote";              ///< "ltp", "quote" or "full"

    // paper
    double paperStartingBalance = 1000000.0;

    // storage
    std::string dataDir = "data";

    // instruments
    std::string instrumentSnapshot;                ///< Optional instrument metadata JSON

    // logging
    std::string logFile = "options_scalper.log";
    std::string logLevel = "INFO";
    bool logToConsole = true;
};

/**
 * @class ConfigManager
 * @brief Loads the JSON configuration file and exposes typed lookups
 *
 * Keys are slash separated paths into the document, e.g. "trading/paper_trading".
 */
class ConfigManager {
public:
    /**
     * @brief Constructor
     * @param configFilePath Path to the configuration file
     * @param logger Logger instance
     */
    ConfigManager(const std::string& configFilePath, std::shared_ptr<Logger> logger);

    /**
     * @brief Load configuration from file
     * @return True if successful, false otherwise
     */
    bool loadConfig();

    /**
     * @brief Load configuration from an in-memory JSON document
     * @param content JSON text
     * @return True if successful, false otherwise
     */
    bool loadFromString(const std::string& content);

    /**
     * @brief Get a string value from the configuration
     * @param key Configuration key
     * @param defaultValue Default value if key is not found
     * @return String value
     */
    std::string getStringValue(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get an integer value from the configuration
     * @param key Configuration key
     * @param defaultValue Default value if key is not found
     * @return Integer value
     */
    int getIntValue(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get a double value from the configuration
     * @param key Configuration key
     * @param defaultValue Default value if key is not found
     * @return Double value
     */
    double getDoubleValue(const std::string& key, double defaultValue = 0.0) const;

    /**
     * @brief Get a boolean value from the configuration
     * @param key Configuration key
     * @param defaultValue Default value if key is not found
     * @return Boolean value
     */
    bool getBoolValue(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Get a section of the configuration
     * @param sectionKey Section key
     * @return JSON object representing the section, empty object if absent
     */
    json getSection(const std::string& sectionKey) const;

    /**
     * @brief Collect all typed settings, falling back to defaults per key
     */
    TerminalSettings getSettings() const;

private:
    template<typename T>
    T getValue(const std::string& key, const T& defaultValue, const char* typeName) const {
        try {
            auto path = json::json_pointer(key.empty() ? "" : "/" + key);
            if (m_config.contains(path)) {
                return m_config.at(path).get<T>();
            }
        } catch (const std::exception& e) {
            m_logger->warn("Exception while getting {} value for key {}: {}", typeName, key, e.what());
        }
        return defaultValue;
    }

    std::string m_configFilePath;     ///< Path to the configuration file
    json m_config;                    ///< Configuration data
    std::shared_ptr<Logger> m_logger; ///< Logger instance
};

}  // namespace OptionsScalper
