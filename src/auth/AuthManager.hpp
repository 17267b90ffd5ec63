/**
 * @file AuthManager.hpp
 * @brief Manages the Kite Connect session for this process
 */

#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <chrono>
#include "../utils/Clock.hpp"
#include "../utils/Logger.hpp"
#include "../utils/HttpClient.hpp"
#include "../config/ConfigManager.hpp"

namespace OptionsScalper {

/**
 * @class AuthManager
 * @brief Holds API credentials and the access token of the current trading day
 *
 * Credentials come from configuration only; nothing is written back to disk.
 */
class AuthManager {
public:
    /**
     * @brief Constructor
     * @param settings Terminal settings carrying the API credentials
     * @param httpClient HTTP client used for the token exchange
     * @param clock Time source for token expiry
     * @param logger Logger instance
     */
    AuthManager(
        const TerminalSettings& settings,
        std::shared_ptr<HttpClient> httpClient,
        std::shared_ptr<Clock> clock,
        std::shared_ptr<Logger> logger
    );

    /**
     * @brief Generate login URL for the user to authenticate
     * @return Login URL
     */
    std::string generateLoginUrl() const;

    /**
     * @brief Exchange a request token for an access token
     * @param requestToken Request token received after user authentication
     * @return true if successful, false otherwise
     */
    bool generateAccessToken(const std::string& requestToken);

    /**
     * @brief Check if current access token is present and not expired
     */
    bool isAccessTokenValid() const;

    /**
     * @brief Drop the access token after the broker rejected it
     */
    void invalidateAccessToken();

    std::string getAccessToken() const;

    /**
     * @brief Set the access token, valid for 24 hours from now
     */
    void setAccessToken(const std::string& accessToken);

    const std::string& getApiKey() const { return m_apiKey; }

    /**
     * @brief Value of the Authorization header, "token key:access"
     */
    std::string authorizationHeader() const;

    /**
     * @brief Login checksum, hex SHA-256 of apiKey + requestToken + apiSecret
     */
    static std::string computeChecksum(const std::string& apiKey,
                                       const std::string& requestToken,
                                       const std::string& apiSecret);

private:
    std::shared_ptr<HttpClient> m_httpClient;        ///< HTTP client
    std::shared_ptr<Clock> m_clock;                  ///< Time source
    std::shared_ptr<Logger> m_logger;                ///< Logger instance

    std::string m_apiKey;                            ///< API key
    std::string m_apiSecret;                         ///< API secret
    std::string m_apiBaseUrl;                        ///< REST base URL
    std::string m_loginUrl;                          ///< Login page URL
    std::string m_accessToken;                       ///< Access token
    std::chrono::system_clock::time_point m_accessTokenExpiry;  ///< Access token expiry time

    mutable std::mutex m_mutex;                      ///< Mutex for thread safety
};

}  // namespace OptionsScalper
