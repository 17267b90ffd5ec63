/**
 * @file AuthManager.cpp
 * @brief Implementation of the AuthManager class
 */

#include "../auth/AuthManager.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>

namespace OptionsScalper {

AuthManager::AuthManager(
    const TerminalSettings& settings,
    std::shared_ptr<HttpClient> httpClient,
    std::shared_ptr<Clock> clock,
    std::shared_ptr<Logger> logger
) : m_httpClient(httpClient),
    m_clock(clock),
    m_logger(logger),
    m_apiKey(settings.apiKey),
    m_apiSecret(settings.apiSecret),
    m_apiBaseUrl(settings.apiBaseUrl),
    m_loginUrl(settings.loginUrl) {

    if (m_apiKey.empty()) {
        m_logger->warn("API key not found in configuration");
    }

    if (!settings.accessToken.empty()) {
        setAccessToken(settings.accessToken);
    }
}

std::string AuthManager::generateLoginUrl() const {
    std::string loginUrl = m_loginUrl + "?api_key=" + HttpClient::urlEncode(m_apiKey) + "&v=3";
    m_logger->info("Generated login URL: {}", loginUrl);
    return loginUrl;
}

bool AuthManager::generateAccessToken(const std::string& requestToken) {
    if (m_apiKey.empty() || m_apiSecret.empty()) {
        m_logger->error("API key or secret not set");
        return false;
    }

    std::string checksum = computeChecksum(m_apiKey, requestToken, m_apiSecret);

    std::unordered_map<std::string, std::string> headers = {
        {"X-Kite-Version", "3"},
        {"Content-Type", "application/x-www-form-urlencoded"}
    };

    std::string requestBody = HttpClient::formEncode({
        {"api_key", m_apiKey},
        {"request_token", requestToken},
        {"checksum", checksum}
    });

    HttpResponse response = m_httpClient->request(
        HttpMethod::POST,
        m_apiBaseUrl + "/session/token",
        headers,
        requestBody
    );

    if (response.statusCode != 200) {
        m_logger->error("Failed to generate access token. Status code: {}, Response: {}",
                        response.statusCode, response.body);
        return false;
    }

    try {
        json responseJson = json::parse(response.body);
        if (responseJson.value("status", std::string()) != "success") {
            m_logger->error("Failed to generate access token: {}",
                            responseJson.value("message", std::string("unknown error")));
            return false;
        }

        setAccessToken(responseJson.at("data").at("access_token").get<std::string>());
        m_logger->info("Access token generated successfully");
        return true;
    } catch (const std::exception& e) {
        m_logger->error("Exception while parsing session response: {}", e.what());
    }

    return false;
}

bool AuthManager::isAccessTokenValid() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_accessToken.empty()) {
        return false;
    }

    return m_clock->now() < m_accessTokenExpiry;
}

void AuthManager::invalidateAccessToken() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_accessToken.empty()) {
        return;
    }
    m_accessToken.clear();
    m_accessTokenExpiry = std::chrono::system_clock::time_point();
    m_logger->warn("Access token invalidated, a fresh login is required");
}

std::string AuthManager::getAccessToken() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_accessToken;
}

void AuthManager::setAccessToken(const std::string& accessToken) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_accessToken = accessToken;
    // Kite access tokens live for one trading day
    m_accessTokenExpiry = m_clock->now() + std::chrono::hours(24);
    m_logger->debug("Access token set, expires {}", formatDateTime(m_accessTokenExpiry));
}

std::string AuthManager::authorizationHeader() const {
    return "token " + m_apiKey + ":" + getAccessToken();
}

std::string AuthManager::computeChecksum(const std::string& apiKey,
                                         const std::string& requestToken,
                                         const std::string& apiSecret) {
    std::string input = apiKey + requestToken + apiSecret;

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;
    if (EVP_Digest(input.data(), input.size(), hash, &hashLength, EVP_sha256(), nullptr) != 1) {
        return "";
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLength; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }

    return ss.str();
}

}  // namespace OptionsScalper
