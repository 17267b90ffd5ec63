/**
 * @file KiteClient.hpp
 * @brief Live ExecutionClient over the Kite Connect v3 REST API
 */

#pragma once

#include <string>
#include <memory>
#include <vector>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "../auth/AuthManager.hpp"
#include "../config/ConfigManager.hpp"
#include "../trading/ExecutionClient.hpp"
#include "../utils/HttpClient.hpp"
#include "../utils/Logger.hpp"

namespace OptionsScalper {

/**
 * @class KiteClient
 * @brief Places and cancels orders and reads account state from Kite
 *
 * Failure mapping: no response, HTTP 429 and 5xx raise TransientApiError;
 * Input/Order/Margin exceptions on order placement raise RejectedOrderError;
 * a TokenException invalidates the session and raises ApiError.
 */
class KiteClient : public ExecutionClient {
public:
    /**
     * @brief Constructor
     * @param settings Terminal settings (base URL, timeouts)
     * @param authManager Session holder
     * @param httpClient HTTP client
     * @param logger Logger instance
     */
    KiteClient(
        const TerminalSettings& settings,
        std::shared_ptr<AuthManager> authManager,
        std::shared_ptr<HttpClient> httpClient,
        std::shared_ptr<Logger> logger
    );

    std::string placeOrder(const OrderRequest& request) override;
    CancelResult cancelOrder(Variety variety, const std::string& orderId) override;
    std::vector<RawPosition> getPositions() override;
    std::vector<RawOrder> getOrders() override;
    MarginSnapshot getMargins() override;
    UserProfile getProfile() override;
    std::string getModeName() const override { return "live"; }

    /**
     * @brief Parse one entry of the /orders response
     */
    static RawOrder parseOrderJson(const nlohmann::json& orderJson);

    /**
     * @brief Parse one entry of the positions "net" array
     */
    static RawPosition parsePositionJson(const nlohmann::json& positionJson);

    /**
     * @brief Form body for POST /orders/{variety}
     */
    static std::string buildOrderRequestBody(const OrderRequest& request);

    /**
     * @brief Classify the message of a failed cancellation
     * @return ALREADY_TERMINAL or NOT_FOUND when the message says so, empty otherwise
     */
    static std::optional<CancelResult> classifyCancelFailure(const std::string& message);

private:
    /**
     * @brief Perform an authenticated request and unwrap the "data" member
     * @param method HTTP method
     * @param endpoint Path below the base URL
     * @param body Form body
     * @param orderPlacement Map broker validation errors to RejectedOrderError
     * @return The "data" member of a successful response
     */
    nlohmann::json makeApiRequest(
        HttpMethod method,
        const std::string& endpoint,
        const std::string& body = "",
        bool orderPlacement = false
    );

    std::shared_ptr<AuthManager> m_authManager;  ///< Session holder
    std::shared_ptr<HttpClient> m_httpClient;    ///< HTTP client
    std::shared_ptr<Logger> m_logger;            ///< Logger instance
    std::string m_baseUrl;                       ///< REST base URL
};

}  // namespace OptionsScalper
