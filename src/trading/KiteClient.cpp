/**
 * @file KiteClient.cpp
 * @brief Implementation of the KiteClient class
 */

#include "../trading/KiteClient.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include "../utils/Clock.hpp"
#include "../utils/Errors.hpp"

using json = nlohmann::json;

namespace OptionsScalper {

namespace {

std::string stringField(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

double doubleField(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<double>();
    }
    return 0.0;
}

int intField(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<int>();
    }
    return 0;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}  // namespace

KiteClient::KiteClient(
    const TerminalSettings& settings,
    std::shared_ptr<AuthManager> authManager,
    std::shared_ptr<HttpClient> httpClient,
    std::shared_ptr<Logger> logger
) : m_authManager(authManager),
    m_httpClient(httpClient),
    m_logger(logger),
    m_baseUrl(settings.apiBaseUrl) {

    m_httpClient->setConnectionTimeout(settings.connectTimeoutMs);
    m_httpClient->setRequestTimeout(settings.requestTimeoutMs);
}

std::string KiteClient::placeOrder(const OrderRequest& request) {
    m_logger->debug("Placing order: {}, {}, {}, {}",
                    request.tradingSymbol,
                    toString(request.side),
                    toString(request.orderType),
                    request.quantity);

    json data = makeApiRequest(HttpMethod::POST, "/orders/" + toString(request.variety),
                               buildOrderRequestBody(request), true);

    std::string orderId = stringField(data, "order_id");
    if (orderId.empty()) {
        throw ApiError("Order response carried no order_id");
    }

    m_logger->info("Order placed successfully. Order ID: {}", orderId);
    return orderId;
}

CancelResult KiteClient::cancelOrder(Variety variety, const std::string& orderId) {
    m_logger->debug("Cancelling order: {}", orderId);

    try {
        makeApiRequest(HttpMethod::DELETE, "/orders/" + toString(variety) + "/" + orderId);
        m_logger->info("Order cancelled successfully. Order ID: {}", orderId);
        return CancelResult::CANCELLED;
    } catch (const TransientApiError&) {
        throw;
    } catch (const ApiError& e) {
        std::optional<CancelResult> result = classifyCancelFailure(e.what());
        if (!result) {
            throw;
        }
        m_logger->info("Cancel of {} answered {}: {}", orderId, toString(*result), e.what());
        return *result;
    }
}

std::vector<RawPosition> KiteClient::getPositions() {
    json data = makeApiRequest(HttpMethod::GET, "/portfolio/positions");

    std::vector<RawPosition> positions;
    if (data.contains("net") && data["net"].is_array()) {
        for (const auto& positionJson : data["net"]) {
            positions.push_back(parsePositionJson(positionJson));
        }
    }

    m_logger->debug("Fetched {} net positions", positions.size());
    return positions;
}

std::vector<RawOrder> KiteClient::getOrders() {
    json data = makeApiRequest(HttpMethod::GET, "/orders");

    std::vector<RawOrder> orders;
    if (data.is_array()) {
        for (const auto& orderJson : data) {
            orders.push_back(parseOrderJson(orderJson));
        }
    }

    m_logger->debug("Fetched {} orders", orders.size());
    return orders;
}

MarginSnapshot KiteClient::getMargins() {
    json data = makeApiRequest(HttpMethod::GET, "/user/margins");

    MarginSnapshot margins;
    if (data.contains("equity") && data["equity"].is_object()) {
        const auto& equity = data["equity"];
        margins.equityNet = doubleField(equity, "net");
        if (equity.contains("utilised") && equity["utilised"].is_object()) {
            margins.utilised = doubleField(equity["utilised"], "debits");
        }
        if (equity.contains("available") && equity["available"].is_object()) {
            margins.available = doubleField(equity["available"], "live_balance");
        }
    }
    if (data.contains("commodity") && data["commodity"].is_object()) {
        margins.commodityNet = doubleField(data["commodity"], "net");
    }
    return margins;
}

UserProfile KiteClient::getProfile() {
    json data = makeApiRequest(HttpMethod::GET, "/user/profile");

    UserProfile profile;
    profile.userId = stringField(data, "user_id");
    profile.userName = stringField(data, "user_name");
    profile.email = stringField(data, "email");
    profile.broker = stringField(data, "broker");
    return profile;
}

json KiteClient::makeApiRequest(
    HttpMethod method,
    const std::string& endpoint,
    const std::string& body,
    bool orderPlacement
) {
    if (!m_authManager->isAccessTokenValid()) {
        m_logger->error("Access token is not valid for API request");
        throw ApiError("Access token is not valid", 401);
    }

    std::unordered_map<std::string, std::string> headers = {
        {"X-Kite-Version", "3"},
        {"Authorization", m_authManager->authorizationHeader()},
        {"Content-Type", "application/x-www-form-urlencoded"}
    };

    HttpResponse response = m_httpClient->request(method, m_baseUrl + endpoint, headers, body);

    if (response.statusCode == 0) {
        throw TransientApiError("Network failure on " + endpoint + ": " + response.transportError);
    }

    json responseJson;
    try {
        responseJson = json::parse(response.body);
    } catch (const std::exception& e) {
        if (response.statusCode == 429 || response.statusCode >= 500) {
            throw TransientApiError(fmt::format("HTTP {} on {}", response.statusCode, endpoint),
                                    response.statusCode);
        }
        throw ApiError(fmt::format("Unparseable response on {}: {}", endpoint, e.what()),
                       response.statusCode);
    }

    std::string status = stringField(responseJson, "status");
    std::string message = stringField(responseJson, "message");
    std::string errorType = stringField(responseJson, "error_type");

    if (response.statusCode == 200 && status == "success") {
        return responseJson.contains("data") ? responseJson["data"] : json::object();
    }

    std::string text = fmt::format("{} {}: {}", response.statusCode, errorType, message);

    if (response.statusCode == 429 || response.statusCode >= 500 || errorType == "NetworkException") {
        m_logger->warn("Transient API failure on {}: {}", endpoint, text);
        throw TransientApiError(text, response.statusCode);
    }

    if (response.statusCode == 403 || errorType == "TokenException") {
        m_logger->error("Authentication error on {}: {}", endpoint, text);
        m_authManager->invalidateAccessToken();
        throw ApiError(text, response.statusCode);
    }

    if (orderPlacement &&
        (errorType == "InputException" || errorType == "OrderException" || errorType == "MarginException")) {
        m_logger->error("Order rejected: {}", text);
        throw RejectedOrderError(message.empty() ? text : message, response.statusCode);
    }

    throw ApiError(message.empty() ? text : message, response.statusCode);
}

RawOrder KiteClient::parseOrderJson(const json& orderJson) {
    RawOrder order;

    order.orderId = stringField(orderJson, "order_id");
    order.exchangeOrderId = stringField(orderJson, "exchange_order_id");
    order.tradingSymbol = stringField(orderJson, "tradingsymbol");
    order.exchange = stringField(orderJson, "exchange");
    if (orderJson.contains("instrument_token") && orderJson["instrument_token"].is_number()) {
        order.instrumentToken = orderJson["instrument_token"].get<uint32_t>();
    }

    order.transactionType = transactionTypeFromString(stringField(orderJson, "transaction_type"));
    order.orderType = orderTypeFromString(stringField(orderJson, "order_type"));
    order.product = productTypeFromString(stringField(orderJson, "product"));
    order.variety = varietyFromString(stringField(orderJson, "variety"));

    order.quantity = intField(orderJson, "quantity");
    order.filledQuantity = intField(orderJson, "filled_quantity");
    order.pendingQuantity = intField(orderJson, "pending_quantity");

    order.price = doubleField(orderJson, "price");
    order.triggerPrice = doubleField(orderJson, "trigger_price");
    order.averagePrice = doubleField(orderJson, "average_price");

    order.status = orderStatusFromString(stringField(orderJson, "status"));
    order.statusMessage = stringField(orderJson, "status_message");

    std::string orderTime = stringField(orderJson, "order_timestamp");
    if (!orderTime.empty()) {
        order.orderTime = parseDateTime(orderTime);
    }

    order.tag = stringField(orderJson, "tag");
    return order;
}

RawPosition KiteClient::parsePositionJson(const json& positionJson) {
    RawPosition position;
    position.tradingSymbol = stringField(positionJson, "tradingsymbol");
    position.exchange = stringField(positionJson, "exchange");
    if (positionJson.contains("instrument_token") && positionJson["instrument_token"].is_number()) {
        position.instrumentToken = positionJson["instrument_token"].get<uint32_t>();
    }
    position.product = productTypeFromString(stringField(positionJson, "product"));
    position.quantity = intField(positionJson, "quantity");
    position.averagePrice = doubleField(positionJson, "average_price");
    position.lastPrice = doubleField(positionJson, "last_price");
    position.pnl = doubleField(positionJson, "pnl");
    return position;
}

std::string KiteClient::buildOrderRequestBody(const OrderRequest& request) {
    std::map<std::string, std::string> fields = {
        {"tradingsymbol", request.tradingSymbol},
        {"exchange", request.exchange},
        {"transaction_type", toString(request.side)},
        {"order_type", toString(request.orderType)},
        {"quantity", std::to_string(request.quantity)},
        {"product", toString(request.product)},
        {"validity", "DAY"}
    };

    if (request.price && (request.orderType == OrderType::LIMIT || request.orderType == OrderType::STOP_LOSS)) {
        fields["price"] = fmt::format("{}", *request.price);
    }

    if (request.triggerPrice &&
        (request.orderType == OrderType::STOP_LOSS || request.orderType == OrderType::STOP_LOSS_MARKET)) {
        fields["trigger_price"] = fmt::format("{}", *request.triggerPrice);
    }

    if (!request.tag.empty()) {
        fields["tag"] = request.tag;
    }

    return HttpClient::formEncode(fields);
}

std::optional<CancelResult> KiteClient::classifyCancelFailure(const std::string& message) {
    std::string lower = toLower(message);

    if (lower.find("complete") != std::string::npos ||
        lower.find("cancelled") != std::string::npos ||
        lower.find("rejected") != std::string::npos ||
        lower.find("already") != std::string::npos) {
        return CancelResult::ALREADY_TERMINAL;
    }

    if (lower.find("not found") != std::string::npos ||
        lower.find("invalid order") != std::string::npos ||
        lower.find("does not exist") != std::string::npos) {
        return CancelResult::NOT_FOUND;
    }

    return std::nullopt;
}

}  // namespace OptionsScalper
