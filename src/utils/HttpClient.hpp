/**
 * @file HttpClient.hpp
 * @brief HTTP client for making requests to the Zerodha Kite Connect API
 */

#pragma once

#include <string>
#include <map>
#include <unordered_map>
#include <memory>
#include <atomic>
#include <curl/curl.h>
#include "../utils/Logger.hpp"

namespace OptionsScalper {

/**
 * @enum HttpMethod
 * @brief HTTP request methods
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE
};

/**
 * @struct HttpResponse
 * @brief HTTP response data
 *
 * A statusCode of 0 means the request never produced an HTTP response;
 * transportError then carries the libcurl message.
 */
struct HttpResponse {
    int statusCode = 0;                          ///< HTTP status code
    std::string body;                            ///< Response body
    std::unordered_map<std::string, std::string> headers;  ///< Response headers, names lower-cased
    std::string transportError;                  ///< libcurl error text, empty on success
};

/**
 * @class HttpClient
 * @brief Thread-safe HTTP client for making API requests
 *
 * Each request uses its own easy handle, so concurrent calls from the
 * session loop and the order path do not contend. Response header names are
 * stored lower-cased. request() is virtual so that broker clients can be
 * exercised against a canned responder in tests.
 */
class HttpClient {
public:
    /**
     * @brief Constructor
     * @param logger Logger instance
     */
    explicit HttpClient(std::shared_ptr<Logger> logger);

    /**
     * @brief Destructor
     */
    virtual ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Perform a synchronous HTTP request
     * @param method HTTP method
     * @param url URL to request
     * @param headers HTTP headers
     * @param body Request body
     * @return HTTP response
     */
    virtual HttpResponse request(HttpMethod method, const std::string& url,
                                 const std::unordered_map<std::string, std::string>& headers = {},
                                 const std::string& body = "");

    /**
     * @brief Set connection timeout
     * @param timeoutMs Timeout in milliseconds
     */
    void setConnectionTimeout(long timeoutMs);

    /**
     * @brief Set request timeout
     * @param timeoutMs Timeout in milliseconds
     */
    void setRequestTimeout(long timeoutMs);

    /**
     * @brief Percent-encode a string for a URL or form body
     * @param value Raw value
     * @return Encoded value
     */
    static std::string urlEncode(const std::string& value);

    /**
     * @brief Build an application/x-www-form-urlencoded body
     * @param fields Ordered field map
     * @return Encoded body
     */
    static std::string formEncode(const std::map<std::string, std::string>& fields);

    /**
     * @brief Convert HTTP method to string
     * @param method HTTP method
     * @return String representation of the HTTP method
     */
    static std::string methodToString(HttpMethod method);

protected:
    std::shared_ptr<Logger> m_logger;  ///< Logger instance

private:
    /**
     * @brief Apply the method, body, timeouts and sinks to an easy handle
     */
    void configureTransfer(CURL* curl, HttpMethod method, const std::string& url,
                           const std::string& body, HttpResponse& response) const;

    static size_t collectBody(char* data, size_t size, size_t nmemb, void* userp);
    static size_t collectHeader(char* data, size_t size, size_t nmemb, void* userp);

    std::atomic<long> m_connectionTimeout{10000};  ///< Connection timeout in milliseconds
    std::atomic<long> m_requestTimeout{30000};     ///< Request timeout in milliseconds
};

}  // namespace OptionsScalper
