/**
 * @file HttpClient.cpp
 * @brief Implementation of the HttpClient class
 */

#include "../utils/HttpClient.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace OptionsScalper {

namespace {

// curl_global_init is not thread-safe and must run once per process
void ensureCurlInitialized() {
    static const CURLcode status = curl_global_init(CURL_GLOBAL_ALL);
    (void)status;
}

struct EasyHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;
using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;

std::string trimLineEnd(std::string value) {
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.pop_back();
    }
    return value;
}

}  // namespace

HttpClient::HttpClient(std::shared_ptr<Logger> logger) : m_logger(logger) {
    ensureCurlInitialized();
}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::request(HttpMethod method, const std::string& url,
                                 const std::unordered_map<std::string, std::string>& headers,
                                 const std::string& body) {
    HttpResponse response;

    EasyHandle curl(curl_easy_init());
    if (!curl) {
        response.transportError = "curl_easy_init failed";
        m_logger->error("{} {}: {}", methodToString(method), url, response.transportError);
        return response;
    }

    configureTransfer(curl.get(), method, url, body, response);

    HeaderList headerList;
    for (const auto& header : headers) {
        std::string line = header.first + ": " + header.second;
        curl_slist* appended = curl_slist_append(headerList.get(), line.c_str());
        if (!appended) {
            response.transportError = "failed to build request headers";
            m_logger->error("{} {}: {}", methodToString(method), url, response.transportError);
            return response;
        }
        headerList.release();
        headerList.reset(appended);
    }
    if (headerList) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        response.transportError = curl_easy_strerror(res);
        m_logger->warn("{} {} failed: {} ({})", methodToString(method), url, response.transportError,
                       static_cast<int>(res));
        return response;
    }

    long statusCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &statusCode);
    response.statusCode = static_cast<int>(statusCode);
    m_logger->debug("{} {} -> {} ({} bytes)", methodToString(method), url, response.statusCode,
                    response.body.size());
    return response;
}

void HttpClient::setConnectionTimeout(long timeoutMs) {
    m_connectionTimeout = timeoutMs;
}

void HttpClient::setRequestTimeout(long timeoutMs) {
    m_requestTimeout = timeoutMs;
}

std::string HttpClient::urlEncode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(static_cast<char>(c));
        } else {
            encoded.push_back('%');
            encoded.push_back(kHex[c >> 4]);
            encoded.push_back(kHex[c & 0x0F]);
        }
    }
    return encoded;
}

std::string HttpClient::formEncode(const std::map<std::string, std::string>& fields) {
    std::string body;
    for (const auto& field : fields) {
        if (!body.empty()) {
            body += '&';
        }
        body += urlEncode(field.first);
        body += '=';
        body += urlEncode(field.second);
    }
    return body;
}

std::string HttpClient::methodToString(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET:    return "GET";
        case HttpMethod::POST:   return "POST";
        case HttpMethod::PUT:    return "PUT";
        case HttpMethod::DELETE: return "DELETE";
    }
    return "UNKNOWN";
}

void HttpClient::configureTransfer(CURL* curl, HttpMethod method, const std::string& url,
                                   const std::string& body, HttpResponse& response) const {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, m_connectionTimeout.load());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, m_requestTimeout.load());
    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &HttpClient::collectBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &HttpClient::collectHeader);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    if (method == HttpMethod::GET) {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        return;
    }

    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, methodToString(method).c_str());
    if (method == HttpMethod::POST || method == HttpMethod::PUT || !body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }
}

size_t HttpClient::collectBody(char* data, size_t size, size_t nmemb, void* userp) {
    const size_t bytes = size * nmemb;
    static_cast<std::string*>(userp)->append(data, bytes);
    return bytes;
}

size_t HttpClient::collectHeader(char* data, size_t size, size_t nmemb, void* userp) {
    const size_t bytes = size * nmemb;
    std::string line(data, bytes);

    const size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return bytes;  // status line or blank separator
    }

    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const size_t valueStart = line.find_first_not_of(" \t", colon + 1);
    std::string value = valueStart == std::string::npos ? std::string() : trimLineEnd(line.substr(valueStart));

    auto& headers = *static_cast<std::unordered_map<std::string, std::string>*>(userp);
    headers[name] = value;
    return bytes;
}

}  // namespace OptionsScalper
