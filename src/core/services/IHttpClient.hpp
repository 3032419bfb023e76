/**
 * @file IHttpClient.hpp
 * @brief Interface and message types for outbound HTTP requests.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace netsentry::core {

/**
 * @brief An outbound HTTP request.
 */
struct HttpRequest {
    std::string method{"GET"};                 ///< Request method
    std::string host;                          ///< Target host
    uint16_t port{80};                         ///< Target port
    std::string path{"/"};                     ///< Request target
    std::map<std::string, std::string> headers; ///< Extra request headers
    std::string body;                          ///< Request body
    std::chrono::milliseconds timeout{10000};  ///< Whole-exchange timeout
};

/**
 * @brief Response to an HttpRequest.
 *
 * @c success is true whenever a complete HTTP response arrived, whatever its
 * status code; it is false for connection errors and timeouts.
 */
struct HttpResponse {
    bool success{false};                       ///< A response was received
    int statusCode{0};                         ///< HTTP status code
    std::map<std::string, std::string> headers; ///< Response headers (lower-case keys)
    std::string body;                          ///< Response body
    std::string errorMessage;                  ///< Transport error, if any
};

/**
 * @brief Interface for sending HTTP requests.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Sends a request and waits for the response.
     * @param request The request to send.
     * @return The response; transport failures are reported, not thrown.
     */
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

} // namespace netsentry::core
