#pragma once

#include "core/services/IHttpClient.hpp"

#include <string>

namespace netsentry::infra {

/**
 * @brief HTTP/1.1 client built on Boost.Beast.
 *
 * Every request runs on its own io_context and connection and asks the
 * server to close it afterwards. The whole exchange, name resolution
 * included, is bounded by HttpRequest::timeout.
 */
class HttpClient : public core::IHttpClient {
public:
    HttpClient() = default;

    core::HttpResponse send(const core::HttpRequest& request) override;
};

/**
 * @brief Builds a Basic authentication header value.
 * @param username User name.
 * @param password Password.
 * @return "Basic " followed by the Base64 of "username:password".
 */
std::string basicAuthorization(const std::string& username, const std::string& password);

} // namespace netsentry::infra
