#include "infrastructure/network/HttpClient.hpp"

#include <spdlog/spdlog.h>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace netsentry::infra {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr std::uint64_t MAX_BODY_BYTES = 8 * 1024 * 1024;

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

http::request<http::string_body> toBeastRequest(const core::HttpRequest& request,
                                                http::verb verb) {
    http::request<http::string_body> req{verb, request.path.empty() ? "/" : request.path, 11};
    req.set(http::field::host, request.port == 80
                                   ? request.host
                                   : request.host + ":" + std::to_string(request.port));
    req.set(http::field::user_agent, "netsentry");
    req.set(http::field::accept, "application/json");
    for (const auto& [key, value] : request.headers) {
        req.set(key, value);
    }
    req.keep_alive(false);
    req.body() = request.body;
    req.prepare_payload();
    return req;
}

} // namespace

core::HttpResponse HttpClient::send(const core::HttpRequest& request) {
    core::HttpResponse response;

    auto verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        response.errorMessage = "Unsupported HTTP method: " + request.method;
        return response;
    }

    net::io_context io;
    tcp::resolver resolver(io);
    beast::tcp_stream stream(io);

    auto req = toBeastRequest(request, verb);
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_BODY_BYTES);
    beast::error_code failure;
    bool done = false;

    stream.expires_after(request.timeout);
    resolver.async_resolve(
        request.host, std::to_string(request.port),
        [&](const beast::error_code& ec, tcp::resolver::results_type endpoints) {
            if (ec) {
                failure = ec;
                return;
            }
            stream.async_connect(endpoints, [&](const beast::error_code& ec2,
                                                const tcp::endpoint&) {
                if (ec2) {
                    failure = ec2;
                    return;
                }
                http::async_write(stream, req, [&](const beast::error_code& ec3, std::size_t) {
                    if (ec3) {
                        failure = ec3;
                        return;
                    }
                    http::async_read(stream, buffer, parser,
                                     [&](const beast::error_code& ec4, std::size_t) {
                                         if (ec4) {
                                             failure = ec4;
                                             return;
                                         }
                                         done = true;
                                     });
                });
            });
        });

    io.run_for(request.timeout);

    if (!done) {
        beast::error_code ignored;
        stream.socket().close(ignored);
        response.errorMessage = failure ? failure.message() : "Request timed out";
        spdlog::debug("HTTP {} {}:{}{} failed: {}", request.method, request.host, request.port,
                      request.path, response.errorMessage);
        return response;
    }

    auto message = parser.release();
    response.statusCode = message.result_int();
    for (const auto& field : message) {
        auto name = field.name_string();
        auto value = field.value();
        response.headers[toLower(std::string(name.data(), name.size()))] =
            std::string(value.data(), value.size());
    }
    response.body = std::move(message.body());
    response.success = true;
    return response;
}

std::string basicAuthorization(const std::string& username, const std::string& password) {
    using namespace boost::archive::iterators;
    using Base64 = base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;

    const std::string credentials = username + ":" + password;
    std::string encoded(Base64(credentials.begin()), Base64(credentials.end()));
    encoded.append((3 - credentials.size() % 3) % 3, '=');
    return "Basic " + encoded;
}

} // namespace netsentry::infra
