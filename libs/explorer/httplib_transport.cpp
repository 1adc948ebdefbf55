/**
 * @file httplib_transport.cpp
 * @brief cpp-httplib implementation of HttpTransport
 */

#include "evmverify/http_transport.hpp"

#include "evmverify/outcome.hpp"

#include <format>
#include <utility>

#include <httplib.h>

namespace evmverify::explorer {

namespace {

/**
 * @brief Classify a request that produced no response
 *
 * A certificate the client rejects will be rejected again; everything else
 * (refused, reset, timed out) may succeed on retry.
 */
[[nodiscard]] Error request_failed(const std::string& url, const httplib::Error error)
{
    const bool permanent = error == httplib::Error::SSLConnection
                           || error == httplib::Error::SSLLoadingCerts
                           || error == httplib::Error::SSLServerVerification;
    const auto code = permanent ? error_code::kNetworkPermanent : error_code::kNetworkTransient;
    return Error::make(std::string(code),
                       std::format("Request to {} failed: {}", url, httplib::to_string(error)));
}

[[nodiscard]] Error invalid_url(std::string message)
{
    return Error::make(std::string(error_code::kNetworkPermanent), std::move(message));
}

void configure(httplib::Client& client, std::chrono::seconds timeout)
{
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
    client.set_follow_location(true);
    client.set_default_headers({
        {"Accept", "application/json"}
    });
}

}  // namespace

Result<UrlParts> split_url(const std::string& url)
{
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::unexpected(
            invalid_url(std::format("URL '{}' has no scheme", url)));
    }
    const auto host_begin = scheme_end + 3;
    const auto path_begin = url.find('/', host_begin);
    if (host_begin >= url.size() || path_begin == host_begin) {
        return std::unexpected(invalid_url(std::format("URL '{}' has no host", url)));
    }
    if (path_begin == std::string::npos) {
        return UrlParts{.origin = url, .path = "/"};
    }
    return UrlParts{.origin = url.substr(0, path_begin), .path = url.substr(path_begin)};
}

HttplibTransport::HttplibTransport(std::chrono::seconds timeout)
    : m_timeout(timeout)
{}

Result<HttpResponse> HttplibTransport::get(const std::string& url)
{
    auto parts = split_url(url);
    if (!parts) {
        return std::unexpected(parts.error());
    }
    httplib::Client client(parts->origin);
    configure(client, m_timeout);
    auto res = client.Get(parts->path);
    if (!res) {
        return std::unexpected(request_failed(url, res.error()));
    }
    return HttpResponse{.status = res->status, .body = std::move(res->body)};
}

Result<HttpResponse> HttplibTransport::post_json(const std::string& url, const std::string& body)
{
    auto parts = split_url(url);
    if (!parts) {
        return std::unexpected(parts.error());
    }
    httplib::Client client(parts->origin);
    configure(client, m_timeout);
    auto res = client.Post(parts->path, body, "application/json");
    if (!res) {
        return std::unexpected(request_failed(url, res.error()));
    }
    return HttpResponse{.status = res->status, .body = std::move(res->body)};
}

}  // namespace evmverify::explorer
