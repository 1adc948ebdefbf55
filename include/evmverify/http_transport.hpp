#pragma once

/**
 * @file http_transport.hpp
 * @brief HttpTransport backed by cpp-httplib (HTTPS via OpenSSL)
 */

#include "evmverify/explorer.hpp"

#include <chrono>
#include <string>

namespace evmverify::explorer {

/**
 * @brief Split "https://host[:port]/path?query" into origin and path
 */
struct UrlParts
{
    std::string origin;  ///< scheme://host[:port]
    std::string path;    ///< Always starts with '/'
};

[[nodiscard]] Result<UrlParts> split_url(const std::string& url);

/**
 * @brief One client per request; safe to share between workers
 */
class HttplibTransport final : public HttpTransport
{
public:
    explicit HttplibTransport(std::chrono::seconds timeout);

    [[nodiscard]] Result<HttpResponse> get(const std::string& url) override;
    [[nodiscard]] Result<HttpResponse> post_json(const std::string& url,
                                                 const std::string& body) override;

private:
    std::chrono::seconds m_timeout;
};

}  // namespace evmverify::explorer
