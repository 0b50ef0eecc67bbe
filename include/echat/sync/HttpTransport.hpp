#ifndef ECHAT_SYNC_HTTP_TRANSPORT_HPP
#define ECHAT_SYNC_HTTP_TRANSPORT_HPP

/**
 * @file HttpTransport.hpp
 * @brief Blocking HTTP/1.1 request/response used by the Matrix adapter.
 *
 * @details
 * `IHttpTransport` is the seam the Matrix adapter talks through, so tests
 * can script homeserver responses. `BeastHttpTransport` is the production
 * implementation on Boost.Beast, with OpenSSL for `https://` base URLs.
 *
 * Every request is bounded by its own timeout. Network level failures
 * (resolve, connect, TLS handshake, timeout, truncated read) are reported as
 * `boost::system::system_error`; any HTTP status, including 4xx and 5xx, is
 * a normal response.
 */

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/verb.hpp>

namespace echat::sync
{
    struct HttpRequest
    {
        boost::beast::http::verb method = boost::beast::http::verb::get;
        std::string target;      ///< path + query, already percent-encoded
        std::string body;        ///< JSON body, empty for GET
        std::string accessToken; ///< sent as "Authorization: Bearer" when not empty
        std::chrono::milliseconds timeout{30000};
    };

    struct HttpResponse
    {
        unsigned status = 0;
        std::string body;
    };

    class IHttpTransport
    {
    public:
        virtual ~IHttpTransport() = default;

        virtual HttpResponse perform(const HttpRequest &request) = 0;
    };

    class BeastHttpTransport : public IHttpTransport
    {
    public:
        /// @p baseUrl is "https://host[:port]" or "http://host[:port]".
        explicit BeastHttpTransport(const std::string &baseUrl);

        HttpResponse perform(const HttpRequest &request) override;

        const std::string &host() const noexcept { return host_; }
        const std::string &port() const noexcept { return port_; }
        bool tls() const noexcept { return tls_; }

    private:
        bool tls_ = true;
        std::string host_;
        std::string port_;
        std::unique_ptr<boost::asio::ssl::context> ssl_;
    };

    /// Percent-encode one path segment or query value.
    [[nodiscard]] std::string url_encode(const std::string &s);

} // namespace echat::sync

#endif // ECHAT_SYNC_HTTP_TRANSPORT_HPP
