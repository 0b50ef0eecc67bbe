#include <echat/sync/HttpTransport.hpp>

#include <cstdio>
#include <stdexcept>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace echat::sync
{
    namespace net = boost::asio;
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace ssl = boost::asio::ssl;
    using tcp = net::ip::tcp;

    namespace
    {
        // /sync responses of large accounts easily exceed Beast's 8 MB default
        constexpr std::uint64_t kMaxBody = 64ull * 1024 * 1024;

        /// Drive the pending operation to completion or fail with timed_out.
        void run_step(net::io_context &ioc,
                      const beast::error_code &ec,
                      std::chrono::milliseconds timeout,
                      const char *stage)
        {
            ioc.restart();
            ioc.run_for(timeout);

            if (!ioc.stopped())
            {
                ioc.stop();
                throw boost::system::system_error(net::error::timed_out, stage);
            }

            if (ec)
                throw boost::system::system_error(ec, stage);
        }

        template <class Stream>
        HttpResponse exchange(net::io_context &ioc,
                              Stream &stream,
                              const http::request<http::string_body> &req,
                              std::chrono::milliseconds timeout)
        {
            beast::error_code ec;

            beast::get_lowest_layer(stream).expires_after(timeout);
            http::async_write(stream, req,
                              [&ec](const beast::error_code &e, std::size_t)
                              { ec = e; });
            run_step(ioc, ec, timeout, "write");

            beast::flat_buffer buffer;
            http::response_parser<http::string_body> parser;
            parser.body_limit(kMaxBody);

            beast::get_lowest_layer(stream).expires_after(timeout);
            http::async_read(stream, buffer, parser,
                             [&ec](const beast::error_code &e, std::size_t)
                             { ec = e; });
            run_step(ioc, ec, timeout, "read");

            auto res = parser.release();

            HttpResponse out;
            out.status = res.result_int();
            out.body = std::move(res.body());
            return out;
        }

        tcp::resolver::results_type resolve(net::io_context &ioc,
                                            const std::string &host,
                                            const std::string &port,
                                            std::chrono::milliseconds timeout)
        {
            beast::error_code ec;
            tcp::resolver::results_type results;
            tcp::resolver resolver(ioc);

            resolver.async_resolve(host, port,
                                   [&](const beast::error_code &e, tcp::resolver::results_type r)
                                   {
                                       ec = e;
                                       results = std::move(r);
                                   });
            run_step(ioc, ec, timeout, "resolve");
            return results;
        }

        http::request<http::string_body> build_request(const HttpRequest &request, const std::string &host)
        {
            http::request<http::string_body> req{request.method, request.target, 11};
            req.set(http::field::host, host);
            req.set(http::field::user_agent, "echat-sync");
            req.set(http::field::accept, "application/json");
            req.keep_alive(false);

            if (!request.accessToken.empty())
                req.set(http::field::authorization, "Bearer " + request.accessToken);

            if (request.method != http::verb::get)
            {
                req.set(http::field::content_type, "application/json");
                req.body() = request.body.empty() ? std::string("{}") : request.body;
                req.prepare_payload();
            }

            return req;
        }
    } // namespace

    BeastHttpTransport::BeastHttpTransport(const std::string &baseUrl)
    {
        std::string rest;
        if (baseUrl.rfind("https://", 0) == 0)
        {
            tls_ = true;
            port_ = "443";
            rest = baseUrl.substr(8);
        }
        else if (baseUrl.rfind("http://", 0) == 0)
        {
            tls_ = false;
            port_ = "80";
            rest = baseUrl.substr(7);
        }
        else
        {
            throw std::invalid_argument("[BeastHttpTransport] unsupported base url: " + baseUrl);
        }

        const auto slash = rest.find('/');
        if (slash != std::string::npos)
            rest.resize(slash);

        const auto colon = rest.rfind(':');
        if (colon != std::string::npos && rest.find(']') == std::string::npos)
        {
            port_ = rest.substr(colon + 1);
            rest.resize(colon);
        }

        if (rest.empty() || port_.empty())
            throw std::invalid_argument("[BeastHttpTransport] missing host in base url: " + baseUrl);

        host_ = rest;

        if (tls_)
        {
            ssl_ = std::make_unique<ssl::context>(ssl::context::tls_client);
            ssl_->set_default_verify_paths();
            ssl_->set_verify_mode(ssl::verify_peer);
        }
    }

    HttpResponse BeastHttpTransport::perform(const HttpRequest &request)
    {
        net::io_context ioc;
        const auto timeout = request.timeout;
        const auto req = build_request(request, host_);
        const auto endpoints = resolve(ioc, host_, port_, timeout);

        beast::error_code ec;

        if (!tls_)
        {
            beast::tcp_stream stream(ioc);
            stream.expires_after(timeout);
            stream.async_connect(endpoints,
                                 [&ec](const beast::error_code &e, const tcp::endpoint &)
                                 { ec = e; });
            run_step(ioc, ec, timeout, "connect");

            auto res = exchange(ioc, stream, req, timeout);

            beast::error_code ignored;
            stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
            return res;
        }

        beast::ssl_stream<beast::tcp_stream> stream(ioc, *ssl_);

        // SNI, required by most virtual-hosted homeservers
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str()))
        {
            beast::error_code sni{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            throw boost::system::system_error(sni, "sni");
        }
        stream.set_verify_callback(ssl::host_name_verification(host_));

        beast::get_lowest_layer(stream).expires_after(timeout);
        beast::get_lowest_layer(stream).async_connect(endpoints,
                                                      [&ec](const beast::error_code &e, const tcp::endpoint &)
                                                      { ec = e; });
        run_step(ioc, ec, timeout, "connect");

        beast::get_lowest_layer(stream).expires_after(timeout);
        stream.async_handshake(ssl::stream_base::client,
                               [&ec](const beast::error_code &e)
                               { ec = e; });
        run_step(ioc, ec, timeout, "handshake");

        auto res = exchange(ioc, stream, req, timeout);

        // Connection: close was requested; skip the TLS close_notify round trip
        beast::error_code ignored;
        beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ignored);
        return res;
    }

    std::string url_encode(const std::string &s)
    {
        std::string out;
        out.reserve(s.size() * 3);

        for (unsigned char c : s)
        {
            const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                    (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
            if (unreserved)
            {
                out.push_back(static_cast<char>(c));
                continue;
            }

            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }

        return out;
    }

} // namespace echat::sync
