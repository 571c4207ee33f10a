/*

asio_transport.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Built-in blocking HTTP/1.1 client: Boost.Beast messages over a Boost.Asio socket, with OpenSSL for https.

*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include <openssl/ssl.h>
#include <boost/asio/ssl/host_name_verification.hpp>

#include <xoauthxx/detail/asio_decl.hpp>
#include <xoauthxx/detail/error_detail.hpp>
#include <xoauthxx/detail/log.hpp>
#include <xoauthxx/detail/result.hpp>
#include <xoauthxx/http/transport.hpp>
#include <xoauthxx/http/url.hpp>
#include <xoauthxx/net/tls_options.hpp>

namespace xoauthxx::http
{

/// Upper bound on a response body read into memory (1 MB).
inline constexpr std::size_t DEFAULT_MAX_RESPONSE_SIZE = 1024 * 1024;

struct asio_options
{
    net::tls_options tls;
    std::size_t max_response_size = DEFAULT_MAX_RESPONSE_SIZE;
};

class asio_transport : public transport
{
public:
    using tcp = xoauthxx::asio::tcp;
    using ssl_stream = xoauthxx::asio::ssl::stream<tcp::socket>;
    using request_type = beast::http::request<beast::http::string_body>;
    using response_type = beast::http::response<beast::http::string_body>;

    explicit asio_transport(asio_options options = {})
        : options_(std::move(options))
    {
    }

    /// POST with the caller's headers, `Accept: application/json` and `Connection: close`.
    [[nodiscard]] static request_type build_request(const url& target, const std::string& body, const headers& hdrs)
    {
        namespace bhttp = beast::http;

        request_type req(bhttp::verb::post, target.target, 11);
        req.set(bhttp::field::host, target.host_header());
        for (const auto& [name, value] : hdrs)
            req.set(name, value);
        req.set(bhttp::field::accept, "application/json");
        req.set(bhttp::field::connection, "close");
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    /**
    Send one POST and return the response body whatever the status.

    @return Body, or `url_invalid`, `invalid_argument`, `http_resolve_failed`, `http_connect_failed`,
            `http_tls_failed`, `http_io_failed` or `http_bad_response`.
    **/
    [[nodiscard]] result<std::string> post(const std::string& url_text, const std::string& body,
        const headers& hdrs) override
    {
        auto valid = validate_headers(hdrs);
        if (!valid)
            return fail<std::string>(std::move(valid).error());

        auto parsed = parse_url(url_text);
        if (!parsed)
            return fail<std::string>(std::move(parsed).error());
        const url target = std::move(*parsed);
        const request_type req = build_request(target, body, hdrs);

        xoauthxx::asio::io_context ctx;
        tcp::resolver resolver(ctx);
        xoauthxx::asio::error_code ec;
        const auto endpoints = resolver.resolve(target.host, target.port, ec);
        if (ec)
        {
            return fail<std::string>(errc::http_resolve_failed, "Cannot resolve token endpoint host.",
                detail::error_detail().add("url", url_text).str(), ec);
        }

        result<response_type> resp;
        if (target.is_tls())
            resp = exchange_tls(ctx, endpoints, target, req, url_text);
        else
            resp = exchange_plain(ctx, endpoints, req, url_text);
        if (!resp)
            return fail<std::string>(std::move(resp).error());

        XOAUTHXX_DEBUG("HTTP " + std::to_string(resp->result_int()) + " from " + url_text);
        return ok(std::move(resp->body()));
    }

private:
    result<response_type> exchange_plain(xoauthxx::asio::io_context& ctx,
        const tcp::resolver::results_type& endpoints, const request_type& req, const std::string& url_text)
    {
        tcp::socket socket(ctx);
        xoauthxx::asio::error_code ec;
        xoauthxx::asio::connect(socket, endpoints, ec);
        if (ec)
        {
            return fail<response_type>(errc::http_connect_failed, "Cannot connect to token endpoint.",
                detail::error_detail().add("url", url_text).str(), ec);
        }

        auto resp = exchange(socket, req, url_text);
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return resp;
    }

    result<response_type> exchange_tls(xoauthxx::asio::io_context& ctx, const tcp::resolver::results_type& endpoints,
        const url& target, const request_type& req, const std::string& url_text)
    {
        namespace ssl = xoauthxx::asio::ssl;

        ssl::context ssl_ctx(ssl::context::tls_client);
        auto configured = net::configure_context(ssl_ctx, options_.tls);
        if (!configured)
            return fail<response_type>(std::move(configured).error());

        ssl_stream stream(ctx, ssl_ctx);
        if (SSL_set_tlsext_host_name(stream.native_handle(), target.host.c_str()) != 1)
        {
            return fail<response_type>(errc::http_tls_failed, "Cannot set TLS server name.",
                detail::error_detail().add("url", url_text).str());
        }

        if (options_.tls.verify == net::verify_mode::peer)
        {
            stream.set_verify_mode(ssl::verify_peer);
            if (options_.tls.verify_host)
                stream.set_verify_callback(ssl::host_name_verification(target.host));
        }
        else
            stream.set_verify_mode(ssl::verify_none);

        xoauthxx::asio::error_code ec;
        xoauthxx::asio::connect(stream.lowest_layer(), endpoints, ec);
        if (ec)
        {
            return fail<response_type>(errc::http_connect_failed, "Cannot connect to token endpoint.",
                detail::error_detail().add("url", url_text).str(), ec);
        }

        stream.handshake(ssl::stream_base::client, ec);
        if (ec)
        {
            return fail<response_type>(errc::http_tls_failed, "TLS handshake failed.",
                detail::error_detail().add("url", url_text).str(), ec);
        }

        auto resp = exchange(stream, req, url_text);
        stream.shutdown(ec);
        return resp;
    }

    /**
    Write the request and read one response; Beast handles Content-Length, chunked and close-delimited bodies.

    A peer that closes a TLS connection without close_notify ends a close-delimited body.
    **/
    template<typename Stream>
    result<response_type> exchange(Stream& stream, const request_type& req, const std::string& url_text)
    {
        namespace bhttp = beast::http;

        xoauthxx::asio::error_code ec;
        bhttp::write(stream, req, ec);
        if (ec)
        {
            return fail<response_type>(errc::http_io_failed, "Cannot send HTTP request.",
                detail::error_detail().add("url", url_text).str(), ec);
        }

        beast::flat_buffer buffer;
        bhttp::response_parser<bhttp::string_body> parser;
        parser.body_limit(static_cast<std::uint64_t>(options_.max_response_size));
        bhttp::read(stream, buffer, parser, ec);
        if (ec == xoauthxx::asio::ssl::error::stream_truncated && !parser.is_done())
        {
            ec = {};
            parser.put_eof(ec);
        }
        else if (ec == xoauthxx::asio::ssl::error::stream_truncated)
            ec = {};

        if (ec == bhttp::error::body_limit || ec == bhttp::error::header_limit)
        {
            return fail<response_type>(errc::http_bad_response, "HTTP response too large.",
                detail::error_detail().add("url", url_text).str(), ec);
        }
        if (ec && ec.category() == bhttp::make_error_code(bhttp::error::bad_version).category()
            && ec != bhttp::error::end_of_stream && ec != bhttp::error::partial_message)
        {
            return fail<response_type>(errc::http_bad_response, "Malformed HTTP response.",
                detail::error_detail().add("url", url_text).add_ec("reason", ec).str(), ec);
        }
        if (ec)
        {
            return fail<response_type>(errc::http_io_failed, "Cannot read HTTP response.",
                detail::error_detail().add("url", url_text).str(), ec);
        }
        return ok(parser.release());
    }

    asio_options options_;
};

} // namespace xoauthxx::http
