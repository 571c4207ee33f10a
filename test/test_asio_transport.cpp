/*

test_asio_transport.cpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE asio_transport_test

#include <boost/test/unit_test.hpp>

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

#include <cstddef>
#include <sstream>
#include <string>
#include <thread>

#include <xoauthxx/http/asio_transport.hpp>


namespace
{

using boost::asio::ip::tcp;

/// Accepts one connection on a loopback port, records the request and answers with a canned response.
class one_shot_server
{
public:
    explicit one_shot_server(std::string response)
        : acceptor_(ctx_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)),
          response_(std::move(response))
    {
        thread_ = std::thread([this] { serve(); });
    }

    ~one_shot_server()
    {
        if (thread_.joinable())
            thread_.join();
    }

    [[nodiscard]] std::string url(const std::string& path) const
    {
        return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + path;
    }

    [[nodiscard]] const std::string& request()
    {
        if (thread_.joinable())
            thread_.join();
        return request_;
    }

private:
    void serve()
    {
        boost::system::error_code ec;
        tcp::socket socket(ctx_);
        acceptor_.accept(socket, ec);
        if (ec)
            return;

        boost::asio::streambuf buffer;
        const std::size_t header_size = boost::asio::read_until(socket, buffer, "\r\n\r\n", ec);
        if (ec)
            return;

        std::string data(boost::asio::buffers_begin(buffer.data()), boost::asio::buffers_end(buffer.data()));
        const std::string head = data.substr(0, header_size);
        std::size_t content_length = 0;
        const auto pos = head.find("Content-Length: ");
        if (pos != std::string::npos)
            content_length = std::stoul(head.substr(pos + 16));
        if (data.size() < header_size + content_length)
        {
            buffer.consume(buffer.size());
            std::string rest(header_size + content_length - data.size(), '\0');
            boost::asio::read(socket, boost::asio::buffer(rest), ec);
            data += rest;
        }
        request_ = data;

        boost::asio::write(socket, boost::asio::buffer(response_), ec);
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

    boost::asio::io_context ctx_;
    tcp::acceptor acceptor_;
    std::string response_;
    std::string request_;
    std::thread thread_;
};

} // namespace


BOOST_AUTO_TEST_CASE(post_with_content_length)
{
    one_shot_server server("HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 27\r\n\r\n"
        "{\"access_token\":\"ya29.abc\"}");

    xoauthxx::http::asio_transport transport;
    auto body = transport.post(server.url("/token"), "grant_type=refresh_token",
        {{"Content-Type", "application/x-www-form-urlencoded"}});
    BOOST_TEST(body.has_value());
    if (body)
        BOOST_TEST(*body == "{\"access_token\":\"ya29.abc\"}");

    const std::string& request = server.request();
    BOOST_TEST(request.starts_with("POST /token HTTP/1.1\r\n"));
    BOOST_TEST(request.find("Content-Type: application/x-www-form-urlencoded\r\n") != std::string::npos);
    BOOST_TEST(request.find("Content-Length: 24\r\n") != std::string::npos);
    BOOST_TEST(request.ends_with("\r\n\r\ngrant_type=refresh_token"));
}

BOOST_AUTO_TEST_CASE(post_with_chunked_body_until_close)
{
    one_shot_server server("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "10\r\n{\"access_token\":\r\n7\r\n\"chunk\"\r\n1\r\n}\r\n0\r\n\r\n");

    xoauthxx::http::asio_transport transport;
    auto body = transport.post(server.url("/"), "x=1", {});
    BOOST_TEST(body.has_value());
    if (body)
        BOOST_TEST(*body == "{\"access_token\":\"chunk\"}");
}

BOOST_AUTO_TEST_CASE(error_status_returns_body)
{
    one_shot_server server("HTTP/1.1 400 Bad Request\r\nContent-Length: 25\r\n\r\n{\"error\":\"invalid_grant\"}");

    xoauthxx::http::asio_transport transport;
    auto body = transport.post(server.url("/token"), "", {});
    BOOST_TEST(body.has_value());
    if (body)
        BOOST_TEST(*body == "{\"error\":\"invalid_grant\"}");
}

BOOST_AUTO_TEST_CASE(connection_refused)
{
    std::string url;
    {
        boost::asio::io_context ctx;
        tcp::acceptor acceptor(ctx, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        url = "http://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port()) + "/token";
    }

    xoauthxx::http::asio_transport transport;
    auto body = transport.post(url, "", {});
    BOOST_TEST(!body.has_value());
    if (!body)
    {
        BOOST_TEST((body.error().code == xoauthxx::errc::http_connect_failed));
        BOOST_TEST(xoauthxx::is_transport_error(body.error().code));
        BOOST_TEST(body.error().detail.find(url) != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(invalid_url_and_header)
{
    xoauthxx::http::asio_transport transport;
    auto bad_url = transport.post("ftp://example.com/token", "", {});
    BOOST_TEST(!bad_url.has_value());
    BOOST_TEST((bad_url.error().code == xoauthxx::errc::url_invalid));

    auto bad_header = transport.post("http://127.0.0.1:1/token", "", {{"X-Injected", "a\r\nHost: evil"}});
    BOOST_TEST(!bad_header.has_value());
    BOOST_TEST((bad_header.error().code == xoauthxx::errc::invalid_argument));
}

BOOST_AUTO_TEST_CASE(request_layout)
{
    auto target = xoauthxx::http::parse_url("https://oauth2.example.com:8443/token?tenant=x");
    BOOST_TEST(target.has_value());
    if (!target)
        return;

    const auto req = xoauthxx::http::asio_transport::build_request(*target, "grant_type=refresh_token",
        {{"Content-Type", "application/x-www-form-urlencoded"}});
    std::ostringstream out;
    out << req;
    const std::string text = out.str();
    BOOST_TEST(text.starts_with("POST /token?tenant=x HTTP/1.1\r\n"));
    BOOST_TEST(text.find("Host: oauth2.example.com:8443\r\n") != std::string::npos);
    BOOST_TEST(text.find("Accept: application/json\r\n") != std::string::npos);
    BOOST_TEST(text.find("Connection: close\r\n") != std::string::npos);
    BOOST_TEST(text.find("Content-Length: 24\r\n") != std::string::npos);
    BOOST_TEST(text.ends_with("\r\n\r\ngrant_type=refresh_token"));
}

BOOST_AUTO_TEST_CASE(body_until_close)
{
    one_shot_server server("HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n\r\n{\"access_token\":\"eof\"}");

    xoauthxx::http::asio_transport transport;
    auto body = transport.post(server.url("/token"), "x=1", {});
    BOOST_TEST(body.has_value());
    if (body)
        BOOST_TEST(*body == "{\"access_token\":\"eof\"}");
}

BOOST_AUTO_TEST_CASE(non_http_reply_is_bad_response)
{
    one_shot_server server("SMTP 220 hello\r\n\r\n");

    xoauthxx::http::asio_transport transport;
    auto body = transport.post(server.url("/token"), "x=1", {});
    BOOST_TEST(!body.has_value());
    if (!body)
    {
        BOOST_TEST((body.error().code == xoauthxx::errc::http_bad_response));
        BOOST_TEST(body.error().detail.find("url=") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(oversized_body_is_rejected)
{
    one_shot_server server("HTTP/1.1 200 OK\r\nContent-Length: 64\r\n\r\n" + std::string(64, 'a'));

    xoauthxx::http::asio_options options;
    options.max_response_size = 16;
    xoauthxx::http::asio_transport transport(options);
    auto body = transport.post(server.url("/token"), "x=1", {});
    BOOST_TEST(!body.has_value());
    if (!body)
        BOOST_TEST((body.error().code == xoauthxx::errc::http_bad_response));
}
