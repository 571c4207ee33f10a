/*

test_token_endpoint.cpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE token_endpoint_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <xoauthxx/detail/log.hpp>
#include <xoauthxx/http/transport.hpp>
#include <xoauthxx/oauth2/token_endpoint.hpp>


namespace
{

struct recorded_post
{
    std::string url;
    std::string body;
    xoauthxx::http::headers hdrs;
};

class stub_transport : public xoauthxx::http::transport
{
public:
    explicit stub_transport(xoauthxx::result<std::string> answer)
        : answer_(std::move(answer))
    {
    }

    xoauthxx::result<std::string> post(const std::string& url, const std::string& body,
        const xoauthxx::http::headers& hdrs) override
    {
        posts.push_back({url, body, hdrs});
        return answer_;
    }

    std::vector<recorded_post> posts;

private:
    xoauthxx::result<std::string> answer_;
};

/// Captures every log line while alive.
struct log_capture
{
    std::vector<std::string> lines;
    xoauthxx::log::scoped_sink sink{xoauthxx::log::level::trace,
        [this](const xoauthxx::log::entry& e) { lines.push_back(e.message); }};

    [[nodiscard]] bool contains(const std::string& text) const
    {
        for (const auto& line : lines)
        {
            if (line.find(text) != std::string::npos)
                return true;
        }
        return false;
    }
};

} // namespace


BOOST_AUTO_TEST_CASE(single_post_with_form_body)
{
    auto transport = std::make_shared<stub_transport>(xoauthxx::ok(std::string(
        "{\"access_token\":\"ya29.fresh\",\"token_type\":\"Bearer\",\"expires_in\":3599,\"scope\":\"https://mail.google.com/\"}")));
    xoauthxx::oauth2::token_endpoint_client client(transport);

    auto tok = client.refresh("https://oauth2.example.com/token", "client id", "secret", "refresh/1");
    BOOST_TEST(tok.has_value());
    BOOST_TEST(tok->access_token == "ya29.fresh");
    BOOST_TEST(tok->token_type == "Bearer");
    BOOST_TEST(tok->scope == "https://mail.google.com/");
    BOOST_TEST(tok->expires_at.has_value());

    BOOST_TEST(transport->posts.size() == 1u);
    const auto& post = transport->posts.front();
    BOOST_TEST(post.url == "https://oauth2.example.com/token");
    BOOST_TEST(post.body == "client_id=client%20id&client_secret=secret&refresh_token=refresh%2F1"
        "&grant_type=refresh_token");
    BOOST_TEST(post.hdrs.size() == 1u);
    BOOST_TEST(post.hdrs.front().first == "Content-Type");
    BOOST_TEST(post.hdrs.front().second == "application/x-www-form-urlencoded");
}

BOOST_AUTO_TEST_CASE(body_without_access_token)
{
    auto transport = std::make_shared<stub_transport>(xoauthxx::ok(std::string(
        "{\"error\":\"invalid_grant\",\"error_description\":\"Token has been expired or revoked.\"}")));
    xoauthxx::oauth2::token_endpoint_client client(transport);

    auto tok = client.refresh("https://oauth2.example.com/token", "id", "secret", "refresh");
    BOOST_TEST(!tok.has_value());
    BOOST_TEST((tok.error().code == xoauthxx::errc::token_missing));
    BOOST_TEST(xoauthxx::is_transport_error(tok.error().code));
    BOOST_TEST(tok.error().detail.find("url=https://oauth2.example.com/token") != std::string::npos);
    BOOST_TEST(tok.error().detail.find("error=invalid_grant") != std::string::npos);
    BOOST_TEST(tok.error().detail.find("Token has been expired or revoked.") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(non_string_access_token)
{
    auto transport = std::make_shared<stub_transport>(xoauthxx::ok(std::string("{\"access_token\":42}")));
    xoauthxx::oauth2::token_endpoint_client client(transport);

    auto tok = client.refresh("https://oauth2.example.com/token", "id", "secret", "refresh");
    BOOST_TEST(!tok.has_value());
    BOOST_TEST((tok.error().code == xoauthxx::errc::token_missing));
}

BOOST_AUTO_TEST_CASE(body_not_json)
{
    auto transport = std::make_shared<stub_transport>(xoauthxx::ok(std::string("<html>502 Bad Gateway</html>")));
    xoauthxx::oauth2::token_endpoint_client client(transport);

    auto tok = client.refresh("https://oauth2.example.com/token", "id", "secret", "refresh");
    BOOST_TEST(!tok.has_value());
    BOOST_TEST((tok.error().code == xoauthxx::errc::token_parse_failed));
}

BOOST_AUTO_TEST_CASE(transport_error_is_propagated)
{
    auto transport = std::make_shared<stub_transport>(
        xoauthxx::fail<std::string>(xoauthxx::errc::http_connect_failed, "Cannot connect to token endpoint."));
    xoauthxx::oauth2::token_endpoint_client client(transport);

    auto tok = client.refresh("https://oauth2.example.com/token", "id", "secret", "refresh");
    BOOST_TEST(!tok.has_value());
    BOOST_TEST((tok.error().code == xoauthxx::errc::http_connect_failed));
    BOOST_TEST(transport->posts.size() == 1u);
}

BOOST_AUTO_TEST_CASE(access_token_logged_long_lived_secrets_not)
{
    log_capture capture;
    auto transport = std::make_shared<stub_transport>(xoauthxx::ok(std::string("{\"access_token\":\"ya29.visible\"}")));
    xoauthxx::oauth2::token_endpoint_client client(transport);

    auto tok = client.refresh("https://oauth2.example.com/token", "id", "very-secret", "long-lived-refresh");
    BOOST_TEST(tok.has_value());
    BOOST_TEST(capture.contains("ya29.visible"));
    BOOST_TEST(!capture.contains("very-secret"));
    BOOST_TEST(!capture.contains("long-lived-refresh"));
}

BOOST_AUTO_TEST_CASE(expires_in_out_of_range_is_clamped)
{
    using xoauthxx::oauth2::MAX_EXPIRES_IN;
    using xoauthxx::oauth2::parse_token_response;

    for (const char* lifetime : {"18446744073709551615", "9223372036854775807", "1e300"})
    {
        const auto before = std::chrono::system_clock::now();
        auto tok = parse_token_response(std::string("{\"access_token\":\"tok\",\"expires_in\":") + lifetime + "}",
            "https://oauth2.example.com/token");
        BOOST_TEST(tok.has_value(), lifetime);
        if (tok && tok->expires_at)
            BOOST_TEST((*tok->expires_at <= before + std::chrono::seconds(MAX_EXPIRES_IN + 60)), lifetime);
    }
}

BOOST_AUTO_TEST_CASE(expires_in_forms)
{
    using xoauthxx::oauth2::expires_in_seconds;

    BOOST_TEST(expires_in_seconds(Json::Value(3599)).value_or(-1) == 3599);
    BOOST_TEST(expires_in_seconds(Json::Value("3599")).value_or(-1) == 3599);
    BOOST_TEST(expires_in_seconds(Json::Value(-5)).value_or(-1) == 0);
    BOOST_TEST(expires_in_seconds(Json::Value(Json::UInt64(18446744073709551615ULL))).value_or(-1)
        == xoauthxx::oauth2::MAX_EXPIRES_IN);
    BOOST_TEST(!expires_in_seconds(Json::Value("soon")).has_value());
    BOOST_TEST(!expires_in_seconds(Json::Value(12.5)).has_value());
    BOOST_TEST(!expires_in_seconds(Json::Value()).has_value());
}
