/*

token_endpoint.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

OAuth2 refresh_token grant against a token endpoint.

*/

#pragma once

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <json/json.h>

#include <xoauthxx/codec/percent.hpp>
#include <xoauthxx/detail/error_detail.hpp>
#include <xoauthxx/detail/log.hpp>
#include <xoauthxx/detail/redact.hpp>
#include <xoauthxx/detail/result.hpp>
#include <xoauthxx/http/transport.hpp>
#include <xoauthxx/oauth2/client_params.hpp>
#include <xoauthxx/oauth2/token.hpp>

namespace xoauthxx::oauth2
{

inline constexpr std::string_view FORM_CONTENT_TYPE = "application/x-www-form-urlencoded";

/// Longest lifetime taken from `expires_in` (one year); larger values are clamped.
inline constexpr std::int64_t MAX_EXPIRES_IN = 365LL * 24 * 60 * 60;

/**
Lifetime in seconds from an `expires_in` member, clamped to [0, MAX_EXPIRES_IN].

Integers and decimal strings are accepted; anything else, or a value outside the int64 range of a string, is
ignored.
**/
[[nodiscard]] inline std::optional<std::int64_t> expires_in_seconds(const Json::Value& member)
{
    if (member.isUInt64() && !member.isInt64())
        return MAX_EXPIRES_IN;
    if (member.isInt64())
        return std::clamp<std::int64_t>(member.asInt64(), 0, MAX_EXPIRES_IN);
    if (member.isString())
    {
        const std::string text = member.asString();
        std::int64_t value = 0;
        const auto parsed = std::from_chars(text.data(), text.data() + text.size(), value);
        if (parsed.ec == std::errc{} && parsed.ptr == text.data() + text.size())
            return std::clamp<std::int64_t>(value, 0, MAX_EXPIRES_IN);
    }
    return std::nullopt;
}

/**
Body of a refresh_token grant.

@return `client_id=..&client_secret=..&refresh_token=..&grant_type=refresh_token` with form encoded values.
**/
[[nodiscard]] inline std::string refresh_request_body(std::string_view client_id, std::string_view client_secret,
    std::string_view refresh_token)
{
    return percent::encode_form({
        {"client_id", client_id},
        {"client_secret", client_secret},
        {"refresh_token", refresh_token},
        {"grant_type", "refresh_token"}});
}

/**
Parse a token endpoint answer.

@param body     Response body.
@param endpoint URL the body came from, for diagnostics.
@return         Token, `token_parse_failed` if the body is not JSON, `token_missing` if it has no access_token.
**/
[[nodiscard]] inline result<token> parse_token_response(const std::string& body, const std::string& endpoint)
{
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream in(body);
    if (!Json::parseFromStream(builder, in, &root, &errors))
    {
        return fail<token>(errc::token_parse_failed, "Token endpoint response is not JSON.",
            detail::error_detail().add("url", endpoint).add("reason", errors).str());
    }

    if (!root.isObject() || !root["access_token"].isString() || root["access_token"].asString().empty())
    {
        detail::error_detail info;
        info.add("url", endpoint);
        if (root.isObject() && root["error"].isString())
            info.add("error", root["error"].asString());
        if (root.isObject() && root["error_description"].isString())
            info.add("error_description", root["error_description"].asString());
        return fail<token>(errc::token_missing, "Token endpoint response has no access_token.", info.str());
    }

    token tok;
    tok.access_token = root["access_token"].asString();
    if (root["token_type"].isString())
        tok.token_type = root["token_type"].asString();
    if (root["scope"].isString())
        tok.scope = root["scope"].asString();
    if (const auto lifetime = expires_in_seconds(root["expires_in"]))
        tok.expires_at = std::chrono::system_clock::now() + std::chrono::seconds(*lifetime);
    return ok(std::move(tok));
}

/**
Exchanges a refresh token for a fresh access token.

Every call performs exactly one POST through the configured transport; nothing is cached or retried.
**/
class token_endpoint_client
{
public:
    explicit token_endpoint_client(std::shared_ptr<http::transport> transport)
        : transport_(std::move(transport))
    {
    }

    [[nodiscard]] result<token> refresh(const std::string& token_url, const std::string& client_id,
        const std::string& client_secret, const std::string& refresh_token) const
    {
        if (!transport_)
            return fail<token>(errc::internal_error, "No HTTP transport configured.");

        const std::string body = refresh_request_body(client_id, client_secret, refresh_token);
        XOAUTHXX_DEBUG("POST " + token_url + " " + detail::redact_form(body));

        const http::headers hdrs{{"Content-Type", std::string(FORM_CONTENT_TYPE)}};
        auto response = transport_->post(token_url, body, hdrs);
        if (!response)
            return fail<token>(std::move(response).error());

        auto tok = parse_token_response(*response, token_url);
        if (!tok)
            return tok;

        // Short-lived and only useful to someone who already has access to this machine.
        XOAUTHXX_DEBUG("Access token from " + token_url + ": " + tok->access_token);
        return tok;
    }

    [[nodiscard]] result<token> refresh(const client_params& params) const
    {
        return refresh(params.token_url, params.client_id, params.client_secret, params.refresh_token);
    }

private:
    std::shared_ptr<http::transport> transport_;
};

} // namespace xoauthxx::oauth2
