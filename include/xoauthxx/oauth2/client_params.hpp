/*

client_params.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Static OAuth2 client parameters produced by a credential source.

*/

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace xoauthxx::oauth2
{

struct client_params
{
    std::string token_url;
    std::string client_id;
    std::string client_secret;
    std::string refresh_token;
    /// Identity to authenticate as when the query carries no user.
    std::optional<std::string> user_override;

    /// Name of the first empty required field, if any.
    [[nodiscard]] std::optional<std::string_view> missing_field() const noexcept
    {
        if (token_url.empty())
            return "token_url";
        if (client_id.empty())
            return "client_id";
        if (client_secret.empty())
            return "client_secret";
        if (refresh_token.empty())
            return "refresh_token";
        return std::nullopt;
    }

    [[nodiscard]] bool usable() const noexcept
    {
        return !missing_field().has_value();
    }
};

} // namespace xoauthxx::oauth2
