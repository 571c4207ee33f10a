/*

sasl.hpp
--------

SASL initial-response encoders for xoauthxx.
Implements encoding for XOAUTH2, OAUTHBEARER, PLAIN and LOGIN.

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>
#include <xoauthxx/codec/base64.hpp>
#include <xoauthxx/detail/result.hpp>

namespace xoauthxx::sasl
{

/// Separates the XOAUTH2 fields (CTRL-A).
inline constexpr char FIELD_SEPARATOR = '\x01';

/**
Initial response of the XOAUTH2 mechanism.

`user=<user>` CTRL-A `auth=Bearer <token>` CTRL-A CTRL-A, base64 encoded on a single line. The two trailing
separators and the literal "Bearer " prefix are part of the mechanism; servers reject anything else.

@param username     Identity the token was issued for.
@param access_token Live OAuth2 access token.
@return             Base64 initial response.
**/
[[nodiscard]] inline result<std::string> encode_xoauth2(std::string_view username, std::string_view access_token)
{
    std::string xoauth2 = "user=";
    xoauth2 += username;
    xoauth2 += FIELD_SEPARATOR;
    xoauth2 += "auth=Bearer ";
    xoauth2 += access_token;
    xoauth2 += FIELD_SEPARATOR;
    xoauth2 += FIELD_SEPARATOR;
    return ok(base64::encode(xoauth2));
}

} // namespace xoauthxx::sasl
