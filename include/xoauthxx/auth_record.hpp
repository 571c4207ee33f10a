/*

auth_record.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>

namespace xoauthxx
{

/// Credential handed to a protocol session; `secret` is the access token, never the refresh token.
struct auth_record
{
    std::string host;
    std::string port;
    std::string user;
    std::string secret;
};

} // namespace xoauthxx
