/*

identity.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <compare>
#include <string>

namespace xoauthxx::source
{

/**
One concrete (host, user, port) triple.

Also the key of credentials file mappings: comparison is exact and case sensitive, no normalisation of host
names, schemes or service names.
**/
struct identity
{
    std::string host;
    std::string user;
    std::string port;

    auto operator<=>(const identity&) const = default;
    bool operator==(const identity&) const = default;
};

[[nodiscard]] inline std::string to_string(const identity& id)
{
    return id.user + "@" + id.host + ":" + id.port;
}

} // namespace xoauthxx::source
