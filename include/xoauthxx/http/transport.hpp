/*

transport.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <utility>
#include <vector>

#include <xoauthxx/detail/ascii.hpp>
#include <xoauthxx/detail/result.hpp>

namespace xoauthxx::http
{

using header = std::pair<std::string, std::string>;
using headers = std::vector<header>;

/// Reject header names that are not tokens and values carrying control characters.
[[nodiscard]] inline result_void validate_headers(const headers& hdrs)
{
    for (const auto& [name, value] : hdrs)
    {
        if (!detail::is_valid_header_name(name))
            return fail_void(errc::invalid_argument, "Invalid HTTP header name.", name);
        if (!detail::is_valid_header_value(value))
            return fail_void(errc::invalid_argument, "Invalid HTTP header value.", name);
    }
    return ok();
}

/**
Blocking HTTP POST.

Implementations issue exactly one request per call, never retry, and return the response body whatever the
status code: the token endpoint reports its own errors in a JSON body.
**/
class transport
{
public:
    virtual ~transport() = default;

    /**
    @param url  Absolute `http` or `https` URL.
    @param body Request body, sent as is.
    @param hdrs Extra request headers.
    @return     Response body, or a transport error.
    **/
    [[nodiscard]] virtual result<std::string> post(const std::string& url, const std::string& body,
        const headers& hdrs) = 0;
};

} // namespace xoauthxx::http
