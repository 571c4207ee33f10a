/*

url.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>

#include <xoauthxx/detail/error_detail.hpp>
#include <xoauthxx/detail/result.hpp>

namespace xoauthxx::http
{

struct url
{
    std::string scheme;
    std::string host;
    std::string port;
    /// Path and query, at least "/".
    std::string target;

    [[nodiscard]] bool is_tls() const noexcept
    {
        return scheme == "https";
    }

    /// Value of the Host header: the port is omitted when it is the scheme default.
    [[nodiscard]] std::string host_header() const
    {
        const bool default_port = (is_tls() && port == "443") || (!is_tls() && port == "80");
        const std::string name = host.find(':') == std::string::npos ? host : "[" + host + "]";
        if (default_port)
            return name;
        return name + ":" + port;
    }
};

/**
Split an absolute http(s) URL into its connection parts.

User info and fragments are rejected; IPv6 literals are accepted in brackets.
**/
[[nodiscard]] inline result<url> parse_url(std::string_view text)
{
    auto invalid = [text](const char* why)
    {
        return fail<url>(errc::url_invalid, why, detail::error_detail().add("url", text).str());
    };

    url out;
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string_view::npos)
        return invalid("URL has no scheme.");

    out.scheme = std::string(text.substr(0, scheme_end));
    for (char& ch : out.scheme)
    {
        if (ch >= 'A' && ch <= 'Z')
            ch = static_cast<char>(ch - 'A' + 'a');
    }
    if (out.scheme != "http" && out.scheme != "https")
        return invalid("Unsupported URL scheme.");

    std::string_view rest = text.substr(scheme_end + 3);
    const auto authority_end = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, authority_end);
    std::string_view tail = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

    if (authority.find('@') != std::string_view::npos)
        return invalid("User info in URL is not supported.");
    if (tail.find('#') != std::string_view::npos)
        tail = tail.substr(0, tail.find('#'));

    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[')
    {
        const auto close = authority.find(']');
        if (close == std::string_view::npos)
            return invalid("Unterminated IPv6 literal.");
        host = authority.substr(1, close - 1);
        std::string_view after = authority.substr(close + 1);
        if (!after.empty())
        {
            if (after.front() != ':')
                return invalid("Garbage after IPv6 literal.");
            port = after.substr(1);
        }
    }
    else
    {
        const auto colon = authority.rfind(':');
        if (colon != std::string_view::npos)
        {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
    }

    if (host.empty())
        return invalid("URL has no host.");
    for (char ch : port)
    {
        if (ch < '0' || ch > '9')
            return invalid("URL port is not numeric.");
    }

    out.host = std::string(host);
    out.port = port.empty() ? (out.is_tls() ? "443" : "80") : std::string(port);
    out.target = tail.empty() || tail.front() != '/' ? "/" + std::string(tail) : std::string(tail);
    return ok(std::move(out));
}

} // namespace xoauthxx::http
