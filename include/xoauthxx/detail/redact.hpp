/*

redact.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Hide long-lived credentials and SASL payloads before they reach a log sink.

*/

#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include <xoauthxx/detail/ascii.hpp>

namespace xoauthxx::detail
{

inline constexpr std::string_view REDACTED = "<redacted>";

inline void split_tokens(std::string_view text, std::vector<std::string_view>& out)
{
    out.clear();
    while (!text.empty())
    {
        while (!text.empty() && text.front() == ' ')
            text.remove_prefix(1);
        if (text.empty())
            break;
        const auto pos = text.find(' ');
        if (pos == std::string_view::npos)
        {
            out.push_back(text);
            break;
        }
        out.push_back(text.substr(0, pos));
        text.remove_prefix(pos + 1);
    }
}

/**
Redact the SASL initial response of an authentication command.

`AUTH <mech> <payload>` (SMTP) and `[tag] AUTHENTICATE <mech> <payload>` (IMAP) keep the mechanism
name and lose the payload; any other line is returned unchanged.
**/
[[nodiscard]] inline std::string redact_command(std::string_view line)
{
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    std::vector<std::string_view> tokens;
    split_tokens(line, tokens);

    std::size_t keep = 0;
    for (std::size_t i = 0; i < tokens.size() && i < 2; ++i)
    {
        if (iequals_ascii(tokens[i], "AUTH") || iequals_ascii(tokens[i], "AUTHENTICATE"))
        {
            keep = i + 2;
            break;
        }
    }
    if (keep == 0 || tokens.size() <= keep)
        return std::string(line);

    std::string out;
    for (std::size_t i = 0; i < keep; ++i)
    {
        out.append(tokens[i]);
        out.push_back(' ');
    }
    out.append(REDACTED);
    return out;
}

/**
Redact the values of long-lived credentials in an `application/x-www-form-urlencoded` body.

The client id and grant type stay readable; the client secret and refresh token never leave the process
through a log line.
**/
[[nodiscard]] inline std::string redact_form(std::string_view body)
{
    static constexpr std::array<std::string_view, 3> sensitive_keys{
        "client_secret", "refresh_token", "password"};

    std::string out;
    out.reserve(body.size());
    while (!body.empty())
    {
        const auto amp = body.find('&');
        const std::string_view pair = body.substr(0, amp);
        const auto eq = pair.find('=');
        const std::string_view key = pair.substr(0, eq);

        bool sensitive = false;
        for (const auto& candidate : sensitive_keys)
            sensitive = sensitive || key == candidate;

        if (sensitive && eq != std::string_view::npos)
        {
            out.append(key);
            out.push_back('=');
            out.append(REDACTED);
        }
        else
            out.append(pair);

        if (amp == std::string_view::npos)
            break;
        out.push_back('&');
        body.remove_prefix(amp + 1);
    }
    return out;
}

} // namespace xoauthxx::detail
