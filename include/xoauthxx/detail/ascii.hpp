/*

ascii.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <string>
#include <string_view>

namespace xoauthxx
{
namespace detail
{
    [[nodiscard]] constexpr char ascii_tolower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }

    [[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
    {
        return std::ranges::equal(a, b, [](char x, char y) { return ascii_tolower(x) == ascii_tolower(y); });
    }

    [[nodiscard]] inline bool istarts_with_ascii(std::string_view text, std::string_view prefix) noexcept
    {
        return text.size() >= prefix.size() && iequals_ascii(text.substr(0, prefix.size()), prefix);
    }

    /// Strip blanks, tabs and line ends at both sides.
    [[nodiscard]] inline std::string_view trim_view(std::string_view sv) noexcept
    {
        constexpr std::string_view BLANKS = " \t\r\n\f\v";
        const auto first = sv.find_first_not_of(BLANKS);
        if (first == std::string_view::npos)
            return {};
        return sv.substr(first, sv.find_last_not_of(BLANKS) - first + 1);
    }

    // RFC 9110 token characters, which is what a field name is made of.
    [[nodiscard]] inline bool is_valid_header_name(std::string_view name) noexcept
    {
        if (name.empty())
            return false;

        static constexpr std::string_view TCHAR_PUNCT = "!#$%&'*+-.^_`|~";
        for (char ch : name)
        {
            const bool alnum = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9');
            if (!alnum && TCHAR_PUNCT.find(ch) == std::string_view::npos)
                return false;
        }
        return true;
    }

    // Conservative validation: reject CR/LF and other control characters (except TAB).
    [[nodiscard]] inline bool is_valid_header_value(std::string_view value) noexcept
    {
        for (char ch : value)
        {
            unsigned char c = static_cast<unsigned char>(ch);
            if (c < 32 && ch != '\t')
                return false;
            if (c == 127)
                return false;
        }
        return true;
    }
}
}
