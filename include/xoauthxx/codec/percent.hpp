/*

percent.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>


namespace xoauthxx
{


/**
Percent encoding of `application/x-www-form-urlencoded` values.

RFC 3986 unreserved characters pass through, every other octet becomes `%XX` with upper case hex digits.
**/
class percent
{
public:

    static constexpr char PERCENT_HEX_FLAG = '%';

    /**
    Encoding a form value.

    @param txt String to encode.
    @return    Encoded string.
    **/
    [[nodiscard]] static std::string encode(std::string_view txt)
    {
        static constexpr std::string_view HEX_DIGITS = "0123456789ABCDEF";

        std::string enc_text;
        enc_text.reserve(txt.size());
        for (char ch : txt)
        {
            if (is_unreserved(ch))
                enc_text += ch;
            else
            {
                const auto octet = static_cast<std::uint8_t>(ch);
                enc_text += PERCENT_HEX_FLAG;
                enc_text += HEX_DIGITS[octet >> 4];
                enc_text += HEX_DIGITS[octet & 0x0f];
            }
        }
        return enc_text;
    }

    /**
    Joining `key=value` pairs with `&`, encoding every value.

    Keys are emitted verbatim; they are protocol constants.
    **/
    [[nodiscard]] static std::string encode_form(std::initializer_list<std::pair<std::string_view, std::string_view>> fields)
    {
        std::string body;
        for (const auto& [key, value] : fields)
        {
            if (!body.empty())
                body += '&';
            body.append(key);
            body += '=';
            body += encode(value);
        }
        return body;
    }

private:

    static constexpr bool is_unreserved(char ch) noexcept
    {
        return (ch >= 'A' && ch <= 'Z')
            || (ch >= 'a' && ch <= 'z')
            || (ch >= '0' && ch <= '9')
            || ch == '-' || ch == '.' || ch == '_' || ch == '~';
    }
};


} // namespace xoauthxx
