/*

error_detail.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Builder for the `detail` of an error_info: space separated `key=value` pairs on one line. Values holding blanks,
quotes or `=` are double quoted with backslash escapes; control characters become spaces.

*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace xoauthxx::detail
{

class error_detail
{
public:
    error_detail& add(std::string_view key, std::string_view value)
    {
        begin_pair(key);
        append_value(value);
        return *this;
    }

    error_detail& add_int(std::string_view key, std::int64_t value)
    {
        begin_pair(key);
        out_ += std::to_string(value);
        return *this;
    }

    /// `key=<category>:<value>` followed by the quoted message.
    error_detail& add_ec(std::string_view key, std::error_code ec)
    {
        begin_pair(key);
        out_ += ec.category().name();
        out_ += ':';
        out_ += std::to_string(ec.value());
        out_ += ' ';
        append_value(ec.message());
        return *this;
    }

    [[nodiscard]] std::string str() const
    {
        return out_;
    }

private:
    void begin_pair(std::string_view key)
    {
        if (!out_.empty())
            out_ += ' ';
        out_ += key;
        out_ += '=';
    }

    void append_value(std::string_view value)
    {
        bool quote = value.empty();
        for (char c : value)
        {
            if (c == ' ' || c == '"' || c == '=' || c == '\\' || static_cast<unsigned char>(c) < 0x20)
                quote = true;
        }
        if (!quote)
        {
            out_ += value;
            return;
        }

        out_ += '"';
        for (char c : value)
        {
            if (c == '"' || c == '\\')
                out_ += '\\';
            out_ += static_cast<unsigned char>(c) < 0x20 ? ' ' : c;
        }
        out_ += '"';
    }

    std::string out_;
};

} // namespace xoauthxx::detail
