/*

sanitize.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <string_view>

#include <xoauthxx/detail/error_detail.hpp>
#include <xoauthxx/detail/result.hpp>

namespace xoauthxx::detail
{

/**
Guard for a value spliced into an AUTH command line, where CR, LF or NUL would end the command early.

@param value Value to check; never copied into the error.
@param field Name reported in the error detail.
@return      Nothing, or `invalid_argument`.
**/
[[nodiscard]] inline result_void ensure_no_crlf_or_nul(std::string_view value, std::string_view field)
{
    const auto bad = value.find_first_of(std::string_view("\r\n\0", 3));
    if (bad == std::string_view::npos)
        return ok();
    return fail_void(errc::invalid_argument, "Line break or NUL in a command argument.",
        error_detail().add("field", field).add_int("offset", static_cast<std::int64_t>(bad)).str());
}

} // namespace xoauthxx::detail
