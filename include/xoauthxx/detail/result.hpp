/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Every fallible xoauthxx operation returns result<T>; throwing.hpp bridges to
exceptions for callers who prefer them.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace xoauthxx
{

/// Error codes for xoauthxx operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Configuration errors (100-199)
    config_invalid = 100,
    config_invalid_extension = 101,
    config_decrypt_failed = 102,
    config_parse_failed = 103,
    config_missing_field = 104,
    config_duplicate_entry = 105,
    store_lookup_failed = 106,

    // Transport errors (200-299)
    url_invalid = 200,
    http_resolve_failed = 201,
    http_connect_failed = 202,
    http_tls_failed = 203,
    http_io_failed = 204,
    http_bad_response = 205,
    http_request_failed = 206,
    process_failed = 207,
    token_parse_failed = 208,
    token_missing = 209,

    // Protocol authentication errors (300-399)
    imap_auth_failed = 300,
    smtp_auth_failed = 301,

    // Input validation (700-799)
    invalid_argument = 700,

    internal_error = 900,
};

[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "ok";
        case errc::config_invalid: return "config_invalid";
        case errc::config_invalid_extension: return "config_invalid_extension";
        case errc::config_decrypt_failed: return "config_decrypt_failed";
        case errc::config_parse_failed: return "config_parse_failed";
        case errc::config_missing_field: return "config_missing_field";
        case errc::config_duplicate_entry: return "config_duplicate_entry";
        case errc::store_lookup_failed: return "store_lookup_failed";
        case errc::url_invalid: return "url_invalid";
        case errc::http_resolve_failed: return "http_resolve_failed";
        case errc::http_connect_failed: return "http_connect_failed";
        case errc::http_tls_failed: return "http_tls_failed";
        case errc::http_io_failed: return "http_io_failed";
        case errc::http_bad_response: return "http_bad_response";
        case errc::http_request_failed: return "http_request_failed";
        case errc::process_failed: return "process_failed";
        case errc::token_parse_failed: return "token_parse_failed";
        case errc::token_missing: return "token_missing";
        case errc::imap_auth_failed: return "imap_auth_failed";
        case errc::smtp_auth_failed: return "smtp_auth_failed";
        case errc::invalid_argument: return "invalid_argument";
        case errc::internal_error: return "internal_error";
    }
    return "unknown";
}

/// Malformed credentials, wrong extension, decrypt failure, missing field.
[[nodiscard]] constexpr bool is_configuration_error(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    return c >= 100 && c < 200;
}

/// Token endpoint request failed or answered without a usable token.
[[nodiscard]] constexpr bool is_transport_error(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    return c >= 200 && c < 300;
}

/// The downstream protocol rejected the AUTH exchange.
[[nodiscard]] constexpr bool is_protocol_auth_error(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    return c >= 300 && c < 400;
}

/// Rich error value with code, message, diagnostic detail and origin
struct error_info
{
    errc code = errc::ok;
    std::string message;
    std::string detail;
    std::error_code sys;
    std::source_location where;

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string out = "[";
        out += ::xoauthxx::to_string(code);
        out += "] ";
        out += message;
        if (!detail.empty())
        {
            out += ": ";
            out += detail;
        }
        if (sys)
        {
            out += " (";
            out += sys.message();
            out += ")";
        }
        return out;
    }
};

template<typename T>
using result = std::expected<T, error_info>;

using result_void = std::expected<void, error_info>;

[[nodiscard]] inline error_info make_error(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return error_info{code, std::move(message), std::move(detail), sys, where};
}

template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline result_void ok()
{
    return result_void{};
}

template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail(error_info err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return std::unexpected(make_error(code, std::move(message), std::move(detail), sys, where));
}

[[nodiscard]] inline result_void fail_void(errc code, std::string message, std::string detail = {},
    std::source_location where = std::source_location::current())
{
    return std::unexpected(make_error(code, std::move(message), std::move(detail), {}, where));
}

/// Propagate the error of a result-returning expression, otherwise yield its value.
/// Usage: auto val = XOAUTHXX_TRY(some_op());
#define XOAUTHXX_TRY(expr) \
    ({ \
        auto&& _result = (expr); \
        if (!_result) [[unlikely]] \
            return std::unexpected(std::move(_result).error()); \
        std::move(*_result); \
    })

/// Same but for void results
#define XOAUTHXX_TRY_VOID(expr) \
    do { \
        auto&& _result = (expr); \
        if (!_result) [[unlikely]] \
            return std::unexpected(std::move(_result).error()); \
    } while(0)

} // namespace xoauthxx
