/*

authenticator.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

XOAUTH2 login over an SMTP session owned by the caller.

*/

#pragma once

#include <string>
#include <utility>

#include <xoauthxx/auth_record.hpp>
#include <xoauthxx/detail/log.hpp>
#include <xoauthxx/detail/redact.hpp>
#include <xoauthxx/detail/result.hpp>
#include <xoauthxx/detail/sanitize.hpp>
#include <xoauthxx/detail/sasl.hpp>

namespace xoauthxx::smtp
{

/// Reply code of a successful AUTH exchange.
inline constexpr int AUTH_SUCCEEDED = 235;

class session
{
public:
    virtual ~session() = default;

    /// Send a command line and fail unless the reply carries `expected_code`.
    [[nodiscard]] virtual result_void send_command_or_fail(const std::string& command, int expected_code) = 0;
};

class xoauth2_authenticator
{
public:
    /**
    Send `AUTH XOAUTH2 <initial response>` and require 235.

    @return Nothing, or the session's failure unmodified.
    **/
    [[nodiscard]] result_void authenticate(session& sess, const auth_record& record) const
    {
        XOAUTHXX_TRY_VOID(detail::ensure_no_crlf_or_nul(record.user, "username"));
        XOAUTHXX_TRY_VOID(detail::ensure_no_crlf_or_nul(record.secret, "access_token"));
        auto encoded = sasl::encode_xoauth2(record.user, record.secret);
        if (!encoded)
            return fail<void>(std::move(encoded).error());

        const std::string command = "AUTH XOAUTH2 " + *encoded;
        XOAUTHXX_DEBUG("SMTP >> " + detail::redact_command(command));
        return sess.send_command_or_fail(command, AUTH_SUCCEEDED);
    }
};

} // namespace xoauthxx::smtp
