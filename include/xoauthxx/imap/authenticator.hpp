/*

authenticator.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

XOAUTH2 login over an IMAP session owned by the caller.

*/

#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <xoauthxx/auth_record.hpp>
#include <xoauthxx/detail/log.hpp>
#include <xoauthxx/detail/redact.hpp>
#include <xoauthxx/detail/result.hpp>
#include <xoauthxx/detail/sanitize.hpp>
#include <xoauthxx/detail/sasl.hpp>

namespace xoauthxx::imap
{

enum class status
{
    ok,
    no,
    bad,
    unknown
};

/// Tagged completion of a command.
struct reply
{
    status st = status::unknown;
    std::string text;
};

/// The IMAP client the authenticator drives; capability negotiation and command tagging are its business.
class session
{
public:
    virtual ~session() = default;

    [[nodiscard]] virtual bool has_capability(std::string_view name) const = 0;

    /// Send one untagged command line; the session adds the tag and CRLF.
    [[nodiscard]] virtual result<reply> send_command(const std::string& command) = 0;

    /// The session's own login path.
    [[nodiscard]] virtual result<reply> login(const auth_record& record) = 0;
};

class xoauth2_authenticator
{
public:
    /// With `use_xoauth2` false every login goes through the session's own login.
    explicit xoauth2_authenticator(bool use_xoauth2 = true)
        : use_xoauth2_(use_xoauth2)
    {
    }

    /// XOAUTH2 with an initial response needs both capabilities.
    [[nodiscard]] bool applies(const session& sess) const
    {
        return use_xoauth2_ && sess.has_capability("AUTH=XOAUTH2") && sess.has_capability("SASL-IR");
    }

    /**
    Log in with the access token of `record`, or through the session's login when XOAUTH2 does not apply.

    @return Server reply, `imap_auth_failed` with the server text on NO or BAD, or the session's error.
    **/
    [[nodiscard]] result<reply> authenticate(session& sess, const auth_record& record) const
    {
        if (!applies(sess))
        {
            XOAUTHXX_DEBUG("XOAUTH2 not applicable, using the session login.");
            return sess.login(record);
        }

        XOAUTHXX_TRY_VOID(detail::ensure_no_crlf_or_nul(record.user, "username"));
        XOAUTHXX_TRY_VOID(detail::ensure_no_crlf_or_nul(record.secret, "access_token"));
        auto encoded = sasl::encode_xoauth2(record.user, record.secret);
        if (!encoded)
            return fail<reply>(std::move(encoded).error());

        const std::string command = "AUTHENTICATE XOAUTH2 " + *encoded;
        XOAUTHXX_DEBUG("IMAP >> " + detail::redact_command(command));
        auto rep = sess.send_command(command);
        if (!rep)
            return rep;
        if (rep->st == status::no || rep->st == status::bad)
            return fail<reply>(errc::imap_auth_failed, "AUTHENTICATE XOAUTH2 rejected.", rep->text);
        return rep;
    }

private:
    bool use_xoauth2_;
};

} // namespace xoauthxx::imap
