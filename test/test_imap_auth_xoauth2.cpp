/*

test_imap_auth_xoauth2.cpp
--------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE imap_auth_xoauth2_test

#include <boost/test/unit_test.hpp>

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <xoauthxx/imap/authenticator.hpp>


using xoauthxx::auth_record;
using xoauthxx::imap::reply;
using xoauthxx::imap::status;
using xoauthxx::imap::xoauth2_authenticator;


namespace
{

class fake_session : public xoauthxx::imap::session
{
public:
    fake_session(std::set<std::string, std::less<>> caps, reply answer)
        : caps_(std::move(caps)), answer_(std::move(answer))
    {
    }

    bool has_capability(std::string_view name) const override
    {
        return caps_.find(name) != caps_.end();
    }

    xoauthxx::result<reply> send_command(const std::string& command) override
    {
        commands.push_back(command);
        return xoauthxx::ok(answer_);
    }

    xoauthxx::result<reply> login(const auth_record& record) override
    {
        logins.push_back(record.user);
        return xoauthxx::ok(reply{status::ok, "LOGIN completed"});
    }

    std::vector<std::string> commands;
    std::vector<std::string> logins;

private:
    std::set<std::string, std::less<>> caps_;
    reply answer_;
};

const auth_record RECORD{"imap.gmail.com", "993", "alice", "tok123"};

} // namespace


BOOST_AUTO_TEST_CASE(single_authenticate_command)
{
    fake_session sess({"IMAP4rev1", "AUTH=XOAUTH2", "SASL-IR"}, reply{status::ok, "Success"});
    const xoauth2_authenticator auth;

    auto rep = auth.authenticate(sess, RECORD);
    BOOST_TEST(rep.has_value());
    BOOST_TEST(sess.commands.size() == 1u);
    BOOST_TEST(sess.commands.front() == "AUTHENTICATE XOAUTH2 dXNlcj1hbGljZQFhdXRoPUJlYXJlciB0b2sxMjMBAQ==");
    BOOST_TEST(sess.logins.empty());
}

BOOST_AUTO_TEST_CASE(without_sasl_ir_delegates_to_login)
{
    fake_session sess({"IMAP4rev1", "AUTH=XOAUTH2"}, reply{status::ok, "Success"});
    const xoauth2_authenticator auth;

    auto rep = auth.authenticate(sess, RECORD);
    BOOST_TEST(rep.has_value());
    BOOST_TEST(sess.commands.empty());
    BOOST_TEST(sess.logins.size() == 1u);
}

BOOST_AUTO_TEST_CASE(without_xoauth2_capability_delegates_to_login)
{
    fake_session sess({"IMAP4rev1", "SASL-IR", "AUTH=PLAIN"}, reply{status::ok, "Success"});
    const xoauth2_authenticator auth;

    auto rep = auth.authenticate(sess, RECORD);
    BOOST_TEST(rep.has_value());
    BOOST_TEST(sess.commands.empty());
    BOOST_TEST(sess.logins.size() == 1u);
}

BOOST_AUTO_TEST_CASE(disabled_xoauth2_delegates_to_login)
{
    fake_session sess({"AUTH=XOAUTH2", "SASL-IR"}, reply{status::ok, "Success"});
    const xoauth2_authenticator auth(false);

    BOOST_TEST(!auth.applies(sess));
    auto rep = auth.authenticate(sess, RECORD);
    BOOST_TEST(rep.has_value());
    BOOST_TEST(sess.logins.size() == 1u);
}

BOOST_AUTO_TEST_CASE(rejection_is_imap_auth_failure)
{
    fake_session sess({"AUTH=XOAUTH2", "SASL-IR"}, reply{status::no, "[AUTHENTICATIONFAILED] Invalid credentials"});
    const xoauth2_authenticator auth;

    auto rep = auth.authenticate(sess, RECORD);
    BOOST_TEST(!rep.has_value());
    BOOST_TEST((rep.error().code == xoauthxx::errc::imap_auth_failed));
    BOOST_TEST(xoauthxx::is_protocol_auth_error(rep.error().code));
    BOOST_TEST(rep.error().detail == "[AUTHENTICATIONFAILED] Invalid credentials");
}

BOOST_AUTO_TEST_CASE(line_breaks_rejected_before_sending)
{
    fake_session sess({"AUTH=XOAUTH2", "SASL-IR"}, reply{status::ok, "Success"});
    const xoauth2_authenticator auth;

    auto rep = auth.authenticate(sess, auth_record{"imap.gmail.com", "993", "alice\r\nA2 LOGOUT", "tok"});
    BOOST_TEST(!rep.has_value());
    BOOST_TEST((rep.error().code == xoauthxx::errc::invalid_argument));
    BOOST_TEST(rep.error().detail == "field=username offset=5");
    BOOST_TEST(rep.error().detail.find("LOGOUT") == std::string::npos);
    BOOST_TEST(sess.commands.empty());
}
