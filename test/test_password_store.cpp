/*

test_password_store.cpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE password_store_test

#include <boost/test/unit_test.hpp>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <xoauthxx/detail/log.hpp>
#include <xoauthxx/source/credential_source.hpp>
#include <xoauthxx/source/password_store_source.hpp>


using xoauthxx::source::password_store_source;
using xoauthxx::source::secret_entry;


namespace
{

class stub_store : public xoauthxx::source::secret_store
{
public:
    explicit stub_store(std::optional<secret_entry> entry)
        : entry_(std::move(entry))
    {
    }

    xoauthxx::result<std::optional<secret_entry>> find(const std::string& host, const std::string& user) override
    {
        queries.emplace_back(host, user);
        return xoauthxx::ok(entry_);
    }

    std::vector<std::pair<std::string, std::string>> queries;

private:
    std::optional<secret_entry> entry_;
};

secret_entry full_entry()
{
    secret_entry entry;
    entry.name = "imap.gmail.com/me@gmail.com";
    entry.secret = "app-password";
    entry.fields = {
        {"xoauth2_token_url", "https://oauth2.googleapis.com/token"},
        {"xoauth2_client_id", "id"},
        {"xoauth2_client_secret", "secret"},
        {"xoauth2_refresh_token", "refresh"}};
    return entry;
}

struct warning_capture
{
    std::vector<std::string> warnings;
    xoauthxx::log::scoped_sink sink{xoauthxx::log::level::warn, [this](const xoauthxx::log::entry& e)
    {
        if (e.lvl == xoauthxx::log::level::warn)
            warnings.push_back(e.message);
    }};
};

} // namespace


BOOST_AUTO_TEST_CASE(all_fields_present)
{
    auto store = std::make_shared<stub_store>(full_entry());
    const password_store_source src(store);

    auto fetched = src.fetch({"imap.gmail.com", "me@gmail.com", "993"});
    BOOST_TEST(fetched.has_value());
    BOOST_TEST(fetched->has_value());
    BOOST_TEST((*fetched)->token_url == "https://oauth2.googleapis.com/token");
    BOOST_TEST((*fetched)->client_id == "id");
    BOOST_TEST((*fetched)->client_secret == "secret");
    BOOST_TEST((*fetched)->refresh_token == "refresh");

    BOOST_TEST(store->queries.size() == 1u);
    BOOST_TEST(store->queries.front().first == "imap.gmail.com");
    BOOST_TEST(store->queries.front().second == "me@gmail.com");
}

BOOST_AUTO_TEST_CASE(missing_fields_warn_and_do_not_match)
{
    warning_capture capture;
    auto entry = full_entry();
    entry.fields.erase("xoauth2_client_secret");
    entry.fields.erase("xoauth2_refresh_token");
    const password_store_source src(std::make_shared<stub_store>(entry));

    auto fetched = src.fetch({"imap.gmail.com", "me@gmail.com", "993"});
    BOOST_TEST(fetched.has_value());
    BOOST_TEST(!fetched->has_value());
    BOOST_TEST(capture.warnings.size() == 2u);
    if (capture.warnings.size() == 2u)
    {
        BOOST_TEST(capture.warnings[0].find("xoauth2_client_secret") != std::string::npos);
        BOOST_TEST(capture.warnings[1].find("xoauth2_refresh_token") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(no_entry_is_no_match)
{
    const password_store_source src(std::make_shared<stub_store>(std::nullopt));
    auto fetched = src.fetch({"imap.gmail.com", "me@gmail.com", "993"});
    BOOST_TEST(fetched.has_value());
    BOOST_TEST(!fetched->has_value());
}

BOOST_AUTO_TEST_CASE(parse_pass_output)
{
    const auto entry = xoauthxx::source::parse_pass_entry("imap.gmail.com/me",
        "app-password\r\n"
        "xoauth2_token_url: https://oauth2.googleapis.com/token\r\n"
        "xoauth2_client_id:id\n"
        "free text line\n"
        "  xoauth2_refresh_token :  1//0refresh  \n");

    BOOST_TEST(entry.name == "imap.gmail.com/me");
    BOOST_TEST(entry.secret == "app-password");
    BOOST_TEST(entry.field("xoauth2_token_url").value_or("") == "https://oauth2.googleapis.com/token");
    BOOST_TEST(entry.field("xoauth2_client_id").value_or("") == "id");
    BOOST_TEST(entry.field("xoauth2_refresh_token").value_or("") == "1//0refresh");
    BOOST_TEST(!entry.field("xoauth2_client_secret").has_value());
}

BOOST_AUTO_TEST_CASE(pass_candidate_names)
{
    using xoauthxx::source::pass_store;
    const std::vector<std::string> with_user{"imap.gmail.com/me", "me@imap.gmail.com", "imap.gmail.com"};
    BOOST_TEST(pass_store::candidate_names("imap.gmail.com", "me") == with_user, boost::test_tools::per_element());

    const std::vector<std::string> without_user{"imap.gmail.com"};
    BOOST_TEST(pass_store::candidate_names("imap.gmail.com", "") == without_user, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(pass_store_runs_program)
{
    // echo answers every `show` with its own arguments: the first candidate name wins.
    xoauthxx::source::pass_store store("echo");
    auto found = store.find("imap.gmail.com", "me");
    BOOST_TEST(found.has_value());
    BOOST_TEST(found->has_value());
    BOOST_TEST((*found)->name == "imap.gmail.com/me");
    BOOST_TEST((*found)->secret == "show -- imap.gmail.com/me");
}

BOOST_AUTO_TEST_CASE(pass_store_entry_name_is_not_an_option)
{
    xoauthxx::source::pass_store store("echo");
    auto found = store.find("--help", "");
    BOOST_TEST(found.has_value());
    BOOST_TEST(found->has_value());
    BOOST_TEST((*found)->secret == "show -- --help");
}

BOOST_AUTO_TEST_CASE(pass_store_missing_entry)
{
    xoauthxx::source::pass_store store("false");
    auto found = store.find("imap.gmail.com", "me");
    BOOST_TEST(found.has_value());
    BOOST_TEST(!found->has_value());
}

BOOST_AUTO_TEST_CASE(pass_store_missing_program)
{
    xoauthxx::source::pass_store store("xoauthxx-no-such-pass-for-tests");
    auto found = store.find("imap.gmail.com", "me");
    BOOST_TEST(!found.has_value());
    BOOST_TEST((found.error().code == xoauthxx::errc::store_lookup_failed));
}

BOOST_AUTO_TEST_CASE(store_source_through_credential_source)
{
    const auto src = xoauthxx::source::credential_source::from_store(std::make_shared<stub_store>(full_entry()));
    BOOST_TEST(std::string(src.kind()) == "pass");
    auto fetched = src.fetch({"imap.gmail.com", "me@gmail.com", "993"});
    BOOST_TEST(fetched.has_value());
    BOOST_TEST(fetched->has_value());
}
