/*

password_store_source.hpp
-------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Credentials kept as fields of a password store entry.

*/

#pragma once

#include <array>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <xoauthxx/detail/ascii.hpp>
#include <xoauthxx/detail/error_detail.hpp>
#include <xoauthxx/detail/log.hpp>
#include <xoauthxx/detail/result.hpp>
#include <xoauthxx/detail/subprocess.hpp>
#include <xoauthxx/oauth2/client_params.hpp>
#include <xoauthxx/source/identity.hpp>

namespace xoauthxx::source
{

inline constexpr std::string_view FIELD_TOKEN_URL = "xoauth2_token_url";
inline constexpr std::string_view FIELD_CLIENT_ID = "xoauth2_client_id";
inline constexpr std::string_view FIELD_CLIENT_SECRET = "xoauth2_client_secret";
inline constexpr std::string_view FIELD_REFRESH_TOKEN = "xoauth2_refresh_token";

/// One entry of a secret store: its name, the secret itself and any named fields stored beside it.
struct secret_entry
{
    std::string name;
    std::string secret;
    std::map<std::string, std::string, std::less<>> fields;

    [[nodiscard]] std::optional<std::string> field(std::string_view key) const
    {
        const auto it = fields.find(key);
        if (it == fields.end())
            return std::nullopt;
        return it->second;
    }
};

/// Finds the entry holding the secret of a (host, user) pair.
class secret_store
{
public:
    virtual ~secret_store() = default;

    [[nodiscard]] virtual result<std::optional<secret_entry>> find(const std::string& host,
        const std::string& user) = 0;
};

/**
Parse the output of `pass show`.

The first line is the secret, each following `key: value` line a field. Lines without a colon are ignored.
**/
[[nodiscard]] inline secret_entry parse_pass_entry(std::string name, std::string_view text)
{
    secret_entry entry;
    entry.name = std::move(name);

    bool first = true;
    while (!text.empty())
    {
        const auto eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        if (first)
        {
            entry.secret = std::string(line);
            first = false;
            continue;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos)
            continue;
        const std::string_view key = detail::trim_view(line.substr(0, colon));
        if (key.empty())
            continue;
        entry.fields.emplace(std::string(key), std::string(detail::trim_view(line.substr(colon + 1))));
    }
    return entry;
}

/**
The `pass` password manager.

Entries are tried under the names `host/user`, `user@host` and `host`, in this order; with an empty user only
`host` is tried.
**/
class pass_store : public secret_store
{
public:
    explicit pass_store(std::string program = "pass")
        : program_(std::move(program))
    {
    }

    [[nodiscard]] static std::vector<std::string> candidate_names(const std::string& host, const std::string& user)
    {
        if (user.empty())
            return {host};
        return {host + "/" + user, user + "@" + host, host};
    }

    [[nodiscard]] result<std::optional<secret_entry>> find(const std::string& host, const std::string& user) override
    {
        if (host.empty())
            return ok(std::optional<secret_entry>());

        for (const auto& name : candidate_names(host, user))
        {
            auto output = detail::run_command({program_, "show", "--", name});
            if (!output)
            {
                auto err = std::move(output).error();
                return fail<std::optional<secret_entry>>(errc::store_lookup_failed, "Password store lookup failed.",
                    detail::error_detail().add("entry", name).add("reason", err.message).str(), err.sys);
            }
            // pass exits with 1 for a missing entry.
            if (!output->succeeded())
                continue;

            XOAUTHXX_DEBUG("Password store entry " + name + " found.");
            return ok(std::optional<secret_entry>(parse_pass_entry(name, output->out)));
        }
        return ok(std::optional<secret_entry>());
    }

private:
    std::string program_;
};

/**
Reads the four `xoauth2_*` fields off the secret store entry of (host, user).

The port takes no part in the lookup. An entry lacking any field is no match, with one warning per missing field.
**/
class password_store_source
{
public:
    explicit password_store_source(std::shared_ptr<secret_store> store = std::make_shared<pass_store>())
        : store_(std::move(store))
    {
    }

    [[nodiscard]] result<std::optional<oauth2::client_params>> fetch(const identity& id) const
    {
        using fetched = std::optional<oauth2::client_params>;

        if (!store_)
            return fail<fetched>(errc::config_invalid, "No secret store configured.");

        auto found = store_->find(id.host, id.user);
        if (!found)
            return fail<fetched>(std::move(found).error());
        if (!found->has_value())
            return ok(fetched());

        const secret_entry& entry = **found;
        const std::array<std::pair<std::string_view, std::string oauth2::client_params::*>, 4> fields{{
            {FIELD_TOKEN_URL, &oauth2::client_params::token_url},
            {FIELD_CLIENT_ID, &oauth2::client_params::client_id},
            {FIELD_CLIENT_SECRET, &oauth2::client_params::client_secret},
            {FIELD_REFRESH_TOKEN, &oauth2::client_params::refresh_token}}};

        oauth2::client_params params;
        bool complete = true;
        for (const auto& [key, member] : fields)
        {
            auto value = entry.field(key);
            if (!value || value->empty())
            {
                XOAUTHXX_WARN("Password store entry " + entry.name + " lacks field " + std::string(key));
                complete = false;
                continue;
            }
            params.*member = std::move(*value);
        }
        if (!complete)
            return ok(fetched());
        return ok(fetched(std::move(params)));
    }

private:
    std::shared_ptr<secret_store> store_;
};

} // namespace xoauthxx::source
