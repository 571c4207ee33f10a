/*

function_source.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>

#include <xoauthxx/detail/log.hpp>
#include <xoauthxx/detail/result.hpp>
#include <xoauthxx/oauth2/client_params.hpp>
#include <xoauthxx/source/identity.hpp>

namespace xoauthxx::source
{

/**
Delegates matching to a user supplied function of (host, user, port).

The function may match however it likes. An empty optional, or parameters with an empty required field, mean
no match.
**/
class function_source
{
public:
    using lookup_fn = std::function<std::optional<oauth2::client_params>(
        const std::string& host, const std::string& user, const std::string& port)>;

    explicit function_source(lookup_fn fn)
        : fn_(std::move(fn))
    {
    }

    [[nodiscard]] result<std::optional<oauth2::client_params>> fetch(const identity& id) const
    {
        if (!fn_)
            return fail<std::optional<oauth2::client_params>>(errc::config_invalid, "Credential function is empty.");

        auto params = fn_(id.host, id.user, id.port);
        if (!params)
            return ok(std::optional<oauth2::client_params>());
        if (const auto field = params->missing_field())
        {
            XOAUTHXX_DEBUG("Credential function result for " + to_string(id) + " lacks " + std::string(*field));
            return ok(std::optional<oauth2::client_params>());
        }
        return ok(std::move(params));
    }

private:
    lookup_fn fn_;
};

} // namespace xoauthxx::source
