/*

static_source.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <string>
#include <utility>

#include <xoauthxx/detail/result.hpp>
#include <xoauthxx/oauth2/client_params.hpp>
#include <xoauthxx/source/identity.hpp>

namespace xoauthxx::source
{

/**
One literal set of client parameters answering every query.

Its `user_override` is the identity used when the query carries no user.
**/
class static_source
{
public:
    explicit static_source(oauth2::client_params params)
        : params_(std::move(params))
    {
    }

    [[nodiscard]] result<std::optional<oauth2::client_params>> fetch(const identity&) const
    {
        if (const auto field = params_.missing_field())
        {
            return fail<std::optional<oauth2::client_params>>(errc::config_missing_field,
                "Static credentials lack a required field.", "field=" + std::string(*field));
        }
        return ok(std::optional<oauth2::client_params>(params_));
    }

    [[nodiscard]] const oauth2::client_params& params() const noexcept
    {
        return params_;
    }

private:
    oauth2::client_params params_;
};

} // namespace xoauthxx::source
