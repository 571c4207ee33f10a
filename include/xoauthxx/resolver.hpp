/*

resolver.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Turns a (host, user, port) query into a live XOAUTH2 credential.

*/

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <xoauthxx/auth_record.hpp>
#include <xoauthxx/detail/log.hpp>
#include <xoauthxx/detail/result.hpp>
#include <xoauthxx/http/asio_transport.hpp>
#include <xoauthxx/http/curl_transport.hpp>
#include <xoauthxx/http/transport.hpp>
#include <xoauthxx/net/tls_options.hpp>
#include <xoauthxx/oauth2/token_endpoint.hpp>
#include <xoauthxx/source/credential_source.hpp>
#include <xoauthxx/source/identity.hpp>

namespace xoauthxx
{

struct resolver_config
{
    source::credential_source source;
    /// Use the external curl program instead of the built-in client.
    bool use_curl = false;
    http::curl_options curl;
    net::tls_options tls;
};

[[nodiscard]] inline std::shared_ptr<http::transport> make_transport(bool use_curl, http::curl_options curl = {},
    http::asio_options asio = {})
{
    if (use_curl)
        return std::make_shared<http::curl_transport>(std::move(curl));
    return std::make_shared<http::asio_transport>(std::move(asio));
}

[[nodiscard]] inline std::shared_ptr<http::transport> make_transport(const resolver_config& config)
{
    http::asio_options asio;
    asio.tls = config.tls;
    return make_transport(config.use_curl, config.curl, std::move(asio));
}

/**
Resolves credentials for candidate hosts and ports.

Nothing is cached: every successful resolution performs a fresh token refresh. The configuration is read-only
after construction, so concurrent `resolve` calls are independent.
**/
class credential_resolver
{
public:
    explicit credential_resolver(resolver_config config)
        : config_(std::move(config)), endpoint_(make_transport(config_))
    {
    }

    credential_resolver(resolver_config config, std::shared_ptr<http::transport> transport)
        : config_(std::move(config)), endpoint_(std::move(transport))
    {
    }

    [[nodiscard]] const resolver_config& config() const noexcept
    {
        return config_;
    }

    /**
    Resolve the first candidate the source knows about.

    Hosts are walked in order and, for each host, ports in order. The first pair with a source match and an
    effective user gets its refresh token exchanged; a failed exchange is returned without probing further
    pairs. An empty candidate list counts as one empty candidate.

    @param hosts Candidate host names.
    @param user  Query user; when absent or empty the source's `user_override` is used.
    @param ports Candidate ports or service names.
    @return      Record of the first match, `std::nullopt` when no pair matches, or the error that stopped the
                 resolution.
    **/
    [[nodiscard]] result<std::optional<auth_record>> resolve(const std::vector<std::string>& hosts,
        const std::optional<std::string>& user, const std::vector<std::string>& ports) const
    {
        using resolved = std::optional<auth_record>;

        auto lookup = config_.source.open();
        if (!lookup)
            return fail<resolved>(std::move(lookup).error());

        static const std::vector<std::string> unspecified{std::string()};
        const auto& host_candidates = hosts.empty() ? unspecified : hosts;
        const auto& port_candidates = ports.empty() ? unspecified : ports;
        const std::string query_user = user.value_or(std::string());

        for (const auto& host : host_candidates)
        {
            for (const auto& port : port_candidates)
            {
                const source::identity id{host, query_user, port};
                auto fetched = (*lookup)(id);
                if (!fetched)
                    return fail<resolved>(std::move(fetched).error());
                if (!fetched->has_value())
                {
                    XOAUTHXX_TRACE("No credentials for " + source::to_string(id));
                    continue;
                }

                const oauth2::client_params& params = **fetched;
                std::string effective_user = query_user;
                if (effective_user.empty() && params.user_override)
                    effective_user = *params.user_override;
                if (effective_user.empty())
                {
                    XOAUTHXX_DEBUG("Credentials for " + host + ":" + port + " name no user, skipped.");
                    continue;
                }

                auto tok = oauth2::token_endpoint_client(endpoint_).refresh(params);
                if (!tok)
                {
                    XOAUTHXX_ERROR("Token refresh for " + effective_user + "@" + host + ":" + port + " failed: "
                        + tok.error().to_string());
                    return fail<resolved>(std::move(tok).error());
                }

                XOAUTHXX_DEBUG("Resolved XOAUTH2 credentials for " + effective_user + "@" + host + ":" + port);
                return ok(resolved(auth_record{host, port, std::move(effective_user), std::move(tok->access_token)}));
            }
        }
        return ok(resolved());
    }

    [[nodiscard]] result<std::optional<auth_record>> resolve(const std::string& host,
        const std::optional<std::string>& user, const std::string& port) const
    {
        return resolve(std::vector<std::string>{host}, user, std::vector<std::string>{port});
    }

private:
    resolver_config config_;
    std::shared_ptr<http::transport> endpoint_;
};

} // namespace xoauthxx
