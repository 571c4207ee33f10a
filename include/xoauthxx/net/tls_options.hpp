/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <openssl/ssl.h>

#include <xoauthxx/detail/asio_decl.hpp>
#include <xoauthxx/detail/error_detail.hpp>
#include <xoauthxx/detail/result.hpp>

namespace xoauthxx::net
{

enum class verify_mode
{
    none,
    peer
};

/// TLS settings of the built-in HTTPS client.
struct tls_options
{
    verify_mode verify = verify_mode::peer;
    bool verify_host = true;
    std::optional<int> min_tls_version = TLS1_2_VERSION;
    bool use_default_verify_paths = true;
    std::vector<std::string> ca_files;
    std::vector<std::string> ca_paths;
};

/**
Load the trust store and protocol floor into a client context.
**/
inline result_void configure_context(xoauthxx::asio::ssl::context& ctx, const tls_options& options)
{
    xoauthxx::asio::error_code ec;
    if (options.use_default_verify_paths)
    {
        ctx.set_default_verify_paths(ec);
        if (ec)
            return fail<void>(errc::http_tls_failed, "TLS trust store configuration failed.", ec.message(), ec);
    }

    for (const auto& file : options.ca_files)
    {
        if (file.empty())
            continue;
        ctx.load_verify_file(file, ec);
        if (ec)
        {
            return fail<void>(errc::http_tls_failed, "TLS trust store configuration failed.",
                detail::error_detail().add("ca_file", file).str(), ec);
        }
    }

    for (const auto& path : options.ca_paths)
    {
        if (path.empty())
            continue;
        ctx.add_verify_path(path, ec);
        if (ec)
        {
            return fail<void>(errc::http_tls_failed, "TLS trust store configuration failed.",
                detail::error_detail().add("ca_path", path).str(), ec);
        }
    }

    if (options.min_tls_version
        && SSL_CTX_set_min_proto_version(ctx.native_handle(), *options.min_tls_version) != 1)
    {
        return fail<void>(errc::http_tls_failed, "Unsupported minimum TLS version.");
    }
    return ok();
}

} // namespace xoauthxx::net
