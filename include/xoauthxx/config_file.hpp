/*

config_file.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

JSON settings file for tools built on the resolver:

    {
        "source": {"kind": "file", "path": "/home/me/.xoauth2.json.gpg"},
        "use_curl": false,
        "curl_program": "curl",
        "tls": {"verify": true, "verify_host": true, "min_version": "1.2", "ca_files": [], "ca_paths": []},
        "log_level": "info"
    }

Source kinds are "static" (the record fields inline), "file" ("path", optional "gpg_program") and "pass"
(optional "pass_program").

*/

#pragma once

#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <json/json.h>
#include <openssl/ssl.h>

#include <xoauthxx/detail/error_detail.hpp>
#include <xoauthxx/detail/log.hpp>
#include <xoauthxx/detail/result.hpp>
#include <xoauthxx/resolver.hpp>
#include <xoauthxx/source/credential_source.hpp>

namespace xoauthxx
{

struct settings
{
    resolver_config resolver;
    std::optional<log::level> log_level;
};

namespace detail
{

[[nodiscard]] inline result<std::string> settings_string(const Json::Value& object, const char* name,
    const std::string& origin, bool required)
{
    const Json::Value& member = object[name];
    if (member.isNull())
    {
        if (required)
        {
            return fail<std::string>(errc::config_missing_field, "Settings lack a required field.",
                error_detail().add("path", origin).add("field", name).str());
        }
        return ok(std::string());
    }
    if (!member.isString())
    {
        return fail<std::string>(errc::config_invalid, "Settings field must be a string.",
            error_detail().add("path", origin).add("field", name).str());
    }
    return ok(member.asString());
}

[[nodiscard]] inline result<bool> settings_bool(const Json::Value& object, const char* name,
    const std::string& origin, bool fallback)
{
    const Json::Value& member = object[name];
    if (member.isNull())
        return ok(fallback);
    if (!member.isBool())
    {
        return fail<bool>(errc::config_invalid, "Settings field must be a boolean.",
            error_detail().add("path", origin).add("field", name).str());
    }
    return ok(member.asBool());
}

[[nodiscard]] inline result<std::vector<std::string>> settings_strings(const Json::Value& object, const char* name,
    const std::string& origin)
{
    std::vector<std::string> values;
    const Json::Value& member = object[name];
    if (member.isNull())
        return ok(std::move(values));
    if (!member.isArray())
    {
        return fail<std::vector<std::string>>(errc::config_invalid, "Settings field must be an array of strings.",
            error_detail().add("path", origin).add("field", name).str());
    }
    for (const auto& element : member)
    {
        if (!element.isString())
        {
            return fail<std::vector<std::string>>(errc::config_invalid,
                "Settings field must be an array of strings.",
                error_detail().add("path", origin).add("field", name).str());
        }
        values.push_back(element.asString());
    }
    return ok(std::move(values));
}

[[nodiscard]] inline result<source::credential_source> settings_source(const Json::Value& src,
    const std::string& origin)
{
    if (!src.isObject())
    {
        return fail<source::credential_source>(errc::config_missing_field, "Settings lack a credential source.",
            error_detail().add("path", origin).add("field", "source").str());
    }

    const std::string kind = XOAUTHXX_TRY(settings_string(src, "kind", origin, true));
    if (kind == "static")
    {
        oauth2::client_params params;
        params.token_url = XOAUTHXX_TRY(settings_string(src, "token_url", origin, true));
        params.client_id = XOAUTHXX_TRY(settings_string(src, "client_id", origin, true));
        params.client_secret = XOAUTHXX_TRY(settings_string(src, "client_secret", origin, true));
        params.refresh_token = XOAUTHXX_TRY(settings_string(src, "refresh_token", origin, true));
        const std::string user = XOAUTHXX_TRY(settings_string(src, "user", origin, false));
        if (!user.empty())
            params.user_override = user;
        return ok(source::credential_source::from_params(std::move(params)));
    }
    if (kind == "file")
    {
        std::string path = XOAUTHXX_TRY(settings_string(src, "path", origin, true));
        std::string program = XOAUTHXX_TRY(settings_string(src, "gpg_program", origin, false));
        if (program.empty())
            program = "gpg";
        return ok(source::credential_source::from_file(std::move(path),
            std::make_shared<source::gpg_decryptor>(std::move(program))));
    }
    if (kind == "pass")
    {
        std::string program = XOAUTHXX_TRY(settings_string(src, "pass_program", origin, false));
        if (program.empty())
            program = "pass";
        return ok(source::credential_source::from_store(std::make_shared<source::pass_store>(std::move(program))));
    }
    return fail<source::credential_source>(errc::config_invalid, "Unknown credential source kind.",
        error_detail().add("path", origin).add("kind", kind).str());
}

[[nodiscard]] inline result<net::tls_options> settings_tls(const Json::Value& tls, const std::string& origin)
{
    net::tls_options options;
    if (tls.isNull())
        return ok(std::move(options));
    if (!tls.isObject())
    {
        return fail<net::tls_options>(errc::config_invalid, "Settings field must be an object.",
            error_detail().add("path", origin).add("field", "tls").str());
    }

    const bool verify = XOAUTHXX_TRY(settings_bool(tls, "verify", origin, true));
    options.verify = verify ? net::verify_mode::peer : net::verify_mode::none;
    options.verify_host = XOAUTHXX_TRY(settings_bool(tls, "verify_host", origin, true));
    options.use_default_verify_paths = XOAUTHXX_TRY(settings_bool(tls, "default_verify_paths", origin, true));
    options.ca_files = XOAUTHXX_TRY(settings_strings(tls, "ca_files", origin));
    options.ca_paths = XOAUTHXX_TRY(settings_strings(tls, "ca_paths", origin));

    const std::string min_version = XOAUTHXX_TRY(settings_string(tls, "min_version", origin, false));
    if (min_version == "1.2")
        options.min_tls_version = TLS1_2_VERSION;
    else if (min_version == "1.3")
        options.min_tls_version = TLS1_3_VERSION;
    else if (!min_version.empty())
    {
        return fail<net::tls_options>(errc::config_invalid, "Unsupported minimum TLS version.",
            error_detail().add("path", origin).add("min_version", min_version).str());
    }
    return ok(std::move(options));
}

} // namespace detail

/**
Parse settings text.

@param text   JSON document.
@param origin Where the text came from, for diagnostics.
@return       Settings, or `config_parse_failed`, `config_invalid` or `config_missing_field`.
**/
[[nodiscard]] inline result<settings> parse_settings(const std::string& text, const std::string& origin)
{
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream in(text);
    if (!Json::parseFromStream(builder, in, &root, &errors))
    {
        return fail<settings>(errc::config_parse_failed, "Settings file is not valid JSON.",
            detail::error_detail().add("path", origin).add("reason", errors).str());
    }
    if (!root.isObject())
    {
        return fail<settings>(errc::config_invalid, "Settings file must hold an object.",
            detail::error_detail().add("path", origin).str());
    }

    settings out;
    out.resolver.source = XOAUTHXX_TRY(detail::settings_source(root["source"], origin));
    out.resolver.use_curl = XOAUTHXX_TRY(detail::settings_bool(root, "use_curl", origin, false));
    const std::string curl_program = XOAUTHXX_TRY(detail::settings_string(root, "curl_program", origin, false));
    if (!curl_program.empty())
        out.resolver.curl.program = curl_program;
    out.resolver.tls = XOAUTHXX_TRY(detail::settings_tls(root["tls"], origin));

    const std::string level_name = XOAUTHXX_TRY(detail::settings_string(root, "log_level", origin, false));
    if (!level_name.empty())
    {
        out.log_level = log::level_from_string(level_name);
        if (!out.log_level)
        {
            return fail<settings>(errc::config_invalid, "Unknown log level.",
                detail::error_detail().add("path", origin).add("log_level", level_name).str());
        }
    }
    return ok(std::move(out));
}

[[nodiscard]] inline result<settings> load_settings(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        return fail<settings>(errc::config_invalid, "Cannot open settings file.",
            detail::error_detail().add("path", path).str());
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    XOAUTHXX_DEBUG("Loaded settings from " + path);
    return parse_settings(contents.str(), path);
}

} // namespace xoauthxx
