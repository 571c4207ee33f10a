/*

file_source.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Credentials kept in an encrypted JSON file.

The plaintext is either one record

    {"token_url": "...", "client_id": "...", "client_secret": "...", "refresh_token": "...", "user": "..."}

answering every query, or an array of records each keyed by "host", "user" and "port".

*/

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <json/json.h>

#include <xoauthxx/detail/error_detail.hpp>
#include <xoauthxx/detail/log.hpp>
#include <xoauthxx/detail/result.hpp>
#include <xoauthxx/detail/subprocess.hpp>
#include <xoauthxx/oauth2/client_params.hpp>
#include <xoauthxx/source/identity.hpp>

namespace xoauthxx::detail
{

[[nodiscard]] inline result<std::string> json_string_member(const Json::Value& object, const char* name,
    const std::string& path, bool required)
{
    const Json::Value& member = object[name];
    if (member.isNull())
    {
        if (!required)
            return ok(std::string());
        return fail<std::string>(errc::config_missing_field, "Credentials record lacks a required field.",
            error_detail().add("path", path).add("field", name).str());
    }
    if (member.isString())
        return ok(member.asString());
    // Integers only; `993.0` would render as "993.0" and never match a port.
    if (member.type() == Json::intValue || member.type() == Json::uintValue)
        return ok(member.asString());
    return fail<std::string>(errc::config_parse_failed, "Credentials field is not a string or an integer.",
        error_detail().add("path", path).add("field", name).str());
}

[[nodiscard]] inline result<oauth2::client_params> parse_record(const Json::Value& object, const std::string& path)
{
    if (!object.isObject())
    {
        return fail<oauth2::client_params>(errc::config_parse_failed, "Credentials record is not an object.",
            error_detail().add("path", path).str());
    }

    oauth2::client_params params;
    params.token_url = XOAUTHXX_TRY(json_string_member(object, "token_url", path, true));
    params.client_id = XOAUTHXX_TRY(json_string_member(object, "client_id", path, true));
    params.client_secret = XOAUTHXX_TRY(json_string_member(object, "client_secret", path, true));
    params.refresh_token = XOAUTHXX_TRY(json_string_member(object, "refresh_token", path, true));
    if (const auto field = params.missing_field())
    {
        return fail<oauth2::client_params>(errc::config_missing_field, "Credentials record has an empty field.",
            error_detail().add("path", path).add("field", *field).str());
    }
    return ok(std::move(params));
}

} // namespace xoauthxx::detail

namespace xoauthxx::source
{

/// Suffix every credentials file must carry.
inline constexpr std::string_view ENCRYPTED_FILE_SUFFIX = ".gpg";

/// Turns an encrypted file into its plaintext.
class decryptor
{
public:
    virtual ~decryptor() = default;

    [[nodiscard]] virtual result<std::string> decrypt(const std::string& path) = 0;
};

/// Runs `gpg --quiet --batch --decrypt -- <path>`; the agent supplies the passphrase.
class gpg_decryptor : public decryptor
{
public:
    explicit gpg_decryptor(std::string program = "gpg")
        : program_(std::move(program))
    {
    }

    [[nodiscard]] result<std::string> decrypt(const std::string& path) override
    {
        auto output = detail::run_command({program_, "--quiet", "--batch", "--decrypt", "--", path});
        if (!output)
        {
            auto err = std::move(output).error();
            return fail<std::string>(errc::config_decrypt_failed, "Cannot decrypt credentials file.",
                detail::error_detail().add("path", path).add("reason", err.message).str(), err.sys);
        }
        if (!output->succeeded())
        {
            return fail<std::string>(errc::config_decrypt_failed, "Cannot decrypt credentials file.",
                detail::error_detail().add("path", path).add("program", program_)
                    .add_int("exit_status", output->exit_status).str());
        }
        return ok(std::move(output->out));
    }

private:
    std::string program_;
};

/**
Parsed plaintext of a credentials file.

Lookups in a mapping are exact on (host, user, port).
**/
class credentials_file
{
public:
    using mapping = std::map<identity, oauth2::client_params>;

    credentials_file() = default;

    explicit credentials_file(oauth2::client_params single)
        : contents_(std::move(single))
    {
    }

    explicit credentials_file(mapping entries)
        : contents_(std::move(entries))
    {
    }

    [[nodiscard]] bool is_mapping() const noexcept
    {
        return std::holds_alternative<mapping>(contents_);
    }

    [[nodiscard]] std::optional<oauth2::client_params> lookup(const identity& id) const
    {
        if (const auto* single = std::get_if<oauth2::client_params>(&contents_))
            return *single;

        const auto& entries = std::get<mapping>(contents_);
        const auto it = entries.find(id);
        if (it == entries.end())
            return std::nullopt;
        return it->second;
    }

private:
    std::variant<oauth2::client_params, mapping> contents_;
};

/**
Parse the plaintext of a credentials file.

@param plaintext Decrypted file contents.
@param path      File the contents came from, for diagnostics.
@return          Single record or mapping; `config_parse_failed`, `config_missing_field` or
                 `config_duplicate_entry` otherwise.
**/
[[nodiscard]] inline result<credentials_file> parse_credentials(const std::string& plaintext, const std::string& path)
{
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream in(plaintext);
    if (!Json::parseFromStream(builder, in, &root, &errors))
    {
        return fail<credentials_file>(errc::config_parse_failed, "Credentials file is not valid JSON.",
            detail::error_detail().add("path", path).add("reason", errors).str());
    }

    if (root.isObject())
    {
        auto params = XOAUTHXX_TRY(detail::parse_record(root, path));
        const auto user = XOAUTHXX_TRY(detail::json_string_member(root, "user", path, false));
        if (!user.empty())
            params.user_override = user;
        return ok(credentials_file(std::move(params)));
    }

    if (!root.isArray())
    {
        return fail<credentials_file>(errc::config_parse_failed,
            "Credentials file must hold an object or an array.",
            detail::error_detail().add("path", path).str());
    }

    credentials_file::mapping entries;
    for (const auto& element : root)
    {
        auto params = XOAUTHXX_TRY(detail::parse_record(element, path));
        identity key;
        key.host = XOAUTHXX_TRY(detail::json_string_member(element, "host", path, true));
        key.user = XOAUTHXX_TRY(detail::json_string_member(element, "user", path, true));
        key.port = XOAUTHXX_TRY(detail::json_string_member(element, "port", path, true));
        params.user_override = key.user;

        const std::string key_text = to_string(key);
        if (!entries.emplace(std::move(key), std::move(params)).second)
        {
            return fail<credentials_file>(errc::config_duplicate_entry, "Duplicate entry in credentials file.",
                detail::error_detail().add("path", path).add("key", key_text).str());
        }
    }
    return ok(credentials_file(std::move(entries)));
}

/**
Credentials read from an encrypted file.

The file is decrypted and parsed by every `load()`; a resolver loads once per resolution and reuses the
result for all its candidates.
**/
class file_source
{
public:
    explicit file_source(std::string path, std::shared_ptr<decryptor> dec = std::make_shared<gpg_decryptor>())
        : path_(std::move(path)), decryptor_(std::move(dec))
    {
    }

    [[nodiscard]] const std::string& path() const noexcept
    {
        return path_;
    }

    [[nodiscard]] result<credentials_file> load() const
    {
        if (!path_.ends_with(ENCRYPTED_FILE_SUFFIX))
        {
            return fail<credentials_file>(errc::config_invalid_extension,
                "Credentials file must be encrypted.",
                detail::error_detail().add("path", path_)
                    .add("expected_suffix", ENCRYPTED_FILE_SUFFIX).str());
        }
        if (!decryptor_)
            return fail<credentials_file>(errc::config_invalid, "No decryptor configured.");

        auto plaintext = decryptor_->decrypt(path_);
        if (!plaintext)
            return fail<credentials_file>(std::move(plaintext).error());

        XOAUTHXX_DEBUG("Decrypted credentials file " + path_);
        return parse_credentials(*plaintext, path_);
    }

    [[nodiscard]] result<std::optional<oauth2::client_params>> fetch(const identity& id) const
    {
        auto file = load();
        if (!file)
            return fail<std::optional<oauth2::client_params>>(std::move(file).error());
        return ok(file->lookup(id));
    }

private:
    std::string path_;
    std::shared_ptr<decryptor> decryptor_;
};

} // namespace xoauthxx::source
