/*

credential_source.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Closed set of credential sources behind one lookup.

*/

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <xoauthxx/detail/result.hpp>
#include <xoauthxx/oauth2/client_params.hpp>
#include <xoauthxx/source/file_source.hpp>
#include <xoauthxx/source/function_source.hpp>
#include <xoauthxx/source/identity.hpp>
#include <xoauthxx/source/password_store_source.hpp>
#include <xoauthxx/source/static_source.hpp>

namespace xoauthxx::source
{

/**
The configured credential source.

The alternative is chosen once, when the source is built; a default constructed source has none and fails every
lookup with `config_invalid`.
**/
class credential_source
{
public:
    using fetch_result = result<std::optional<oauth2::client_params>>;

    /// Lookup bound to one opened source.
    using lookup = std::function<fetch_result(const identity&)>;

    credential_source() = default;

    credential_source(static_source src)
        : source_(std::move(src))
    {
    }

    credential_source(function_source src)
        : source_(std::move(src))
    {
    }

    credential_source(file_source src)
        : source_(std::move(src))
    {
    }

    credential_source(password_store_source src)
        : source_(std::move(src))
    {
    }

    [[nodiscard]] static credential_source from_params(oauth2::client_params params)
    {
        return credential_source(static_source(std::move(params)));
    }

    [[nodiscard]] static credential_source from_function(function_source::lookup_fn fn)
    {
        return credential_source(function_source(std::move(fn)));
    }

    [[nodiscard]] static credential_source from_file(std::string path,
        std::shared_ptr<decryptor> dec = std::make_shared<gpg_decryptor>())
    {
        return credential_source(file_source(std::move(path), std::move(dec)));
    }

    [[nodiscard]] static credential_source from_store(std::shared_ptr<secret_store> store = std::make_shared<pass_store>())
    {
        return credential_source(password_store_source(std::move(store)));
    }

    [[nodiscard]] bool configured() const noexcept
    {
        return !std::holds_alternative<std::monostate>(source_);
    }

    [[nodiscard]] std::string_view kind() const noexcept
    {
        return std::visit([](const auto& src) -> std::string_view
        {
            using source_type = std::decay_t<decltype(src)>;
            if constexpr (std::is_same_v<source_type, static_source>)
                return "static";
            else if constexpr (std::is_same_v<source_type, function_source>)
                return "function";
            else if constexpr (std::is_same_v<source_type, file_source>)
                return "file";
            else if constexpr (std::is_same_v<source_type, password_store_source>)
                return "pass";
            else
                return "none";
        }, source_);
    }

    /**
    Prepare the source for a series of lookups.

    A credentials file is decrypted and parsed here, once; the returned lookup answers from the parsed contents.
    Other sources are queried on every lookup.

    @return Lookup for candidate identities, or the configuration error that prevents any.
    **/
    [[nodiscard]] result<lookup> open() const
    {
        if (const auto* file = std::get_if<file_source>(&source_))
        {
            auto loaded = file->load();
            if (!loaded)
                return fail<lookup>(std::move(loaded).error());

            auto contents = std::make_shared<const credentials_file>(std::move(*loaded));
            return ok(lookup([contents](const identity& id) -> fetch_result
            {
                return ok(contents->lookup(id));
            }));
        }

        if (std::holds_alternative<std::monostate>(source_))
            return fail<lookup>(errc::config_invalid, "No credential source configured.");

        auto src = source_;
        return ok(lookup([src = std::move(src)](const identity& id) -> fetch_result
        {
            return fetch_from(src, id);
        }));
    }

    /// One lookup; a credentials file is decrypted for this call alone.
    [[nodiscard]] fetch_result fetch(const identity& id) const
    {
        if (std::holds_alternative<std::monostate>(source_))
            return fail<std::optional<oauth2::client_params>>(errc::config_invalid, "No credential source configured.");
        return fetch_from(source_, id);
    }

private:
    using variant_type = std::variant<std::monostate, static_source, function_source, file_source,
        password_store_source>;

    static fetch_result fetch_from(const variant_type& src, const identity& id)
    {
        return std::visit([&id](const auto& alternative) -> fetch_result
        {
            using source_type = std::decay_t<decltype(alternative)>;
            if constexpr (std::is_same_v<source_type, std::monostate>)
                return fail<std::optional<oauth2::client_params>>(errc::config_invalid, "No credential source configured.");
            else
                return alternative.fetch(id);
        }, src);
    }

    variant_type source_;
};

} // namespace xoauthxx::source
