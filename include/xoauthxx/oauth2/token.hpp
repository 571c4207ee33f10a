/*

token.hpp
---------

OAuth2 token endpoint answer. Lives for one lookup only.

*/

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace xoauthxx::oauth2
{

struct token
{
    std::string access_token;
    std::string token_type;
    std::string scope;
    /// Computed from `expires_in` when the endpoint sent one.
    std::optional<std::chrono::system_clock::time_point> expires_at;
};

} // namespace xoauthxx::oauth2
