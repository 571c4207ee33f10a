/*

xoauth2_token.cpp
-----------------

Resolves the XOAUTH2 credential of a mail account and prints the access token,
or the encoded SASL initial response with --sasl.

    xoauth2_token [--config FILE] [--curl] [--sasl] [--debug] HOST USER PORT...

Several ports may be given; they are probed in order. Exit status is 0 on
success, 1 when no credentials match, 2 on error and 64 on bad usage.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <xoauthxx/config_file.hpp>
#include <xoauthxx/detail/log.hpp>
#include <xoauthxx/detail/sasl.hpp>
#include <xoauthxx/resolver.hpp>
#include "example_util.hpp"


using std::cerr;
using std::cout;
using std::string;


namespace
{

constexpr int EXIT_NO_MATCH = 1;
constexpr int EXIT_ERROR = 2;
constexpr int EXIT_USAGE = 64;

struct arguments
{
    string config_path;
    bool use_curl = false;
    bool sasl = false;
    bool debug = false;
    string host;
    string user;
    std::vector<string> ports;
};

void usage(std::string_view program)
{
    cerr << "usage: " << program << " [--config FILE] [--curl] [--sasl] [--debug] HOST USER PORT...\n";
}

string default_config_path()
{
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0')
        return string(xdg) + "/xoauthxx/settings.json";
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0')
        return string(home) + "/.config/xoauthxx/settings.json";
    return "settings.json";
}

std::optional<arguments> parse_arguments(int argc, char* argv[])
{
    arguments args;
    std::vector<string> positional;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--config")
        {
            if (i + 1 >= argc)
                return std::nullopt;
            args.config_path = argv[++i];
        }
        else if (arg == "--curl")
            args.use_curl = true;
        else if (arg == "--sasl")
            args.sasl = true;
        else if (arg == "--debug")
            args.debug = true;
        else if (arg.starts_with("--"))
            return std::nullopt;
        else
            positional.emplace_back(arg);
    }

    if (positional.size() < 3)
        return std::nullopt;
    args.host = positional[0];
    args.user = positional[1];
    args.ports.assign(positional.begin() + 2, positional.end());
    if (args.config_path.empty())
        args.config_path = default_config_path();
    return args;
}

} // namespace


int main(int argc, char* argv[])
{
    const auto args = parse_arguments(argc, argv);
    if (!args)
    {
        usage(argc > 0 ? argv[0] : "xoauth2_token");
        return EXIT_USAGE;
    }

    auto loaded = xoauthxx::load_settings(args->config_path);
    if (!loaded)
    {
        print_error(loaded.error());
        return EXIT_ERROR;
    }
    xoauthxx::settings conf = std::move(*loaded);

    auto& logger = xoauthxx::log::logger::instance();
    if (conf.log_level)
        logger.set_level(*conf.log_level);
    if (args->debug)
        logger.set_level(xoauthxx::log::level::debug);
    if (args->use_curl)
        conf.resolver.use_curl = true;

    const xoauthxx::credential_resolver resolver(std::move(conf.resolver));
    auto resolved = resolver.resolve(std::vector<string>{args->host}, args->user, args->ports);
    if (!resolved)
    {
        print_error(resolved.error());
        return EXIT_ERROR;
    }
    if (!resolved->has_value())
    {
        cerr << "No credentials for " << args->user << "@" << args->host << "\n";
        return EXIT_NO_MATCH;
    }

    const xoauthxx::auth_record& record = **resolved;
    if (!args->sasl)
    {
        cout << record.secret << "\n";
        return EXIT_SUCCESS;
    }

    auto encoded = xoauthxx::sasl::encode_xoauth2(record.user, record.secret);
    if (!encoded)
    {
        print_error(encoded.error());
        return EXIT_ERROR;
    }
    cout << *encoded << "\n";
    return EXIT_SUCCESS;
}
