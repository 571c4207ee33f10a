/*

curl_transport.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

HTTP POST through the external curl program.

*/

#pragma once

#include <string>
#include <utility>
#include <vector>

#include <xoauthxx/detail/error_detail.hpp>
#include <xoauthxx/detail/log.hpp>
#include <xoauthxx/detail/result.hpp>
#include <xoauthxx/detail/subprocess.hpp>
#include <xoauthxx/http/transport.hpp>

namespace xoauthxx::http
{

struct curl_options
{
    /// Program name or path, looked up in PATH.
    std::string program = "curl";
};

class curl_transport : public transport
{
public:
    explicit curl_transport(curl_options options = {})
        : options_(std::move(options))
    {
    }

    /**
    Command line for one POST; `--fail` is not used so error bodies reach the caller.
    **/
    [[nodiscard]] std::vector<std::string> command_line(const std::string& url, const std::string& body,
        const headers& hdrs) const
    {
        std::vector<std::string> argv{options_.program, "--silent", "--show-error", "--request", "POST"};
        for (const auto& [name, value] : hdrs)
        {
            argv.emplace_back("--header");
            argv.push_back(name + ": " + value);
        }
        argv.emplace_back("--data-raw");
        argv.push_back(body);
        argv.emplace_back("--");
        argv.push_back(url);
        return argv;
    }

    [[nodiscard]] result<std::string> post(const std::string& url, const std::string& body,
        const headers& hdrs) override
    {
        auto valid = validate_headers(hdrs);
        if (!valid)
            return fail<std::string>(std::move(valid).error());

        XOAUTHXX_DEBUG("Running " + options_.program + " POST " + url);
        auto run = detail::run_command(command_line(url, body, hdrs));
        if (!run)
            return fail<std::string>(std::move(run).error());

        detail::process_output output = std::move(*run);
        if (!output.succeeded())
        {
            return fail<std::string>(errc::http_request_failed, "HTTP request through curl failed.",
                detail::error_detail()
                    .add("url", url)
                    .add("program", options_.program)
                    .add_int("exit_status", output.exit_status)
                    .str());
        }
        return ok(std::move(output.out));
    }

private:
    curl_options options_;
};

} // namespace xoauthxx::http
