/*

subprocess.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Blocking execution of an external program with its standard output captured.
Used by the curl transport, the gpg decryptor and the pass secret store.

*/

#pragma once

#include <array>
#include <cerrno>
#include <cstdio>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <sys/wait.h>

#include <xoauthxx/detail/error_detail.hpp>
#include <xoauthxx/detail/result.hpp>

namespace xoauthxx::detail
{

/// Exit status reported by the shell when the program could not be found.
inline constexpr int EXIT_COMMAND_NOT_FOUND = 127;

struct process_output
{
    int exit_status = 0;
    std::string out;

    [[nodiscard]] bool succeeded() const noexcept
    {
        return exit_status == 0;
    }
};

/// Single-quote an argument for /bin/sh; embedded quotes become '\''.
[[nodiscard]] inline std::string shell_quote(std::string_view arg)
{
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted += '\'';
    for (char ch : arg)
    {
        if (ch == '\'')
            quoted += "'\\''";
        else
            quoted += ch;
    }
    quoted += '\'';
    return quoted;
}

[[nodiscard]] inline std::string build_command_line(const std::vector<std::string>& argv)
{
    std::string command;
    for (const auto& arg : argv)
    {
        if (!command.empty())
            command += ' ';
        command += shell_quote(arg);
    }
    return command;
}

/**
Run a program and capture its standard output.

Standard error is inherited. A non-zero exit status is not an error at this level: callers decide what it means
(a miss in a secret store, a failed HTTP request, ...). Only the failure to spawn or reap the process is.

@param argv Program followed by its arguments; argv[0] is looked up in PATH.
@return     Exit status and captured output, or `process_failed`.
**/
[[nodiscard]] inline result<process_output> run_command(const std::vector<std::string>& argv)
{
    if (argv.empty() || argv.front().empty())
        return fail<process_output>(errc::invalid_argument, "Empty command line.");

    const std::string command = build_command_line(argv);
    FILE* pipe = ::popen(command.c_str(), "r");
    if (pipe == nullptr)
    {
        const std::error_code ec(errno, std::generic_category());
        return fail<process_output>(errc::process_failed, "Failed to start program.",
            error_detail().add("program", argv.front()).str(), ec);
    }

    process_output output;
    std::array<char, 4096> buffer;
    std::size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0)
        output.out.append(buffer.data(), n);

    const int status = ::pclose(pipe);
    if (status == -1)
    {
        const std::error_code ec(errno, std::generic_category());
        return fail<process_output>(errc::process_failed, "Failed to wait for program.",
            error_detail().add("program", argv.front()).str(), ec);
    }

    if (WIFEXITED(status))
        output.exit_status = WEXITSTATUS(status);
    else
        output.exit_status = -1;

    if (output.exit_status == EXIT_COMMAND_NOT_FOUND)
    {
        return fail<process_output>(errc::process_failed, "Program not found.",
            error_detail().add("program", argv.front()).str());
    }
    return ok(std::move(output));
}

} // namespace xoauthxx::detail
