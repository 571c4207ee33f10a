#pragma once

#include <iostream>
#include <xoauthxx/detail/result.hpp>

inline void print_error(const xoauthxx::error_info& err)
{
    std::cerr << "Error: " << xoauthxx::to_string(err.code) << " - " << err.message << "\n";
    if (!err.detail.empty())
        std::cerr << "Detail: " << err.detail << "\n";
    if (err.sys)
        std::cerr << "Sys: " << err.sys.message() << "\n";
    std::cerr << "Where: " << err.where.file_name() << ":" << err.where.line()
              << " " << err.where.function_name() << "\n";
}
