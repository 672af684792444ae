#pragma once

#include <iostream>
#include <imapxx/detail/result.hpp>

inline void print_error(const imapxx::error& err)
{
    std::cout << "Error: " << imapxx::error_code_to_string(err.code()) << " - " << err.message() << "\n";
    if (!err.server_response().empty())
        std::cout << "Server: " << err.server_response() << "\n";
}
