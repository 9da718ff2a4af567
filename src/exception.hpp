#ifndef SPVD_EXCEPTION_HPP
#define SPVD_EXCEPTION_HPP
#pragma once

#include <stdexcept>
#include <string>

namespace spvd {

    // Raised through SPVD_RUNTIME_ASSERT; indicates a programming or
    // configuration defect rather than a bad request
    class assertion_error : public std::runtime_error {
    public:
        explicit assertion_error(const std::string& what)
            : std::runtime_error(what)
        {
        }
    };

    class user_error : public std::runtime_error {
    public:
        explicit user_error(const std::string& what)
            : std::runtime_error(what)
        {
        }
    };

    // A named account, address or transaction does not exist
    class not_found_error : public user_error {
    public:
        explicit not_found_error(const std::string& what)
            : user_error(what)
        {
        }
    };

    // A fault reported by the wallet store (connection, constraint, query)
    class storage_error : public std::runtime_error {
    public:
        explicit storage_error(const std::string& what)
            : std::runtime_error(what)
        {
        }
    };

} // namespace spvd

#endif
