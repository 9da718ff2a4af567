#ifndef SPVD_UTILS_HPP
#define SPVD_UTILS_HPP
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/exception/exception.hpp>

namespace spvd {

    void get_random_bytes(std::size_t num_bytes, void* output_bytes, std::size_t siz);

    template <std::size_t N> std::array<unsigned char, N> get_random_bytes()
    {
        std::array<unsigned char, N> buff{ { 0 } };
        get_random_bytes(N, buff.data(), buff.size());
        return buff;
    }

    bool nsee_log_info(std::string message, const char* context);

    template <typename F> bool no_std_exception_escape(F&& fn, const char* context = "") noexcept
    {
        std::string message;
        try {
            fn();
            return false;
        } catch (const boost::exception& e) {
            try {
                message = diagnostic_information(e);
            } catch (const std::exception&) {
            }
        } catch (const std::exception& e) {
            try {
                message = e.what();
            } catch (const std::exception&) {
            }
        }
        return nsee_log_info(message, context);
    }

} // namespace spvd

#endif
