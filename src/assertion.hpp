#ifndef SPVD_ASSERTION_HPP
#define SPVD_ASSERTION_HPP
#pragma once

#include <string>

namespace spvd {
    [[noreturn]] void runtime_assert_message(const std::string& error_message, const char* file, unsigned int line);
    [[noreturn]] void throw_user_error(const std::string& error_message);
} // namespace spvd

#ifdef __FILE_NAME__
#define SPVD_RUNTIME_ASSERT_MSG(condition, error_message)                                                              \
    do {                                                                                                               \
        if (!(condition)) {                                                                                            \
            spvd::runtime_assert_message(error_message, __FILE_NAME__, __LINE__);                                      \
        }                                                                                                              \
    } while (false)
#else
#define SPVD_RUNTIME_ASSERT_MSG(condition, error_message)                                                              \
    do {                                                                                                               \
        if (!(condition)) {                                                                                            \
            spvd::runtime_assert_message(error_message, __FILE__, __LINE__);                                           \
        }                                                                                                              \
    } while (false)
#endif
#define SPVD_RUNTIME_ASSERT(condition) SPVD_RUNTIME_ASSERT_MSG(condition, std::string())
#define SPVD_USER_ASSERT(condition, error_message)                                                                     \
    do {                                                                                                               \
        if (!(condition)) {                                                                                            \
            spvd::throw_user_error(error_message);                                                                     \
        }                                                                                                              \
    } while (false)
#define SPVD_VERIFY(x) SPVD_RUNTIME_ASSERT((x) == WALLY_OK)

#endif
