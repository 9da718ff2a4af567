#ifndef SPVD_JSON_UTILS_HPP
#define SPVD_JSON_UTILS_HPP
#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spvd {
    using json_array_t = std::vector<nlohmann::json>;

    // JSON fetch helpers:
    // j_fooref:      get a const reference to a foo (or by value for value types). Throw if not found.
    // j_foo:         get an optional<foo>, empty if not found.
    // j_foo_or_bar:  get a foo, or bar if not found

    // string
    const std::string& j_strref(const nlohmann::json& src, std::string_view key);
    std::optional<std::string> j_str(const nlohmann::json& src, std::string_view key);
    std::string j_str_or_empty(const nlohmann::json& src, std::string_view key);
    // Returns true if key is missing, or present and an empty string
    bool j_str_is_empty(const nlohmann::json& src, std::string_view key);

    // array
    const json_array_t& j_arrayref(const nlohmann::json& src, std::string_view key);
    std::optional<json_array_t> j_array(const nlohmann::json& src, std::string_view key);

    // bool
    bool j_boolref(const nlohmann::json& src, std::string_view key);
    bool j_bool_or_false(const nlohmann::json& src, std::string_view key);

    // uint32_t
    uint32_t j_uint32ref(const nlohmann::json& src, std::string_view key);
    uint32_t j_uint32_or_zero(const nlohmann::json& src, std::string_view key);

    // uint64_t
    uint64_t j_uint64ref(const nlohmann::json& src, std::string_view key);
    std::optional<uint64_t> j_uint64(const nlohmann::json& src, std::string_view key);
} // namespace spvd
#endif
