#include "json_utils.hpp"

#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <type_traits>

#include "exception.hpp"

namespace {
static auto find(const nlohmann::json& src, std::string_view key)
{
    if (src.is_null()) {
        return src.end();
    }
    auto it = src.find(key);
    if (it == src.end() || it->is_null()) {
        return src.end();
    }
    return it;
}
static auto get_or_throw(const nlohmann::json& src, std::string_view key)
{
    auto it = find(src, key);
    if (it == src.end()) {
        std::string error_message = std::string("key ") + std::string(key) + " not found";
        throw ::spvd::user_error(error_message);
    }
    return it;
}
static void check_type(bool type_ok, std::string_view key)
{
    if (!type_ok) {
        throw ::spvd::user_error(std::string("invalid value for key ") + std::string(key));
    }
}
template <typename T> static T get_checked(nlohmann::json::const_iterator it, std::string_view key)
{
    if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        // nlohmann casts negative and oversized numbers silently
        check_type(it->is_number_unsigned() || (it->is_number_integer() && it->get<int64_t>() >= 0), key);
        const auto value = it->get<uint64_t>();
        check_type(value <= std::numeric_limits<T>::max(), key);
        return static_cast<T>(value);
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::type_error&) {
        throw ::spvd::user_error(std::string("invalid value for key ") + std::string(key));
    }
}
template <typename T> static std::optional<T> get_optional(const nlohmann::json& src, std::string_view key)
{
    auto it = find(src, key);
    if (it == src.end()) {
        return {};
    }
    return get_checked<T>(it, key);
}
template <typename T> static T get_or_default(const nlohmann::json& src, std::string_view key)
{
    auto it = find(src, key);
    return it == src.end() ? T() : get_checked<T>(it, key);
}
} // namespace

namespace spvd {

    const std::string& j_strref(const nlohmann::json& src, std::string_view key)
    {
        const auto it = get_or_throw(src, key);
        check_type(it->is_string(), key);
        return it->get_ref<const std::string&>();
    }

    std::optional<std::string> j_str(const nlohmann::json& src, std::string_view key)
    {
        return get_optional<std::string>(src, key);
    }

    std::string j_str_or_empty(const nlohmann::json& src, std::string_view key)
    {
        return get_or_default<std::string>(src, key);
    }

    bool j_str_is_empty(const nlohmann::json& src, std::string_view key)
    {
        const auto it = find(src, key);
        return it == src.end() ? true : get_checked<std::string>(it, key).empty();
    }

    const json_array_t& j_arrayref(const nlohmann::json& src, std::string_view key)
    {
        static_assert(
            std::is_same_v<json_array_t, nlohmann::json::array_t>, "json_array_t must be nlohmann::json::array_t");
        const auto it = get_or_throw(src, key);
        check_type(it->is_array(), key);
        return it->get_ref<const nlohmann::json::array_t&>();
    }

    std::optional<json_array_t> j_array(const nlohmann::json& src, std::string_view key)
    {
        return get_optional<nlohmann::json::array_t>(src, key);
    }

    bool j_boolref(const nlohmann::json& src, std::string_view key)
    {
        return get_checked<bool>(get_or_throw(src, key), key);
    }

    bool j_bool_or_false(const nlohmann::json& src, std::string_view key) { return get_or_default<bool>(src, key); }

    uint32_t j_uint32ref(const nlohmann::json& src, std::string_view key)
    {
        return get_checked<uint32_t>(get_or_throw(src, key), key);
    }

    uint32_t j_uint32_or_zero(const nlohmann::json& src, std::string_view key)
    {
        return get_or_default<uint32_t>(src, key);
    }

    uint64_t j_uint64ref(const nlohmann::json& src, std::string_view key)
    {
        return get_checked<uint64_t>(get_or_throw(src, key), key);
    }

    std::optional<uint64_t> j_uint64(const nlohmann::json& src, std::string_view key)
    {
        return get_optional<uint64_t>(src, key);
    }
} // namespace spvd
