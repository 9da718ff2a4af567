#ifndef SPVD_CONFIG_HPP
#define SPVD_CONFIG_HPP
#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace spvd {

    class config final {
    public:
        // Defaults for every setting
        static nlohmann::json get_defaults();

        // Construct from a user's overrides applied on top of the defaults
        explicit config(const nlohmann::json& user_overrides);

        config(const config&) = default;
        config& operator=(const config&) = default;
        config(config&&) = default;
        config& operator=(config&&) = default;

        const nlohmann::json& get_json() const { return m_details; }

        bool is_online() const;
        std::string network() const;
        bool is_main_net() const;
        std::string db_connection() const;
        uint32_t db_pool_size() const;
        uint32_t db_concurrency() const;
        std::string log_level() const;

    private:
        nlohmann::json m_details;
    };

} // namespace spvd

#endif
