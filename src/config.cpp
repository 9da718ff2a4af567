#include "config.hpp"

#include "assertion.hpp"
#include "exception.hpp"
#include "json_utils.hpp"
#include "logging.hpp"

#include "include/spvd.h"

namespace spvd {

    namespace {
        static void set_override(
            nlohmann::json& ret, const std::string& key, const nlohmann::json& src, const nlohmann::json& default_value)
        {
            auto p = src.find(key);
            if (p == src.end()) {
                ret[key] = default_value;
            } else {
                SPVD_USER_ASSERT(p->type() == default_value.type()
                        || (p->is_number_integer() && default_value.is_number_integer()),
                    "invalid type for config key " + key);
                ret[key] = *p;
            }
        }

        static nlohmann::json get_config_overrides(const nlohmann::json& user_overrides)
        {
            SPVD_USER_ASSERT(user_overrides.is_null() || user_overrides.is_object(), "config must be an object");
            const auto src = user_overrides.is_null() ? nlohmann::json::object() : user_overrides;
            const auto defaults = config::get_defaults();

            nlohmann::json ret;
            set_override(ret, "mode", src, defaults["mode"]);
            set_override(ret, "network", src, defaults["network"]);
            set_override(ret, "db_concurrency", src, defaults["db_concurrency"]);
            set_override(ret, "log_level", src, defaults["log_level"]);

            const auto db = src.value("database", nlohmann::json::object());
            SPVD_USER_ASSERT(db.is_object(), "database must be an object");
            set_override(ret["database"], "connection", db, defaults["database"]["connection"]);
            set_override(ret["database"], "pool_size", db, defaults["database"]["pool_size"]);
            return ret;
        }
    } // namespace

    nlohmann::json config::get_defaults()
    {
        return { { "mode", SPVD_MODE_ONLINE }, { "network", "testnet" }, { "db_concurrency", 32 },
            { "log_level", "info" }, { "database", { { "connection", "spvd.sqlite3" }, { "pool_size", 8 } } } };
    }

    config::config(const nlohmann::json& user_overrides)
        : m_details(get_config_overrides(user_overrides))
    {
        const auto mode = j_strref(m_details, "mode");
        SPVD_USER_ASSERT(mode == SPVD_MODE_ONLINE || mode == SPVD_MODE_OFFLINE, "invalid mode: " + mode);
        const auto net = network();
        SPVD_USER_ASSERT(net == "mainnet" || net == "testnet" || net == "regtest", "invalid network: " + net);
        SPVD_USER_ASSERT(m_details["db_concurrency"].get<int64_t>() > 0, "db_concurrency must be positive");
        SPVD_USER_ASSERT(m_details["database"]["pool_size"].get<int64_t>() > 0, "pool_size must be positive");
        // Range checked as uint32
        db_concurrency();
        db_pool_size();
        parse_log_level(log_level());
    }

    bool config::is_online() const { return j_strref(m_details, "mode") == SPVD_MODE_ONLINE; }

    std::string config::network() const { return j_strref(m_details, "network"); }

    bool config::is_main_net() const { return network() == "mainnet"; }

    std::string config::db_connection() const { return j_strref(m_details.at("database"), "connection"); }

    uint32_t config::db_pool_size() const { return j_uint32ref(m_details.at("database"), "pool_size"); }

    uint32_t config::db_concurrency() const { return j_uint32ref(m_details, "db_concurrency"); }

    std::string config::log_level() const { return j_strref(m_details, "log_level"); }

} // namespace spvd
