#include "router.hpp"

#include "assertion.hpp"
#include "exception.hpp"
#include "handler.hpp"
#include "json_utils.hpp"
#include "logging.hpp"

#include "include/spvd.h"

namespace spvd {

    namespace {
        static nlohmann::json make_result(nlohmann::json result)
        {
            return { { "status", "ok" }, { "code", SPVD_OK }, { "result", std::move(result) } };
        }

        static nlohmann::json make_error(int code, const std::string& message)
        {
            return { { "status", "error" }, { "code", code }, { "error", message } };
        }

        static const std::string& get_name(const nlohmann::json& params) { return j_strref(params, "account"); }

        static address_type get_address_type(const nlohmann::json& params)
        {
            const auto type = j_str(params, "type");
            return type ? address_type_from_string(*type) : address_type::external;
        }

        static list_request get_list_request(const nlohmann::json& params)
        {
            list_request request;
            from_json(params, request);
            return request;
        }

        static std::vector<std::string> get_keys(const nlohmann::json& params)
        {
            std::vector<std::string> keys;
            for (const auto& key : j_arrayref(params, "keys")) {
                SPVD_USER_ASSERT(key.is_string(), "Invalid account key");
                keys.emplace_back(key.get<std::string>());
            }
            return keys;
        }

        static std::vector<coin_sign_data> get_coins(const nlohmann::json& params)
        {
            std::vector<coin_sign_data> coins;
            for (const auto& coin : j_arrayref(params, "coins")) {
                coins.emplace_back(coin.get<coin_sign_data>());
            }
            return coins;
        }
    } // namespace

    request_router::request_router(request_handler& handler)
        : m_handler(handler)
    {
        add_methods();
    }

    void request_router::add_methods()
    {
        auto& h = m_handler;

        // Accounts
        m_methods["get_accounts"] = [&h](const nlohmann::json& p) { return h.get_accounts(get_list_request(p)); };
        m_methods["get_account"] = [&h](const nlohmann::json& p) { return h.get_account(get_name(p)); };
        m_methods["create_account"]
            = [&h](const nlohmann::json& p) { return h.post_account(p.get<account_spec>()); };
        m_methods["rename_account"]
            = [&h](const nlohmann::json& p) { return h.rename_account(get_name(p), j_strref(p, "new_name")); };
        m_methods["add_account_keys"]
            = [&h](const nlohmann::json& p) { return h.post_account_keys(get_name(p), get_keys(p)); };
        m_methods["set_account_gap"]
            = [&h](const nlohmann::json& p) { return h.post_account_gap(get_name(p), j_uint32ref(p, "gap")); };

        // Addresses
        m_methods["get_addresses"] = [&h](const nlohmann::json& p) {
            return h.get_addresses(get_name(p), get_address_type(p), j_uint32_or_zero(p, "minconf"),
                j_bool_or_false(p, "offline"), get_list_request(p));
        };
        m_methods["get_unused_addresses"] = [&h](const nlohmann::json& p) {
            return h.get_unused_addresses(get_name(p), get_address_type(p), get_list_request(p));
        };
        m_methods["get_address"] = [&h](const nlohmann::json& p) {
            return h.get_address(get_name(p), j_uint32ref(p, "index"), get_address_type(p),
                j_uint32_or_zero(p, "minconf"), j_bool_or_false(p, "offline"));
        };
        m_methods["set_address_label"] = [&h](const nlohmann::json& p) {
            return h.put_address_label(get_name(p), j_uint32ref(p, "index"), get_address_type(p), j_strref(p, "label"));
        };
        m_methods["generate_addresses"] = [&h](const nlohmann::json& p) {
            return h.post_addresses(get_name(p), j_uint32ref(p, "index"), get_address_type(p));
        };

        // Transactions
        m_methods["get_txs"] = [&h](const nlohmann::json& p) { return h.get_txs(get_name(p), get_list_request(p)); };
        m_methods["get_address_txs"] = [&h](const nlohmann::json& p) {
            return h.get_address_txs(get_name(p), j_uint32ref(p, "index"), get_address_type(p), get_list_request(p));
        };
        m_methods["post_tx"] = [&h](const nlohmann::json& p) {
            return h.post_tx(get_name(p), j_str(p, "master"), tx_action_from_json(p));
        };
        m_methods["get_tx"] = [&h](const nlohmann::json& p) { return h.get_tx(get_name(p), j_strref(p, "txid")); };
        m_methods["delete_tx"] = [&h](const nlohmann::json& p) {
            h.delete_tx(j_strref(p, "txid"));
            return nlohmann::json();
        };
        m_methods["get_balance"] = [&h](const nlohmann::json& p) {
            return h.get_balance(get_name(p), j_uint32_or_zero(p, "minconf"), j_bool_or_false(p, "offline"));
        };

        // Offline signing
        m_methods["get_offline_tx"]
            = [&h](const nlohmann::json& p) { return h.get_offline_tx(get_name(p), j_strref(p, "txid")); };
        m_methods["sign_offline_tx"] = [&h](const nlohmann::json& p) {
            return h.post_offline_tx(get_name(p), j_str(p, "master"), j_strref(p, "tx"), get_coins(p));
        };

        // Node
        m_methods["post_node"] = [&h](const nlohmann::json& p) { return h.post_node(node_action_from_json(p)); };
        m_methods["get_sync"] = [&h](const nlohmann::json& p) {
            return h.get_sync(get_name(p), j_strref(p, "block"), j_uint32_or_zero(p, "count"));
        };
    }

    nlohmann::json request_router::call(const std::string& method, const nlohmann::json& params)
    {
        try {
            const auto p = m_methods.find(method);
            if (p == m_methods.end()) {
                throw user_error("Unknown method: " + method);
            }
            return make_result(p->second(params.is_null() ? nlohmann::json::object() : params));
        } catch (const not_found_error& e) {
            SPVD_LOG_SEV(log_level::debug) << method << " not found: " << e.what();
            return make_error(SPVD_NOT_FOUND, e.what());
        } catch (const user_error& e) {
            SPVD_LOG_SEV(log_level::debug) << method << " user error: " << e.what();
            return make_error(SPVD_ERROR, e.what());
        } catch (const nlohmann::json::exception& e) {
            SPVD_LOG_SEV(log_level::debug) << method << " invalid parameters: " << e.what();
            return make_error(SPVD_ERROR, e.what());
        } catch (const storage_error& e) {
            SPVD_LOG_SEV(log_level::error) << method << " storage error: " << e.what();
            return make_error(SPVD_STORAGE_ERROR, "A database error occurred");
        } catch (const assertion_error&) {
            // Already logged by the assertion that failed
            return make_error(SPVD_INTERNAL_ERROR, "Internal error");
        } catch (const std::exception& e) {
            SPVD_LOG_SEV(log_level::error) << method << " uncaught exception: " << e.what();
            return make_error(SPVD_INTERNAL_ERROR, "Internal error");
        }
    }

    nlohmann::json request_router::call(const nlohmann::json& request)
    {
        if (!request.is_object() || !request.contains("method") || !request["method"].is_string()) {
            return make_error(SPVD_ERROR, "Invalid request");
        }
        return call(request["method"].get<std::string>(), request.value("params", nlohmann::json::object()));
    }

    std::vector<std::string> request_router::get_methods() const
    {
        std::vector<std::string> ret;
        for (const auto& method : m_methods) {
            ret.push_back(method.first);
        }
        return ret;
    }

} // namespace spvd
