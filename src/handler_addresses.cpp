#include <algorithm>

#include "handler.hpp"
#include "logging.hpp"
#include "session.hpp"

namespace spvd {

    namespace {
        static nlohmann::json address_with_balance(const wallet_address& addr, const address_balance& balance)
        {
            nlohmann::json ret = addr;
            ret["balance"] = balance;
            return ret;
        }

        // Pair each address with the balance of the same index. Addresses
        // without a balance entry are dropped.
        static nlohmann::json join_balances(
            const std::vector<wallet_address>& addrs, const std::vector<address_balance>& balances)
        {
            nlohmann::json ret = nlohmann::json::array();
            for (const auto& addr : addrs) {
                const auto p = std::find_if(balances.begin(), balances.end(),
                    [&addr](const auto& balance) { return balance.index == addr.index; });
                if (p != balances.end()) {
                    ret.push_back(address_with_balance(addr, *p));
                }
            }
            return ret;
        }
    } // namespace

    nlohmann::json request_handler::get_addresses(
        const std::string& name, address_type type, uint32_t minconf, bool offline, const list_request& request)
    {
        SPVD_LOG_SEV(log_level::info) << "GetAddresses " << name << " type:" << to_string(type)
                                      << " minconf:" << minconf << " offline:" << offline
                                      << " offset:" << request.offset << " limit:" << request.limit
                                      << " reverse:" << request.reverse;

        return m_session.run_storage([&](wallet_store& store) {
            const auto acc = store.get_account(name);
            const auto page = store.address_list(acc, type, request);
            std::vector<address_balance> balances;
            if (!page.first.empty()) {
                const auto bounds = std::minmax_element(page.first.begin(), page.first.end(),
                    [](const auto& lhs, const auto& rhs) { return lhs.index < rhs.index; });
                balances = store.address_balances(
                    acc, bounds.first->index, bounds.second->index, type, minconf, offline);
            }
            return nlohmann::json{ { "addresses", join_balances(page.first, balances) }, { "total", page.second } };
        });
    }

    nlohmann::json request_handler::get_unused_addresses(
        const std::string& name, address_type type, const list_request& request)
    {
        SPVD_LOG_SEV(log_level::info) << "GetAddressesUnused " << name << " type:" << to_string(type)
                                      << " offset:" << request.offset << " limit:" << request.limit
                                      << " reverse:" << request.reverse;

        const auto page = m_session.run_storage([&](wallet_store& store) {
            const auto acc = store.get_account(name);
            return store.unused_addresses(acc, type, request);
        });
        return { { "addresses", page.first }, { "total", page.second } };
    }

    nlohmann::json request_handler::get_address(
        const std::string& name, uint32_t index, address_type type, uint32_t minconf, bool offline)
    {
        SPVD_LOG_SEV(log_level::info) << "GetAddress " << name << " index:" << index << " type:" << to_string(type)
                                      << " minconf:" << minconf << " offline:" << offline;

        return m_session.run_storage([&](wallet_store& store) {
            const auto acc = store.get_account(name);
            const auto addr = store.get_address(acc, index, type);
            const auto balances = store.address_balances(acc, index, index, type, minconf, offline);
            if (balances.empty()) {
                nlohmann::json ret = addr;
                ret["balance"] = nullptr;
                return ret;
            }
            return address_with_balance(addr, balances.front());
        });
    }

    nlohmann::json request_handler::put_address_label(
        const std::string& name, uint32_t index, address_type type, const std::string& label)
    {
        SPVD_LOG_SEV(log_level::info) << "PutAddress " << name << " index:" << index << " type:" << to_string(type)
                                      << " label:" << label;

        return m_session.run_storage([&](wallet_store& store) {
            const auto acc = store.get_account(name);
            return store.set_address_label(acc, index, type, label);
        });
    }

    nlohmann::json request_handler::post_addresses(const std::string& name, uint32_t index, address_type type)
    {
        SPVD_LOG_SEV(log_level::info) << "PostAddresses " << name << " index:" << index << " type:" << to_string(type);

        const auto count = m_session.run_storage([&](wallet_store& store) {
            const auto acc = store.get_account(name);
            return store.generate_addresses(acc, type, index);
        });
        m_session.when_online([this] { update_node_filter(); });
        return { { "count", count } };
    }

} // namespace spvd
