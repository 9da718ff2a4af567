#ifndef SPVD_HANDLER_HPP
#define SPVD_HANDLER_HPP
#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "actions.hpp"
#include "types.hpp"

namespace spvd {
    class session;

    // One member per client operation. Inputs are strictly typed; results
    // are returned as JSON ready for encoding.
    class request_handler final {
    public:
        explicit request_handler(session& s);

        request_handler(const request_handler&) = delete;
        request_handler& operator=(const request_handler&) = delete;

        // Accounts
        nlohmann::json get_accounts(const list_request& request);
        nlohmann::json get_account(const std::string& name);
        nlohmann::json post_account(const account_spec& details);
        nlohmann::json rename_account(const std::string& old_name, const std::string& new_name);
        nlohmann::json post_account_keys(const std::string& name, const std::vector<std::string>& keys);
        nlohmann::json post_account_gap(const std::string& name, uint32_t gap);

        // Addresses
        nlohmann::json get_addresses(const std::string& name, address_type type, uint32_t minconf, bool offline,
            const list_request& request);
        nlohmann::json get_unused_addresses(const std::string& name, address_type type, const list_request& request);
        nlohmann::json get_address(
            const std::string& name, uint32_t index, address_type type, uint32_t minconf, bool offline);
        nlohmann::json put_address_label(
            const std::string& name, uint32_t index, address_type type, const std::string& label);
        nlohmann::json post_addresses(const std::string& name, uint32_t index, address_type type);

        // Transactions
        nlohmann::json get_txs(const std::string& name, const list_request& request);
        nlohmann::json get_address_txs(
            const std::string& name, uint32_t index, address_type type, const list_request& request);
        nlohmann::json post_tx(
            const std::string& name, const std::optional<std::string>& master, const tx_action& action);
        nlohmann::json get_tx(const std::string& name, const std::string& txid);
        void delete_tx(const std::string& txid);
        nlohmann::json get_balance(const std::string& name, uint32_t minconf, bool offline);

        // Offline signing
        nlohmann::json get_offline_tx(const std::string& name, const std::string& txid);
        nlohmann::json post_offline_tx(const std::string& name, const std::optional<std::string>& master,
            const std::string& tx_hex, const std::vector<coin_sign_data>& coins);

        // Node
        nlohmann::json post_node(const node_action& action);
        nlohmann::json get_sync(const std::string& name, const std::string& block_hash, uint32_t max_blocks);

        // Send the store's current bloom filter to the node
        void update_node_filter();

        // Best-effort filter load when the server starts
        void load_initial_filter();

    private:
        nlohmann::json on_node_action(const rescan_action& action);
        nlohmann::json on_node_action(const status_action& action);

        // Refresh the node's filter when the account is complete
        void refresh_if_complete(const account& acc);

        session& m_session;
    };

} // namespace spvd

#endif
