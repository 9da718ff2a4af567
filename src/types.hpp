#ifndef SPVD_TYPES_HPP
#define SPVD_TYPES_HPP
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace spvd {

    // Paging window applied to every listing operation
    struct list_request {
        uint32_t offset = 0;
        uint32_t limit = 0; // 0 means no limit
        bool reverse = false;
    };

    enum class address_type : uint32_t { external = 0, internal = 1 };

    std::string to_string(address_type type);
    address_type address_type_from_string(const std::string& type);

    struct account_type {
        bool read_only = false;
        bool multisig = false;
        uint32_t required = 1; // m
        uint32_t total = 1; // n

        // Number of extended public keys needed before addresses can be derived
        uint32_t required_keys() const { return multisig ? total : 1; }
    };

    struct account {
        uint64_t id = 0;
        std::string name;
        account_type type;
        std::optional<std::string> master; // Extended private key, absent for watch-only accounts
        std::vector<std::string> keys; // Extended public keys, own key first
        uint32_t gap = 10;
        uint64_t created = 0;

        // All co-signer keys are present
        bool is_complete() const { return keys.size() >= type.required_keys(); }
    };

    struct account_spec {
        std::string name;
        account_type type;
        std::optional<std::string> mnemonic;
        std::optional<std::string> passphrase;
        std::vector<std::string> keys;
    };

    struct wallet_address {
        uint32_t index = 0;
        address_type type = address_type::external;
        std::string address;
        std::string label;
        uint64_t created = 0;
    };

    struct address_balance {
        uint32_t index = 0;
        uint64_t in = 0;
        uint64_t out = 0;
        uint32_t coins = 0;
        uint32_t spent_coins = 0;
    };

    struct block_ref {
        std::string hash;
        uint32_t height = 0;
    };

    // A header as known to the node's header tree
    struct block_node {
        std::string hash;
        std::string prev_hash;
        uint32_t height = 0;
        uint64_t timestamp = 0;
    };

    enum class tx_confidence : uint32_t { pending = 0, confirmed = 1, dead = 2, offline = 3 };

    std::string to_string(tx_confidence confidence);

    enum class tx_type : uint32_t { incoming = 0, outgoing = 1, self = 2 };

    std::string to_string(tx_type type);

    struct wallet_tx {
        std::string hash;
        uint64_t account_id = 0;
        tx_type type = tx_type::incoming;
        int64_t value = 0;
        std::string tx; // Raw transaction hex
        tx_confidence confidence = tx_confidence::pending;
        std::optional<block_ref> confirmed_by;
        uint64_t created = 0;
    };

    // Number of blocks confirming tx given the wallet's best block
    uint32_t get_confirmations(const wallet_tx& tx, const block_ref& best);

    // Record of a store-side transaction mutation
    struct tx_result {
        std::vector<wallet_tx> txs;
        std::vector<wallet_address> new_addresses;
    };

    struct coin_sign_data {
        std::string txid;
        uint32_t vout = 0;
        std::string script; // Previous output script, hex
        std::vector<uint32_t> path; // Derivation path relative to the account key
    };

    struct offline_tx_data {
        std::string tx;
        std::vector<coin_sign_data> coins;
    };

    struct bloom_filter {
        std::string data; // Serialized filter bits, hex
        uint32_t hash_funcs = 0;
        uint32_t tweak = 0;
        uint32_t flags = 0;
        uint32_t elements = 0;
    };

    struct node_status {
        std::optional<block_ref> best_header;
        uint32_t peers = 0;
        uint32_t pending_txs = 0;
        bool syncing = false;
        std::optional<uint64_t> rescan_from;
    };

    void to_json(nlohmann::json& json, const list_request& request);
    void from_json(const nlohmann::json& json, list_request& request);

    void to_json(nlohmann::json& json, const account_type& type);
    void from_json(const nlohmann::json& json, account_type& type);

    void to_json(nlohmann::json& json, const account& acc);

    void from_json(const nlohmann::json& json, account_spec& details);

    void to_json(nlohmann::json& json, const wallet_address& addr);

    void to_json(nlohmann::json& json, const address_balance& balance);

    void to_json(nlohmann::json& json, const block_ref& block);

    void to_json(nlohmann::json& json, const block_node& node);

    void to_json(nlohmann::json& json, const wallet_tx& tx);

    void to_json(nlohmann::json& json, const coin_sign_data& coin);
    void from_json(const nlohmann::json& json, coin_sign_data& coin);

    void to_json(nlohmann::json& json, const offline_tx_data& data);

    void to_json(nlohmann::json& json, const bloom_filter& filter);

    void to_json(nlohmann::json& json, const node_status& status);

    // Wallet tx JSON including its confirmation count
    nlohmann::json tx_to_json(const wallet_tx& tx, const block_ref& best);

} // namespace spvd

#endif
