#ifndef SPVD_STORE_HPP
#define SPVD_STORE_HPP
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "actions.hpp"
#include "types.hpp"

namespace spvd {

    // The wallet store as seen from inside one storage transaction.
    // Lookups of named entities throw not_found_error; faults of the
    // underlying store are reported as storage_error.
    class wallet_store {
    public:
        wallet_store() = default;
        wallet_store(const wallet_store&) = delete;
        wallet_store& operator=(const wallet_store&) = delete;
        virtual ~wallet_store() = default;

        // Accounts
        virtual account get_account(const std::string& name) = 0;
        virtual std::pair<std::vector<account>, uint32_t> accounts(const list_request& request) = 0;
        // Returns the account and the mnemonic, when one was generated
        virtual std::pair<account, std::optional<std::string>> new_account(const account_spec& details) = 0;
        virtual account rename_account(const account& acc, const std::string& new_name) = 0;
        virtual account add_account_keys(const account& acc, const std::vector<std::string>& keys) = 0;
        virtual account set_account_gap(const account& acc, uint32_t gap) = 0;

        // Addresses
        virtual std::pair<std::vector<wallet_address>, uint32_t> address_list(
            const account& acc, address_type type, const list_request& request)
            = 0;
        virtual std::pair<std::vector<wallet_address>, uint32_t> unused_addresses(
            const account& acc, address_type type, const list_request& request)
            = 0;
        virtual wallet_address get_address(const account& acc, uint32_t index, address_type type) = 0;
        virtual wallet_address set_address_label(
            const account& acc, uint32_t index, address_type type, const std::string& label)
            = 0;
        // Generates addresses up to index; returns the number created
        virtual uint32_t generate_addresses(const account& acc, address_type type, uint32_t index) = 0;
        virtual std::vector<address_balance> address_balances(const account& acc, uint32_t index_min,
            uint32_t index_max, address_type type, uint32_t minconf, bool offline)
            = 0;

        // Transactions
        virtual std::pair<std::vector<wallet_tx>, uint32_t> txs(const account& acc, const list_request& request) = 0;
        virtual std::pair<std::vector<wallet_tx>, uint32_t> address_txs(
            const account& acc, const wallet_address& addr, const list_request& request)
            = 0;
        virtual wallet_tx get_account_tx(const account& acc, const std::string& txid) = 0;
        virtual void delete_tx(const std::string& txid) = 0;
        virtual uint64_t account_balance(const account& acc, uint32_t minconf, bool offline) = 0;
        virtual tx_result create_tx(
            const account& acc, const std::optional<std::string>& master, const create_tx_action& action)
            = 0;
        // May record the tx against several accounts sharing its addresses
        virtual tx_result import_tx(const account& acc, const std::string& tx_hex) = 0;
        virtual tx_result sign_account_tx(
            const account& acc, const std::optional<std::string>& master, const std::string& txid)
            = 0;
        virtual offline_tx_data get_offline_tx_data(const account& acc, const std::string& txid) = 0;

        // Chain and filter bookkeeping
        virtual block_ref get_best_block() = 0;
        // This account's txs confirmed in blocks at or above height; count 0 is unbounded
        virtual std::vector<wallet_tx> account_txs_from_block(const account& acc, uint32_t height, uint32_t count)
            = 0;
        // Creation time of the first address in the wallet, if any
        virtual std::optional<uint64_t> first_address_time() = 0;
        virtual void reset_rescan() = 0;
        virtual bloom_filter get_bloom_filter() = 0;
    };

    class store_transaction {
    public:
        store_transaction() = default;
        store_transaction(const store_transaction&) = delete;
        store_transaction& operator=(const store_transaction&) = delete;
        virtual ~store_transaction() = default;

        virtual wallet_store& store() = 0;
        virtual void commit() = 0;
        virtual void rollback() noexcept = 0;
    };

    // A pooled, transactional connection to the wallet store
    class store_pool {
    public:
        store_pool() = default;
        store_pool(const store_pool&) = delete;
        store_pool& operator=(const store_pool&) = delete;
        virtual ~store_pool() = default;

        virtual std::unique_ptr<store_transaction> begin() = 0;
    };

} // namespace spvd

#endif
