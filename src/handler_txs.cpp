#include <algorithm>
#include <type_traits>

#include "handler.hpp"
#include "logging.hpp"
#include "offline_signer.hpp"
#include "session.hpp"
#include "wally.hpp"

namespace spvd {

    namespace {
        // The record among possibly several affected accounts that belongs to acc
        static wallet_tx select_account_tx(const tx_result& result, const account& acc, const char* error_message)
        {
            const auto p = std::find_if(result.txs.begin(), result.txs.end(),
                [&acc](const auto& tx) { return tx.account_id == acc.id; });
            if (p == result.txs.end()) {
                throw user_error(error_message);
            }
            return *p;
        }

        // Applies one transaction action to the store. Every action variant
        // must have an overload here.
        struct tx_action_visitor {
            wallet_store& store;
            const account& acc;
            const std::optional<std::string>& master;

            tx_result operator()(const create_tx_action& action) const
            {
                auto result = store.create_tx(acc, master, action);
                result.txs = { select_account_tx(result, acc, "Could not create the transaction") };
                return result;
            }

            tx_result operator()(const import_tx_action& action) const
            {
                auto result = store.import_tx(acc, action.tx);
                result.txs = { select_account_tx(
                    result, acc, "Could not import the transaction: it had no effect on this account") };
                return result;
            }

            tx_result operator()(const sign_tx_action& action) const
            {
                auto result = store.sign_account_tx(acc, master, action.txid);
                result.txs = { select_account_tx(
                    result, acc, "Could not sign the transaction: it had no effect on this account") };
                return result;
            }
        };

        static const char* action_name(const tx_action& action)
        {
            return std::visit(
                [](const auto& a) -> const char* {
                    using T = std::decay_t<decltype(a)>;
                    if constexpr (std::is_same_v<T, create_tx_action>) {
                        return "CreateTx";
                    } else if constexpr (std::is_same_v<T, import_tx_action>) {
                        return "ImportTx";
                    } else {
                        static_assert(std::is_same_v<T, sign_tx_action>, "unhandled tx action");
                        return "SignTx";
                    }
                },
                action);
        }
    } // namespace

    nlohmann::json request_handler::get_txs(const std::string& name, const list_request& request)
    {
        SPVD_LOG_SEV(log_level::info) << "GetTxs " << name << " offset:" << request.offset
                                      << " limit:" << request.limit << " reverse:" << request.reverse;

        return m_session.run_storage([&](wallet_store& store) {
            const auto acc = store.get_account(name);
            const auto best = store.get_best_block();
            const auto page = store.txs(acc, request);
            nlohmann::json txs = nlohmann::json::array();
            for (const auto& tx : page.first) {
                txs.push_back(tx_to_json(tx, best));
            }
            return nlohmann::json{ { "txs", std::move(txs) }, { "total", page.second }, { "best_block", best } };
        });
    }

    nlohmann::json request_handler::get_address_txs(
        const std::string& name, uint32_t index, address_type type, const list_request& request)
    {
        SPVD_LOG_SEV(log_level::info) << "GetAddrTxs " << name << " index:" << index << " type:" << to_string(type)
                                      << " offset:" << request.offset << " limit:" << request.limit
                                      << " reverse:" << request.reverse;

        return m_session.run_storage([&](wallet_store& store) {
            const auto acc = store.get_account(name);
            const auto addr = store.get_address(acc, index, type);
            const auto best = store.get_best_block();
            const auto page = store.address_txs(acc, addr, request);
            nlohmann::json txs = nlohmann::json::array();
            for (const auto& tx : page.first) {
                txs.push_back(tx_to_json(tx, best));
            }
            return nlohmann::json{ { "txs", std::move(txs) }, { "total", page.second }, { "best_block", best } };
        });
    }

    nlohmann::json request_handler::post_tx(
        const std::string& name, const std::optional<std::string>& master, const tx_action& action)
    {
        SPVD_LOG_SEV(log_level::info) << "PostTx " << name << " action:" << action_name(action);

        struct outcome {
            tx_result result;
            block_ref best;
        };
        const auto done = m_session.run_storage([&](wallet_store& store) {
            const auto acc = store.get_account(name);
            auto best = store.get_best_block();
            return outcome{ std::visit(tx_action_visitor{ store, acc, master }, action), std::move(best) };
        });
        const auto& tx = done.result.txs.front();

        // New addresses must be in the node's filter before the tx is relayed
        m_session.when_online([this, &done, &tx] {
            if (!done.result.new_addresses.empty()) {
                update_node_filter();
            }
            if (tx.confidence == tx_confidence::pending) {
                m_session.run_sync([&tx](sync_service& sync) { sync.broadcast_txs({ tx.tx }); });
            }
        });
        return tx_to_json(tx, done.best);
    }

    nlohmann::json request_handler::get_tx(const std::string& name, const std::string& txid)
    {
        SPVD_LOG_SEV(log_level::info) << "GetTx " << name << " txid:" << txid;

        return m_session.run_storage([&](wallet_store& store) {
            const auto acc = store.get_account(name);
            const auto best = store.get_best_block();
            return tx_to_json(store.get_account_tx(acc, txid), best);
        });
    }

    void request_handler::delete_tx(const std::string& txid)
    {
        SPVD_LOG_SEV(log_level::info) << "DeleteTx " << txid;

        m_session.run_storage([&txid](wallet_store& store) { store.delete_tx(txid); });
    }

    nlohmann::json request_handler::get_balance(const std::string& name, uint32_t minconf, bool offline)
    {
        SPVD_LOG_SEV(log_level::info) << "GetBalance " << name << " minconf:" << minconf << " offline:" << offline;

        return m_session.run_storage([&](wallet_store& store) {
            const auto acc = store.get_account(name);
            const auto best = store.get_best_block();
            const auto balance = store.account_balance(acc, minconf, offline);
            return nlohmann::json{ { "balance", balance }, { "minconf", minconf }, { "offline", offline },
                { "best_block", best } };
        });
    }

    nlohmann::json request_handler::get_offline_tx(const std::string& name, const std::string& txid)
    {
        SPVD_LOG_SEV(log_level::info) << "GetOfflineTx " << name << " txid:" << txid;

        return m_session.run_storage([&](wallet_store& store) {
            const auto acc = store.get_account(name);
            return store.get_offline_tx_data(acc, txid);
        });
    }

    nlohmann::json request_handler::post_offline_tx(const std::string& name, const std::optional<std::string>& master,
        const std::string& tx_hex, const std::vector<coin_sign_data>& coins)
    {
        SPVD_LOG_SEV(log_level::info) << "PostOfflineTx " << name << " coins:" << coins.size()
                                      << " external key:" << master.has_value();

        const auto acc = m_session.run_storage([&name](wallet_store& store) { return store.get_account(name); });

        Tx tx(tx_hex);
        sign_offline_tx(acc, master, m_session.get_config().is_main_net(), tx, coins);
        const bool complete = verify_std_tx(tx, coins);
        return { { "tx", tx.to_hex() }, { "complete", complete } };
    }

} // namespace spvd
