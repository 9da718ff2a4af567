#include <map>

#include "handler.hpp"
#include "logging.hpp"
#include "session.hpp"

#include "include/spvd.h"

namespace spvd {

    nlohmann::json request_handler::post_node(const node_action& action)
    {
        return std::visit([this](const auto& a) { return on_node_action(a); }, action);
    }

    nlohmann::json request_handler::on_node_action(const rescan_action& action)
    {
        SPVD_LOG_SEV(log_level::info) << "NodeAction Rescan "
                                      << (action.timestamp ? std::to_string(*action.timestamp) : "from first key");

        uint64_t timestamp;
        if (action.timestamp) {
            timestamp = *action.timestamp;
        } else {
            timestamp = m_session.run_storage([](wallet_store& store) {
                const auto first = store.first_address_time();
                SPVD_USER_ASSERT(first.has_value(), "No keys have been generated in the wallet");
                return *first;
            });
        }
        // Allow for clock skew between key creation and block times
        const uint64_t adjusted = timestamp > SPVD_RESCAN_MARGIN ? timestamp - SPVD_RESCAN_MARGIN : 0;

        m_session.when_online([this, adjusted] {
            m_session.run_storage([](wallet_store& store) { store.reset_rescan(); });
            m_session.run_sync([adjusted](sync_service& sync) { sync.rescan_from(adjusted); });
        });
        return { { "timestamp", adjusted } };
    }

    nlohmann::json request_handler::on_node_action(const status_action& /*action*/)
    {
        SPVD_LOG_SEV(log_level::info) << "NodeAction Status";
        SPVD_USER_ASSERT(m_session.has_sync(), "No node state available");

        nlohmann::json ret = m_session.run_sync([](sync_service& sync) { return sync.get_status(); });
        const auto best = m_session.try_storage([](wallet_store& store) { return store.get_best_block(); });
        ret["wallet_best_block"] = best ? nlohmann::json(*best) : nlohmann::json();
        return ret;
    }

    nlohmann::json request_handler::get_sync(
        const std::string& name, const std::string& block_hash, uint32_t max_blocks)
    {
        SPVD_LOG_SEV(log_level::info) << "GetSync " << name << " block:" << block_hash << " count:" << max_blocks;
        SPVD_USER_ASSERT(m_session.has_sync(), "No node state available");

        return m_session.run_storage([&](wallet_store& store) {
            const auto acc = store.get_account(name);
            const auto best = store.get_best_block();
            auto blocks = m_session.run_sync(
                [&best, &block_hash](sync_service& sync) { return sync.main_chain(best.hash, block_hash); });
            if (max_blocks != 0 && blocks.size() > max_blocks) {
                blocks.resize(max_blocks);
            }
            if (blocks.empty()) {
                // Already at the tip
                return nlohmann::json::array();
            }

            const auto count = gsl::narrow<uint32_t>(blocks.size());
            const auto txs = store.account_txs_from_block(acc, blocks.front().height, count);
            std::map<std::string, std::vector<const wallet_tx*>> block_txs;
            for (const auto& tx : txs) {
                if (tx.confirmed_by) {
                    block_txs[tx.confirmed_by->hash].push_back(&tx);
                }
            }

            nlohmann::json ret = nlohmann::json::array();
            for (const auto& block : blocks) {
                nlohmann::json bundle = { { "block", block }, { "txs", nlohmann::json::array() } };
                const auto p = block_txs.find(block.hash);
                if (p != block_txs.end()) {
                    for (const auto* tx : p->second) {
                        bundle["txs"].push_back(tx_to_json(*tx, best));
                    }
                }
                ret.push_back(std::move(bundle));
            }
            return ret;
        });
    }

} // namespace spvd
