#include "sync_service.hpp"
#include "header_chain.hpp"
#include "logging.hpp"

namespace spvd {

    sync_service::sync_service(std::shared_ptr<sync_state> state)
        : m_state(std::move(state))
    {
        SPVD_RUNTIME_ASSERT(m_state);
    }

    // m_runner joins its thread before m_state is released
    sync_service::~sync_service() = default;

    void sync_service::send_bloom_filter(const bloom_filter& filter)
    {
        atomic_operation([&filter](sync_state& state) { state.send_bloom_filter(filter); });
    }

    void sync_service::broadcast_txs(const std::vector<std::string>& txs)
    {
        SPVD_LOG_SEV(log_level::debug) << "Broadcasting " << txs.size() << " transaction(s)";
        atomic_operation([&txs](sync_state& state) { state.broadcast_txs(txs); });
    }

    void sync_service::rescan_from(uint64_t timestamp)
    {
        atomic_operation([timestamp](sync_state& state) { state.rescan_from(timestamp); });
    }

    node_status sync_service::get_status()
    {
        return atomic_operation([](sync_state& state) { return state.get_status(); });
    }

    std::vector<block_node> sync_service::main_chain(const std::string& tip, const std::string& target)
    {
        return atomic_operation(
            [&tip, &target](sync_state& state) { return spvd::main_chain(state, tip, target); });
    }

} // namespace spvd
