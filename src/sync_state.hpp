#ifndef SPVD_SYNC_STATE_HPP
#define SPVD_SYNC_STATE_HPP
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace spvd {

    // Peer synchronization state owned by the node. Only ever touched from
    // the sync_service thread.
    class sync_state {
    public:
        sync_state() = default;
        sync_state(const sync_state&) = delete;
        sync_state& operator=(const sync_state&) = delete;
        virtual ~sync_state() = default;

        virtual void send_bloom_filter(const bloom_filter& filter) = 0;
        virtual void broadcast_txs(const std::vector<std::string>& txs) = 0;
        virtual void rescan_from(uint64_t timestamp) = 0;
        virtual node_status get_status() = 0;
        virtual std::optional<block_node> get_header(const std::string& hash) = 0;
    };

} // namespace spvd

#endif
