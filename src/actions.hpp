#ifndef SPVD_ACTIONS_HPP
#define SPVD_ACTIONS_HPP
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace spvd {

    struct recipient {
        std::string address;
        uint64_t value = 0;
    };

    // Build (and optionally sign) a new spend from the account's coins
    struct create_tx_action {
        std::vector<recipient> recipients;
        uint64_t fee_rate = 0; // Satoshi per kB
        uint32_t minconf = 0; // Minimum confirmations of selected coins
        bool recipient_pays_fee = false;
        bool sign = false;
    };

    // Add an externally built transaction to the wallet
    struct import_tx_action {
        std::string tx;
    };

    // Add this account's signatures to a stored partial transaction
    struct sign_tx_action {
        std::string txid;
    };

    using tx_action = std::variant<create_tx_action, import_tx_action, sign_tx_action>;

    struct rescan_action {
        std::optional<uint64_t> timestamp;
    };

    struct status_action {
    };

    using node_action = std::variant<rescan_action, status_action>;

    // Parse {"action": "create"|"import"|"sign", ...}
    tx_action tx_action_from_json(const nlohmann::json& details);

    // Parse {"action": "rescan"|"status", ...}
    node_action node_action_from_json(const nlohmann::json& details);

} // namespace spvd

#endif
