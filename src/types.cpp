#include "types.hpp"

#include "assertion.hpp"
#include "exception.hpp"
#include "json_utils.hpp"

#include <limits>

namespace spvd {

    namespace {
        // Largest multisig supported by standard P2SH scripts
        constexpr uint32_t MAX_MULTISIG_KEYS = 15;
    } // namespace

    std::string to_string(address_type type)
    {
        return type == address_type::internal ? "internal" : "external";
    }

    address_type address_type_from_string(const std::string& type)
    {
        if (type == "external") {
            return address_type::external;
        } else if (type == "internal") {
            return address_type::internal;
        }
        throw user_error("Invalid address type: " + type);
    }

    std::string to_string(tx_confidence confidence)
    {
        switch (confidence) {
        case tx_confidence::pending:
            return "pending";
        case tx_confidence::confirmed:
            return "confirmed";
        case tx_confidence::dead:
            return "dead";
        case tx_confidence::offline:
            return "offline";
        }
        SPVD_RUNTIME_ASSERT_MSG(false, "unknown tx confidence");
        __builtin_unreachable();
    }

    std::string to_string(tx_type type)
    {
        switch (type) {
        case tx_type::incoming:
            return "incoming";
        case tx_type::outgoing:
            return "outgoing";
        case tx_type::self:
            return "self";
        }
        SPVD_RUNTIME_ASSERT_MSG(false, "unknown tx type");
        __builtin_unreachable();
    }

    uint32_t get_confirmations(const wallet_tx& tx, const block_ref& best)
    {
        if (!tx.confirmed_by || tx.confirmed_by->height > best.height) {
            return 0;
        }
        return best.height - tx.confirmed_by->height + 1;
    }

    void to_json(nlohmann::json& json, const list_request& request)
    {
        json = { { "offset", request.offset }, { "limit", request.limit }, { "reverse", request.reverse } };
    }

    void from_json(const nlohmann::json& json, list_request& request)
    {
        request.offset = j_uint32_or_zero(json, "offset");
        request.limit = j_uint32_or_zero(json, "limit");
        request.reverse = j_bool_or_false(json, "reverse");
    }

    void to_json(nlohmann::json& json, const account_type& type)
    {
        json = { { "read_only", type.read_only }, { "multisig", type.multisig } };
        if (type.multisig) {
            json["required"] = type.required;
            json["total"] = type.total;
        }
    }

    void from_json(const nlohmann::json& json, account_type& type)
    {
        type.read_only = j_bool_or_false(json, "read_only");
        type.multisig = j_bool_or_false(json, "multisig");
        if (!type.multisig) {
            type.required = type.total = 1;
            return;
        }
        type.required = j_uint32ref(json, "required");
        type.total = j_uint32ref(json, "total");
        SPVD_USER_ASSERT(type.required != 0 && type.required <= type.total && type.total <= MAX_MULTISIG_KEYS,
            "Invalid multisig parameters");
    }

    void to_json(nlohmann::json& json, const account& acc)
    {
        json = { { "name", acc.name }, { "type", acc.type }, { "keys", acc.keys }, { "gap", acc.gap },
            { "created", acc.created }, { "complete", acc.is_complete() } };
    }

    void from_json(const nlohmann::json& json, account_spec& details)
    {
        details.name = j_strref(json, "name");
        SPVD_USER_ASSERT(!details.name.empty(), "Account name cannot be empty");
        auto type = json.find("type");
        details.type = type == json.end() ? account_type{} : type->get<account_type>();
        details.mnemonic = j_str(json, "mnemonic");
        details.passphrase = j_str(json, "passphrase");
        details.keys.clear();
        for (const auto& key : j_array(json, "keys").value_or(json_array_t{})) {
            SPVD_USER_ASSERT(key.is_string(), "Invalid account key");
            details.keys.emplace_back(key.get<std::string>());
        }
        SPVD_USER_ASSERT(details.keys.size() <= details.type.required_keys(), "Too many keys for account type");
    }

    void to_json(nlohmann::json& json, const wallet_address& addr)
    {
        json = { { "index", addr.index }, { "type", to_string(addr.type) }, { "address", addr.address },
            { "label", addr.label }, { "created", addr.created } };
    }

    void to_json(nlohmann::json& json, const address_balance& balance)
    {
        json = { { "in", balance.in }, { "out", balance.out }, { "coins", balance.coins },
            { "spent_coins", balance.spent_coins } };
    }

    void to_json(nlohmann::json& json, const block_ref& block)
    {
        json = { { "hash", block.hash }, { "height", block.height } };
    }

    void to_json(nlohmann::json& json, const block_node& node)
    {
        json = { { "hash", node.hash }, { "prev_hash", node.prev_hash }, { "height", node.height },
            { "timestamp", node.timestamp } };
    }

    void to_json(nlohmann::json& json, const wallet_tx& tx)
    {
        json = { { "txid", tx.hash }, { "type", to_string(tx.type) }, { "value", tx.value }, { "tx", tx.tx },
            { "confidence", to_string(tx.confidence) }, { "created", tx.created } };
        json["confirmed_by"] = tx.confirmed_by ? nlohmann::json(*tx.confirmed_by) : nlohmann::json();
    }

    void to_json(nlohmann::json& json, const coin_sign_data& coin)
    {
        json = { { "txid", coin.txid }, { "vout", coin.vout }, { "script", coin.script }, { "path", coin.path } };
    }

    void from_json(const nlohmann::json& json, coin_sign_data& coin)
    {
        coin.txid = j_strref(json, "txid");
        coin.vout = j_uint32ref(json, "vout");
        coin.script = j_strref(json, "script");
        coin.path.clear();
        for (const auto& element : j_arrayref(json, "path")) {
            SPVD_USER_ASSERT(
                element.is_number_integer() && element.get<int64_t>() >= 0
                    && element.get<uint64_t>() <= std::numeric_limits<uint32_t>::max(),
                "Invalid derivation path");
            coin.path.push_back(element.get<uint32_t>());
        }
        SPVD_USER_ASSERT(!coin.path.empty(), "Invalid derivation path");
    }

    void to_json(nlohmann::json& json, const offline_tx_data& data)
    {
        json = { { "tx", data.tx }, { "coins", data.coins } };
    }

    void to_json(nlohmann::json& json, const bloom_filter& filter)
    {
        json = { { "data", filter.data }, { "hash_funcs", filter.hash_funcs }, { "tweak", filter.tweak },
            { "flags", filter.flags }, { "elements", filter.elements } };
    }

    void to_json(nlohmann::json& json, const node_status& status)
    {
        json = { { "peers", status.peers }, { "pending_txs", status.pending_txs }, { "syncing", status.syncing } };
        json["best_header"] = status.best_header ? nlohmann::json(*status.best_header) : nlohmann::json();
        json["rescan_from"] = status.rescan_from ? nlohmann::json(*status.rescan_from) : nlohmann::json();
    }

    nlohmann::json tx_to_json(const wallet_tx& tx, const block_ref& best)
    {
        nlohmann::json ret = tx;
        ret["confirmations"] = get_confirmations(tx, best);
        return ret;
    }

} // namespace spvd
