#include "actions.hpp"

#include <nlohmann/json.hpp>

#include "assertion.hpp"
#include "exception.hpp"
#include "json_utils.hpp"

namespace spvd {

    namespace {
        static create_tx_action create_tx_from_json(const nlohmann::json& details)
        {
            create_tx_action action;
            for (const auto& item : j_arrayref(details, "recipients")) {
                recipient rcpt;
                rcpt.address = j_strref(item, "address");
                rcpt.value = j_uint64ref(item, "value");
                SPVD_USER_ASSERT(rcpt.value != 0, "Recipient amount must be non-zero");
                action.recipients.emplace_back(std::move(rcpt));
            }
            SPVD_USER_ASSERT(!action.recipients.empty(), "No recipients given");
            action.fee_rate = j_uint64ref(details, "fee_rate");
            action.minconf = j_uint32_or_zero(details, "minconf");
            action.recipient_pays_fee = j_bool_or_false(details, "recipient_pays_fee");
            action.sign = j_bool_or_false(details, "sign");
            return action;
        }
    } // namespace

    tx_action tx_action_from_json(const nlohmann::json& details)
    {
        const auto& action = j_strref(details, "action");
        if (action == "create") {
            return create_tx_from_json(details);
        } else if (action == "import") {
            return import_tx_action{ j_strref(details, "tx") };
        } else if (action == "sign") {
            return sign_tx_action{ j_strref(details, "txid") };
        }
        throw user_error("Unknown transaction action: " + action);
    }

    node_action node_action_from_json(const nlohmann::json& details)
    {
        const auto& action = j_strref(details, "action");
        if (action == "rescan") {
            return rescan_action{ j_uint64(details, "timestamp") };
        } else if (action == "status") {
            return status_action{};
        }
        throw user_error("Unknown node action: " + action);
    }

} // namespace spvd
