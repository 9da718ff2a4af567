#include "src/actions.hpp"
#include "src/assertion.hpp"
#include "src/exception.hpp"
#include "src/json_utils.hpp"
#include "src/types.hpp"
#include "tests/test_fakes.hpp"

#include <nlohmann/json.hpp>

// Parsing of request parameters into typed inputs, and result encoding

using namespace spvd;
using namespace spvd::test;

static void test_fetch_helpers()
{
    const nlohmann::json src
        = { { "name", "alice" }, { "empty", "" }, { "count", 7 }, { "flag", true }, { "nothing", nullptr },
              { "items", { 1, 2 } }, { "big", 5000000000ull } };

    SPVD_RUNTIME_ASSERT(j_strref(src, "name") == "alice");
    SPVD_RUNTIME_ASSERT(j_str(src, "name").value() == "alice");
    SPVD_RUNTIME_ASSERT(!j_str(src, "missing"));
    // Null values are treated as missing
    SPVD_RUNTIME_ASSERT(!j_str(src, "nothing"));
    SPVD_RUNTIME_ASSERT(j_str_or_empty(src, "missing").empty());
    SPVD_RUNTIME_ASSERT(j_str_is_empty(src, "empty"));
    SPVD_RUNTIME_ASSERT(j_str_is_empty(src, "missing"));
    SPVD_RUNTIME_ASSERT(!j_str_is_empty(src, "name"));

    SPVD_RUNTIME_ASSERT(j_uint32ref(src, "count") == 7);
    SPVD_RUNTIME_ASSERT(j_uint32_or_zero(src, "missing") == 0);
    SPVD_RUNTIME_ASSERT(j_uint64ref(src, "big") == 5000000000ull);
    SPVD_RUNTIME_ASSERT(j_boolref(src, "flag"));
    SPVD_RUNTIME_ASSERT(!j_bool_or_false(src, "missing"));
    SPVD_RUNTIME_ASSERT(j_arrayref(src, "items").size() == 2);
    SPVD_RUNTIME_ASSERT(!j_array(src, "missing"));

    expect_throw<user_error>([&src] { j_strref(src, "missing"); }, "key missing not found");
    expect_throw<user_error>([&src] { j_strref(src, "count"); }, "invalid value for key count");
    expect_throw<user_error>([&src] { j_uint32ref(src, "name"); }, "invalid value for key name");
    expect_throw<user_error>([&src] { j_bool_or_false(src, "name"); }, "invalid value for key name");
    expect_throw<user_error>([&src] { j_arrayref(src, "name"); }, "invalid value for key name");

    // Negative, oversized and fractional numbers are rejected rather than wrapped
    const auto numbers = nlohmann::json::parse(
        R"({"index":-1,"gap":-5,"count":4294967297,"timestamp":-604800,"limit":2.5,"max":4294967295})");
    SPVD_RUNTIME_ASSERT(j_uint32ref(numbers, "max") == 4294967295u);
    SPVD_RUNTIME_ASSERT(j_uint64ref(numbers, "count") == 4294967297ull);
    expect_throw<user_error>([&numbers] { j_uint32ref(numbers, "index"); }, "invalid value for key index");
    expect_throw<user_error>([&numbers] { j_uint32ref(numbers, "gap"); }, "invalid value for key gap");
    expect_throw<user_error>([&numbers] { j_uint32_or_zero(numbers, "count"); }, "invalid value for key count");
    expect_throw<user_error>([&numbers] { j_uint64(numbers, "timestamp"); }, "invalid value for key timestamp");
    expect_throw<user_error>([&numbers] { j_uint64ref(numbers, "index"); }, "invalid value for key index");
    expect_throw<user_error>([&numbers] { j_uint32_or_zero(numbers, "limit"); }, "invalid value for key limit");
}

static void test_account_spec()
{
    const nlohmann::json single = { { "name", "spending" } };
    const auto details = single.get<account_spec>();
    SPVD_RUNTIME_ASSERT(details.name == "spending");
    SPVD_RUNTIME_ASSERT(!details.type.multisig && !details.type.read_only);
    SPVD_RUNTIME_ASSERT(details.type.required_keys() == 1);
    SPVD_RUNTIME_ASSERT(!details.mnemonic && details.keys.empty());

    const nlohmann::json multisig = { { "name", "shared" },
        { "type", { { "multisig", true }, { "required", 2 }, { "total", 3 } } },
        { "mnemonic", "abandon about" }, { "keys", { "xpub1", "xpub2" } } };
    const auto shared = multisig.get<account_spec>();
    SPVD_RUNTIME_ASSERT(shared.type.multisig && shared.type.required == 2 && shared.type.total == 3);
    SPVD_RUNTIME_ASSERT(shared.mnemonic.value() == "abandon about");
    SPVD_RUNTIME_ASSERT(shared.keys.size() == 2);

    const auto parse = [](const nlohmann::json& json) { json.get<account_spec>(); };
    expect_throw<user_error>([&] { parse({ { "name", "" } }); }, "cannot be empty");
    expect_throw<user_error>([&] { parse(nlohmann::json::object()); }, "key name not found");
    expect_throw<user_error>(
        [&] {
            parse({ { "name", "x" }, { "type", { { "multisig", true }, { "required", 3 }, { "total", 2 } } } });
        },
        "Invalid multisig parameters");
    expect_throw<user_error>(
        [&] {
            parse({ { "name", "x" }, { "type", { { "multisig", true }, { "required", 1 }, { "total", 16 } } } });
        },
        "Invalid multisig parameters");
    expect_throw<user_error>([&] { parse({ { "name", "x" }, { "keys", { "a", "b" } } }); }, "Too many keys");
    expect_throw<user_error>([&] { parse({ { "name", "x" }, { "keys", { 1 } } }); }, "Invalid account key");
}

static void test_actions()
{
    const nlohmann::json create = { { "action", "create" },
        { "recipients",
            nlohmann::json::array({ { { "address", "mzBc4XEFSdzCDcTxAgf6EZXgsZWpztRhef" }, { "value", 1000 } } }) },
        { "fee_rate", 2000 }, { "sign", true } };
    const auto action = tx_action_from_json(create);
    const auto* spend = std::get_if<create_tx_action>(&action);
    SPVD_RUNTIME_ASSERT(spend != nullptr);
    SPVD_RUNTIME_ASSERT(spend->recipients.size() == 1 && spend->recipients[0].value == 1000);
    SPVD_RUNTIME_ASSERT(spend->fee_rate == 2000 && spend->sign && !spend->recipient_pays_fee);
    SPVD_RUNTIME_ASSERT(spend->minconf == 0);

    const auto imported = tx_action_from_json({ { "action", "import" }, { "tx", "0100" } });
    SPVD_RUNTIME_ASSERT(std::get<import_tx_action>(imported).tx == "0100");
    const auto sign = tx_action_from_json({ { "action", "sign" }, { "txid", "ab" } });
    SPVD_RUNTIME_ASSERT(std::get<sign_tx_action>(sign).txid == "ab");

    expect_throw<user_error>([] { tx_action_from_json({ { "action", "burn" } }); }, "Unknown transaction action");
    expect_throw<user_error>(
        [] { tx_action_from_json({ { "action", "create" }, { "recipients", nlohmann::json::array() } }); },
        "No recipients given");
    expect_throw<user_error>([] { tx_action_from_json({ { "action", "import" } }); }, "key tx not found");

    const auto rescan = node_action_from_json({ { "action", "rescan" }, { "timestamp", 1600000000 } });
    SPVD_RUNTIME_ASSERT(std::get<rescan_action>(rescan).timestamp.value() == 1600000000);
    const auto rescan_default = node_action_from_json({ { "action", "rescan" } });
    SPVD_RUNTIME_ASSERT(!std::get<rescan_action>(rescan_default).timestamp);
    SPVD_RUNTIME_ASSERT(std::holds_alternative<status_action>(node_action_from_json({ { "action", "status" } })));
    expect_throw<user_error>([] { node_action_from_json({ { "action", "reboot" } }); }, "Unknown node action");
    expect_throw<user_error>(
        [] { node_action_from_json(nlohmann::json::parse(R"({"action":"rescan","timestamp":-604800})")); },
        "invalid value for key timestamp");
}

static void test_encoding()
{
    account acc;
    acc.name = "shared";
    acc.master = "xprv-secret";
    acc.type.multisig = true;
    acc.type.required = 2;
    acc.type.total = 3;
    acc.keys = { "xpub1" };
    const nlohmann::json json = acc;
    SPVD_RUNTIME_ASSERT(json.at("complete") == false);
    SPVD_RUNTIME_ASSERT(json.at("type").at("required") == 2);
    // The private key is never encoded
    SPVD_RUNTIME_ASSERT(json.dump().find("xprv-secret") == std::string::npos);

    const block_ref best{ "block-10", 10 };
    SPVD_RUNTIME_ASSERT(tx_to_json(make_tx("a", 1, tx_confidence::pending), best).at("confirmations") == 0);
    const auto confirmed = tx_to_json(make_tx("b", 1, tx_confidence::confirmed, block_ref{ "block-10", 10 }), best);
    SPVD_RUNTIME_ASSERT(confirmed.at("confirmations") == 1);
    SPVD_RUNTIME_ASSERT(confirmed.at("confidence") == "confirmed");
    SPVD_RUNTIME_ASSERT(confirmed.at("confirmed_by").at("hash") == "block-10");
    // A block above the wallet's best is not yet counted
    SPVD_RUNTIME_ASSERT(get_confirmations(make_tx("c", 1, tx_confidence::confirmed, block_ref{ "x", 11 }), best) == 0);

    const nlohmann::json coin = { { "txid", "aa" }, { "vout", 1 }, { "script", "76a9" }, { "path", { 0, 3 } } };
    const auto parsed = coin.get<coin_sign_data>();
    SPVD_RUNTIME_ASSERT(parsed.path == std::vector<uint32_t>({ 0, 3 }));
    SPVD_RUNTIME_ASSERT(nlohmann::json(parsed) == coin);
    expect_throw<user_error>(
        [] {
            nlohmann::json({ { "txid", "aa" }, { "vout", 1 }, { "script", "" }, { "path", nlohmann::json::array() } })
                .get<coin_sign_data>();
        },
        "Invalid derivation path");
    expect_throw<user_error>(
        [] {
            nlohmann::json({ { "txid", "aa" }, { "vout", 1 }, { "script", "" }, { "path", { 0, 4294967296ull } } })
                .get<coin_sign_data>();
        },
        "Invalid derivation path");

    SPVD_RUNTIME_ASSERT(address_type_from_string("internal") == address_type::internal);
    expect_throw<user_error>([] { address_type_from_string("change"); });
}

int main()
{
    test_fetch_helpers();
    test_account_spec();
    test_actions();
    test_encoding();
    return 0;
}
