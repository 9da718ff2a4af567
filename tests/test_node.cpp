#include "src/assertion.hpp"
#include "src/exception.hpp"
#include "src/handler.hpp"
#include "tests/test_fakes.hpp"

#include "include/spvd.h"

// Node actions and the per-account sync window

using namespace spvd;
using namespace spvd::test;

static void setup_account(test_env& env)
{
    account_spec details;
    details.name = "main";
    env.handler.post_account(details);
    env.node->clear_calls();
}

static void test_rescan()
{
    test_env env(true);
    setup_account(env);

    // An explicit time is moved back by the rescan margin
    const uint64_t when = 1700000000;
    auto ret = env.handler.post_node(rescan_action{ when });
    SPVD_RUNTIME_ASSERT(ret.at("timestamp") == when - SPVD_RESCAN_MARGIN);
    SPVD_RUNTIME_ASSERT(
        env.node->get_calls() == std::vector<std::string>{ "rescan_from:" + std::to_string(when - SPVD_RESCAN_MARGIN) });
    SPVD_RUNTIME_ASSERT(env.pool->snapshot().rescan_resets == 1);

    // Times within the margin of the epoch clamp to zero
    ret = env.handler.post_node(rescan_action{ 1000 });
    SPVD_RUNTIME_ASSERT(ret.at("timestamp") == 0);

    // Without a time, rescan from the wallet's first address
    env.node->clear_calls();
    expect_throw<user_error>(
        [&env] { env.handler.post_node(rescan_action{}); }, "No keys have been generated in the wallet");
    SPVD_RUNTIME_ASSERT(env.node->get_calls().empty());

    env.pool->update([](wallet_data& data) { data.now = 1650000000; });
    env.handler.post_addresses("main", 0, address_type::external);
    env.node->clear_calls();
    ret = env.handler.post_node(rescan_action{});
    SPVD_RUNTIME_ASSERT(ret.at("timestamp") == 1650000000 - SPVD_RESCAN_MARGIN);
    SPVD_RUNTIME_ASSERT(env.node->count_calls("rescan_from:") == 1);

    // Offline, the time is computed but nothing is reset or sent
    test_env offline(false, false);
    setup_account(offline);
    ret = offline.handler.post_node(rescan_action{ when });
    SPVD_RUNTIME_ASSERT(ret.at("timestamp") == when - SPVD_RESCAN_MARGIN);
    SPVD_RUNTIME_ASSERT(offline.pool->snapshot().rescan_resets == 0);
}

static void test_status()
{
    test_env env(true);
    env.node->status.peers = 3;
    env.node->status.syncing = true;
    env.node->status.best_header = block_ref{ "block-50", 50 };
    env.pool->update([](wallet_data& data) { data.best = { "block-48", 48 }; });

    auto status = env.handler.post_node(status_action{});
    SPVD_RUNTIME_ASSERT(status.at("peers") == 3);
    SPVD_RUNTIME_ASSERT(status.at("syncing") == true);
    SPVD_RUNTIME_ASSERT(status.at("best_header").at("height") == 50);
    SPVD_RUNTIME_ASSERT(status.at("rescan_from").is_null());
    SPVD_RUNTIME_ASSERT(status.at("wallet_best_block").at("height") == 48);

    // A storage fault only loses the wallet's part of the report
    env.pool->update([](wallet_data& data) { data.fail_best_block = true; });
    status = env.handler.post_node(status_action{});
    SPVD_RUNTIME_ASSERT(status.at("peers") == 3);
    SPVD_RUNTIME_ASSERT(status.at("wallet_best_block").is_null());

    test_env offline(false, false);
    expect_throw<user_error>([&offline] { offline.handler.post_node(status_action{}); }, "No node state available");
}

static void test_sync_window()
{
    test_env env(true);
    setup_account(env);
    env.node->add_chain(0, 10);
    // A competing branch forking off after block-2
    env.node->add_chain(3, 6, "fork-");
    env.node->headers["fork-3"].prev_hash = "block-2";
    env.pool->update([](wallet_data& data) {
        data.best = { "block-10", 10 };
        data.txs = { make_tx("t4", 1, tx_confidence::confirmed, block_ref{ "block-4", 4 }),
            make_tx("t7", 1, tx_confidence::confirmed, block_ref{ "block-7", 7 }),
            make_tx("t7b", 1, tx_confidence::confirmed, block_ref{ "block-7", 7 }),
            make_tx("t7c", 2, tx_confidence::confirmed, block_ref{ "block-7", 7 }),
            make_tx("t9", 1, tx_confidence::confirmed, block_ref{ "block-9", 9 }) };
    });

    // Three blocks after block-5, in height order
    const auto window = env.handler.get_sync("main", "block-5", 3);
    SPVD_RUNTIME_ASSERT(window.size() == 3);
    SPVD_RUNTIME_ASSERT(window.at(0).at("block").at("hash") == "block-6");
    SPVD_RUNTIME_ASSERT(window.at(1).at("block").at("hash") == "block-7");
    SPVD_RUNTIME_ASSERT(window.at(2).at("block").at("hash") == "block-8");
    SPVD_RUNTIME_ASSERT(window.at(0).at("txs").empty());
    SPVD_RUNTIME_ASSERT(window.at(1).at("txs").size() == 2);
    SPVD_RUNTIME_ASSERT(window.at(1).at("txs").at(0).at("confirmations") == 4);
    SPVD_RUNTIME_ASSERT(window.at(2).at("txs").empty());

    // No limit runs up to the best block
    const auto unbounded = env.handler.get_sync("main", "block-5", 0);
    SPVD_RUNTIME_ASSERT(unbounded.size() == 5);
    SPVD_RUNTIME_ASSERT(unbounded.at(3).at("block").at("height") == 9);
    SPVD_RUNTIME_ASSERT(unbounded.at(3).at("txs").at(0).at("txid") == "t9");

    // Already at the best block
    const auto at_tip = env.handler.get_sync("main", "block-10", 3);
    SPVD_RUNTIME_ASSERT(at_tip.is_array() && at_tip.empty());

    expect_throw<user_error>([&env] { env.handler.get_sync("main", "fork-4", 3); }, "not an ancestor");
    expect_throw<user_error>([&env] { env.handler.get_sync("main", "block-99", 3); }, "Unknown block");
    expect_throw<not_found_error>([&env] { env.handler.get_sync("nobody", "block-5", 3); });

    test_env offline(false, false);
    setup_account(offline);
    expect_throw<user_error>(
        [&offline] { offline.handler.get_sync("main", "block-5", 3); }, "No node state available");
}

int main()
{
    test_rescan();
    test_status();
    test_sync_window();
    return 0;
}
