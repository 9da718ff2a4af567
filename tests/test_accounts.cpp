#include "src/assertion.hpp"
#include "src/exception.hpp"
#include "src/handler.hpp"
#include "tests/test_fakes.hpp"

// Account handlers and the filter refreshes they trigger

using namespace spvd;
using namespace spvd::test;

static account_spec multisig_spec(const std::string& name)
{
    account_spec details;
    details.name = name;
    details.type.multisig = true;
    details.type.required = 2;
    details.type.total = 3;
    return details;
}

static void test_create_and_list()
{
    test_env env(true);

    account_spec details;
    details.name = "spending";
    const auto created = env.handler.post_account(details);
    SPVD_RUNTIME_ASSERT(created.at("name") == "spending");
    SPVD_RUNTIME_ASSERT(created.at("complete") == true);
    SPVD_RUNTIME_ASSERT(created.contains("mnemonic"));
    SPVD_RUNTIME_ASSERT(!created.contains("master"));
    // A complete account is added to the node's filter straight away
    SPVD_RUNTIME_ASSERT(env.node->count_calls("send_bloom_filter") == 1);

    // An incomplete multisig account is not
    env.node->clear_calls();
    const auto pending = env.handler.post_account(multisig_spec("shared"));
    SPVD_RUNTIME_ASSERT(pending.at("complete") == false);
    SPVD_RUNTIME_ASSERT(env.node->get_calls().empty());

    const auto all = env.handler.get_accounts({});
    SPVD_RUNTIME_ASSERT(all.at("total") == 2);
    SPVD_RUNTIME_ASSERT(all.at("accounts").size() == 2);

    list_request request;
    request.offset = 1;
    request.limit = 5;
    const auto page = env.handler.get_accounts(request);
    SPVD_RUNTIME_ASSERT(page.at("total") == 2);
    SPVD_RUNTIME_ASSERT(page.at("accounts").size() == 1);
    SPVD_RUNTIME_ASSERT(page.at("accounts").at(0).at("name") == "shared");

    expect_throw<user_error>([&env] { env.handler.post_account(multisig_spec("shared")); }, "already exists");
}

static void test_account_keys()
{
    test_env env(true);
    env.handler.post_account(multisig_spec("shared"));

    // One of two missing keys: still incomplete, no refresh
    auto acc = env.handler.post_account_keys("shared", { "xpub-bob" });
    SPVD_RUNTIME_ASSERT(acc.at("complete") == false);
    SPVD_RUNTIME_ASSERT(env.node->count_calls("send_bloom_filter") == 0);

    // The last key completes the account: exactly one refresh
    acc = env.handler.post_account_keys("shared", { "xpub-carol" });
    SPVD_RUNTIME_ASSERT(acc.at("complete") == true);
    SPVD_RUNTIME_ASSERT(acc.at("keys").size() == 3);
    SPVD_RUNTIME_ASSERT(env.node->count_calls("send_bloom_filter") == 1);

    expect_throw<user_error>([&env] { env.handler.post_account_keys("shared", { "xpub-dave" }); }, "Too many keys");
    expect_throw<user_error>([&env] { env.handler.post_account_keys("shared", {}); }, "No keys given");
    expect_throw<not_found_error>([&env] { env.handler.post_account_keys("nobody", { "xpub-erin" }); });
    SPVD_RUNTIME_ASSERT(env.node->count_calls("send_bloom_filter") == 1);
}

static void test_gap_and_rename()
{
    test_env env(true);
    account_spec details;
    details.name = "savings";
    env.handler.post_account(details);
    env.node->clear_calls();

    const auto acc = env.handler.post_account_gap("savings", 25);
    SPVD_RUNTIME_ASSERT(acc.at("gap") == 25);
    SPVD_RUNTIME_ASSERT(env.node->count_calls("send_bloom_filter") == 1);
    expect_throw<user_error>([&env] { env.handler.post_account_gap("savings", 0); }, "Gap must be positive");

    const auto renamed = env.handler.rename_account("savings", "cold");
    SPVD_RUNTIME_ASSERT(renamed.at("name") == "cold");
    SPVD_RUNTIME_ASSERT(env.handler.get_account("cold").at("gap") == 25);
    expect_throw<not_found_error>([&env] { env.handler.get_account("savings"); });
    expect_throw<user_error>([&env] { env.handler.rename_account("cold", ""); }, "cannot be empty");
}

static void test_offline_mode()
{
    test_env env(false);

    account_spec details;
    details.name = "watch";
    details.type.read_only = true;
    details.keys = { "xpub-watch" };
    const auto created = env.handler.post_account(details);
    SPVD_RUNTIME_ASSERT(created.at("complete") == true);
    SPVD_RUNTIME_ASSERT(!created.contains("mnemonic"));
    env.handler.post_account_gap("watch", 30);

    // Offline sessions never talk to the node
    SPVD_RUNTIME_ASSERT(env.node->get_calls().empty());
    SPVD_RUNTIME_ASSERT(env.pool->snapshot().bloom_reads == 0);
}

static void test_refresh_failure()
{
    test_env env(true);
    env.pool->update([](wallet_data& data) { data.fail_bloom_filter = true; });

    account_spec details;
    details.name = "doomed";
    expect_throw<storage_error>([&env, &details] { env.handler.post_account(details); });
    // The account itself was committed before the refresh failed
    SPVD_RUNTIME_ASSERT(env.pool->snapshot().accounts.size() == 1);
    SPVD_RUNTIME_ASSERT(env.node->get_calls().empty());

    // Startup filter loading tolerates the same failure
    env.handler.load_initial_filter();
    SPVD_RUNTIME_ASSERT(env.node->get_calls().empty());

    env.pool->update([](wallet_data& data) { data.fail_bloom_filter = false; });
    env.handler.load_initial_filter();
    SPVD_RUNTIME_ASSERT(env.node->count_calls("send_bloom_filter") == 1);
}

int main()
{
    test_create_and_list();
    test_account_keys();
    test_gap_and_rename();
    test_offline_mode();
    test_refresh_failure();
    return 0;
}
