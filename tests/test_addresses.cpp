#include "src/assertion.hpp"
#include "src/exception.hpp"
#include "src/handler.hpp"
#include "tests/test_fakes.hpp"

// Address listing, balances and generation

using namespace spvd;
using namespace spvd::test;

static void setup_account(test_env& env)
{
    account_spec details;
    details.name = "main";
    env.handler.post_account(details);
    env.node->clear_calls();
}

static address_balance make_balance(uint32_t index, uint64_t in, uint32_t coins)
{
    address_balance balance;
    balance.index = index;
    balance.in = in;
    balance.coins = coins;
    return balance;
}

static void test_generate()
{
    test_env env(true);
    setup_account(env);

    const auto generated = env.handler.post_addresses("main", 4, address_type::external);
    SPVD_RUNTIME_ASSERT(generated.at("count") == 5);
    // Exactly one filter refresh per generation request
    SPVD_RUNTIME_ASSERT(env.node->get_calls() == std::vector<std::string>{ "send_bloom_filter" });

    // Nothing new to generate still refreshes the filter
    SPVD_RUNTIME_ASSERT(env.handler.post_addresses("main", 2, address_type::external).at("count") == 0);
    SPVD_RUNTIME_ASSERT(env.node->count_calls("send_bloom_filter") == 2);

    const auto internal = env.handler.post_addresses("main", 0, address_type::internal);
    SPVD_RUNTIME_ASSERT(internal.at("count") == 1);

    expect_throw<not_found_error>([&env] { env.handler.post_addresses("nobody", 1, address_type::external); });

    test_env offline(false);
    setup_account(offline);
    offline.handler.post_addresses("main", 1, address_type::external);
    SPVD_RUNTIME_ASSERT(offline.node->get_calls().empty());
}

static void test_addresses_with_balances()
{
    test_env env(false);
    setup_account(env);
    env.handler.post_addresses("main", 5, address_type::external);

    // Balances exist for indexes 1, 3 and 9; 9 is outside any page
    env.pool->update([](wallet_data& data) {
        data.balances[{ 1, address_type::external }]
            = { make_balance(1, 1000, 1), make_balance(3, 5000, 2), make_balance(9, 7, 1) };
    });

    list_request request;
    request.offset = 1;
    request.limit = 3;
    const auto page = env.handler.get_addresses("main", address_type::external, 2, true, request);
    SPVD_RUNTIME_ASSERT(page.at("total") == 6);
    // Only addresses of the page that have a balance entry, in page order
    const auto& addrs = page.at("addresses");
    SPVD_RUNTIME_ASSERT(addrs.size() == 2);
    SPVD_RUNTIME_ASSERT(addrs.at(0).at("index") == 1);
    SPVD_RUNTIME_ASSERT(addrs.at(0).at("balance").at("in") == 1000);
    SPVD_RUNTIME_ASSERT(addrs.at(1).at("index") == 3);
    SPVD_RUNTIME_ASSERT(addrs.at(1).at("balance").at("coins") == 2);
    const auto data = env.pool->snapshot();
    SPVD_RUNTIME_ASSERT(data.last_minconf == 2 && data.last_offline);

    request.reverse = true;
    const auto reversed = env.handler.get_addresses("main", address_type::external, 0, false, request);
    // Reversed, the page covers indexes 4, 3 and 2
    SPVD_RUNTIME_ASSERT(reversed.at("addresses").size() == 1);
    SPVD_RUNTIME_ASSERT(reversed.at("addresses").at(0).at("index") == 3);

    // An empty page has no balances to look up
    request.offset = 50;
    const auto empty = env.handler.get_addresses("main", address_type::internal, 0, false, request);
    SPVD_RUNTIME_ASSERT(empty.at("addresses").empty());
    SPVD_RUNTIME_ASSERT(empty.at("total") == 0);

    const auto unused = env.handler.get_unused_addresses("main", address_type::external, {});
    SPVD_RUNTIME_ASSERT(unused.at("total") == 4);
    for (const auto& addr : unused.at("addresses")) {
        SPVD_RUNTIME_ASSERT(addr.at("index") != 1 && addr.at("index") != 3);
    }
}

static void test_single_address()
{
    test_env env(false);
    setup_account(env);
    env.handler.post_addresses("main", 2, address_type::external);
    env.pool->update([](wallet_data& data) {
        data.balances[{ 1, address_type::external }] = { make_balance(2, 300, 1) };
    });

    const auto with_balance = env.handler.get_address("main", 2, address_type::external, 0, false);
    SPVD_RUNTIME_ASSERT(with_balance.at("address") == "addr-1-external-2");
    SPVD_RUNTIME_ASSERT(with_balance.at("balance").at("in") == 300);

    const auto without_balance = env.handler.get_address("main", 0, address_type::external, 0, false);
    SPVD_RUNTIME_ASSERT(without_balance.at("balance").is_null());

    const auto labelled = env.handler.put_address_label("main", 1, address_type::external, "rent");
    SPVD_RUNTIME_ASSERT(labelled.at("label") == "rent");
    SPVD_RUNTIME_ASSERT(env.handler.get_address("main", 1, address_type::external, 0, false).at("label") == "rent");

    expect_throw<not_found_error>([&env] { env.handler.get_address("main", 7, address_type::external, 0, false); });
    expect_throw<not_found_error>(
        [&env] { env.handler.put_address_label("main", 0, address_type::internal, "change"); });
}

int main()
{
    test_generate();
    test_addresses_with_balances();
    test_single_address();
    return 0;
}
