#include "handler.hpp"
#include "logging.hpp"
#include "session.hpp"

namespace spvd {

    request_handler::request_handler(session& s)
        : m_session(s)
    {
    }

    nlohmann::json request_handler::get_accounts(const list_request& request)
    {
        SPVD_LOG_SEV(log_level::info) << "GetAccounts offset:" << request.offset << " limit:" << request.limit
                                      << " reverse:" << request.reverse;

        const auto page = m_session.run_storage([&request](wallet_store& store) { return store.accounts(request); });
        return { { "accounts", page.first }, { "total", page.second } };
    }

    nlohmann::json request_handler::get_account(const std::string& name)
    {
        SPVD_LOG_SEV(log_level::info) << "GetAccount " << name;

        return m_session.run_storage([&name](wallet_store& store) { return store.get_account(name); });
    }

    nlohmann::json request_handler::post_account(const account_spec& details)
    {
        SPVD_LOG_SEV(log_level::info) << "PostAccount " << details.name << " keys:" << details.keys.size();

        const auto created
            = m_session.run_storage([&details](wallet_store& store) { return store.new_account(details); });
        m_session.when_online([this, &created] { refresh_if_complete(created.first); });

        nlohmann::json ret = created.first;
        if (created.second) {
            ret["mnemonic"] = *created.second;
        }
        return ret;
    }

    nlohmann::json request_handler::rename_account(const std::string& old_name, const std::string& new_name)
    {
        SPVD_LOG_SEV(log_level::info) << "RenameAccount " << old_name << " to " << new_name;
        SPVD_USER_ASSERT(!new_name.empty(), "Account name cannot be empty");

        return m_session.run_storage([&old_name, &new_name](wallet_store& store) {
            const auto acc = store.get_account(old_name);
            return store.rename_account(acc, new_name);
        });
    }

    nlohmann::json request_handler::post_account_keys(const std::string& name, const std::vector<std::string>& keys)
    {
        SPVD_LOG_SEV(log_level::info) << "PostAccountKeys " << name << " keys:" << keys.size();
        SPVD_USER_ASSERT(!keys.empty(), "No keys given");

        const auto acc = m_session.run_storage([&name, &keys](wallet_store& store) {
            const auto current = store.get_account(name);
            return store.add_account_keys(current, keys);
        });
        m_session.when_online([this, &acc] { refresh_if_complete(acc); });
        return acc;
    }

    nlohmann::json request_handler::post_account_gap(const std::string& name, uint32_t gap)
    {
        SPVD_LOG_SEV(log_level::info) << "PostAccountGap " << name << " gap:" << gap;
        SPVD_USER_ASSERT(gap != 0, "Gap must be positive");

        const auto acc = m_session.run_storage([&name, gap](wallet_store& store) {
            const auto current = store.get_account(name);
            return store.set_account_gap(current, gap);
        });
        // The watched address window changed
        m_session.when_online([this] { update_node_filter(); });
        return acc;
    }

    void request_handler::refresh_if_complete(const account& acc)
    {
        if (acc.is_complete()) {
            update_node_filter();
        }
    }

    void request_handler::update_node_filter()
    {
        SPVD_LOG_SEV(log_level::info) << "Sending a new bloom filter";

        const auto filter = m_session.run_storage([](wallet_store& store) { return store.get_bloom_filter(); });
        m_session.run_sync([&filter](sync_service& sync) { sync.send_bloom_filter(filter); });
    }

    void request_handler::load_initial_filter()
    {
        m_session.when_online([this] {
            const auto filter
                = m_session.try_storage([](wallet_store& store) { return store.get_bloom_filter(); });
            if (!filter) {
                SPVD_LOG_SEV(log_level::warning) << "Starting without a bloom filter";
                return;
            }
            SPVD_LOG_SEV(log_level::info) << "Loaded bloom filter with " << filter->elements << " elements";
            m_session.run_sync([&filter](sync_service& sync) { sync.send_bloom_filter(*filter); });
        });
    }

} // namespace spvd
