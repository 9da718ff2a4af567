#include <atomic>

#include "session.hpp"
#include "utils.hpp"
#include "wally.hpp"

namespace spvd {

    namespace {
        static std::atomic_bool init_done{ false };
    } // namespace

    void init(const config& cfg)
    {
        set_log_level(cfg.log_level());

        if (init_done.exchange(true)) {
            return;
        }
        SPVD_VERIFY(wally_init(0));
        auto entropy = get_random_bytes<WALLY_SECP_RANDOMIZE_LEN>();
        SPVD_VERIFY(wally_secp_randomize(entropy.data(), entropy.size()));
        wally_bzero(entropy.data(), entropy.size());
    }

    session::session(const config& cfg, std::shared_ptr<store_pool> pool, std::shared_ptr<sync_service> sync)
        : m_config(cfg)
        , m_pool(std::move(pool))
        , m_storage_guard(cfg.db_concurrency())
        , m_sync(std::move(sync))
    {
        SPVD_RUNTIME_ASSERT_MSG(m_pool != nullptr, "session requires a store pool");
        SPVD_RUNTIME_ASSERT_MSG(!m_config.is_online() || m_sync != nullptr, "online session requires a sync service");
        SPVD_LOG_SEV(log_level::info) << "session created: mode " << (is_online() ? "online" : "offline")
                                      << ", storage concurrency " << storage_capacity();
    }

} // namespace spvd
