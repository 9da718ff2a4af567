#ifndef SPVD_SESSION_HPP
#define SPVD_SESSION_HPP
#pragma once

#include <memory>
#include <optional>
#include <type_traits>

#include "assertion.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "gsl_wrapper.hpp"
#include "logging.hpp"
#include "store.hpp"
#include "sync_service.hpp"
#include "threading.hpp"

namespace spvd {

    // Perform one-time process initialization (logging, libwally)
    void init(const config& cfg);

    // Process-wide resources shared by every request: configuration, the
    // store pool, the bound on concurrent storage transactions and the
    // optional sync service.
    class session final {
    public:
        session(const config& cfg, std::shared_ptr<store_pool> pool, std::shared_ptr<sync_service> sync);

        session(const session&) = delete;
        session& operator=(const session&) = delete;

        const config& get_config() const { return m_config; }
        bool is_online() const { return m_config.is_online(); }
        bool has_sync() const { return m_sync != nullptr; }
        size_t storage_capacity() const { return m_storage_guard.capacity(); }

        // Run fn(wallet_store&) as one storage transaction. Blocks until one
        // of the N storage permits is free. Commits on success; rolls back
        // and rethrows on any exception.
        template <typename F> auto run_storage(F&& fn)
        {
            using result_t = std::invoke_result_t<F, wallet_store&>;

            permit storage_permit{ m_storage_guard };
            auto txn = m_pool->begin();
            SPVD_RUNTIME_ASSERT(txn != nullptr);
            bool committed = false;
            auto rollback = gsl::finally([&txn, &committed] {
                if (!committed) {
                    txn->rollback();
                }
            });

            if constexpr (std::is_void_v<result_t>) {
                fn(txn->store());
                txn->commit();
                committed = true;
            } else {
                result_t ret = fn(txn->store());
                txn->commit();
                committed = true;
                return ret;
            }
        }

        // As run_storage, but a storage_error is logged and converted to an
        // empty result. Other errors propagate.
        template <typename F> auto try_storage(F&& fn) -> std::optional<std::invoke_result_t<F, wallet_store&>>
        {
            try {
                return run_storage(std::forward<F>(fn));
            } catch (const storage_error& e) {
                SPVD_LOG_SEV(log_level::error) << "A database error occurred: " << e.what();
            }
            return std::nullopt;
        }

        // Run fn(sync_service&). Calling this on a session without a sync
        // service is a programming error.
        template <typename F> auto run_sync(F&& fn)
        {
            SPVD_RUNTIME_ASSERT_MSG(m_sync != nullptr, "No node state available");
            return fn(*m_sync);
        }

        // Run step only when configured online
        template <typename F> void when_online(F&& step)
        {
            if (is_online()) {
                step();
            }
        }

    private:
        const config m_config;
        std::shared_ptr<store_pool> m_pool;
        semaphore m_storage_guard;
        std::shared_ptr<sync_service> m_sync;
    };

} // namespace spvd

#endif
