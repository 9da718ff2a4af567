#ifndef SPVD_SYNC_SERVICE_HPP
#define SPVD_SYNC_SERVICE_HPP
#pragma once

#include <future>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/asio/post.hpp>

#include "assertion.hpp"
#include "io_runner.hpp"
#include "sync_state.hpp"
#include "types.hpp"

namespace spvd {

    // Owns the node's sync_state and serializes every access to it through
    // a single-threaded executor. Callers submit whole operations and block
    // for the result; they never hold a reference into the state.
    class sync_service final {
    public:
        explicit sync_service(std::shared_ptr<sync_state> state);
        ~sync_service();

        sync_service(const sync_service&) = delete;
        sync_service& operator=(const sync_service&) = delete;

        // Run fn(sync_state&) on the service thread. Its result, or the
        // exception it threw, is returned to the caller.
        template <typename F> auto atomic_operation(F&& fn)
        {
            using result_t = std::invoke_result_t<F, sync_state&>;
            SPVD_RUNTIME_ASSERT_MSG(!m_runner.running_in_this_thread(), "re-entrant sync operation");

            auto promise = std::make_shared<std::promise<result_t>>();
            auto future = promise->get_future();
            boost::asio::post(m_runner.get_io_context(), [this, promise, fn = std::forward<F>(fn)]() mutable {
                try {
                    if constexpr (std::is_void_v<result_t>) {
                        fn(*m_state);
                        promise->set_value();
                    } else {
                        promise->set_value(fn(*m_state));
                    }
                } catch (...) {
                    promise->set_exception(std::current_exception());
                }
            });
            return future.get();
        }

        void send_bloom_filter(const bloom_filter& filter);
        void broadcast_txs(const std::vector<std::string>& txs);
        void rescan_from(uint64_t timestamp);
        node_status get_status();
        std::vector<block_node> main_chain(const std::string& tip, const std::string& target);

    private:
        std::shared_ptr<sync_state> m_state;
        io_runner m_runner;
    };

} // namespace spvd

#endif
