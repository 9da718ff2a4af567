#ifndef SPVD_IO_RUNNER_HPP
#define SPVD_IO_RUNNER_HPP
#pragma once

#include <memory>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace spvd {

    // An io_context serviced by a single dedicated thread. Handlers posted
    // to it run one at a time, in posting order.
    class io_runner {
    public:
        io_runner();
        ~io_runner();

        io_runner(const io_runner&) = delete;
        io_runner(io_runner&&) = delete;
        io_runner& operator=(const io_runner&) = delete;
        io_runner& operator=(io_runner&&) = delete;

        boost::asio::io_context& get_io_context();

        // True when called from a handler executing on the runner thread
        bool running_in_this_thread() const;

    private:
        std::unique_ptr<boost::asio::io_context> m_io;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> m_work_guard;
        std::thread m_run_thread;
    };

} // namespace spvd

#endif
