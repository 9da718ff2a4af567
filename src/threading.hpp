#ifndef SPVD_THREADING_HPP
#define SPVD_THREADING_HPP
#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

#include "assertion.hpp"
#include "utils.hpp"

namespace spvd {

    // Counting semaphore bounding concurrent access to a shared resource
    class semaphore {
    public:
        explicit semaphore(size_t count)
            : m_capacity(count)
            , m_available(count)
        {
            SPVD_RUNTIME_ASSERT_MSG(count != 0, "semaphore capacity must be non-zero");
        }

        semaphore(const semaphore&) = delete;
        semaphore(semaphore&&) = delete;
        semaphore& operator=(const semaphore&) = delete;
        semaphore& operator=(semaphore&&) = delete;

        void acquire()
        {
            std::unique_lock<std::mutex> locker{ m_mutex };
            m_cv.wait(locker, [this] { return m_available != 0; });
            --m_available;
        }

        void release()
        {
            {
                std::unique_lock<std::mutex> locker{ m_mutex };
                SPVD_RUNTIME_ASSERT(m_available < m_capacity);
                ++m_available;
            }
            m_cv.notify_one();
        }

        size_t capacity() const { return m_capacity; }

    private:
        const size_t m_capacity;
        size_t m_available;
        std::mutex m_mutex;
        std::condition_variable m_cv;
    };

    // Scoped permit: blocks until a slot is free, releases it on every exit path
    class permit {
    public:
        explicit permit(semaphore& sem)
            : m_sem(sem)
        {
            m_sem.acquire();
        }

        ~permit()
        {
            no_std_exception_escape([this] { m_sem.release(); }, "permit release");
        }

        permit(const permit&) = delete;
        permit(permit&&) = delete;
        permit& operator=(const permit&) = delete;
        permit& operator=(permit&&) = delete;

    private:
        semaphore& m_sem;
    };

} // namespace spvd

#endif
