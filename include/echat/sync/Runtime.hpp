#pragma once

#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace echat::sync
{
    /**
     * @brief io_context with its worker threads.
     *
     * The core owns one shared instance for timers. Each account gets a
     * small one of its own for blocking backend calls. One thread is a
     * valid configuration.
     */
    class Runtime
    {
    public:
        explicit Runtime(std::size_t threads);
        ~Runtime();

        Runtime(const Runtime &) = delete;
        Runtime &operator=(const Runtime &) = delete;
        Runtime(Runtime &&) = delete;
        Runtime &operator=(Runtime &&) = delete;

        boost::asio::io_context &context() noexcept { return ioc_; }

        /// Drop the work guard, stop the context and join every thread. Idempotent.
        void stop() noexcept;

        std::size_t thread_count() const noexcept { return threads_.size(); }

    private:
        boost::asio::io_context ioc_;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
        std::vector<std::thread> threads_;
        std::atomic<bool> stopped_{false};
    };

} // namespace echat::sync
