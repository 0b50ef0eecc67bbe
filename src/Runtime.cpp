#include <echat/sync/Runtime.hpp>

#include <algorithm>
#include <exception>

#include <vix/utils/Logger.hpp>

namespace echat::sync
{
    Runtime::Runtime(std::size_t threads)
        : ioc_(static_cast<int>(std::max<std::size_t>(1, threads))),
          work_(boost::asio::make_work_guard(ioc_))
    {
        const std::size_t n = std::max<std::size_t>(1, threads);
        threads_.reserve(n);

        for (std::size_t i = 0; i < n; ++i)
        {
            threads_.emplace_back([this, i]()
                                  {
                auto &log = vix::utils::Logger::getInstance();
                for (;;)
                {
                    try
                    {
                        ioc_.run();
                        break;
                    }
                    catch (const std::exception &e)
                    {
                        // handlers report their own errors; keep the worker alive
                        log.log(vix::utils::Logger::Level::ERROR,
                                "[sync][runtime] worker {} handler threw: {}", i, e.what());
                    }
                } });
        }
    }

    Runtime::~Runtime()
    {
        stop();
    }

    void Runtime::stop() noexcept
    {
        bool expected = false;
        if (!stopped_.compare_exchange_strong(expected, true))
            return;

        work_.reset();
        ioc_.stop();

        for (auto &t : threads_)
        {
            if (t.joinable() && t.get_id() != std::this_thread::get_id())
                t.join();
            else if (t.joinable())
                t.detach();
        }
    }

} // namespace echat::sync
