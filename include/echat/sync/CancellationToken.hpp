#pragma once

#include <atomic>
#include <memory>

namespace echat::sync
{
    /**
     * @brief Shared cancellation flag.
     *
     * Copies share the same state. Completions check `cancelled()` before
     * they touch the store; a long poll checks it between requests.
     */
    class CancellationToken
    {
    public:
        CancellationToken()
            : flag_(std::make_shared<std::atomic<bool>>(false))
        {
        }

        void cancel() noexcept { flag_->store(true, std::memory_order_release); }

        bool cancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

        explicit operator bool() const noexcept { return cancelled(); }

    private:
        std::shared_ptr<std::atomic<bool>> flag_;
    };

} // namespace echat::sync
