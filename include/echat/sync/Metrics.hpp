#ifndef ECHAT_SYNC_METRICS_HPP
#define ECHAT_SYNC_METRICS_HPP

/**
 * @file Metrics.hpp
 * @brief Prometheus-style counters for the sync core.
 *
 * One instance is owned by ChatCore and shared (by pointer) with the engine,
 * the outbound queue and the subscription hub. Any of those accept a null
 * pointer and then simply do not count.
 *
 * @code{.cpp}
 * echat::sync::SyncMetrics metrics;
 * metrics.events_received_total.fetch_add(1, std::memory_order_relaxed);
 * std::cout << metrics.render_prometheus();
 * @endcode
 */

#include <atomic>
#include <cstdint>
#include <string>

namespace echat::sync
{
    /**
     * @struct SyncMetrics
     * @brief Aggregated counters for synchronization activity.
     *
     * All fields are 64-bit atomics and can be incremented from any thread.
     */
    struct SyncMetrics
    {
        // ingestion
        std::atomic<std::uint64_t> events_received_total{0};
        std::atomic<std::uint64_t> duplicates_dropped_total{0};
        std::atomic<std::uint64_t> decryption_failures_total{0};
        std::atomic<std::uint64_t> redecryptions_total{0};
        std::atomic<std::uint64_t> reconnects_total{0};

        // outbound
        std::atomic<std::uint64_t> messages_sent_total{0};
        std::atomic<std::uint64_t> send_failures_total{0};
        std::atomic<std::uint64_t> send_retries_total{0};

        // subscriptions
        std::atomic<std::uint64_t> subscriptions_active{0};
        std::atomic<std::uint64_t> notifications_enqueued_total{0};
        std::atomic<std::uint64_t> notifications_drained_total{0};
        std::atomic<std::uint64_t> notifications_dropped_total{0};

        /**
         * @brief Render all counters in Prometheus text format (v0.0.4).
         */
        [[nodiscard]] std::string render_prometheus() const;
    };

} // namespace echat::sync

#endif // ECHAT_SYNC_METRICS_HPP
