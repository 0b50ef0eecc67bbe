#ifndef ECHAT_SYNC_CONFIG_HPP
#define ECHAT_SYNC_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Sync-core configuration built from the core Vix config.
 *
 * @details
 * Wraps `vix::config::Config` into a strongly-typed structure used by the
 * engine, the outbound queue and the subscription hub. Every knob has a
 * default so an empty config file yields a working core.
 */

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <vix/config/Config.hpp>

#include <echat/sync/types.hpp>

namespace echat::sync
{
    /// Capped exponential backoff parameters.
    struct BackoffPolicy
    {
        std::chrono::milliseconds initial{500};
        double multiplier = 2.0;
        std::chrono::milliseconds max{60000};
        unsigned maxRetries = 8; ///< attempts after the first one

        /// Delay before retry number @p attempt (1-based).
        [[nodiscard]] std::chrono::milliseconds delay(unsigned attempt) const noexcept;
    };

    /**
     * @struct Credentials
     * @brief Login material for one account.
     *
     * `params` holds the backend specific login fields (homeserver, user,
     * password / api_id, phone, code ...). `session` holds what the adapter
     * returned from a previous successful connect (access token, device id)
     * so a restart does not need a fresh login.
     */
    struct Credentials
    {
        BackendKind backend = BackendKind::Matrix;
        nlohmann::json params = nlohmann::json::object();
        nlohmann::json session = nlohmann::json::object();
    };

    struct AccountConfig
    {
        AccountId account;
        Credentials credentials;
    };

    /**
     * @struct Config
     * @brief Tunables controlling the sync core.
     */
    struct Config
    {
        /// Worker threads of the shared io_context (minimum 1). Timers only, never backend calls.
        std::size_t workerThreads = 2;

        /// Threads per account running its blocking backend calls (minimum 1).
        std::size_t accountThreads = 2;

        /// Reconnect backoff of the ingestion loop.
        BackoffPolicy reconnect{};

        /// Retry policy of outbound commands. maxRetries + 1 = max attempts.
        BackoffPolicy send{std::chrono::milliseconds{250}, 2.0, std::chrono::milliseconds{8000}, 4};

        /// Time an outbound command may stay unacknowledged.
        std::chrono::milliseconds reconcileTimeout{30000};

        std::size_t historyPageSize = 50;

        /// Long-poll timeout handed to the adapters.
        std::chrono::milliseconds longPollTimeout{30000};

        std::size_t subscriptionBuffer = 1024;
        std::chrono::seconds subscriptionTtl{300};

        std::string stateDb = "echat-state.db";

        [[nodiscard]] unsigned send_max_attempts() const noexcept { return send.maxRetries + 1; }

        /**
         * @brief Build a Config from the core Vix config.
         *
         * Keys (all optional):
         *  - sync.worker_threads, sync.account_threads, sync.history_page_size
         *  - sync.backoff.initial_ms, sync.backoff.multiplier_pct,
         *    sync.backoff.max_ms, sync.backoff.max_retries
         *  - sync.send.max_attempts, sync.send.initial_ms, sync.send.max_ms
         *  - sync.reconcile_timeout_ms, sync.long_poll_timeout_ms
         *  - sync.subscription.buffer, sync.subscription.ttl_s
         *  - sync.state_db
         */
        static Config from_core(const vix::config::Config &core);

        /**
         * @brief Accounts configured under `matrix.*` and `telegram.*`.
         *
         * An account is listed only when its mandatory keys are present
         * (matrix: homeserver, user; telegram: api_id, api_hash, phone).
         */
        static std::vector<AccountConfig> accounts_from_core(const vix::config::Config &core);
    };

} // namespace echat::sync

#endif // ECHAT_SYNC_CONFIG_HPP
