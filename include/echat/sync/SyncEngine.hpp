#ifndef ECHAT_SYNC_SYNC_ENGINE_HPP
#define ECHAT_SYNC_SYNC_ENGINE_HPP

/**
 * @file SyncEngine.hpp
 * @brief Ingestion loop of one account.
 *
 * @details
 * State machine:
 *
 *   Disconnected -> Connecting -> Syncing -> Backoff(n) -> Connecting ...
 *   Backoff(n > maxRetries)        -> Disconnected (lastError set)
 *   Connecting|Syncing + AuthError -> Disconnected (needsLogin)
 *
 * The loop runs on a private single-threaded io_context, so the blocking
 * long poll of one account never occupies a shared worker and its steps are
 * naturally serialised. Every step checks the CancellationToken of the run
 * it belongs to; a stopped run never writes to the store again.
 *
 * Per raw event: translate -> dedupe -> decrypt -> apply. The cursor is
 * persisted only after every event of the batch has been applied.
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <echat/sync/BackendAdapter.hpp>
#include <echat/sync/CancellationToken.hpp>
#include <echat/sync/ConversationStore.hpp>
#include <echat/sync/Metrics.hpp>
#include <echat/sync/StateStore.hpp>
#include <echat/sync/SubscriptionHub.hpp>
#include <echat/sync/config.hpp>

namespace echat::sync
{
    class SyncEngine
    {
    public:
        using StatusListener = std::function<void(const AccountStatus &)>;
        using ChangeSink = std::function<void(const Change &)>;

        SyncEngine(std::shared_ptr<IBackendAdapter> adapter,
                   ConversationStore &store,
                   IStateStore &state,
                   const Config &config,
                   SyncMetrics *metrics = nullptr);

        ~SyncEngine();

        SyncEngine(const SyncEngine &) = delete;
        SyncEngine &operator=(const SyncEngine &) = delete;

        /// Receives every status transition. Called from the ingestion thread.
        void set_status_listener(StatusListener listener);

        /// Receives presence and typing changes (not stored).
        void set_change_sink(ChangeSink sink);

        /// Begin a new run: Disconnected -> Connecting. Waits for a previous run to exit.
        void start(Credentials credentials);

        /// Cancel the current run. Does not wait for an in-flight long poll.
        void stop();

        /// Wait until the ingestion thread of the last run has exited.
        void join();

        [[nodiscard]] AccountStatus status() const;
        [[nodiscard]] const AccountId &account() const noexcept;
        [[nodiscard]] BackendKind kind() const noexcept;
        [[nodiscard]] std::string self_id() const;

        IBackendAdapter &adapter() noexcept { return *adapter_; }

        /// Translate, dedupe, decrypt and apply a list of raw events. Returns how many were applied.
        std::size_t ingest(const std::vector<RawEvent> &events, bool live);

        /**
         * @brief Fetch and apply one page of older history. Blocking.
         *
         * Never moves the sync cursor. Returns 0 when another page of the same
         * conversation is already being fetched or the beginning was reached.
         * Backend errors propagate to the caller.
         */
        std::size_t fetch_history_page(const ConversationId &conversation);

        /// Targeted re-decryption pass after a key for @p sessionId arrived. No network I/O.
        std::size_t redecrypt(const std::string &sessionId);

    private:
        bool process(const SyncEvent &ev, bool live);
        bool process_message(const MessageEvent &m, bool live);
        void handle_keys(const KeyEvent &k);
        void emit(const Change &change);

        void connect_step(CancellationToken token);
        void poll_step(CancellationToken token);
        void schedule_backoff(const CancellationToken &token, const std::string &why);
        void fail(const CancellationToken &token, const std::string &why, bool needsLogin);

        /// Apply @p fn to the status if the run is still current, then notify.
        template <typename Fn>
        void update_status(const CancellationToken &token, Fn &&fn);

    private:
        std::shared_ptr<IBackendAdapter> adapter_;
        ConversationStore &store_;
        IStateStore &state_;
        Config config_;
        SyncMetrics *metrics_;

        mutable std::mutex mutex_;
        AccountStatus status_;
        Credentials credentials_;
        CancellationToken token_;
        StatusListener statusListener_;
        ChangeSink changeSink_;
        bool seeded_{false};

        // owned by the ingestion thread
        std::unique_ptr<boost::asio::io_context> ioc_;
        std::unique_ptr<boost::asio::steady_timer> timer_;
        std::unique_ptr<IEventStream> stream_;
        std::thread thread_;

        std::mutex historyMutex_;
        std::set<ConversationId> historyInFlight_;
    };

} // namespace echat::sync

#endif // ECHAT_SYNC_SYNC_ENGINE_HPP
