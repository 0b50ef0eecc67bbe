#ifndef ECHAT_SYNC_CHAT_CORE_HPP
#define ECHAT_SYNC_CHAT_CORE_HPP

/**
 * @file ChatCore.hpp
 * @brief The only surface the presentation layer talks to.
 *
 * @details
 * ChatCore owns the whole sync core:
 *
 *   - the durable state store (credentials, cursors, crypto pickles)
 *   - the conversation store and participant registry
 *   - one SyncEngine and one adapter per account
 *   - the outbound command queue, with timers on the shared pool and backend calls on per-account io lanes
 *   - the subscription hub fed by store, engines and queue
 *
 * A frame of the presentation layer typically does:
 *
 * @code{.cpp}
 * echat::sync::ChatCore core(config);
 * auto sub = core.subscribe();
 * // render sub.snapshot ...
 * for (const auto &change : core.poll(sub.id).value_or({}))
 *     if (change.conversation)
 *         render(core.get_conversation(*change.conversation));
 * @endcode
 *
 * Reads never wait for the network: they copy published shared pointers.
 */

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include <echat/sync/BackendAdapter.hpp>
#include <echat/sync/ConversationStore.hpp>
#include <echat/sync/Metrics.hpp>
#include <echat/sync/OutboundQueue.hpp>
#include <echat/sync/Runtime.hpp>
#include <echat/sync/StateStore.hpp>
#include <echat/sync/SubscriptionHub.hpp>
#include <echat/sync/SyncEngine.hpp>
#include <echat/sync/config.hpp>

namespace echat::sync
{
    /// Immutable view of the whole model at one instant.
    struct Snapshot
    {
        std::vector<ConversationStatePtr> conversations; ///< most recent activity first
        std::shared_ptr<const ParticipantRegistry::Map> participants;
        std::vector<AccountStatus> accounts;
    };

    struct Subscription
    {
        SubscriptionId id = 0;
        Snapshot snapshot;
    };

    /// Builds the adapter of a new account. The default one knows Matrix and Telegram.
    using AdapterFactory = std::function<std::shared_ptr<IBackendAdapter>(
        const AccountId &, BackendKind, IStateStore &, const Config &)>;

    class ChatCore
    {
    public:
        /// State lives in the SQLite file named by `config.stateDb`.
        explicit ChatCore(const Config &config);

        ChatCore(const Config &config, std::shared_ptr<IStateStore> state, AdapterFactory factory = {});

        ~ChatCore();

        ChatCore(const ChatCore &) = delete;
        ChatCore &operator=(const ChatCore &) = delete;
        ChatCore(ChatCore &&) = delete;
        ChatCore &operator=(ChatCore &&) = delete;

        // ───────────── accounts ─────────────

        /**
         * @brief Register an account and persist its credentials.
         *
         * Re-adding a known account replaces its login parameters but keeps the
         * stored session. Throws std::invalid_argument for an empty id or an
         * unknown backend.
         */
        void add_account(const AccountId &account, const Credentials &credentials);

        /// Register every account with stored credentials. Returns how many were added.
        std::size_t restore_accounts();

        /// Start (or restart) the ingestion loop of @p account.
        void connect(const AccountId &account);

        /// Merge @p params into the login parameters (e.g. a Telegram code) and reconnect.
        void login(const AccountId &account, const nlohmann::json &params);

        /// Stop syncing @p account and cancel its outbound commands. Other accounts are untouched.
        void disconnect(const AccountId &account);

        /// Disconnect and drop every persisted trace of @p account. Its conversations stay archived.
        void remove_account(const AccountId &account);

        [[nodiscard]] std::optional<AccountStatus> account_status(const AccountId &account) const;
        [[nodiscard]] std::vector<AccountStatus> accounts() const;

        // ───────────── presentation ─────────────

        Subscription subscribe(std::optional<AccountId> account = std::nullopt);

        /// Drain pending changes. nullopt when the subscription expired or is unknown.
        std::optional<std::vector<Change>> poll(SubscriptionId id, std::size_t maxChanges = 256);

        bool unsubscribe(SubscriptionId id);

        [[nodiscard]] Snapshot snapshot(const std::optional<AccountId> &account = std::nullopt) const;

        [[nodiscard]] ConversationStatePtr get_conversation(const ConversationId &id) const;

        SubmitResult submit(const Intent &intent);

        /// Load one older page of @p conversation on the account's io lane. False if the account is unknown.
        bool fetch_history(const ConversationId &conversation);

        // ───────────── encryption ─────────────

        /// Mark a device as verified. False when the account has no encryption.
        bool verify_device(const ParticipantId &participant, const std::string &deviceId);

        /// Import an exported room key and re-decrypt what it unlocks. Returns the number of
        /// messages recovered, nullopt when the key was rejected.
        std::optional<std::size_t> import_room_key(const ConversationId &room,
                                                   const std::string &sessionId,
                                                   const std::string &sessionKey);

        /// Generate fresh one-time keys for @p account.
        bool rotate_keys(const AccountId &account);

        // ───────────── plumbing ─────────────

        [[nodiscard]] SyncMetrics &metrics() noexcept { return metrics_; }
        [[nodiscard]] ConversationStore &store() noexcept { return store_; }
        [[nodiscard]] const Config &config() const noexcept { return config_; }

        /// Stop every account, cancel outbound work and join the worker pool. Idempotent.
        void shutdown();

    private:
        struct Account
        {
            AccountId id;
            Credentials credentials;
            std::shared_ptr<IBackendAdapter> adapter;
            std::unique_ptr<SyncEngine> engine;
        };

        std::shared_ptr<Account> find(const AccountId &account) const;
        std::shared_ptr<Account> require(const AccountId &account) const;

        void on_status(const AccountStatus &status);
        void arm_sweep();

    private:
        Config config_;
        SyncMetrics metrics_;
        std::shared_ptr<IStateStore> state_;
        AdapterFactory factory_;

        ConversationStore store_;
        SubscriptionHub hub_;
        Runtime runtime_;
        std::unique_ptr<OutboundQueue> queue_;
        boost::asio::steady_timer sweepTimer_;

        mutable std::mutex mutex_;
        std::map<AccountId, std::shared_ptr<Account>> accounts_;
        bool shutdown_{false};
    };

    /// Adapter factory for the real backends (Matrix over Beast, Telegram over TDLib).
    std::shared_ptr<IBackendAdapter> make_default_adapter(const AccountId &account,
                                                          BackendKind backend,
                                                          IStateStore &state,
                                                          const Config &config);

} // namespace echat::sync

#endif // ECHAT_SYNC_CHAT_CORE_HPP
