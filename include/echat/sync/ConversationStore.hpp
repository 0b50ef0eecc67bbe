#ifndef ECHAT_SYNC_CONVERSATION_STORE_HPP
#define ECHAT_SYNC_CONVERSATION_STORE_HPP

/**
 * @file ConversationStore.hpp
 * @brief Unified, account-agnostic conversation model.
 *
 * @details
 * The store maps ConversationId to an entry. Each entry has:
 *
 *  - a write mutex: a single writer per conversation, unrelated
 *    conversations update in parallel;
 *  - writer-owned state (ordered messages, dedupe indexes, parked relations,
 *    outstanding provisional ids);
 *  - a published, immutable ConversationState swapped in after every
 *    mutation under a brief publish lock.
 *
 * Readers never take a write mutex, so a poll from the presentation layer
 * never waits for a network call or for a batch being applied.
 *
 * Messages are totally ordered by (timestamp, native id). Relations (edits,
 * reactions, redactions) whose target is unknown are parked and replayed
 * when the target arrives, so the final state does not depend on delivery
 * order. Applying the same event twice is a no-op.
 *
 * Referencing a conversation that does not exist in the outbound helpers
 * is a contract violation and throws std::logic_error.
 */

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <echat/sync/events.hpp>
#include <echat/sync/types.hpp>

namespace echat::sync
{
    /// Immutable view of one conversation, shared between readers.
    struct ConversationState
    {
        Conversation conversation;
        std::vector<std::shared_ptr<const Message>> messages; ///< ascending (timestamp, native)
        std::uint64_t version = 0;

        /// Linear lookup by native id; nullptr if absent.
        [[nodiscard]] const Message *find(const std::string &native) const noexcept;
    };

    using ConversationStatePtr = std::shared_ptr<const ConversationState>;

    /**
     * @brief Participants of every account, held once and copied on write.
     */
    class ParticipantRegistry
    {
    public:
        using Map = std::map<ParticipantId, Participant>;

        ParticipantRegistry();

        [[nodiscard]] std::shared_ptr<const Map> snapshot() const;
        [[nodiscard]] std::optional<Participant> get(const ParticipantId &id) const;

        /// Merge @p ev. Returns true when something changed.
        bool apply(const ParticipantEvent &ev);

        /// Insert a bare participant if unknown.
        bool ensure(const ParticipantId &id);

        void set_device_verified(const ParticipantId &id, const std::string &deviceId, bool verified);

    private:
        mutable std::mutex mutex_;
        std::shared_ptr<const Map> map_;
    };

    enum class ApplyResult
    {
        Applied,
        Duplicate,
        Parked,
        Ignored,
    };

    enum class ReconcileResult
    {
        Renamed,           ///< provisional entry now carries the server id
        Merged,            ///< echo was already stored, provisional entry dropped
        AlreadyReconciled, ///< nothing left to do
        NotFound,
    };

    class ConversationStore
    {
    public:
        using ChangeListener = std::function<void(const ConversationId &)>;

        ConversationStore();
        ~ConversationStore();

        ConversationStore(const ConversationStore &) = delete;
        ConversationStore &operator=(const ConversationStore &) = delete;

        /// Called after each published change, outside of any store lock.
        void set_change_listener(ChangeListener listener);

        // ───────────── reads ─────────────

        [[nodiscard]] ConversationStatePtr get(const ConversationId &id) const;
        [[nodiscard]] bool contains(const ConversationId &id) const;

        /// Published states, most recent activity first. All accounts when @p account is empty.
        [[nodiscard]] std::vector<ConversationStatePtr> list(const std::optional<AccountId> &account = std::nullopt) const;

        [[nodiscard]] std::vector<ConversationId> conversations_of(const AccountId &account) const;

        /// True when @p native is a stored message or an already applied relation.
        [[nodiscard]] bool is_known(const ConversationId &id, const std::string &native) const;

        ParticipantRegistry &participants() noexcept { return participants_; }
        const ParticipantRegistry &participants() const noexcept { return participants_; }

        // ───────────── ingestion ─────────────

        /// Create the conversation if it is unknown. Returns true if created.
        bool ensure(const ConversationId &id);

        /**
         * @brief Apply one normalized event.
         *
         * @param live  true for events from the live stream; only those bump
         *              the local unread counter.
         * @param delivery overrides the delivery state of a new message
         *              (used for DecryptionFailed).
         */
        ApplyResult apply(const SyncEvent &ev, bool live = true, const std::optional<Delivery> &delivery = std::nullopt);

        /// Messages of @p account that failed to decrypt with @p sessionId.
        [[nodiscard]] std::vector<MessageId> undecrypted(const AccountId &account, const std::string &sessionId) const;

        /**
         * @brief Replace an undecryptable placeholder with its decrypted events.
         *
         * A MessageEvent with the same native id replaces the content in place;
         * relation events replace the placeholder entirely. Returns false if the
         * message is gone or no longer undecryptable.
         */
        bool replace_undecrypted(const MessageId &id, const std::vector<SyncEvent> &events);

        [[nodiscard]] std::optional<std::string> history_token(const ConversationId &id) const;
        [[nodiscard]] bool history_exhausted(const ConversationId &id) const;
        void set_history_token(const ConversationId &id, const std::optional<std::string> &token);

        // ───────────── outbound ─────────────

        /// Insert a Pending message with the next provisional id `~<n>`.
        MessageId create_provisional(const ConversationId &id, const ParticipantId &self, const std::string &text);

        /// Swap a provisional message for its server id in one atomic update.
        ReconcileResult reconcile(const MessageId &provisional, const std::string &serverId, std::int64_t timestamp);

        /// Resolve a provisional id still waiting for reconciliation.
        [[nodiscard]] bool is_pending_provisional(const MessageId &id) const;

        bool set_delivery(const MessageId &id, const Delivery &delivery);

        /// Drop a failed provisional message. False if it is not a failed provisional.
        bool discard(const MessageId &id);

        /// Optimistic edit; returns the provisional edit id used as transaction id.
        std::string add_pending_edit(const MessageId &target, const ParticipantId &self, const std::string &text);
        void settle_edit(const MessageId &target, const std::string &txnId, const std::string &serverId, std::int64_t timestamp);
        void fail_edit(const MessageId &target, const std::string &txnId, const std::string &reason);

        std::string add_pending_reaction(const MessageId &target, const ParticipantId &self, const std::string &key);
        void settle_reaction(const MessageId &target, const std::string &txnId, const std::string &serverId);
        void fail_reaction(const MessageId &target, const std::string &txnId, const std::string &reason);

        /// Local mark-read: unread drops to zero immediately.
        void mark_read_local(const ConversationId &id);

        /// Newest message with a server id, if any.
        [[nodiscard]] std::optional<std::string> latest_server_native(const ConversationId &id) const;

    private:
        struct Entry;

        std::shared_ptr<Entry> find_entry(const ConversationId &id) const;
        std::shared_ptr<Entry> require_entry(const ConversationId &id) const;
        std::shared_ptr<Entry> get_or_create(const ConversationId &id, bool &created);

        /// Run @p fn under the entry write lock; publish and notify when it returns true.
        template <typename Fn>
        auto mutate(const std::shared_ptr<Entry> &entry, Fn &&fn);

        ApplyResult apply_locked(Entry &e, const SyncEvent &ev, bool live, const std::optional<Delivery> &delivery);
        void drain_parked(Entry &e, const std::string &native, bool live);
        void publish_locked(Entry &e);
        void notify(const ConversationId &id);

    private:
        mutable std::shared_mutex mapMutex_;
        std::map<ConversationId, std::shared_ptr<Entry>> entries_;

        ParticipantRegistry participants_;

        mutable std::mutex listenerMutex_;
        ChangeListener listener_;
    };

} // namespace echat::sync

#endif // ECHAT_SYNC_CONVERSATION_STORE_HPP
