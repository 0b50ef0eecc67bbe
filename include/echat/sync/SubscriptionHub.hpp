#pragma once

/**
 * @file SubscriptionHub.hpp
 * @brief Per-subscriber bounded change buffers for the presentation layer.
 *
 * Each subscription owns a FIFO of Change notifications, optionally filtered
 * to one account. The presentation layer drains it with `poll()`, typically
 * once per rendered frame, and re-reads the conversations it was told about
 * from the store.
 *
 *  - Repeated Conversation changes for the same conversation that are still
 *    buffered are coalesced into one.
 *  - When a buffer overflows it is replaced by a single Resync change: the
 *    subscriber must take a fresh snapshot.
 *  - Subscriptions not polled for longer than the TTL are removed by
 *    `sweep_expired()`.
 */

#include <echat/sync/Metrics.hpp>
#include <echat/sync/events.hpp>
#include <echat/sync/types.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace echat::sync
{
    enum class ChangeKind
    {
        Conversation,
        Presence,
        Typing,
        Connectivity,
        Resync,
    };

    [[nodiscard]] const char *to_string(ChangeKind kind) noexcept;

    struct Change
    {
        ChangeKind kind = ChangeKind::Conversation;
        AccountId account;
        std::optional<ConversationId> conversation; ///< Conversation, Typing
        std::optional<PresenceEvent> presence;      ///< Presence
        std::optional<TypingEvent> typing;          ///< Typing
        std::optional<AccountStatus> status;        ///< Connectivity

        static Change conversation_changed(const ConversationId &id);
        static Change presence_changed(const PresenceEvent &ev);
        static Change typing_changed(const TypingEvent &ev);
        static Change connectivity_changed(const AccountStatus &status);
        static Change resync();
    };

    using SubscriptionId = std::uint64_t;

    struct SubscriptionBuffer
    {
        SubscriptionId id = 0;
        std::optional<AccountId> account;
        std::chrono::steady_clock::time_point lastSeen;
        std::deque<Change> buffer;
        std::unordered_set<ConversationId, ConversationIdHash> pendingConversations;

        SubscriptionBuffer() = default;

        SubscriptionBuffer(SubscriptionId subId, std::optional<AccountId> filter)
            : id(subId),
              account(std::move(filter)),
              lastSeen(std::chrono::steady_clock::now()),
              buffer(),
              pendingConversations()
        {
        }

        void touch() noexcept
        {
            lastSeen = std::chrono::steady_clock::now();
        }

        bool is_expired(std::chrono::seconds ttl,
                        std::chrono::steady_clock::time_point now) const noexcept
        {
            return (now - lastSeen) > ttl;
        }

        bool accepts(const Change &change) const noexcept
        {
            return !account || change.kind == ChangeKind::Resync || change.account == *account;
        }

        /// Returns the number of changes dropped to make room.
        std::size_t enqueue(const Change &change, std::size_t maxBufferSize);

        std::vector<Change> drain(std::size_t maxCount);
    };

    class SubscriptionHub
    {
    public:
        /// @param ttl              idle time after which a subscription expires
        /// @param maxBufferPerSub  bounded buffer size per subscription
        /// @param metrics          optional counters
        SubscriptionHub(std::chrono::seconds ttl = std::chrono::seconds{300},
                        std::size_t maxBufferPerSub = 1024,
                        SyncMetrics *metrics = nullptr);

        SubscriptionHub(const SubscriptionHub &) = delete;
        SubscriptionHub &operator=(const SubscriptionHub &) = delete;

        SubscriptionId open(std::optional<AccountId> account = std::nullopt);
        bool close(SubscriptionId id);

        /// Fan a change out to every matching subscription.
        void publish(const Change &change);

        /// Drain up to @p maxChanges. nullopt when the subscription is unknown or expired.
        std::optional<std::vector<Change>> poll(SubscriptionId id, std::size_t maxChanges = 256);

        /// Remove idle subscriptions; returns how many were removed.
        std::size_t sweep_expired();

        std::size_t subscription_count() const;
        std::size_t buffer_size(SubscriptionId id) const;

    private:
        std::chrono::seconds ttl_;
        std::size_t maxBufferPerSub_;
        mutable std::mutex mutex_;
        std::unordered_map<SubscriptionId, SubscriptionBuffer> subs_;
        SubscriptionId nextId_{1};
        SyncMetrics *metrics_;
    };

} // namespace echat::sync
