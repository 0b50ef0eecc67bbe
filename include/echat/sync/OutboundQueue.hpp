#ifndef ECHAT_SYNC_OUTBOUND_QUEUE_HPP
#define ECHAT_SYNC_OUTBOUND_QUEUE_HPP

/**
 * @file OutboundQueue.hpp
 * @brief User intents flowing back to the backends.
 *
 * @details
 * `submit()` is synchronous and cheap: it validates the intent, performs the
 * optimistic store update (a Pending provisional message, a pending edit or
 * reaction, a local unread reset) and returns. The backend call itself runs
 * later on the account's own io lane, so a backend that blocks stalls only
 * its own account. Deadline and retry timers stay on the shared context.
 *
 * Command lifecycle:
 *
 *   Parked   while the owning account is not Syncing
 *   Waiting  for the reconciliation of a provisional target (edit / react)
 *   Running  backend call in flight
 *   Retry    transient failure, bounded exponential backoff
 *
 * The reconciliation deadline starts at the first dispatch. When it fires
 * the message becomes Failed("reconciliation timeout"); an acknowledgment
 * arriving later still reconciles it. Cancelling an account fails its
 * commands with "cancelled" and discards their late completions.
 */

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

#include <boost/asio/io_context.hpp>

#include <echat/sync/BackendAdapter.hpp>
#include <echat/sync/ConversationStore.hpp>
#include <echat/sync/Metrics.hpp>
#include <echat/sync/Runtime.hpp>
#include <echat/sync/config.hpp>

namespace echat::sync
{
    struct SendText
    {
        ConversationId conversation;
        std::string text;
    };

    struct Edit
    {
        MessageId target;
        std::string text;
    };

    struct React
    {
        MessageId target;
        std::string key;
    };

    struct MarkRead
    {
        ConversationId conversation;
        std::optional<std::string> upTo; ///< newest stored server message when empty
    };

    /// Retry a Failed provisional message with its original transaction id.
    struct Resend
    {
        MessageId message;
    };

    /// Drop a Failed provisional message.
    struct Discard
    {
        MessageId message;
    };

    using Intent = std::variant<SendText, Edit, React, MarkRead, Resend, Discard>;

    struct SubmitResult
    {
        bool accepted = false;
        std::optional<MessageId> provisional; ///< set for SendText / Resend
        std::string error;

        static SubmitResult rejected(std::string why)
        {
            SubmitResult r;
            r.error = std::move(why);
            return r;
        }
    };

    class OutboundQueue
    {
    public:
        OutboundQueue(boost::asio::io_context &ioc,
                      ConversationStore &store,
                      const Config &config,
                      SyncMetrics *metrics = nullptr);

        ~OutboundQueue();

        OutboundQueue(const OutboundQueue &) = delete;
        OutboundQueue &operator=(const OutboundQueue &) = delete;

        void register_account(std::shared_ptr<IBackendAdapter> adapter);
        void unregister_account(const AccountId &account);

        /// Own participant id used as sender of provisional messages.
        void set_self(const AccountId &account, const std::string &selfNative);

        /// Syncing accounts are online; going online releases parked commands.
        void set_online(const AccountId &account, bool online);

        SubmitResult submit(const Intent &intent);

        /// Fail every command of @p account with "cancelled".
        void cancel_account(const AccountId &account);

        [[nodiscard]] std::size_t pending(const AccountId &account) const;

        /// Run @p job on the io lane of @p account. False when the account is unknown.
        bool post_blocking(const AccountId &account, std::function<void()> job);

        /// Cancel everything without touching the store.
        void shutdown();

    private:
        struct Command;
        struct AccountSlot
        {
            std::shared_ptr<IBackendAdapter> adapter;
            std::shared_ptr<Runtime> io; ///< blocking backend calls of this account
            std::string selfNative;
            bool online = false;
        };

        using CommandPtr = std::shared_ptr<Command>;

        SubmitResult submit_send(const SendText &intent);
        SubmitResult submit_edit(const Edit &intent);
        SubmitResult submit_react(const React &intent);
        SubmitResult submit_mark_read(const MarkRead &intent);
        SubmitResult submit_resend(const Resend &intent);
        SubmitResult submit_discard(const Discard &intent);

        /// Resolve a provisional target to its in-flight send command (caller holds mutex_).
        std::optional<std::uint64_t> pending_sender_locked(const MessageId &target) const;

        CommandPtr enqueue_locked(CommandPtr cmd);
        void schedule_locked(const CommandPtr &cmd);
        void dispatch(const CommandPtr &cmd);
        void on_success(const CommandPtr &cmd, const SendReceipt &receipt);
        void on_failure(const CommandPtr &cmd, const std::string &reason, bool retryable, bool auth);
        void on_deadline(const CommandPtr &cmd);

        void fail_locked(const CommandPtr &cmd, const std::string &reason);
        void finish_locked(const CommandPtr &cmd);
        void release_dependents_locked(const CommandPtr &cmd, const std::optional<std::string> &serverId);

    private:
        boost::asio::io_context &ioc_;
        ConversationStore &store_;
        Config config_;
        SyncMetrics *metrics_;

        mutable std::mutex mutex_;
        std::map<AccountId, AccountSlot> accounts_;
        std::map<std::uint64_t, CommandPtr> commands_;
        std::uint64_t nextId_{1};
        bool shutdown_{false};
    };

} // namespace echat::sync

#endif // ECHAT_SYNC_OUTBOUND_QUEUE_HPP
