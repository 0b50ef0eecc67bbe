#ifndef ECHAT_SYNC_TELEGRAM_ADAPTER_HPP
#define ECHAT_SYNC_TELEGRAM_ADAPTER_HPP

/**
 * @file TelegramAdapter.hpp
 * @brief IBackendAdapter on TDLib.
 *
 * @details
 * Raw events are TDLib update objects as they come out of the client.
 * TDLib keeps its own message database and resumes from it, so the stream
 * reports no cursor.
 *
 * Outgoing messages are first announced by TDLib with a temporary id.
 * send() waits for the matching `updateMessageSendSucceeded` (seen by the
 * event stream through translate()) and the echo it produces carries the
 * local transaction id.
 *
 * Edits have no id of their own on Telegram; they are named
 * "e<message>:<hash of the new text>" so the echo of an own edit matches
 * the receipt of editMessageText.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <echat/sync/BackendAdapter.hpp>
#include <echat/sync/TdClient.hpp>
#include <echat/sync/config.hpp>

namespace echat::sync
{
    class TelegramAdapter : public IBackendAdapter
    {
    public:
        /**
         * @param client TDLib client; when null, connect() creates a
         *               TdJsonClient (only in builds with TDLib).
         */
        TelegramAdapter(AccountId account, std::shared_ptr<ITdClient> client, const Config &config);
        ~TelegramAdapter() override;

        BackendKind kind() const noexcept override { return BackendKind::Telegram; }
        const AccountId &account() const noexcept override { return account_; }

        SessionInfo connect(const Credentials &credentials) override;
        std::unique_ptr<IEventStream> resume(const std::optional<SyncCursor> &cursor) override;

        SendReceipt send(const ConversationId &conversation,
                         const std::string &text,
                         const std::string &txnId) override;

        SendReceipt edit(const ConversationId &conversation,
                         const std::string &target,
                         const std::string &text,
                         const std::string &txnId) override;

        SendReceipt react(const ConversationId &conversation,
                          const std::string &target,
                          const std::string &key,
                          const std::string &txnId) override;

        void mark_read(const ConversationId &conversation, const std::string &upTo) override;

        HistoryPage fetch_history(const ConversationId &conversation,
                                  const std::optional<std::string> &before,
                                  std::size_t limit) override;

        std::vector<RawEvent> list_conversations() override;

        std::vector<SyncEvent> translate(const RawEvent &raw) override;

        RawEvent encode_message(const ConversationId &conversation,
                                const std::string &text,
                                const std::string &txnId) const override;

        void close() override;

        [[nodiscard]] std::string user_id() const;

        /// Native id of an edit of @p message to @p text.
        [[nodiscard]] static std::string edit_native(const std::string &message, const std::string &text);

        /// Native id of the reaction of @p sender with @p key on @p message.
        [[nodiscard]] static std::string reaction_native(const std::string &message,
                                                         const std::string &sender,
                                                         const std::string &key);

    private:
        class UpdateStream;

        /// Outcome of one sendMessage, filled from the update stream.
        struct PendingSend
        {
            std::string txn;
            bool done = false;
            bool abandoned = false; ///< send() gave up waiting; a late confirmation still carries txn
            std::string serverId;
            std::int64_t timestamp = 0;
            nlohmann::json error; ///< TDLib error object when the send failed
        };

        std::shared_ptr<ITdClient> client() const;

        /// Execute @p request, throwing the classified error on an `error` answer.
        nlohmann::json call(const nlohmann::json &request, bool authorizing = false);

        void authorize(const Credentials &credentials);

        std::vector<SyncEvent> translate_message(const nlohmann::json &message, const std::string &txnId);
        ReactionSnapshotEvent translate_interaction(const ConversationId &conv,
                                                    const std::string &message,
                                                    const nlohmann::json &info) const;

        std::optional<ParticipantId> sender_of(const std::string &chat, const std::string &message);
        void remember_sender(const std::string &chat, const std::string &message, const std::string &sender);

        void settle_send(const nlohmann::json &message, const std::string &oldId, const nlohmann::json *error,
                         std::string *txnOut);

    private:
        AccountId account_;
        Config config_;

        mutable std::mutex mutex_;
        std::shared_ptr<ITdClient> client_;
        bool ownsClient_ = false; ///< created by connect(), dropped by close()
        std::string selfId_;

        std::condition_variable sendCv_;
        std::map<std::string, std::shared_ptr<PendingSend>> pendingSends_; ///< "chat:temporary id"

        std::map<std::string, std::string> senders_;          ///< "chat:message" -> sender
        std::map<std::string, std::set<std::string>> typing_; ///< chat -> typing users
    };

    /// Classify a TDLib `error` object. @p authorizing maps rejected login input to AuthError.
    [[noreturn]] void throw_td_error(const nlohmann::json &error, bool authorizing);

} // namespace echat::sync

#endif // ECHAT_SYNC_TELEGRAM_ADAPTER_HPP
