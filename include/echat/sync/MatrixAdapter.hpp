#ifndef ECHAT_SYNC_MATRIX_ADAPTER_HPP
#define ECHAT_SYNC_MATRIX_ADAPTER_HPP

/**
 * @file MatrixAdapter.hpp
 * @brief IBackendAdapter for the Matrix client-server API (v3).
 *
 * @details
 * The event stream is a `/sync` long poll. Each sync response is flattened
 * into one RawEvent per protocol event, wrapped in an envelope that keeps the
 * context the bare event lacks:
 *
 *   { "kind": "to_device" | "presence" | "room_summary" | "state"
 *           | "timeline" | "ephemeral",
 *     "room": "!id:server", "membership": "join" | "leave",
 *     "event": { ...protocol event... } }
 *
 * `room_summary` envelopes carry the unread count and the pagination token
 * instead of an event. To-device events come first in a batch so room keys
 * are imported before the messages they unlock.
 *
 * Local transaction ids ("~n") are scoped to one conversation, Matrix
 * transaction ids to one device. On the wire they are made unique per
 * process and room, and mapped back when the echo comes in.
 */

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <boost/beast/http/verb.hpp>
#include <nlohmann/json.hpp>

#include <echat/sync/BackendAdapter.hpp>
#include <echat/sync/HttpTransport.hpp>
#include <echat/sync/OlmEncryptionManager.hpp>
#include <echat/sync/StateStore.hpp>
#include <echat/sync/config.hpp>

namespace echat::sync
{
    class MatrixAdapter : public IBackendAdapter
    {
    public:
        /**
         * @param http transport to the homeserver; when null, connect() builds a
         *             BeastHttpTransport from the `homeserver` credential.
         */
        MatrixAdapter(AccountId account,
                      std::shared_ptr<IHttpTransport> http,
                      IStateStore &state,
                      const Config &config);

        ~MatrixAdapter() override;

        BackendKind kind() const noexcept override { return BackendKind::Matrix; }
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

        std::vector<SyncEvent> interpret_plaintext(const MessageEvent &envelope,
                                                   const std::string &plaintext) override;

        RawEvent encode_message(const ConversationId &conversation,
                                const std::string &text,
                                const std::string &txnId) const override;

        IEncryptionProvider *encryption() noexcept override { return crypto_.get(); }

        /// Transaction id sent to the homeserver for local @p txnId in @p room.
        [[nodiscard]] std::string wire_txn(const std::string &room, const std::string &txnId) const;

        /// Local transaction id of an echo, empty when @p wire was not issued by this process.
        [[nodiscard]] std::string local_txn(const std::string &wire) const;

        [[nodiscard]] std::string user_id() const;

    private:
        class SyncStream;

        nlohmann::json request(boost::beast::http::verb method,
                               const std::string &target,
                               const nlohmann::json &body = nlohmann::json(),
                               std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                               bool login = false);

        RawBatch sync_once(const std::string &since);
        void flatten(const nlohmann::json &sync, std::vector<RawEvent> &out) const;

        void upload_keys(std::optional<std::size_t> onServer);

        SendReceipt put_event(const ConversationId &conversation,
                              const std::string &type,
                              const nlohmann::json &content,
                              const std::string &txnId);

        std::vector<SyncEvent> translate_room_event(const ConversationId &conversation,
                                                    const nlohmann::json &ev);

        bool room_encrypted(const std::string &room) const;
        void set_room_encrypted(const std::string &room);

    private:
        AccountId account_;
        std::shared_ptr<IHttpTransport> http_;
        IStateStore &state_;
        Config config_;

        std::string nonce_; ///< per-process part of wire transaction ids

        mutable std::mutex mutex_;
        std::string accessToken_;
        std::string userId_;
        std::string deviceId_;
        std::set<std::string> encryptedRooms_;

        std::unique_ptr<OlmEncryptionManager> crypto_;
    };

} // namespace echat::sync

#endif // ECHAT_SYNC_MATRIX_ADAPTER_HPP
