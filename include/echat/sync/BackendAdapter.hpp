#ifndef ECHAT_SYNC_BACKEND_ADAPTER_HPP
#define ECHAT_SYNC_BACKEND_ADAPTER_HPP

/**
 * @file BackendAdapter.hpp
 * @brief Capability interface every messaging backend implements.
 *
 * @details
 * Adapter calls are blocking and bounded by their configured timeout. They
 * are executed on the worker pool, never on a caller thread that holds a
 * store lock. Errors leave an adapter only as one of the BackendError
 * classes declared in errors.hpp.
 *
 * An IEventStream is infinite and not restartable: once `next()` threw, the
 * engine drops it and calls `resume()` again with the last durable cursor.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <echat/sync/CancellationToken.hpp>
#include <echat/sync/EncryptionProvider.hpp>
#include <echat/sync/config.hpp>
#include <echat/sync/events.hpp>
#include <echat/sync/types.hpp>

namespace echat::sync
{
    /// One protocol event as the backend delivered it.
    struct RawEvent
    {
        nlohmann::json payload;
    };

    struct RawBatch
    {
        std::vector<RawEvent> events;
        std::string cursor; ///< resume point once every event of the batch is applied
    };

    struct SessionInfo
    {
        std::string selfId;            ///< own native user id
        nlohmann::json persisted;      ///< goes back into Credentials::session
    };

    struct SendReceipt
    {
        std::string serverId;
        std::int64_t timestamp = 0;
    };

    struct HistoryPage
    {
        std::vector<RawEvent> events;
        std::optional<std::string> nextBefore; ///< nullopt once the beginning is reached
    };

    class IEventStream
    {
    public:
        virtual ~IEventStream() = default;

        /// Block until the next batch (or the long-poll timeout). Throws Cancelled
        /// when @p cancel fired, a BackendError otherwise.
        virtual RawBatch next(const CancellationToken &cancel) = 0;
    };

    class IBackendAdapter
    {
    public:
        virtual ~IBackendAdapter() = default;

        virtual BackendKind kind() const noexcept = 0;
        virtual const AccountId &account() const noexcept = 0;

        /// Log in (or restore the persisted session).
        virtual SessionInfo connect(const Credentials &credentials) = 0;

        virtual std::unique_ptr<IEventStream> resume(const std::optional<SyncCursor> &cursor) = 0;

        virtual SendReceipt send(const ConversationId &conversation,
                                 const std::string &text,
                                 const std::string &txnId) = 0;

        virtual SendReceipt edit(const ConversationId &conversation,
                                 const std::string &target,
                                 const std::string &text,
                                 const std::string &txnId) = 0;

        virtual SendReceipt react(const ConversationId &conversation,
                                  const std::string &target,
                                  const std::string &key,
                                  const std::string &txnId) = 0;

        virtual void mark_read(const ConversationId &conversation, const std::string &upTo) = 0;

        virtual HistoryPage fetch_history(const ConversationId &conversation,
                                          const std::optional<std::string> &before,
                                          std::size_t limit) = 0;

        /// Raw descriptions of every known conversation, fed through translate().
        virtual std::vector<RawEvent> list_conversations() = 0;

        virtual std::vector<SyncEvent> translate(const RawEvent &raw) = 0;

        /// Turn a decrypted payload back into events. @p envelope is the
        /// MessageEvent the ciphertext arrived in.
        virtual std::vector<SyncEvent> interpret_plaintext(const MessageEvent &envelope,
                                                           const std::string &plaintext)
        {
            (void)envelope;
            (void)plaintext;
            return {};
        }

        /// The raw event a server would echo for a text message sent with @p txnId.
        virtual RawEvent encode_message(const ConversationId &conversation,
                                        const std::string &text,
                                        const std::string &txnId) const = 0;

        /// Nullable: backends without end-to-end encryption return nullptr.
        virtual IEncryptionProvider *encryption() noexcept { return nullptr; }

        /// Drop network resources. The adapter may be connected again later.
        virtual void close() {}
    };

} // namespace echat::sync

#endif // ECHAT_SYNC_BACKEND_ADAPTER_HPP
