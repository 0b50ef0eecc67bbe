#ifndef ECHAT_SYNC_TYPES_HPP
#define ECHAT_SYNC_TYPES_HPP

/**
 * @file types.hpp
 * @brief Account-agnostic domain model shared by every backend.
 *
 * Identifiers are value types. A conversation is scoped to one account and
 * one backend; a message is scoped to one conversation. Participants are
 * scoped to one account and live once in the ParticipantRegistry.
 *
 * Timestamps are milliseconds since the Unix epoch (UTC).
 */

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace echat::sync
{
    enum class BackendKind
    {
        Matrix,
        Telegram,
    };

    [[nodiscard]] const char *to_string(BackendKind kind) noexcept;
    [[nodiscard]] std::optional<BackendKind> backend_from_string(std::string_view s) noexcept;

    /// Opaque, immutable identifier of one logged-in backend account.
    using AccountId = std::string;

    struct ConversationId
    {
        AccountId account;
        BackendKind backend = BackendKind::Matrix;
        std::string native; ///< room id / chat id as the backend spells it

        [[nodiscard]] std::string str() const;

        friend bool operator==(const ConversationId &a, const ConversationId &b)
        {
            return a.account == b.account && a.backend == b.backend && a.native == b.native;
        }
        friend bool operator!=(const ConversationId &a, const ConversationId &b) { return !(a == b); }
        friend bool operator<(const ConversationId &a, const ConversationId &b)
        {
            return std::tie(a.account, a.backend, a.native) < std::tie(b.account, b.backend, b.native);
        }
    };

    struct ConversationIdHash
    {
        std::size_t operator()(const ConversationId &id) const noexcept;
    };

    struct ParticipantId
    {
        AccountId account;
        std::string native;

        friend bool operator==(const ParticipantId &a, const ParticipantId &b)
        {
            return a.account == b.account && a.native == b.native;
        }
        friend bool operator!=(const ParticipantId &a, const ParticipantId &b) { return !(a == b); }
        friend bool operator<(const ParticipantId &a, const ParticipantId &b)
        {
            return std::tie(a.account, a.native) < std::tie(b.account, b.native);
        }
    };

    /// Native id wrapped with its conversation. Provisional ids start with '~'.
    struct MessageId
    {
        ConversationId conversation;
        std::string native;
        bool provisional = false;

        friend bool operator==(const MessageId &a, const MessageId &b)
        {
            return a.conversation == b.conversation && a.native == b.native;
        }
        friend bool operator!=(const MessageId &a, const MessageId &b) { return !(a == b); }
    };

    inline constexpr char kProvisionalPrefix = '~';

    [[nodiscard]] inline bool is_provisional_native(std::string_view native) noexcept
    {
        return !native.empty() && native.front() == kProvisionalPrefix;
    }

    enum class DeliveryState
    {
        Pending,
        Sent,
        Delivered,
        Failed,
        DecryptionFailed,
    };

    [[nodiscard]] const char *to_string(DeliveryState state) noexcept;

    struct Delivery
    {
        DeliveryState state = DeliveryState::Pending;
        std::string reason; ///< set for Failed / DecryptionFailed

        static Delivery pending() { return {DeliveryState::Pending, {}}; }
        static Delivery sent() { return {DeliveryState::Sent, {}}; }
        static Delivery delivered() { return {DeliveryState::Delivered, {}}; }
        static Delivery failed(std::string why) { return {DeliveryState::Failed, std::move(why)}; }
        static Delivery undecryptable(std::string why) { return {DeliveryState::DecryptionFailed, std::move(why)}; }

        friend bool operator==(const Delivery &a, const Delivery &b)
        {
            return a.state == b.state && a.reason == b.reason;
        }
    };

    /// Ciphertext reference kept on a message so it can be decrypted later
    /// without going back to the network.
    struct EncryptedPayload
    {
        std::string algorithm;
        std::string sessionId;
        std::string senderKey;
        std::string deviceId;
        std::string ciphertext;
    };

    struct MessageContent
    {
        std::string text;
        std::optional<EncryptedPayload> encrypted;
        bool redacted = false;
    };

    struct EditRecord
    {
        std::string native; ///< edit event id (provisional while pending)
        std::int64_t timestamp = 0;
        std::string text;
        Delivery delivery = Delivery::sent();
    };

    struct ReactionRecord
    {
        std::string native; ///< reaction event id, may be synthetic
        ParticipantId sender;
        Delivery delivery = Delivery::sent();

        friend bool operator==(const ReactionRecord &a, const ReactionRecord &b)
        {
            return a.native == b.native && a.sender == b.sender && a.delivery == b.delivery;
        }
    };

    /// Reaction key (emoji) -> reactions carrying it.
    using ReactionMap = std::map<std::string, std::vector<ReactionRecord>>;

    struct Message
    {
        MessageId id;
        ParticipantId sender;
        std::int64_t timestamp = 0;
        MessageContent content;
        std::vector<EditRecord> edits; ///< ordered by (timestamp, native)
        ReactionMap reactions;
        Delivery delivery;
        bool outgoing = false;

        /// Body as it should be displayed: newest non-failed edit, else the original text.
        [[nodiscard]] const std::string &display_text() const noexcept;
    };

    struct Conversation
    {
        ConversationId id;
        std::string displayName;
        std::set<ParticipantId> participants;
        std::int64_t lastActivity = 0;
        std::uint32_t unread = 0;
        bool encrypted = false;
        bool archived = false;
    };

    struct Participant
    {
        ParticipantId id;
        std::string displayName;
        std::string avatar;                   ///< mxc:// uri or file reference, may be empty
        std::map<std::string, bool> devices; ///< device id -> verified (advisory)
    };

    struct SyncCursor
    {
        AccountId account;
        BackendKind backend = BackendKind::Matrix;
        std::string token;
    };

    enum class ConnectionState
    {
        Disconnected,
        Connecting,
        Syncing,
        Backoff,
    };

    [[nodiscard]] const char *to_string(ConnectionState state) noexcept;

    /// Connectivity badge of one account.
    struct AccountStatus
    {
        AccountId account;
        BackendKind backend = BackendKind::Matrix;
        ConnectionState state = ConnectionState::Disconnected;
        unsigned attempt = 0;   ///< current backoff attempt, 0 while healthy
        std::string lastError;  ///< empty when healthy
        bool needsLogin = false;
        std::string selfId;
    };

    [[nodiscard]] std::int64_t now_ms();

} // namespace echat::sync

#endif // ECHAT_SYNC_TYPES_HPP
