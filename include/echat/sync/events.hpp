#ifndef ECHAT_SYNC_EVENTS_HPP
#define ECHAT_SYNC_EVENTS_HPP

/**
 * @file events.hpp
 * @brief Normalized events produced by `IBackendAdapter::translate`.
 *
 * A raw protocol event maps to zero or more SyncEvents. The engine applies
 * them to the ConversationStore (or forwards the ephemeral ones to the
 * subscription hub). Every event carrying a `native` id can be deduplicated
 * by that id within its conversation.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include <echat/sync/types.hpp>

namespace echat::sync
{
    struct MessageEvent
    {
        ConversationId conversation;
        std::string native;
        ParticipantId sender;
        std::int64_t timestamp = 0;
        MessageContent content;
        std::string transactionId; ///< provisional id when this is the echo of a local send
        bool outgoing = false;     ///< sent by the own account
    };

    struct EditEvent
    {
        ConversationId conversation;
        std::string native;
        std::string target;
        ParticipantId sender;
        std::int64_t timestamp = 0;
        std::string text;
        std::string transactionId;
    };

    struct ReactionEvent
    {
        ConversationId conversation;
        std::string native;
        std::string target;
        ParticipantId sender;
        std::string key;
        std::string transactionId;
    };

    /// Authoritative reaction set of one message (backends that only report aggregates).
    struct ReactionSnapshotEvent
    {
        ConversationId conversation;
        std::string target;
        ReactionMap reactions;
    };

    struct RedactionEvent
    {
        ConversationId conversation;
        std::string native; ///< redaction event id, may be synthetic
        std::string target; ///< message, edit or reaction id
    };

    struct ConversationEvent
    {
        ConversationId conversation;
        std::optional<std::string> name;  ///< explicit room name / chat title
        std::optional<std::string> alias; ///< fallback name when no explicit name is set
        std::optional<bool> encrypted;
        std::optional<bool> archived;
        std::optional<std::uint32_t> serverUnread;
        std::optional<std::int64_t> lastActivity;
        std::optional<std::string> historyToken; ///< where backwards pagination starts, kept if already set
        std::vector<ParticipantId> joined;
        std::vector<ParticipantId> left;
    };

    struct ParticipantEvent
    {
        ParticipantId participant;
        std::optional<std::string> displayName;
        std::optional<std::string> avatar;
        std::map<std::string, bool> devices; ///< merged into the known device map
    };

    struct ReadReceiptEvent
    {
        ConversationId conversation;
        ParticipantId reader;
        std::string upTo;
        bool own = false;
    };

    struct PresenceEvent
    {
        ParticipantId participant;
        std::string presence; ///< online / offline / unavailable ...
        std::int64_t lastActive = 0;
    };

    struct TypingEvent
    {
        ConversationId conversation;
        std::vector<ParticipantId> typing;
    };

    /// Raw key material (Matrix to-device) for the encryption provider.
    struct KeyEvent
    {
        AccountId account;
        nlohmann::json raw;
    };

    using SyncEvent = std::variant<MessageEvent,
                                   EditEvent,
                                   ReactionEvent,
                                   ReactionSnapshotEvent,
                                   RedactionEvent,
                                   ConversationEvent,
                                   ParticipantEvent,
                                   ReadReceiptEvent,
                                   PresenceEvent,
                                   TypingEvent,
                                   KeyEvent>;

    /// Conversation the event belongs to, or nullptr for account level events.
    [[nodiscard]] const ConversationId *conversation_of(const SyncEvent &ev) noexcept;

    /// Native id used for deduplication, empty when the event has none.
    [[nodiscard]] const std::string &native_of(const SyncEvent &ev) noexcept;

} // namespace echat::sync

#endif // ECHAT_SYNC_EVENTS_HPP
