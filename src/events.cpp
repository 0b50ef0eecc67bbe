#include <echat/sync/events.hpp>

namespace echat::sync
{
    namespace
    {
        template <class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        const std::string kEmpty;
    } // namespace

    const ConversationId *conversation_of(const SyncEvent &ev) noexcept
    {
        return std::visit(
            overloaded{
                [](const ParticipantEvent &) -> const ConversationId * { return nullptr; },
                [](const PresenceEvent &) -> const ConversationId * { return nullptr; },
                [](const KeyEvent &) -> const ConversationId * { return nullptr; },
                [](const auto &e) -> const ConversationId * { return &e.conversation; },
            },
            ev);
    }

    const std::string &native_of(const SyncEvent &ev) noexcept
    {
        return std::visit(
            overloaded{
                [](const MessageEvent &e) -> const std::string & { return e.native; },
                [](const EditEvent &e) -> const std::string & { return e.native; },
                [](const ReactionEvent &e) -> const std::string & { return e.native; },
                [](const RedactionEvent &e) -> const std::string & { return e.native; },
                [](const auto &) -> const std::string & { return kEmpty; },
            },
            ev);
    }

} // namespace echat::sync
