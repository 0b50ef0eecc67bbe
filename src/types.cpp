#include <echat/sync/types.hpp>

#include <chrono>

namespace echat::sync
{
    const char *to_string(BackendKind kind) noexcept
    {
        switch (kind)
        {
        case BackendKind::Matrix:
            return "matrix";
        case BackendKind::Telegram:
            return "telegram";
        }
        return "unknown";
    }

    std::optional<BackendKind> backend_from_string(std::string_view s) noexcept
    {
        if (s == "matrix")
            return BackendKind::Matrix;
        if (s == "telegram")
            return BackendKind::Telegram;
        return std::nullopt;
    }

    const char *to_string(DeliveryState state) noexcept
    {
        switch (state)
        {
        case DeliveryState::Pending:
            return "pending";
        case DeliveryState::Sent:
            return "sent";
        case DeliveryState::Delivered:
            return "delivered";
        case DeliveryState::Failed:
            return "failed";
        case DeliveryState::DecryptionFailed:
            return "decryption_failed";
        }
        return "unknown";
    }

    const char *to_string(ConnectionState state) noexcept
    {
        switch (state)
        {
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Syncing:
            return "syncing";
        case ConnectionState::Backoff:
            return "backoff";
        }
        return "unknown";
    }

    std::string ConversationId::str() const
    {
        std::string out = account;
        out += '/';
        out += to_string(backend);
        out += '/';
        out += native;
        return out;
    }

    std::size_t ConversationIdHash::operator()(const ConversationId &id) const noexcept
    {
        std::size_t h = std::hash<std::string>{}(id.account);
        h ^= std::hash<std::string>{}(id.native) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= static_cast<std::size_t>(id.backend) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }

    const std::string &Message::display_text() const noexcept
    {
        if (content.redacted)
            return content.text;

        for (auto it = edits.rbegin(); it != edits.rend(); ++it)
        {
            if (it->delivery.state != DeliveryState::Failed)
                return it->text;
        }
        return content.text;
    }

    std::int64_t now_ms()
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

} // namespace echat::sync
