#ifndef ECHAT_SYNC_TD_JSON_CLIENT_HPP
#define ECHAT_SYNC_TD_JSON_CLIENT_HPP

/**
 * @file TdJsonClient.hpp
 * @brief ITdClient on TDLib's `td_json_client` C interface.
 *
 * @details
 * `td_receive()` is process wide and must not be called concurrently, so
 * all TdJsonClient instances share one receiver thread. It routes every
 * incoming object by its "@client_id": objects carrying an "@extra" answer
 * a pending execute(), the rest are queued as updates of that client.
 *
 * Only available when the project is built with TDLib
 * (ECHAT_SYNC_WITH_TDLIB).
 */

#include <atomic>
#include <memory>

#include <echat/sync/TdClient.hpp>

namespace echat::sync
{
    class TdJsonClient : public ITdClient
    {
    public:
        TdJsonClient();
        ~TdJsonClient() override;

        TdJsonClient(const TdJsonClient &) = delete;
        TdJsonClient &operator=(const TdJsonClient &) = delete;

        nlohmann::json execute(const nlohmann::json &request, std::chrono::milliseconds timeout) override;
        std::optional<nlohmann::json> next_update(std::chrono::milliseconds timeout) override;
        void close() override;

        int client_id() const noexcept { return clientId_; }

    private:
        struct Mailbox;
        class Receiver;

        int clientId_;
        std::shared_ptr<Receiver> receiver_;
        std::shared_ptr<Mailbox> mailbox_;
        std::atomic<bool> closeRequested_{false};
    };

} // namespace echat::sync

#endif // ECHAT_SYNC_TD_JSON_CLIENT_HPP
