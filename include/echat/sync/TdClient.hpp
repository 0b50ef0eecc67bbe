#ifndef ECHAT_SYNC_TD_CLIENT_HPP
#define ECHAT_SYNC_TD_CLIENT_HPP

#include <chrono>
#include <optional>

#include <nlohmann/json.hpp>

namespace echat::sync
{
    /**
     * @brief One TDLib client instance seen through its JSON interface.
     *
     * Requests and responses are TDLib JSON objects ("@type" ...). A failed
     * request is answered with an `error` object, never with an exception;
     * a request that gets no answer within @p timeout is answered with
     * `{"@type":"error","code":0,"message":"request timeout"}`.
     */
    class ITdClient
    {
    public:
        virtual ~ITdClient() = default;

        /// Blocking request/response.
        virtual nlohmann::json execute(const nlohmann::json &request, std::chrono::milliseconds timeout) = 0;

        /// Next update of this client, waiting at most @p timeout.
        virtual std::optional<nlohmann::json> next_update(std::chrono::milliseconds timeout) = 0;

        /// Ask TDLib to close the instance (flushes its database).
        virtual void close() = 0;
    };

} // namespace echat::sync

#endif // ECHAT_SYNC_TD_CLIENT_HPP
