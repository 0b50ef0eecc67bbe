#include <echat/sync/TdJsonClient.hpp>

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include <td/telegram/td_json_client.h>

#include <vix/utils/Logger.hpp>

namespace echat::sync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    using json = nlohmann::json;

    struct TdJsonClient::Mailbox
    {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<json> updates;
        std::map<std::string, json> responses; ///< "@extra" -> answer
        std::set<std::string> abandoned;        ///< requests whose caller timed out
        bool closed = false;
    };

    /// Process wide td_receive() loop. Lives as long as one client holds it.
    class TdJsonClient::Receiver
    {
    public:
        static std::shared_ptr<Receiver> instance()
        {
            static std::mutex m;
            static std::weak_ptr<Receiver> current;

            std::lock_guard<std::mutex> lock(m);
            if (auto r = current.lock())
                return r;

            auto r = std::make_shared<Receiver>();
            current = r;
            return r;
        }

        Receiver()
        {
            // TDLib logs to stderr at verbosity 5 otherwise
            td_execute(R"({"@type":"setLogVerbosityLevel","new_verbosity_level":1})");
            thread_ = std::thread([this]
                                  { run(); });
        }

        ~Receiver()
        {
            running_ = false;
            if (thread_.joinable())
                thread_.join();
        }

        void attach(int clientId, std::shared_ptr<Mailbox> box)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            boxes_[clientId] = std::move(box);
        }

        void detach(int clientId)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            boxes_.erase(clientId);
        }

    private:
        void run()
        {
            while (running_)
            {
                const char *raw = td_receive(0.5);
                if (!raw)
                    continue;

                json obj = json::parse(raw, nullptr, false);
                if (obj.is_discarded() || !obj.is_object())
                    continue;

                const int clientId = obj.value("@client_id", 0);

                std::shared_ptr<Mailbox> box;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    auto it = boxes_.find(clientId);
                    if (it != boxes_.end())
                        box = it->second;
                }
                if (!box)
                    continue;

                route(*box, std::move(obj));
            }
        }

        static void route(Mailbox &box, json obj)
        {
            std::lock_guard<std::mutex> lock(box.mutex);

            auto extra = obj.find("@extra");
            if (extra != obj.end() && extra->is_string())
            {
                const std::string key = extra->get<std::string>();
                if (box.abandoned.erase(key) == 0)
                    box.responses[key] = std::move(obj);
            }
            else
            {
                const auto &state = obj.value("authorization_state", json::object());
                if (obj.value("@type", "") == "updateAuthorizationState" &&
                    state.value("@type", "") == "authorizationStateClosed")
                {
                    box.closed = true;
                }
                box.updates.push_back(std::move(obj));
            }

            box.cv.notify_all();
        }

    private:
        std::atomic<bool> running_{true};
        std::mutex mutex_;
        std::map<int, std::shared_ptr<Mailbox>> boxes_;
        std::thread thread_;
    };

    TdJsonClient::TdJsonClient()
        : clientId_(0),
          receiver_(Receiver::instance()),
          mailbox_(std::make_shared<Mailbox>())
    {
        clientId_ = td_create_client_id();
        receiver_->attach(clientId_, mailbox_);

        // a new instance stays silent until it gets its first request
        td_send(clientId_, R"({"@type":"getOption","name":"version"})");

        logger.log(Logger::Level::DEBUG, "[sync][telegram] tdlib client {} created", clientId_);
    }

    TdJsonClient::~TdJsonClient()
    {
        close();

        {
            std::unique_lock<std::mutex> lock(mailbox_->mutex);
            mailbox_->cv.wait_for(lock, std::chrono::seconds(5), [this]
                                  { return mailbox_->closed; });
        }

        receiver_->detach(clientId_);
    }

    json TdJsonClient::execute(const json &request, std::chrono::milliseconds timeout)
    {
        static std::atomic<std::uint64_t> counter{0};
        const std::string extra = "q" + std::to_string(++counter);

        json req = request;
        req["@extra"] = extra;
        td_send(clientId_, req.dump().c_str());

        std::unique_lock<std::mutex> lock(mailbox_->mutex);
        const bool answered = mailbox_->cv.wait_for(lock, timeout, [&]
                                                    { return mailbox_->responses.count(extra) > 0 || mailbox_->closed; });

        auto it = mailbox_->responses.find(extra);
        if (!answered || it == mailbox_->responses.end())
        {
            mailbox_->abandoned.insert(extra);
            const char *message = mailbox_->closed ? "client closed" : "request timeout";
            return json{{"@type", "error"}, {"code", 0}, {"message", message}};
        }

        json res = std::move(it->second);
        mailbox_->responses.erase(it);
        res.erase("@extra");
        res.erase("@client_id");
        return res;
    }

    std::optional<json> TdJsonClient::next_update(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mailbox_->mutex);
        if (!mailbox_->cv.wait_for(lock, timeout, [this]
                                   { return !mailbox_->updates.empty(); }))
        {
            return std::nullopt;
        }

        json u = std::move(mailbox_->updates.front());
        mailbox_->updates.pop_front();
        u.erase("@client_id");
        return u;
    }

    void TdJsonClient::close()
    {
        if (closeRequested_.exchange(true))
            return;
        td_send(clientId_, R"({"@type":"close"})");
    }

} // namespace echat::sync
