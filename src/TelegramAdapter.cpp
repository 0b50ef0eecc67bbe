#include <echat/sync/TelegramAdapter.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

#include <vix/utils/Logger.hpp>

#include <echat/sync/errors.hpp>

#ifdef ECHAT_SYNC_WITH_TDLIB
#include <echat/sync/TdJsonClient.hpp>
#endif

#include "json_helpers.hpp"

namespace echat::sync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    using detail::fnv32hex;
    using detail::json_id;
    using detail::json_int;
    using detail::json_member;
    using detail::json_string;
    using json = nlohmann::json;

    namespace
    {
        constexpr std::size_t kMaxBatch = 256;
        constexpr std::size_t kMaxKnownSenders = 50000;
        constexpr std::size_t kMaxOrphanSends = 256;

        std::int64_t to_td_id(const std::string &native)
        {
            std::size_t used = 0;
            std::int64_t id = 0;
            try
            {
                id = std::stoll(native, &used);
            }
            catch (const std::logic_error &)
            {
                throw PermanentError("telegram: invalid id '" + native + "'");
            }
            if (used != native.size())
                throw PermanentError("telegram: invalid id '" + native + "'");
            return id;
        }

        bool json_bool(const json &j, const char *key)
        {
            const auto &v = json_member(j, key);
            return v.is_boolean() && v.get<bool>();
        }

        std::string lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        json text_content(const std::string &text)
        {
            return json{
                {"@type", "inputMessageText"},
                {"text", {{"@type", "formattedText"}, {"text", text}}},
            };
        }

        /// messageSenderUser / messageSenderChat -> native participant id
        std::string sender_native(const json &sender)
        {
            const std::string type = json_string(sender, "@type");
            if (type == "messageSenderUser")
                return json_id(sender, "user_id");
            if (type == "messageSenderChat")
                return json_id(sender, "chat_id");
            return {};
        }

        std::string content_text(const json &content)
        {
            const std::string type = json_string(content, "@type");
            if (type == "messageText")
                return json_string(json_member(content, "text"), "text");

            static const std::map<std::string, const char *> media = {
                {"messagePhoto", "photo"},
                {"messageVideo", "video"},
                {"messageDocument", "document"},
                {"messageAudio", "audio"},
                {"messageAnimation", "animation"},
                {"messageVoiceNote", "voice note"},
                {"messageSticker", "sticker"},
            };

            auto it = media.find(type);
            if (it == media.end())
                return {};

            const std::string caption = json_string(json_member(content, "caption"), "text");
            return caption.empty() ? "[" + std::string(it->second) + "]" : caption;
        }

        PresenceEvent presence_of(const AccountId &account, const std::string &user, const json &status)
        {
            PresenceEvent pe;
            pe.participant = ParticipantId{account, user};

            const std::string type = json_string(status, "@type");
            if (type == "userStatusOnline")
            {
                pe.presence = "online";
                pe.lastActive = now_ms();
            }
            else if (type == "userStatusOffline")
            {
                pe.presence = "offline";
                pe.lastActive = json_int(status, "was_online") * 1000;
            }
            else
            {
                pe.presence = "unavailable";
            }
            return pe;
        }
    } // namespace

    [[noreturn]] void throw_td_error(const json &error, bool authorizing)
    {
        const auto code = json_int(error, "code");
        const std::string message = json_string(error, "message");
        const std::string what = "telegram: error " + std::to_string(code) + " " + message;

        if (code == 401 || (authorizing && code == 400))
            throw AuthError(what);

        // code 0 is a failure of the local client (timeout, closed instance)
        if (code == 0 || code == 420 || code == 429 || code >= 500 ||
            lower(message).find("timeout") != std::string::npos)
        {
            throw TransientError(what);
        }

        throw PermanentError(what);
    }

    // ───────────────────────── stream ─────────────────────────

    class TelegramAdapter::UpdateStream : public IEventStream
    {
    public:
        UpdateStream(std::shared_ptr<ITdClient> client, std::chrono::milliseconds poll)
            : client_(std::move(client)), poll_(poll)
        {
        }

        RawBatch next(const CancellationToken &cancel) override
        {
            RawBatch batch;
            const auto deadline = std::chrono::steady_clock::now() + poll_;

            while (batch.events.empty())
            {
                if (cancel.cancelled())
                    throw Cancelled();

                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (left.count() <= 0)
                    break;

                if (auto u = client_->next_update(std::min(left, std::chrono::milliseconds(500))))
                    accept(batch, std::move(*u));
            }

            while (batch.events.size() < kMaxBatch)
            {
                auto u = client_->next_update(std::chrono::milliseconds(0));
                if (!u)
                    break;
                accept(batch, std::move(*u));
            }

            return batch;
        }

    private:
        static void accept(RawBatch &batch, json u)
        {
            if (json_string(u, "@type") == "updateAuthorizationState")
            {
                const std::string state = json_string(json_member(u, "authorization_state"), "@type");
                if (state == "authorizationStateClosed" || state == "authorizationStateClosing" ||
                    state == "authorizationStateLoggingOut")
                {
                    throw AuthError("telegram: session closed (" + state + ")");
                }
                return;
            }
            batch.events.push_back(RawEvent{std::move(u)});
        }

    private:
        std::shared_ptr<ITdClient> client_;
        std::chrono::milliseconds poll_;
    };

    // ───────────────────────── lifecycle ─────────────────────────

    TelegramAdapter::TelegramAdapter(AccountId account, std::shared_ptr<ITdClient> client, const Config &config)
        : account_(std::move(account)),
          config_(config),
          client_(std::move(client)),
          ownsClient_(client_ == nullptr)
    {
    }

    TelegramAdapter::~TelegramAdapter()
    {
        close();
    }

    std::shared_ptr<ITdClient> TelegramAdapter::client() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return client_;
    }

    std::string TelegramAdapter::user_id() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return selfId_;
    }

    std::string TelegramAdapter::edit_native(const std::string &message, const std::string &text)
    {
        return "e" + message + ":" + fnv32hex(text);
    }

    std::string TelegramAdapter::reaction_native(const std::string &message,
                                                 const std::string &sender,
                                                 const std::string &key)
    {
        return "r" + message + ":" + sender + ":" + key;
    }

    json TelegramAdapter::call(const json &request, bool authorizing)
    {
        auto c = client();
        if (!c)
            throw TransientError("telegram: not connected");

        json res = c->execute(request, config_.longPollTimeout);
        if (json_string(res, "@type") == "error")
            throw_td_error(res, authorizing);
        return res;
    }

    SessionInfo TelegramAdapter::connect(const Credentials &credentials)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!client_)
            {
#ifdef ECHAT_SYNC_WITH_TDLIB
                client_ = std::make_shared<TdJsonClient>();
#else
                throw PermanentError("telegram: this build has no TDLib support");
#endif
            }
        }

        authorize(credentials);

        const json me = call(json{{"@type", "getMe"}});
        const std::string self = json_id(me, "id");
        if (self.empty())
            throw PermanentError("telegram: getMe returned no user id");

        {
            std::lock_guard<std::mutex> lock(mutex_);
            selfId_ = self;
        }

        logger.log(Logger::Level::INFO, "[sync][telegram] {} authorized as user {}", account_, self);

        SessionInfo info;
        info.selfId = self;
        info.persisted = json{{"user_id", self}};
        return info;
    }

    void TelegramAdapter::authorize(const Credentials &credentials)
    {
        const json &p = credentials.params;

        // every step moves the state machine forward or fails; a loop means TDLib is stuck
        for (int step = 0; step < 16; ++step)
        {
            const json state = call(json{{"@type", "getAuthorizationState"}}, true);
            const std::string type = json_string(state, "@type");

            logger.log(Logger::Level::DEBUG, "[sync][telegram] {} authorization state {}", account_, type);

            if (type == "authorizationStateReady")
                return;

            if (type == "authorizationStateWaitTdlibParameters")
            {
                std::int64_t apiId = json_int(p, "api_id");
                if (apiId == 0 && !json_string(p, "api_id").empty())
                    apiId = to_td_id(json_string(p, "api_id"));
                const std::string apiHash = json_string(p, "api_hash");
                if (apiId == 0 || apiHash.empty())
                    throw AuthError("telegram: api_id and api_hash required");

                std::string dir = json_string(p, "database_dir");
                if (dir.empty())
                    dir = "tdlib-" + account_;

                call(json{
                         {"@type", "setTdlibParameters"},
                         {"use_test_dc", json_bool(p, "use_test_dc")},
                         {"database_directory", dir},
                         {"use_file_database", false},
                         {"use_chat_info_database", true},
                         {"use_message_database", true},
                         {"use_secret_chats", false},
                         {"api_id", apiId},
                         {"api_hash", apiHash},
                         {"system_language_code", "en"},
                         {"device_model", "echat"},
                         {"application_version", "0.1"},
                     },
                     true);
            }
            else if (type == "authorizationStateWaitEncryptionKey")
            {
                // TDLib before 1.8.6 asks separately for the database key
                call(json{{"@type", "checkDatabaseEncryptionKey"}, {"encryption_key", ""}}, true);
            }
            else if (type == "authorizationStateWaitPhoneNumber")
            {
                const std::string phone = json_string(p, "phone");
                if (phone.empty())
                    throw AuthError("telegram: phone number required");
                call(json{{"@type", "setAuthenticationPhoneNumber"}, {"phone_number", phone}}, true);
            }
            else if (type == "authorizationStateWaitCode")
            {
                const std::string code = json_id(p, "code");
                if (code.empty())
                    throw AuthError("telegram: login code required");
                call(json{{"@type", "checkAuthenticationCode"}, {"code", code}}, true);
            }
            else if (type == "authorizationStateWaitPassword")
            {
                const std::string password = json_string(p, "password");
                if (password.empty())
                    throw AuthError("telegram: two-step verification password required");
                call(json{{"@type", "checkAuthenticationPassword"}, {"password", password}}, true);
            }
            else if (type == "authorizationStateClosed" || type == "authorizationStateClosing" ||
                     type == "authorizationStateLoggingOut")
            {
                throw AuthError("telegram: session closed (" + type + ")");
            }
            else
            {
                throw AuthError("telegram: unsupported authorization state " + type);
            }
        }

        throw AuthError("telegram: authorization did not complete");
    }

    std::unique_ptr<IEventStream> TelegramAdapter::resume(const std::optional<SyncCursor> &cursor)
    {
        (void)cursor;

        auto c = client();
        if (!c)
            throw TransientError("telegram: not connected");
        return std::make_unique<UpdateStream>(std::move(c), config_.longPollTimeout);
    }

    void TelegramAdapter::close()
    {
        std::shared_ptr<ITdClient> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto &[key, pending] : pendingSends_)
            {
                (void)key;
                if (!pending->done)
                {
                    pending->done = true;
                    pending->error = json{{"@type", "error"}, {"code", 0}, {"message", "connection closed"}};
                }
            }
            sendCv_.notify_all();

            if (ownsClient_)
                dropped = std::move(client_);
        }

        // TdJsonClient waits for TDLib to flush; do it outside the lock
        if (dropped)
            dropped->close();
    }

    // ───────────────────────── outbound ─────────────────────────

    SendReceipt TelegramAdapter::send(const ConversationId &conversation,
                                      const std::string &text,
                                      const std::string &txnId)
    {
        const json msg = call(json{
            {"@type", "sendMessage"},
            {"chat_id", to_td_id(conversation.native)},
            {"input_message_content", text_content(text)},
        });

        const std::string tempId = json_id(msg, "id");
        if (tempId.empty())
            throw TransientError("telegram: sendMessage returned no message");

        if (!msg.contains("sending_state"))
        {
            remember_sender(conversation.native, tempId, sender_native(json_member(msg, "sender_id")));
            return SendReceipt{tempId, json_int(msg, "date") * 1000};
        }

        const std::string key = conversation.native + ":" + tempId;

        std::unique_lock<std::mutex> lock(mutex_);
        auto &slot = pendingSends_[key];
        if (!slot)
            slot = std::make_shared<PendingSend>();
        slot->txn = txnId;
        auto pending = slot;

        const bool done = sendCv_.wait_for(lock, config_.reconcileTimeout, [&]
                                           { return pending->done; });
        if (done)
            pendingSends_.erase(key);
        else
            pending->abandoned = true;
        lock.unlock();

        if (!done)
            throw TransientError("telegram: message " + tempId + " not confirmed");
        if (!pending->error.is_null())
            throw_td_error(pending->error, false);

        return SendReceipt{pending->serverId, pending->timestamp};
    }

    SendReceipt TelegramAdapter::edit(const ConversationId &conversation,
                                      const std::string &target,
                                      const std::string &text,
                                      const std::string &txnId)
    {
        (void)txnId;

        const json msg = call(json{
            {"@type", "editMessageText"},
            {"chat_id", to_td_id(conversation.native)},
            {"message_id", to_td_id(target)},
            {"input_message_content", text_content(text)},
        });

        const auto editDate = json_int(msg, "edit_date");
        return SendReceipt{edit_native(target, text), editDate > 0 ? editDate * 1000 : now_ms()};
    }

    SendReceipt TelegramAdapter::react(const ConversationId &conversation,
                                       const std::string &target,
                                       const std::string &key,
                                       const std::string &txnId)
    {
        (void)txnId;

        call(json{
            {"@type", "addMessageReaction"},
            {"chat_id", to_td_id(conversation.native)},
            {"message_id", to_td_id(target)},
            {"reaction_type", {{"@type", "reactionTypeEmoji"}, {"emoji", key}}},
            {"is_big", false},
            {"update_recent_reactions", true},
        });

        return SendReceipt{reaction_native(target, user_id(), key), now_ms()};
    }

    void TelegramAdapter::mark_read(const ConversationId &conversation, const std::string &upTo)
    {
        if (upTo.empty())
            return;

        call(json{
            {"@type", "viewMessages"},
            {"chat_id", to_td_id(conversation.native)},
            {"message_ids", json::array({to_td_id(upTo)})},
            {"force_read", true},
        });
    }

    HistoryPage TelegramAdapter::fetch_history(const ConversationId &conversation,
                                               const std::optional<std::string> &before,
                                               std::size_t limit)
    {
        const json res = call(json{
            {"@type", "getChatHistory"},
            {"chat_id", to_td_id(conversation.native)},
            {"from_message_id", before ? to_td_id(*before) : 0},
            {"offset", 0},
            {"limit", std::min<std::size_t>(limit, 100)},
            {"only_local", false},
        });

        HistoryPage page;
        std::string oldest;
        for (const auto &m : json_member(res, "messages"))
        {
            if (!m.is_object())
                continue;
            oldest = json_id(m, "id");
            page.events.push_back(RawEvent{json{{"@type", "updateNewMessage"}, {"message", m}}});
        }

        if (!oldest.empty())
            page.nextBefore = oldest;
        return page;
    }

    std::vector<RawEvent> TelegramAdapter::list_conversations()
    {
        const json chats = call(json{
            {"@type", "getChats"},
            {"chat_list", {{"@type", "chatListMain"}}},
            {"limit", 200},
        });

        std::vector<RawEvent> out;
        for (const auto &id : json_member(chats, "chat_ids"))
        {
            if (!id.is_number_integer())
                continue;

            try
            {
                json chat = call(json{{"@type", "getChat"}, {"chat_id", id}});
                out.push_back(RawEvent{json{{"@type", "updateNewChat"}, {"chat", std::move(chat)}}});
            }
            catch (const PermanentError &e)
            {
                logger.log(Logger::Level::WARN, "[sync][telegram] {} no chat {}: {}", account_, id.dump(), e.what());
            }
        }

        return out;
    }

    RawEvent TelegramAdapter::encode_message(const ConversationId &conversation,
                                             const std::string &text,
                                             const std::string &txnId) const
    {
        // a stable positive id that fits TDLib's 53-bit message ids
        const std::int64_t id = static_cast<std::int64_t>(std::stoul(fnv32hex(conversation.native + txnId), nullptr, 16));

        const std::string self = user_id();

        json msg{
            {"@type", "message"},
            {"id", id},
            {"chat_id", to_td_id(conversation.native)},
            {"sender_id", {{"@type", "messageSenderUser"}, {"user_id", self.empty() ? 0 : to_td_id(self)}}},
            {"date", now_ms() / 1000},
            {"is_outgoing", true},
            {"content", {{"@type", "messageText"}, {"text", {{"@type", "formattedText"}, {"text", text}}}}},
        };
        return RawEvent{json{{"@type", "updateNewMessage"}, {"message", std::move(msg)}}};
    }

    // ───────────────────────── translation ─────────────────────────

    void TelegramAdapter::settle_send(const json &message, const std::string &oldId, const json *error,
                                      std::string *txnOut)
    {
        const std::string key = json_id(message, "chat_id") + ":" + oldId;

        std::lock_guard<std::mutex> lock(mutex_);

        // confirmations that nobody waits for yet stay until send() picks them up; on overflow
        // those and abandoned sends are dropped
        if (pendingSends_.size() > kMaxOrphanSends)
        {
            for (auto it = pendingSends_.begin(); it != pendingSends_.end();)
            {
                const auto &s = *it->second;
                if ((s.done && s.txn.empty()) || s.abandoned)
                    it = pendingSends_.erase(it);
                else
                    ++it;
            }
        }

        auto &slot = pendingSends_[key];
        if (!slot)
            slot = std::make_shared<PendingSend>();

        slot->done = true;
        slot->serverId = json_id(message, "id");
        slot->timestamp = json_int(message, "date") * 1000;
        if (error)
            slot->error = *error;

        if (txnOut)
            *txnOut = slot->txn;

        // nobody waits any more: the echo carries the txn to the store instead
        if (slot->abandoned)
            pendingSends_.erase(key);

        sendCv_.notify_all();
    }

    void TelegramAdapter::remember_sender(const std::string &chat, const std::string &message, const std::string &sender)
    {
        if (sender.empty())
            return;

        std::lock_guard<std::mutex> lock(mutex_);
        if (senders_.size() >= kMaxKnownSenders)
            senders_.clear();
        senders_[chat + ":" + message] = sender;
    }

    std::optional<ParticipantId> TelegramAdapter::sender_of(const std::string &chat, const std::string &message)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = senders_.find(chat + ":" + message);
            if (it != senders_.end())
                return ParticipantId{account_, it->second};
        }

        try
        {
            const json m = call(json{{"@type", "getMessage"}, {"chat_id", to_td_id(chat)}, {"message_id", to_td_id(message)}});
            const std::string sender = sender_native(json_member(m, "sender_id"));
            if (sender.empty())
                return std::nullopt;
            remember_sender(chat, message, sender);
            return ParticipantId{account_, sender};
        }
        catch (const BackendError &e)
        {
            logger.log(Logger::Level::DEBUG, "[sync][telegram] {} sender of {}:{} unknown: {}",
                       account_, chat, message, e.what());
            return std::nullopt;
        }
    }

    std::vector<SyncEvent> TelegramAdapter::translate_message(const json &m, const std::string &txnId)
    {
        std::vector<SyncEvent> out;

        const std::string chat = json_id(m, "chat_id");
        const std::string id = json_id(m, "id");
        if (chat.empty() || id.empty())
            return out;

        // the temporary copy of an own message; the confirmed one follows
        if (txnId.empty() && m.contains("sending_state"))
            return out;

        const std::string sender = sender_native(json_member(m, "sender_id"));
        remember_sender(chat, id, sender);

        const ConversationId conv{account_, BackendKind::Telegram, chat};

        MessageEvent me;
        me.conversation = conv;
        me.native = id;
        me.sender = ParticipantId{account_, sender};
        me.timestamp = json_int(m, "date") * 1000;
        me.content.text = content_text(json_member(m, "content"));
        me.transactionId = txnId;
        me.outgoing = json_bool(m, "is_outgoing");
        out.push_back(std::move(me));

        const auto &info = json_member(m, "interaction_info");
        if (info.contains("reactions"))
            out.push_back(translate_interaction(conv, id, info));

        return out;
    }

    ReactionSnapshotEvent TelegramAdapter::translate_interaction(const ConversationId &conv,
                                                                 const std::string &message,
                                                                 const json &info) const
    {
        ReactionSnapshotEvent ev;
        ev.conversation = conv;
        ev.target = message;

        const std::string self = user_id();

        // TDLib 1.8.15 wrapped the list into a messageReactions object
        const auto &reactions = json_member(info, "reactions");
        const json &list = reactions.is_array() ? reactions : json_member(reactions, "reactions");
        if (!list.is_array())
            return ev;

        for (const auto &r : list)
        {
            const auto &type = json_member(r, "type");
            std::string key = json_string(type, "emoji");
            if (key.empty())
            {
                const std::string custom = json_id(type, "custom_emoji_id");
                if (custom.empty())
                    continue;
                key = "custom:" + custom;
            }

            std::vector<ReactionRecord> records;
            std::set<std::string> seen;

            for (const auto &s : json_member(r, "recent_sender_ids"))
            {
                const std::string sender = sender_native(s);
                if (sender.empty() || !seen.insert(sender).second)
                    continue;
                records.push_back(ReactionRecord{reaction_native(message, sender, key), ParticipantId{account_, sender}});
            }

            if (json_bool(r, "is_chosen") && !self.empty() && seen.insert(self).second)
                records.push_back(ReactionRecord{reaction_native(message, self, key), ParticipantId{account_, self}});

            // only the most recent senders are named, the rest is a count
            const auto total = json_int(r, "total_count");
            for (auto i = static_cast<std::int64_t>(records.size()); i < total; ++i)
            {
                records.push_back(ReactionRecord{reaction_native(message, "?" + std::to_string(i), key),
                                                 ParticipantId{account_, ""}});
            }

            if (!records.empty())
                ev.reactions[key] = std::move(records);
        }

        return ev;
    }

    std::vector<SyncEvent> TelegramAdapter::translate(const RawEvent &raw)
    {
        const json &u = raw.payload;
        const std::string type = json_string(u, "@type");

        std::vector<SyncEvent> out;

        if (type == "updateNewMessage")
            return translate_message(json_member(u, "message"), {});

        if (type == "updateMessageSendSucceeded")
        {
            const auto &message = json_member(u, "message");
            std::string txn;
            settle_send(message, json_id(u, "old_message_id"), nullptr, &txn);
            if (txn.empty())
            {
                // send() has not registered yet; its receipt reconciles the provisional message
                logger.log(Logger::Level::DEBUG, "[sync][telegram] {} held back early confirmation of {}",
                           account_, json_id(message, "id"));
                return out;
            }
            return translate_message(message, txn);
        }

        if (type == "updateMessageSendFailed")
        {
            json error = json_member(u, "error");
            if (!error.is_object() || error.empty())
            {
                error = json{{"@type", "error"},
                             {"code", json_int(u, "error_code")},
                             {"message", json_string(u, "error_message")}};
            }
            settle_send(json_member(u, "message"), json_id(u, "old_message_id"), &error, nullptr);
            return out;
        }

        if (type == "updateUser")
        {
            const auto &user = json_member(u, "user");
            const std::string id = json_id(user, "id");
            if (id.empty())
                return out;

            std::string name = json_string(user, "first_name");
            const std::string last = json_string(user, "last_name");
            if (!last.empty())
                name += name.empty() ? last : " " + last;

            ParticipantEvent pe;
            pe.participant = ParticipantId{account_, id};
            pe.displayName = name;
            out.push_back(std::move(pe));

            if (user.contains("status"))
                out.push_back(presence_of(account_, id, json_member(user, "status")));
            return out;
        }

        if (type == "updateUserStatus")
        {
            const std::string id = json_id(u, "user_id");
            if (!id.empty())
                out.push_back(presence_of(account_, id, json_member(u, "status")));
            return out;
        }

        const std::string chat = type == "updateNewChat" ? json_id(json_member(u, "chat"), "id")
                                                         : json_id(u, "chat_id");
        if (chat.empty())
            return out;

        const ConversationId conv{account_, BackendKind::Telegram, chat};

        if (type == "updateNewChat")
        {
            const auto &c = json_member(u, "chat");

            ConversationEvent ce;
            ce.conversation = conv;
            ce.name = json_string(c, "title");
            if (c.contains("unread_count"))
                ce.serverUnread = static_cast<std::uint32_t>(std::max<std::int64_t>(0, json_int(c, "unread_count")));

            for (const auto &pos : json_member(c, "positions"))
            {
                if (json_string(json_member(pos, "list"), "@type") == "chatListArchive")
                    ce.archived = true;
            }

            const auto lastDate = json_int(json_member(c, "last_message"), "date");
            if (lastDate > 0)
                ce.lastActivity = lastDate * 1000;

            out.push_back(std::move(ce));
        }
        else if (type == "updateChatTitle")
        {
            ConversationEvent ce;
            ce.conversation = conv;
            ce.name = json_string(u, "title");
            out.push_back(std::move(ce));
        }
        else if (type == "updateChatPosition")
        {
            const auto &pos = json_member(u, "position");
            const std::string list = json_string(json_member(pos, "list"), "@type");
            const std::string order = json_id(pos, "order");
            const bool listed = !order.empty() && order != "0";

            ConversationEvent ce;
            ce.conversation = conv;
            if (list == "chatListArchive" && listed)
                ce.archived = true;
            else if (list == "chatListMain" && listed)
                ce.archived = false;
            else
                return out;
            out.push_back(std::move(ce));
        }
        else if (type == "updateChatReadInbox")
        {
            ConversationEvent ce;
            ce.conversation = conv;
            ce.serverUnread = static_cast<std::uint32_t>(std::max<std::int64_t>(0, json_int(u, "unread_count")));
            out.push_back(std::move(ce));
        }
        else if (type == "updateChatReadOutbox")
        {
            // private chats share their id with the peer
            ReadReceiptEvent rr;
            rr.conversation = conv;
            rr.reader = ParticipantId{account_, chat};
            rr.upTo = json_id(u, "last_read_outbox_message_id");
            if (!rr.upTo.empty())
                out.push_back(std::move(rr));
        }
        else if (type == "updateMessageContent")
        {
            const std::string message = json_id(u, "message_id");
            const std::string text = content_text(json_member(u, "new_content"));
            if (message.empty() || text.empty())
                return out;

            auto sender = sender_of(chat, message);
            if (!sender)
                return out;

            EditEvent ee;
            ee.conversation = conv;
            ee.native = edit_native(message, text);
            ee.target = message;
            ee.sender = std::move(*sender);
            ee.timestamp = now_ms();
            ee.text = text;
            out.push_back(std::move(ee));
        }
        else if (type == "updateMessageInteractionInfo")
        {
            const std::string message = json_id(u, "message_id");
            if (!message.empty())
                out.push_back(translate_interaction(conv, message, json_member(u, "interaction_info")));
        }
        else if (type == "updateDeleteMessages")
        {
            // from_cache: TDLib only evicted its local copy
            if (json_bool(u, "from_cache"))
                return out;

            for (const auto &id : json_member(u, "message_ids"))
            {
                if (!id.is_number_integer())
                    continue;
                const std::string target = std::to_string(id.get<std::int64_t>());
                out.push_back(RedactionEvent{conv, "d" + target, target});
            }
        }
        else if (type == "updateChatAction")
        {
            const std::string sender = sender_native(json_member(u, "sender_id"));
            const std::string action = json_string(json_member(u, "action"), "@type");
            if (sender.empty() || (action != "chatActionTyping" && action != "chatActionCancel"))
                return out;

            TypingEvent te;
            te.conversation = conv;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto &users = typing_[chat];
                if (action == "chatActionTyping")
                    users.insert(sender);
                else
                    users.erase(sender);

                for (const auto &user : users)
                    te.typing.push_back(ParticipantId{account_, user});
                if (users.empty())
                    typing_.erase(chat);
            }
            out.push_back(std::move(te));
        }

        return out;
    }

} // namespace echat::sync
