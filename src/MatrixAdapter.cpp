#include <echat/sync/MatrixAdapter.hpp>

#include <algorithm>
#include <stdexcept>

#include <boost/system/system_error.hpp>
#include <openssl/rand.h>

#include <vix/utils/Logger.hpp>

#include <echat/sync/errors.hpp>

#include "json_helpers.hpp"

namespace echat::sync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    using detail::fnv32hex;
    using detail::json_int;
    using detail::json_member;
    using detail::json_string;
    using json = nlohmann::json;
    namespace http = boost::beast::http;

    namespace
    {
        constexpr const char *kApi = "/_matrix/client/v3";

        // members are lazy-loaded: the timeline brings the ones that speak
        const char *kSyncFilter =
            R"({"room":{"state":{"lazy_load_members":true},"timeline":{"lazy_load_members":true,"limit":50}}})";

        std::string hex(const unsigned char *data, std::size_t n)
        {
            static const char *digits = "0123456789abcdef";
            std::string out;
            out.reserve(n * 2);
            for (std::size_t i = 0; i < n; ++i)
            {
                out.push_back(digits[data[i] >> 4]);
                out.push_back(digits[data[i] & 0x0f]);
            }
            return out;
        }

        std::string random_hex(std::size_t bytes)
        {
            std::string buf(bytes, '\0');
            auto *p = reinterpret_cast<unsigned char *>(buf.data());
            if (RAND_bytes(p, static_cast<int>(bytes)) != 1)
                throw std::runtime_error("[MatrixAdapter] RAND_bytes failed");
            return hex(p, bytes);
        }

        std::string room_path(const std::string &room)
        {
            return std::string(kApi) + "/rooms/" + url_encode(room);
        }

        /// Pickle passphrase of the device account, created on first use.
        std::string pickle_key(IStateStore &state, const AccountId &account)
        {
            if (auto stored = state.load_secret(account, "olm.pickle_key"))
            {
                const std::string key = json_string(*stored, "key");
                if (!key.empty())
                    return key;
            }

            std::string key = random_hex(32);
            state.save_secret(account, "olm.pickle_key", json{{"key", key}});
            return key;
        }

        json envelope(const char *kind, const std::string &room, const char *membership, const json &event)
        {
            json e{{"kind", kind}, {"event", event}};
            if (!room.empty())
                e["room"] = room;
            if (membership)
                e["membership"] = membership;
            return e;
        }

        std::string body_text(const json &content)
        {
            const auto &newContent = json_member(content, "m.new_content");
            if (newContent.contains("body"))
                return json_string(newContent, "body");

            std::string body = json_string(content, "body");
            const std::string msgtype = json_string(content, "msgtype");
            if (msgtype == "m.emote")
                return "* " + body;
            return body;
        }
    } // namespace

    // ───────────────────────── stream ─────────────────────────

    class MatrixAdapter::SyncStream : public IEventStream
    {
    public:
        SyncStream(MatrixAdapter &adapter, std::string since)
            : adapter_(adapter), since_(std::move(since))
        {
        }

        RawBatch next(const CancellationToken &cancel) override
        {
            if (cancel.cancelled())
                throw Cancelled();

            RawBatch batch = adapter_.sync_once(since_);
            if (cancel.cancelled())
                throw Cancelled();

            since_ = batch.cursor;
            return batch;
        }

    private:
        MatrixAdapter &adapter_;
        std::string since_;
    };

    // ───────────────────────── lifecycle ─────────────────────────

    MatrixAdapter::MatrixAdapter(AccountId account,
                                 std::shared_ptr<IHttpTransport> http,
                                 IStateStore &state,
                                 const Config &config)
        : account_(std::move(account)),
          http_(std::move(http)),
          state_(state),
          config_(config),
          nonce_(random_hex(4))
    {
        crypto_ = std::make_unique<OlmEncryptionManager>(account_, state_, pickle_key(state_, account_));
    }

    MatrixAdapter::~MatrixAdapter() = default;

    std::string MatrixAdapter::user_id() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return userId_;
    }

    json MatrixAdapter::request(http::verb method,
                                const std::string &target,
                                const json &body,
                                std::optional<std::chrono::milliseconds> timeout,
                                bool login)
    {
        HttpRequest req;
        req.method = method;
        req.target = target;
        req.timeout = timeout.value_or(config_.longPollTimeout);
        if (!body.is_null())
            req.body = body.dump();

        std::shared_ptr<IHttpTransport> http;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            http = http_;
            if (!login)
                req.accessToken = accessToken_;
        }
        if (!http)
            throw PermanentError("matrix: no homeserver configured");

        HttpResponse res;
        try
        {
            res = http->perform(req);
        }
        catch (const boost::system::system_error &e)
        {
            throw TransientError(std::string("matrix: network error: ") + e.what());
        }

        const json payload = json::parse(res.body, nullptr, false);

        if (res.status >= 200 && res.status < 300)
        {
            if (payload.is_discarded())
                throw TransientError("matrix: malformed response to " + target);
            return payload;
        }

        const std::string errcode = json_string(payload, "errcode");
        const std::string error = json_string(payload, "error");
        const std::string what = "matrix: HTTP " + std::to_string(res.status) + " " + errcode +
                                 (error.empty() ? "" : ": " + error);

        if (errcode == "M_UNKNOWN_TOKEN" || errcode == "M_MISSING_TOKEN" || errcode == "M_USER_DEACTIVATED" ||
            res.status == 401 || (login && errcode == "M_FORBIDDEN"))
        {
            throw AuthError(what);
        }

        if (res.status == 429 || res.status >= 500 || errcode == "M_LIMIT_EXCEEDED")
            throw TransientError(what);

        throw PermanentError(what);
    }

    SessionInfo MatrixAdapter::connect(const Credentials &credentials)
    {
        const std::string homeserver = json_string(credentials.params, "homeserver");

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!http_)
            {
                if (homeserver.empty())
                    throw PermanentError("matrix: missing homeserver");
                try
                {
                    http_ = std::make_shared<BeastHttpTransport>(homeserver);
                }
                catch (const std::invalid_argument &e)
                {
                    throw PermanentError(e.what());
                }
            }
        }

        const std::string token = json_string(credentials.session, "access_token");
        std::string userId;
        std::string deviceId;

        if (!token.empty())
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                accessToken_ = token;
            }
            const json whoami = request(http::verb::get, std::string(kApi) + "/account/whoami");
            userId = json_string(whoami, "user_id");
            deviceId = json_string(credentials.session, "device_id");
            if (deviceId.empty())
                deviceId = json_string(whoami, "device_id");

            logger.log(Logger::Level::INFO, "[sync][matrix] {} restored session of {}", account_, userId);
        }
        else
        {
            const std::string user = json_string(credentials.params, "user");
            const std::string password = json_string(credentials.params, "password");
            if (user.empty() || password.empty())
                throw AuthError("matrix: user and password required");

            std::string deviceName = json_string(credentials.params, "device_name");
            if (deviceName.empty())
                deviceName = "echat";

            json body{
                {"type", "m.login.password"},
                {"identifier", {{"type", "m.id.user"}, {"user", user}}},
                {"password", password},
                {"initial_device_display_name", deviceName},
            };

            const json res = request(http::verb::post, std::string(kApi) + "/login", body, std::nullopt, true);
            userId = json_string(res, "user_id");
            deviceId = json_string(res, "device_id");

            std::lock_guard<std::mutex> lock(mutex_);
            accessToken_ = json_string(res, "access_token");
            if (accessToken_.empty())
                throw AuthError("matrix: login response without access token");

            logger.log(Logger::Level::INFO, "[sync][matrix] {} logged in as {} (device {})", account_, userId, deviceId);
        }

        if (userId.empty())
            throw PermanentError("matrix: homeserver did not report the user id");

        SessionInfo info;
        info.selfId = userId;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            userId_ = userId;
            deviceId_ = deviceId;
            info.persisted = json{
                {"access_token", accessToken_},
                {"device_id", deviceId_},
                {"user_id", userId_},
            };
        }

        if (!deviceId.empty())
        {
            crypto_->load_or_create(userId, deviceId);
            upload_keys(std::nullopt);
        }
        else
        {
            logger.log(Logger::Level::WARN, "[sync][matrix] {} no device id, end-to-end encryption disabled", account_);
        }

        return info;
    }

    void MatrixAdapter::upload_keys(std::optional<std::size_t> onServer)
    {
        const std::string target = std::string(kApi) + "/keys/upload";

        if (!onServer || !crypto_->device_keys_uploaded())
        {
            json body = json::object();
            const bool withDevice = !crypto_->device_keys_uploaded();
            if (withDevice)
                body["device_keys"] = crypto_->device_keys();

            const json res = request(http::verb::post, target, body);
            if (withDevice)
                crypto_->mark_keys_published(true);
            onServer = static_cast<std::size_t>(json_int(json_member(res, "one_time_key_counts"), "signed_curve25519"));
        }

        crypto_->replenish_one_time_keys(*onServer);

        json otks = crypto_->one_time_keys();
        if (otks.empty())
            return;

        request(http::verb::post, target, json{{"one_time_keys", otks}});
        crypto_->mark_keys_published(false);

        logger.log(Logger::Level::DEBUG, "[sync][matrix] {} uploaded {} one-time key(s)", account_, otks.size());
    }

    std::unique_ptr<IEventStream> MatrixAdapter::resume(const std::optional<SyncCursor> &cursor)
    {
        return std::make_unique<SyncStream>(*this, cursor ? cursor->token : std::string{});
    }

    // ───────────────────────── sync ─────────────────────────

    RawBatch MatrixAdapter::sync_once(const std::string &since)
    {
        const auto pollMs = config_.longPollTimeout.count();

        std::string target = std::string(kApi) + "/sync?filter=" + url_encode(kSyncFilter);
        if (!since.empty())
        {
            target += "&since=" + url_encode(since);
            target += "&timeout=" + std::to_string(pollMs);
        }
        else
        {
            target += "&timeout=0";
        }

        // the server holds the request for up to pollMs
        const json res = request(http::verb::get, target, json(),
                                 config_.longPollTimeout + std::chrono::milliseconds(15000));

        RawBatch batch;
        batch.cursor = json_string(res, "next_batch");
        flatten(res, batch.events);

        const auto &counts = json_member(res, "device_one_time_keys_count");
        if (counts.contains("signed_curve25519") && crypto_->ready())
        {
            try
            {
                upload_keys(static_cast<std::size_t>(json_int(counts, "signed_curve25519")));
            }
            catch (const TransientError &e)
            {
                logger.log(Logger::Level::WARN, "[sync][matrix] {} key upload deferred: {}", account_, e.what());
            }
            catch (const PermanentError &e)
            {
                logger.log(Logger::Level::WARN, "[sync][matrix] {} key upload rejected: {}", account_, e.what());
            }
        }

        return batch;
    }

    void MatrixAdapter::flatten(const json &sync, std::vector<RawEvent> &out) const
    {
        for (const auto &ev : json_member(json_member(sync, "to_device"), "events"))
            out.push_back(RawEvent{envelope("to_device", {}, nullptr, ev)});

        for (const auto &ev : json_member(json_member(sync, "presence"), "events"))
            out.push_back(RawEvent{envelope("presence", {}, nullptr, ev)});

        const auto &rooms = json_member(sync, "rooms");

        auto section = [&](const char *membership, const json &byRoom)
        {
            if (!byRoom.is_object())
                return;

            for (const auto &[room, data] : byRoom.items())
            {
                json summary{{"kind", "room_summary"}, {"room", room}, {"membership", membership}};

                const auto &unread = json_member(data, "unread_notifications");
                if (unread.contains("notification_count"))
                    summary["unread"] = json_int(unread, "notification_count");

                const auto &timeline = json_member(data, "timeline");
                const std::string prev = json_string(timeline, "prev_batch");
                if (!prev.empty())
                    summary["prev_batch"] = prev;

                for (const auto &ev : json_member(json_member(data, "state"), "events"))
                    out.push_back(RawEvent{envelope("state", room, membership, ev)});

                for (const auto &ev : json_member(timeline, "events"))
                    out.push_back(RawEvent{envelope("timeline", room, membership, ev)});

                for (const auto &ev : json_member(json_member(data, "ephemeral"), "events"))
                    out.push_back(RawEvent{envelope("ephemeral", room, membership, ev)});

                // the server count already includes this batch's timeline, so it lands last
                out.push_back(RawEvent{std::move(summary)});
            }
        };

        section("join", json_member(rooms, "join"));
        section("leave", json_member(rooms, "leave"));
    }

    // ───────────────────────── outbound ─────────────────────────

    std::string MatrixAdapter::wire_txn(const std::string &room, const std::string &txnId) const
    {
        return "echat" + nonce_ + "." + fnv32hex(room) + "." + txnId;
    }

    std::string MatrixAdapter::local_txn(const std::string &wire) const
    {
        const std::string prefix = "echat" + nonce_ + ".";
        if (wire.rfind(prefix, 0) != 0)
            return {};

        const auto dot = wire.find('.', prefix.size());
        if (dot == std::string::npos)
            return {};
        return wire.substr(dot + 1);
    }

    bool MatrixAdapter::room_encrypted(const std::string &room) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return encryptedRooms_.count(room) > 0;
    }

    void MatrixAdapter::set_room_encrypted(const std::string &room)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        encryptedRooms_.insert(room);
    }

    SendReceipt MatrixAdapter::put_event(const ConversationId &conversation,
                                         const std::string &type,
                                         const json &content,
                                         const std::string &txnId)
    {
        // outbound megolm sessions (and the olm key sharing they need) are not implemented
        if (room_encrypted(conversation.native))
            throw PermanentError("matrix: sending to encrypted rooms is not supported");

        const std::string target = room_path(conversation.native) + "/send/" + url_encode(type) + "/" +
                                   url_encode(wire_txn(conversation.native, txnId));

        const json res = request(http::verb::put, target, content);

        SendReceipt receipt;
        receipt.serverId = json_string(res, "event_id");
        receipt.timestamp = now_ms();
        if (receipt.serverId.empty())
            throw TransientError("matrix: send response without event id");
        return receipt;
    }

    SendReceipt MatrixAdapter::send(const ConversationId &conversation,
                                    const std::string &text,
                                    const std::string &txnId)
    {
        return put_event(conversation, "m.room.message", json{{"msgtype", "m.text"}, {"body", text}}, txnId);
    }

    SendReceipt MatrixAdapter::edit(const ConversationId &conversation,
                                    const std::string &target,
                                    const std::string &text,
                                    const std::string &txnId)
    {
        json content{
            {"msgtype", "m.text"},
            {"body", "* " + text},
            {"m.new_content", {{"msgtype", "m.text"}, {"body", text}}},
            {"m.relates_to", {{"rel_type", "m.replace"}, {"event_id", target}}},
        };
        return put_event(conversation, "m.room.message", content, txnId);
    }

    SendReceipt MatrixAdapter::react(const ConversationId &conversation,
                                     const std::string &target,
                                     const std::string &key,
                                     const std::string &txnId)
    {
        json content{
            {"m.relates_to", {{"rel_type", "m.annotation"}, {"event_id", target}, {"key", key}}},
        };
        return put_event(conversation, "m.reaction", content, txnId);
    }

    void MatrixAdapter::mark_read(const ConversationId &conversation, const std::string &upTo)
    {
        request(http::verb::post,
                room_path(conversation.native) + "/receipt/m.read/" + url_encode(upTo),
                json::object());
    }

    HistoryPage MatrixAdapter::fetch_history(const ConversationId &conversation,
                                             const std::optional<std::string> &before,
                                             std::size_t limit)
    {
        std::string target = room_path(conversation.native) + "/messages?dir=b&limit=" + std::to_string(limit);
        if (before)
            target += "&from=" + url_encode(*before);

        const json res = request(http::verb::get, target);

        HistoryPage page;
        for (const auto &ev : json_member(res, "state"))
            page.events.push_back(RawEvent{envelope("state", conversation.native, "join", ev)});

        const auto &chunk = json_member(res, "chunk");
        for (const auto &ev : chunk)
            page.events.push_back(RawEvent{envelope("timeline", conversation.native, "join", ev)});

        const std::string end = json_string(res, "end");
        if (!end.empty() && chunk.is_array() && !chunk.empty())
            page.nextBefore = end;

        return page;
    }

    std::vector<RawEvent> MatrixAdapter::list_conversations()
    {
        const json joined = request(http::verb::get, std::string(kApi) + "/joined_rooms");

        std::vector<RawEvent> out;
        for (const auto &r : json_member(joined, "joined_rooms"))
        {
            if (!r.is_string())
                continue;
            const std::string room = r.get<std::string>();

            out.push_back(RawEvent{json{{"kind", "room_summary"}, {"room", room}, {"membership", "join"}}});

            try
            {
                const json state = request(http::verb::get, room_path(room) + "/state");
                for (const auto &ev : state)
                    out.push_back(RawEvent{envelope("state", room, "join", ev)});
            }
            catch (const PermanentError &e)
            {
                logger.log(Logger::Level::WARN, "[sync][matrix] {} no state for {}: {}", account_, room, e.what());
            }
        }

        return out;
    }

    RawEvent MatrixAdapter::encode_message(const ConversationId &conversation,
                                           const std::string &text,
                                           const std::string &txnId) const
    {
        std::string self;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            self = userId_;
        }

        const std::string wire = wire_txn(conversation.native, txnId);

        json ev{
            {"type", "m.room.message"},
            {"event_id", "$" + wire},
            {"sender", self},
            {"origin_server_ts", now_ms()},
            {"content", {{"msgtype", "m.text"}, {"body", text}}},
            {"unsigned", {{"transaction_id", wire}}},
        };
        return RawEvent{envelope("timeline", conversation.native, "join", ev)};
    }

    // ───────────────────────── translation ─────────────────────────

    std::vector<SyncEvent> MatrixAdapter::translate(const RawEvent &raw)
    {
        const json &p = raw.payload;
        const std::string kind = json_string(p, "kind");
        const std::string room = json_string(p, "room");
        const json &ev = json_member(p, "event");

        std::vector<SyncEvent> out;

        if (kind == "to_device")
        {
            if (json_string(ev, "type") == "m.room.encrypted")
                out.push_back(KeyEvent{account_, ev});
            return out;
        }

        if (kind == "presence")
        {
            const std::string sender = json_string(ev, "sender");
            if (sender.empty())
                return out;

            const auto &content = json_member(ev, "content");
            PresenceEvent pe;
            pe.participant = ParticipantId{account_, sender};
            pe.presence = json_string(content, "presence");
            const auto ago = json_int(content, "last_active_ago", -1);
            pe.lastActive = ago >= 0 ? now_ms() - ago : 0;
            out.push_back(std::move(pe));

            if (content.contains("displayname") || content.contains("avatar_url"))
            {
                ParticipantEvent part;
                part.participant = ParticipantId{account_, sender};
                if (content.contains("displayname"))
                    part.displayName = json_string(content, "displayname");
                if (content.contains("avatar_url"))
                    part.avatar = json_string(content, "avatar_url");
                out.push_back(std::move(part));
            }
            return out;
        }

        if (room.empty())
            return out;

        const ConversationId conv{account_, BackendKind::Matrix, room};

        if (kind == "room_summary")
        {
            ConversationEvent ce;
            ce.conversation = conv;
            ce.archived = json_string(p, "membership") == "leave";
            if (p.contains("unread"))
                ce.serverUnread = static_cast<std::uint32_t>(std::max<std::int64_t>(0, json_int(p, "unread")));
            const std::string prev = json_string(p, "prev_batch");
            if (!prev.empty())
                ce.historyToken = prev;
            out.push_back(std::move(ce));
            return out;
        }

        if (kind == "ephemeral")
        {
            const std::string type = json_string(ev, "type");
            const auto &content = json_member(ev, "content");

            if (type == "m.typing")
            {
                TypingEvent te;
                te.conversation = conv;
                for (const auto &u : json_member(content, "user_ids"))
                {
                    if (u.is_string())
                        te.typing.push_back(ParticipantId{account_, u.get<std::string>()});
                }
                out.push_back(std::move(te));
            }
            else if (type == "m.receipt" && content.is_object())
            {
                const std::string self = user_id();
                for (const auto &[eventId, receipts] : content.items())
                {
                    for (const auto &[reader, data] : json_member(receipts, "m.read").items())
                    {
                        (void)data;
                        ReadReceiptEvent rr;
                        rr.conversation = conv;
                        rr.reader = ParticipantId{account_, reader};
                        rr.upTo = eventId;
                        rr.own = reader == self;
                        out.push_back(std::move(rr));
                    }
                }
            }
            return out;
        }

        if (kind == "state" || kind == "timeline")
            return translate_room_event(conv, ev);

        return out;
    }

    std::vector<SyncEvent> MatrixAdapter::translate_room_event(const ConversationId &conv, const json &ev)
    {
        std::vector<SyncEvent> out;

        const std::string type = json_string(ev, "type");
        const std::string eventId = json_string(ev, "event_id");
        const std::string sender = json_string(ev, "sender");
        const std::int64_t ts = json_int(ev, "origin_server_ts");
        const auto &content = json_member(ev, "content");
        const auto &unsignedData = json_member(ev, "unsigned");
        const std::string txn = local_txn(json_string(unsignedData, "transaction_id"));
        const std::string self = user_id();
        const ParticipantId from{account_, sender};

        if (type == "m.room.name")
        {
            ConversationEvent ce;
            ce.conversation = conv;
            ce.name = json_string(content, "name");
            out.push_back(std::move(ce));
        }
        else if (type == "m.room.canonical_alias")
        {
            ConversationEvent ce;
            ce.conversation = conv;
            ce.alias = json_string(content, "alias");
            out.push_back(std::move(ce));
        }
        else if (type == "m.room.encryption")
        {
            set_room_encrypted(conv.native);
            ConversationEvent ce;
            ce.conversation = conv;
            ce.encrypted = true;
            out.push_back(std::move(ce));
        }
        else if (type == "m.room.member")
        {
            const std::string who = json_string(ev, "state_key");
            if (who.empty())
                return out;

            const ParticipantId member{account_, who};
            const std::string membership = json_string(content, "membership");

            ConversationEvent ce;
            ce.conversation = conv;
            if (membership == "join")
            {
                ce.joined.push_back(member);
            }
            else if (membership == "leave" || membership == "ban")
            {
                ce.left.push_back(member);
                if (who == self)
                    ce.archived = true;
            }
            out.push_back(std::move(ce));

            if (membership == "join")
            {
                ParticipantEvent pe;
                pe.participant = member;
                if (content.contains("displayname"))
                    pe.displayName = json_string(content, "displayname");
                if (content.contains("avatar_url"))
                    pe.avatar = json_string(content, "avatar_url");
                out.push_back(std::move(pe));
            }
        }
        else if (type == "m.room.message")
        {
            if (eventId.empty())
                return out;

            const auto &rel = json_member(content, "m.relates_to");
            if (json_string(rel, "rel_type") == "m.replace" && !json_string(rel, "event_id").empty())
            {
                EditEvent ee;
                ee.conversation = conv;
                ee.native = eventId;
                ee.target = json_string(rel, "event_id");
                ee.sender = from;
                ee.timestamp = ts;
                ee.text = body_text(content);
                ee.transactionId = txn;
                out.push_back(std::move(ee));
                return out;
            }

            MessageEvent me;
            me.conversation = conv;
            me.native = eventId;
            me.sender = from;
            me.timestamp = ts;
            me.content.text = body_text(content);
            me.content.redacted = content.empty() && unsignedData.contains("redacted_because");
            me.transactionId = txn;
            me.outgoing = !self.empty() && sender == self;
            out.push_back(std::move(me));
        }
        else if (type == "m.reaction")
        {
            const auto &rel = json_member(content, "m.relates_to");
            if (eventId.empty() || json_string(rel, "rel_type") != "m.annotation")
                return out;

            ReactionEvent re;
            re.conversation = conv;
            re.native = eventId;
            re.target = json_string(rel, "event_id");
            re.sender = from;
            re.key = json_string(rel, "key");
            re.transactionId = txn;
            if (!re.target.empty() && !re.key.empty())
                out.push_back(std::move(re));
        }
        else if (type == "m.room.redaction")
        {
            RedactionEvent rd;
            rd.conversation = conv;
            rd.native = eventId;
            // room v11 moved `redacts` into the content
            rd.target = ev.contains("redacts") ? json_string(ev, "redacts") : json_string(content, "redacts");
            if (!rd.target.empty())
                out.push_back(std::move(rd));
        }
        else if (type == "m.room.encrypted")
        {
            if (eventId.empty())
                return out;

            set_room_encrypted(conv.native);

            EncryptedPayload payload;
            payload.algorithm = json_string(content, "algorithm");
            payload.sessionId = json_string(content, "session_id");
            payload.senderKey = json_string(content, "sender_key");
            payload.deviceId = json_string(content, "device_id");
            payload.ciphertext = json_string(content, "ciphertext");

            MessageEvent me;
            me.conversation = conv;
            me.native = eventId;
            me.sender = from;
            me.timestamp = ts;
            me.content.encrypted = std::move(payload);
            me.content.redacted = content.empty() && unsignedData.contains("redacted_because");
            me.transactionId = txn;
            me.outgoing = !self.empty() && sender == self;

            if (me.content.redacted)
                me.content.encrypted.reset();
            out.push_back(std::move(me));
        }

        return out;
    }

    std::vector<SyncEvent> MatrixAdapter::interpret_plaintext(const MessageEvent &envelope,
                                                              const std::string &plaintext)
    {
        const json inner = json::parse(plaintext, nullptr, false);
        if (inner.is_discarded() || !inner.is_object())
            return {};

        // the decrypted payload only has type and content; the rest comes from the envelope
        json ev{
            {"type", json_string(inner, "type")},
            {"content", json_member(inner, "content")},
            {"event_id", envelope.native},
            {"sender", envelope.sender.native},
            {"origin_server_ts", envelope.timestamp},
        };

        auto events = translate_room_event(envelope.conversation, ev);
        for (auto &e : events)
        {
            if (auto *m = std::get_if<MessageEvent>(&e))
            {
                m->transactionId = envelope.transactionId;
                m->outgoing = envelope.outgoing;
            }
            else if (auto *ed = std::get_if<EditEvent>(&e))
            {
                ed->transactionId = envelope.transactionId;
            }
            else if (auto *re = std::get_if<ReactionEvent>(&e))
            {
                re->transactionId = envelope.transactionId;
            }
        }
        return events;
    }

} // namespace echat::sync
