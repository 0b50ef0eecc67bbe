#ifndef ECHAT_SYNC_TESTS_TEST_UTIL_HPP
#define ECHAT_SYNC_TESTS_TEST_UTIL_HPP

// Scripted backend used by the engine, queue and core tests.
//
// Raw events are small JSON objects:
//   {"type":"message","conv":"r","id":"$1","sender":"@a","ts":1,"text":"hi"}
//   {"type":"message",...,"session":"s1","cipher":"<plaintext json>"}   (encrypted)
//   {"type":"edit","conv":"r","id":"$e","target":"$1","sender":"@a","ts":2,"text":"x"}
//   {"type":"reaction","conv":"r","id":"$r","target":"$1","sender":"@a","key":"+1"}
//   {"type":"redaction","conv":"r","id":"$x","target":"$1"}
//   {"type":"conversation","conv":"r","name":"Room","unread":3}
//   {"type":"presence","user":"@a","presence":"online"}
//   {"type":"keys","session":"s1"}
//   {"type":"bad"}                                                      (translate throws)

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include <echat/sync/BackendAdapter.hpp>
#include <echat/sync/errors.hpp>

namespace echat::sync::test
{
    using nlohmann::json;

    template <typename Pred>
    bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000))
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (pred())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return pred();
    }

    /// Short timings so retries and backoff finish within a test.
    inline Config fast_config()
    {
        Config cfg;
        cfg.workerThreads = 2;
        cfg.reconnect = BackoffPolicy{std::chrono::milliseconds(5), 2.0, std::chrono::milliseconds(20), 2};
        cfg.send = BackoffPolicy{std::chrono::milliseconds(5), 2.0, std::chrono::milliseconds(20), 2};
        cfg.reconcileTimeout = std::chrono::milliseconds(2000);
        cfg.longPollTimeout = std::chrono::milliseconds(50);
        cfg.historyPageSize = 10;
        cfg.subscriptionBuffer = 64;
        cfg.subscriptionTtl = std::chrono::seconds(60);
        cfg.stateDb = ":memory:";
        return cfg;
    }

    inline json message(const std::string &conv, const std::string &id, const std::string &sender,
                        std::int64_t ts, const std::string &text)
    {
        return json{{"type", "message"}, {"conv", conv}, {"id", id}, {"sender", sender}, {"ts", ts}, {"text", text}};
    }

    inline json encrypted(const std::string &conv, const std::string &id, const std::string &sender,
                          std::int64_t ts, const std::string &session, const json &inner)
    {
        return json{{"type", "message"}, {"conv", conv}, {"id", id}, {"sender", sender}, {"ts", ts},
                    {"session", session}, {"cipher", inner.dump()}};
    }

    inline json edit(const std::string &conv, const std::string &id, const std::string &target,
                     const std::string &sender, std::int64_t ts, const std::string &text)
    {
        return json{{"type", "edit"}, {"conv", conv}, {"id", id}, {"target", target},
                    {"sender", sender}, {"ts", ts}, {"text", text}};
    }

    inline json reaction(const std::string &conv, const std::string &id, const std::string &target,
                         const std::string &sender, const std::string &key)
    {
        return json{{"type", "reaction"}, {"conv", conv}, {"id", id}, {"target", target},
                    {"sender", sender}, {"key", key}};
    }

    inline json redaction(const std::string &conv, const std::string &id, const std::string &target)
    {
        return json{{"type", "redaction"}, {"conv", conv}, {"id", id}, {"target", target}};
    }

    inline std::vector<RawEvent> raws(std::initializer_list<json> payloads)
    {
        std::vector<RawEvent> out;
        for (const auto &p : payloads)
            out.push_back(RawEvent{p});
        return out;
    }

    /// Decrypts "ciphertext" (plain JSON) once the session is known.
    class FakeCrypto : public IEncryptionProvider
    {
    public:
        DecryptResult decrypt(const ConversationId &, const std::string &, const EncryptedPayload &payload) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!sessions_.count(payload.sessionId))
                return DecryptResult::failure(reason::kNoSession, payload.sessionId);
            return DecryptResult::success(payload.ciphertext, payload.sessionId);
        }

        std::vector<std::string> handle_to_device(const json &raw) override
        {
            const auto id = raw.at("session").get<std::string>();
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_.insert(id);
            return {id};
        }

        bool import_room_key(const std::string &, const std::string &sessionId, const std::string &sessionKey) override
        {
            if (sessionKey.empty())
                return false;
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_.insert(sessionId);
            return true;
        }

        void verify_device(const ParticipantId &participant, const std::string &deviceId) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            verified_.insert(participant.native + "|" + deviceId);
        }

        bool device_verified(const ParticipantId &participant, const std::string &deviceId) const override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return verified_.count(participant.native + "|" + deviceId) > 0;
        }

        void rotate() override { ++rotations; }

        int rotations = 0;

    private:
        mutable std::mutex mutex_;
        std::set<std::string> sessions_;
        std::set<std::string> verified_;
    };

    /**
     * Adapter whose network is a script. Batches pushed with push_batch() are
     * returned by the stream; outbound calls go through replaceable handlers.
     */
    class FakeAdapter : public IBackendAdapter
    {
    public:
        using SendHandler = std::function<SendReceipt(const ConversationId &, const std::string &, const std::string &)>;

        explicit FakeAdapter(AccountId account, BackendKind kind = BackendKind::Matrix, bool withCrypto = false)
            : account_(std::move(account)), kind_(kind)
        {
            if (withCrypto)
                crypto_ = std::make_unique<FakeCrypto>();
        }

        BackendKind kind() const noexcept override { return kind_; }
        const AccountId &account() const noexcept override { return account_; }

        // ───────────── script ─────────────

        void push_batch(std::vector<RawEvent> events, std::string cursor = {})
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                batches_.push_back(RawBatch{std::move(events), std::move(cursor)});
            }
            cv_.notify_all();
        }

        /// The next stream call throws @p error.
        void push_stream_error(std::exception_ptr error)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                streamErrors_.push_back(std::move(error));
            }
            cv_.notify_all();
        }

        /// The next connect() calls throw these, in order.
        void push_connect_error(std::exception_ptr error)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connectErrors_.push_back(std::move(error));
        }

        void set_send_handler(SendHandler handler)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sendHandler_ = std::move(handler);
        }

        void set_conversations(std::vector<RawEvent> raws)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            conversations_ = std::move(raws);
        }

        void push_history_page(HistoryPage page)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            history_.push_back(std::move(page));
        }

        std::size_t batches_left() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return batches_.size();
        }

        FakeCrypto *crypto() noexcept { return crypto_.get(); }

        // ───────────── recorded calls ─────────────

        std::atomic<int> connects{0};
        std::atomic<int> sends{0};
        std::atomic<int> edits{0};
        std::atomic<int> reacts{0};
        std::atomic<int> closes{0};

        std::vector<std::string> sent_txns() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return sentTxns_;
        }

        std::vector<std::string> marked_read() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return markedRead_;
        }

        std::optional<std::optional<std::string>> last_history_before() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return lastBefore_;
        }

        Credentials last_credentials() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return lastCredentials_;
        }

        std::optional<SyncCursor> last_resume_cursor() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return lastCursor_;
        }

        // ───────────── IBackendAdapter ─────────────

        SessionInfo connect(const Credentials &credentials) override
        {
            ++connects;
            std::exception_ptr error;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                lastCredentials_ = credentials;
                if (!connectErrors_.empty())
                {
                    error = connectErrors_.front();
                    connectErrors_.pop_front();
                }
            }
            if (error)
                std::rethrow_exception(error);

            return SessionInfo{"@me", json{{"token", "t-" + account_}}};
        }

        std::unique_ptr<IEventStream> resume(const std::optional<SyncCursor> &cursor) override
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                lastCursor_ = cursor;
            }
            return std::make_unique<Stream>(*this);
        }

        SendReceipt send(const ConversationId &conversation, const std::string &text, const std::string &txnId) override
        {
            ++sends;
            SendHandler handler;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                sentTxns_.push_back(txnId);
                handler = sendHandler_;
            }
            if (handler)
                return handler(conversation, text, txnId);
            return SendReceipt{"$srv" + std::to_string(sends.load()), 0};
        }

        SendReceipt edit(const ConversationId &, const std::string &target, const std::string &,
                         const std::string &) override
        {
            ++edits;
            return SendReceipt{"$edit-of-" + target, 0};
        }

        SendReceipt react(const ConversationId &, const std::string &target, const std::string &key,
                          const std::string &) override
        {
            ++reacts;
            return SendReceipt{"$react-" + key + "-" + target, 0};
        }

        void mark_read(const ConversationId &, const std::string &upTo) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            markedRead_.push_back(upTo);
        }

        HistoryPage fetch_history(const ConversationId &, const std::optional<std::string> &before, std::size_t) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastBefore_ = before;
            if (history_.empty())
                return HistoryPage{};
            auto page = std::move(history_.front());
            history_.pop_front();
            return page;
        }

        std::vector<RawEvent> list_conversations() override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return conversations_;
        }

        std::vector<SyncEvent> translate(const RawEvent &raw) override
        {
            return translate_json(raw.payload, nullptr);
        }

        std::vector<SyncEvent> interpret_plaintext(const MessageEvent &envelope, const std::string &plaintext) override
        {
            return translate_json(json::parse(plaintext), &envelope);
        }

        RawEvent encode_message(const ConversationId &conversation, const std::string &text,
                                const std::string &txnId) const override
        {
            auto p = message(conversation.native, "$echo" + txnId, "@me", now_ms(), text);
            p["txn"] = txnId;
            return RawEvent{p};
        }

        IEncryptionProvider *encryption() noexcept override { return crypto_.get(); }

        void close() override { ++closes; }

        ConversationId conv(const std::string &native) const
        {
            return ConversationId{account_, kind_, native};
        }

    private:
        class Stream : public IEventStream
        {
        public:
            explicit Stream(FakeAdapter &owner) : owner_(owner) {}

            RawBatch next(const CancellationToken &cancel) override
            {
                std::unique_lock<std::mutex> lock(owner_.mutex_);
                const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(50);
                while (owner_.batches_.empty() && owner_.streamErrors_.empty())
                {
                    if (cancel.cancelled())
                        throw Cancelled();
                    if (std::chrono::steady_clock::now() >= deadline)
                        return RawBatch{};
                    owner_.cv_.wait_for(lock, std::chrono::milliseconds(5));
                }
                if (cancel.cancelled())
                    throw Cancelled();

                if (!owner_.streamErrors_.empty())
                {
                    auto error = owner_.streamErrors_.front();
                    owner_.streamErrors_.pop_front();
                    lock.unlock();
                    std::rethrow_exception(error);
                }

                auto batch = std::move(owner_.batches_.front());
                owner_.batches_.pop_front();
                return batch;
            }

        private:
            FakeAdapter &owner_;
        };

        std::vector<SyncEvent> translate_json(const json &p, const MessageEvent *envelope) const
        {
            const auto type = p.at("type").get<std::string>();
            if (type == "bad")
                throw std::runtime_error("malformed event");

            auto conv = [&]()
            {
                if (envelope)
                    return envelope->conversation;
                return ConversationId{account_, kind_, p.at("conv").get<std::string>()};
            };
            auto who = [&](const char *key)
            {
                return ParticipantId{account_, p.at(key).get<std::string>()};
            };

            if (type == "message")
            {
                MessageEvent m;
                m.conversation = conv();
                m.native = envelope ? envelope->native : p.at("id").get<std::string>();
                m.sender = envelope ? envelope->sender : who("sender");
                m.timestamp = envelope ? envelope->timestamp : p.value("ts", std::int64_t{0});
                m.transactionId = p.value("txn", std::string());
                m.outgoing = m.sender.native == "@me";
                if (p.contains("cipher"))
                {
                    EncryptedPayload enc;
                    enc.algorithm = "fake";
                    enc.sessionId = p.at("session").get<std::string>();
                    enc.ciphertext = p.at("cipher").get<std::string>();
                    m.content.encrypted = enc;
                }
                else
                {
                    m.content.text = p.value("text", std::string());
                }
                return {m};
            }
            if (type == "edit")
            {
                EditEvent e;
                e.conversation = conv();
                e.native = envelope ? envelope->native : p.at("id").get<std::string>();
                e.target = p.at("target").get<std::string>();
                e.sender = envelope ? envelope->sender : who("sender");
                e.timestamp = p.value("ts", std::int64_t{0});
                e.text = p.at("text").get<std::string>();
                return {e};
            }
            if (type == "reaction")
            {
                ReactionEvent r;
                r.conversation = conv();
                r.native = envelope ? envelope->native : p.at("id").get<std::string>();
                r.target = p.at("target").get<std::string>();
                r.sender = envelope ? envelope->sender : who("sender");
                r.key = p.at("key").get<std::string>();
                return {r};
            }
            if (type == "redaction")
            {
                RedactionEvent r;
                r.conversation = conv();
                r.native = p.value("id", std::string());
                r.target = p.at("target").get<std::string>();
                return {r};
            }
            if (type == "conversation")
            {
                ConversationEvent c;
                c.conversation = conv();
                if (p.contains("name"))
                    c.name = p.at("name").get<std::string>();
                if (p.contains("unread"))
                    c.serverUnread = p.at("unread").get<std::uint32_t>();
                return {c};
            }
            if (type == "presence")
            {
                PresenceEvent e;
                e.participant = who("user");
                e.presence = p.at("presence").get<std::string>();
                return {e};
            }
            if (type == "keys")
            {
                return {KeyEvent{account_, p}};
            }
            return {};
        }

    private:
        AccountId account_;
        BackendKind kind_;
        std::unique_ptr<FakeCrypto> crypto_;

        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<RawBatch> batches_;
        std::deque<std::exception_ptr> streamErrors_;
        std::deque<std::exception_ptr> connectErrors_;
        std::deque<HistoryPage> history_;
        std::vector<RawEvent> conversations_;
        SendHandler sendHandler_;

        std::vector<std::string> sentTxns_;
        std::vector<std::string> markedRead_;
        std::optional<std::optional<std::string>> lastBefore_;
        Credentials lastCredentials_;
        std::optional<SyncCursor> lastCursor_;
    };

} // namespace echat::sync::test

#endif // ECHAT_SYNC_TESTS_TEST_UTIL_HPP
