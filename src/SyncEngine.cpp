#include <echat/sync/SyncEngine.hpp>

#include <boost/asio/post.hpp>

#include <vix/utils/Logger.hpp>

#include <echat/sync/errors.hpp>

namespace echat::sync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    namespace
    {
        template <class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        /// Releases the per-conversation history guard on scope exit.
        class InFlightGuard
        {
        public:
            InFlightGuard(std::mutex &m, std::set<ConversationId> &set, const ConversationId &id)
                : m_(m), set_(set), id_(id)
            {
                std::lock_guard<std::mutex> lock(m_);
                acquired_ = set_.insert(id_).second;
            }

            ~InFlightGuard()
            {
                if (!acquired_)
                    return;
                std::lock_guard<std::mutex> lock(m_);
                set_.erase(id_);
            }

            InFlightGuard(const InFlightGuard &) = delete;
            InFlightGuard &operator=(const InFlightGuard &) = delete;

            bool acquired() const noexcept { return acquired_; }

        private:
            std::mutex &m_;
            std::set<ConversationId> &set_;
            ConversationId id_;
            bool acquired_{false};
        };
    } // namespace

    SyncEngine::SyncEngine(std::shared_ptr<IBackendAdapter> adapter,
                           ConversationStore &store,
                           IStateStore &state,
                           const Config &config,
                           SyncMetrics *metrics)
        : adapter_(std::move(adapter)),
          store_(store),
          state_(state),
          config_(config),
          metrics_(metrics)
    {
        status_.account = adapter_->account();
        status_.backend = adapter_->kind();
        status_.state = ConnectionState::Disconnected;
        token_.cancel(); // no run yet
    }

    SyncEngine::~SyncEngine()
    {
        stop();
        join();
    }

    void SyncEngine::set_status_listener(StatusListener listener)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        statusListener_ = std::move(listener);
    }

    void SyncEngine::set_change_sink(ChangeSink sink)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changeSink_ = std::move(sink);
    }

    AccountStatus SyncEngine::status() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }

    const AccountId &SyncEngine::account() const noexcept
    {
        return adapter_->account();
    }

    BackendKind SyncEngine::kind() const noexcept
    {
        return adapter_->kind();
    }

    std::string SyncEngine::self_id() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_.selfId;
    }

    template <typename Fn>
    void SyncEngine::update_status(const CancellationToken &token, Fn &&fn)
    {
        AccountStatus snapshot;
        StatusListener listener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (token.cancelled())
                return;
            fn(status_);
            snapshot = status_;
            listener = statusListener_;
        }

        if (listener)
            listener(snapshot);
    }

    // ───────────────────────── lifecycle ─────────────────────────

    void SyncEngine::start(Credentials credentials)
    {
        stop();
        join();

        CancellationToken token;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            credentials_ = std::move(credentials);
            token_ = token;
            status_.lastError.clear();
            status_.needsLogin = false;
            status_.attempt = 0;
        }

        ioc_ = std::make_unique<boost::asio::io_context>(1);
        timer_ = std::make_unique<boost::asio::steady_timer>(*ioc_);
        stream_.reset();

        logger.log(Logger::Level::INFO, "[sync][engine] {} starting", account());

        boost::asio::post(*ioc_, [this, token]()
                          { connect_step(token); });

        thread_ = std::thread([ioc = ioc_.get()]()
                              { ioc->run(); });
    }

    void SyncEngine::stop()
    {
        AccountStatus snapshot;
        StatusListener listener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (token_.cancelled())
                return;

            token_.cancel();
            status_.state = ConnectionState::Disconnected;
            status_.attempt = 0;
            snapshot = status_;
            listener = statusListener_;
        }

        if (ioc_ && timer_)
        {
            auto *timer = timer_.get();
            boost::asio::post(*ioc_, [timer]()
                              { timer->cancel(); });
        }

        logger.log(Logger::Level::INFO, "[sync][engine] {} stopped", account());

        if (listener)
            listener(snapshot);
    }

    void SyncEngine::join()
    {
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
            thread_.join();
    }

    // ───────────────────────── loop steps ─────────────────────────

    void SyncEngine::connect_step(CancellationToken token)
    {
        if (token.cancelled())
            return;

        update_status(token, [](AccountStatus &s)
                      { s.state = ConnectionState::Connecting; });

        Credentials creds;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            creds = credentials_;
        }

        try
        {
            SessionInfo info = adapter_->connect(creds);
            if (token.cancelled())
                return;

            creds.session = info.persisted;
            state_.save_credentials(account(), creds);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                credentials_ = creds;
                status_.selfId = info.selfId;
            }

            auto cursor = state_.load_cursor(account(), kind());
            stream_ = adapter_->resume(cursor);

            bool seed = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                seed = !seeded_;
            }
            if (seed)
            {
                auto raws = adapter_->list_conversations();
                if (token.cancelled())
                    return;
                const auto n = ingest(raws, false);
                logger.log(Logger::Level::DEBUG, "[sync][engine] {} seeded {} conversation event(s)", account(), n);

                std::lock_guard<std::mutex> lock(mutex_);
                seeded_ = true;
            }

            update_status(token, [](AccountStatus &s)
                          {
                              s.state = ConnectionState::Syncing;
                              s.attempt = 0;
                              s.lastError.clear();
                              s.needsLogin = false; });

            logger.log(Logger::Level::INFO, "[sync][engine] {} syncing as {} (cursor: {})",
                       account(), info.selfId, cursor ? "resumed" : "none");

            boost::asio::post(*ioc_, [this, token]()
                              { poll_step(token); });
        }
        catch (const AuthError &e)
        {
            fail(token, e.what(), true);
        }
        catch (const PermanentError &e)
        {
            fail(token, e.what(), false);
        }
        catch (const std::exception &e)
        {
            schedule_backoff(token, e.what());
        }
    }

    void SyncEngine::poll_step(CancellationToken token)
    {
        if (token.cancelled() || !stream_)
            return;

        try
        {
            RawBatch batch = stream_->next(token);
            if (token.cancelled())
                return;

            if (!batch.events.empty())
            {
                const auto applied = ingest(batch.events, true);
                logger.log(Logger::Level::DEBUG, "[sync][engine] {} batch: {} raw, {} applied",
                           account(), batch.events.size(), applied);
            }

            // durable only once the whole batch is in the store
            if (!batch.cursor.empty() && !token.cancelled())
                state_.save_cursor(SyncCursor{account(), kind(), batch.cursor});

            boost::asio::post(*ioc_, [this, token]()
                              { poll_step(token); });
        }
        catch (const Cancelled &)
        {
            stream_.reset();
        }
        catch (const AuthError &e)
        {
            stream_.reset();
            fail(token, e.what(), true);
        }
        catch (const PermanentError &e)
        {
            stream_.reset();
            fail(token, e.what(), false);
        }
        catch (const std::exception &e)
        {
            stream_.reset();
            schedule_backoff(token, e.what());
        }
    }

    void SyncEngine::schedule_backoff(const CancellationToken &token, const std::string &why)
    {
        if (token.cancelled())
            return;

        unsigned attempt = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            attempt = status_.attempt + 1;
        }

        if (metrics_)
            metrics_->reconnects_total.fetch_add(1, std::memory_order_relaxed);

        if (attempt > config_.reconnect.maxRetries)
        {
            logger.log(Logger::Level::ERROR, "[sync][engine] {} giving up after {} attempt(s): {}",
                       account(), attempt - 1, why);

            update_status(token, [&](AccountStatus &s)
                          {
                              s.state = ConnectionState::Disconnected;
                              s.lastError = why; });
            return;
        }

        const auto delay = config_.reconnect.delay(attempt);

        logger.log(Logger::Level::WARN, "[sync][engine] {} backoff #{} for {} ms: {}",
                   account(), attempt, static_cast<long long>(delay.count()), why);

        update_status(token, [&](AccountStatus &s)
                      {
                          s.state = ConnectionState::Backoff;
                          s.attempt = attempt;
                          s.lastError = why; });

        timer_->expires_after(delay);
        timer_->async_wait([this, token](const boost::system::error_code &ec)
                           {
                               if (ec || token.cancelled())
                                   return;
                               connect_step(token); });
    }

    void SyncEngine::fail(const CancellationToken &token, const std::string &why, bool needsLogin)
    {
        logger.log(Logger::Level::ERROR, "[sync][engine] {} disconnected{}: {}",
                   account(), needsLogin ? " (login required)" : "", why);

        update_status(token, [&](AccountStatus &s)
                      {
                          s.state = ConnectionState::Disconnected;
                          s.attempt = 0;
                          s.lastError = why;
                          s.needsLogin = needsLogin; });
    }

    // ───────────────────────── pipeline ─────────────────────────

    void SyncEngine::emit(const Change &change)
    {
        ChangeSink sink;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sink = changeSink_;
        }
        if (sink)
            sink(change);
    }

    std::size_t SyncEngine::ingest(const std::vector<RawEvent> &events, bool live)
    {
        std::size_t applied = 0;

        for (const auto &raw : events)
        {
            if (metrics_)
                metrics_->events_received_total.fetch_add(1, std::memory_order_relaxed);

            std::vector<SyncEvent> translated;
            try
            {
                translated = adapter_->translate(raw);
            }
            catch (const std::exception &e)
            {
                // one malformed event must not stall the stream
                logger.log(Logger::Level::WARN, "[sync][engine] {} dropped untranslatable event: {}",
                           account(), e.what());
                continue;
            }

            for (const auto &ev : translated)
            {
                if (process(ev, live))
                    ++applied;
            }
        }

        return applied;
    }

    bool SyncEngine::process(const SyncEvent &ev, bool live)
    {
        return std::visit(
            overloaded{
                [&](const KeyEvent &k)
                {
                    handle_keys(k);
                    return false;
                },
                [&](const PresenceEvent &p)
                {
                    emit(Change::presence_changed(p));
                    return false;
                },
                [&](const TypingEvent &t)
                {
                    emit(Change::typing_changed(t));
                    return false;
                },
                [&](const MessageEvent &m)
                {
                    return process_message(m, live);
                },
                [&](const auto &)
                {
                    const ConversationId *conv = conversation_of(ev);
                    const std::string &native = native_of(ev);
                    if (conv && !native.empty() && store_.is_known(*conv, native))
                    {
                        if (metrics_)
                            metrics_->duplicates_dropped_total.fetch_add(1, std::memory_order_relaxed);
                        return false;
                    }

                    auto r = store_.apply(ev, live);
                    if (r == ApplyResult::Duplicate && metrics_)
                        metrics_->duplicates_dropped_total.fetch_add(1, std::memory_order_relaxed);
                    return r == ApplyResult::Applied || r == ApplyResult::Parked;
                },
            },
            ev);
    }

    bool SyncEngine::process_message(const MessageEvent &m, bool live)
    {
        if (store_.is_known(m.conversation, m.native))
        {
            if (metrics_)
                metrics_->duplicates_dropped_total.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        if (!m.content.encrypted || !m.content.text.empty())
        {
            auto r = store_.apply(m, live);
            return r == ApplyResult::Applied;
        }

        // ciphertext: the conversation is end-to-end encrypted
        ConversationEvent marker;
        marker.conversation = m.conversation;
        marker.encrypted = true;
        store_.apply(marker, live);

        IEncryptionProvider *crypto = adapter_->encryption();
        DecryptResult result = crypto
                                   ? crypto->decrypt(m.conversation, m.native, *m.content.encrypted)
                                   : DecryptResult::failure("no encryption support", m.content.encrypted->sessionId);

        if (result.ok)
        {
            auto inner = adapter_->interpret_plaintext(m, result.plaintext);
            if (!inner.empty())
            {
                bool any = false;
                for (const auto &ev : inner)
                {
                    auto r = store_.apply(ev, live);
                    any = any || r == ApplyResult::Applied || r == ApplyResult::Parked;
                }
                return any;
            }
            result = DecryptResult::failure("unsupported decrypted payload", result.sessionId);
        }

        if (metrics_)
            metrics_->decryption_failures_total.fetch_add(1, std::memory_order_relaxed);

        logger.log(Logger::Level::WARN, "[sync][crypto] {} cannot decrypt {} in {}: {}",
                   account(), m.native, m.conversation.native, result.error);

        auto r = store_.apply(m, live, Delivery::undecryptable(result.error));
        return r == ApplyResult::Applied;
    }

    void SyncEngine::handle_keys(const KeyEvent &k)
    {
        IEncryptionProvider *crypto = adapter_->encryption();
        if (!crypto)
            return;

        std::vector<std::string> sessions;
        try
        {
            sessions = crypto->handle_to_device(k.raw);
        }
        catch (const std::exception &e)
        {
            logger.log(Logger::Level::WARN, "[sync][crypto] {} rejected to-device event: {}", account(), e.what());
            return;
        }

        for (const auto &sessionId : sessions)
        {
            const auto n = redecrypt(sessionId);
            logger.log(Logger::Level::DEBUG, "[sync][crypto] {} room key {}: {} message(s) decrypted",
                       account(), sessionId, n);
        }
    }

    std::size_t SyncEngine::redecrypt(const std::string &sessionId)
    {
        IEncryptionProvider *crypto = adapter_->encryption();
        if (!crypto)
            return 0;

        std::size_t done = 0;

        for (const auto &id : store_.undecrypted(account(), sessionId))
        {
            auto state = store_.get(id.conversation);
            if (!state)
                continue;

            const Message *msg = state->find(id.native);
            if (!msg || !msg->content.encrypted)
                continue;

            auto result = crypto->decrypt(id.conversation, id.native, *msg->content.encrypted);
            if (!result.ok)
                continue;

            MessageEvent envelope;
            envelope.conversation = id.conversation;
            envelope.native = id.native;
            envelope.sender = msg->sender;
            envelope.timestamp = msg->timestamp;
            envelope.content = msg->content;
            envelope.outgoing = msg->outgoing;

            auto events = adapter_->interpret_plaintext(envelope, result.plaintext);
            if (events.empty())
                continue;

            if (store_.replace_undecrypted(id, events))
            {
                ++done;
                if (metrics_)
                    metrics_->redecryptions_total.fetch_add(1, std::memory_order_relaxed);
            }
        }

        return done;
    }

    // ───────────────────────── history ─────────────────────────

    std::size_t SyncEngine::fetch_history_page(const ConversationId &conversation)
    {
        InFlightGuard guard(historyMutex_, historyInFlight_, conversation);
        if (!guard.acquired())
            return 0;

        CancellationToken token;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            token = token_;
        }
        if (token.cancelled())
        {
            logger.log(Logger::Level::DEBUG, "[sync][engine] {} not running, history of {} skipped",
                       account(), conversation.native);
            return 0;
        }

        store_.ensure(conversation);
        if (store_.history_exhausted(conversation))
            return 0;

        const auto before = store_.history_token(conversation);
        HistoryPage page = adapter_->fetch_history(conversation, before, config_.historyPageSize);
        if (token.cancelled())
            return 0;

        const auto applied = ingest(page.events, false);
        store_.set_history_token(conversation, page.nextBefore);

        logger.log(Logger::Level::DEBUG, "[sync][engine] {} history of {}: {} event(s), {}",
                   account(), conversation.native, applied, page.nextBefore ? "more" : "complete");
        return applied;
    }

} // namespace echat::sync
