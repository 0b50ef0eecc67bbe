#include <echat/sync/OutboundQueue.hpp>

#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <vix/utils/Logger.hpp>

#include <echat/sync/CancellationToken.hpp>
#include <echat/sync/errors.hpp>

namespace echat::sync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    struct OutboundQueue::Command
    {
        enum class Kind
        {
            Send,
            Edit,
            React,
            MarkRead,
        };

        enum class State
        {
            Parked,
            Waiting,
            Queued,
            Running,
            Retry,
            Done,
        };

        std::uint64_t id = 0;
        Kind kind = Kind::Send;
        AccountId account;
        ConversationId conversation;
        MessageId message; ///< provisional message (Send) or target (Edit, React)
        std::string txn;   ///< transaction id handed to the backend
        std::string payload;

        unsigned attempts = 0;
        State state = State::Parked;
        std::optional<std::uint64_t> waitingOn;
        CancellationToken token;

        bool deadlineArmed = false;
        bool timedOut = false;
        std::unique_ptr<boost::asio::steady_timer> retryTimer;
        std::unique_ptr<boost::asio::steady_timer> deadline;

        const char *name() const noexcept
        {
            switch (kind)
            {
            case Kind::Send:
                return "send";
            case Kind::Edit:
                return "edit";
            case Kind::React:
                return "react";
            case Kind::MarkRead:
                return "mark-read";
            }
            return "command";
        }
    };

    OutboundQueue::OutboundQueue(boost::asio::io_context &ioc,
                                 ConversationStore &store,
                                 const Config &config,
                                 SyncMetrics *metrics)
        : ioc_(ioc),
          store_(store),
          config_(config),
          metrics_(metrics)
    {
    }

    OutboundQueue::~OutboundQueue()
    {
        shutdown();
    }

    void OutboundQueue::register_account(std::shared_ptr<IBackendAdapter> adapter)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const AccountId account = adapter->account();
        auto &slot = accounts_[account];
        slot.adapter = std::move(adapter);
        if (!slot.io)
            slot.io = std::make_shared<Runtime>(config_.accountThreads);
    }

    void OutboundQueue::unregister_account(const AccountId &account)
    {
        cancel_account(account);

        std::shared_ptr<Runtime> io;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = accounts_.find(account);
            if (it == accounts_.end())
                return;
            io = std::move(it->second.io);
            accounts_.erase(it);
        }

        // joined outside the lock: an in-flight call completes through on_success
        if (io)
            io->stop();
    }

    bool OutboundQueue::post_blocking(const AccountId &account, std::function<void()> job)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_)
            return false;

        auto it = accounts_.find(account);
        if (it == accounts_.end() || !it->second.io)
            return false;

        boost::asio::post(it->second.io->context(), std::move(job));
        return true;
    }

    void OutboundQueue::set_self(const AccountId &account, const std::string &selfNative)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accounts_.find(account);
        if (it != accounts_.end())
            it->second.selfNative = selfNative;
    }

    void OutboundQueue::set_online(const AccountId &account, bool online)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = accounts_.find(account);
        if (it == accounts_.end() || it->second.online == online)
            return;

        it->second.online = online;
        if (!online)
            return;

        std::size_t released = 0;
        for (auto &[id, cmd] : commands_)
        {
            if (cmd->account == account && cmd->state == Command::State::Parked)
            {
                schedule_locked(cmd);
                ++released;
            }
        }

        if (released > 0)
            logger.log(Logger::Level::INFO, "[sync][queue] {} online, released {} parked command(s)", account, released);
    }

    std::size_t OutboundQueue::pending(const AccountId &account) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::size_t n = 0;
        for (const auto &[id, cmd] : commands_)
        {
            if (cmd->account == account)
                ++n;
        }
        return n;
    }

    // ───────────────────────── submit ─────────────────────────

    SubmitResult OutboundQueue::submit(const Intent &intent)
    {
        if (const auto *s = std::get_if<SendText>(&intent))
            return submit_send(*s);
        if (const auto *e = std::get_if<Edit>(&intent))
            return submit_edit(*e);
        if (const auto *r = std::get_if<React>(&intent))
            return submit_react(*r);
        if (const auto *m = std::get_if<MarkRead>(&intent))
            return submit_mark_read(*m);
        if (const auto *r = std::get_if<Resend>(&intent))
            return submit_resend(*r);
        return submit_discard(std::get<Discard>(intent));
    }

    SubmitResult OutboundQueue::submit_send(const SendText &intent)
    {
        if (intent.text.empty())
            return SubmitResult::rejected("empty message");

        std::lock_guard<std::mutex> lock(mutex_);

        if (shutdown_)
            return SubmitResult::rejected("shutting down");

        auto slot = accounts_.find(intent.conversation.account);
        if (slot == accounts_.end())
            return SubmitResult::rejected("unknown account");
        if (!store_.contains(intent.conversation))
            return SubmitResult::rejected("unknown conversation");

        const ParticipantId self{intent.conversation.account, slot->second.selfNative};
        MessageId provisional = store_.create_provisional(intent.conversation, self, intent.text);

        auto cmd = std::make_shared<Command>();
        cmd->kind = Command::Kind::Send;
        cmd->account = intent.conversation.account;
        cmd->conversation = intent.conversation;
        cmd->message = provisional;
        cmd->txn = provisional.native;
        cmd->payload = intent.text;
        enqueue_locked(cmd);

        logger.log(Logger::Level::DEBUG, "[sync][queue] send {} queued in {}", provisional.native, intent.conversation.native);

        SubmitResult r;
        r.accepted = true;
        r.provisional = provisional;
        return r;
    }

    std::optional<std::uint64_t> OutboundQueue::pending_sender_locked(const MessageId &target) const
    {
        for (const auto &[id, cmd] : commands_)
        {
            if (cmd->kind == Command::Kind::Send && cmd->message == target && cmd->state != Command::State::Done)
                return id;
        }
        return std::nullopt;
    }

    SubmitResult OutboundQueue::submit_edit(const Edit &intent)
    {
        if (intent.text.empty())
            return SubmitResult::rejected("empty message");

        std::lock_guard<std::mutex> lock(mutex_);

        if (shutdown_)
            return SubmitResult::rejected("shutting down");

        const auto &conv = intent.target.conversation;
        auto slot = accounts_.find(conv.account);
        if (slot == accounts_.end())
            return SubmitResult::rejected("unknown account");

        auto state = store_.get(conv);
        const Message *msg = state ? state->find(intent.target.native) : nullptr;
        if (!msg)
            return SubmitResult::rejected("unknown message");
        if (!msg->outgoing)
            return SubmitResult::rejected("only own messages can be edited");
        if (msg->content.redacted)
            return SubmitResult::rejected("message was deleted");

        std::optional<std::uint64_t> waitOn;
        if (is_provisional_native(intent.target.native))
        {
            waitOn = pending_sender_locked(intent.target);
            if (!waitOn)
                return SubmitResult::rejected(reason::kTargetFailed);
        }

        const ParticipantId self{conv.account, slot->second.selfNative};

        auto cmd = std::make_shared<Command>();
        cmd->kind = Command::Kind::Edit;
        cmd->account = conv.account;
        cmd->conversation = conv;
        cmd->message = MessageId{conv, intent.target.native, is_provisional_native(intent.target.native)};
        cmd->txn = store_.add_pending_edit(cmd->message, self, intent.text);
        cmd->payload = intent.text;
        cmd->waitingOn = waitOn;
        enqueue_locked(cmd);

        SubmitResult r;
        r.accepted = true;
        return r;
    }

    SubmitResult OutboundQueue::submit_react(const React &intent)
    {
        if (intent.key.empty())
            return SubmitResult::rejected("empty reaction");

        std::lock_guard<std::mutex> lock(mutex_);

        if (shutdown_)
            return SubmitResult::rejected("shutting down");

        const auto &conv = intent.target.conversation;
        auto slot = accounts_.find(conv.account);
        if (slot == accounts_.end())
            return SubmitResult::rejected("unknown account");

        auto state = store_.get(conv);
        const Message *msg = state ? state->find(intent.target.native) : nullptr;
        if (!msg)
            return SubmitResult::rejected("unknown message");
        if (msg->content.redacted)
            return SubmitResult::rejected("message was deleted");

        std::optional<std::uint64_t> waitOn;
        if (is_provisional_native(intent.target.native))
        {
            waitOn = pending_sender_locked(intent.target);
            if (!waitOn)
                return SubmitResult::rejected(reason::kTargetFailed);
        }

        const ParticipantId self{conv.account, slot->second.selfNative};

        auto cmd = std::make_shared<Command>();
        cmd->kind = Command::Kind::React;
        cmd->account = conv.account;
        cmd->conversation = conv;
        cmd->message = MessageId{conv, intent.target.native, is_provisional_native(intent.target.native)};
        cmd->txn = store_.add_pending_reaction(cmd->message, self, intent.key);
        cmd->payload = intent.key;
        cmd->waitingOn = waitOn;
        enqueue_locked(cmd);

        SubmitResult r;
        r.accepted = true;
        return r;
    }

    SubmitResult OutboundQueue::submit_mark_read(const MarkRead &intent)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (shutdown_)
            return SubmitResult::rejected("shutting down");
        if (accounts_.find(intent.conversation.account) == accounts_.end())
            return SubmitResult::rejected("unknown account");
        if (!store_.contains(intent.conversation))
            return SubmitResult::rejected("unknown conversation");

        store_.mark_read_local(intent.conversation);

        auto upTo = intent.upTo ? intent.upTo : store_.latest_server_native(intent.conversation);
        SubmitResult r;
        r.accepted = true;
        if (!upTo || is_provisional_native(*upTo))
            return r; // nothing the server knows about

        auto cmd = std::make_shared<Command>();
        cmd->kind = Command::Kind::MarkRead;
        cmd->account = intent.conversation.account;
        cmd->conversation = intent.conversation;
        cmd->payload = *upTo;
        enqueue_locked(cmd);
        return r;
    }

    SubmitResult OutboundQueue::submit_resend(const Resend &intent)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (shutdown_)
            return SubmitResult::rejected("shutting down");
        if (accounts_.find(intent.message.conversation.account) == accounts_.end())
            return SubmitResult::rejected("unknown account");

        auto state = store_.get(intent.message.conversation);
        const Message *msg = state ? state->find(intent.message.native) : nullptr;
        if (!msg)
            return SubmitResult::rejected("unknown message");
        if (msg->delivery.state != DeliveryState::Failed || !store_.is_pending_provisional(msg->id))
            return SubmitResult::rejected("only failed local messages can be resent");
        if (pending_sender_locked(msg->id))
            return SubmitResult::rejected("message is still being sent");

        const MessageId id{intent.message.conversation, msg->id.native, true};
        store_.set_delivery(id, Delivery::pending());

        auto cmd = std::make_shared<Command>();
        cmd->kind = Command::Kind::Send;
        cmd->account = id.conversation.account;
        cmd->conversation = id.conversation;
        cmd->message = id;
        cmd->txn = id.native; // same transaction id: the backend deduplicates
        cmd->payload = msg->content.text;
        enqueue_locked(cmd);

        logger.log(Logger::Level::INFO, "[sync][queue] resending {} in {}", id.native, id.conversation.native);

        SubmitResult r;
        r.accepted = true;
        r.provisional = id;
        return r;
    }

    SubmitResult OutboundQueue::submit_discard(const Discard &intent)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!store_.contains(intent.message.conversation))
            return SubmitResult::rejected("unknown conversation");
        if (pending_sender_locked(intent.message))
            return SubmitResult::rejected("message is still being sent");
        if (!store_.discard(intent.message))
            return SubmitResult::rejected("only failed local messages can be discarded");

        SubmitResult r;
        r.accepted = true;
        return r;
    }

    // ───────────────────────── scheduling ─────────────────────────

    OutboundQueue::CommandPtr OutboundQueue::enqueue_locked(CommandPtr cmd)
    {
        cmd->id = nextId_++;
        commands_.emplace(cmd->id, cmd);
        schedule_locked(cmd);
        return cmd;
    }

    void OutboundQueue::schedule_locked(const CommandPtr &cmd)
    {
        if (cmd->state == Command::State::Done || cmd->token.cancelled())
            return;

        if (cmd->waitingOn)
        {
            cmd->state = Command::State::Waiting;
            return;
        }

        auto slot = accounts_.find(cmd->account);
        if (slot == accounts_.end() || !slot->second.online)
        {
            cmd->state = Command::State::Parked;
            return;
        }

        cmd->state = Command::State::Queued;

        if (!cmd->deadlineArmed && cmd->kind != Command::Kind::MarkRead)
        {
            cmd->deadlineArmed = true;
            cmd->deadline = std::make_unique<boost::asio::steady_timer>(ioc_);
            cmd->deadline->expires_after(config_.reconcileTimeout);
            cmd->deadline->async_wait([this, cmd](const boost::system::error_code &ec)
                                      {
                                          if (!ec)
                                              on_deadline(cmd); });
        }

        boost::asio::post(slot->second.io->context(), [this, cmd]()
                          { dispatch(cmd); });
    }

    void OutboundQueue::dispatch(const CommandPtr &cmd)
    {
        std::shared_ptr<IBackendAdapter> adapter;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cmd->token.cancelled() || cmd->state != Command::State::Queued)
                return;

            auto slot = accounts_.find(cmd->account);
            if (slot == accounts_.end() || !slot->second.online)
            {
                cmd->state = Command::State::Parked;
                return;
            }

            adapter = slot->second.adapter;
            cmd->state = Command::State::Running;
            ++cmd->attempts;
        }

        try
        {
            SendReceipt receipt;
            switch (cmd->kind)
            {
            case Command::Kind::Send:
                receipt = adapter->send(cmd->conversation, cmd->payload, cmd->txn);
                break;
            case Command::Kind::Edit:
                receipt = adapter->edit(cmd->conversation, cmd->message.native, cmd->payload, cmd->txn);
                break;
            case Command::Kind::React:
                receipt = adapter->react(cmd->conversation, cmd->message.native, cmd->payload, cmd->txn);
                break;
            case Command::Kind::MarkRead:
                adapter->mark_read(cmd->conversation, cmd->payload);
                break;
            }
            on_success(cmd, receipt);
        }
        catch (const AuthError &e)
        {
            on_failure(cmd, e.what(), false, true);
        }
        catch (const TransientError &e)
        {
            on_failure(cmd, e.what(), true, false);
        }
        catch (const std::exception &e)
        {
            on_failure(cmd, e.what(), false, false);
        }
    }

    void OutboundQueue::on_success(const CommandPtr &cmd, const SendReceipt &receipt)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (cmd->token.cancelled() || cmd->state != Command::State::Running)
        {
            logger.log(Logger::Level::DEBUG, "[sync][queue] discarding late {} completion for {}",
                       cmd->name(), cmd->message.native);
            return;
        }

        switch (cmd->kind)
        {
        case Command::Kind::Send:
        {
            auto r = store_.reconcile(cmd->message, receipt.serverId, receipt.timestamp);
            logger.log(Logger::Level::DEBUG, "[sync][queue] {} -> {} ({})", cmd->message.native, receipt.serverId,
                       r == ReconcileResult::Renamed ? "renamed" : r == ReconcileResult::Merged ? "merged echo"
                                                                                              : "already reconciled");
            release_dependents_locked(cmd, receipt.serverId);
            break;
        }
        case Command::Kind::Edit:
            store_.settle_edit(cmd->message, cmd->txn, receipt.serverId, receipt.timestamp);
            break;
        case Command::Kind::React:
            store_.settle_reaction(cmd->message, cmd->txn, receipt.serverId);
            break;
        case Command::Kind::MarkRead:
            break;
        }

        if (metrics_ && cmd->kind != Command::Kind::MarkRead)
            metrics_->messages_sent_total.fetch_add(1, std::memory_order_relaxed);

        finish_locked(cmd);
    }

    void OutboundQueue::on_failure(const CommandPtr &cmd, const std::string &why, bool retryable, bool auth)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (cmd->token.cancelled() || cmd->state != Command::State::Running)
            return;

        if (cmd->timedOut)
        {
            // already reported as a reconciliation timeout
            finish_locked(cmd);
            return;
        }

        if (auth)
        {
            logger.log(Logger::Level::WARN, "[sync][queue] {} {} parked until re-login: {}", cmd->name(), cmd->message.native, why);
            cmd->state = Command::State::Parked;
            return;
        }

        if (retryable && cmd->attempts < config_.send_max_attempts())
        {
            const auto delay = config_.send.delay(cmd->attempts);
            logger.log(Logger::Level::WARN, "[sync][queue] {} {} attempt {}/{} failed, retry in {} ms: {}",
                       cmd->name(), cmd->message.native, cmd->attempts, config_.send_max_attempts(),
                       static_cast<long long>(delay.count()), why);

            if (metrics_)
                metrics_->send_retries_total.fetch_add(1, std::memory_order_relaxed);

            cmd->state = Command::State::Retry;
            cmd->retryTimer = std::make_unique<boost::asio::steady_timer>(ioc_);
            cmd->retryTimer->expires_after(delay);
            cmd->retryTimer->async_wait([this, cmd](const boost::system::error_code &ec)
                                        {
                                            if (ec)
                                                return;
                                            std::lock_guard<std::mutex> lock(mutex_);
                                            if (cmd->state != Command::State::Retry)
                                                return;
                                            schedule_locked(cmd); });
            return;
        }

        fail_locked(cmd, why);
        finish_locked(cmd);
    }

    void OutboundQueue::on_deadline(const CommandPtr &cmd)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (cmd->token.cancelled() || cmd->state == Command::State::Done || cmd->timedOut)
            return;

        logger.log(Logger::Level::WARN, "[sync][queue] {} {} not acknowledged in {} ms",
                   cmd->name(), cmd->message.native, static_cast<long long>(config_.reconcileTimeout.count()));

        fail_locked(cmd, reason::kReconciliationTimeout);

        if (cmd->state == Command::State::Running)
        {
            // the call may still complete; a late acknowledgment reconciles
            cmd->timedOut = true;
            return;
        }

        finish_locked(cmd);
    }

    void OutboundQueue::fail_locked(const CommandPtr &cmd, const std::string &why)
    {
        if (metrics_)
            metrics_->send_failures_total.fetch_add(1, std::memory_order_relaxed);

        logger.log(Logger::Level::WARN, "[sync][queue] {} {} in {} failed after {} attempt(s): {}",
                   cmd->name(), cmd->message.native, cmd->conversation.native, cmd->attempts, why);

        switch (cmd->kind)
        {
        case Command::Kind::Send:
            if (store_.is_pending_provisional(cmd->message))
                store_.set_delivery(cmd->message, Delivery::failed(why));
            release_dependents_locked(cmd, std::nullopt);
            break;
        case Command::Kind::Edit:
            store_.fail_edit(cmd->message, cmd->txn, why);
            break;
        case Command::Kind::React:
            store_.fail_reaction(cmd->message, cmd->txn, why);
            break;
        case Command::Kind::MarkRead:
            break;
        }
    }

    void OutboundQueue::finish_locked(const CommandPtr &cmd)
    {
        cmd->state = Command::State::Done;
        if (cmd->retryTimer)
            cmd->retryTimer->cancel();
        if (cmd->deadline)
            cmd->deadline->cancel();
        commands_.erase(cmd->id);
    }

    void OutboundQueue::release_dependents_locked(const CommandPtr &cmd, const std::optional<std::string> &serverId)
    {
        std::vector<CommandPtr> dependents;
        for (const auto &[id, dep] : commands_)
        {
            if (dep->waitingOn && *dep->waitingOn == cmd->id)
                dependents.push_back(dep);
        }

        for (const auto &dep : dependents)
        {
            dep->waitingOn.reset();

            if (serverId)
            {
                dep->message = MessageId{dep->conversation, *serverId, false};
                schedule_locked(dep);
            }
            else
            {
                fail_locked(dep, reason::kTargetFailed);
                finish_locked(dep);
            }
        }
    }

    // ───────────────────────── cancellation ─────────────────────────

    void OutboundQueue::cancel_account(const AccountId &account)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<CommandPtr> victims;
        for (const auto &[id, cmd] : commands_)
        {
            if (cmd->account == account)
                victims.push_back(cmd);
        }

        for (const auto &cmd : victims)
        {
            cmd->token.cancel();

            switch (cmd->kind)
            {
            case Command::Kind::Send:
                if (store_.is_pending_provisional(cmd->message))
                    store_.set_delivery(cmd->message, Delivery::failed(reason::kCancelled));
                break;
            case Command::Kind::Edit:
                store_.fail_edit(cmd->message, cmd->txn, reason::kCancelled);
                break;
            case Command::Kind::React:
                store_.fail_reaction(cmd->message, cmd->txn, reason::kCancelled);
                break;
            case Command::Kind::MarkRead:
                break;
            }

            finish_locked(cmd);
        }

        auto slot = accounts_.find(account);
        if (slot != accounts_.end())
            slot->second.online = false;

        if (!victims.empty())
            logger.log(Logger::Level::INFO, "[sync][queue] {} cancelled {} command(s)", account, victims.size());
    }

    void OutboundQueue::shutdown()
    {
        std::vector<std::shared_ptr<Runtime>> lanes;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (shutdown_)
                return;
            shutdown_ = true;

            for (auto &[id, cmd] : commands_)
            {
                cmd->token.cancel();
                cmd->state = Command::State::Done;
                if (cmd->retryTimer)
                    cmd->retryTimer->cancel();
                if (cmd->deadline)
                    cmd->deadline->cancel();
            }
            commands_.clear();

            for (auto &[account, slot] : accounts_)
            {
                if (slot.io)
                    lanes.push_back(slot.io);
            }
        }

        for (auto &io : lanes)
            io->stop();
    }

} // namespace echat::sync
