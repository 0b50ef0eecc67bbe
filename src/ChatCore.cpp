#include <echat/sync/ChatCore.hpp>

#include <algorithm>
#include <stdexcept>


#include <vix/utils/Logger.hpp>

#include <echat/sync/MatrixAdapter.hpp>
#include <echat/sync/SqliteStateStore.hpp>
#include <echat/sync/TelegramAdapter.hpp>
#include <echat/sync/errors.hpp>

namespace echat::sync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    std::shared_ptr<IBackendAdapter> make_default_adapter(const AccountId &account,
                                                          BackendKind backend,
                                                          IStateStore &state,
                                                          const Config &config)
    {
        switch (backend)
        {
        case BackendKind::Matrix:
            return std::make_shared<MatrixAdapter>(account, nullptr, state, config);
        case BackendKind::Telegram:
            return std::make_shared<TelegramAdapter>(account, nullptr, config);
        }
        return nullptr;
    }

    ChatCore::ChatCore(const Config &config)
        : ChatCore(config, std::make_shared<SqliteStateStore>(config.stateDb))
    {
    }

    ChatCore::ChatCore(const Config &config, std::shared_ptr<IStateStore> state, AdapterFactory factory)
        : config_(config),
          metrics_(),
          state_(std::move(state)),
          factory_(factory ? std::move(factory) : AdapterFactory(&make_default_adapter)),
          store_(),
          hub_(config_.subscriptionTtl, config_.subscriptionBuffer, &metrics_),
          runtime_(config_.workerThreads),
          queue_(std::make_unique<OutboundQueue>(runtime_.context(), store_, config_, &metrics_)),
          sweepTimer_(runtime_.context())
    {
        if (!state_)
            throw std::invalid_argument("ChatCore: state store is required");

        store_.set_change_listener([this](const ConversationId &id)
                                   { hub_.publish(Change::conversation_changed(id)); });

        arm_sweep();

        logger.log(Logger::Level::INFO, "[sync][core] started with {} worker thread(s)", runtime_.thread_count());
    }

    ChatCore::~ChatCore()
    {
        shutdown();
    }

    void ChatCore::arm_sweep()
    {
        const auto period = std::max<std::chrono::seconds>(std::chrono::seconds(1), config_.subscriptionTtl / 2);

        sweepTimer_.expires_after(period);
        sweepTimer_.async_wait([this](const boost::system::error_code &ec)
                               {
            if (ec)
                return;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (shutdown_)
                    return;
            }

            const auto removed = hub_.sweep_expired();
            if (removed > 0)
                logger.log(Logger::Level::DEBUG, "[sync][core] expired {} idle subscription(s)", removed);

            arm_sweep(); });
    }

    // ───────────────────────── accounts ─────────────────────────

    std::shared_ptr<ChatCore::Account> ChatCore::find(const AccountId &account) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accounts_.find(account);
        return it != accounts_.end() ? it->second : nullptr;
    }

    std::shared_ptr<ChatCore::Account> ChatCore::require(const AccountId &account) const
    {
        auto acc = find(account);
        if (!acc)
            throw std::invalid_argument("ChatCore: unknown account '" + account + "'");
        return acc;
    }

    void ChatCore::add_account(const AccountId &account, const Credentials &credentials)
    {
        if (account.empty())
            throw std::invalid_argument("ChatCore: empty account id");

        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_)
            throw std::logic_error("ChatCore: add_account after shutdown");

        auto it = accounts_.find(account);
        if (it != accounts_.end())
        {
            auto &acc = *it->second;
            if (acc.credentials.backend != credentials.backend)
                throw std::invalid_argument("ChatCore: account '" + account + "' already uses another backend");

            acc.credentials.params = credentials.params;
            if (auto stored = state_->load_credentials(account))
                acc.credentials.session = stored->session;
            state_->save_credentials(account, acc.credentials);
            return;
        }

        Credentials creds = credentials;
        if (creds.session.empty())
        {
            if (auto stored = state_->load_credentials(account); stored && stored->backend == creds.backend)
                creds.session = stored->session;
        }

        auto adapter = factory_(account, creds.backend, *state_, config_);
        if (!adapter)
            throw std::invalid_argument("ChatCore: no adapter for backend " + std::string(to_string(creds.backend)));

        auto acc = std::make_shared<Account>();
        acc->id = account;
        acc->credentials = creds;
        acc->adapter = adapter;
        acc->engine = std::make_unique<SyncEngine>(adapter, store_, *state_, config_, &metrics_);

        acc->engine->set_status_listener([this](const AccountStatus &status)
                                         { on_status(status); });
        acc->engine->set_change_sink([this](const Change &change)
                                     { hub_.publish(change); });

        queue_->register_account(adapter);
        state_->save_credentials(account, creds);
        accounts_.emplace(account, std::move(acc));

        logger.log(Logger::Level::INFO, "[sync][core] account {} added ({})", account, to_string(creds.backend));
    }

    std::size_t ChatCore::restore_accounts()
    {
        std::size_t added = 0;
        for (const auto &id : state_->list_accounts())
        {
            if (find(id))
                continue;

            auto creds = state_->load_credentials(id);
            if (!creds)
                continue;

            try
            {
                add_account(id, *creds);
                ++added;
            }
            catch (const std::invalid_argument &e)
            {
                logger.log(Logger::Level::WARN, "[sync][core] cannot restore account {}: {}", id, e.what());
            }
        }
        return added;
    }

    void ChatCore::connect(const AccountId &account)
    {
        auto acc = require(account);

        Credentials creds;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_)
                return;
            creds = acc->credentials;
        }

        // the engine stores the session of every successful login
        if (auto stored = state_->load_credentials(account); stored && stored->backend == creds.backend)
            creds.session = stored->session;

        acc->engine->start(std::move(creds));
    }

    void ChatCore::login(const AccountId &account, const nlohmann::json &params)
    {
        auto acc = require(account);

        if (!params.is_object())
            throw std::invalid_argument("ChatCore: login parameters must be an object");

        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &[key, value] : params.items())
                acc->credentials.params[key] = value;
        }

        connect(account);
    }

    void ChatCore::disconnect(const AccountId &account)
    {
        auto acc = require(account);

        acc->engine->stop();
        queue_->cancel_account(account);
        acc->adapter->close();

        logger.log(Logger::Level::INFO, "[sync][core] account {} disconnected", account);
    }

    void ChatCore::remove_account(const AccountId &account)
    {
        auto acc = require(account);

        disconnect(account);
        acc->engine->join();
        queue_->unregister_account(account);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            accounts_.erase(account);
        }

        state_->forget_account(account);

        for (const auto &id : store_.conversations_of(account))
        {
            ConversationEvent ev;
            ev.conversation = id;
            ev.archived = true;
            store_.apply(ev, false);
        }

        logger.log(Logger::Level::INFO, "[sync][core] account {} removed", account);
    }

    std::optional<AccountStatus> ChatCore::account_status(const AccountId &account) const
    {
        auto acc = find(account);
        if (!acc)
            return std::nullopt;
        return acc->engine->status();
    }

    std::vector<AccountStatus> ChatCore::accounts() const
    {
        std::vector<std::shared_ptr<Account>> all;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &[id, acc] : accounts_)
            {
                (void)id;
                all.push_back(acc);
            }
        }

        std::vector<AccountStatus> out;
        out.reserve(all.size());
        for (const auto &acc : all)
            out.push_back(acc->engine->status());
        return out;
    }

    void ChatCore::on_status(const AccountStatus &status)
    {
        if (!status.selfId.empty())
            queue_->set_self(status.account, status.selfId);
        queue_->set_online(status.account, status.state == ConnectionState::Syncing);

        hub_.publish(Change::connectivity_changed(status));
    }

    // ───────────────────────── presentation ─────────────────────────

    Subscription ChatCore::subscribe(std::optional<AccountId> account)
    {
        Subscription sub;
        // open first: a change racing with the snapshot is reported twice, never lost
        sub.id = hub_.open(account);
        sub.snapshot = snapshot(account);
        return sub;
    }

    std::optional<std::vector<Change>> ChatCore::poll(SubscriptionId id, std::size_t maxChanges)
    {
        return hub_.poll(id, maxChanges);
    }

    bool ChatCore::unsubscribe(SubscriptionId id)
    {
        return hub_.close(id);
    }

    Snapshot ChatCore::snapshot(const std::optional<AccountId> &account) const
    {
        Snapshot snap;
        snap.conversations = store_.list(account);

        auto participants = store_.participants().snapshot();
        if (account)
        {
            auto filtered = std::make_shared<ParticipantRegistry::Map>();
            for (const auto &[id, participant] : *participants)
            {
                if (id.account == *account)
                    filtered->emplace(id, participant);
            }
            snap.participants = std::move(filtered);
        }
        else
        {
            snap.participants = std::move(participants);
        }

        for (auto &status : accounts())
        {
            if (!account || status.account == *account)
                snap.accounts.push_back(std::move(status));
        }

        return snap;
    }

    ConversationStatePtr ChatCore::get_conversation(const ConversationId &id) const
    {
        return store_.get(id);
    }

    SubmitResult ChatCore::submit(const Intent &intent)
    {
        return queue_->submit(intent);
    }

    bool ChatCore::fetch_history(const ConversationId &conversation)
    {
        auto acc = find(conversation.account);
        if (!acc)
            return false;

        // the page request blocks, so it goes to the account's io lane
        return queue_->post_blocking(conversation.account, [acc, conversation]()
                                     {
            try
            {
                acc->engine->fetch_history_page(conversation);
            }
            catch (const BackendError &e)
            {
                logger.log(Logger::Level::WARN, "[sync][core] history of {} failed: {}", conversation.str(), e.what());
            } });
    }

    // ───────────────────────── encryption ─────────────────────────

    bool ChatCore::verify_device(const ParticipantId &participant, const std::string &deviceId)
    {
        auto acc = find(participant.account);
        if (!acc)
            return false;

        auto *crypto = acc->adapter->encryption();
        if (!crypto)
            return false;

        crypto->verify_device(participant, deviceId);
        store_.participants().set_device_verified(participant, deviceId, true);
        return true;
    }

    std::optional<std::size_t> ChatCore::import_room_key(const ConversationId &room,
                                                         const std::string &sessionId,
                                                         const std::string &sessionKey)
    {
        auto acc = find(room.account);
        if (!acc)
            return std::nullopt;

        auto *crypto = acc->adapter->encryption();
        if (!crypto || !crypto->import_room_key(room.native, sessionId, sessionKey))
            return std::nullopt;

        return acc->engine->redecrypt(sessionId);
    }

    bool ChatCore::rotate_keys(const AccountId &account)
    {
        auto acc = find(account);
        if (!acc)
            return false;

        auto *crypto = acc->adapter->encryption();
        if (!crypto)
            return false;

        crypto->rotate();
        return true;
    }

    // ───────────────────────── shutdown ─────────────────────────

    void ChatCore::shutdown()
    {
        std::map<AccountId, std::shared_ptr<Account>> accounts;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_)
                return;
            shutdown_ = true;
            accounts = accounts_;
        }

        for (auto &[id, acc] : accounts)
        {
            (void)id;
            acc->engine->stop();
        }
        for (auto &[id, acc] : accounts)
        {
            (void)id;
            acc->engine->join();
            acc->adapter->close();
        }

        // the sweep timer sees shutdown_ and is dropped with the pool
        queue_->shutdown();
        runtime_.stop();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            accounts_.clear();
        }

        logger.log(Logger::Level::INFO, "[sync][core] shut down");
    }

} // namespace echat::sync
