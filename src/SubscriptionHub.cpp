#include <echat/sync/SubscriptionHub.hpp>

#include <algorithm>

#include <vix/utils/Logger.hpp>

namespace echat::sync
{
    const char *to_string(ChangeKind kind) noexcept
    {
        switch (kind)
        {
        case ChangeKind::Conversation:
            return "conversation";
        case ChangeKind::Presence:
            return "presence";
        case ChangeKind::Typing:
            return "typing";
        case ChangeKind::Connectivity:
            return "connectivity";
        case ChangeKind::Resync:
            return "resync";
        }
        return "unknown";
    }

    Change Change::conversation_changed(const ConversationId &id)
    {
        Change c;
        c.kind = ChangeKind::Conversation;
        c.account = id.account;
        c.conversation = id;
        return c;
    }

    Change Change::presence_changed(const PresenceEvent &ev)
    {
        Change c;
        c.kind = ChangeKind::Presence;
        c.account = ev.participant.account;
        c.presence = ev;
        return c;
    }

    Change Change::typing_changed(const TypingEvent &ev)
    {
        Change c;
        c.kind = ChangeKind::Typing;
        c.account = ev.conversation.account;
        c.conversation = ev.conversation;
        c.typing = ev;
        return c;
    }

    Change Change::connectivity_changed(const AccountStatus &status)
    {
        Change c;
        c.kind = ChangeKind::Connectivity;
        c.account = status.account;
        c.status = status;
        return c;
    }

    Change Change::resync()
    {
        Change c;
        c.kind = ChangeKind::Resync;
        return c;
    }

    // ───────────────────────── SubscriptionBuffer ─────────────────────────

    std::size_t SubscriptionBuffer::enqueue(const Change &change, std::size_t maxBufferSize)
    {
        if (change.kind == ChangeKind::Conversation && change.conversation)
        {
            // still buffered, the subscriber will re-read the latest state anyway
            if (pendingConversations.count(*change.conversation))
                return 0;
        }

        // a pending resync already covers every store change
        if (change.kind == ChangeKind::Conversation && !buffer.empty() &&
            buffer.front().kind == ChangeKind::Resync)
        {
            return 0;
        }

        std::size_t dropped = 0;
        if (buffer.size() >= maxBufferSize)
        {
            dropped = buffer.size();
            buffer.clear();
            pendingConversations.clear();
            buffer.push_back(Change::resync());
            if (change.kind != ChangeKind::Connectivity)
                return dropped;
        }

        if (change.kind == ChangeKind::Conversation && change.conversation)
            pendingConversations.insert(*change.conversation);

        buffer.push_back(change);
        return dropped;
    }

    std::vector<Change> SubscriptionBuffer::drain(std::size_t maxCount)
    {
        std::vector<Change> out;
        touch();

        if (maxCount == 0 || buffer.empty())
            return out;

        const std::size_t n = std::min(maxCount, buffer.size());
        out.reserve(n);

        for (std::size_t i = 0; i < n; ++i)
        {
            Change &front = buffer.front();
            if (front.kind == ChangeKind::Conversation && front.conversation)
                pendingConversations.erase(*front.conversation);

            out.push_back(std::move(front));
            buffer.pop_front();
        }

        return out;
    }

    // ───────────────────────── SubscriptionHub ─────────────────────────

    SubscriptionHub::SubscriptionHub(std::chrono::seconds ttl,
                                     std::size_t maxBufferPerSub,
                                     SyncMetrics *metrics)
        : ttl_(ttl),
          maxBufferPerSub_(std::max<std::size_t>(2, maxBufferPerSub)),
          mutex_(),
          subs_(),
          metrics_(metrics)
    {
    }

    SubscriptionId SubscriptionHub::open(std::optional<AccountId> account)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const SubscriptionId id = nextId_++;
        subs_.emplace(id, SubscriptionBuffer{id, std::move(account)});

        if (metrics_)
            metrics_->subscriptions_active.fetch_add(1, std::memory_order_relaxed);

        return id;
    }

    bool SubscriptionHub::close(SubscriptionId id)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (subs_.erase(id) == 0)
            return false;

        if (metrics_)
            metrics_->subscriptions_active.fetch_sub(1, std::memory_order_relaxed);
        return true;
    }

    void SubscriptionHub::publish(const Change &change)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        for (auto &[id, sub] : subs_)
        {
            if (!sub.accepts(change))
                continue;

            const auto before = sub.buffer.size();
            const auto dropped = sub.enqueue(change, maxBufferPerSub_);

            if (metrics_)
            {
                if (sub.buffer.size() > before || dropped > 0)
                    metrics_->notifications_enqueued_total.fetch_add(1, std::memory_order_relaxed);
                if (dropped > 0)
                    metrics_->notifications_dropped_total.fetch_add(dropped, std::memory_order_relaxed);
            }
        }
    }

    std::optional<std::vector<Change>> SubscriptionHub::poll(SubscriptionId id, std::size_t maxChanges)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = subs_.find(id);
        if (it == subs_.end())
            return std::nullopt;

        if (it->second.is_expired(ttl_, std::chrono::steady_clock::now()))
        {
            subs_.erase(it);
            if (metrics_)
                metrics_->subscriptions_active.fetch_sub(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        auto out = it->second.drain(maxChanges);

        if (metrics_ && !out.empty())
            metrics_->notifications_drained_total.fetch_add(out.size(), std::memory_order_relaxed);

        return out;
    }

    std::size_t SubscriptionHub::sweep_expired()
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto now = std::chrono::steady_clock::now();
        std::size_t removed = 0;

        for (auto it = subs_.begin(); it != subs_.end();)
        {
            if (it->second.is_expired(ttl_, now))
            {
                it = subs_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }

        if (removed > 0)
        {
            if (metrics_)
                metrics_->subscriptions_active.fetch_sub(removed, std::memory_order_relaxed);

            vix::utils::Logger::getInstance().log(vix::utils::Logger::Level::DEBUG,
                                                  "[sync][hub] expired {} idle subscription(s)", removed);
        }

        return removed;
    }

    std::size_t SubscriptionHub::subscription_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return subs_.size();
    }

    std::size_t SubscriptionHub::buffer_size(SubscriptionId id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = subs_.find(id);
        if (it == subs_.end())
            return 0;
        return it->second.buffer.size();
    }

} // namespace echat::sync
