#include <echat/sync/ConversationStore.hpp>

#include <algorithm>
#include <stdexcept>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

namespace echat::sync
{
    namespace
    {
        struct OrderKey
        {
            std::int64_t timestamp = 0;
            std::string native;

            friend bool operator<(const OrderKey &a, const OrderKey &b)
            {
                return std::tie(a.timestamp, a.native) < std::tie(b.timestamp, b.native);
            }
        };

        void sort_edits(std::vector<EditRecord> &edits)
        {
            std::sort(edits.begin(), edits.end(), [](const EditRecord &a, const EditRecord &b)
                      { return std::tie(a.timestamp, a.native) < std::tie(b.timestamp, b.native); });
        }

        ReactionRecord *find_reaction(Message &msg, const std::string &native)
        {
            for (auto &[key, records] : msg.reactions)
            {
                for (auto &r : records)
                {
                    if (r.native == native)
                        return &r;
                }
            }
            return nullptr;
        }

        /// Move the local edits and reactions of @p from onto @p into, skipping records it already has.
        void carry_relations(const Message &from, Message &into)
        {
            for (const auto &edit : from.edits)
            {
                const bool known = std::any_of(into.edits.begin(), into.edits.end(), [&](const EditRecord &r)
                                               { return r.native == edit.native; });
                if (!known)
                    into.edits.push_back(edit);
            }
            sort_edits(into.edits);

            for (const auto &[key, records] : from.reactions)
            {
                for (const auto &r : records)
                {
                    if (!find_reaction(into, r.native))
                        into.reactions[key].push_back(r);
                }
            }
        }

        bool erase_reaction(Message &msg, const std::string &native)
        {
            for (auto it = msg.reactions.begin(); it != msg.reactions.end(); ++it)
            {
                auto &records = it->second;
                auto rit = std::find_if(records.begin(), records.end(),
                                        [&](const ReactionRecord &r)
                                        { return r.native == native; });
                if (rit != records.end())
                {
                    records.erase(rit);
                    if (records.empty())
                        msg.reactions.erase(it);
                    return true;
                }
            }
            return false;
        }
    } // namespace

    // ───────────────────────── ConversationState ─────────────────────────

    const Message *ConversationState::find(const std::string &native) const noexcept
    {
        for (const auto &m : messages)
        {
            if (m->id.native == native)
                return m.get();
        }
        return nullptr;
    }

    // ───────────────────────── ParticipantRegistry ─────────────────────────

    ParticipantRegistry::ParticipantRegistry()
        : map_(std::make_shared<const Map>())
    {
    }

    std::shared_ptr<const ParticipantRegistry::Map> ParticipantRegistry::snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_;
    }

    std::optional<Participant> ParticipantRegistry::get(const ParticipantId &id) const
    {
        auto snap = snapshot();
        auto it = snap->find(id);
        if (it == snap->end())
            return std::nullopt;
        return it->second;
    }

    bool ParticipantRegistry::apply(const ParticipantEvent &ev)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto next = std::make_shared<Map>(*map_);
        auto &p = (*next)[ev.participant];
        const Participant before = p;

        p.id = ev.participant;
        if (ev.displayName)
            p.displayName = *ev.displayName;
        if (ev.avatar)
            p.avatar = *ev.avatar;
        for (const auto &[device, verified] : ev.devices)
        {
            // verification is local metadata, a device list update never clears it
            auto it = p.devices.find(device);
            if (it == p.devices.end())
                p.devices.emplace(device, verified);
            else
                it->second = it->second || verified;
        }

        const bool changed = map_->find(ev.participant) == map_->end() ||
                             before.displayName != p.displayName ||
                             before.avatar != p.avatar ||
                             before.devices != p.devices;
        if (changed)
            map_ = std::move(next);
        return changed;
    }

    bool ParticipantRegistry::ensure(const ParticipantId &id)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (map_->find(id) != map_->end())
            return false;

        auto next = std::make_shared<Map>(*map_);
        Participant p;
        p.id = id;
        p.displayName = id.native;
        next->emplace(id, std::move(p));
        map_ = std::move(next);
        return true;
    }

    void ParticipantRegistry::set_device_verified(const ParticipantId &id, const std::string &deviceId, bool verified)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto next = std::make_shared<Map>(*map_);
        auto &p = (*next)[id];
        p.id = id;
        p.devices[deviceId] = verified;
        map_ = std::move(next);
    }

    // ───────────────────────── Entry ─────────────────────────

    struct ConversationStore::Entry
    {
        explicit Entry(const ConversationId &id)
        {
            conversation.id = id;
            conversation.displayName = id.native;
        }

        std::mutex write;

        // writer-owned, guarded by `write`
        Conversation conversation;
        std::optional<std::string> explicitName;
        std::optional<std::string> alias;

        std::map<OrderKey, std::shared_ptr<const Message>> ordered;
        std::unordered_map<std::string, OrderKey> index;

        std::unordered_set<std::string> seen; ///< applied relation ids
        std::unordered_map<std::string, std::string> editIndex;
        std::unordered_map<std::string, std::string> reactionIndex;
        std::unordered_map<std::string, std::vector<SyncEvent>> parked;

        std::unordered_set<std::string> pendingTxns; ///< provisional ids awaiting reconciliation
        std::uint64_t nextProvisional = 1;

        std::optional<std::string> historyToken;
        bool historyExhausted = false;

        std::uint64_t version = 0;

        // published
        std::mutex publishMutex;
        ConversationStatePtr published;

        const Message *find(const std::string &native) const
        {
            auto it = index.find(native);
            if (it == index.end())
                return nullptr;
            return ordered.at(it->second).get();
        }

        void put(Message msg)
        {
            erase(msg.id.native);
            OrderKey key{msg.timestamp, msg.id.native};
            index[msg.id.native] = key;
            ordered[key] = std::make_shared<const Message>(std::move(msg));
        }

        bool erase(const std::string &native)
        {
            auto it = index.find(native);
            if (it == index.end())
                return false;
            ordered.erase(it->second);
            index.erase(it);
            return true;
        }

        void touch(std::int64_t ts)
        {
            conversation.lastActivity = std::max(conversation.lastActivity, ts);
        }

        void refresh_name()
        {
            if (explicitName && !explicitName->empty())
                conversation.displayName = *explicitName;
            else if (alias && !alias->empty())
                conversation.displayName = *alias;
            else
                conversation.displayName = conversation.id.native;
        }

        std::string next_txn()
        {
            std::string id(1, kProvisionalPrefix);
            id += std::to_string(nextProvisional++);
            return id;
        }
    };

    // ───────────────────────── ConversationStore ─────────────────────────

    ConversationStore::ConversationStore() = default;
    ConversationStore::~ConversationStore() = default;

    void ConversationStore::set_change_listener(ChangeListener listener)
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listener_ = std::move(listener);
    }

    void ConversationStore::notify(const ConversationId &id)
    {
        ChangeListener listener;
        {
            std::lock_guard<std::mutex> lock(listenerMutex_);
            listener = listener_;
        }
        if (listener)
            listener(id);
    }

    std::shared_ptr<ConversationStore::Entry> ConversationStore::find_entry(const ConversationId &id) const
    {
        std::shared_lock<std::shared_mutex> lock(mapMutex_);
        auto it = entries_.find(id);
        if (it == entries_.end())
            return nullptr;
        return it->second;
    }

    std::shared_ptr<ConversationStore::Entry> ConversationStore::require_entry(const ConversationId &id) const
    {
        auto entry = find_entry(id);
        if (!entry)
            throw std::logic_error("[ConversationStore] unknown conversation " + id.str());
        return entry;
    }

    std::shared_ptr<ConversationStore::Entry> ConversationStore::get_or_create(const ConversationId &id, bool &created)
    {
        created = false;
        if (auto entry = find_entry(id))
            return entry;

        std::unique_lock<std::shared_mutex> lock(mapMutex_);
        auto it = entries_.find(id);
        if (it != entries_.end())
            return it->second;

        auto entry = std::make_shared<Entry>(id);
        publish_locked(*entry);
        entries_.emplace(id, entry);
        created = true;
        return entry;
    }

    template <typename Fn>
    auto ConversationStore::mutate(const std::shared_ptr<Entry> &entry, Fn &&fn)
    {
        const ConversationId id = entry->conversation.id;

        std::unique_lock<std::mutex> lock(entry->write);
        bool changed = false;
        auto result = fn(*entry, changed);
        if (changed)
            publish_locked(*entry);
        lock.unlock();

        if (changed)
            notify(id);
        return result;
    }

    void ConversationStore::publish_locked(Entry &e)
    {
        auto state = std::make_shared<ConversationState>();
        state->conversation = e.conversation;
        state->messages.reserve(e.ordered.size());
        for (const auto &[key, msg] : e.ordered)
            state->messages.push_back(msg);
        state->version = ++e.version;

        std::lock_guard<std::mutex> lock(e.publishMutex);
        e.published = std::move(state);
    }

    ConversationStatePtr ConversationStore::get(const ConversationId &id) const
    {
        auto entry = find_entry(id);
        if (!entry)
            return nullptr;

        std::lock_guard<std::mutex> lock(entry->publishMutex);
        return entry->published;
    }

    bool ConversationStore::contains(const ConversationId &id) const
    {
        return find_entry(id) != nullptr;
    }

    std::vector<ConversationStatePtr> ConversationStore::list(const std::optional<AccountId> &account) const
    {
        std::vector<std::shared_ptr<Entry>> entries;
        {
            std::shared_lock<std::shared_mutex> lock(mapMutex_);
            entries.reserve(entries_.size());
            for (const auto &[id, entry] : entries_)
            {
                if (!account || id.account == *account)
                    entries.push_back(entry);
            }
        }

        std::vector<ConversationStatePtr> out;
        out.reserve(entries.size());
        for (const auto &entry : entries)
        {
            std::lock_guard<std::mutex> lock(entry->publishMutex);
            out.push_back(entry->published);
        }

        std::stable_sort(out.begin(), out.end(), [](const ConversationStatePtr &a, const ConversationStatePtr &b)
                         { return a->conversation.lastActivity > b->conversation.lastActivity; });
        return out;
    }

    std::vector<ConversationId> ConversationStore::conversations_of(const AccountId &account) const
    {
        std::shared_lock<std::shared_mutex> lock(mapMutex_);

        std::vector<ConversationId> out;
        for (const auto &[id, entry] : entries_)
        {
            if (id.account == account)
                out.push_back(id);
        }
        return out;
    }

    bool ConversationStore::is_known(const ConversationId &id, const std::string &native) const
    {
        auto entry = find_entry(id);
        if (!entry || native.empty())
            return false;

        std::lock_guard<std::mutex> lock(entry->write);
        return entry->index.count(native) > 0 || entry->seen.count(native) > 0;
    }

    bool ConversationStore::ensure(const ConversationId &id)
    {
        bool created = false;
        get_or_create(id, created);
        if (created)
            notify(id);
        return created;
    }

    // ───────────────────────── apply ─────────────────────────

    ApplyResult ConversationStore::apply(const SyncEvent &ev, bool live, const std::optional<Delivery> &delivery)
    {
        if (const auto *p = std::get_if<ParticipantEvent>(&ev))
            return participants_.apply(*p) ? ApplyResult::Applied : ApplyResult::Ignored;

        if (std::holds_alternative<PresenceEvent>(ev) ||
            std::holds_alternative<TypingEvent>(ev) ||
            std::holds_alternative<KeyEvent>(ev))
        {
            return ApplyResult::Ignored;
        }

        const ConversationId *conv = conversation_of(ev);
        if (!conv)
            return ApplyResult::Ignored;

        bool created = false;
        auto entry = get_or_create(*conv, created);

        if (const auto *m = std::get_if<MessageEvent>(&ev))
            participants_.ensure(m->sender);

        return mutate(entry, [&](Entry &e, bool &changed)
                      {
                          auto r = apply_locked(e, ev, live, delivery);
                          changed = created || r == ApplyResult::Applied;
                          return r; });
    }

    void ConversationStore::drain_parked(Entry &e, const std::string &native, bool live)
    {
        auto it = e.parked.find(native);
        if (it == e.parked.end())
            return;

        auto events = std::move(it->second);
        e.parked.erase(it);

        for (const auto &ev : events)
            apply_locked(e, ev, live, std::nullopt);
    }

    ApplyResult ConversationStore::apply_locked(Entry &e,
                                                const SyncEvent &ev,
                                                bool live,
                                                const std::optional<Delivery> &delivery)
    {
        if (const auto *m = std::get_if<MessageEvent>(&ev))
        {
            if (e.index.count(m->native) || e.seen.count(m->native))
                return ApplyResult::Duplicate;

            if (!m->transactionId.empty() && e.pendingTxns.count(m->transactionId))
            {
                // echo of a local send: swap the provisional entry atomically
                Message msg;
                if (const Message *prov = e.find(m->transactionId))
                {
                    msg = *prov;
                    e.erase(m->transactionId);
                }

                msg.id = MessageId{e.conversation.id, m->native, false};
                msg.sender = m->sender;
                msg.timestamp = m->timestamp;
                if (!m->content.text.empty() || msg.content.text.empty())
                    msg.content = m->content;
                msg.outgoing = true;
                msg.delivery = Delivery::sent();

                e.pendingTxns.erase(m->transactionId);
                e.touch(msg.timestamp);
                e.put(std::move(msg));
                drain_parked(e, m->native, live);
                return ApplyResult::Applied;
            }

            Message msg;
            msg.id = MessageId{e.conversation.id, m->native, false};
            msg.sender = m->sender;
            msg.timestamp = m->timestamp;
            msg.content = m->content;
            msg.outgoing = m->outgoing;
            if (delivery)
                msg.delivery = *delivery;
            else
                msg.delivery = m->outgoing ? Delivery::sent() : Delivery::delivered();

            if (live && !m->outgoing && !m->content.redacted)
                ++e.conversation.unread;

            e.conversation.participants.insert(m->sender);
            e.touch(msg.timestamp);
            e.put(std::move(msg));
            drain_parked(e, m->native, live);
            return ApplyResult::Applied;
        }

        if (const auto *ed = std::get_if<EditEvent>(&ev))
        {
            if (e.seen.count(ed->native))
                return ApplyResult::Duplicate;

            const Message *target = e.find(ed->target);
            if (!target)
            {
                e.parked[ed->target].push_back(ev);
                return ApplyResult::Parked;
            }

            Message msg = *target;

            if (!ed->transactionId.empty())
            {
                auto it = std::find_if(msg.edits.begin(), msg.edits.end(),
                                       [&](const EditRecord &r)
                                       { return r.native == ed->transactionId; });
                if (it != msg.edits.end())
                {
                    it->native = ed->native;
                    it->timestamp = ed->timestamp;
                    it->delivery = Delivery::sent();
                    sort_edits(msg.edits);
                    e.seen.insert(ed->native);
                    e.editIndex[ed->native] = ed->target;
                    e.put(std::move(msg));
                    drain_parked(e, ed->native, live);
                    return ApplyResult::Applied;
                }
            }

            e.seen.insert(ed->native);
            if (msg.content.redacted || ed->sender != msg.sender)
                return ApplyResult::Ignored;

            msg.edits.push_back(EditRecord{ed->native, ed->timestamp, ed->text, Delivery::sent()});
            sort_edits(msg.edits);
            e.editIndex[ed->native] = ed->target;
            e.put(std::move(msg));
            drain_parked(e, ed->native, live);
            return ApplyResult::Applied;
        }

        if (const auto *re = std::get_if<ReactionEvent>(&ev))
        {
            if (e.seen.count(re->native))
                return ApplyResult::Duplicate;

            const Message *target = e.find(re->target);
            if (!target)
            {
                e.parked[re->target].push_back(ev);
                return ApplyResult::Parked;
            }

            Message msg = *target;
            e.seen.insert(re->native);

            if (!re->transactionId.empty())
            {
                if (ReactionRecord *r = find_reaction(msg, re->transactionId))
                {
                    r->native = re->native;
                    r->delivery = Delivery::sent();
                    e.reactionIndex[re->native] = re->target;
                    e.put(std::move(msg));
                    drain_parked(e, re->native, live);
                    return ApplyResult::Applied;
                }
            }

            if (msg.content.redacted)
                return ApplyResult::Ignored;

            msg.reactions[re->key].push_back(ReactionRecord{re->native, re->sender, Delivery::sent()});
            e.reactionIndex[re->native] = re->target;
            e.put(std::move(msg));
            drain_parked(e, re->native, live);
            return ApplyResult::Applied;
        }

        if (const auto *rs = std::get_if<ReactionSnapshotEvent>(&ev))
        {
            const Message *target = e.find(rs->target);
            if (!target)
            {
                e.parked[rs->target].push_back(ev);
                return ApplyResult::Parked;
            }

            Message msg = *target;
            if (msg.content.redacted)
                return ApplyResult::Ignored;

            ReactionMap next = rs->reactions;
            for (const auto &[key, records] : msg.reactions)
            {
                if (next.count(key))
                    continue;
                for (const auto &r : records)
                {
                    if (r.delivery.state == DeliveryState::Pending)
                        next[key].push_back(r);
                }
            }

            if (next == msg.reactions)
                return ApplyResult::Ignored;

            msg.reactions = std::move(next);
            e.put(std::move(msg));
            return ApplyResult::Applied;
        }

        if (const auto *rd = std::get_if<RedactionEvent>(&ev))
        {
            if (!rd->native.empty() && e.seen.count(rd->native))
                return ApplyResult::Duplicate;

            if (const Message *target = e.find(rd->target))
            {
                Message msg = *target;
                msg.content = MessageContent{};
                msg.content.redacted = true;
                msg.edits.clear();
                msg.reactions.clear();
                e.put(std::move(msg));
            }
            else if (auto it = e.reactionIndex.find(rd->target); it != e.reactionIndex.end())
            {
                if (const Message *owner = e.find(it->second))
                {
                    Message msg = *owner;
                    erase_reaction(msg, rd->target);
                    e.put(std::move(msg));
                }
                e.reactionIndex.erase(it);
            }
            else if (auto eit = e.editIndex.find(rd->target); eit != e.editIndex.end())
            {
                if (const Message *owner = e.find(eit->second))
                {
                    Message msg = *owner;
                    msg.edits.erase(std::remove_if(msg.edits.begin(), msg.edits.end(),
                                                   [&](const EditRecord &r)
                                                   { return r.native == rd->target; }),
                                    msg.edits.end());
                    e.put(std::move(msg));
                }
                e.editIndex.erase(eit);
            }
            else if (!e.seen.count(rd->target))
            {
                e.parked[rd->target].push_back(ev);
                return ApplyResult::Parked;
            }

            if (!rd->native.empty())
                e.seen.insert(rd->native);
            return ApplyResult::Applied;
        }

        if (const auto *ce = std::get_if<ConversationEvent>(&ev))
        {
            const Conversation before = e.conversation;

            if (ce->name)
                e.explicitName = *ce->name;
            if (ce->alias)
                e.alias = *ce->alias;
            e.refresh_name();

            if (ce->encrypted)
                e.conversation.encrypted = e.conversation.encrypted || *ce->encrypted;
            if (ce->archived)
                e.conversation.archived = *ce->archived;
            if (ce->serverUnread)
                e.conversation.unread = *ce->serverUnread;
            if (ce->lastActivity)
                e.touch(*ce->lastActivity);
            if (ce->historyToken && !e.historyToken && !e.historyExhausted)
                e.historyToken = *ce->historyToken;

            for (const auto &p : ce->joined)
            {
                participants_.ensure(p);
                e.conversation.participants.insert(p);
            }
            for (const auto &p : ce->left)
                e.conversation.participants.erase(p);

            const bool changed = before.displayName != e.conversation.displayName ||
                                 before.encrypted != e.conversation.encrypted ||
                                 before.archived != e.conversation.archived ||
                                 before.unread != e.conversation.unread ||
                                 before.lastActivity != e.conversation.lastActivity ||
                                 before.participants != e.conversation.participants;
            return changed ? ApplyResult::Applied : ApplyResult::Ignored;
        }

        if (const auto *rr = std::get_if<ReadReceiptEvent>(&ev))
        {
            if (!rr->own || e.conversation.unread == 0)
                return ApplyResult::Ignored;
            e.conversation.unread = 0;
            return ApplyResult::Applied;
        }

        return ApplyResult::Ignored;
    }

    // ───────────────────────── decryption ─────────────────────────

    std::vector<MessageId> ConversationStore::undecrypted(const AccountId &account, const std::string &sessionId) const
    {
        std::vector<MessageId> out;
        for (const auto &state : list(account))
        {
            for (const auto &m : state->messages)
            {
                if (m->delivery.state == DeliveryState::DecryptionFailed &&
                    m->content.encrypted &&
                    m->content.encrypted->sessionId == sessionId)
                {
                    out.push_back(m->id);
                }
            }
        }
        return out;
    }

    bool ConversationStore::replace_undecrypted(const MessageId &id, const std::vector<SyncEvent> &events)
    {
        auto entry = find_entry(id.conversation);
        if (!entry)
            return false;

        return mutate(entry, [&](Entry &e, bool &changed)
                      {
                          const Message *cur = e.find(id.native);
                          if (!cur || cur->delivery.state != DeliveryState::DecryptionFailed)
                              return false;

                          if (!events.empty())
                          {
                              const auto *m = std::get_if<MessageEvent>(&events.front());
                              if (m && m->native == id.native)
                              {
                                  Message msg = *cur;
                                  msg.content = m->content;
                                  msg.delivery = msg.outgoing ? Delivery::sent() : Delivery::delivered();
                                  e.put(std::move(msg));
                                  changed = true;
                                  return true;
                              }
                          }

                          // the ciphertext carried a relation, not a message
                          e.erase(id.native);
                          for (const auto &ev : events)
                              apply_locked(e, ev, false, std::nullopt);
                          e.seen.insert(id.native);
                          changed = true;
                          return true; });
    }

    std::optional<std::string> ConversationStore::history_token(const ConversationId &id) const
    {
        auto entry = require_entry(id);
        std::lock_guard<std::mutex> lock(entry->write);
        return entry->historyToken;
    }

    bool ConversationStore::history_exhausted(const ConversationId &id) const
    {
        auto entry = require_entry(id);
        std::lock_guard<std::mutex> lock(entry->write);
        return entry->historyExhausted;
    }

    void ConversationStore::set_history_token(const ConversationId &id, const std::optional<std::string> &token)
    {
        auto entry = require_entry(id);
        std::lock_guard<std::mutex> lock(entry->write);
        entry->historyToken = token;
        entry->historyExhausted = !token.has_value();
    }

    // ───────────────────────── outbound ─────────────────────────

    MessageId ConversationStore::create_provisional(const ConversationId &id,
                                                    const ParticipantId &self,
                                                    const std::string &text)
    {
        auto entry = require_entry(id);

        return mutate(entry, [&](Entry &e, bool &changed)
                      {
                          Message msg;
                          msg.id = MessageId{id, e.next_txn(), true};
                          msg.sender = self;
                          msg.timestamp = std::max(now_ms(), e.conversation.lastActivity);
                          msg.content.text = text;
                          msg.delivery = Delivery::pending();
                          msg.outgoing = true;

                          MessageId out = msg.id;
                          e.pendingTxns.insert(out.native);
                          e.touch(msg.timestamp);
                          e.put(std::move(msg));
                          changed = true;
                          return out; });
    }

    ReconcileResult ConversationStore::reconcile(const MessageId &provisional,
                                                 const std::string &serverId,
                                                 std::int64_t timestamp)
    {
        auto entry = require_entry(provisional.conversation);

        return mutate(entry, [&](Entry &e, bool &changed)
                      {
                          if (!e.pendingTxns.count(provisional.native))
                          {
                              if (e.find(serverId))
                                  return ReconcileResult::AlreadyReconciled;
                              return ReconcileResult::NotFound;
                          }

                          e.pendingTxns.erase(provisional.native);
                          const Message *prov = e.find(provisional.native);
                          changed = true;

                          if (const Message *echo = e.find(serverId))
                          {
                              Message msg = *echo;
                              if (prov)
                                  carry_relations(*prov, msg);
                              msg.outgoing = true;
                              msg.delivery = Delivery::sent();
                              e.put(std::move(msg));
                              e.erase(provisional.native);
                              return ReconcileResult::Merged;
                          }

                          if (!prov)
                              return ReconcileResult::NotFound;

                          Message msg = *prov;
                          e.erase(provisional.native);
                          msg.id = MessageId{provisional.conversation, serverId, false};
                          if (timestamp > 0)
                              msg.timestamp = timestamp;
                          msg.delivery = Delivery::sent();
                          e.touch(msg.timestamp);
                          e.put(std::move(msg));
                          drain_parked(e, serverId, true);
                          return ReconcileResult::Renamed; });
    }

    bool ConversationStore::is_pending_provisional(const MessageId &id) const
    {
        auto entry = find_entry(id.conversation);
        if (!entry)
            return false;
        std::lock_guard<std::mutex> lock(entry->write);
        return entry->pendingTxns.count(id.native) > 0;
    }

    bool ConversationStore::set_delivery(const MessageId &id, const Delivery &delivery)
    {
        auto entry = require_entry(id.conversation);

        return mutate(entry, [&](Entry &e, bool &changed)
                      {
                          const Message *cur = e.find(id.native);
                          if (!cur)
                              return false;
                          if (cur->delivery == delivery)
                              return true;
                          Message msg = *cur;
                          msg.delivery = delivery;
                          e.put(std::move(msg));
                          changed = true;
                          return true; });
    }

    bool ConversationStore::discard(const MessageId &id)
    {
        auto entry = require_entry(id.conversation);

        return mutate(entry, [&](Entry &e, bool &changed)
                      {
                          const Message *cur = e.find(id.native);
                          if (!cur || !is_provisional_native(id.native) ||
                              cur->delivery.state != DeliveryState::Failed)
                          {
                              return false;
                          }
                          e.erase(id.native);
                          e.pendingTxns.erase(id.native);
                          changed = true;
                          return true; });
    }

    std::string ConversationStore::add_pending_edit(const MessageId &target,
                                                    const ParticipantId &self,
                                                    const std::string &text)
    {
        auto entry = require_entry(target.conversation);

        return mutate(entry, [&](Entry &e, bool &changed)
                      {
                          const Message *cur = e.find(target.native);
                          if (!cur)
                              throw std::logic_error("[ConversationStore] edit of unknown message " + target.native);

                          Message msg = *cur;
                          std::string txn = e.next_txn();
                          (void)self;
                          msg.edits.push_back(EditRecord{txn, std::max(now_ms(), msg.timestamp), text, Delivery::pending()});
                          sort_edits(msg.edits);
                          e.put(std::move(msg));
                          changed = true;
                          return txn; });
    }

    void ConversationStore::settle_edit(const MessageId &target,
                                        const std::string &txnId,
                                        const std::string &serverId,
                                        std::int64_t timestamp)
    {
        auto entry = require_entry(target.conversation);

        mutate(entry, [&](Entry &e, bool &changed)
               {
                   const Message *cur = e.find(target.native);
                   if (!cur)
                       return false;

                   Message msg = *cur;
                   auto it = std::find_if(msg.edits.begin(), msg.edits.end(),
                                          [&](const EditRecord &r)
                                          { return r.native == txnId; });
                   if (it == msg.edits.end())
                       return false; // echo settled it already

                   it->native = serverId;
                   if (timestamp > 0)
                       it->timestamp = timestamp;
                   it->delivery = Delivery::sent();
                   sort_edits(msg.edits);

                   e.seen.insert(serverId);
                   e.editIndex[serverId] = target.native;
                   e.put(std::move(msg));
                   drain_parked(e, serverId, true);
                   changed = true;
                   return true; });
    }

    void ConversationStore::fail_edit(const MessageId &target, const std::string &txnId, const std::string &reason)
    {
        auto entry = require_entry(target.conversation);

        mutate(entry, [&](Entry &e, bool &changed)
               {
                   const Message *cur = e.find(target.native);
                   if (!cur)
                       return false;

                   Message msg = *cur;
                   for (auto &r : msg.edits)
                   {
                       if (r.native == txnId)
                       {
                           r.delivery = Delivery::failed(reason);
                           e.put(std::move(msg));
                           changed = true;
                           return true;
                       }
                   }
                   return false; });
    }

    std::string ConversationStore::add_pending_reaction(const MessageId &target,
                                                        const ParticipantId &self,
                                                        const std::string &key)
    {
        auto entry = require_entry(target.conversation);

        return mutate(entry, [&](Entry &e, bool &changed)
                      {
                          const Message *cur = e.find(target.native);
                          if (!cur)
                              throw std::logic_error("[ConversationStore] reaction to unknown message " + target.native);

                          Message msg = *cur;
                          std::string txn = e.next_txn();
                          msg.reactions[key].push_back(ReactionRecord{txn, self, Delivery::pending()});
                          e.put(std::move(msg));
                          changed = true;
                          return txn; });
    }

    void ConversationStore::settle_reaction(const MessageId &target, const std::string &txnId, const std::string &serverId)
    {
        auto entry = require_entry(target.conversation);

        mutate(entry, [&](Entry &e, bool &changed)
               {
                   const Message *cur = e.find(target.native);
                   if (!cur)
                       return false;

                   Message msg = *cur;
                   ReactionRecord *r = find_reaction(msg, txnId);
                   if (!r)
                       return false;

                   r->native = serverId;
                   r->delivery = Delivery::sent();
                   e.seen.insert(serverId);
                   e.reactionIndex[serverId] = target.native;
                   e.put(std::move(msg));
                   drain_parked(e, serverId, true);
                   changed = true;
                   return true; });
    }

    void ConversationStore::fail_reaction(const MessageId &target, const std::string &txnId, const std::string &reason)
    {
        auto entry = require_entry(target.conversation);

        mutate(entry, [&](Entry &e, bool &changed)
               {
                   const Message *cur = e.find(target.native);
                   if (!cur)
                       return false;

                   Message msg = *cur;
                   ReactionRecord *r = find_reaction(msg, txnId);
                   if (!r)
                       return false;

                   r->delivery = Delivery::failed(reason);
                   e.put(std::move(msg));
                   changed = true;
                   return true; });
    }

    void ConversationStore::mark_read_local(const ConversationId &id)
    {
        auto entry = require_entry(id);

        mutate(entry, [&](Entry &e, bool &changed)
               {
                   changed = e.conversation.unread != 0;
                   e.conversation.unread = 0;
                   return changed; });
    }

    std::optional<std::string> ConversationStore::latest_server_native(const ConversationId &id) const
    {
        auto state = get(id);
        if (!state)
            return std::nullopt;

        for (auto it = state->messages.rbegin(); it != state->messages.rend(); ++it)
        {
            if (!(*it)->id.provisional)
                return (*it)->id.native;
        }
        return std::nullopt;
    }

} // namespace echat::sync
