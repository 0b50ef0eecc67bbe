#include <echat/sync/ConversationStore.hpp>
#include <echat/sync/errors.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace echat::sync;

namespace {

const ConversationId kRoom{"acc", BackendKind::Matrix, "!room:x"};
const ParticipantId kAlice{"acc", "@alice:x"};
const ParticipantId kBob{"acc", "@bob:x"};
const ParticipantId kMe{"acc", "@me:x"};

MessageEvent msg(const std::string &id, std::int64_t ts, const std::string &text,
                 const ParticipantId &sender = kAlice) {
    MessageEvent m;
    m.conversation = kRoom;
    m.native = id;
    m.sender = sender;
    m.timestamp = ts;
    m.content.text = text;
    m.outgoing = sender == kMe;
    return m;
}

EditEvent edit(const std::string &id, const std::string &target, std::int64_t ts, const std::string &text,
               const ParticipantId &sender = kAlice) {
    EditEvent e;
    e.conversation = kRoom;
    e.native = id;
    e.target = target;
    e.sender = sender;
    e.timestamp = ts;
    e.text = text;
    return e;
}

ReactionEvent react(const std::string &id, const std::string &target, const std::string &key,
                    const ParticipantId &sender = kBob) {
    ReactionEvent r;
    r.conversation = kRoom;
    r.native = id;
    r.target = target;
    r.sender = sender;
    r.key = key;
    return r;
}

RedactionEvent redact(const std::string &id, const std::string &target) {
    return RedactionEvent{kRoom, id, target};
}

/// What the presentation layer would render, ignoring versions.
std::vector<std::string> rendered(const ConversationStore &store) {
    std::vector<std::string> out;
    auto state = store.get(kRoom);
    if (!state)
        return out;
    for (const auto &m : state->messages) {
        std::string line = m->id.native + "|" + m->display_text();
        for (const auto &[key, records] : m->reactions)
            line += "|" + key + "x" + std::to_string(records.size());
        if (m->content.redacted)
            line += "|redacted";
        out.push_back(line);
    }
    return out;
}

} // namespace

// -- Ordering and deduplication -----------------------------------------------

TEST(ConversationStore, messages_are_ordered_by_timestamp_then_id) {
    ConversationStore store;
    store.apply(msg("$c", 30, "third"));
    store.apply(msg("$b", 10, "first-b"));
    store.apply(msg("$a", 10, "first-a"));

    auto state = store.get(kRoom);
    ASSERT_EQ(state->messages.size(), 3u);
    EXPECT_EQ(state->messages[0]->id.native, "$a");
    EXPECT_EQ(state->messages[1]->id.native, "$b");
    EXPECT_EQ(state->messages[2]->id.native, "$c");
    EXPECT_EQ(state->conversation.lastActivity, 30);
}

TEST(ConversationStore, duplicate_message_is_a_no_op) {
    ConversationStore store;
    EXPECT_EQ(store.apply(msg("$1", 10, "hi")), ApplyResult::Applied);
    const auto version = store.get(kRoom)->version;

    EXPECT_EQ(store.apply(msg("$1", 10, "hi")), ApplyResult::Duplicate);
    EXPECT_EQ(store.get(kRoom)->messages.size(), 1u);
    EXPECT_EQ(store.get(kRoom)->conversation.unread, 1u);
    EXPECT_EQ(store.get(kRoom)->version, version);
}

TEST(ConversationStore, final_state_does_not_depend_on_delivery_order) {
    std::vector<SyncEvent> events = {
        msg("$1", 10, "hello"),
        edit("$e1", "$1", 20, "hello there"),
        react("$r1", "$1", "+1"),
        react("$r2", "$1", "+1", kAlice),
        msg("$2", 15, "second", kBob),
        redact("$x", "$2"),
        react("$r3", "$2", "<3"),
    };

    ConversationStore forward;
    for (const auto &ev : events)
        forward.apply(ev);

    ConversationStore backward;
    for (auto it = events.rbegin(); it != events.rend(); ++it)
        backward.apply(*it);

    ConversationStore twice;
    for (const auto &ev : events)
        twice.apply(ev);
    for (const auto &ev : events)
        twice.apply(ev);

    const std::vector<std::string> expected = {"$1|hello there|+1x2", "$2||redacted"};
    EXPECT_EQ(rendered(forward), expected);
    EXPECT_EQ(rendered(backward), expected);
    EXPECT_EQ(rendered(twice), expected);
}

// -- Relations ----------------------------------------------------------------

TEST(ConversationStore, edit_before_target_is_parked_then_applied) {
    ConversationStore store;
    EXPECT_EQ(store.apply(edit("$e", "$1", 20, "fixed")), ApplyResult::Parked);
    EXPECT_TRUE(store.get(kRoom)->messages.empty());

    store.apply(msg("$1", 10, "fixd"));
    auto state = store.get(kRoom);
    ASSERT_EQ(state->messages.size(), 1u);
    EXPECT_EQ(state->messages[0]->display_text(), "fixed");
    EXPECT_EQ(state->messages[0]->content.text, "fixd");
}

TEST(ConversationStore, edits_apply_in_timestamp_order) {
    ConversationStore store;
    store.apply(msg("$1", 10, "v0"));
    store.apply(edit("$e2", "$1", 30, "v2"));
    store.apply(edit("$e1", "$1", 20, "v1"));

    auto m = store.get(kRoom)->messages.at(0);
    ASSERT_EQ(m->edits.size(), 2u);
    EXPECT_EQ(m->edits[0].native, "$e1");
    EXPECT_EQ(m->display_text(), "v2");
}

TEST(ConversationStore, edit_by_another_sender_is_ignored) {
    ConversationStore store;
    store.apply(msg("$1", 10, "mine"));
    EXPECT_EQ(store.apply(edit("$e", "$1", 20, "hijacked", kBob)), ApplyResult::Ignored);
    EXPECT_EQ(store.get(kRoom)->messages.at(0)->display_text(), "mine");
}

TEST(ConversationStore, redaction_clears_content_edits_and_reactions) {
    ConversationStore store;
    store.apply(msg("$1", 10, "secret"));
    store.apply(edit("$e", "$1", 20, "more secret"));
    store.apply(react("$r", "$1", "+1"));

    EXPECT_EQ(store.apply(redact("$x", "$1")), ApplyResult::Applied);

    auto m = store.get(kRoom)->messages.at(0);
    EXPECT_TRUE(m->content.redacted);
    EXPECT_TRUE(m->content.text.empty());
    EXPECT_TRUE(m->edits.empty());
    EXPECT_TRUE(m->reactions.empty());

    // relations arriving later stay out
    store.apply(edit("$e2", "$1", 30, "back"));
    store.apply(react("$r2", "$1", "<3"));
    m = store.get(kRoom)->messages.at(0);
    EXPECT_TRUE(m->edits.empty());
    EXPECT_TRUE(m->reactions.empty());
}

TEST(ConversationStore, redacting_a_reaction_removes_only_it) {
    ConversationStore store;
    store.apply(msg("$1", 10, "hi"));
    store.apply(react("$r1", "$1", "+1"));
    store.apply(react("$r2", "$1", "+1", kAlice));

    store.apply(redact("$x", "$r1"));

    auto m = store.get(kRoom)->messages.at(0);
    ASSERT_EQ(m->reactions.count("+1"), 1u);
    ASSERT_EQ(m->reactions.at("+1").size(), 1u);
    EXPECT_EQ(m->reactions.at("+1")[0].native, "$r2");
    EXPECT_EQ(m->display_text(), "hi");
}

TEST(ConversationStore, reaction_snapshot_replaces_but_keeps_pending) {
    ConversationStore store;
    store.apply(msg("$1", 10, "hi"));
    store.add_pending_reaction(MessageId{kRoom, "$1"}, kMe, "<3");

    ReactionSnapshotEvent snap;
    snap.conversation = kRoom;
    snap.target = "$1";
    snap.reactions["+1"] = {ReactionRecord{"r$1:@bob:x:+1", kBob, Delivery::sent()}};
    EXPECT_EQ(store.apply(snap), ApplyResult::Applied);

    auto m = store.get(kRoom)->messages.at(0);
    ASSERT_EQ(m->reactions.size(), 2u);
    EXPECT_EQ(m->reactions.at("+1").size(), 1u);
    EXPECT_EQ(m->reactions.at("<3").at(0).delivery.state, DeliveryState::Pending);

    EXPECT_EQ(store.apply(snap), ApplyResult::Ignored);
}

// -- Unread -------------------------------------------------------------------

TEST(ConversationStore, unread_counts_live_incoming_only) {
    ConversationStore store;
    store.apply(msg("$1", 10, "live"), true);
    store.apply(msg("$0", 5, "history"), false);
    store.apply(msg("$2", 20, "mine", kMe), true);

    EXPECT_EQ(store.get(kRoom)->conversation.unread, 1u);
}

TEST(ConversationStore, server_unread_is_authoritative) {
    ConversationStore store;
    store.apply(msg("$1", 10, "a"));
    store.apply(msg("$2", 11, "b"));

    ConversationEvent ce;
    ce.conversation = kRoom;
    ce.serverUnread = 7;
    store.apply(ce);
    EXPECT_EQ(store.get(kRoom)->conversation.unread, 7u);
}

TEST(ConversationStore, own_read_receipt_and_local_mark_read_reset_unread) {
    ConversationStore store;
    store.apply(msg("$1", 10, "a"));
    store.apply(msg("$2", 11, "b"));

    ReadReceiptEvent other{kRoom, kBob, "$2", false};
    EXPECT_EQ(store.apply(other), ApplyResult::Ignored);
    EXPECT_EQ(store.get(kRoom)->conversation.unread, 2u);

    ReadReceiptEvent own{kRoom, kMe, "$2", true};
    EXPECT_EQ(store.apply(own), ApplyResult::Applied);
    EXPECT_EQ(store.get(kRoom)->conversation.unread, 0u);

    store.apply(msg("$3", 12, "c"));
    store.mark_read_local(kRoom);
    EXPECT_EQ(store.get(kRoom)->conversation.unread, 0u);
}

// -- Conversation metadata ----------------------------------------------------

TEST(ConversationStore, explicit_name_wins_over_alias) {
    ConversationStore store;
    store.ensure(kRoom);
    EXPECT_EQ(store.get(kRoom)->conversation.displayName, kRoom.native);

    ConversationEvent alias;
    alias.conversation = kRoom;
    alias.alias = "#general:x";
    store.apply(alias);
    EXPECT_EQ(store.get(kRoom)->conversation.displayName, "#general:x");

    ConversationEvent named;
    named.conversation = kRoom;
    named.name = "General";
    store.apply(named);
    EXPECT_EQ(store.get(kRoom)->conversation.displayName, "General");

    EXPECT_EQ(store.apply(named), ApplyResult::Ignored);
}

TEST(ConversationStore, membership_changes) {
    ConversationStore store;
    ConversationEvent join;
    join.conversation = kRoom;
    join.joined = {kAlice, kBob};
    store.apply(join);

    ConversationEvent leave;
    leave.conversation = kRoom;
    leave.left = {kBob};
    store.apply(leave);

    const auto &participants = store.get(kRoom)->conversation.participants;
    EXPECT_EQ(participants.size(), 1u);
    EXPECT_TRUE(participants.count(kAlice));
    EXPECT_TRUE(store.participants().get(kBob).has_value());
}

TEST(ConversationStore, list_is_sorted_by_activity_and_filtered_by_account) {
    ConversationStore store;
    ConversationId other{"acc2", BackendKind::Telegram, "42"};
    ConversationId quiet{"acc", BackendKind::Matrix, "!quiet:x"};

    store.apply(msg("$1", 10, "old"));
    MessageEvent tg = msg("7", 50, "newer");
    tg.conversation = other;
    tg.sender = ParticipantId{"acc2", "9"};
    store.apply(tg);
    store.ensure(quiet);

    auto all = store.list();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0]->conversation.id, other);
    EXPECT_EQ(all[1]->conversation.id, kRoom);

    auto mine = store.list(AccountId("acc"));
    EXPECT_EQ(mine.size(), 2u);
    EXPECT_EQ(store.conversations_of("acc2"), (std::vector<ConversationId>{other}));
}

// -- Outbound helpers ---------------------------------------------------------

TEST(ConversationStore, provisional_echo_swaps_in_one_update) {
    ConversationStore store;
    store.ensure(kRoom);
    auto prov = store.create_provisional(kRoom, kMe, "hi");
    EXPECT_TRUE(prov.provisional);
    EXPECT_TRUE(is_provisional_native(prov.native));
    EXPECT_EQ(store.get(kRoom)->messages.at(0)->delivery.state, DeliveryState::Pending);

    auto echo = msg("$srv", now_ms(), "hi", kMe);
    echo.transactionId = prov.native;
    EXPECT_EQ(store.apply(echo), ApplyResult::Applied);

    auto state = store.get(kRoom);
    ASSERT_EQ(state->messages.size(), 1u);
    EXPECT_EQ(state->messages[0]->id.native, "$srv");
    EXPECT_EQ(state->messages[0]->delivery.state, DeliveryState::Sent);
    EXPECT_FALSE(store.is_pending_provisional(prov));

    EXPECT_EQ(store.reconcile(prov, "$srv", 0), ReconcileResult::AlreadyReconciled);
}

TEST(ConversationStore, reconcile_renames_and_later_echo_is_duplicate) {
    ConversationStore store;
    store.ensure(kRoom);
    auto prov = store.create_provisional(kRoom, kMe, "hi");

    EXPECT_EQ(store.reconcile(prov, "$srv", 1234), ReconcileResult::Renamed);

    auto echo = msg("$srv", 1234, "hi", kMe);
    echo.transactionId = prov.native;
    EXPECT_EQ(store.apply(echo), ApplyResult::Duplicate);

    auto state = store.get(kRoom);
    ASSERT_EQ(state->messages.size(), 1u);
    EXPECT_EQ(state->messages[0]->timestamp, 1234);
    EXPECT_EQ(state->messages[0]->delivery.state, DeliveryState::Sent);
}

TEST(ConversationStore, reconcile_merges_with_echo_that_lost_its_transaction) {
    ConversationStore store;
    store.ensure(kRoom);
    auto prov = store.create_provisional(kRoom, kMe, "hi");
    store.apply(msg("$srv", 99, "hi", kMe));
    ASSERT_EQ(store.get(kRoom)->messages.size(), 2u);

    EXPECT_EQ(store.reconcile(prov, "$srv", 99), ReconcileResult::Merged);
    auto state = store.get(kRoom);
    ASSERT_EQ(state->messages.size(), 1u);
    EXPECT_EQ(state->messages[0]->id.native, "$srv");
    EXPECT_TRUE(state->messages[0]->outgoing);
}

TEST(ConversationStore, merge_with_early_echo_keeps_pending_edit) {
    ConversationStore store;
    store.ensure(kRoom);
    auto prov = store.create_provisional(kRoom, kMe, "typo");
    store.add_pending_edit(prov, kMe, "fixed");

    // the server copy arrived before the send was acknowledged
    store.apply(msg("$srv", 99, "typo", kMe));
    EXPECT_EQ(store.reconcile(prov, "$srv", 99), ReconcileResult::Merged);

    auto state = store.get(kRoom);
    ASSERT_EQ(state->messages.size(), 1u);
    auto m = state->messages[0];
    EXPECT_EQ(m->id.native, "$srv");
    ASSERT_EQ(m->edits.size(), 1u);
    EXPECT_EQ(m->edits[0].delivery.state, DeliveryState::Pending);
    EXPECT_EQ(m->display_text(), "fixed");
}

TEST(ConversationStore, relation_parked_on_server_id_drains_on_rename) {
    ConversationStore store;
    store.ensure(kRoom);
    auto prov = store.create_provisional(kRoom, kMe, "hi");

    EXPECT_EQ(store.apply(react("$r", "$srv", "+1")), ApplyResult::Parked);
    store.reconcile(prov, "$srv", 0);

    auto m = store.get(kRoom)->messages.at(0);
    EXPECT_EQ(m->reactions.at("+1").size(), 1u);
}

TEST(ConversationStore, pending_edit_settles_and_echo_is_deduplicated) {
    ConversationStore store;
    store.apply(msg("$1", 10, "typo", kMe));
    const MessageId target{kRoom, "$1"};

    auto txn = store.add_pending_edit(target, kMe, "fixed");
    EXPECT_EQ(store.get(kRoom)->messages.at(0)->display_text(), "fixed");

    store.settle_edit(target, txn, "$e", 20);
    EXPECT_TRUE(store.is_known(kRoom, "$e"));
    EXPECT_EQ(store.apply(edit("$e", "$1", 20, "fixed", kMe)), ApplyResult::Duplicate);

    auto m = store.get(kRoom)->messages.at(0);
    ASSERT_EQ(m->edits.size(), 1u);
    EXPECT_EQ(m->edits[0].delivery.state, DeliveryState::Sent);
}

TEST(ConversationStore, failed_edit_falls_back_to_previous_text) {
    ConversationStore store;
    store.apply(msg("$1", 10, "original", kMe));
    const MessageId target{kRoom, "$1"};

    auto txn = store.add_pending_edit(target, kMe, "rewritten");
    store.fail_edit(target, txn, "forbidden");

    auto m = store.get(kRoom)->messages.at(0);
    EXPECT_EQ(m->display_text(), "original");
    EXPECT_EQ(m->edits.at(0).delivery.reason, "forbidden");
}

TEST(ConversationStore, discard_only_drops_failed_provisionals) {
    ConversationStore store;
    store.ensure(kRoom);
    auto prov = store.create_provisional(kRoom, kMe, "hi");

    EXPECT_FALSE(store.discard(prov));
    store.set_delivery(prov, Delivery::failed("network"));
    EXPECT_TRUE(store.discard(prov));
    EXPECT_TRUE(store.get(kRoom)->messages.empty());
}

TEST(ConversationStore, provisional_ids_are_unique_per_conversation) {
    ConversationStore store;
    store.ensure(kRoom);
    auto a = store.create_provisional(kRoom, kMe, "a");
    auto b = store.create_provisional(kRoom, kMe, "b");
    EXPECT_NE(a.native, b.native);
}

TEST(ConversationStore, outbound_helpers_reject_unknown_conversation) {
    ConversationStore store;
    EXPECT_THROW(store.create_provisional(kRoom, kMe, "x"), std::logic_error);
    EXPECT_THROW(store.mark_read_local(kRoom), std::logic_error);
}

TEST(ConversationStore, latest_server_native_skips_provisionals) {
    ConversationStore store;
    store.apply(msg("$1", 10, "a"));
    store.create_provisional(kRoom, kMe, "b");
    EXPECT_EQ(store.latest_server_native(kRoom), std::optional<std::string>("$1"));
}

// -- Decryption ---------------------------------------------------------------

TEST(ConversationStore, undecrypted_placeholder_is_replaced_in_place) {
    ConversationStore store;
    auto enc = msg("$1", 10, "");
    enc.content.encrypted = EncryptedPayload{"m.megolm.v1.aes-sha2", "sess", "key", "DEV", "AwgA"};
    store.apply(enc, true, Delivery::undecryptable(reason::kNoSession));

    const auto pending = store.undecrypted("acc", "sess");
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_TRUE(store.undecrypted("acc", "other").empty());

    auto clear = msg("$1", 10, "plaintext");
    EXPECT_TRUE(store.replace_undecrypted(pending[0], {clear}));

    auto m = store.get(kRoom)->messages.at(0);
    EXPECT_EQ(m->content.text, "plaintext");
    EXPECT_EQ(m->delivery.state, DeliveryState::Delivered);
    EXPECT_TRUE(store.undecrypted("acc", "sess").empty());
    EXPECT_FALSE(store.replace_undecrypted(pending[0], {clear}));
}

TEST(ConversationStore, undecrypted_relation_replaces_placeholder) {
    ConversationStore store;
    store.apply(msg("$1", 10, "hi"));

    auto enc = msg("$2", 20, "");
    enc.content.encrypted = EncryptedPayload{"m.megolm.v1.aes-sha2", "sess", "key", "DEV", "AwgA"};
    store.apply(enc, true, Delivery::undecryptable(reason::kNoSession));

    EXPECT_TRUE(store.replace_undecrypted(MessageId{kRoom, "$2"}, {react("$2", "$1", "+1")}));

    auto state = store.get(kRoom);
    ASSERT_EQ(state->messages.size(), 1u);
    EXPECT_EQ(state->messages[0]->reactions.at("+1").size(), 1u);
}

// -- History ------------------------------------------------------------------

TEST(ConversationStore, history_token_is_kept_once_set) {
    ConversationStore store;
    ConversationEvent ce;
    ce.conversation = kRoom;
    ce.historyToken = "t1";
    store.apply(ce);
    ce.historyToken = "t2";
    store.apply(ce);
    EXPECT_EQ(store.history_token(kRoom), std::optional<std::string>("t1"));

    store.set_history_token(kRoom, std::nullopt);
    EXPECT_TRUE(store.history_exhausted(kRoom));
}

// -- Notification and concurrency ---------------------------------------------

TEST(ConversationStore, listener_fires_once_per_published_change) {
    ConversationStore store;
    std::vector<ConversationId> seen;
    store.set_change_listener([&](const ConversationId &id) { seen.push_back(id); });

    store.apply(msg("$1", 10, "a"));
    store.apply(msg("$1", 10, "a")); // duplicate: no publish
    EXPECT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], kRoom);
}

TEST(ConversationStore, readers_keep_their_snapshot) {
    ConversationStore store;
    store.apply(msg("$1", 10, "a"));
    auto before = store.get(kRoom);
    store.apply(msg("$2", 20, "b"));
    EXPECT_EQ(before->messages.size(), 1u);
    EXPECT_EQ(store.get(kRoom)->messages.size(), 2u);
    EXPECT_GT(store.get(kRoom)->version, before->version);
}

TEST(ConversationStore, conversations_update_in_parallel) {
    ConversationStore store;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, t] {
            ConversationId id{"acc", BackendKind::Matrix, "!r" + std::to_string(t)};
            for (int i = 0; i < 100; ++i) {
                MessageEvent m = msg("$" + std::to_string(i), i, "x");
                m.conversation = id;
                store.apply(m);
            }
        });
    }
    for (auto &th : threads)
        th.join();

    for (int t = 0; t < 4; ++t) {
        auto state = store.get(ConversationId{"acc", BackendKind::Matrix, "!r" + std::to_string(t)});
        ASSERT_TRUE(state);
        EXPECT_EQ(state->messages.size(), 100u);
        EXPECT_EQ(state->conversation.unread, 100u);
    }
}
