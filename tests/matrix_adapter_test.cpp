#include <echat/sync/ConversationStore.hpp>
#include <echat/sync/MatrixAdapter.hpp>
#include <echat/sync/SqliteStateStore.hpp>
#include <echat/sync/SyncEngine.hpp>
#include <echat/sync/errors.hpp>

#include <gtest/gtest.h>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

using namespace echat::sync;
using nlohmann::json;
namespace http = boost::beast::http;

namespace {

/// Homeserver stand-in: routes are matched by "METHOD path" prefix, first match wins.
class FakeHomeserver : public IHttpTransport {
public:
    FakeHomeserver() {
        route("POST /_matrix/client/v3/login", 200,
              json{{"user_id", "@me:x"}, {"access_token", "tok"}, {"device_id", "DEV"}});
        route("GET /_matrix/client/v3/account/whoami", 200, json{{"user_id", "@me:x"}, {"device_id", "DEV"}});
        route("POST /_matrix/client/v3/keys/upload", 200, json{{"one_time_key_counts", {{"signed_curve25519", 0}}}});
    }

    void route(const std::string &prefix, unsigned status, const json &body) {
        route_raw(prefix, status, body.dump());
    }

    void route_raw(const std::string &prefix, unsigned status, const std::string &body) {
        std::lock_guard<std::mutex> lock(mutex_);
        // newer routes shadow older ones
        routes_.insert(routes_.begin(), Route{prefix, HttpResponse{status, body}});
    }

    void fail_network(bool on) {
        std::lock_guard<std::mutex> lock(mutex_);
        networkDown_ = on;
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    HttpRequest last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.back();
    }

    HttpResponse perform(const HttpRequest &request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);

        if (networkDown_)
            throw boost::system::system_error(boost::asio::error::connection_refused);

        const std::string key = std::string(http::to_string(request.method)) + " " + request.target;
        for (const auto &r : routes_) {
            if (key.rfind(r.prefix, 0) == 0)
                return r.response;
        }
        return HttpResponse{404, json{{"errcode", "M_UNRECOGNIZED"}, {"error", "no route"}}.dump()};
    }

private:
    struct Route {
        std::string prefix;
        HttpResponse response;
    };

    mutable std::mutex mutex_;
    std::vector<Route> routes_;
    std::vector<HttpRequest> requests_;
    bool networkDown_ = false;
};

Credentials password_login() {
    Credentials c;
    c.backend = BackendKind::Matrix;
    c.params = {{"homeserver", "https://x"}, {"user", "me"}, {"password", "pw"}};
    return c;
}

template <typename T>
const T &only(const std::vector<SyncEvent> &events) {
    if (events.size() != 1)
        throw std::runtime_error("expected exactly one event, got " + std::to_string(events.size()));
    return std::get<T>(events.front());
}

json timeline(const std::string &room, const json &event) {
    return json{{"kind", "timeline"}, {"room", room}, {"membership", "join"}, {"event", event}};
}

class MatrixAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        http = std::make_shared<FakeHomeserver>();
        adapter = std::make_unique<MatrixAdapter>("acc", http, state, config);
    }

    void login() {
        adapter->connect(password_login());
    }

    std::vector<SyncEvent> translate(const json &payload) {
        return adapter->translate(RawEvent{payload});
    }

    ConversationId room{"acc", BackendKind::Matrix, "!r:x"};
    Config config;
    SqliteStateStore state{":memory:"};
    std::shared_ptr<FakeHomeserver> http;
    std::unique_ptr<MatrixAdapter> adapter;
};

} // namespace

// -- Login --------------------------------------------------------------------

TEST_F(MatrixAdapterTest, password_login_persists_session) {
    auto info = adapter->connect(password_login());

    EXPECT_EQ(info.selfId, "@me:x");
    EXPECT_EQ(info.persisted["access_token"], "tok");
    EXPECT_EQ(info.persisted["device_id"], "DEV");
    EXPECT_EQ(adapter->user_id(), "@me:x");

    auto reqs = http->requests();
    ASSERT_GE(reqs.size(), 3u);
    EXPECT_EQ(reqs[0].target, "/_matrix/client/v3/login");
    EXPECT_TRUE(reqs[0].accessToken.empty());
    auto body = json::parse(reqs[0].body);
    EXPECT_EQ(body["type"], "m.login.password");
    EXPECT_EQ(body["identifier"]["user"], "me");
}

TEST_F(MatrixAdapterTest, login_uploads_device_and_one_time_keys) {
    login();

    auto reqs = http->requests();
    ASSERT_EQ(reqs.size(), 3u);
    EXPECT_EQ(reqs[1].target, "/_matrix/client/v3/keys/upload");
    EXPECT_EQ(reqs[1].accessToken, "tok");
    auto first = json::parse(reqs[1].body);
    EXPECT_EQ(first["device_keys"]["device_id"], "DEV");
    EXPECT_TRUE(first["device_keys"]["keys"].contains("ed25519:DEV"));

    auto second = json::parse(reqs[2].body);
    ASSERT_TRUE(second.contains("one_time_keys"));
    EXPECT_FALSE(second["one_time_keys"].empty());
}

TEST_F(MatrixAdapterTest, restores_session_from_access_token) {
    Credentials c = password_login();
    c.session = {{"access_token", "saved"}, {"device_id", "DEV"}};

    auto info = adapter->connect(c);

    EXPECT_EQ(info.selfId, "@me:x");
    auto reqs = http->requests();
    EXPECT_EQ(reqs[0].target, "/_matrix/client/v3/account/whoami");
    EXPECT_EQ(reqs[0].accessToken, "saved");
    for (const auto &r : reqs)
        EXPECT_NE(r.target, "/_matrix/client/v3/login");
}

TEST_F(MatrixAdapterTest, missing_password_is_an_auth_error) {
    Credentials c;
    c.params = {{"homeserver", "https://x"}, {"user", "me"}};
    EXPECT_THROW(adapter->connect(c), AuthError);
    EXPECT_TRUE(http->requests().empty());
}

TEST_F(MatrixAdapterTest, rejected_password_is_an_auth_error) {
    http->route("POST /_matrix/client/v3/login", 403, json{{"errcode", "M_FORBIDDEN"}, {"error", "Invalid password"}});
    EXPECT_THROW(login(), AuthError);
}

TEST_F(MatrixAdapterTest, expired_token_is_an_auth_error) {
    Credentials c = password_login();
    c.session = {{"access_token", "old"}};
    http->route("GET /_matrix/client/v3/account/whoami", 401, json{{"errcode", "M_UNKNOWN_TOKEN"}});
    EXPECT_THROW(adapter->connect(c), AuthError);
}

TEST_F(MatrixAdapterTest, pickle_key_is_created_once) {
    auto stored = state.load_secret("acc", "olm.pickle_key");
    ASSERT_TRUE(stored.has_value());
    const auto key = stored->at("key").get<std::string>();
    EXPECT_EQ(key.size(), 64u);

    MatrixAdapter again("acc", http, state, config);
    EXPECT_EQ(state.load_secret("acc", "olm.pickle_key")->at("key"), key);
}

// -- Error classification -----------------------------------------------------

TEST_F(MatrixAdapterTest, classifies_http_failures) {
    const std::string send = "PUT /_matrix/client/v3/rooms/%21r%3Ax/send/";

    http->route(send, 429, json{{"errcode", "M_LIMIT_EXCEEDED"}, {"retry_after_ms", 100}});
    EXPECT_THROW(adapter->send(room, "hi", "~1"), TransientError);

    http->route(send, 502, json::object());
    EXPECT_THROW(adapter->send(room, "hi", "~1"), TransientError);

    http->route(send, 400, json{{"errcode", "M_BAD_JSON"}});
    EXPECT_THROW(adapter->send(room, "hi", "~1"), PermanentError);

    http->route(send, 401, json{{"errcode", "M_UNKNOWN_TOKEN"}});
    EXPECT_THROW(adapter->send(room, "hi", "~1"), AuthError);

    http->route_raw(send, 200, "<html>proxy</html>");
    EXPECT_THROW(adapter->send(room, "hi", "~1"), TransientError);

    http->route(send, 200, json::object());
    EXPECT_THROW(adapter->send(room, "hi", "~1"), TransientError);
}

TEST_F(MatrixAdapterTest, network_errors_are_transient) {
    http->fail_network(true);
    EXPECT_THROW(adapter->send(room, "hi", "~1"), TransientError);
    EXPECT_THROW(adapter->resume(std::nullopt)->next(CancellationToken()), TransientError);
}

TEST_F(MatrixAdapterTest, message_carries_reason) {
    http->route("PUT /_matrix/client/v3/rooms/", 403, json{{"errcode", "M_FORBIDDEN"}, {"error", "not in room"}});
    try {
        adapter->send(room, "hi", "~1");
        FAIL() << "send should throw";
    } catch (const PermanentError &e) {
        EXPECT_NE(std::string(e.what()).find("M_FORBIDDEN: not in room"), std::string::npos);
    }
}

// -- Outbound -----------------------------------------------------------------

TEST_F(MatrixAdapterTest, send_puts_message_with_wire_transaction) {
    http->route("PUT /_matrix/client/v3/rooms/%21r%3Ax/send/m.room.message/", 200, json{{"event_id", "$abc"}});

    auto receipt = adapter->send(room, "hello", "~7");

    EXPECT_EQ(receipt.serverId, "$abc");
    EXPECT_GT(receipt.timestamp, 0);

    auto req = http->last();
    EXPECT_EQ(req.method, http::verb::put);
    const auto wire = adapter->wire_txn("!r:x", "~7");
    EXPECT_EQ(req.target, "/_matrix/client/v3/rooms/%21r%3Ax/send/m.room.message/" + wire);
    auto body = json::parse(req.body);
    EXPECT_EQ(body["msgtype"], "m.text");
    EXPECT_EQ(body["body"], "hello");
}

TEST_F(MatrixAdapterTest, edit_and_react_relations) {
    http->route("PUT /_matrix/client/v3/rooms/", 200, json{{"event_id", "$rel"}});

    adapter->edit(room, "$orig", "better", "~2");
    auto edit = json::parse(http->last().body);
    EXPECT_EQ(edit["body"], "* better");
    EXPECT_EQ(edit["m.new_content"]["body"], "better");
    EXPECT_EQ(edit["m.relates_to"]["rel_type"], "m.replace");
    EXPECT_EQ(edit["m.relates_to"]["event_id"], "$orig");

    adapter->react(room, "$orig", "👍", "~3");
    EXPECT_NE(http->last().target.find("/send/m.reaction/"), std::string::npos);
    auto react = json::parse(http->last().body);
    EXPECT_EQ(react["m.relates_to"]["rel_type"], "m.annotation");
    EXPECT_EQ(react["m.relates_to"]["key"], "👍");
}

TEST_F(MatrixAdapterTest, mark_read_posts_receipt) {
    http->route("POST /_matrix/client/v3/rooms/", 200, json::object());
    adapter->mark_read(room, "$m1");
    EXPECT_EQ(http->last().target, "/_matrix/client/v3/rooms/%21r%3Ax/receipt/m.read/%24m1");
}

TEST_F(MatrixAdapterTest, encrypted_rooms_refuse_plaintext_sends) {
    translate(json{{"kind", "state"}, {"room", "!r:x"}, {"membership", "join"},
                   {"event", {{"type", "m.room.encryption"}, {"state_key", ""},
                              {"content", {{"algorithm", "m.megolm.v1.aes-sha2"}}}}}});

    EXPECT_THROW(adapter->send(room, "plain", "~1"), PermanentError);
    EXPECT_TRUE(http->requests().empty());
}

TEST_F(MatrixAdapterTest, wire_transaction_maps_back) {
    const auto wire = adapter->wire_txn("!r:x", "~12");
    EXPECT_EQ(wire.rfind("echat", 0), 0u);
    EXPECT_NE(wire.find(".b217f868.~12"), std::string::npos);
    EXPECT_NE(wire, adapter->wire_txn("!other:x", "~12"));
    EXPECT_EQ(adapter->local_txn(wire), "~12");
    EXPECT_EQ(adapter->local_txn("m1700000000.3"), "");

    MatrixAdapter otherProcess("acc2", http, state, config);
    EXPECT_EQ(otherProcess.local_txn(wire), "");
}

TEST_F(MatrixAdapterTest, echo_of_local_send_carries_local_txn) {
    login();

    auto events = translate(adapter->encode_message(room, "hi", "~4").payload);
    const auto &m = only<MessageEvent>(events);
    EXPECT_EQ(m.transactionId, "~4");
    EXPECT_TRUE(m.outgoing);
    EXPECT_EQ(m.content.text, "hi");
    EXPECT_EQ(m.sender.native, "@me:x");
}

// -- Sync ---------------------------------------------------------------------

TEST_F(MatrixAdapterTest, sync_flattens_response_in_order) {
    json sync = {
        {"next_batch", "s2"},
        {"to_device", {{"events", {{{"type", "m.room.encrypted"}, {"sender", "@bob:x"}, {"content", json::object()}}}}}},
        {"presence", {{"events", {{{"type", "m.presence"}, {"sender", "@bob:x"}, {"content", {{"presence", "online"}}}}}}}},
        {"rooms",
         {{"join",
           {{"!r:x",
             {{"unread_notifications", {{"notification_count", 3}}},
              {"state", {{"events", {{{"type", "m.room.name"}, {"state_key", ""}, {"content", {{"name", "Room"}}}}}}}},
              {"timeline",
               {{"prev_batch", "p1"},
                {"events",
                 {{{"type", "m.room.message"}, {"event_id", "$1"}, {"sender", "@bob:x"},
                   {"origin_server_ts", 10}, {"content", {{"msgtype", "m.text"}, {"body", "hi"}}}},
                  {{"type", "m.room.message"}, {"event_id", "$2"}, {"sender", "@bob:x"},
                   {"origin_server_ts", 11}, {"content", {{"msgtype", "m.text"}, {"body", "there"}}}}}}}},
              {"ephemeral", {{"events", {{{"type", "m.typing"}, {"content", {{"user_ids", {"@bob:x"}}}}}}}}}}}}},
          {"leave", {{"!old:x", {{"timeline", {{"events", json::array()}}}}}}}}},
    };
    http->route("GET /_matrix/client/v3/sync", 200, sync);

    auto batch = adapter->resume(std::nullopt)->next(CancellationToken());

    EXPECT_EQ(batch.cursor, "s2");
    std::vector<std::string> kinds;
    for (const auto &e : batch.events)
        kinds.push_back(e.payload["kind"].get<std::string>());
    EXPECT_EQ(kinds, (std::vector<std::string>{"to_device", "presence", "state", "timeline", "timeline",
                                               "ephemeral", "room_summary", "room_summary"}));

    const auto &summary = batch.events[6].payload;
    EXPECT_EQ(summary["unread"], 3);
    EXPECT_EQ(summary["prev_batch"], "p1");
    EXPECT_EQ(batch.events.back().payload["membership"], "leave");
}

TEST(MatrixUnread, notification_count_is_not_added_to_live_messages) {
    Config config;
    SqliteStateStore state{":memory:"};
    ConversationStore store;
    auto http = std::make_shared<FakeHomeserver>();
    auto adapter = std::make_shared<MatrixAdapter>("acc", http, state, config);
    adapter->connect(password_login());

    http->route("GET /_matrix/client/v3/sync", 200,
                json{{"next_batch", "s2"},
                     {"rooms",
                      {{"join",
                        {{"!r:x",
                          {{"unread_notifications", {{"notification_count", 1}}},
                           {"timeline",
                            {{"events",
                              {{{"type", "m.room.message"}, {"event_id", "$1"}, {"sender", "@bob:x"},
                                {"origin_server_ts", 10}, {"content", {{"msgtype", "m.text"}, {"body", "hi"}}}}}}}}}}}}}}});

    SyncEngine engine(adapter, store, state, config);
    auto batch = adapter->resume(std::nullopt)->next(CancellationToken());
    engine.ingest(batch.events, true);

    auto conv = store.get(ConversationId{"acc", BackendKind::Matrix, "!r:x"});
    ASSERT_TRUE(conv);
    ASSERT_EQ(conv->messages.size(), 1u);
    EXPECT_EQ(conv->conversation.unread, 1u);
}

TEST_F(MatrixAdapterTest, stream_sends_since_and_timeout) {
    http->route("GET /_matrix/client/v3/sync", 200, json{{"next_batch", "s9"}});

    auto initial = adapter->resume(std::nullopt);
    initial->next(CancellationToken());
    EXPECT_NE(http->last().target.find("&timeout=0"), std::string::npos);
    EXPECT_EQ(http->last().target.find("since="), std::string::npos);

    auto resumed = adapter->resume(SyncCursor{"acc", BackendKind::Matrix, "s1"});
    resumed->next(CancellationToken());
    EXPECT_NE(http->last().target.find("&since=s1"), std::string::npos);

    // the stream keeps its own position
    resumed->next(CancellationToken());
    EXPECT_NE(http->last().target.find("&since=s9"), std::string::npos);
}

TEST_F(MatrixAdapterTest, cancelled_stream_makes_no_request) {
    CancellationToken token;
    token.cancel();
    EXPECT_THROW(adapter->resume(std::nullopt)->next(token), Cancelled);
    EXPECT_TRUE(http->requests().empty());
}

// -- Translation --------------------------------------------------------------

TEST_F(MatrixAdapterTest, translates_messages_and_relations) {
    auto msg = translate(timeline("!r:x", {{"type", "m.room.message"}, {"event_id", "$1"}, {"sender", "@bob:x"},
                                           {"origin_server_ts", 5}, {"content", {{"msgtype", "m.emote"}, {"body", "waves"}}}}));
    const auto &m = only<MessageEvent>(msg);
    EXPECT_EQ(m.conversation, room);
    EXPECT_EQ(m.native, "$1");
    EXPECT_EQ(m.timestamp, 5);
    EXPECT_EQ(m.content.text, "* waves");
    EXPECT_FALSE(m.outgoing);

    auto ed = translate(timeline("!r:x", {{"type", "m.room.message"}, {"event_id", "$2"}, {"sender", "@bob:x"},
                                          {"content", {{"body", "* fixed"},
                                                       {"m.new_content", {{"body", "fixed"}}},
                                                       {"m.relates_to", {{"rel_type", "m.replace"}, {"event_id", "$1"}}}}}}));
    const auto &e = only<EditEvent>(ed);
    EXPECT_EQ(e.target, "$1");
    EXPECT_EQ(e.text, "fixed");

    auto re = translate(timeline("!r:x", {{"type", "m.reaction"}, {"event_id", "$3"}, {"sender", "@bob:x"},
                                          {"content", {{"m.relates_to", {{"rel_type", "m.annotation"}, {"event_id", "$1"}, {"key", "+1"}}}}}}));
    EXPECT_EQ(only<ReactionEvent>(re).key, "+1");

    auto rd = translate(timeline("!r:x", {{"type", "m.room.redaction"}, {"event_id", "$4"}, {"redacts", "$3"}}));
    EXPECT_EQ(only<RedactionEvent>(rd).target, "$3");

    // room version 11 keeps the target in the content
    auto rd11 = translate(timeline("!r:x", {{"type", "m.room.redaction"}, {"event_id", "$5"},
                                            {"content", {{"redacts", "$1"}}}}));
    EXPECT_EQ(only<RedactionEvent>(rd11).target, "$1");
}

TEST_F(MatrixAdapterTest, redacted_message_arrives_redacted) {
    auto ev = translate(timeline("!r:x", {{"type", "m.room.message"}, {"event_id", "$1"}, {"sender", "@bob:x"},
                                          {"content", json::object()},
                                          {"unsigned", {{"redacted_because", {{"type", "m.room.redaction"}}}}}}));
    EXPECT_TRUE(only<MessageEvent>(ev).content.redacted);
}

TEST_F(MatrixAdapterTest, translates_room_state) {
    auto summary = translate(json{{"kind", "room_summary"}, {"room", "!r:x"}, {"membership", "leave"},
                                  {"unread", 4}, {"prev_batch", "p0"}});
    const auto &ce = only<ConversationEvent>(summary);
    EXPECT_EQ(ce.serverUnread, 4u);
    EXPECT_EQ(ce.historyToken, "p0");
    EXPECT_EQ(ce.archived, true);

    auto alias = translate(json{{"kind", "state"}, {"room", "!r:x"},
                                {"event", {{"type", "m.room.canonical_alias"}, {"content", {{"alias", "#room:x"}}}}}});
    EXPECT_EQ(only<ConversationEvent>(alias).alias, "#room:x");

    auto member = translate(json{{"kind", "state"}, {"room", "!r:x"},
                                 {"event", {{"type", "m.room.member"}, {"state_key", "@bob:x"},
                                            {"content", {{"membership", "join"}, {"displayname", "Bob"}}}}}});
    ASSERT_EQ(member.size(), 2u);
    EXPECT_EQ(std::get<ConversationEvent>(member[0]).joined.at(0).native, "@bob:x");
    EXPECT_EQ(std::get<ParticipantEvent>(member[1]).displayName, "Bob");
}

TEST_F(MatrixAdapterTest, own_leave_archives) {
    login();
    auto ev = translate(json{{"kind", "state"}, {"room", "!r:x"},
                             {"event", {{"type", "m.room.member"}, {"state_key", "@me:x"},
                                        {"content", {{"membership", "leave"}}}}}});
    const auto &ce = only<ConversationEvent>(ev);
    EXPECT_EQ(ce.archived, true);
    EXPECT_EQ(ce.left.at(0).native, "@me:x");
}

TEST_F(MatrixAdapterTest, translates_ephemeral_events) {
    login();

    auto typing = translate(json{{"kind", "ephemeral"}, {"room", "!r:x"},
                                 {"event", {{"type", "m.typing"}, {"content", {{"user_ids", {"@a:x", "@b:x"}}}}}}});
    EXPECT_EQ(only<TypingEvent>(typing).typing.size(), 2u);

    auto receipts = translate(json{{"kind", "ephemeral"}, {"room", "!r:x"},
                                   {"event", {{"type", "m.receipt"},
                                              {"content", {{"$9", {{"m.read", {{"@me:x", {{"ts", 1}}}, {"@bob:x", {{"ts", 2}}}}}}}}}}}});
    ASSERT_EQ(receipts.size(), 2u);
    int own = 0;
    for (const auto &r : receipts) {
        const auto &rr = std::get<ReadReceiptEvent>(r);
        EXPECT_EQ(rr.upTo, "$9");
        if (rr.own) {
            ++own;
            EXPECT_EQ(rr.reader.native, "@me:x");
        }
    }
    EXPECT_EQ(own, 1);

    auto presence = translate(json{{"kind", "presence"},
                                   {"event", {{"sender", "@bob:x"}, {"content", {{"presence", "unavailable"}, {"avatar_url", "mxc://x/y"}}}}}});
    ASSERT_EQ(presence.size(), 2u);
    EXPECT_EQ(std::get<PresenceEvent>(presence[0]).presence, "unavailable");
    EXPECT_EQ(std::get<ParticipantEvent>(presence[1]).avatar, "mxc://x/y");
}

TEST_F(MatrixAdapterTest, translates_encrypted_events) {
    auto ev = translate(timeline("!r:x", {{"type", "m.room.encrypted"}, {"event_id", "$e"}, {"sender", "@bob:x"},
                                          {"origin_server_ts", 7},
                                          {"content", {{"algorithm", "m.megolm.v1.aes-sha2"}, {"session_id", "S"},
                                                       {"sender_key", "K"}, {"device_id", "BOBDEV"}, {"ciphertext", "AwgA"}}}}));
    const auto &m = only<MessageEvent>(ev);
    ASSERT_TRUE(m.content.encrypted.has_value());
    EXPECT_EQ(m.content.encrypted->sessionId, "S");
    EXPECT_EQ(m.content.encrypted->senderKey, "K");
    EXPECT_EQ(m.content.encrypted->ciphertext, "AwgA");

    auto keys = translate(json{{"kind", "to_device"}, {"event", {{"type", "m.room.encrypted"}, {"content", json::object()}}}});
    EXPECT_EQ(only<KeyEvent>(keys).account, "acc");

    auto ignored = translate(json{{"kind", "to_device"}, {"event", {{"type", "m.dummy"}}}});
    EXPECT_TRUE(ignored.empty());
}

TEST_F(MatrixAdapterTest, decrypted_payload_takes_envelope_identity) {
    MessageEvent envelope;
    envelope.conversation = room;
    envelope.native = "$e";
    envelope.sender = ParticipantId{"acc", "@bob:x"};
    envelope.timestamp = 77;
    envelope.transactionId = "~1";

    auto events = adapter->interpret_plaintext(
        envelope, json{{"type", "m.room.message"}, {"room_id", "!r:x"}, {"content", {{"msgtype", "m.text"}, {"body", "secret"}}}}.dump());
    const auto &m = only<MessageEvent>(events);
    EXPECT_EQ(m.native, "$e");
    EXPECT_EQ(m.sender.native, "@bob:x");
    EXPECT_EQ(m.timestamp, 77);
    EXPECT_EQ(m.content.text, "secret");
    EXPECT_EQ(m.transactionId, "~1");

    EXPECT_TRUE(adapter->interpret_plaintext(envelope, "not json").empty());
}

TEST_F(MatrixAdapterTest, unknown_events_translate_to_nothing) {
    EXPECT_TRUE(translate(timeline("!r:x", {{"type", "m.call.invite"}, {"event_id", "$c"}})).empty());
    EXPECT_TRUE(translate(json{{"kind", "timeline"}, {"event", {{"type", "m.room.message"}}}}).empty());
}

// -- History and listing ------------------------------------------------------

TEST_F(MatrixAdapterTest, history_pages_backwards) {
    http->route("GET /_matrix/client/v3/rooms/%21r%3Ax/messages", 200,
                json{{"chunk", {{{"type", "m.room.message"}, {"event_id", "$old"}, {"sender", "@bob:x"},
                                 {"content", {{"body", "old"}}}}}},
                     {"end", "t2"}});

    auto page = adapter->fetch_history(room, std::string("t1"), 10);

    EXPECT_EQ(http->last().target, "/_matrix/client/v3/rooms/%21r%3Ax/messages?dir=b&limit=10&from=t1");
    ASSERT_EQ(page.events.size(), 1u);
    EXPECT_EQ(page.events[0].payload["kind"], "timeline");
    EXPECT_EQ(page.nextBefore, "t2");
}

TEST_F(MatrixAdapterTest, empty_history_page_is_the_beginning) {
    http->route("GET /_matrix/client/v3/rooms/%21r%3Ax/messages", 200, json{{"chunk", json::array()}, {"end", "t3"}});

    auto page = adapter->fetch_history(room, std::nullopt, 10);

    EXPECT_EQ(http->last().target.find("from="), std::string::npos);
    EXPECT_TRUE(page.events.empty());
    EXPECT_FALSE(page.nextBefore.has_value());
}

TEST_F(MatrixAdapterTest, lists_joined_rooms_with_state) {
    http->route("GET /_matrix/client/v3/joined_rooms", 200, json{{"joined_rooms", {"!a:x", "!b:x"}}});
    http->route("GET /_matrix/client/v3/rooms/%21a%3Ax/state", 200,
                json::array({{{"type", "m.room.name"}, {"state_key", ""}, {"content", {{"name", "A"}}}}}));
    http->route("GET /_matrix/client/v3/rooms/%21b%3Ax/state", 403, json{{"errcode", "M_FORBIDDEN"}});

    auto raws = adapter->list_conversations();

    ASSERT_EQ(raws.size(), 3u);
    EXPECT_EQ(raws[0].payload["kind"], "room_summary");
    EXPECT_EQ(raws[1].payload["event"]["content"]["name"], "A");
    EXPECT_EQ(raws[2].payload["room"], "!b:x");

    EXPECT_EQ(only<ConversationEvent>(translate(raws[1].payload)).name, "A");
}
