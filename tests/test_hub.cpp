#include "hub/Hub.h"
#include "hub/MessageTypes.hpp"

#include <gtest/gtest.h>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace consulthub::hub;
namespace json = boost::json;

namespace {

std::string str(const json::value& v) {
    return json::value_to<std::string>(v);
}

std::vector<Envelope> take_all(const ConnectionPtr& c) {
    std::vector<Envelope> out;
    while (auto e = c->queue().try_pop()) out.push_back(std::move(*e));
    return out;
}

std::string chat(const std::string& session, const std::string& content) {
    return R"({"type":"chat_message","data":{"sessionId":")" + session +
           R"(","content":")" + content + R"("}})";
}

std::string room_msg(const std::string& type, const std::string& session) {
    return R"({"type":")" + type + R"(","data":{"sessionId":")" + session + R"("}})";
}

} // namespace

class HubTest : public ::testing::Test {
protected:
    void SetUp() override {
        hub_.start();
        drain();
    }

    // Run every posted hub operation to completion.
    void drain() {
        ioc_.restart();
        ioc_.run();
    }

    ConnectionPtr connect(const std::string& user, std::size_t capacity = 64) {
        auto c = std::make_shared<Connection>("conn-" + std::to_string(++next_id_), user, capacity);
        hub_.register_connection(c);
        drain();
        auto confirmed = c->queue().try_pop();
        EXPECT_TRUE(confirmed.has_value());
        if (confirmed) EXPECT_EQ(confirmed->type(), msg::kConnectionConfirmed);
        return c;
    }

    // What the connection actor does with an inbound frame.
    void send(const std::string& user, const std::string& frame) {
        hub_.dispatch(Envelope::parse(frame).with_user(user));
        drain();
    }

    void join(const std::string& user, const std::string& session) {
        send(user, room_msg("join_consultation", session));
    }

    boost::asio::io_context ioc_;
    Hub hub_{ioc_};
    int next_id_ = 0;
};

TEST_F(HubTest, RegisterSendsConfirmation) {
    auto c = std::make_shared<Connection>("conn-x", "u1", 8);
    hub_.register_connection(c);
    drain();

    EXPECT_TRUE(hub_.is_registered(c));
    EXPECT_EQ(hub_.connection_count(), 1u);

    auto confirmed = c->queue().try_pop();
    ASSERT_TRUE(confirmed.has_value());
    EXPECT_EQ(confirmed->type(), "connection_confirmed");
    EXPECT_EQ(str(confirmed->data().as_object().at("status")), "connected");
    EXPECT_EQ(str(confirmed->data().as_object().at("connectionId")), "conn-x");
    EXPECT_GT(confirmed->timestamp(), 0);
}

TEST_F(HubTest, UndeliverableConfirmationDropsConnection) {
    auto c = std::make_shared<Connection>("conn-full", "u1", 1);
    ASSERT_TRUE(c->queue().try_push(Envelope("filler", nullptr)));

    hub_.register_connection(c);
    drain();

    EXPECT_FALSE(hub_.is_registered(c));
    EXPECT_EQ(hub_.connection_count(), 0u);
    EXPECT_TRUE(c->queue().closed());
}

TEST_F(HubTest, UnregisterRemovesFromEveryRoom) {
    auto a = connect("u1");
    auto b = connect("u2");
    join("u1", "s1");
    join("u1", "s2");
    join("u2", "s2");

    hub_.unregister_connection(a);
    drain();

    EXPECT_FALSE(hub_.is_registered(a));
    EXPECT_TRUE(a->queue().closed());
    EXPECT_TRUE(a->rooms().empty());
    EXPECT_FALSE(hub_.rooms().contains("s1"));
    EXPECT_EQ(hub_.rooms().member_count("s2"), 1u);
    EXPECT_TRUE(hub_.rooms().is_member(b, "s2"));
}

TEST_F(HubTest, UnregisterTwiceIsANoOp) {
    auto a = connect("u1");
    auto b = connect("u2");
    join("u1", "s1");
    join("u2", "s1");

    hub_.unregister_connection(a);
    drain();
    hub_.unregister_connection(a);
    drain();

    EXPECT_EQ(hub_.connection_count(), 1u);
    EXPECT_EQ(hub_.rooms().member_count("s1"), 1u);
    EXPECT_TRUE(hub_.is_registered(b));
    EXPECT_FALSE(b->queue().closed());
}

TEST_F(HubTest, JoinWithoutBroadcast) {
    auto a = connect("u1");
    auto b = connect("u2");
    join("u2", "s1");
    join("u1", "s1");

    EXPECT_TRUE(hub_.rooms().is_member(a, "s1"));
    EXPECT_TRUE(a->in_room("s1"));
    EXPECT_TRUE(take_all(a).empty());
    EXPECT_TRUE(take_all(b).empty());
}

TEST_F(HubTest, JoinWithoutSessionIdIsIgnored) {
    auto a = connect("u1");
    send("u1", R"({"type":"join_consultation","data":{}})");
    send("u1", R"({"type":"join_consultation","data":null})");
    send("u1", R"({"type":"join_consultation","data":{"sessionId":12}})");

    EXPECT_EQ(hub_.rooms().room_count(), 0u);
    EXPECT_TRUE(a->rooms().empty());
    EXPECT_TRUE(hub_.is_registered(a));
}

TEST_F(HubTest, AcceptsLegacyConsultationIdKey) {
    auto a = connect("u1");
    send("u1", R"({"type":"join_consultation","data":{"consultationId":"legacy"}})");
    EXPECT_TRUE(hub_.rooms().is_member(a, "legacy"));
}

TEST_F(HubTest, LeaveDeletesEmptyRoom) {
    auto a = connect("u1");
    auto b = connect("u2");
    join("u1", "s1");
    join("u2", "s1");

    send("u1", room_msg("leave_consultation", "s1"));
    EXPECT_FALSE(a->in_room("s1"));
    EXPECT_TRUE(hub_.rooms().contains("s1"));

    send("u2", room_msg("leave_consultation", "s1"));
    EXPECT_FALSE(hub_.rooms().contains("s1"));
    EXPECT_TRUE(b->rooms().empty());
}

TEST_F(HubTest, LeaveByNonMemberChangesNothing) {
    auto a = connect("u1");
    connect("u2");
    join("u1", "s1");

    send("u2", room_msg("leave_consultation", "s1"));
    EXPECT_EQ(hub_.rooms().member_count("s1"), 1u);
    EXPECT_TRUE(a->in_room("s1"));
}

TEST_F(HubTest, ChatReachesEveryMemberIncludingSender) {
    auto a = connect("A");
    auto b = connect("B");
    auto c = connect("C");
    for (const char* u : {"A", "B", "C"}) join(u, "S1");

    send("A", chat("S1", "hello"));

    for (const auto& conn : {a, b, c}) {
        auto got = take_all(conn);
        ASSERT_EQ(got.size(), 1u) << conn->user_id();
        EXPECT_EQ(got[0].type(), "chat_message");
        EXPECT_EQ(got[0].session_id(), "S1");
        EXPECT_EQ(got[0].user_id(), "A");
        EXPECT_EQ(str(got[0].data().as_object().at("content")), "hello");
    }
}

TEST_F(HubTest, ChatFromNonMemberIsDropped) {
    auto a = connect("A");
    auto b = connect("B");
    join("B", "S1");

    send("A", chat("S1", "let me in"));

    EXPECT_TRUE(take_all(a).empty());
    EXPECT_TRUE(take_all(b).empty());
}

TEST_F(HubTest, ChatIsStampedByTheHub) {
    auto a = connect("A");
    join("A", "S1");

    hub_.dispatch(Envelope::parse(
        R"({"type":"chat_message","data":{"sessionId":"S1"},"timestamp":5,"id":"corr-1"})")
        .with_user("A"));
    drain();

    auto got = take_all(a);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_GT(got[0].timestamp(), 5);
    EXPECT_EQ(got[0].id(), "corr-1");
}

TEST_F(HubTest, TypingSkipsTheSender) {
    auto a = connect("A");
    auto b = connect("B");
    auto c = connect("C");
    for (const char* u : {"A", "B", "C"}) join(u, "S1");

    send("A", room_msg("typing_start", "S1"));

    EXPECT_TRUE(take_all(a).empty());
    for (const auto& conn : {b, c}) {
        auto got = take_all(conn);
        ASSERT_EQ(got.size(), 1u);
        EXPECT_EQ(got[0].type(), "typing_start");
        EXPECT_EQ(got[0].session_id(), "S1");
        EXPECT_EQ(str(got[0].data().as_object().at("userId")), "A");
    }

    send("B", room_msg("typing_stop", "S1"));
    EXPECT_EQ(take_all(a).size(), 1u);
    EXPECT_TRUE(take_all(b).empty());
    EXPECT_EQ(take_all(c).size(), 1u);
}

TEST_F(HubTest, PingGetsPongOnlyForSender) {
    auto a = connect("A");
    auto b = connect("B");
    join("A", "S1");
    join("B", "S1");

    send("A", R"({"type":"ping","data":null})");

    auto got = take_all(a);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].type(), "pong");
    EXPECT_TRUE(got[0].data().is_null());
    EXPECT_TRUE(take_all(b).empty());
}

TEST_F(HubTest, UnknownTypeIsIgnored) {
    auto a = connect("A");
    auto b = connect("B");
    join("A", "S1");
    join("B", "S1");

    send("A", R"({"type":"rename_room","data":{"sessionId":"S1"}})");
    send("A", R"({"type":"pong"})");

    EXPECT_TRUE(take_all(a).empty());
    EXPECT_TRUE(take_all(b).empty());
    EXPECT_TRUE(hub_.is_registered(a));
    EXPECT_EQ(hub_.rooms().member_count("S1"), 2u);
}

TEST_F(HubTest, SaturatedMemberIsEvictedOthersStillServed) {
    auto a = connect("A");
    auto slow = connect("B", 2);
    auto c = connect("C");
    join("A", "S1");
    join("B", "S1");
    join("B", "S2");
    join("C", "S1");

    send("A", chat("S1", "1"));
    send("A", chat("S1", "2"));
    EXPECT_TRUE(hub_.is_registered(slow));
    EXPECT_EQ(slow->queue().size(), 2u);

    send("A", chat("S1", "3"));

    EXPECT_FALSE(hub_.is_registered(slow));
    EXPECT_TRUE(slow->queue().closed());
    EXPECT_TRUE(slow->rooms().empty());
    EXPECT_FALSE(hub_.rooms().is_member(slow, "S1"));
    EXPECT_FALSE(hub_.rooms().contains("S2"));
    EXPECT_EQ(hub_.rooms().member_count("S1"), 2u);

    EXPECT_EQ(take_all(a).size(), 3u);
    EXPECT_EQ(take_all(c).size(), 3u);
    // Envelopes accepted before the eviction are still there to drain.
    EXPECT_EQ(take_all(slow).size(), 2u);
}

TEST_F(HubTest, RoomOrderIsTheSameForEveryMember) {
    auto a = connect("A");
    auto b = connect("B");
    join("A", "S1");
    join("B", "S1");

    for (int i = 0; i < 10; ++i) {
        hub_.dispatch(Envelope::parse(chat("S1", std::to_string(i))).with_user(i % 2 ? "A" : "B"));
    }
    drain();

    auto got_a = take_all(a);
    auto got_b = take_all(b);
    ASSERT_EQ(got_a.size(), 10u);
    ASSERT_EQ(got_b.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(str(got_a[i].data().as_object().at("content")), std::to_string(i));
        EXPECT_EQ(str(got_b[i].data().as_object().at("content")), std::to_string(i));
    }
}

TEST_F(HubTest, ChatInOneRoomStaysThere) {
    auto u1 = connect("u1");
    auto u2 = connect("u2");
    auto u3 = connect("u3");
    join("u1", "sess-42");
    join("u2", "sess-42");

    send("u1", R"({"type":"chat_message","data":{"sessionId":"sess-42","content":"hello"}})");

    auto got = take_all(u2);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].type(), "chat_message");
    EXPECT_EQ(got[0].session_id(), "sess-42");
    EXPECT_EQ(str(got[0].data().as_object().at("content")), "hello");

    EXPECT_EQ(take_all(u1).size(), 1u);
    EXPECT_TRUE(take_all(u3).empty());
}

TEST_F(HubTest, BroadcastToRoomStampsSessionAndTime) {
    auto a = connect("A");
    auto b = connect("B");
    join("A", "S1");

    hub_.broadcast_to_room("S1", Envelope("chat_message", json::object{{"content", "system"}}, 0));
    hub_.broadcast_to_room("nowhere", Envelope("chat_message", nullptr, 0));
    drain();

    auto got = take_all(a);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].session_id(), "S1");
    EXPECT_GT(got[0].timestamp(), 0);
    EXPECT_TRUE(take_all(b).empty());
    EXPECT_FALSE(hub_.rooms().contains("nowhere"));
}

TEST_F(HubTest, BroadcastToUserReachesAllItsConnections) {
    auto first = connect("A");
    auto second = connect("A");
    auto other = connect("B");

    hub_.broadcast_to_user("A", Envelope("chat_message", nullptr, 0));
    hub_.broadcast_to_user("ghost", Envelope("chat_message", nullptr, 0));
    drain();

    EXPECT_EQ(take_all(first).size(), 1u);
    EXPECT_EQ(take_all(second).size(), 1u);
    EXPECT_TRUE(take_all(other).empty());
}

TEST_F(HubTest, BroadcastToUserEvictsWhenFull) {
    auto a = connect("A", 1);
    auto b = connect("B");

    hub_.broadcast_to_user("A", Envelope("chat_message", nullptr, 0));
    hub_.broadcast_to_user("A", Envelope("chat_message", nullptr, 0));
    drain();

    EXPECT_FALSE(hub_.is_registered(a));
    EXPECT_TRUE(a->queue().closed());
    EXPECT_TRUE(hub_.is_registered(b));
}

TEST_F(HubTest, DirectJoinAndLeave) {
    auto a = connect("A");
    hub_.join_room("A", "S7");
    drain();
    EXPECT_TRUE(hub_.rooms().is_member(a, "S7"));

    hub_.leave_room("A", "S7");
    drain();
    EXPECT_FALSE(hub_.rooms().contains("S7"));

    hub_.join_room("nobody", "S7");
    drain();
    EXPECT_FALSE(hub_.rooms().contains("S7"));
}

TEST_F(HubTest, MostRecentConnectionActsForTheUser) {
    auto older = connect("A");
    auto newer = connect("A");

    join("A", "S1");
    EXPECT_TRUE(newer->in_room("S1"));
    EXPECT_FALSE(older->in_room("S1"));

    send("A", R"({"type":"ping"})");
    EXPECT_EQ(take_all(newer).size(), 1u);
    EXPECT_TRUE(take_all(older).empty());

    hub_.unregister_connection(newer);
    drain();
    EXPECT_FALSE(hub_.rooms().contains("S1"));

    join("A", "S1");
    EXPECT_TRUE(older->in_room("S1"));
}

TEST_F(HubTest, StatsReportRoomsAndParticipants) {
    connect("A");
    connect("B");
    connect("C");
    join("A", "S1");
    join("B", "S1");
    join("C", "S2");

    HubStats stats;
    hub_.async_stats([&](HubStats s) { stats = std::move(s); });
    drain();

    EXPECT_EQ(stats.connections, 3u);
    EXPECT_EQ(stats.rooms, 2u);
    EXPECT_EQ(stats.participants.at("S1"), 2u);
    EXPECT_EQ(stats.participants.at("S2"), 1u);
}

TEST_F(HubTest, StopEvictsEveryoneAndClosesIntake) {
    auto a = connect("A");
    auto b = connect("B");
    join("A", "S1");
    join("B", "S1");

    hub_.stop();
    drain();

    EXPECT_FALSE(hub_.running());
    EXPECT_EQ(hub_.connection_count(), 0u);
    EXPECT_EQ(hub_.rooms().room_count(), 0u);
    EXPECT_TRUE(a->queue().closed());
    EXPECT_TRUE(b->queue().closed());

    auto late = std::make_shared<Connection>("conn-late", "C", 8);
    hub_.register_connection(late);
    drain();
    EXPECT_FALSE(hub_.is_registered(late));
    EXPECT_TRUE(late->queue().closed());

    hub_.start();
    drain();
    EXPECT_TRUE(hub_.running());
    connect("D");
    EXPECT_EQ(hub_.connection_count(), 1u);
}

TEST(HubConcurrencyTest, ConcurrentIntakeKeepsTablesConsistent) {
    boost::asio::io_context ioc;
    Hub hub(ioc);
    auto work = boost::asio::make_work_guard(ioc);

    std::vector<std::thread> io;
    for (int i = 0; i < 4; ++i) io.emplace_back([&ioc] { ioc.run(); });

    hub.start();

    constexpr int kClients = 32;
    std::vector<ConnectionPtr> conns(kClients);
    std::vector<std::thread> clients;
    for (int i = 0; i < kClients; ++i) {
        clients.emplace_back([&, i] {
            const std::string user = "u" + std::to_string(i);
            conns[i] = std::make_shared<Connection>("conn-" + std::to_string(i), user, 1024);
            hub.register_connection(conns[i]);
            hub.dispatch(Envelope::parse(room_msg("join_consultation", "room")).with_user(user));
            for (int k = 0; k < 5; ++k) {
                hub.dispatch(Envelope::parse(chat("room", user)).with_user(user));
            }
            if (i % 2) hub.unregister_connection(conns[i]);
        });
    }
    for (auto& t : clients) t.join();

    std::promise<HubStats> done;
    hub.async_stats([&done](HubStats s) { done.set_value(std::move(s)); });
    HubStats stats = done.get_future().get();

    work.reset();
    ioc.stop();
    for (auto& t : io) t.join();

    EXPECT_EQ(stats.connections, static_cast<std::size_t>(kClients / 2));
    EXPECT_EQ(stats.rooms, 1u);
    EXPECT_EQ(stats.participants["room"], static_cast<std::size_t>(kClients / 2));

    for (int i = 0; i < kClients; ++i) {
        if (i % 2) {
            EXPECT_TRUE(conns[i]->queue().closed()) << i;
            EXPECT_TRUE(conns[i]->rooms().empty()) << i;
        } else {
            EXPECT_FALSE(conns[i]->queue().closed()) << i;
            EXPECT_TRUE(conns[i]->in_room("room")) << i;
        }
    }
}
