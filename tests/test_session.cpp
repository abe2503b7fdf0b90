// ============================================================
// test_session.cpp -- Session state machine and acceptance gate
// ============================================================

#include "../common/session.hpp"
#include "../receiver/acceptance_gate.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

// ---------------------------------------------------------------
// TransferSession
// ---------------------------------------------------------------

TEST(SessionTest, IdsAreUniqueAndIncreasing) {
    TransferSession a(Direction::SEND, "10.0.0.1:12345");
    TransferSession b(Direction::RECEIVE, "10.0.0.2:40000");
    EXPECT_GT(b.id(), a.id());
    EXPECT_EQ(a.state(), SessionState::NEGOTIATING);
}

TEST(SessionTest, HappyPathReachesCompleted) {
    TransferSession s(Direction::SEND, "peer");
    EXPECT_TRUE(s.advance(SessionState::READY));
    EXPECT_TRUE(s.advance(SessionState::TRANSFERRING));
    EXPECT_TRUE(s.advance(SessionState::FINALIZING));
    EXPECT_EQ(s.conclude(), SessionState::COMPLETED);
    EXPECT_TRUE(is_terminal(s.state()));
    EXPECT_FALSE(s.failure().is_set());
}

TEST(SessionTest, RefusesBackwardAndSkippingEdges) {
    TransferSession s(Direction::SEND, "peer");
    EXPECT_FALSE(s.advance(SessionState::TRANSFERRING));
    EXPECT_FALSE(s.advance(SessionState::COMPLETED));
    ASSERT_TRUE(s.advance(SessionState::READY));
    ASSERT_TRUE(s.advance(SessionState::TRANSFERRING));
    EXPECT_FALSE(s.advance(SessionState::READY));
    EXPECT_FALSE(s.advance(SessionState::NEGOTIATING));
    EXPECT_FALSE(s.advance(SessionState::REJECTED));
    EXPECT_EQ(s.state(), SessionState::TRANSFERRING);
}

TEST(SessionTest, TerminalStatesHaveNoExits) {
    const SessionState all[] = {
        SessionState::NEGOTIATING, SessionState::READY, SessionState::TRANSFERRING,
        SessionState::FINALIZING, SessionState::COMPLETED, SessionState::FAILED,
        SessionState::REJECTED, SessionState::CANCELLED,
    };
    for (SessionState from : all) {
        if (!is_terminal(from)) continue;
        for (SessionState to : all) EXPECT_FALSE(transition_allowed(from, to));
    }
    EXPECT_TRUE(transition_allowed(SessionState::NEGOTIATING, SessionState::REJECTED));
    EXPECT_FALSE(transition_allowed(SessionState::READY, SessionState::REJECTED));
}

TEST(SessionTest, FirstFailureWinsAndRaisesCancelFlag) {
    TransferSession s(Direction::RECEIVE, "peer");
    s.advance(SessionState::READY);
    s.advance(SessionState::TRANSFERRING);
    EXPECT_FALSE(s.cancel_requested());

    EXPECT_TRUE(s.fail(ErrorCode::IDLE_TIMEOUT, "worker 2: stalled", 0, 4096));
    EXPECT_TRUE(s.cancel_requested());
    EXPECT_FALSE(s.fail(ErrorCode::CONNECTION_LOST, "worker 3: reset"));
    s.request_cancel();

    FailureInfo f = s.failure();
    EXPECT_EQ(f.code, ErrorCode::IDLE_TIMEOUT);
    EXPECT_EQ(f.reason, "worker 2: stalled");
    EXPECT_EQ(f.offset, 4096u);
    EXPECT_EQ(s.conclude(), SessionState::FAILED);
}

TEST(SessionTest, CancelConcludesCancelled) {
    TransferSession s(Direction::SEND, "peer");
    s.advance(SessionState::READY);
    s.request_cancel();
    EXPECT_EQ(s.conclude(), SessionState::CANCELLED);
    EXPECT_EQ(s.failure().code, ErrorCode::CANCELLED);
}

TEST(SessionTest, RejectionBeforeReadyConcludesRejected) {
    TransferSession s(Direction::SEND, "peer");
    s.fail(ErrorCode::DECISION_TIMEOUT, "no answer");
    EXPECT_EQ(s.conclude(), SessionState::REJECTED);
    EXPECT_EQ(s.failure().code, ErrorCode::DECISION_TIMEOUT);
}

TEST(SessionTest, EndingEarlyWithoutFailureIsAProtocolViolation) {
    TransferSession s(Direction::SEND, "peer");
    s.advance(SessionState::READY);
    EXPECT_EQ(s.conclude(), SessionState::FAILED);
    EXPECT_EQ(s.failure().code, ErrorCode::PROTOCOL_VIOLATION);
}

TEST(SessionTest, FailAfterTerminalIsIgnored) {
    TransferSession s(Direction::SEND, "peer");
    s.request_cancel();
    s.conclude();
    EXPECT_FALSE(s.fail(ErrorCode::FILE_IO, "late"));
    EXPECT_EQ(s.conclude(), SessionState::CANCELLED);
}

TEST(SessionTest, WaitTerminalWakesOnConclude) {
    TransferSession s(Direction::SEND, "peer");
    EXPECT_FALSE(s.wait_terminal(20));
    std::thread t([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        s.request_cancel();
        s.conclude();
    });
    EXPECT_TRUE(s.wait_terminal(5000));
    t.join();
}

// ---------------------------------------------------------------
// AcceptanceGate
// ---------------------------------------------------------------

static IncomingRequest request_from(const std::string& name) {
    IncomingRequest r;
    r.peer_addr   = "192.168.1.9:51000";
    r.sender_name = name;
    r.total_bytes = 1234;
    return r;
}

TEST(AcceptanceGateTest, AutoPoliciesDecideImmediately) {
    AcceptanceGate gate(60000);
    IncomingRequest r = request_from("a");

    gate.set_policy(AcceptPolicy::AUTO_ACCEPT);
    EXPECT_EQ(gate.submit(r), Decision::ACCEPT);
    EXPECT_NE(r.request_id, 0u);

    gate.set_policy(AcceptPolicy::AUTO_REJECT);
    u64 first = r.request_id;
    EXPECT_EQ(gate.submit(r), Decision::REJECT);
    EXPECT_GT(r.request_id, first);
}

TEST(AcceptanceGateTest, ConsumerDecisionResolvesExactlyOnce) {
    AcceptanceGate gate(10000);
    std::atomic<u64> seen{0};
    gate.set_listener([&](const IncomingRequest& r) { seen = r.request_id; });

    IncomingRequest r = request_from("b");
    Decision result = Decision::TIMEOUT;
    std::thread handler([&]() { result = gate.submit(r); });

    ASSERT_TRUE(testutil::eventually([&] { return seen.load() != 0; }, 2000));
    ASSERT_EQ(gate.pending().size(), 1u);
    EXPECT_EQ(gate.pending()[0].sender_name, "b");

    EXPECT_TRUE(gate.decide(seen, Decision::ACCEPT));
    EXPECT_FALSE(gate.decide(seen, Decision::REJECT));
    handler.join();

    EXPECT_EQ(result, Decision::ACCEPT);
    EXPECT_TRUE(gate.pending().empty());
}

TEST(AcceptanceGateTest, TimesOutAndRefusesLateDecision) {
    AcceptanceGate gate(100);
    std::atomic<u64> seen{0};
    gate.set_listener([&](const IncomingRequest& r) { seen = r.request_id; });

    IncomingRequest r = request_from("c");
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_EQ(gate.submit(r), Decision::TIMEOUT);
    auto waited = std::chrono::steady_clock::now() - t0;
    EXPECT_GE(waited, std::chrono::milliseconds(90));

    EXPECT_FALSE(gate.decide(seen, Decision::ACCEPT));
    EXPECT_FALSE(gate.decide(987654, Decision::ACCEPT));
}

TEST(AcceptanceGateTest, TimeoutIsNotAConsumerDecision) {
    AcceptanceGate gate(10000);
    std::atomic<u64> seen{0};
    gate.set_listener([&](const IncomingRequest& r) { seen = r.request_id; });

    IncomingRequest r = request_from("d");
    Decision result = Decision::ACCEPT;
    std::thread handler([&]() { result = gate.submit(r); });
    ASSERT_TRUE(testutil::eventually([&] { return seen.load() != 0; }, 2000));

    EXPECT_FALSE(gate.decide(seen, Decision::TIMEOUT));
    EXPECT_TRUE(gate.decide(seen, Decision::REJECT));
    handler.join();
    EXPECT_EQ(result, Decision::REJECT);
}

TEST(AcceptanceGateTest, ShutdownRejectsPendingAndLaterRequests) {
    AcceptanceGate gate(10000);
    std::atomic<int> waiting{0};
    gate.set_listener([&](const IncomingRequest&) { ++waiting; });

    std::vector<Decision> results(3, Decision::ACCEPT);
    std::vector<std::thread> handlers;
    for (int i = 0; i < 3; ++i) {
        handlers.emplace_back([&, i]() {
            IncomingRequest r = request_from("e" + std::to_string(i));
            results[i] = gate.submit(r);
        });
    }
    ASSERT_TRUE(testutil::eventually([&] { return waiting.load() == 3; }, 2000));

    gate.shutdown();
    for (auto& t : handlers) t.join();
    for (Decision d : results) EXPECT_EQ(d, Decision::REJECT);

    IncomingRequest late = request_from("f");
    EXPECT_EQ(gate.submit(late), Decision::REJECT);

    gate.reopen();
    gate.set_policy(AcceptPolicy::AUTO_ACCEPT);
    EXPECT_EQ(gate.submit(late), Decision::ACCEPT);
}
