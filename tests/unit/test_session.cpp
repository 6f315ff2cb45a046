#include <gtest/gtest.h>
#include "mcplink/session.hpp"
#include "mcplink/error.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace mcplink;

namespace {

JsonRpcResponse response_for(int64_t id, const nlohmann::json& result) {
    return make_result(RequestId{id}, result);
}

} // namespace

TEST(Session, InitialState) {
    Session s;
    EXPECT_EQ(s.state(), SessionState::Uninitialized);
    EXPECT_EQ(s.pending_count(), 0u);
}

TEST(Session, StateTransitions) {
    Session s;
    s.set_state(SessionState::Initializing);
    EXPECT_EQ(s.state(), SessionState::Initializing);
    s.set_state(SessionState::Ready);
    EXPECT_EQ(s.state(), SessionState::Ready);
    s.set_state(SessionState::Closed);
    EXPECT_EQ(s.state(), SessionState::Closed);
}

TEST(Session, TransitionIsCompareAndSet) {
    Session s;
    EXPECT_TRUE(s.transition(SessionState::Uninitialized, SessionState::Initializing));
    EXPECT_FALSE(s.transition(SessionState::Uninitialized, SessionState::Initializing));
    EXPECT_EQ(s.state(), SessionState::Initializing);
    EXPECT_TRUE(s.transition(SessionState::Initializing, SessionState::Ready));

    s.fail_all("closed");
    EXPECT_FALSE(s.transition(SessionState::Ready, SessionState::Uninitialized));
    EXPECT_EQ(s.state(), SessionState::Closed);
}

TEST(Session, ConcurrentTransitionHasOneWinner) {
    Session s;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (s.transition(SessionState::Uninitialized, SessionState::Initializing)) ++winners;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(winners.load(), 1);
}

TEST(Session, ClosedIsFinal) {
    Session s;
    s.fail_all("gone");
    s.set_state(SessionState::Ready);
    EXPECT_EQ(s.state(), SessionState::Closed);
}

TEST(Session, IdsIncreaseAndAreNeverReused) {
    Session s;
    auto r1 = s.register_request("ping");
    auto r2 = s.register_request("ping");
    EXPECT_LT(r1.id, r2.id);

    EXPECT_TRUE(s.complete_request(RequestId{r1.id}, response_for(r1.id, {})));
    auto r3 = s.register_request("ping");
    EXPECT_LT(r2.id, r3.id);
    EXPECT_NE(r3.id, r1.id);
}

TEST(Session, RegisterAndCompleteRequest) {
    Session s;
    auto reg = s.register_request("tools/list");
    EXPECT_TRUE(s.has_pending_request(reg.id));

    EXPECT_TRUE(s.complete_request(RequestId{reg.id}, response_for(reg.id, {{"tools", {}}})));
    EXPECT_FALSE(s.has_pending_request(reg.id));

    auto resp = reg.response.get();
    EXPECT_EQ(std::get<int64_t>(resp.id), reg.id);
    EXPECT_TRUE(resp.result->parse().contains("tools"));
}

TEST(Session, CompleteUnknownRequest) {
    Session s;
    EXPECT_FALSE(s.complete_request(RequestId{int64_t{999}}, response_for(999, {})));
    EXPECT_FALSE(s.complete_request(RequestId{std::string("1")}, response_for(1, {})));
    EXPECT_FALSE(s.complete_request(RequestId{nullptr}, response_for(1, {})));
}

TEST(Session, SecondResponseIsDropped) {
    Session s;
    auto reg = s.register_request("ping");
    EXPECT_TRUE(s.complete_request(RequestId{reg.id}, response_for(reg.id, 1)));
    EXPECT_FALSE(s.complete_request(RequestId{reg.id}, response_for(reg.id, 2)));
    EXPECT_EQ(reg.response.get().result->text(), "1");
}

TEST(Session, CancelFreesSlotAndDropsLateResponse) {
    Session s;
    auto reg = s.register_request("ping");
    EXPECT_TRUE(s.cancel_request(reg.id, std::make_exception_ptr(CancelledError("cancelled"))));
    EXPECT_FALSE(s.has_pending_request(reg.id));
    EXPECT_THROW(reg.response.get(), CancelledError);

    EXPECT_FALSE(s.complete_request(RequestId{reg.id}, response_for(reg.id, {})));
    EXPECT_FALSE(s.cancel_request(reg.id, std::make_exception_ptr(CancelledError("again"))));
}

TEST(Session, FailAllFailsEveryWaiter) {
    Session s;
    auto r1 = s.register_request("a");
    auto r2 = s.register_request("b");
    s.fail_all("stream closed");

    EXPECT_EQ(s.pending_count(), 0u);
    EXPECT_EQ(s.state(), SessionState::Closed);
    EXPECT_THROW(r1.response.get(), ConnectionClosedError);
    EXPECT_THROW(r2.response.get(), ConnectionClosedError);
}

TEST(Session, RegisterAfterCloseThrows) {
    Session s;
    s.fail_all("stream closed");
    EXPECT_THROW((void)s.register_request("ping"), ConnectionClosedError);
}

TEST(Session, ConcurrentCompletionAndCancellationDeliverOnce) {
    Session s;
    constexpr int kRequests = 200;
    std::vector<Session::Registration> regs;
    for (int i = 0; i < kRequests; ++i) regs.push_back(s.register_request("ping"));

    std::thread completer([&] {
        for (auto& r : regs) s.complete_request(RequestId{r.id}, response_for(r.id, r.id));
    });
    std::thread canceller([&] {
        for (auto& r : regs) {
            s.cancel_request(r.id, std::make_exception_ptr(CancelledError("cancelled")));
        }
    });
    completer.join();
    canceller.join();

    EXPECT_EQ(s.pending_count(), 0u);
    for (auto& r : regs) {
        try {
            auto resp = r.response.get();
            EXPECT_EQ(resp.result->parse().get<int64_t>(), r.id);
        } catch (const CancelledError&) {
            // lost the race to the canceller
        }
    }
}
