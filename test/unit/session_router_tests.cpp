// Copyright (c) 2024 Discofill
// Distributed under the MIT software license

#include "../transfer_test_helpers.hpp"
#include "transfer/session_router.hpp"
#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace discofill;
using namespace discofill::transfer;
using discofill::test::EventLog;

namespace {

SessionEvent ResultEvent(const std::string &path) {
    SessionEvent event;
    event.type = SessionEventType::SearchResult;
    SearchResult result;
    result.file_path = path;
    event.result = result;
    return event;
}

} // namespace

TEST_CASE("SessionRouter: delivery is per session", "[transfer][router]") {
    SessionRouter router;
    EventLog log1, log2;
    auto sub1 = router.Subscribe(1, log1.callback());
    auto sub2 = router.Subscribe(2, log2.callback());

    router.Publish(1, ResultEvent("a.mp3"));
    router.Publish(2, ResultEvent("b.mp3"));
    router.Publish(3, ResultEvent("nobody.mp3"));

    auto events1 = log1.events();
    auto events2 = log2.events();
    REQUIRE(events1.size() == 1);
    REQUIRE(events2.size() == 1);
    CHECK(events1[0].session_id == 1);
    CHECK(events1[0].result->file_path == "a.mp3");
    CHECK(events2[0].session_id == 2);
    CHECK(events2[0].result->file_path == "b.mp3");
}

TEST_CASE("SessionRouter: multiple subscribers of one session", "[transfer][router]") {
    SessionRouter router;
    EventLog a, b;
    auto sub_a = router.Subscribe(5, a.callback());
    auto sub_b = router.Subscribe(5, b.callback());
    CHECK(router.SubscriberCount(5) == 2);

    router.PublishStatus(5, "Searching for: x...");
    CHECK(a.count(SessionEventType::Status) == 1);
    CHECK(b.count(SessionEventType::Status) == 1);
}

TEST_CASE("SessionRouter: unsubscribe", "[transfer][router]") {
    SessionRouter router;
    EventLog log;

    SECTION("Explicit and idempotent") {
        auto sub = router.Subscribe(1, log.callback());
        REQUIRE(sub.active());
        sub.Unsubscribe();
        sub.Unsubscribe();
        CHECK_FALSE(sub.active());
        router.PublishStatus(1, "after");
        CHECK(log.events().empty());
        CHECK(router.SubscriberCount(1) == 0);
    }

    SECTION("On destruction") {
        {
            auto sub = router.Subscribe(1, log.callback());
            CHECK(router.SubscriberCount(1) == 1);
        }
        router.PublishStatus(1, "after");
        CHECK(log.events().empty());
    }

    SECTION("Moved handle keeps the subscription") {
        SessionRouter::Subscription outer;
        {
            auto sub = router.Subscribe(1, log.callback());
            outer = std::move(sub);
        }
        router.PublishStatus(1, "still here");
        CHECK(log.count(SessionEventType::Status) == 1);
    }

    SECTION("Callback may unsubscribe itself") {
        SessionRouter::Subscription self;
        int calls = 0;
        self = router.Subscribe(1, [&](const SessionEvent &) {
            ++calls;
            self.Unsubscribe();
        });
        router.PublishStatus(1, "one");
        router.PublishStatus(1, "two");
        CHECK(calls == 1);
    }
}

TEST_CASE("SessionRouter: handle outlives router", "[transfer][router]") {
    SessionRouter::Subscription sub;
    {
        SessionRouter router;
        sub = router.Subscribe(1, [](const SessionEvent &) {});
    }
    sub.Unsubscribe();
    CHECK_FALSE(sub.active());
}

TEST_CASE("SessionRouter: queue subscribers see transfer updates only", "[transfer][router]") {
    SessionRouter router;
    EventLog queue;
    auto sub = router.SubscribeQueue(queue.callback());

    Transfer t;
    t.id = 3;
    t.session_id = 9;
    router.PublishTransfer(SessionEventType::TransferUpdate, t);
    router.PublishTransfer(SessionEventType::MatchUpdate, t);
    router.PublishStatus(9, "status");
    router.Publish(9, ResultEvent("x.flac"));

    auto events = queue.events();
    REQUIRE(events.size() == 1);
    CHECK(events[0].type == SessionEventType::TransferUpdate);
    CHECK(events[0].session_id == 9);
    CHECK(events[0].transfer->id == 3);
}

TEST_CASE("SessionRouter: throwing callback does not stop delivery", "[transfer][router]") {
    SessionRouter router;
    EventLog log;
    auto bad = router.Subscribe(1, [](const SessionEvent &) {
        throw std::runtime_error("subscriber bug");
    });
    auto good = router.Subscribe(1, log.callback());

    REQUIRE_NOTHROW(router.PublishStatus(1, "hello"));
    CHECK(log.count(SessionEventType::Status) == 1);
}

TEST_CASE("SessionRouter: concurrent publishers stay isolated", "[transfer][router]") {
    SessionRouter router;
    constexpr int kSessions = 4;
    constexpr int kEvents = 250;

    std::vector<std::unique_ptr<EventLog>> logs;
    std::vector<SessionRouter::Subscription> subs;
    for (int s = 1; s <= kSessions; ++s) {
        logs.push_back(std::make_unique<EventLog>());
        subs.push_back(router.Subscribe(s, logs.back()->callback()));
    }

    std::vector<std::thread> threads;
    for (int s = 1; s <= kSessions; ++s) {
        threads.emplace_back([&router, s]() {
            for (int i = 0; i < kEvents; ++i) {
                router.Publish(s, ResultEvent("s" + std::to_string(s)));
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    for (int s = 1; s <= kSessions; ++s) {
        auto events = logs[s - 1]->events();
        REQUIRE(events.size() == static_cast<size_t>(kEvents));
        for (const auto &e : events) {
            REQUIRE(e.session_id == static_cast<SessionId>(s));
            REQUIRE(e.result->file_path == "s" + std::to_string(s));
        }
    }
}
