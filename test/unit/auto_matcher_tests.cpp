// Copyright (c) 2024 Discofill
// Distributed under the MIT software license

#include "../transfer_test_helpers.hpp"
#include "transfer/auto_matcher.hpp"
#include "transfer/session_router.hpp"
#include "transfer/transfer_registry.hpp"
#include "util/threadpool.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>

using namespace discofill;
using namespace discofill::transfer;
using discofill::test::EventLog;
using discofill::test::RunIo;
using discofill::test::ScriptedDestination;

namespace {

struct MatcherFixture {
    boost::asio::io_context io;
    TransferRegistry registry;
    SessionRouter router;
    util::ThreadPool pool{"analysis-test", 1};
    EventLog log;
    SessionRouter::Subscription sub = router.Subscribe(1, log.callback());

    static AutoMatcher::Config FastMatch(int max_attempts = 5) {
        AutoMatcher::Config config;
        config.max_attempts = max_attempts;
        config.base_delay = std::chrono::milliseconds(1);
        config.max_delay = std::chrono::milliseconds(4);
        return config;
    }

    TransferId CompletedTransfer(DestinationPtr destination) {
        Transfer t;
        t.session_id = 1;
        t.peer = "peer";
        t.remote_path = "Album/01.flac";
        t.destination = std::move(destination);
        const TransferId id = registry.Add(t);
        registry.Transition(id, TransferState::InProgress);
        registry.Transition(id, TransferState::Completed,
                            [](Transfer &tr) { tr.local_path = "downloads/01.flac"; });
        return id;
    }
};

} // namespace

TEST_CASE("BackoffDelay doubles and caps", "[transfer][match]") {
    AutoMatcher::Config config;
    config.base_delay = std::chrono::milliseconds(1000);
    config.max_delay = std::chrono::milliseconds(30000);

    CHECK(AutoMatcher::BackoffDelay(config, 1).count() == 1000);
    CHECK(AutoMatcher::BackoffDelay(config, 2).count() == 2000);
    CHECK(AutoMatcher::BackoffDelay(config, 3).count() == 4000);
    CHECK(AutoMatcher::BackoffDelay(config, 5).count() == 16000);
    CHECK(AutoMatcher::BackoffDelay(config, 6).count() == 30000);
    CHECK(AutoMatcher::BackoffDelay(config, 50).count() == 30000);
}

TEST_CASE("AutoMatcher: retryable twice then success", "[transfer][match]") {
    MatcherFixture f;
    AutoMatcher matcher(f.io, f.registry, f.router, &f.pool, MatcherFixture::FastMatch());

    auto dest = std::make_shared<ScriptedDestination>(std::vector<AttachResult>{
        AttachResult::Retryable, AttachResult::Retryable, AttachResult::Success});
    const TransferId id = f.CompletedTransfer(dest);

    matcher.Start(id);
    // First attempt is immediate, the rest wait for timers
    CHECK(dest->calls() == 1);
    CHECK(matcher.PendingRetries() == 1);
    RunIo(f.io);

    CHECK(dest->calls() == 3);
    auto t = f.registry.Get(id);
    CHECK(t->match_status == MatchStatus::Success);
    CHECK(t->match_attempts == 3);
    CHECK(t->state == TransferState::Completed);
    CHECK(matcher.PendingRetries() == 0);
    CHECK(dest->paths().front() == "downloads/01.flac");
    CHECK(f.log.count(SessionEventType::MatchUpdate) >= 2);
}

TEST_CASE("AutoMatcher: always retryable exhausts max attempts", "[transfer][match]") {
    MatcherFixture f;
    AutoMatcher matcher(f.io, f.registry, f.router, &f.pool, MatcherFixture::FastMatch(4));

    auto dest = std::make_shared<ScriptedDestination>(std::vector<AttachResult>{},
                                                      AttachResult::Retryable);
    const TransferId id = f.CompletedTransfer(dest);

    matcher.Start(id);
    RunIo(f.io);

    CHECK(dest->calls() == 4);
    auto t = f.registry.Get(id);
    CHECK(t->match_status == MatchStatus::Failed);
    CHECK(t->state == TransferState::Completed);
}

TEST_CASE("AutoMatcher: fatal gives up at once", "[transfer][match]") {
    MatcherFixture f;
    AutoMatcher matcher(f.io, f.registry, f.router, &f.pool, MatcherFixture::FastMatch());

    auto dest = std::make_shared<ScriptedDestination>(std::vector<AttachResult>{AttachResult::Fatal});
    const TransferId id = f.CompletedTransfer(dest);

    matcher.Start(id);
    CHECK(matcher.PendingRetries() == 0);
    RunIo(f.io);

    CHECK(dest->calls() == 1);
    CHECK(f.registry.Get(id)->match_status == MatchStatus::Failed);
    CHECK(f.registry.Get(id)->state == TransferState::Completed);
}

TEST_CASE("AutoMatcher: throwing destination counts as fatal", "[transfer][match]") {
    class ThrowingDestination : public Destination {
    public:
        AttachResult AttachFile(const std::string &) override {
            ++calls;
            throw std::runtime_error("library gone");
        }
        void TriggerAnalysis(const std::string &) override {}
        int calls{0};
    };

    MatcherFixture f;
    AutoMatcher matcher(f.io, f.registry, f.router, &f.pool, MatcherFixture::FastMatch());
    auto dest = std::make_shared<ThrowingDestination>();
    const TransferId id = f.CompletedTransfer(dest);

    REQUIRE_NOTHROW(matcher.Start(id));
    CHECK(dest->calls == 1);
    CHECK(f.registry.Get(id)->match_status == MatchStatus::Failed);
}

TEST_CASE("AutoMatcher: analysis only when enabled", "[transfer][match]") {
    MatcherFixture f;
    auto config = MatcherFixture::FastMatch();

    SECTION("Disabled") {
        AutoMatcher matcher(f.io, f.registry, f.router, &f.pool, config);
        auto dest = std::make_shared<ScriptedDestination>();
        matcher.Start(f.CompletedTransfer(dest));
        f.pool.shutdown();
        CHECK(dest->analysis_calls() == 0);
    }

    SECTION("Enabled") {
        config.analysis_enabled = true;
        AutoMatcher matcher(f.io, f.registry, f.router, &f.pool, config);
        auto dest = std::make_shared<ScriptedDestination>();
        matcher.Start(f.CompletedTransfer(dest));
        f.pool.shutdown(); // drains queued tasks
        CHECK(dest->analysis_calls() == 1);
    }
}

TEST_CASE("AutoMatcher: ignores transfers that are not completed", "[transfer][match]") {
    MatcherFixture f;
    AutoMatcher matcher(f.io, f.registry, f.router, &f.pool, MatcherFixture::FastMatch());
    auto dest = std::make_shared<ScriptedDestination>();

    Transfer t;
    t.session_id = 1;
    t.destination = dest;
    const TransferId id = f.registry.Add(t);

    matcher.Start(id);
    CHECK(dest->calls() == 0);
    CHECK(f.registry.Get(id)->match_status == MatchStatus::NotAttempted);
}

TEST_CASE("AutoMatcher: CancelAll fails pending matches", "[transfer][match]") {
    MatcherFixture f;
    AutoMatcher::Config config = MatcherFixture::FastMatch();
    config.base_delay = std::chrono::milliseconds(60000);
    config.max_delay = std::chrono::milliseconds(60000);
    AutoMatcher matcher(f.io, f.registry, f.router, &f.pool, config);

    auto dest = std::make_shared<ScriptedDestination>(std::vector<AttachResult>{},
                                                      AttachResult::Retryable);
    const TransferId id = f.CompletedTransfer(dest);
    matcher.Start(id);
    REQUIRE(matcher.PendingRetries() == 1);

    matcher.CancelAll();
    RunIo(f.io); // aborted timer handlers only

    CHECK(matcher.PendingRetries() == 0);
    CHECK(dest->calls() == 1);
    CHECK(f.registry.Get(id)->match_status == MatchStatus::Failed);
}
