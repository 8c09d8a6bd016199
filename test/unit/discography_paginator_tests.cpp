// Copyright (c) 2024 Discofill
// Distributed under the MIT software license

#include "../catalog_test_helpers.hpp"
#include "catalog/discography_paginator.hpp"
#include "util/time.hpp"
#include <catch2/catch_test_macros.hpp>
#include <set>

using namespace discofill;
using namespace discofill::catalog;
using discofill::test::FakeCatalog;

namespace {

DiscographyPaginator::Options TestOptions(uint32_t limit) {
    DiscographyPaginator::Options options;
    options.limit = limit;
    options.min_request_interval = std::chrono::milliseconds(0);
    options.base_backoff = std::chrono::milliseconds(10);
    options.max_backoff = std::chrono::milliseconds(40);
    return options;
}

// Records sleeps instead of sleeping, advancing mock time
struct RecordingSleeper {
    std::vector<std::chrono::milliseconds> sleeps;

    RateLimiter::Sleeper callback() {
        return [this](std::chrono::milliseconds d) {
            sleeps.push_back(d);
            util::SetMockTime(util::GetMockTime() + d.count());
        };
    }

    int64_t total() const {
        int64_t sum = 0;
        for (auto d : sleeps) {
            sum += d.count();
        }
        return sum;
    }
};

void AddGroups(FakeCatalog &fake, const std::string &artist, int count) {
    for (int i = 1; i <= count; ++i) {
        fake.AddReleaseGroup(artist, "rg-" + std::to_string(i), "Album " + std::to_string(i));
    }
}

bool Unique(const DiscographyResult &result) {
    std::set<std::string> ids;
    for (const auto &n : result.nodes) {
        if (!ids.insert(n.id).second) {
            return false;
        }
    }
    return true;
}

} // namespace

TEST_CASE("Paginator: three full pages and a partial one", "[catalog][paginator]") {
    FakeCatalog fake;
    AddGroups(fake, "artist", 7);
    auto options = TestOptions(2);
    options.include_releases = false;

    SECTION("Without a total count") {
        DiscographyPaginator paginator(fake, options);
        auto result = paginator.FetchAll("artist");

        CHECK(result.nodes.size() == 7);
        CHECK(Unique(result));
        CHECK(result.release_group_requests == 4);
        CHECK(result.release_requests == 0);
        CHECK(fake.calls("rg:artist") == 4);
        CHECK(fake.offsets("rg:artist") == std::vector<uint32_t>{0, 2, 4, 6});
        CHECK_FALSE(result.truncated);
        CHECK(result.errors.empty());
    }

    SECTION("With a total count") {
        fake.set_report_total(true);
        DiscographyPaginator paginator(fake, options);
        auto result = paginator.FetchAll("artist");

        CHECK(result.nodes.size() == 7);
        CHECK(result.release_group_requests == 4);
    }
}

TEST_CASE("Paginator: total count ends an exact multiple early", "[catalog][paginator]") {
    FakeCatalog fake;
    AddGroups(fake, "artist", 4);
    auto options = TestOptions(2);
    options.include_releases = false;

    SECTION("Total known: no empty trailing page") {
        fake.set_report_total(true);
        DiscographyPaginator paginator(fake, options);
        CHECK(paginator.FetchAll("artist").release_group_requests == 2);
    }

    SECTION("Total unknown: one empty page confirms the end") {
        DiscographyPaginator paginator(fake, options);
        auto result = paginator.FetchAll("artist");
        CHECK(result.release_group_requests == 3);
        CHECK(result.nodes.size() == 4);
    }
}

TEST_CASE("Paginator: skipped entries still advance the offset", "[catalog][paginator]") {
    FakeCatalog fake;
    fake.AddReleaseGroup("artist", "rg-1", "Album 1");
    fake.AddReleaseGroup("artist", "", "entry without an id");
    fake.AddReleaseGroup("artist", "rg-3", "Album 3");
    fake.AddReleaseGroup("artist", "rg-4", "Album 4");
    fake.AddReleaseGroup("artist", "rg-5", "Album 5");
    auto options = TestOptions(3);
    options.include_releases = false;

    DiscographyPaginator paginator(fake, options);
    auto result = paginator.FetchAll("artist");

    CHECK(fake.offsets("rg:artist") == std::vector<uint32_t>{0, 3});
    CHECK(result.nodes.size() == 4);
    CHECK(result.nodes.back().id == "rg-5");
    CHECK_FALSE(result.truncated);
}

TEST_CASE("Paginator: repeated items across pages are dropped", "[catalog][paginator]") {
    FakeCatalog fake;
    // The listing shifted between requests: rg-2 shows up twice
    fake.AddReleaseGroup("artist", "rg-1", "One");
    fake.AddReleaseGroup("artist", "rg-2", "Two");
    fake.AddReleaseGroup("artist", "rg-2", "Two");
    fake.AddReleaseGroup("artist", "rg-3", "Three");
    auto options = TestOptions(2);
    options.include_releases = false;

    DiscographyPaginator paginator(fake, options);
    auto result = paginator.FetchAll("artist");

    REQUIRE(result.nodes.size() == 3);
    CHECK(Unique(result));
    CHECK(result.nodes[0].id == "rg-1");
    CHECK(result.nodes[1].id == "rg-2");
    CHECK(result.nodes[2].id == "rg-3");
}

TEST_CASE("Paginator: releases of every group", "[catalog][paginator]") {
    FakeCatalog fake;
    fake.set_report_total(true);
    AddGroups(fake, "artist", 2);
    for (const char *group : {"rg-1", "rg-2"}) {
        for (int i = 1; i <= 3; ++i) {
            fake.AddRelease(group, std::string(group) + "-r" + std::to_string(i), "Edition");
        }
    }

    SECTION("All releases, paged") {
        DiscographyPaginator paginator(fake, TestOptions(2));
        auto result = paginator.FetchAll("artist");

        CHECK(result.nodes.size() == 8);
        CHECK(Unique(result));
        CHECK(result.release_group_requests == 1);
        CHECK(result.release_requests == 4);
        for (const auto &node : result.nodes) {
            if (node.type == NodeType::Release) {
                REQUIRE(node.parent_id.has_value());
                CHECK(node.id.rfind(*node.parent_id, 0) == 0);
            }
        }
    }

    SECTION("First release per group") {
        auto options = TestOptions(100);
        options.max_releases_per_group = 1;
        DiscographyPaginator paginator(fake, options);
        auto result = paginator.FetchAll("artist");

        CHECK(result.nodes.size() == 4);
        CHECK(result.release_requests == 2);
        CHECK(fake.calls("rel:rg-1") == 1);
    }
}

TEST_CASE("Paginator: transient failures are retried", "[catalog][paginator]") {
    util::MockTimeScope mock_time(1000000);
    FakeCatalog fake;
    AddGroups(fake, "artist", 7);
    fake.FailNext("rg:artist", 503, true, 2);
    fake.FailNext("rg:artist", 429, true, 2);
    auto options = TestOptions(2);
    options.include_releases = false;

    RecordingSleeper sleeper;
    DiscographyPaginator paginator(fake, options, sleeper.callback());
    auto result = paginator.FetchAll("artist");

    CHECK(result.nodes.size() == 7);
    CHECK_FALSE(result.truncated);
    CHECK(result.errors.empty());
    CHECK(result.release_group_requests == 6);
    REQUIRE(sleeper.sleeps.size() == 2);
    CHECK(sleeper.sleeps[0].count() == 10);
    CHECK(sleeper.sleeps[1].count() == 20);
}

TEST_CASE("Paginator: exhausted retries keep partial results", "[catalog][paginator]") {
    FakeCatalog fake;
    AddGroups(fake, "artist", 5);
    for (int i = 0; i < 3; ++i) {
        fake.FailNext("rg:artist", 502, true, 2);
    }
    auto options = TestOptions(2);
    options.include_releases = false;
    options.max_page_attempts = 3;

    RecordingSleeper sleeper;
    DiscographyPaginator paginator(fake, options, sleeper.callback());
    auto result = paginator.FetchAll("artist");

    CHECK(result.truncated);
    CHECK(result.nodes.size() == 2);
    CHECK(result.errors.size() == 1);
    CHECK(result.release_group_requests == 4);
    CHECK(sleeper.sleeps.size() == 2);
}

TEST_CASE("Paginator: permanent failure abandons only its branch", "[catalog][paginator]") {
    FakeCatalog fake;
    AddGroups(fake, "artist", 2);
    fake.AddRelease("rg-1", "r-1", "One");
    fake.AddRelease("rg-2", "r-2", "Two");
    fake.FailNext("rel:rg-1", 404, false);

    RecordingSleeper sleeper;
    DiscographyPaginator paginator(fake, TestOptions(10), sleeper.callback());
    auto result = paginator.FetchAll("artist");

    CHECK(result.truncated);
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].find("rg-1") != std::string::npos);
    CHECK(fake.calls("rel:rg-1") == 1); // not retried
    CHECK(fake.calls("rel:rg-2") == 1);
    CHECK(result.nodes.size() == 3);
    CHECK(sleeper.sleeps.empty());
}

TEST_CASE("Paginator: requests are rate limited", "[catalog][paginator]") {
    util::MockTimeScope mock_time(5000000);
    FakeCatalog fake;
    AddGroups(fake, "artist", 7);
    auto options = TestOptions(2);
    options.include_releases = false;
    options.min_request_interval = std::chrono::milliseconds(1000);

    RecordingSleeper sleeper;
    DiscographyPaginator paginator(fake, options, sleeper.callback());
    auto result = paginator.FetchAll("artist");

    CHECK(result.release_group_requests == 4);
    CHECK(sleeper.sleeps.size() == 3);
    CHECK(sleeper.total() == 3000);
}

TEST_CASE("Paginator: a shared limiter spaces separate walks", "[catalog][paginator]") {
    util::MockTimeScope mock_time(5000000);
    FakeCatalog fake;
    AddGroups(fake, "artist", 1);
    auto options = TestOptions(10);
    options.include_releases = false;

    RecordingSleeper sleeper;
    auto limiter =
        std::make_shared<RateLimiter>(std::chrono::milliseconds(1000), sleeper.callback());

    DiscographyPaginator first(fake, options, sleeper.callback(), limiter);
    first.FetchAll("artist");
    CHECK(sleeper.sleeps.empty());

    DiscographyPaginator second(fake, options, sleeper.callback(), limiter);
    second.FetchAll("artist");
    REQUIRE(sleeper.sleeps.size() == 1);
    CHECK(sleeper.sleeps[0].count() == 1000);
    CHECK(limiter->total_wait().count() == 1000);
}

TEST_CASE("Paginator: lookup by artist name", "[catalog][paginator]") {
    FakeCatalog fake;
    fake.AddArtist("wrong-id", "Example Band", 40);
    fake.AddArtist("right-id", "Example Band", 100);
    AddGroups(fake, "right-id", 3);
    auto options = TestOptions(10);
    options.include_releases = false;
    DiscographyPaginator paginator(fake, options);

    auto result = paginator.FetchAllByName("Example Band");
    CHECK(result.artist_id == "right-id");
    CHECK(result.nodes.size() == 3);
    CHECK(fake.search_calls() == 1);

    CHECK_THROWS_AS(paginator.FetchAllByName("Nobody"), CatalogError);
}

TEST_CASE("RateLimiter spaces requests", "[catalog][util]") {
    util::MockTimeScope mock_time(100000);
    RecordingSleeper sleeper;
    RateLimiter limiter(std::chrono::milliseconds(1000), sleeper.callback());

    limiter.Acquire();
    CHECK(sleeper.sleeps.empty());

    util::SetMockTime(100400);
    limiter.Acquire();
    REQUIRE(sleeper.sleeps.size() == 1);
    CHECK(sleeper.sleeps[0].count() == 600);

    util::SetMockTime(util::GetMockTime() + 5000);
    limiter.Acquire();
    CHECK(sleeper.sleeps.size() == 1);
    CHECK(limiter.total_wait().count() == 600);
}
