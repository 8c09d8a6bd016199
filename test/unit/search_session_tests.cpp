// Copyright (c) 2024 Discofill
// Distributed under the MIT software license

#include "transfer/search_session.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace discofill::transfer;

namespace {

SearchResult Result(const std::string &path, uint64_t size,
                    std::optional<uint32_t> kbps = std::nullopt,
                    bool lossless = false, uint64_t speed = 0,
                    uint32_t queue = 0) {
    SearchResult r;
    r.peer = "peer";
    r.file_path = path;
    r.size_bytes = size;
    r.bitrate_kbps = kbps;
    r.lossless = lossless;
    r.upload_speed = speed;
    r.queue_length = queue;
    return r;
}

std::vector<std::string> Paths(const std::vector<SearchResult> &results) {
    std::vector<std::string> out;
    for (const auto &r : results) {
        out.push_back(r.file_path);
    }
    return out;
}

} // namespace

TEST_CASE("Quality tiers", "[transfer][search]") {
    CHECK(ClassifyQuality(Result("a.mp3", 1, 320)) == QualityTier::High);
    CHECK(ClassifyQuality(Result("a.mp3", 1, 400)) == QualityTier::High);
    CHECK(ClassifyQuality(Result("a.mp3", 1, 319)) == QualityTier::Medium);
    CHECK(ClassifyQuality(Result("a.mp3", 1, 192)) == QualityTier::Medium);
    CHECK(ClassifyQuality(Result("a.mp3", 1, 191)) == QualityTier::Low);
    CHECK(ClassifyQuality(Result("a.mp3", 1, 128, true)) == QualityTier::High);

    SECTION("Unknown bitrate") {
        CHECK(ClassifyQuality(Result("Album\\01.FLAC", 1)) == QualityTier::High);
        CHECK(ClassifyQuality(Result("Album/01 [320].mp3", 1)) == QualityTier::High);
        CHECK(ClassifyQuality(Result("Album/01.mp3", 1)) == QualityTier::Medium);
        CHECK(ClassifyQuality(Result("320kbps/01.mp3", 1)) == QualityTier::Medium);
    }

    CHECK(HasLosslessExtension("x.wv"));
    CHECK(HasLosslessExtension("dir.flac/x.Ape"));
    CHECK_FALSE(HasLosslessExtension("flac/x.ogg"));
    CHECK_FALSE(HasLosslessExtension("noext"));
}

TEST_CASE("SearchSession accumulates in arrival order", "[transfer][search]") {
    SearchSession session(3, "tidal");
    CHECK(session.id() == 3);
    CHECK(session.query() == "tidal");

    auto stored = session.Append(Result("a.mp3", 10));
    CHECK(stored.session_id == 3);
    CHECK(stored.sequence == 0);
    session.Append(Result("b.mp3", 30));
    session.Append(Result("c.mp3", 20));

    CHECK(session.ResultCount() == 3);
    CHECK(Paths(session.Results()) == std::vector<std::string>{"a.mp3", "b.mp3", "c.mp3"});

    session.Reset("undertow");
    CHECK(session.ResultCount() == 0);
    CHECK(session.query() == "undertow");
    CHECK(session.Append(Result("d.mp3", 1)).sequence == 0);
}

TEST_CASE("SearchSession rejects results of a replaced query", "[transfer][search]") {
    SearchSession session(4, "");
    const uint64_t first = session.Reset("tidal");
    CHECK(session.generation() == first);
    REQUIRE(session.AppendIfCurrent(first, Result("a.mp3", 10)).has_value());

    const uint64_t second = session.Reset("undertow");
    CHECK(second != first);
    CHECK_FALSE(session.AppendIfCurrent(first, Result("late.mp3", 10)).has_value());
    CHECK(session.ResultCount() == 0);

    auto stored = session.AppendIfCurrent(second, Result("b.mp3", 20));
    REQUIRE(stored.has_value());
    CHECK(stored->session_id == 4);
    CHECK(stored->sequence == 0);
    CHECK(Paths(session.Results()) == std::vector<std::string>{"b.mp3"});
}

TEST_CASE("Sorting is a stable view", "[transfer][search]") {
    SearchSession session(1, "q");
    session.Append(Result("a.mp3", 100, 128, false, 50, 3));
    session.Append(Result("b.flac", 300, std::nullopt, true, 10, 0));
    session.Append(Result("c.mp3", 100, 320, false, 50, 1));
    session.Append(Result("d.mp3", 200, 256, false, 90, 3));

    SECTION("Size descending, ties by arrival") {
        CHECK(Paths(session.Sorted({SortKey::Size, true})) ==
              std::vector<std::string>{"b.flac", "d.mp3", "a.mp3", "c.mp3"});
    }

    SECTION("Size ascending, ties by arrival") {
        CHECK(Paths(session.Sorted({SortKey::Size, false})) ==
              std::vector<std::string>{"a.mp3", "c.mp3", "d.mp3", "b.flac"});
    }

    SECTION("Speed descending") {
        CHECK(Paths(session.Sorted({SortKey::Speed, true})) ==
              std::vector<std::string>{"d.mp3", "a.mp3", "c.mp3", "b.flac"});
    }

    SECTION("Quality descending, ties by arrival") {
        CHECK(Paths(session.Sorted({SortKey::Quality, true})) ==
              std::vector<std::string>{"b.flac", "c.mp3", "d.mp3", "a.mp3"});
    }

    SECTION("Queue length ascending") {
        CHECK(Paths(session.Sorted({SortKey::QueueLength, false})) ==
              std::vector<std::string>{"b.flac", "c.mp3", "a.mp3", "d.mp3"});
    }

    SECTION("Sorting never reorders the buffer") {
        auto by_size = session.Sorted({SortKey::Size, true});
        CHECK(Paths(session.Results()) ==
              std::vector<std::string>{"a.mp3", "b.flac", "c.mp3", "d.mp3"});
        // Re-sorting a sorted view gives the same answer as sorting the buffer
        CHECK(Paths(SortResults(by_size, {SortKey::Speed, true})) ==
              Paths(session.Sorted({SortKey::Speed, true})));
    }
}
