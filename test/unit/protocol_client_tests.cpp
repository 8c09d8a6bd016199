// Copyright (c) 2024 Discofill
// Distributed under the MIT software license

#include "transfer/null_protocol_client.hpp"
#include "transfer/simulated_protocol_client.hpp"
#include <catch2/catch_test_macros.hpp>
#include <vector>

using namespace discofill::transfer;

TEST_CASE("NullProtocolClient", "[transfer][protocol]") {
    std::vector<std::string> instructions;
    NullProtocolClient client([&](const std::string &m) { instructions.push_back(m); });

    std::vector<ProtocolEvent> events;
    client.set_event_callback([&](const ProtocolEvent &e) { events.push_back(e); });

    SECTION("Never connects") {
        bool called = false;
        client.connect({"user", "pass"}, [&](bool success, const std::string &error) {
            called = true;
            CHECK_FALSE(success);
            CHECK(error == NullProtocolClient::UNAVAILABLE_REASON);
        });
        CHECK(called);
        CHECK_FALSE(client.is_connected());
        CHECK(client.name() == "null");
    }

    SECTION("Search becomes a manual instruction") {
        bool got_result = false;
        CHECK(client.search(7, "Boards of Canada Roygbiv",
                            [&](const SearchResult &) { got_result = true; }));
        CHECK_FALSE(got_result);
        REQUIRE(instructions.size() == 1);
        CHECK(instructions[0] ==
              "P2P library not available. Search manually in your P2P client for: "
              "Boards of Canada Roygbiv");
    }

    SECTION("Downloads fail immediately") {
        CHECK(client.request_download(3, "peer", "a/b.mp3", "downloads"));
        REQUIRE(events.size() == 1);
        CHECK(events[0].type == ProtocolEventType::Failed);
        CHECK(events[0].transfer_id == 3);
        CHECK(events[0].error == NullProtocolClient::UNAVAILABLE_REASON);
    }

    SECTION("Browse reports failure") {
        bool ok = true;
        client.browse_folder("peer", "Music/Album",
                             [&](bool success, const FolderManifest &manifest,
                                 const std::string &) {
                                 ok = success;
                                 CHECK(manifest.folder == "Music/Album");
                             });
        CHECK_FALSE(ok);
    }
}

TEST_CASE("SimulatedProtocolClient search", "[transfer][protocol]") {
    SimulatedProtocolClient client;
    client.AddFile("alice", "Music/Tidal/01 - Tidal.flac", 30000000, std::nullopt, true);
    client.AddFile("bob", "mp3/Tidal/01 Tidal.mp3", 8000000, 320);
    client.AddFile("bob", "mp3/Other/01 Wave.mp3", 7000000, 192);

    std::vector<SearchResult> results;
    auto collect = [&](const SearchResult &r) { results.push_back(r); };

    SECTION("Refused while disconnected") {
        CHECK_FALSE(client.search(1, "tidal", collect));
        CHECK(results.empty());
    }

    SECTION("Every query word must match") {
        client.connect({"u", "p"}, nullptr);
        REQUIRE(client.search(4, "TIDAL 01", collect));
        REQUIRE(results.size() == 2);
        for (const auto &r : results) {
            CHECK(r.session_id == 4);
        }
        CHECK(results[0].peer == "alice");
        CHECK(results[0].lossless);
        CHECK(results[1].bitrate_kbps == std::optional<uint32_t>(320));
        CHECK(client.search_queries() == std::vector<std::string>{"TIDAL 01"});
    }
}

TEST_CASE("SimulatedProtocolClient downloads", "[transfer][protocol]") {
    SimulatedProtocolClient client;
    client.AddFile("alice", "Music/Album/01.flac", 1000);
    client.AddFile("alice", "Music/Album/02.flac", 2000);
    client.AddFile("alice", "Music/Album/cover.jpg", 50);
    client.FailFile("Music/Album/02.flac");

    std::vector<ProtocolEvent> events;
    client.set_event_callback([&](const ProtocolEvent &e) { events.push_back(e); });

    CHECK_FALSE(client.request_download(1, "alice", "Music/Album/01.flac", "dl"));
    client.connect({"u", "p"}, nullptr);
    REQUIRE(client.is_connected());

    SECTION("Auto-complete") {
        REQUIRE(client.request_download(1, "alice", "Music/Album/01.flac", "dl"));
        REQUIRE(events.size() == 2);
        CHECK(events[0].type == ProtocolEventType::Progress);
        CHECK(events[0].bytes_transferred == 500);
        CHECK(events[1].type == ProtocolEventType::Completed);
        CHECK(events[1].total_bytes == 1000);
        CHECK(events[1].local_path ==
              SimulatedProtocolClient::LocalPathFor("dl", "Music/Album/01.flac"));
        CHECK(client.in_flight() == 0);
    }

    SECTION("Failing path") {
        REQUIRE(client.request_download(2, "alice", "Music/Album/02.flac", "dl"));
        REQUIRE(events.size() == 2);
        CHECK(events[1].type == ProtocolEventType::Failed);
        CHECK(events[1].error == "peer closed the transfer");
    }

    SECTION("Manual mode and cancel acknowledgement") {
        client.SetAutoComplete(false);
        REQUIRE(client.request_download(5, "alice", "Music/Album/01.flac", "dl"));
        CHECK(events.empty());
        CHECK(client.in_flight() == 1);
        REQUIRE(client.download(5).has_value());
        CHECK(client.download(5)->download_dir == "dl");

        client.cancel(5);
        REQUIRE(events.size() == 1);
        CHECK(events[0].type == ProtocolEventType::Cancelled);

        // Nothing in flight any more: counted, not acknowledged
        client.cancel(5);
        CHECK(events.size() == 1);
        CHECK(client.cancel_requests(5) == 2);
    }

    SECTION("Browse lists one folder") {
        FolderManifest listing;
        bool ok = false;
        client.browse_folder("alice", "Music/Album",
                             [&](bool success, const FolderManifest &m, const std::string &) {
                                 ok = success;
                                 listing = m;
                             });
        CHECK(ok);
        CHECK(listing.files.size() == 3);

        client.browse_folder("alice", "Music/Nothing",
                             [&](bool success, const FolderManifest &, const std::string &) {
                                 ok = success;
                             });
        CHECK_FALSE(ok);
    }

    SECTION("Dropping the connection") {
        std::string lost;
        client.set_connection_lost_callback([&](const std::string &r) { lost = r; });
        client.SetAutoComplete(false);
        client.request_download(9, "alice", "Music/Album/01.flac", "dl");
        client.DropConnection("server restart");
        CHECK(lost == "server restart");
        CHECK_FALSE(client.is_connected());
        CHECK(client.in_flight() == 0);
    }
}

TEST_CASE("SimulatedProtocolClient connect outcome", "[transfer][protocol]") {
    SimulatedProtocolClient client;
    client.SetConnectOutcome(false, "bad password");

    bool success = true;
    std::string error;
    client.connect({"u", "p"}, [&](bool s, const std::string &e) {
        success = s;
        error = e;
    });
    CHECK_FALSE(success);
    CHECK(error == "bad password");
    CHECK(client.connect_attempts() == 1);
}
