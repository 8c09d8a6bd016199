// Copyright (c) 2024 Discofill
// Distributed under the MIT software license
// In-memory catalog service for paginator and application tests

#ifndef DISCOFILL_TEST_CATALOG_TEST_HELPERS_HPP
#define DISCOFILL_TEST_CATALOG_TEST_HELPERS_HPP

#include "catalog/catalog_client.hpp"
#include <algorithm>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace discofill {
namespace test {

/**
 * FakeCatalog - serves release groups and releases from memory
 *
 * Nodes added with an empty id stand for entries the service returns but
 * the parser skips: they take up their offset without reaching page.items.
 *
 * Failures can be queued per listing key ("rg:<artist>" or "rel:<group>");
 * each queued error is thrown by one request, in order. report_total
 * controls whether pages carry the total count.
 */
class FakeCatalog : public catalog::CatalogClient {
public:
    void AddReleaseGroup(const std::string &artist, const std::string &id,
                         const std::string &title) {
        catalog::CatalogNode node;
        node.id = id;
        node.type = catalog::NodeType::ReleaseGroup;
        node.title = title;
        std::lock_guard<std::mutex> lock(mutex_);
        groups_[artist].push_back(node);
    }

    void AddRelease(const std::string &group, const std::string &id,
                    const std::string &title) {
        catalog::CatalogNode node;
        node.id = id;
        node.type = catalog::NodeType::Release;
        node.title = title;
        node.parent_id = group;
        std::lock_guard<std::mutex> lock(mutex_);
        releases_[group].push_back(node);
    }

    void AddArtist(const std::string &id, const std::string &name, int score) {
        std::lock_guard<std::mutex> lock(mutex_);
        artists_.push_back({id, name, score});
    }

    // Fail one request of `key` (only at `at_offset`, if given)
    void FailNext(const std::string &key, int status, bool transient,
                  std::optional<uint32_t> at_offset = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[key].push_back({status, transient, at_offset});
    }

    void set_report_total(bool value) { report_total_ = value; }

    catalog::Page FetchReleaseGroups(const std::string &artist_id, uint32_t offset,
                                     uint32_t limit) override {
        return serve("rg:" + artist_id, groups_, artist_id, offset, limit);
    }

    catalog::Page FetchReleases(const std::string &group_id, uint32_t offset,
                                uint32_t limit) override {
        return serve("rel:" + group_id, releases_, group_id, offset, limit);
    }

    std::vector<catalog::ArtistMatch> SearchArtist(const std::string &name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++search_calls_;
        std::vector<catalog::ArtistMatch> out;
        for (const auto &a : artists_) {
            if (a.name == name) {
                out.push_back(a);
            }
        }
        std::sort(out.begin(), out.end(), [](const auto &a, const auto &b) {
            return a.score > b.score;
        });
        return out;
    }

    int calls(const std::string &key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(key);
        return it == calls_.end() ? 0 : it->second;
    }

    std::vector<uint32_t> offsets(const std::string &key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = offsets_.find(key);
        return it == offsets_.end() ? std::vector<uint32_t>{} : it->second;
    }

    int search_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return search_calls_;
    }

private:
    struct Failure {
        int status;
        bool transient;
        std::optional<uint32_t> at_offset;
    };

    using Listing = std::map<std::string, std::vector<catalog::CatalogNode>>;

    catalog::Page serve(const std::string &key, const Listing &listing,
                        const std::string &parent, uint32_t offset, uint32_t limit) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_[key];
        offsets_[key].push_back(offset);

        auto &queue = failures_[key];
        for (auto it = queue.begin(); it != queue.end(); ++it) {
            if (!it->at_offset || *it->at_offset == offset) {
                Failure f = *it;
                queue.erase(it);
                throw catalog::CatalogError("HTTP " + std::to_string(f.status),
                                            f.status, f.transient);
            }
        }

        static const std::vector<catalog::CatalogNode> kEmpty;
        auto found = listing.find(parent);
        const auto &items = found == listing.end() ? kEmpty : found->second;

        catalog::Page page;
        for (uint32_t i = offset; i < items.size() && i < offset + limit; ++i) {
            ++page.raw_count;
            if (!items[i].id.empty()) {
                page.items.push_back(items[i]);
            }
        }
        if (report_total_) {
            page.total = items.size();
        }
        return page;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<catalog::CatalogNode>> groups_;
    std::map<std::string, std::vector<catalog::CatalogNode>> releases_;
    std::vector<catalog::ArtistMatch> artists_;
    std::map<std::string, std::deque<Failure>> failures_;
    std::map<std::string, int> calls_;
    std::map<std::string, std::vector<uint32_t>> offsets_;
    int search_calls_{0};
    bool report_total_{false};
};

} // namespace test
} // namespace discofill

#endif // DISCOFILL_TEST_CATALOG_TEST_HELPERS_HPP
