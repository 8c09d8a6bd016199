// Copyright (c) 2024 Discofill
// Distributed under the MIT software license

#include "transfer/search_session.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace discofill {
namespace transfer {

namespace {

constexpr uint32_t HIGH_BITRATE_KBPS = 320;
constexpr uint32_t MEDIUM_BITRATE_KBPS = 192;

std::string Lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string BaseName(const std::string &path) {
  // Peers use both separators
  auto pos = path.find_last_of("/\\");
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

int TierRank(QualityTier tier) {
  switch (tier) {
  case QualityTier::Low:
    return 0;
  case QualityTier::Medium:
    return 1;
  case QualityTier::High:
    return 2;
  }
  return 0;
}

} // namespace

bool HasLosslessExtension(const std::string &path) {
  static const std::array<const char *, 6> kLossless = {
      ".flac", ".wav", ".aiff", ".alac", ".ape", ".wv"};

  const std::string name = Lowercase(BaseName(path));
  auto dot = name.rfind('.');
  if (dot == std::string::npos) {
    return false;
  }
  const std::string ext = name.substr(dot);
  return std::find(kLossless.begin(), kLossless.end(), ext) != kLossless.end();
}

QualityTier ClassifyQuality(const SearchResult &result) {
  if (result.lossless) {
    return QualityTier::High;
  }

  if (result.bitrate_kbps) {
    const uint32_t kbps = *result.bitrate_kbps;
    if (kbps >= HIGH_BITRATE_KBPS) {
      return QualityTier::High;
    }
    if (kbps >= MEDIUM_BITRATE_KBPS) {
      return QualityTier::Medium;
    }
    return QualityTier::Low;
  }

  if (HasLosslessExtension(result.file_path)) {
    return QualityTier::High;
  }
  if (BaseName(result.file_path).find("320") != std::string::npos) {
    return QualityTier::High;
  }
  return QualityTier::Medium;
}

std::vector<SearchResult> SortResults(const std::vector<SearchResult> &results,
                                      const SortOrder &order) {
  std::vector<SearchResult> view = results;

  // Establish arrival order first, so stable_sort breaks ties by arrival
  std::stable_sort(view.begin(), view.end(),
                   [](const SearchResult &a, const SearchResult &b) {
                     return a.sequence < b.sequence;
                   });

  if (order.key == SortKey::Arrival) {
    if (order.descending) {
      std::reverse(view.begin(), view.end());
    }
    return view;
  }

  auto key_of = [&order](const SearchResult &r) -> uint64_t {
    switch (order.key) {
    case SortKey::Size:
      return r.size_bytes;
    case SortKey::Speed:
      return r.upload_speed;
    case SortKey::Quality:
      return static_cast<uint64_t>(TierRank(ClassifyQuality(r)));
    case SortKey::QueueLength:
      return r.queue_length;
    case SortKey::Arrival:
      return r.sequence;
    }
    return 0;
  };

  std::stable_sort(view.begin(), view.end(),
                   [&](const SearchResult &a, const SearchResult &b) {
                     const uint64_t ka = key_of(a);
                     const uint64_t kb = key_of(b);
                     return order.descending ? ka > kb : ka < kb;
                   });
  return view;
}

SearchSession::SearchSession(SessionId id, std::string query)
    : id_(id), query_(std::move(query)) {}

std::string SearchSession::query() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return query_;
}

SearchResult SearchSession::Append(SearchResult result) {
  std::lock_guard<std::mutex> lock(mutex_);
  result.session_id = id_;
  result.sequence = next_sequence_++;
  results_.push_back(result);
  return result;
}

std::optional<SearchResult>
SearchSession::AppendIfCurrent(uint64_t generation, SearchResult result) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (generation != generation_) {
    return std::nullopt;
  }
  result.session_id = id_;
  result.sequence = next_sequence_++;
  results_.push_back(result);
  return result;
}

std::vector<SearchResult> SearchSession::Results() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return results_;
}

std::vector<SearchResult> SearchSession::Sorted(const SortOrder &order) const {
  return SortResults(Results(), order);
}

size_t SearchSession::ResultCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return results_.size();
}

uint64_t SearchSession::Reset(std::string query) {
  std::lock_guard<std::mutex> lock(mutex_);
  query_ = std::move(query);
  results_.clear();
  next_sequence_ = 0;
  return ++generation_;
}

uint64_t SearchSession::generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

} // namespace transfer
} // namespace discofill
