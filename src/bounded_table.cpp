#include "trackmap/bounded_table.hpp"
#include "trackmap/cutoff_selector.hpp"
#include "trackmap/errors.hpp"

#include <spdlog/spdlog.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace trackmap {

namespace {

std::int64_t CheckedMaxSize(std::int64_t max_size) {
    if (max_size <= 0) {
        throw std::invalid_argument("max_size must be positive, got " + std::to_string(max_size));
    }
    return max_size;
}

} // namespace

BoundedTrackingTable::BoundedTrackingTable(CoordinationStore& store, std::string dir,
                                           std::int64_t max_size, OverflowObserver on_overflow)
    : TrackingTable(store, std::move(dir)),
      max_size_(CheckedMaxSize(max_size)),
      cleanup_count_(static_cast<std::size_t>(max_size_ / 10)),
      on_overflow_(std::move(on_overflow)) {
    if (cleanup_count_ == 0) {
        spdlog::warn("tracking table {}: max_size {} gives an empty cleanup quota, "
                     "entries will never be evicted", dir_, max_size_);
    }
}

void BoundedTrackingTable::Put(const std::string& id, const Bytes& payload) {
    ShrinkIfNeeded();
    TrackingTable::Put(id, payload);
}

bool BoundedTrackingTable::PutIfAbsent(const std::string& id, const Bytes& payload) {
    ShrinkIfNeeded();
    return TrackingTable::PutIfAbsent(id, payload);
}

std::size_t BoundedTrackingTable::ShrinkIfNeeded() {
    const std::size_t size = Size();
    if (static_cast<std::int64_t>(size) < max_size_ || cleanup_count_ == 0) {
        return 0;
    }

    const std::vector<std::string> children = store_.ListChildren(dir_);

    // Pass 1: collect stamps and find the newest of the oldest cleanup_count_ entries.
    CutoffSelector selector(cleanup_count_);
    std::unordered_map<std::string, Stamp> stamps;
    stamps.reserve(children.size());
    for (const auto& child : children) {
        auto stat = store_.Exists(ChildPath(dir_, child));
        if (!stat) {
            continue; // deleted since the listing
        }
        selector.Offer(stat->mzxid);
        stamps.emplace(child, stat->mzxid);
    }

    const std::optional<Stamp> cutoff = selector.Boundary();
    if (!cutoff) {
        return 0;
    }

    // Pass 2: delete everything at or below the cutoff.
    std::size_t deleted = 0;
    for (const auto& child : children) {
        auto it = stamps.find(child);
        if (it == stamps.end() || it->second > *cutoff) {
            continue;
        }
        try {
            store_.Delete(ChildPath(dir_, child));
        } catch (const NoNodeError&) {
            spdlog::debug("tracking table {}: {} already removed", dir_, child);
            continue;
        }
        ++deleted;
        ++evicted_count_;
        if (on_overflow_) {
            on_overflow_(StripKeyPrefix(child));
        }
    }

    spdlog::debug("tracking table {}: size {} >= {}, evicted {} entries up to stamp {}",
                  dir_, size, max_size_, deleted, *cutoff);
    return deleted;
}

} // namespace trackmap
