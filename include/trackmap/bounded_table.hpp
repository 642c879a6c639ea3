#pragma once

#include "tracking_table.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace trackmap {

// Called once per entry evicted by a BoundedTrackingTable, with the un-prefixed id.
// Anything it throws aborts the eviction pass and the insertion that triggered it.
using OverflowObserver = std::function<void(const std::string& id)>;

/**
 * @class BoundedTrackingTable
 * @brief TrackingTable whose size is capped by evicting the least recently modified entries.
 *
 * Before every Put/PutIfAbsent, if Size() >= max_size, the oldest max_size / 10 entries
 * (by modification stamp) are deleted. Entries sharing the boundary stamp are all deleted.
 * With max_size < 10 the quota is zero and nothing is ever evicted.
 *
 * Eviction is best effort: several clients may trim the same directory at once and no
 * lock spans the list, stat and delete calls. Deletes carry no version guard, so an entry
 * rewritten after its stamp was read is still removed.
 */
class BoundedTrackingTable : public TrackingTable {
public:
    /**
     * @param max_size Number of entries at which eviction starts. Must be positive.
     * @param on_overflow Optional observer notified for every evicted entry.
     * @throws std::invalid_argument if max_size is not positive.
     */
    BoundedTrackingTable(CoordinationStore& store, std::string dir, std::int64_t max_size,
                         OverflowObserver on_overflow = nullptr);

    void Put(const std::string& id, const Bytes& payload) override;
    bool PutIfAbsent(const std::string& id, const Bytes& payload) override;

    std::int64_t MaxSize() const { return max_size_; }
    std::size_t CleanupCount() const { return cleanup_count_; }

    // Entries deleted by this instance's eviction passes so far.
    std::uint64_t EvictedCount() const { return evicted_count_.load(); }

private:
    // Runs an eviction pass if the table is full. Returns the number of entries deleted.
    std::size_t ShrinkIfNeeded();

    const std::int64_t max_size_;
    const std::size_t cleanup_count_;
    OverflowObserver on_overflow_;
    std::atomic<std::uint64_t> evicted_count_{0};
};

} // namespace trackmap
