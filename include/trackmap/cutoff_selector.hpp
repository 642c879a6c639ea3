#pragma once

#include "types.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace trackmap {

/**
 * @class CutoffSelector
 * @brief Retains the `capacity` smallest stamps offered to it.
 *
 * Backed by a fixed-capacity max-heap: once full, a new stamp is kept only if it is
 * smaller than the current maximum, which it then replaces. Offering n stamps costs
 * O(n log capacity) and the selector never holds more than `capacity` values.
 *
 * This class is not thread-safe by itself.
 */
class CutoffSelector {
public:
    explicit CutoffSelector(std::size_t capacity);

    /**
     * @brief Offers a stamp to the selector.
     * @param stamp The candidate.
     * @return True if the stamp is now retained, false if it was discarded.
     */
    bool Offer(Stamp stamp);

    /**
     * @brief Returns the largest retained stamp, i.e. the newest of the oldest `capacity`.
     * @return The boundary, or std::nullopt if nothing is retained (always the case
     *         for a zero-capacity selector).
     */
    std::optional<Stamp> Boundary() const;

    size_t Size() const;
    size_t Capacity() const;

private:
    std::size_t capacity_;
    std::vector<Stamp> heap_; // max-heap, heap_.front() is the boundary
};

} // namespace trackmap
