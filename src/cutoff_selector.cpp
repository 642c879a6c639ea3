#include "trackmap/cutoff_selector.hpp"

#include <algorithm>

namespace trackmap {

CutoffSelector::CutoffSelector(std::size_t capacity) : capacity_(capacity) {
    heap_.reserve(capacity_);
}

bool CutoffSelector::Offer(Stamp stamp) {
    if (capacity_ == 0) {
        return false;
    }

    if (heap_.size() < capacity_) {
        heap_.push_back(stamp);
        std::push_heap(heap_.begin(), heap_.end());
        return true;
    }

    // Full: only something older than the current boundary displaces it.
    if (stamp >= heap_.front()) {
        return false;
    }
    std::pop_heap(heap_.begin(), heap_.end());
    heap_.back() = stamp;
    std::push_heap(heap_.begin(), heap_.end());
    return true;
}

std::optional<Stamp> CutoffSelector::Boundary() const {
    if (heap_.empty()) {
        return std::nullopt;
    }
    return heap_.front();
}

size_t CutoffSelector::Size() const {
    return heap_.size();
}

size_t CutoffSelector::Capacity() const {
    return capacity_;
}

} // namespace trackmap
