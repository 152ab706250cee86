#include "SubsetGenerator.h"
#include <algorithm>
#include <numeric>

SubsetGenerator::SubsetGenerator(size_t n, size_t maxSize) : n_(n), maxSize_(std::min(n, maxSize)) {}

void SubsetGenerator::reset() {
    size_ = 0;
    current_.clear();
    started_ = false;
    done_ = false;
}

bool SubsetGenerator::next(std::vector<size_t>& out) {
    if (done_) return false;

    if (!started_) {
        started_ = true;
        current_.clear();
        out = current_;
        return true;
    }

    // Advance within the current size: bump the rightmost index that still has room.
    for (size_t i = size_; i-- > 0;) {
        if (current_[i] < n_ - size_ + i) {
            ++current_[i];
            for (size_t j = i + 1; j < size_; ++j) current_[j] = current_[j - 1] + 1;
            out = current_;
            return true;
        }
    }

    if (size_ >= maxSize_) {
        done_ = true;
        return false;
    }
    ++size_;
    current_.resize(size_);
    std::iota(current_.begin(), current_.end(), 0);
    out = current_;
    return true;
}
