#pragma once
#include <cstddef>
#include <vector>

/**
 * Enumerates index subsets of {0, ..., n-1} with at most maxSize elements:
 * the empty set first, then every subset of size 1, 2, ... in lexicographic order.
 * The generator is finite and can be restarted with reset().
 */
class SubsetGenerator {
public:
    SubsetGenerator(size_t n, size_t maxSize);

    // Writes the next subset into out. Returns false once every subset has been produced.
    bool next(std::vector<size_t>& out);
    void reset();

    size_t getMaxSize() const { return maxSize_; }

private:
    size_t n_;
    size_t maxSize_;
    size_t size_ = 0;
    std::vector<size_t> current_;
    bool started_ = false;
    bool done_ = false;
};
