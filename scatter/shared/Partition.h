/**
 * @file scatter/shared/Partition.h
 * @brief Splits an input of a given length into contiguous balanced chunks.
 */

#pragma once

#include <cstddef>
#include <vector>

namespace scatter {

/**
 * @brief Half-open index range [begin, end) into a request's data
 */
struct ChunkRange {
    std::size_t begin = 0;
    std::size_t end = 0;

    std::size_t size() const { return end - begin; }
    bool operator==(const ChunkRange& other) const {
        return begin == other.begin && end == other.end;
    }
};

/**
 * @brief Partitions [0, length) into min(parts, length) contiguous ranges
 *
 * Sizes differ by at most one; the first (length % count) ranges carry the
 * extra element. Returns an empty vector when length or parts is zero.
 */
std::vector<ChunkRange> partition(std::size_t length, std::size_t parts);

} // namespace scatter
