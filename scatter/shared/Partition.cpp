/**
 * @file scatter/shared/Partition.cpp
 * @brief Balanced split of a value range into contiguous chunks.
 */

#include "Partition.h"

#include <algorithm>

namespace scatter {

std::vector<ChunkRange> partition(std::size_t length, std::size_t parts) {
    std::vector<ChunkRange> chunks;
    const std::size_t count = std::min(parts, length);
    if (count == 0) {
        return chunks;
    }

    const std::size_t base = length / count;
    const std::size_t extra = length % count;
    chunks.reserve(count);

    std::size_t start = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t size = base + (i < extra ? 1 : 0);
        chunks.push_back({start, start + size});
        start += size;
    }
    return chunks;
}

} // namespace scatter
