#include "rangedl/range_planner.hpp"

#include <algorithm>

namespace rangedl {

std::vector<Segment> planSegments(std::uint64_t total_size, std::size_t threads) {
    const std::size_t count = std::max<std::size_t>(1, threads);
    const std::uint64_t part_size = total_size / count;

    std::vector<Segment> segments;
    segments.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        // 起点按 part_size 步进, 保证相邻分段首尾相接
        const std::uint64_t start = static_cast<std::uint64_t>(i) * part_size;
        const std::uint64_t length = (i + 1 == count) ? total_size - start : part_size;
        segments.push_back({i, start, length});
    }
    return segments;
}

} // namespace rangedl
