#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rangedl {

struct Segment {
    std::size_t index{0};
    std::uint64_t start{0};
    std::uint64_t length{0};

    [[nodiscard]] std::uint64_t end() const { return start + length; }

    bool operator==(const Segment& other) const {
        return index == other.index && start == other.start && length == other.length;
    }
    bool operator!=(const Segment& other) const { return !(*this == other); }
};

// Splits [0, total_size) into exactly max(threads, 1) contiguous segments.
// Every segment but the last has total_size / threads bytes, the last one
// takes whatever is left.
[[nodiscard]] std::vector<Segment> planSegments(std::uint64_t total_size, std::size_t threads);

} // namespace rangedl
