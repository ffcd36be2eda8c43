#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

namespace rangedl {

struct Progress {
    std::uint64_t total_bytes{0};
    std::uint64_t written_bytes{0};
    std::size_t segments_completed{0};
    std::size_t segment_count{0};
};

// Truncating percentage: only reaches 100 once every byte is written.
[[nodiscard]] std::uint64_t percentOf(std::uint64_t written, std::uint64_t total);

[[nodiscard]] std::string formatSize(std::uint64_t bytes);

// Single-line "Progress: |████---| 42% Complete" renderer.
class ProgressBar {
public:
    static constexpr std::size_t kWidth = 50;

    explicit ProgressBar(std::FILE* out = stdout) : out_(out) {}

    // Redraws only when the percentage or the bar changes; prints a newline
    // when written == total.
    void update(const Progress& progress);

    [[nodiscard]] static std::string renderLine(std::uint64_t written, std::uint64_t total);

private:
    std::FILE* out_;
    std::uint64_t last_percent_{0};
    std::uint64_t last_filled_{0};
    bool drawn_{false};
    bool finished_{false};
};

} // namespace rangedl
