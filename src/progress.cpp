#include "rangedl/progress.hpp"

#include <fmt/format.h>

namespace rangedl {

namespace {

std::uint64_t filledCells(std::uint64_t written, std::uint64_t total) {
    if (total == 0) {
        return 0;
    }
    return ProgressBar::kWidth * written / total;
}

} // namespace

std::uint64_t percentOf(std::uint64_t written, std::uint64_t total) {
    if (total == 0) {
        return 0;
    }
    return 100 * written / total;
}

std::string formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

std::string ProgressBar::renderLine(std::uint64_t written, std::uint64_t total) {
    const auto filled = static_cast<std::size_t>(filledCells(written, total));

    std::string bar;
    bar.reserve(kWidth * 3);
    for (std::size_t i = 0; i < kWidth; ++i) {
        bar += (i < filled) ? u8"█" : "-";
    }

    return fmt::format("\rProgress: |{}| {}% Complete", bar, percentOf(written, total));
}

void ProgressBar::update(const Progress& progress) {
    if (finished_ || progress.total_bytes == 0) {
        return;
    }

    const auto percent = percentOf(progress.written_bytes, progress.total_bytes);
    const auto filled = filledCells(progress.written_bytes, progress.total_bytes);
    if (drawn_ && percent == last_percent_ && filled == last_filled_) {
        return;
    }

    fmt::print(out_, "{}", renderLine(progress.written_bytes, progress.total_bytes));
    if (progress.written_bytes == progress.total_bytes) {
        fmt::print(out_, "\n");
        finished_ = true;
    }
    std::fflush(out_);

    drawn_ = true;
    last_percent_ = percent;
    last_filled_ = filled;
}

} // namespace rangedl
