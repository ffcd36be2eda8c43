#pragma once

#include "progress.hpp"
#include "task_event.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rangedl {

// Sole owner of the output file. Drains the result channel and writes every
// chunk at its own offset, so arrival order across segments does not matter.
class FileWriter {
public:
    using ProgressObserver = std::function<void(const Progress&)>;

    FileWriter(std::string path, std::uint64_t total_size, std::size_t segment_count);

    // Creates or truncates the file. Throws IoError.
    void open();

    // Returns once every segment has reported SegmentDone. Rethrows the first
    // SegmentFailed error dequeued, and throws ChannelClosedError if all
    // senders disappear before that.
    void consume(EventReceiver& events);

    // Flushes and closes. Throws IoError if the flush fails.
    void close();

    void onProgress(ProgressObserver observer) { observer_ = std::move(observer); }

    [[nodiscard]] std::uint64_t bytesWritten() const { return bytes_written_; }
    [[nodiscard]] std::size_t segmentsCompleted() const { return segments_completed_; }
    [[nodiscard]] std::optional<std::size_t> failedSegment() const { return failed_segment_; }

private:
    struct FileDeleter {
        void operator()(std::FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    void writeAt(std::uint64_t offset, const std::vector<char>& bytes);

    std::string path_;
    std::uint64_t total_size_;
    std::size_t segment_count_;

    std::unique_ptr<std::FILE, FileDeleter> file_{};
    ProgressObserver observer_;

    std::uint64_t bytes_written_{0};
    std::size_t segments_completed_{0};
    std::optional<std::size_t> failed_segment_;
};

} // namespace rangedl
