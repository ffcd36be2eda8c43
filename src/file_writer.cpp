#include "rangedl/file_writer.hpp"
#include "rangedl/error.hpp"

#include <cerrno>
#include <cstring>
#include <utility>
#include <variant>

#include <fmt/format.h>
#include <sys/types.h>

namespace rangedl {

namespace {

std::string osError(const char* what, const std::string& path) {
    return fmt::format("{} {}: {}", what, path, std::strerror(errno));
}

} // namespace

FileWriter::FileWriter(std::string path, std::uint64_t total_size, std::size_t segment_count)
    : path_(std::move(path)),
      total_size_(total_size),
      segment_count_(segment_count) {}

void FileWriter::open() {
    file_.reset(std::fopen(path_.c_str(), "wb"));
    if (!file_) {
        throw IoError(osError("Cannot create destination file", path_));
    }
}

void FileWriter::consume(EventReceiver& events) {
    while (segments_completed_ < segment_count_) {
        auto event = events.receive();
        if (!event) {
            throw ChannelClosedError("All segment fetchers stopped before the download finished");
        }

        if (auto* chunk = std::get_if<Chunk>(&*event)) {
            writeAt(chunk->offset, chunk->bytes);
            bytes_written_ += chunk->bytes.size();
            if (observer_) {
                observer_({total_size_, bytes_written_, segments_completed_, segment_count_});
            }
        } else if (auto* failed = std::get_if<SegmentFailed>(&*event)) {
            failed_segment_ = failed->segment_index;
            std::rethrow_exception(failed->error);
        } else if (std::holds_alternative<SegmentDone>(*event)) {
            ++segments_completed_;
        }
    }
}

void FileWriter::close() {
    if (!file_) {
        return;
    }
    if (std::fflush(file_.get()) != 0) {
        const auto message = osError("Failed to flush", path_);
        file_.reset();
        throw IoError(message);
    }
    file_.reset();
}

void FileWriter::writeAt(std::uint64_t offset, const std::vector<char>& bytes) {
    std::FILE* file = file_.get();
    if (!file) {
        throw IoError(fmt::format("Destination file {} is not open", path_));
    }
    if (offset > total_size_ || bytes.size() > total_size_ - offset) {
        throw IoError(fmt::format("Chunk at offset {} ({} bytes) exceeds file size {}",
                                  offset, bytes.size(), total_size_));
    }

    if (fseeko(file, static_cast<off_t>(offset), SEEK_SET) != 0) {
        throw IoError(osError("Failed to seek output file", path_));
    }
    if (std::fwrite(bytes.data(), 1, bytes.size(), file) != bytes.size()) {
        throw IoError(osError("Failed to write output file", path_));
    }
}

} // namespace rangedl
