#include "rangedl/downloader.hpp"
#include "rangedl/error.hpp"
#include "rangedl/file_naming.hpp"
#include "rangedl/file_writer.hpp"
#include "rangedl/progress.hpp"
#include "rangedl/range_planner.hpp"
#include "rangedl/segment_fetcher.hpp"
#include "rangedl/size_probe.hpp"
#include "rangedl/task_event.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace rangedl {

const char* toString(DownloadPhase phase) {
    switch (phase) {
    case DownloadPhase::planning:
        return "planning";
    case DownloadPhase::running:
        return "running";
    case DownloadPhase::succeeded:
        return "succeeded";
    case DownloadPhase::failed:
        return "failed";
    }
    return "unknown";
}

class Downloader::Impl {
public:
    explicit Impl(DownloadOptions options)
        : options_(std::move(options)) {
        options_.threads = std::max<std::size_t>(1, options_.threads);
    }

    ~Impl() { joinWorkers(); }

    std::string run() {
        try {
            return download();
        } catch (const std::exception&) {
            phase_ = DownloadPhase::failed;
            throw;
        }
    }

    [[nodiscard]] DownloadPhase phase() const { return phase_; }
    [[nodiscard]] std::uint64_t totalBytes() const { return total_bytes_; }
    [[nodiscard]] std::uint64_t bytesWritten() const { return bytes_written_; }

private:
    std::string download() {
        phase_ = DownloadPhase::planning;
        joinWorkers();
        total_bytes_ = 0;
        bytes_written_ = 0;

        const std::string requested = options_.output ? *options_.output : fileNameFromUrl(options_.url);
        total_bytes_ = probeSize(options_.url);
        const std::string file_name = avoidCollision(requested);

        if (options_.verbose) {
            fmt::print("Downloading {} to {} with {} threads, content-length: {} ({})\n",
                       options_.url, file_name, options_.threads, total_bytes_, formatSize(total_bytes_));
        }

        const auto segments = planSegments(total_bytes_, options_.threads);
        FileWriter writer(file_name, total_bytes_, segments.size());
        writer.open();

        ProgressBar bar;
        if (options_.verbose) {
            writer.onProgress([&bar](const Progress& progress) { bar.update(progress); });
        }

        phase_ = DownloadPhase::running;
        auto channel = makeChannel<TaskEvent>(kChannelCapacity);
        EventReceiver events = std::move(channel.second);
        spawnFetchers(segments, std::move(channel.first));
        const auto started = std::chrono::steady_clock::now();

        std::exception_ptr failure;
        try {
            writer.consume(events);
            writer.close();
        } catch (const std::exception& ex) {
            failure = std::current_exception();
            if (options_.verbose && writer.failedSegment()) {
                fmt::print(stderr, "\nThread {} failed: {}\n", *writer.failedSegment(), ex.what());
            }
        }
        bytes_written_ = writer.bytesWritten();

        // 关闭通道后, 仍在传输的分段会在下一次发送或进度回调时中止
        events.close();
        joinWorkers();

        if (failure) {
            std::rethrow_exception(failure);
        }

        phase_ = DownloadPhase::succeeded;
        if (options_.verbose) {
            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
            const double seconds = std::max(elapsed.count(), 1e-6);
            fmt::print("Downloaded {} bytes in {:.3f} seconds, speed: {:.2f} MB/s\n",
                       total_bytes_, elapsed.count(),
                       static_cast<double>(total_bytes_) / 1024.0 / 1024.0 / seconds);
        }
        return file_name;
    }

    void spawnFetchers(const std::vector<Segment>& segments, EventSender sender) {
        workers_.reserve(segments.size());
        for (const auto& segment : segments) {
            if (options_.verbose) {
                fmt::print("Thread {} start: pos={} length={}\n", segment.index, segment.start, segment.length);
            }
            workers_.emplace_back([url = options_.url, segment, sender]() mutable {
                SegmentFetcher fetcher(std::move(url), segment, std::move(sender));
                fetcher.run();
            });
        }
    }

    void joinWorkers() {
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    DownloadOptions options_;
    std::vector<std::thread> workers_;

    DownloadPhase phase_{DownloadPhase::planning};
    std::uint64_t total_bytes_{0};
    std::uint64_t bytes_written_{0};
};

Downloader::Downloader(DownloadOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

Downloader::~Downloader() = default;

std::string Downloader::run() { return impl_->run(); }

DownloadPhase Downloader::phase() const { return impl_->phase(); }

std::uint64_t Downloader::totalBytes() const { return impl_->totalBytes(); }

std::uint64_t Downloader::bytesWritten() const { return impl_->bytesWritten(); }

} // namespace rangedl
