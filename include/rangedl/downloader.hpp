#pragma once

#include "config.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace rangedl {

enum class DownloadPhase {
    planning,
    running,
    succeeded,
    failed,
};

[[nodiscard]] const char* toString(DownloadPhase phase);

// Probes the resource size, splits it into one range per thread, fetches the
// ranges concurrently and reassembles them into a single file.
class Downloader final {
public:
    explicit Downloader(DownloadOptions options);
    ~Downloader();

    Downloader(const Downloader&) = delete;
    Downloader& operator=(const Downloader&) = delete;

    // Returns the name of the file written. Throws a DownloadError subclass on
    // failure; a partially written file is left where it is.
    std::string run();

    [[nodiscard]] DownloadPhase phase() const;
    [[nodiscard]] std::uint64_t totalBytes() const;
    [[nodiscard]] std::uint64_t bytesWritten() const;

private:
    //用 impl 隔离 curl 和线程相关的依赖
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rangedl
