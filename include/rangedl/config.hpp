#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace rangedl {

inline constexpr std::size_t kChunkSize = 8 * 1024;
inline constexpr std::size_t kDefaultThreads = 2;
inline constexpr std::size_t kChannelCapacity = 256;   // in-flight chunk events, 0 = unbounded
inline constexpr std::size_t kMaxErrorBody = 4 * 1024;

inline constexpr long kMaxRedirects = 10;
inline constexpr long kConnectTimeoutSec = 30;

inline constexpr const char* kUserAgent = "curl/7.81.0";

struct DownloadOptions {
    std::string url;
    std::size_t threads{kDefaultThreads};
    std::optional<std::string> output;
    bool verbose{false};
};

} // namespace rangedl
