#include "rangedl/file_naming.hpp"
#include "rangedl/detail/curl_utils.hpp"
#include "rangedl/error.hpp"

#include <filesystem>
#include <memory>
#include <system_error>

#include <fmt/format.h>

namespace rangedl {

namespace {

using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

bool exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

} // namespace

std::string fileNameFromUrl(const std::string& url) {
    UrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle) {
        throw InvalidUrlError("Failed to allocate URL parser");
    }

    if (const CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0); rc != CURLUE_OK) {
        throw InvalidUrlError(fmt::format("Invalid URL: {}", url));
    }

    char* raw_path = nullptr;
    if (curl_url_get(handle.get(), CURLUPART_PATH, &raw_path, 0) != CURLUE_OK || !raw_path) {
        return "index.html";
    }
    std::string path(raw_path);
    curl_free(raw_path);

    const auto slash = path.rfind('/');
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    return name.empty() ? "index.html" : name;
}

std::string avoidCollision(const std::string& name) {
    if (!exists(name)) {
        return name;
    }

    const std::filesystem::path original(name);
    const std::string extension = original.extension().string();
    const std::filesystem::path stem = original.parent_path() / original.stem();

    for (unsigned index = 1;; ++index) {
        const std::string candidate = extension.empty()
            ? fmt::format("{}.{}", original.string(), index)
            : fmt::format("{}.{}{}", stem.string(), index, extension);
        if (!exists(candidate)) {
            return candidate;
        }
    }
}

} // namespace rangedl
