#pragma once

#include <curl/curl.h>

#include <cstddef>
#include <map>
#include <memory>
#include <string>

namespace rangedl::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

void ensureCurlInitialized();

// Throws TransportError if libcurl cannot hand out an easy handle.
[[nodiscard]] CurlHandle makeCurlHandle();

// URL, identity header, redirects and timeouts shared by every request.
void applyCommonOptions(CURL* curl, const std::string& url, char* error_buffer);

// Status line and headers of the last response seen on a handle; a new
// status line (after a redirect) discards what came before.
struct ResponseHead {
    long status{0};
    std::string status_text;   // "404 Not Found"
    std::map<std::string, std::string> headers;   // lower-case names
};

std::size_t headerCallback(char* buffer, std::size_t size, std::size_t nitems, void* userdata);

[[nodiscard]] inline bool isSuccess(long status) { return status >= 200 && status < 300; }

[[nodiscard]] std::string describeCurlError(CURLcode code, const char* error_buffer);

// A reply libcurl refused to parse (bad status line, invalid Content-Length)
// is a ProtocolError; every other failed transfer is a TransportError.
[[noreturn]] void throwTransferError(CURLcode code, const char* error_buffer);

} // namespace rangedl::detail
