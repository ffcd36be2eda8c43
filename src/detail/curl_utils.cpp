#include "rangedl/detail/curl_utils.hpp"
#include "rangedl/config.hpp"
#include "rangedl/error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string_view>

namespace rangedl::detail {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw TransportError("Failed to allocate curl handle");
    }
    return curl;
}

void applyCommonOptions(CURL* curl, const std::string& url, char* error_buffer) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, kMaxRedirects);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSec);
    // 多线程下必须关闭信号, 否则 DNS 超时会用 SIGALRM
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (error_buffer) {
        error_buffer[0] = '\0';
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    }
}

std::size_t headerCallback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    const std::size_t total = size * nitems;
    auto* head = static_cast<ResponseHead*>(userdata);
    if (!head) {
        return total;
    }

    const std::string_view line = trim(std::string_view(buffer, total));
    if (line.rfind("HTTP/", 0) == 0) {
        head->headers.clear();
        head->status = 0;
        head->status_text.clear();

        const auto code_pos = line.find(' ');
        if (code_pos != std::string_view::npos) {
            head->status_text = std::string(trim(line.substr(code_pos + 1)));
            head->status = std::strtol(head->status_text.c_str(), nullptr, 10);
        }
        return total;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return total;
    }

    std::string name(trim(line.substr(0, colon)));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    head->headers[name] = std::string(trim(line.substr(colon + 1)));
    return total;
}

std::string describeCurlError(CURLcode code, const char* error_buffer) {
    std::string message = curl_easy_strerror(code);
    if (error_buffer && error_buffer[0] != '\0') {
        message += ": ";
        message += error_buffer;
    }
    return message;
}

void throwTransferError(CURLcode code, const char* error_buffer) {
    if (code == CURLE_WEIRD_SERVER_REPLY) {
        throw ProtocolError(describeCurlError(code, error_buffer));
    }
    throw TransportError(describeCurlError(code, error_buffer));
}

} // namespace rangedl::detail
