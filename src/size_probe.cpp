#include "rangedl/size_probe.hpp"
#include "rangedl/detail/curl_utils.hpp"
#include "rangedl/error.hpp"

#include <charconv>
#include <system_error>

#include <fmt/format.h>

namespace rangedl {

bool parseContentLength(const std::string& value, std::uint64_t& out) {
    if (value.empty()) {
        return false;
    }
    const char* first = value.data();
    const char* last = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

std::uint64_t probeSize(const std::string& url) {
    auto curl = detail::makeCurlHandle();
    char error_buffer[CURL_ERROR_SIZE];
    detail::ResponseHead head;

    detail::applyCommonOptions(curl.get(), url, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &detail::headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &head);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_WEIRD_SERVER_REPLY && head.status != 0) {
        // libcurl 8 校验 Content-Length, 非整数的值在传输中就被拒绝
        throw ProtocolError(fmt::format("Failed to parse content-length: {}",
                                        detail::describeCurlError(res, error_buffer)));
    }
    if (res != CURLE_OK) {
        detail::throwTransferError(res, error_buffer);
    }

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    if (!detail::isSuccess(code)) {
        const std::string status = head.status_text.empty() ? std::to_string(code) : head.status_text;
        throw ProtocolError(fmt::format("Failed to get content-length: {}", status));
    }

    const auto it = head.headers.find("content-length");
    std::uint64_t size = 0;
    if (it == head.headers.end() || !parseContentLength(it->second, size)) {
        throw ProtocolError("Failed to parse content-length");
    }
    if (size == 0) {
        throw EmptyResourceError("File size is 0");
    }
    return size;
}

} // namespace rangedl
