#include "rangedl/segment_fetcher.hpp"
#include "rangedl/config.hpp"
#include "rangedl/detail/curl_utils.hpp"
#include "rangedl/error.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <fmt/format.h>

namespace rangedl {

namespace {

struct TransferContext {
    const Segment* segment{nullptr};
    EventSender* events{nullptr};
    std::uint64_t* position{nullptr};
    CURL* curl{nullptr};
    long status{0};
    std::string error_body;
    std::exception_ptr failure;
};

bool emitChunks(TransferContext& ctx, const char* data, std::size_t size) {
    while (size > 0) {
        const std::size_t n = std::min(size, kChunkSize);
        Chunk chunk{ctx.segment->index, *ctx.position, std::vector<char>(data, data + n)};
        if (!ctx.events->send(std::move(chunk))) {
            ctx.failure = std::make_exception_ptr(ChannelClosedError("Failed to send download event"));
            return false;
        }
        *ctx.position += n;
        data += n;
        size -= n;
    }
    return true;
}

std::size_t writeCallback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const std::size_t total = size * nmemb;
    if (!ctx || total == 0) {
        return 0;
    }

    if (ctx->status == 0) {
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->status);
    }
    if (!detail::isSuccess(ctx->status)) {
        // 错误响应的正文留作错误描述
        const std::size_t room = kMaxErrorBody - std::min(kMaxErrorBody, ctx->error_body.size());
        ctx->error_body.append(ptr, std::min(room, total));
        return total;
    }

    if (*ctx->position + total > ctx->segment->end()) {
        ctx->failure = std::make_exception_ptr(ProtocolError(fmt::format(
            "Server sent data past the end of range {}-{}", ctx->segment->start, ctx->segment->end() - 1)));
        return 0;
    }

    try {
        return emitChunks(*ctx, ptr, total) ? total : 0;
    } catch (const std::exception&) {
        // 异常不能穿过 libcurl 的 C 栈帧
        ctx->failure = std::current_exception();
        return 0;
    }
}

int progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    return (ctx && ctx->events->isClosed()) ? 1 : 0;
}

std::string trimmed(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

SegmentFetcher::SegmentFetcher(std::string url, Segment segment, EventSender events)
    : url_(std::move(url)),
      segment_(segment),
      events_(std::move(events)),
      position_(segment.start) {}

std::uint64_t SegmentFetcher::run() {
    try {
        fetch();
    } catch (const std::exception& ex) {
        // 接收端已关闭时这条事件无人接收, 直接结束即可
        static_cast<void>(events_.send(SegmentFailed{segment_.index, std::current_exception(), ex.what()}));
        return position_;
    }

    static_cast<void>(events_.send(SegmentDone{segment_.index}));
    return position_;
}

void SegmentFetcher::fetch() {
    if (segment_.length == 0) {
        return;
    }

    auto curl = detail::makeCurlHandle();
    char error_buffer[CURL_ERROR_SIZE];
    detail::ResponseHead head;
    TransferContext ctx{&segment_, &events_, &position_, curl.get()};
    const std::string range = fmt::format("{}-{}", segment_.start, segment_.end() - 1);

    detail::applyCommonOptions(curl.get(), url_, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(kChunkSize));
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &detail::headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &head);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);

    const CURLcode res = curl_easy_perform(curl.get());
    if (ctx.failure) {
        std::rethrow_exception(ctx.failure);
    }
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw ChannelClosedError("Result channel closed, transfer aborted");
    }
    if (res != CURLE_OK) {
        detail::throwTransferError(res, error_buffer);
    }

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    if (!detail::isSuccess(code)) {
        std::string reason = trimmed(ctx.error_body);
        if (reason.empty()) {
            reason = head.status_text.empty() ? std::to_string(code) : head.status_text;
        }
        throw ProtocolError(reason);
    }

    if (position_ != segment_.end()) {
        throw ProtocolError(fmt::format("Range download incomplete: received {} of {} bytes",
                                        position_ - segment_.start, segment_.length));
    }
}

} // namespace rangedl
