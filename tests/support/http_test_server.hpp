#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace rangedl::testing {

// What the server returns for one path.
struct TestResource {
    std::string body;
    int head_status{200};
    bool send_content_length{true};
    std::optional<std::string> content_length;       // raw Content-Length value
    std::optional<std::uint64_t> fail_range_start;   // GET ranges starting here fail
    int fail_status{500};
    std::string fail_body;
    bool ignore_range{false};                         // answer 200 with the whole body
};

struct RecordedRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;   // lower-case names
};

// Minimal HTTP/1.1 server on 127.0.0.1, one connection per request.
class HttpTestServer {
public:
    HttpTestServer();
    ~HttpTestServer();

    HttpTestServer(const HttpTestServer&) = delete;
    HttpTestServer& operator=(const HttpTestServer&) = delete;

    void addResource(const std::string& path, TestResource resource);

    [[nodiscard]] std::string url(const std::string& path) const;
    [[nodiscard]] std::vector<RecordedRequest> requests() const;

    // A local port with nothing listening on it.
    [[nodiscard]] static std::uint16_t unusedPort();

private:
    void acceptLoop();
    void handle(int fd);

    int listen_fd_{-1};
    std::uint16_t port_{0};
    std::atomic<bool> stopping_{false};
    std::thread acceptor_;

    mutable std::mutex mutex_;
    std::vector<std::thread> handlers_;
    std::map<std::string, TestResource> resources_;
    std::vector<RecordedRequest> requests_;
};

// Deterministic, non-repeating-looking payload of the given size.
[[nodiscard]] std::string makePayload(std::size_t size);

} // namespace rangedl::testing
