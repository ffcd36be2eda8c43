#include <catch2/catch.hpp>

#include "rangedl/error.hpp"
#include "rangedl/file_writer.hpp"
#include "rangedl/task_event.hpp"
#include "support/temp_dir.hpp"

#include <exception>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

using namespace rangedl;
using rangedl::testing::readFile;
using rangedl::testing::TempDir;

namespace {

Chunk chunkOf(std::size_t segment, std::uint64_t offset, const std::string& text) {
    return Chunk{segment, offset, std::vector<char>(text.begin(), text.end())};
}

SegmentFailed failureOf(std::size_t segment, const std::string& message) {
    return SegmentFailed{segment, std::make_exception_ptr(ProtocolError(message)), message};
}

} // namespace

TEST_CASE("FileWriter places chunks by offset, not arrival order", "[writer]") {
    TempDir dir;
    const auto path = dir.file("out.bin");

    auto channel = makeChannel<TaskEvent>();
    auto events = std::move(channel.second);
    auto sender = std::move(channel.first);

    REQUIRE(sender.send(chunkOf(1, 5, "FGH")));
    REQUIRE(sender.send(chunkOf(0, 0, "ABC")));
    REQUIRE(sender.send(chunkOf(1, 8, "IJ")));
    REQUIRE(sender.send(SegmentDone{1}));
    REQUIRE(sender.send(chunkOf(0, 3, "DE")));
    REQUIRE(sender.send(SegmentDone{0}));

    FileWriter writer(path, 10, 2);
    writer.open();
    writer.consume(events);
    writer.close();

    CHECK(writer.bytesWritten() == 10);
    CHECK(writer.segmentsCompleted() == 2);
    CHECK_FALSE(writer.failedSegment());
    CHECK(readFile(path) == "ABCDEFGHIJ");
}

TEST_CASE("FileWriter reports progress monotonically", "[writer]") {
    TempDir dir;
    auto channel = makeChannel<TaskEvent>();
    auto events = std::move(channel.second);
    auto sender = std::move(channel.first);

    REQUIRE(sender.send(chunkOf(0, 0, "aa")));
    REQUIRE(sender.send(chunkOf(1, 4, "cc")));
    REQUIRE(sender.send(chunkOf(0, 2, "bb")));
    REQUIRE(sender.send(SegmentDone{0}));
    REQUIRE(sender.send(SegmentDone{1}));

    std::vector<std::uint64_t> seen;
    FileWriter writer(dir.file("progress.bin"), 6, 2);
    writer.onProgress([&seen](const Progress& progress) {
        CHECK(progress.total_bytes == 6);
        CHECK(progress.segment_count == 2);
        seen.push_back(progress.written_bytes);
    });
    writer.open();
    writer.consume(events);

    CHECK(seen == std::vector<std::uint64_t>{2, 4, 6});
}

TEST_CASE("FileWriter stops at the first failure", "[writer]") {
    TempDir dir;
    const auto path = dir.file("failed.bin");

    auto channel = makeChannel<TaskEvent>();
    auto events = std::move(channel.second);
    auto sender = std::move(channel.first);

    REQUIRE(sender.send(chunkOf(0, 0, "xy")));
    REQUIRE(sender.send(SegmentDone{0}));
    REQUIRE(sender.send(failureOf(2, "segment unavailable")));
    REQUIRE(sender.send(failureOf(1, "second failure")));
    REQUIRE(sender.send(SegmentDone{3}));

    FileWriter writer(path, 8, 4);
    writer.open();
    CHECK_THROWS_AS(writer.consume(events), ProtocolError);
    CHECK(writer.failedSegment() == std::optional<std::size_t>{2});
    CHECK(writer.segmentsCompleted() == 1);
    CHECK(writer.bytesWritten() == 2);

    // The partial file stays on disk.
    writer.close();
    CHECK(std::filesystem::exists(path));
}

TEST_CASE("FileWriter rethrows the original error object", "[writer]") {
    TempDir dir;
    auto channel = makeChannel<TaskEvent>();
    auto events = std::move(channel.second);
    auto sender = std::move(channel.first);

    REQUIRE(sender.send(SegmentFailed{0, std::make_exception_ptr(TransportError("connection reset")),
                                      "connection reset"}));

    FileWriter writer(dir.file("transport.bin"), 4, 1);
    writer.open();
    CHECK_THROWS_WITH(writer.consume(events), "connection reset");
}

TEST_CASE("FileWriter fails when every sender disappears early", "[writer]") {
    TempDir dir;
    auto channel = makeChannel<TaskEvent>();
    auto events = std::move(channel.second);
    {
        auto sender = std::move(channel.first);
        REQUIRE(sender.send(chunkOf(0, 0, "ab")));
        REQUIRE(sender.send(SegmentDone{0}));
    }

    FileWriter writer(dir.file("orphan.bin"), 4, 2);
    writer.open();
    CHECK_THROWS_AS(writer.consume(events), ChannelClosedError);
    CHECK(writer.segmentsCompleted() == 1);
}

TEST_CASE("FileWriter rejects writes outside the resource", "[writer]") {
    TempDir dir;
    auto channel = makeChannel<TaskEvent>();
    auto events = std::move(channel.second);
    auto sender = std::move(channel.first);

    REQUIRE(sender.send(chunkOf(0, 3, "toolong")));

    FileWriter writer(dir.file("bounds.bin"), 4, 1);
    writer.open();
    CHECK_THROWS_AS(writer.consume(events), IoError);
}

TEST_CASE("FileWriter reports unwritable destinations", "[writer]") {
    TempDir dir;
    FileWriter writer(dir.file("missing/dir/out.bin"), 4, 1);
    CHECK_THROWS_AS(writer.open(), IoError);
}
