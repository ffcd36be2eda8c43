#pragma once

#include "range_planner.hpp"
#include "task_event.hpp"

#include <cstdint>
#include <string>

namespace rangedl {

// Streams one byte range of the resource into the result channel as
// kChunkSize chunks, then reports SegmentDone or SegmentFailed exactly once.
// Never touches the output file.
class SegmentFetcher {
public:
    SegmentFetcher(std::string url, Segment segment, EventSender events);

    // Runs to completion on the calling thread and returns the absolute
    // position reached. Errors are delivered as a SegmentFailed event rather
    // than thrown.
    std::uint64_t run();

private:
    void fetch();

    std::string url_;
    Segment segment_;
    EventSender events_;
    std::uint64_t position_;
};

} // namespace rangedl
