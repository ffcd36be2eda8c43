#pragma once

#include "result_channel.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <variant>
#include <vector>

namespace rangedl {

struct Chunk {
    std::size_t segment_index{0};
    std::uint64_t offset{0};   // absolute position in the resource
    std::vector<char> bytes;
};

struct SegmentFailed {
    std::size_t segment_index{0};
    std::exception_ptr error;
    std::string message;
};

struct SegmentDone {
    std::size_t segment_index{0};
};

using TaskEvent = std::variant<Chunk, SegmentFailed, SegmentDone>;

using EventSender = Sender<TaskEvent>;
using EventReceiver = Receiver<TaskEvent>;

} // namespace rangedl
