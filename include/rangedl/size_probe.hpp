#pragma once

#include <cstdint>
#include <string>

namespace rangedl {

// Issues a HEAD request and returns the resource size from Content-Length.
//
// Throws TransportError when the request cannot complete, ProtocolError on a
// non-success status or a missing/unparseable length, and EmptyResourceError
// when the server reports zero bytes.
[[nodiscard]] std::uint64_t probeSize(const std::string& url);

// Strict decimal parse of a Content-Length value; false on anything else.
[[nodiscard]] bool parseContentLength(const std::string& value, std::uint64_t& out);

} // namespace rangedl
