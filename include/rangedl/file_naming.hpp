#pragma once

#include <string>

namespace rangedl {

// Last non-empty path segment of the URL, or "index.html". Throws
// InvalidUrlError when the URL cannot be parsed.
[[nodiscard]] std::string fileNameFromUrl(const std::string& url);

// Returns name unchanged if nothing exists there, otherwise the first free
// "stem.N.ext" (or "name.N" without an extension), N = 1, 2, ...
[[nodiscard]] std::string avoidCollision(const std::string& name);

} // namespace rangedl
