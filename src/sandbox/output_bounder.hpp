#pragma once

#include <cstddef>
#include <string>

namespace boxrun::sandbox {

// Suffix appended after truncation, e.g. "\n... Output truncated (exceeded 10240 bytes)".
std::string TruncationSuffix(std::size_t max_bytes);

// Returns |text| unchanged when its UTF-8 size is at most |max_bytes|.
// Otherwise keeps the first |max_bytes| bytes, drops a trailing partial
// character and appends TruncationSuffix(max_bytes).
std::string BoundOutput(const std::string& text, std::size_t max_bytes);

}  // namespace boxrun::sandbox
