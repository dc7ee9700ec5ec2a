#pragma once

#include <string>

namespace boxrun::runtime {

struct DemuxedStreams {
    std::string stdout_bytes;
    std::string stderr_bytes;
    // Set when the input ended inside a frame header or payload.
    bool truncated = false;
};

// Splits Docker's multiplexed attach stream. Each frame is an 8-byte header
// (stream type, three zero bytes, big-endian payload length) followed by the
// payload. Stream type 1 is stdout, 2 is stderr; stdin frames are ignored.
DemuxedStreams DemuxDockerStream(const std::string& raw);

}  // namespace boxrun::runtime
