#include "runtime/stream_demux.hpp"

#include <cstdint>

namespace boxrun::runtime {
namespace {

constexpr std::size_t kHeaderSize = 8;
constexpr unsigned char kStdout = 1;
constexpr unsigned char kStderr = 2;

}  // namespace

DemuxedStreams DemuxDockerStream(const std::string& raw) {
    DemuxedStreams streams{};
    std::size_t offset = 0;
    while (offset < raw.size()) {
        if (raw.size() - offset < kHeaderSize) {
            streams.truncated = true;
            break;
        }
        const auto* header = reinterpret_cast<const unsigned char*>(raw.data() + offset);
        const unsigned char stream_type = header[0];
        const std::uint32_t length =
            (static_cast<std::uint32_t>(header[4]) << 24) |
            (static_cast<std::uint32_t>(header[5]) << 16) |
            (static_cast<std::uint32_t>(header[6]) << 8) |
            static_cast<std::uint32_t>(header[7]);
        offset += kHeaderSize;

        std::size_t available = length;
        if (raw.size() - offset < length) {
            available = raw.size() - offset;
            streams.truncated = true;
        }
        if (stream_type == kStdout) {
            streams.stdout_bytes.append(raw, offset, available);
        } else if (stream_type == kStderr) {
            streams.stderr_bytes.append(raw, offset, available);
        }
        offset += available;
    }
    return streams;
}

}  // namespace boxrun::runtime
