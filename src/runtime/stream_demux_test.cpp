#include "runtime/stream_demux.hpp"

#include <cstdint>
#include <string>

#include "gtest/gtest.h"

namespace {

using boxrun::runtime::DemuxDockerStream;

std::string Frame(unsigned char stream, const std::string& payload) {
    std::string frame(8, '\0');
    frame[0] = static_cast<char>(stream);
    const auto size = static_cast<std::uint32_t>(payload.size());
    frame[4] = static_cast<char>((size >> 24) & 0xFF);
    frame[5] = static_cast<char>((size >> 16) & 0xFF);
    frame[6] = static_cast<char>((size >> 8) & 0xFF);
    frame[7] = static_cast<char>(size & 0xFF);
    return frame + payload;
}

TEST(StreamDemux, SplitsInterleavedFrames) {
    const auto raw = Frame(1, "hello ") + Frame(2, "oops\n") + Frame(1, "world\n");
    const auto streams = DemuxDockerStream(raw);
    EXPECT_EQ(streams.stdout_bytes, "hello world\n");
    EXPECT_EQ(streams.stderr_bytes, "oops\n");
    EXPECT_FALSE(streams.truncated);
}

TEST(StreamDemux, EmptyInput) {
    const auto streams = DemuxDockerStream("");
    EXPECT_TRUE(streams.stdout_bytes.empty());
    EXPECT_TRUE(streams.stderr_bytes.empty());
    EXPECT_FALSE(streams.truncated);
}

TEST(StreamDemux, IgnoresStdinFrames) {
    const auto streams = DemuxDockerStream(Frame(0, "typed") + Frame(1, "out"));
    EXPECT_EQ(streams.stdout_bytes, "out");
}

TEST(StreamDemux, LargeFrameLength) {
    const std::string payload(70000, 'x');
    const auto streams = DemuxDockerStream(Frame(2, payload));
    EXPECT_EQ(streams.stderr_bytes.size(), 70000u);
}

TEST(StreamDemux, KeepsPartialPayloadAndFlagsTruncation) {
    auto raw = Frame(1, "abcdef");
    raw.resize(raw.size() - 2);
    const auto streams = DemuxDockerStream(raw);
    EXPECT_EQ(streams.stdout_bytes, "abcd");
    EXPECT_TRUE(streams.truncated);
}

TEST(StreamDemux, ShortHeaderIsTruncation) {
    const auto streams = DemuxDockerStream(Frame(1, "ok") + std::string("\x01\x00\x00", 3));
    EXPECT_EQ(streams.stdout_bytes, "ok");
    EXPECT_TRUE(streams.truncated);
}

}  // namespace
