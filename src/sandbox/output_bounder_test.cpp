#include "sandbox/output_bounder.hpp"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/text_codec.hpp"

namespace {

using ::testing::EndsWith;
using ::testing::StartsWith;

using boxrun::sandbox::BoundOutput;
using boxrun::sandbox::DecodeErrors;
using boxrun::sandbox::DecodeUtf8;
using boxrun::sandbox::TruncationSuffix;

TEST(OutputBounder, ShortTextUnchanged) {
    EXPECT_EQ(BoundOutput("hello", 10), "hello");
    EXPECT_EQ(BoundOutput("", 1), "");
}

TEST(OutputBounder, ExactLimitUnchanged) {
    const std::string text(64, 'a');
    EXPECT_EQ(BoundOutput(text, 64), text);
}

TEST(OutputBounder, TruncatesWithMarker) {
    const std::string text(100, 'a');
    const auto bounded = BoundOutput(text, 10);
    EXPECT_EQ(bounded, std::string(10, 'a') + "\n... Output truncated (exceeded 10 bytes)");
}

TEST(OutputBounder, DropsSplitMultibyteCharacter) {
    // "é" is two bytes; a limit of 2 lands inside the second one.
    const std::string text = "a\xC3\xA9" "bcdef";
    const auto bounded = BoundOutput(text, 2);
    EXPECT_THAT(bounded, StartsWith("a\n..."));
    EXPECT_EQ(bounded, "a" + TruncationSuffix(2));
}

TEST(OutputBounder, NeverExceedsLimitPlusSuffix) {
    const std::string snowman = "\xE2\x98\x83";
    std::string text;
    for (int i = 0; i < 50; ++i) {
        text += snowman + "x";
    }
    for (std::size_t limit = 1; limit < text.size(); limit += 7) {
        const auto bounded = BoundOutput(text, limit);
        EXPECT_LE(bounded.size(), limit + TruncationSuffix(limit).size()) << limit;
        EXPECT_THAT(bounded, EndsWith(TruncationSuffix(limit)));
        // The kept prefix is still valid UTF-8.
        const auto kept = bounded.substr(0, bounded.size() - TruncationSuffix(limit).size());
        EXPECT_EQ(DecodeUtf8(kept, DecodeErrors::kReplace), kept);
    }
}

}  // namespace
