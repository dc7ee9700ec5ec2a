#include "sandbox/output_bounder.hpp"

#include "sandbox/text_codec.hpp"

namespace boxrun::sandbox {

std::string TruncationSuffix(std::size_t max_bytes) {
    return "\n... Output truncated (exceeded " + std::to_string(max_bytes) + " bytes)";
}

std::string BoundOutput(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    auto truncated = DecodeUtf8(text.substr(0, max_bytes), DecodeErrors::kIgnore);
    return truncated + TruncationSuffix(max_bytes);
}

}  // namespace boxrun::sandbox
