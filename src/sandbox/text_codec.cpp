#include "sandbox/text_codec.hpp"

#include <cstdint>

#include "utils/common.hpp"

namespace boxrun::sandbox {
namespace {

constexpr const char* kReplacement = "\xEF\xBF\xBD";

void AppendCodePoint(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Number of bytes of a well-formed sequence starting at |pos|, or the length
// of the ill-formed prefix negated (at least -1).
int MeasureSequence(const std::string& bytes, std::size_t pos) {
    const auto lead = static_cast<unsigned char>(bytes[pos]);
    if (lead < 0x80) {
        return 1;
    }
    int length = 0;
    unsigned char lower = 0x80;
    unsigned char upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead == 0xE0) {
        length = 3;
        lower = 0xA0;
    } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        length = 3;
    } else if (lead == 0xED) {
        length = 3;
        upper = 0x9F;
    } else if (lead == 0xF0) {
        length = 4;
        lower = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        length = 4;
    } else if (lead == 0xF4) {
        length = 4;
        upper = 0x8F;
    } else {
        return -1;
    }
    for (int i = 1; i < length; ++i) {
        if (pos + i >= bytes.size()) {
            return -i;
        }
        const auto c = static_cast<unsigned char>(bytes[pos + i]);
        const unsigned char lo = i == 1 ? lower : 0x80;
        const unsigned char hi = i == 1 ? upper : 0xBF;
        if (c < lo || c > hi) {
            return -i;
        }
    }
    return length;
}

}  // namespace

std::string DecodeUtf8(const std::string& bytes, DecodeErrors errors) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const int measured = MeasureSequence(bytes, pos);
        if (measured > 0) {
            out.append(bytes, pos, static_cast<std::size_t>(measured));
            pos += static_cast<std::size_t>(measured);
            continue;
        }
        if (errors == DecodeErrors::kReplace) {
            out.append(kReplacement);
        }
        pos += static_cast<std::size_t>(-measured);
    }
    return out;
}

std::string DecodeOutput(const std::string& bytes, const std::string& encoding) {
    const auto name = utils::ToLower(encoding);
    if (name == "latin-1" || name == "latin1" || name == "iso-8859-1") {
        std::string out;
        out.reserve(bytes.size());
        for (const char c : bytes) {
            AppendCodePoint(out, static_cast<unsigned char>(c));
        }
        return out;
    }
    if (name == "ascii" || name == "us-ascii") {
        std::string out;
        out.reserve(bytes.size());
        for (const char c : bytes) {
            if (static_cast<unsigned char>(c) < 0x80) {
                out.push_back(c);
            } else {
                out.append(kReplacement);
            }
        }
        return out;
    }
    return DecodeUtf8(bytes, DecodeErrors::kReplace);
}

}  // namespace boxrun::sandbox
