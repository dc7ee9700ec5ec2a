#pragma once

#include <string>

namespace boxrun::sandbox {

enum class DecodeErrors {
    kReplace,
    kIgnore
};

// Decodes UTF-8 |bytes| into valid UTF-8. Each maximal ill-formed subsequence
// becomes U+FFFD (kReplace) or is dropped (kIgnore).
std::string DecodeUtf8(const std::string& bytes, DecodeErrors errors);

// Decodes captured output in |encoding| (utf-8, latin-1 or ascii) into UTF-8
// with replacement on error. Unknown encodings are treated as utf-8.
std::string DecodeOutput(const std::string& bytes, const std::string& encoding);

}  // namespace boxrun::sandbox
