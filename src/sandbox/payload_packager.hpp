#pragma once

#include <string>
#include <vector>

namespace boxrun::sandbox {

struct PayloadFile {
    std::string path;
    std::string content;
};

class PayloadPackager {
public:
    // Builds a ustar archive holding |files| in order. Paths are relative,
    // unique and free of ".." components; violations throw
    // std::invalid_argument. Header fields other than name and size are
    // fixed, so equal inputs extract to identical trees.
    static std::string Pack(const std::vector<PayloadFile>& files);
};

}  // namespace boxrun::sandbox
