#include "sandbox/payload_packager.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <set>
#include <sstream>
#include <stdexcept>

namespace boxrun::sandbox {
namespace {

constexpr std::size_t kBlockSize = 512;
constexpr std::size_t kNameSize = 100;
constexpr std::size_t kPrefixSize = 155;
constexpr std::uint64_t kMaxEntrySize = 077777777777ULL;

#pragma pack(push, 1)
struct TarHeader {
    char name[kNameSize];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char chksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[kPrefixSize];
    char padding[12];
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == kBlockSize, "TarHeader must be one block");

void WriteOctal(char* dest, std::size_t size, std::uint64_t value) {
    const std::size_t digits = size - 1;
    dest[digits] = '\0';
    for (std::size_t i = digits; i > 0; --i) {
        dest[i - 1] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
}

void ValidatePath(const std::string& path) {
    if (path.empty()) {
        throw std::invalid_argument("payload path is empty");
    }
    if (path.front() == '/' || path.back() == '/') {
        throw std::invalid_argument("payload path must be a relative file path: " + path);
    }
    if (path.find('\0') != std::string::npos) {
        throw std::invalid_argument("payload path contains NUL");
    }
    std::istringstream parts(path);
    std::string part;
    while (std::getline(parts, part, '/')) {
        if (part.empty() || part == "..") {
            throw std::invalid_argument("payload path has an empty or '..' component: " + path);
        }
    }
}

void SetName(TarHeader& header, const std::string& path) {
    if (path.size() <= kNameSize) {
        std::memcpy(header.name, path.data(), path.size());
        return;
    }
    // Split at a slash so the tail fits in name and the head in prefix.
    const auto split = path.rfind('/', kPrefixSize);
    if (split == std::string::npos || path.size() - split - 1 > kNameSize) {
        throw std::invalid_argument("payload path too long for ustar: " + path);
    }
    std::memcpy(header.prefix, path.data(), split);
    std::memcpy(header.name, path.data() + split + 1, path.size() - split - 1);
}

TarHeader MakeHeader(const PayloadFile& file) {
    TarHeader header;
    std::memset(&header, 0, sizeof(header));
    SetName(header, file.path);
    WriteOctal(header.mode, sizeof(header.mode), 0644);
    WriteOctal(header.uid, sizeof(header.uid), 0);
    WriteOctal(header.gid, sizeof(header.gid), 0);
    WriteOctal(header.size, sizeof(header.size), file.content.size());
    WriteOctal(header.mtime, sizeof(header.mtime), 0);
    header.typeflag = '0';
    std::memcpy(header.magic, "ustar", 6);
    header.version[0] = '0';
    header.version[1] = '0';

    const auto* bytes = reinterpret_cast<const unsigned char*>(&header);
    std::uint32_t checksum = 0;
    for (std::size_t i = 0; i < sizeof(header); ++i) {
        const bool in_chksum = i >= offsetof(TarHeader, chksum) &&
            i < offsetof(TarHeader, chksum) + sizeof(header.chksum);
        checksum += in_chksum ? ' ' : bytes[i];
    }
    char formatted[8];
    std::snprintf(formatted, sizeof(formatted), "%06o", checksum);
    std::memcpy(header.chksum, formatted, 6);
    header.chksum[6] = '\0';
    header.chksum[7] = ' ';
    return header;
}

}  // namespace

std::string PayloadPackager::Pack(const std::vector<PayloadFile>& files) {
    std::set<std::string> seen;
    for (const auto& file : files) {
        ValidatePath(file.path);
        if (!seen.insert(file.path).second) {
            throw std::invalid_argument("duplicate payload path: " + file.path);
        }
        if (file.content.size() > kMaxEntrySize) {
            throw std::invalid_argument("payload file too large: " + file.path);
        }
    }

    std::string archive;
    for (const auto& file : files) {
        const auto header = MakeHeader(file);
        archive.append(reinterpret_cast<const char*>(&header), sizeof(header));
        archive.append(file.content);
        const auto remainder = file.content.size() % kBlockSize;
        if (remainder != 0) {
            archive.append(kBlockSize - remainder, '\0');
        }
    }
    archive.append(kBlockSize * 2, '\0');
    return archive;
}

}  // namespace boxrun::sandbox
