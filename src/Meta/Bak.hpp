#pragma once
#include <array>
#include <cstdint>
#include <string_view>
#include <spdlog/fmt/fmt.h>

// Binary metadata backup container ("bak").
//
//   [segment]...[segment][index][trailer]
//
// Segments are appended as they are produced; the index and the fixed-size
// trailer are written last, so a reader starts at EOF. All integers are little-endian.
namespace Meta::Bak {

constexpr uint32_t BAK_VERSION = 1;
constexpr uint32_t MAX_PAYLOAD_SIZE = 256 << 20;
constexpr size_t MAX_NAME_LEN = 255;

// segment names produced by a metadata dump, in dump order
constexpr std::array<const char*, 14> SEGMENT_NAMES = {
    "format", "counter", "sustained", "delfile", "sliceref", "acl", "xattr",
    "quota", "stat", "inode", "chunk", "edge", "parent", "symlink",
};

// names become file names of a metadata store, so no path separators or parent references
inline bool valid_segment_name(std::string_view name) {
    return !name.empty() && name.size() <= MAX_NAME_LEN
        && name.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos
        && name.find("..") == std::string_view::npos;
}

}
