#pragma once
#include <cstdint>
#include <cstring>
#include <string>

#include "../Bak.hpp"

namespace Meta::Bak {
    constexpr char TRAILER_MAGIC[4] = { 'M', 'B', 'A', 'K' };

    // last 24 bytes of a container
    struct __attribute__((packed)) BakTrailer {
        uint64_t index_offset;
        uint32_t index_size;
        uint32_t index_crc;
        uint32_t version;
        char magic[4];

        std::string to_string() const {
            return fmt::format("<BakTrailer index_offset: {:x}, index_size: {:x}, index_crc: {:08x}, version: {}>",
                +index_offset, +index_size, +index_crc, +version);
        }

        bool valid() const {
            return memcmp(magic, TRAILER_MAGIC, sizeof(magic)) == 0 &&
                version != 0 && version <= BAK_VERSION;
        }
    };
}
