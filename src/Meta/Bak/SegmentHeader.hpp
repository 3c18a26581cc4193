#pragma once
#include <cstdint>
#include <cstring>
#include <string>

#include "../Bak.hpp"

namespace Meta::Bak {
    constexpr char SEGMENT_MAGIC[4] = { 'M', 'S', 'E', 'G' };

    // followed by name_len bytes of name and payload_size bytes of CBOR
    struct __attribute__((packed)) SegmentHeader {
        char magic[4];
        uint16_t name_len;
        uint16_t flags;        // reserved, 0
        uint32_t payload_size;
        uint32_t payload_crc;  // crc32 of name + payload

        size_t record_size() const {
            return sizeof(SegmentHeader) + name_len + payload_size;
        }

        std::string to_string() const {
            return fmt::format("<SegmentHeader name_len: {:x}, flags: {:x}, payload_size: {:x}, payload_crc: {:08x}>",
                +name_len, +flags, +payload_size, +payload_crc); // unary + copies out of the packed struct
        }

        bool valid() const {
            return memcmp(magic, SEGMENT_MAGIC, sizeof(magic)) == 0 &&
                name_len != 0 && name_len <= MAX_NAME_LEN &&
                flags == 0 &&
                payload_size <= MAX_PAYLOAD_SIZE;
        }
    };
}
