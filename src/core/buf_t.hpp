#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>
#include <cstring>

class buf_t : public std::vector<uint8_t> {
    public:
    buf_t() = default;
    buf_t(size_t size) : std::vector<uint8_t>(size) {}
    buf_t(const void* data, size_t size)
        : std::vector<uint8_t>(static_cast<const uint8_t*>(data), static_cast<const uint8_t*>(data) + size) {}

    void append(const void* data, size_t size) {
        const uint8_t* p = static_cast<const uint8_t*>(data);
        insert(end(), p, p + size);
    }

    template<typename T>
        void append_pod(const T& value) {
            append(&value, sizeof(T));
        }

    // reads a POD at pos, advancing pos; returns false if the buffer is too short
    template<typename T>
        bool read_pod(size_t& pos, T& value) const {
            if( pos > size() || size() - pos < sizeof(T) ){
                return false;
            }
            std::memcpy(&value, data() + pos, sizeof(T));
            pos += sizeof(T);
            return true;
        }
};
