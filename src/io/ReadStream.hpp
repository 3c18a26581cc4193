#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

#include "core/buf_t.hpp"

// A sequential byte source. Layers (decryption, decompression) are ReadStreams over other ReadStreams.
class ReadStream {
    public:
    class ReadError : public std::runtime_error {
        public:
        explicit ReadError(const std::string& msg) : std::runtime_error(msg) {}
    };

    virtual ~ReadStream() {}

    // reads up to count bytes, returns 0 only at EOF; throws ReadError on failure
    virtual size_t read(void* buf, size_t count) = 0;

    // releases the underlying resource; calling it again is a no-op
    virtual void close() = 0;

    // reads until EOF
    buf_t read_all(size_t chunk_size = 1 << 20);
};
