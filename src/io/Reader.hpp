#pragma once
#include <cstdint>
#include <fcntl.h>
#include <filesystem>
#include <string>
#include <sys/types.h>

#include "core/buf_t.hpp"

// Positioned reader over a regular file.
// read_at() uses pread(), so one Reader can be shared between threads.
class Reader {
    public:
    Reader(const std::filesystem::path& fname);
    ~Reader();

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    class ReadError : public std::runtime_error {
        public:
        explicit ReadError(const std::string& msg) : std::runtime_error(msg) {}
    };

    // returns less than count only at EOF; throws on error
    size_t read_at(off_t offset, void* buf, size_t count);
    size_t read_at(off_t offset, buf_t& buf) {
        return read_at(offset, buf.data(), buf.size());
    }

    // reads exactly count bytes or throws ReadError
    void read_exact(off_t offset, void* buf, size_t count);

    template <typename T>
    T read_pod(off_t offset) {
        T value;
        read_exact(offset, &value, sizeof(T));
        return value;
    }

    size_t size() const { return m_size; }
    const std::filesystem::path& fname() const { return m_fname; }

    private:
    std::filesystem::path m_fname;
    int m_fd = -1;
    size_t m_size = 0;
};
