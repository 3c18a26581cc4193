/**
 * @file Reader.cpp
 * @brief Implementation of the positioned file reader.
 */

#include "Reader.hpp"
#include "utils/common.hpp"

#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

/**
 * @brief Opens a regular file for reading and determines its size.
 * @throws std::runtime_error If file cannot be opened or is not a regular file.
 */
Reader::Reader(const std::filesystem::path& fname) : m_fname(fname) {
    m_fd = open(fname.c_str(), O_RDONLY);
    if( m_fd == -1 ) {
        throw std::runtime_error(fmt::format("open(\"{}\", {:#x}): {}", fname, O_RDONLY, strerror(errno)));
    }
    struct stat st;
    if( fstat(m_fd, &st) == -1 ) {
        int err = errno;
        close(m_fd);
        m_fd = -1;
        throw std::runtime_error(fmt::format("fstat(\"{}\"): {}", fname, strerror(err)));
    }
    if( !S_ISREG(st.st_mode) ) {
        close(m_fd);
        m_fd = -1;
        throw std::runtime_error(fmt::format("{}: not a regular file", fname));
    }
    m_size = st.st_size;
}

Reader::~Reader() {
    if( m_fd != -1 ) {
        close(m_fd);
    }
}

/**
 * @brief Reads data from a specific file position (thread-safe).
 *
 * @param offset File position to read from.
 * @param buf Buffer to read into.
 * @param count Number of bytes to read.
 * @return Number of bytes actually read (may be less than count at EOF).
 * @throws std::invalid_argument If offset is negative.
 * @throws ReadError On read error.
 */
size_t Reader::read_at(off_t offset, void* buf, size_t count) {
    if( offset < 0 ){
        throw std::invalid_argument(fmt::format("offset < 0: {:#x}", offset));
    }
    if( (size_t)offset >= m_size ) {
        return 0;
    }

    char* out = static_cast<char*>(buf);
    size_t total = 0;
    while( total < count ){
        ssize_t nread = ::pread(m_fd, out + total, count - total, offset + total);
        if( nread == -1 ) {
            if( errno == EINTR ) continue;
            throw ReadError(fmt::format("read(fd {:#x}, offset {:#x}, count {:#x}): {}", m_fd, offset + total, count - total, strerror(errno)));
        }
        if( nread == 0 ){
            break;
        }
        total += nread;
    }
    return total;
}

void Reader::read_exact(off_t offset, void* buf, size_t count) {
    size_t nread = read_at(offset, buf, count);
    if( nread != count ){
        throw ReadError(fmt::format("{}: short read at {:#x}: {} of {} bytes", m_fname, offset, nread, count));
    }
}
