/**
 * @file Writer.cpp
 * @brief Implementation of the file writer used for plain backups and containers.
 *
 * Handles large writes by chunking, retries interrupted writes and provides
 * positioned write operations. Exclusive mode is used when a file must not be
 * overwritten, e.g. a converted backup that another process may be creating.
 */

#include "Writer.hpp"
#include "utils/common.hpp"

#include <algorithm>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

static int open_flags(Writer::Mode mode) {
    switch( mode ){
        case Writer::Mode::Truncate:
            return O_WRONLY | O_CREAT | O_TRUNC;
        case Writer::Mode::Update:
            return O_WRONLY | O_CREAT;
        case Writer::Mode::Exclusive:
            return O_WRONLY | O_CREAT | O_EXCL;
    }
    return O_WRONLY;
}

/**
 * @brief Creates or opens a file for writing.
 *
 * @param fname Path to file to create/open.
 * @param mode Truncate, keep, or refuse an existing file.
 * @throws std::runtime_error If file cannot be created/opened. errno is preserved.
 */
Writer::Writer(const std::filesystem::path& fname, Mode mode) : m_fname(fname) {
    int flags = open_flags(mode);
    m_fd = open(fname.c_str(), flags, 0644);
    if (m_fd == -1) {
        throw std::runtime_error(fmt::format("Writer: open(\"{}\", {:#x}, 0644): {}", fname.string(), flags, strerror(errno)));
    }
}

/**
 * @brief Seeks to a position in the file.
 *
 * @param offset Offset to seek to.
 * @param whence SEEK_SET, SEEK_CUR, or SEEK_END.
 * @throws std::runtime_error On lseek error.
 */
void Writer::seek(off_t offset, int whence) const {
    if (lseek(m_fd, offset, whence) == -1) {
        throw std::runtime_error(fmt::format("Writer: lseek({:#x}, {:#x}, {}): {}", m_fd, offset, whence, strerror(errno)));
    }
}

off_t Writer::tell() const {
    off_t offset = lseek(m_fd, 0, SEEK_CUR);
    if (offset == -1) {
        throw std::runtime_error(fmt::format("Writer: lseek({:#x}, 0, SEEK_CUR): {}", m_fd, strerror(errno)));
    }
    return offset;
}

void Writer::write_at(off_t offset, const void* buf, size_t count) const {
    seek(offset, SEEK_SET);
    write(buf, count);
}

/**
 * @brief Writes data to the file at the current position.
 *
 * Handles large writes by chunking into 1GB pieces. Automatically retries
 * on EINTR signal interruption.
 *
 * @throws std::runtime_error On write error or if write returns 0 bytes.
 */
void Writer::write(const void* buf, size_t count) const {
    constexpr size_t CHUNK_SIZE = 1ULL << 30; // 1 GB
    if( m_fd == -1 ){
        throw std::runtime_error(fmt::format("Writer: write to closed file \"{}\"", m_fname.string()));
    }

    const char* ptr = static_cast<const char*>(buf);
    size_t remaining = count;

    while (remaining > 0) {
        size_t to_write = std::min(remaining, CHUNK_SIZE);
        const char* chunk_ptr = ptr;
        size_t chunk_remaining = to_write;

        while (chunk_remaining > 0) {
            ssize_t nwritten = ::write(m_fd, chunk_ptr, chunk_remaining);
            if (nwritten == -1) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::runtime_error(fmt::format(
                    "Writer: write({:#x}, {}, {}): {}", m_fd, static_cast<const void*>(chunk_ptr), chunk_remaining, strerror(errno)));
            }
            if (nwritten == 0) {
                throw std::runtime_error(fmt::format(
                    "Writer: write({:#x}, {}, {}): write returned 0 bytes", m_fd, static_cast<const void*>(chunk_ptr), chunk_remaining));
            }

            chunk_ptr += nwritten;
            chunk_remaining -= nwritten;
        }

        ptr += to_write;
        remaining -= to_write;
    }
}

void Writer::close() {
    if( m_fd == -1 ){
        return;
    }
    int fd = m_fd;
    m_fd = -1;
    if( fsync(fd) == -1 && errno != EINVAL ){
        int err = errno;
        ::close(fd);
        throw std::runtime_error(fmt::format("Writer: fsync(\"{}\"): {}", m_fname.string(), strerror(err)));
    }
    if( ::close(fd) == -1 ){
        throw std::runtime_error(fmt::format("Writer: close(\"{}\"): {}", m_fname.string(), strerror(errno)));
    }
}

Writer::~Writer() {
    if( m_fd != -1 ){
        ::close(m_fd);
        m_fd = -1;
    }
}
