/**
 * @file FileStream.cpp
 * @brief Plain local byte streams: files, stdin and in-memory buffers.
 */

#include "FileStream.hpp"
#include "utils/common.hpp"

#include <algorithm>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

buf_t ReadStream::read_all(size_t chunk_size) {
    buf_t result;
    buf_t chunk(chunk_size);
    while( size_t nread = read(chunk.data(), chunk.size()) ){
        result.append(chunk.data(), nread);
    }
    return result;
}

#ifdef O_BINARY
#define OPEN_MODE O_RDONLY|O_BINARY
#else
#define OPEN_MODE O_RDONLY
#endif

/**
 * @brief Opens a file for sequential reading.
 * @throws std::runtime_error If the file cannot be opened.
 */
FileStream::FileStream(const std::filesystem::path& fname) : m_fname(fname) {
    m_fd = ::open(fname.c_str(), OPEN_MODE);
    if( m_fd == -1 ){
        throw std::runtime_error(fmt::format("open(\"{}\", {:#x}): {}", fname, OPEN_MODE, strerror(errno)));
    }
}

std::unique_ptr<FileStream> FileStream::open_stdin() {
    return std::unique_ptr<FileStream>(new FileStream(STDIN_FILENO, "STDIN", false));
}

FileStream::~FileStream() {
    if( m_fd != -1 && m_owning ){
        ::close(m_fd);
    }
}

void FileStream::seek(off_t offset) {
    if( lseek(m_fd, offset, SEEK_SET) == -1 ){
        throw std::runtime_error(fmt::format("lseek(\"{}\", {:#x}, SEEK_SET): {}", m_fname, offset, strerror(errno)));
    }
}

size_t FileStream::read(void* buf, size_t count) {
    if( m_fd == -1 ){
        throw ReadError(fmt::format("read(\"{}\"): stream is closed", m_fname));
    }
    if( m_limit >= 0 ){
        count = std::min(count, (size_t)m_limit);
    }
    if( count == 0 ){
        return 0;
    }

    ssize_t nread;
    do {
        nread = ::read(m_fd, buf, count);
    } while( nread == -1 && errno == EINTR );

    if( nread == -1 ){
        throw ReadError(fmt::format("read(\"{}\", {}, {:#x}): {}", m_fname, buf, count, strerror(errno)));
    }
    if( m_limit >= 0 ){
        m_limit -= nread;
    }
    return nread;
}

void FileStream::close() {
    if( m_fd == -1 ){
        return;
    }
    const int fd = m_fd;
    m_fd = -1;
    if( m_owning && ::close(fd) == -1 ){
        throw std::runtime_error(fmt::format("close(\"{}\"): {}", m_fname, strerror(errno)));
    }
}

size_t MemoryStream::read(void* buf, size_t count) {
    if( m_closed ){
        throw ReadError("read: memory stream is closed");
    }
    const size_t n = std::min(count, m_data.size() - m_pos);
    memcpy(buf, m_data.data() + m_pos, n);
    m_pos += n;
    return n;
}
