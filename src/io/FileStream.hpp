#pragma once
#include <filesystem>
#include <memory>
#include <sys/types.h>

#include "ReadStream.hpp"

// fd-backed stream over a local file
class FileStream : public ReadStream {
    public:
    explicit FileStream(const std::filesystem::path& fname);
    ~FileStream();

    FileStream(const FileStream&) = delete;
    FileStream& operator=(const FileStream&) = delete;

    // not owning: close() leaves fd 0 open
    static std::unique_ptr<FileStream> open_stdin();

    size_t read(void* buf, size_t count) override;
    void close() override;

    void seek(off_t offset);
    // stop after limit more bytes, -1 = no limit
    void set_limit(int64_t limit) { m_limit = limit; }

    const std::filesystem::path& fname() const { return m_fname; }

    private:
    FileStream(int fd, const std::filesystem::path& fname, bool owning) : m_fname(fname), m_fd(fd), m_owning(owning) {}

    std::filesystem::path m_fname;
    int m_fd = -1;
    bool m_owning = true;
    int64_t m_limit = -1;
};

class MemoryStream : public ReadStream {
    public:
    explicit MemoryStream(buf_t data) : m_data(std::move(data)) {}

    size_t read(void* buf, size_t count) override;
    void close() override { m_closed = true; }

    bool closed() const { return m_closed; }

    private:
    buf_t m_data;
    size_t m_pos = 0;
    bool m_closed = false;
};
