#pragma once
#include <filesystem>
#include <sys/types.h>

// Sequential/positioned file writer; huge buffers are written in chunks.
class Writer {
    public:
    enum class Mode {
        Truncate,   // create or truncate
        Update,     // create or open, keep contents
        Exclusive,  // create, fail if the file exists
    };

    Writer(const std::filesystem::path& fname, Mode mode = Mode::Truncate);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void seek(off_t offset, int whence = SEEK_SET) const;
    void write(const void* buf, size_t count) const;
    void write_at(off_t offset, const void* buf, size_t count) const;
    off_t tell() const;

    // flush to disk and release the descriptor, reporting errors the destructor would hide
    void close();

    const std::filesystem::path& fname() const { return m_fname; }

    private:
    std::filesystem::path m_fname;
    int m_fd = -1;
};
