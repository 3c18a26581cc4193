#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include <zlib.h>
#include <zstd.h>

#include "ReadStream.hpp"

// compression scheme of a backup file, resolved once from its name
enum class Compression {
    None,
    Gzip,   // ".gz"
    Zstd,   // ".zstd"
};

Compression compression_from_path(const std::filesystem::path& path);
const char* compression_name(Compression c);

// Decoders read from a non-owned upstream; whoever owns both must keep upstream alive.
// Constructors validate the stream header and throw DecodeInitError if it's wrong.

class GzipStream : public ReadStream {
    public:
    GzipStream(ReadStream& upstream, const std::string& name);
    ~GzipStream();

    GzipStream(const GzipStream&) = delete;
    GzipStream& operator=(const GzipStream&) = delete;

    size_t read(void* buf, size_t count) override;
    void close() override;

    private:
    void fill();
    void read_header();

    ReadStream& m_upstream;
    const std::string m_name;
    buf_t m_in;
    z_stream m_strm = {};
    gz_header m_header = {}; // header of the first member
    bool m_inited = false;
    bool m_in_eof = false;
    bool m_member_end = false;
    bool m_done = false;
};

class ZstdStream : public ReadStream {
    public:
    ZstdStream(ReadStream& upstream, const std::string& name);
    ~ZstdStream();

    ZstdStream(const ZstdStream&) = delete;
    ZstdStream& operator=(const ZstdStream&) = delete;

    size_t read(void* buf, size_t count) override;
    void close() override;

    private:
    void fill();

    ReadStream& m_upstream;
    const std::string m_name;
    buf_t m_in;
    ZSTD_inBuffer m_input = { nullptr, 0, 0 };
    ZSTD_DCtx* m_dctx = nullptr;
    size_t m_last_ret = 1; // 0 = frame fully decoded and flushed
    bool m_in_eof = false;
    bool m_done = false;
};

// nullptr for Compression::None
std::unique_ptr<ReadStream> make_decoder(Compression c, ReadStream& upstream, const std::string& name);
