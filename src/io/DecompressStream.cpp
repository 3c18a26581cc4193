/**
 * @file DecompressStream.cpp
 * @brief Streaming gzip (zlib) and zstd decoders over an upstream ReadStream.
 *
 * Both decoders read the upstream in IN_CHUNK pieces, check the stream header
 * eagerly in the constructor, and accept concatenated members/frames.
 * A stream that ends in the middle of a member is reported as a ReadError.
 */

#include "DecompressStream.hpp"
#include "core/errors.hpp"
#include "utils/common.hpp"

static const size_t IN_CHUNK = 256 * 1024;

Compression compression_from_path(const std::filesystem::path& path) {
    if( path_ends_with(path, ".gz") ){
        return Compression::Gzip;
    }
    if( path_ends_with(path, ".zstd") ){
        return Compression::Zstd;
    }
    return Compression::None;
}

const char* compression_name(Compression c) {
    switch( c ){
        case Compression::None: return "none";
        case Compression::Gzip: return "gzip";
        case Compression::Zstd: return "zstd";
    }
    return "?";
}

std::unique_ptr<ReadStream> make_decoder(Compression c, ReadStream& upstream, const std::string& name) {
    switch( c ){
        case Compression::None:
            return nullptr;
        case Compression::Gzip:
            return std::make_unique<GzipStream>(upstream, name);
        case Compression::Zstd:
            return std::make_unique<ZstdStream>(upstream, name);
    }
    throw std::invalid_argument(fmt::format("unknown compression {}", (int)c));
}

/////////////////////////////////////////////////////////////////////////////
// gzip

GzipStream::GzipStream(ReadStream& upstream, const std::string& name) : m_upstream(upstream), m_name(name), m_in(IN_CHUNK) {
    fill();
    if( m_strm.avail_in < 2 || m_in[0] != 0x1f || m_in[1] != 0x8b ){
        throw DecodeInitError(fmt::format("{}: invalid gzip header", m_name));
    }

    // 15 + 16: max window, expect gzip wrapper
    int ret = inflateInit2(&m_strm, 15 + 16);
    if( ret != Z_OK ){
        throw DecodeInitError(fmt::format("{}: inflateInit2() failed: {}", m_name, ret));
    }
    m_inited = true;

    try {
        read_header();
    } catch (...) {
        inflateEnd(&m_strm);
        m_inited = false;
        throw;
    }
}

// consumes the first member header without producing output, so that a damaged
// header fails in the constructor rather than in the middle of a copy
void GzipStream::read_header() {
    int ret = inflateGetHeader(&m_strm, &m_header);
    if( ret != Z_OK ){
        throw DecodeInitError(fmt::format("{}: inflateGetHeader() failed: {}", m_name, ret));
    }
    Bytef unused = 0;
    while( m_header.done == 0 ){
        if( m_strm.avail_in == 0 ){
            if( m_in_eof ){
                throw DecodeInitError(fmt::format("{}: truncated gzip header", m_name));
            }
            fill();
            continue;
        }
        m_strm.next_out = &unused;
        m_strm.avail_out = 0;
        ret = inflate(&m_strm, Z_NO_FLUSH);
        if( ret == Z_STREAM_END ){
            m_member_end = true;
        } else if( ret != Z_OK && ret != Z_BUF_ERROR ){
            throw DecodeInitError(fmt::format("{}: invalid gzip header: {} ({})", m_name, ret, m_strm.msg ? m_strm.msg : "-"));
        }
    }
}

GzipStream::~GzipStream() {
    if( m_inited ){
        inflateEnd(&m_strm);
    }
}

void GzipStream::fill() {
    size_t nread = m_upstream.read(m_in.data(), m_in.size());
    m_strm.next_in = m_in.data();
    m_strm.avail_in = nread;
    if( nread == 0 ){
        m_in_eof = true;
    }
}

size_t GzipStream::read(void* buf, size_t count) {
    if( !m_inited ){
        throw ReadError(fmt::format("{}: gzip stream is closed", m_name));
    }
    if( count == 0 || m_done ){
        return 0;
    }

    m_strm.next_out = static_cast<Bytef*>(buf);
    m_strm.avail_out = count;

    while( m_strm.avail_out > 0 ){
        if( m_strm.avail_in == 0 && !m_in_eof ){
            fill();
        }
        if( m_strm.avail_in == 0 ){
            if( m_member_end ){
                m_done = true;
                break;
            }
            throw ReadError(fmt::format("{}: unexpected end of gzip stream", m_name));
        }
        if( m_member_end ){
            // next member of a multi-member gzip
            int ret = inflateReset(&m_strm);
            if( ret != Z_OK ){
                throw ReadError(fmt::format("{}: inflateReset() failed: {}", m_name, ret));
            }
            m_member_end = false;
        }

        int ret = inflate(&m_strm, Z_NO_FLUSH);
        if( ret == Z_STREAM_END ){
            m_member_end = true;
        } else if( ret != Z_OK && ret != Z_BUF_ERROR ){
            throw ReadError(fmt::format("{}: inflate() failed: {} ({})", m_name, ret, m_strm.msg ? m_strm.msg : "-"));
        }
    }

    return count - m_strm.avail_out;
}

void GzipStream::close() {
    if( m_inited ){
        inflateEnd(&m_strm);
        m_inited = false;
    }
}

/////////////////////////////////////////////////////////////////////////////
// zstd

static bool is_zstd_magic(const uint8_t* p) {
    // regular frame, or a skippable one (0x184D2A50..0x184D2A5F)
    return (p[0] == 0x28 && p[1] == 0xb5 && p[2] == 0x2f && p[3] == 0xfd) ||
           ((p[0] & 0xf0) == 0x50 && p[1] == 0x2a && p[2] == 0x4d && p[3] == 0x18);
}

ZstdStream::ZstdStream(ReadStream& upstream, const std::string& name) : m_upstream(upstream), m_name(name), m_in(IN_CHUNK) {
    fill();
    if( m_input.size < 4 || !is_zstd_magic(m_in.data()) ){
        throw DecodeInitError(fmt::format("{}: invalid zstd header", m_name));
    }

    m_dctx = ZSTD_createDCtx();
    if( !m_dctx ){
        throw DecodeInitError(fmt::format("{}: ZSTD_createDCtx() failed", m_name));
    }
}

ZstdStream::~ZstdStream() {
    if( m_dctx ){
        ZSTD_freeDCtx(m_dctx);
    }
}

void ZstdStream::fill() {
    size_t nread = m_upstream.read(m_in.data(), m_in.size());
    m_input = { m_in.data(), nread, 0 };
    if( nread == 0 ){
        m_in_eof = true;
    }
}

size_t ZstdStream::read(void* buf, size_t count) {
    if( !m_dctx ){
        throw ReadError(fmt::format("{}: zstd stream is closed", m_name));
    }
    if( count == 0 || m_done ){
        return 0;
    }

    ZSTD_outBuffer output = { buf, count, 0 };
    while( output.pos < output.size ){
        if( m_input.pos == m_input.size && !m_in_eof ){
            fill();
        }
        if( m_input.pos == m_input.size && m_in_eof ){
            if( m_last_ret == 0 ){
                m_done = true;
                break;
            }
            // no more input, but the decoder may still hold buffered output
            const size_t before = output.pos;
            size_t ret = ZSTD_decompressStream(m_dctx, &output, &m_input);
            if( ZSTD_isError(ret) ){
                throw ReadError(fmt::format("{}: zstd decompress failed: {}", m_name, ZSTD_getErrorName(ret)));
            }
            m_last_ret = ret;
            if( output.pos > before ){
                continue;
            }
            if( ret == 0 ){
                m_done = true;
                break;
            }
            throw ReadError(fmt::format("{}: unexpected end of zstd stream", m_name));
        }

        size_t ret = ZSTD_decompressStream(m_dctx, &output, &m_input);
        if( ZSTD_isError(ret) ){
            throw ReadError(fmt::format("{}: zstd decompress failed: {}", m_name, ZSTD_getErrorName(ret)));
        }
        m_last_ret = ret;
    }

    return output.pos;
}

void ZstdStream::close() {
    if( m_dctx ){
        ZSTD_freeDCtx(m_dctx);
        m_dctx = nullptr;
    }
}
