/**
 * @file BakFormat.cpp
 * @brief Reading the trailer index and single segments of a backup container.
 *
 * The trailer at EOF points to the index block, which maps segment names to
 * item counts and record offsets. Every record carries its own header with a
 * crc32, so a segment can be validated without touching the rest of the file.
 */

#include "BakFormat.hpp"
#include "core/errors.hpp"
#include "utils/common.hpp"

#include <zlib.h>

using namespace Meta::Bak;

uint32_t BakInspector::crc32(const void* data, size_t size, uint32_t crc) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    while( size > 0 ){
        uInt chunk = size > 0x40000000 ? 0x40000000 : (uInt)size;
        crc = ::crc32(crc, p, chunk);
        p += chunk;
        size -= chunk;
    }
    return crc;
}

buf_t BakInspector::encode_index(const std::unordered_map<std::string, SegInfo>& segments) {
    buf_t buf;
    buf.append_pod<uint32_t>(segments.size());
    for( const auto& [name, info] : segments ){
        buf.append_pod<uint16_t>(name.size());
        buf.append(name.data(), name.size());
        buf.append_pod<uint64_t>(info.num);
        buf.append_pod<int64_t>(info.offset);
    }
    return buf;
}

BakFooter BakInspector::read_footer(Reader& reader) const {
    const size_t fsize = reader.size();
    if( fsize < sizeof(BakTrailer) ){
        throw MalformedFooterError(fmt::format("{}: file too short for a backup trailer: {} bytes", reader.fname(), fsize));
    }

    BakTrailer trailer;
    buf_t index;
    try {
        trailer = reader.read_pod<BakTrailer>(fsize - sizeof(BakTrailer));
        m_logger->debug("{}: {}", reader.fname(), trailer.to_string());
        if( !trailer.valid() ){
            throw MalformedFooterError(fmt::format("{}: not a backup file or unsupported version: {}", reader.fname(), trailer.to_string()));
        }
        if( trailer.index_offset + trailer.index_size + sizeof(BakTrailer) != fsize ){
            throw MalformedFooterError(fmt::format("{}: index at {:#x}+{:#x} does not end at the trailer, file size {:#x}",
                        reader.fname(), +trailer.index_offset, +trailer.index_size, fsize));
        }

        index = buf_t(trailer.index_size);
        reader.read_exact(trailer.index_offset, index.data(), index.size());
    } catch (const Reader::ReadError& e) {
        throw MalformedFooterError(fmt::format("{}: failed to read footer: {}", reader.fname(), e.what()));
    }

    uint32_t crc = crc32(index.data(), index.size());
    if( crc != trailer.index_crc ){
        throw MalformedFooterError(fmt::format("{}: index crc mismatch: {:08x} != {:08x}", reader.fname(), crc, +trailer.index_crc));
    }

    BakFooter footer;
    footer.version = trailer.version;

    size_t pos = 0;
    uint32_t n = 0;
    if( !index.read_pod(pos, n) ){
        throw MalformedFooterError(fmt::format("{}: truncated index", reader.fname()));
    }
    for( uint32_t i = 0; i < n; i++ ){
        uint16_t name_len = 0;
        if( !index.read_pod(pos, name_len) || index.size() - pos < name_len ){
            throw MalformedFooterError(fmt::format("{}: truncated index entry #{}", reader.fname(), i));
        }
        std::string name(reinterpret_cast<const char*>(index.data() + pos), name_len);
        pos += name_len;
        if( !valid_segment_name(name) ){
            throw MalformedFooterError(fmt::format("{}: invalid segment name \"{}\" in index entry #{}", reader.fname(), filter_unprintable(name), i));
        }

        SegInfo info;
        if( !index.read_pod(pos, info.num) || !index.read_pod(pos, info.offset) ){
            throw MalformedFooterError(fmt::format("{}: truncated index entry #{} \"{}\"", reader.fname(), i, filter_unprintable(name)));
        }
        if( info.offset < 0 || (uint64_t)info.offset >= trailer.index_offset ){
            throw MalformedFooterError(fmt::format("{}: segment \"{}\" offset {:#x} is out of the data area", reader.fname(), filter_unprintable(name), info.offset));
        }
        if( !footer.segments.emplace(name, info).second ){
            throw MalformedFooterError(fmt::format("{}: duplicate segment \"{}\" in index", reader.fname(), filter_unprintable(name)));
        }
    }
    if( pos != index.size() ){
        throw MalformedFooterError(fmt::format("{}: {} trailing bytes after index", reader.fname(), index.size() - pos));
    }

    m_logger->debug("{}: backup version {}, {} segments", reader.fname(), footer.version, footer.segments.size());
    return footer;
}

Segment BakInspector::read_segment(Reader& reader, off_t offset) const {
    if( offset < 0 || (size_t)offset >= reader.size() ){
        throw SegmentReadError(fmt::format("{}: offset {} is out of bounds, file size {}", reader.fname(), offset, reader.size()));
    }

    SegmentHeader hdr;
    buf_t body;
    try {
        hdr = reader.read_pod<SegmentHeader>(offset);
        if( !hdr.valid() ){
            throw SegmentReadError(fmt::format("{}: no segment at offset {}: {}", reader.fname(), offset, hdr.to_string()));
        }
        m_logger->trace("{}: {:#x}: {}", reader.fname(), offset, hdr.to_string());

        body = buf_t(hdr.name_len + hdr.payload_size);
        reader.read_exact(offset + sizeof(SegmentHeader), body.data(), body.size());
    } catch (const Reader::ReadError& e) {
        throw SegmentReadError(fmt::format("{}: failed to read segment at offset {}: {}", reader.fname(), offset, e.what()));
    }

    uint32_t crc = crc32(body.data(), body.size());
    if( crc != hdr.payload_crc ){
        throw SegmentReadError(fmt::format("{}: segment at offset {}: crc mismatch: {:08x} != {:08x}", reader.fname(), offset, crc, +hdr.payload_crc));
    }

    Segment seg;
    seg.name.assign(reinterpret_cast<const char*>(body.data()), hdr.name_len);
    try {
        seg.value = nlohmann::json::from_cbor(body.begin() + hdr.name_len, body.end());
    } catch (const nlohmann::json::exception& e) {
        throw SegmentReadError(fmt::format("{}: segment \"{}\" at offset {}: {}", reader.fname(), filter_unprintable(seg.name), offset, e.what()));
    }
    return seg;
}
