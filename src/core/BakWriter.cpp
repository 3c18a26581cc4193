#include "BakWriter.hpp"
#include "utils/common.hpp"

using namespace Meta::Bak;

BakWriter::BakWriter(const fs::path& fname, Writer::Mode mode) : m_writer(fname, mode) {
}

int64_t BakWriter::add_segment(const std::string& name, const nlohmann::json& value) {
    return add_segment(name, value, Segment{name, value}.count());
}

int64_t BakWriter::add_segment(const std::string& name, const nlohmann::json& value, uint64_t num) {
    if( m_finished ){
        throw std::logic_error(fmt::format("BakWriter: add_segment(\"{}\") after finish()", name));
    }
    if( name.empty() || name.size() > MAX_NAME_LEN ){
        throw std::invalid_argument(fmt::format("BakWriter: invalid segment name length {}", name.size()));
    }
    if( m_segments.contains(name) ){
        throw std::invalid_argument(fmt::format("BakWriter: duplicate segment \"{}\"", name));
    }

    std::vector<uint8_t> payload = nlohmann::json::to_cbor(value);
    if( payload.size() > MAX_PAYLOAD_SIZE ){
        throw std::invalid_argument(fmt::format("BakWriter: segment \"{}\" is too large: {}", name, bytes2human(payload.size())));
    }

    SegmentHeader hdr;
    memcpy(hdr.magic, SEGMENT_MAGIC, sizeof(hdr.magic));
    hdr.name_len = name.size();
    hdr.flags = 0;
    hdr.payload_size = payload.size();
    uint32_t crc = BakInspector::crc32(name.data(), name.size());
    hdr.payload_crc = BakInspector::crc32(payload.data(), payload.size(), crc);

    const int64_t offset = m_pos;
    m_writer.write(&hdr, sizeof(hdr));
    m_writer.write(name.data(), name.size());
    m_writer.write(payload.data(), payload.size());
    m_pos += hdr.record_size();

    m_segments[name] = SegInfo{ num, offset };
    return offset;
}

void BakWriter::finish() {
    if( m_finished ){
        return;
    }
    m_finished = true;

    buf_t index = BakInspector::encode_index(m_segments);

    BakTrailer trailer;
    trailer.index_offset = m_pos;
    trailer.index_size = index.size();
    trailer.index_crc = BakInspector::crc32(index.data(), index.size());
    trailer.version = BAK_VERSION;
    memcpy(trailer.magic, TRAILER_MAGIC, sizeof(trailer.magic));

    m_writer.write(index.data(), index.size());
    m_writer.write(&trailer, sizeof(trailer));
    m_writer.close();
}
