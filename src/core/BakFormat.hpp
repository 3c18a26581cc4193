#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "io/Logger.hpp"
#include "io/Reader.hpp"
#include "Meta/Bak/BakTrailer.hpp"
#include "Meta/Bak/SegmentHeader.hpp"

struct SegInfo {
    uint64_t num = 0;   // number of items in the segment
    int64_t offset = 0; // of the segment record, from the start of the file
};

// Index of a container, as read from its trailer. Names are unordered.
struct BakFooter {
    uint32_t version = 0;
    std::unordered_map<std::string, SegInfo> segments;
};

struct Segment {
    std::string name;
    nlohmann::json value;

    // items in the segment: array size, or 1 for a single object
    uint64_t count() const { return value.is_array() ? value.size() : 1; }

    std::string to_string() const { return value.dump(); }
};

// Random-access reader of the container format; no body scan is needed for either operation.
class BakInspector {
    public:
    explicit BakInspector(std::shared_ptr<Logger> logger) : m_logger(std::move(logger)) {}

    // throws MalformedFooterError
    BakFooter read_footer(Reader& reader) const;

    // offset should come from a BakFooter entry; throws SegmentReadError
    Segment read_segment(Reader& reader, off_t offset) const;

    // index block encoding, shared with BakWriter
    static buf_t encode_index(const std::unordered_map<std::string, SegInfo>& segments);
    static uint32_t crc32(const void* data, size_t size, uint32_t crc = 0);

    private:
    std::shared_ptr<Logger> m_logger;
};
