#pragma once
#include <filesystem>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "core/BakFormat.hpp"
#include "io/Writer.hpp"

// Writes a container in one pass: records are appended as they come, index and trailer go last.
class BakWriter {
    public:
    explicit BakWriter(const std::filesystem::path& fname, Writer::Mode mode = Writer::Mode::Truncate);

    // returns the record offset; num defaults to Segment::count() of the value
    int64_t add_segment(const std::string& name, const nlohmann::json& value);
    int64_t add_segment(const std::string& name, const nlohmann::json& value, uint64_t num);

    // writes index and trailer, then closes the file; no segments can be added after it
    void finish();

    const std::unordered_map<std::string, SegInfo>& segments() const { return m_segments; }

    private:
    Writer m_writer;
    std::unordered_map<std::string, SegInfo> m_segments;
    int64_t m_pos = 0;
    bool m_finished = false;
};
