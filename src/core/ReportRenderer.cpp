#include "ReportRenderer.hpp"
#include "utils/common.hpp"

#include <algorithm>

void ReportRenderer::summary(const BakFooter& footer, bool with_offset) {
    std::vector<std::pair<std::string, SegInfo>> rows(footer.segments.begin(), footer.segments.end());
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

    m_out << fmt::format("Backup Version: {}\n", footer.version);

    const std::string line(with_offset ? 34 : 23, '-');
    m_out << line << "\n";
    if( with_offset ){
        m_out << fmt::format("{:<10}| {:<10}| {:<10}\n", "Name", "Num", "Offset");
    } else {
        m_out << fmt::format("{:<10}| {:<10}\n", "Name", "Num");
    }
    m_out << line << "\n";

    for( const auto& [name, info] : rows ){
        m_out << fmt::format("{:<10}| {:<10}|", name, std::to_string(info.num));
        if( with_offset ){
            m_out << fmt::format(" {:<10}", std::to_string(info.offset));
        }
        m_out << "\n";
    }
    m_out.flush();
    if( !m_out ){
        throw std::runtime_error("failed to write report");
    }
}

void ReportRenderer::detail(const Segment& seg) {
    m_out << fmt::format("Segment: {}\n", seg.name);
    m_out << fmt::format("Value: {}\n", seg.to_string());
    m_out.flush();
    if( !m_out ){
        throw std::runtime_error("failed to write report");
    }
}
