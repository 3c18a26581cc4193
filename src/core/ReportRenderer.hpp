#pragma once
#include <ostream>

#include "core/BakFormat.hpp"

// Text reports over a container: the segment table, or one segment.
class ReportRenderer {
    public:
    explicit ReportRenderer(std::ostream& out) : m_out(out) {}

    // rows are sorted by name
    void summary(const BakFooter& footer, bool with_offset);
    void detail(const Segment& seg);

    private:
    std::ostream& m_out;
};
