#pragma once
#include "rain/events.hpp"

#include <string>

namespace rain {

class SvgPlotter {
public:
    // Hourly bar chart; wet events are shaded behind the bars.
    void hyetograph(const std::string& path,
                    double width, double height,
                    const EventSegmentation& seg) const;
};

} // namespace rain
