#pragma once
#include "rain/series.hpp"
#include "rain/weather.hpp"

#include <vector>

namespace rain {

struct SegmentOptions {
    // Interior dry runs of at most this many hours, with wet hours on both
    // sides, are folded into a single wet event. 0 disables merging.
    int merge_dry_gap_hours = 0;
};

// Per-hour event annotation, parallel to the source series.
struct EventSegmentation {
    std::vector<Timestamp> times;
    std::vector<double> precip;
    std::vector<int> event_id;          // 1-based, increases with time
    std::vector<Weather> event_type;

    std::size_t size() const { return times.size(); }
    int event_count() const { return event_id.empty() ? 0 : event_id.back(); }
};

struct EventSummary {
    int event_id = 0;
    Weather type = Weather::Dry;
    Timestamp start;
    Timestamp end;                      // inclusive
    int duration_hours = 0;
    double total_depth = 0.0;
    double peak_intensity = 0.0;
    double mean_intensity = 0.0;
};

// Hours with precip > 0 are wet. Events at either end of the series are
// cut at the series boundary.
EventSegmentation segment(const ValidSeries& series, const SegmentOptions& opts = {});

std::vector<EventSummary> summarize(const EventSegmentation& seg);

} // namespace rain
