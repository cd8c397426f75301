#include "rain/events.hpp"

#include <algorithm>
#include <stdexcept>

namespace rain {

static Weather hour_type(double precip) {
    return precip > 0.0 ? Weather::Wet : Weather::Dry;
}

// Relabels short dry runs enclosed by wet runs as wet.
static void merge_dry_gaps(std::vector<Weather>& types, int max_gap) {
    const size_t n = types.size();
    size_t i = 0;
    while (i < n) {
        if (types[i] != Weather::Dry) { ++i; continue; }
        size_t j = i;
        while (j < n && types[j] == Weather::Dry) ++j;
        const bool enclosed = i > 0 && j < n;
        if (enclosed && j - i <= static_cast<size_t>(max_gap)) {
            std::fill(types.begin() + i, types.begin() + j, Weather::Wet);
        }
        i = j;
    }
}

EventSegmentation segment(const ValidSeries& series, const SegmentOptions& opts) {
    if (opts.merge_dry_gap_hours < 0) {
        throw std::invalid_argument("merge_dry_gap_hours must be >= 0");
    }

    EventSegmentation seg;
    seg.times = series.times();
    seg.precip = series.precip();
    seg.event_type.reserve(seg.precip.size());
    for (double p : seg.precip) seg.event_type.push_back(hour_type(p));
    if (opts.merge_dry_gap_hours > 0) merge_dry_gaps(seg.event_type, opts.merge_dry_gap_hours);

    seg.event_id.resize(seg.size());
    int id = 0;
    for (size_t i=0; i<seg.size(); ++i) {
        if (i == 0 || seg.event_type[i] != seg.event_type[i-1]) ++id;
        seg.event_id[i] = id;
    }
    return seg;
}

std::vector<EventSummary> summarize(const EventSegmentation& seg) {
    std::vector<EventSummary> out;
    out.reserve(static_cast<size_t>(seg.event_count()));

    for (size_t i=0; i<seg.size(); ++i) {
        if (out.empty() || out.back().event_id != seg.event_id[i]) {
            EventSummary s;
            s.event_id = seg.event_id[i];
            s.type = seg.event_type[i];
            s.start = seg.times[i];
            out.push_back(s);
        }
        EventSummary& s = out.back();
        s.end = seg.times[i];
        s.total_depth += seg.precip[i];
        s.peak_intensity = std::max(s.peak_intensity, seg.precip[i]);
    }

    for (auto& s : out) {
        s.duration_hours = static_cast<int>((s.end - s.start) / kHour) + 1;
        s.mean_intensity = s.total_depth / s.duration_hours;
    }
    return out;
}

} // namespace rain
