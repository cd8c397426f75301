#include "rain/series.hpp"
#include "rain/errors.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace rain {

std::optional<std::size_t> ValidSeries::index_of(Timestamp t) const {
    if (times_.empty() || t < times_.front() || t > times_.back()) return std::nullopt;
    const auto off = t - times_.front();
    if (off % kHour != std::chrono::seconds{0}) return std::nullopt;
    return static_cast<std::size_t>(off / kHour);
}

static std::string list_times(const std::vector<Timestamp>& ts) {
    std::string s;
    const size_t shown = ts.size() < 5 ? ts.size() : 5;
    for (size_t i=0; i<shown; ++i) {
        if (i) s += ", ";
        s += format_timestamp(ts[i]);
    }
    if (ts.size() > shown) s += ", ... (" + std::to_string(ts.size()) + " total)";
    return s;
}

ValidSeries validate(const HourlySeries& series) {
    const auto& r = series.records;

    for (size_t i=1; i<r.size(); ++i) {
        if (r[i].timestamp <= r[i-1].timestamp) {
            throw SeriesError(ErrorKind::UnorderedOrDuplicateTimestamp,
                              (r[i].timestamp == r[i-1].timestamp ? "duplicate timestamp " : "timestamp out of order ")
                              + format_timestamp(r[i].timestamp) + " at index " + std::to_string(i),
                              i, {r[i].timestamp});
        }
    }

    // Later records inherit the alignment of the first through the step check.
    if (!r.empty() && r[0].timestamp != floor_to_hour(r[0].timestamp)) {
        const auto offset = r[0].timestamp - floor_to_hour(r[0].timestamp);
        throw SeriesError(ErrorKind::DiscontinuousSeries,
                          "first record " + format_timestamp(r[0].timestamp) + " is "
                          + std::to_string(offset.count()) + " s past the hour",
                          0, {r[0].timestamp}, offset);
    }

    for (size_t i=1; i<r.size(); ++i) {
        const auto step = r[i].timestamp - r[i-1].timestamp;
        if (step != kHour) {
            throw SeriesError(ErrorKind::DiscontinuousSeries,
                              "step of " + std::to_string(step.count()) + " s between "
                              + format_timestamp(r[i-1].timestamp) + " and "
                              + format_timestamp(r[i].timestamp) + " at index " + std::to_string(i),
                              i, {r[i-1].timestamp, r[i].timestamp}, step);
        }
    }

    std::vector<Timestamp> missing;
    size_t first_missing = 0;
    for (size_t i=0; i<r.size(); ++i) {
        if (!r[i].precip) {
            if (missing.empty()) first_missing = i;
            missing.push_back(r[i].timestamp);
        }
    }
    if (!missing.empty()) {
        throw SeriesError(ErrorKind::MissingValue, "no precipitation value at " + list_times(missing),
                          first_missing, missing);
    }

    std::vector<Timestamp> negative;
    size_t first_negative = 0;
    for (size_t i=0; i<r.size(); ++i) {
        if (*r[i].precip < 0.0) {
            if (negative.empty()) first_negative = i;
            negative.push_back(r[i].timestamp);
        }
    }
    if (!negative.empty()) {
        throw SeriesError(ErrorKind::NegativeValue, "negative precipitation at " + list_times(negative),
                          first_negative, negative);
    }

    ValidSeries out;
    out.times_.reserve(r.size());
    out.precip_.reserve(r.size());
    for (const auto& rec : r) {
        out.times_.push_back(rec.timestamp);
        out.precip_.push_back(*rec.precip);
    }
    return out;
}

} // namespace rain
