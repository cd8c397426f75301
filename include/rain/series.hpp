#pragma once
#include "rain/util.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rain {

struct HourlyRecord {
    Timestamp timestamp;
    std::optional<double> precip;   // nullopt = missing reading
};

// Raw series as loaded from a reader. Nothing is guaranteed about it until
// it has passed validate().
struct HourlySeries {
    std::vector<HourlyRecord> records;
    std::string source;
};

class ValidSeries;
ValidSeries validate(const HourlySeries& series);

// A strictly increasing, gap-free, complete hourly series. Only validate()
// constructs one, so consumers never re-check continuity.
class ValidSeries {
public:
    ValidSeries() = default;

    std::size_t size() const { return times_.size(); }
    bool empty() const { return times_.empty(); }
    const std::vector<Timestamp>& times() const { return times_; }
    const std::vector<double>& precip() const { return precip_; }
    Timestamp time(std::size_t i) const { return times_[i]; }
    double precip(std::size_t i) const { return precip_[i]; }

    // Index of the record starting at hour t, if the series covers it.
    std::optional<std::size_t> index_of(Timestamp t) const;

private:
    friend ValidSeries validate(const HourlySeries& series);
    std::vector<Timestamp> times_;
    std::vector<double> precip_;
};

} // namespace rain
