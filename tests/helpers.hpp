#pragma once
#include "rain/series.hpp"
#include "rain/util.hpp"

#include <optional>
#include <vector>

namespace rain::test {

inline Timestamp t0() { return parse_timestamp("2021-07-01 00:00:00"); }

inline Timestamp hour(int i) { return t0() + i * kHour; }

inline HourlySeries make_raw(const std::vector<std::optional<double>>& precip) {
    HourlySeries s;
    for (size_t i=0; i<precip.size(); ++i) {
        s.records.push_back({hour(static_cast<int>(i)), precip[i]});
    }
    return s;
}

inline ValidSeries make_series(const std::vector<double>& precip) {
    std::vector<std::optional<double>> p(precip.begin(), precip.end());
    return validate(make_raw(p));
}

} // namespace rain::test
