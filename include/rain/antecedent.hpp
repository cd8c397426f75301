#pragma once
#include "rain/series.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace rain {

enum class Reducer { Sum, Max, Min, Mean };

using ReduceFn = std::function<double(std::vector<double>::const_iterator first,
                                      std::vector<double>::const_iterator last)>;

Reducer parse_reducer(const std::string& name);
const char* to_string(Reducer r);

// Trailing-window statistic aligned with its source series. nullopt marks
// hours without enough history for the window.
struct AntecedentSeries {
    std::vector<Timestamp> times;
    std::vector<std::optional<double>> values;
    int period = 0;
    int delay = 0;
    std::string reducer;
};

// Value at hour i reduces precip over [i - delay - period + 1, i - delay].
// Throws SeriesError(InvalidWindowParameters) for period <= 0 or delay < 0.
AntecedentSeries aggregate(const ValidSeries& series, int period, int delay = 0,
                           Reducer reducer = Reducer::Sum);
AntecedentSeries aggregate(const ValidSeries& series, int period, int delay,
                           const ReduceFn& reducer, const std::string& name = "custom");

} // namespace rain
