#pragma once
#include "rain/antecedent.hpp"
#include "rain/series.hpp"
#include "rain/table.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rain {

enum class Weather { Dry, Wet };

const char* to_string(Weather w);

// Wet iff value >= threshold. Undefined values stay undefined.
std::vector<std::optional<Weather>> classify(const AntecedentSeries& antecedent, double threshold);

struct WeatherOptions {
    int period = 24;
    int delay = 0;
    double threshold = 0.1;
    std::string column_prefix = "precip";
    Reducer reducer = Reducer::Sum;
};

// Rows that could not be annotated, by cause. matched + the three causes
// always add up to rows.
struct JoinCoverage {
    std::size_t rows = 0;
    std::size_t matched = 0;
    std::size_t no_timestamp = 0;
    std::size_t unmatched_hour = 0;
    std::size_t undefined_antecedent = 0;

    std::size_t unannotated() const { return rows - matched; }
    bool complete() const { return matched == rows; }
};

struct WeatherJoin {
    Table table;
    JoinCoverage coverage;
    std::string value_column;
    std::string weather_column;
};

std::string antecedent_column_name(const WeatherOptions& opts);

// Copies target and appends the antecedent value and its Wet/Dry label for
// the hour containing each row's time_column value.
WeatherJoin append_weather(const Table& target, const std::string& time_column,
                           const ValidSeries& series, const WeatherOptions& opts);

} // namespace rain
