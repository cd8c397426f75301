#include "rain/weather.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace rain {

const char* to_string(Weather w) {
    return w == Weather::Wet ? "Wet" : "Dry";
}

std::vector<std::optional<Weather>> classify(const AntecedentSeries& antecedent, double threshold) {
    std::vector<std::optional<Weather>> out;
    out.reserve(antecedent.values.size());
    for (const auto& v : antecedent.values) {
        if (!v) out.emplace_back(std::nullopt);
        else    out.emplace_back(*v >= threshold ? Weather::Wet : Weather::Dry);
    }
    return out;
}

std::string antecedent_column_name(const WeatherOptions& opts) {
    return opts.column_prefix + std::to_string(opts.period) + "h";
}

WeatherJoin append_weather(const Table& target, const std::string& time_column,
                           const ValidSeries& series, const WeatherOptions& opts)
{
    const size_t tcol = target.column_index(time_column);

    WeatherJoin out;
    out.value_column = antecedent_column_name(opts);
    out.weather_column = out.value_column + "_weather";
    for (const std::string* name : {&out.value_column, &out.weather_column}) {
        if (target.has_column(*name)) {
            throw std::runtime_error("table already has a column named '" + *name + "'");
        }
    }

    const AntecedentSeries ante = aggregate(series, opts.period, opts.delay, opts.reducer);
    const auto labels = classify(ante, opts.threshold);

    out.table.columns = target.columns;
    out.table.columns.push_back(out.value_column);
    out.table.columns.push_back(out.weather_column);
    out.table.rows.reserve(target.rows.size());
    out.coverage.rows = target.rows.size();

    for (const auto& row : target.rows) {
        auto& dst = out.table.rows.emplace_back(row);
        dst.resize(target.columns.size());
        Cell value, label;

        const Timestamp* t = tcol < row.size() ? std::get_if<Timestamp>(&row[tcol]) : nullptr;
        if (!t) {
            ++out.coverage.no_timestamp;
        } else if (const auto idx = series.index_of(floor_to_hour(*t)); !idx) {
            ++out.coverage.unmatched_hour;
        } else if (!ante.values[*idx]) {
            ++out.coverage.undefined_antecedent;
        } else {
            value = *ante.values[*idx];
            label = std::string(to_string(*labels[*idx]));
            ++out.coverage.matched;
        }
        dst.push_back(std::move(value));
        dst.push_back(std::move(label));
    }
    return out;
}

} // namespace rain
