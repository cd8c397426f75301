#pragma once
#include "rain/antecedent.hpp"
#include "rain/events.hpp"
#include "rain/series.hpp"
#include "rain/table.hpp"

#include <string>
#include <vector>

namespace rain {

class CsvReader {
public:
    // Header row required; columns "timestamp" and "precip" (in any order).
    // Empty, NA and NaN cells are read as missing values.
    HourlySeries read_series(const std::string& path) const;
    // Generic table; time_column is parsed as timestamps, other cells as
    // integers, reals or text.
    Table read_table(const std::string& path, const std::string& time_column) const;
};

class CsvWriter {
public:
    void write(const std::string& path, const AntecedentSeries& ante,
               const std::vector<std::optional<Weather>>& labels) const;
    void write(const std::string& path, const EventSegmentation& seg) const;
    void write(const std::string& path, const std::vector<EventSummary>& events) const;
    void write(const std::string& path, const Table& table) const;
};

// Splits one CSV line; double-quoted fields may contain commas and "".
std::vector<std::string> split_csv_line(const std::string& line);

} // namespace rain
