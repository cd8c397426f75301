#include "rain/csv.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace rain {

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool quoted = false;
    for (size_t i=0; i<line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"' && i+1 < line.size() && line[i+1] == '"') { cur += '"'; ++i; }
            else if (c == '"') quoted = false;
            else cur += c;
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            out.push_back(cur);
            cur.clear();
        } else if (c != '\r') {
            cur += c;
        }
    }
    out.push_back(cur);
    return out;
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}

static bool is_missing(const std::string& s) {
    return s.empty() || s == "NA" || s == "NaN" || s == "nan";
}

static bool parse_double(const std::string& s, double& v) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    v = std::strtod(s.c_str(), &end);
    return errno == 0 && end == s.c_str() + s.size();
}

static bool parse_int(const std::string& s, std::int64_t& v) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    v = std::strtoll(s.c_str(), &end, 10);
    return errno == 0 && end == s.c_str() + s.size();
}

static std::ifstream open_in(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("cannot open input file: " + path);
    return f;
}

// Depths are written so they read back as the same double.
static std::ofstream open_out(const std::string& path) {
    std::ofstream f(path);
    if (!f) throw std::runtime_error("cannot open output file: " + path);
    f << std::setprecision(std::numeric_limits<double>::max_digits10);
    return f;
}

static std::vector<std::string> read_header(std::ifstream& f, const std::string& path) {
    std::string line;
    if (!std::getline(f, line)) throw std::runtime_error("empty CSV file: " + path);
    auto cols = split_csv_line(line);
    for (auto& c : cols) c = trim(c);
    return cols;
}

HourlySeries CsvReader::read_series(const std::string& path) const {
    std::ifstream f = open_in(path);
    const auto cols = read_header(f, path);
    const auto find_col = [&](const std::string& name) {
        const auto it = std::find(cols.begin(), cols.end(), name);
        if (it == cols.end()) throw std::runtime_error(path + ": missing column '" + name + "'");
        return static_cast<size_t>(it - cols.begin());
    };
    const size_t tcol = find_col("timestamp");
    const size_t pcol = find_col("precip");

    HourlySeries out;
    out.source = path;
    std::string line;
    size_t lineno = 1;
    while (std::getline(f, line)) {
        ++lineno;
        if (trim(line).empty()) continue;
        const auto fields = split_csv_line(line);
        if (fields.size() <= std::max(tcol, pcol)) {
            throw std::runtime_error(path + ":" + std::to_string(lineno) + ": too few fields");
        }
        HourlyRecord rec;
        rec.timestamp = parse_timestamp(trim(fields[tcol]));
        const std::string p = trim(fields[pcol]);
        if (!is_missing(p)) {
            double v = 0.0;
            if (!parse_double(p, v) || std::isnan(v)) {
                throw std::runtime_error(path + ":" + std::to_string(lineno) + ": bad precip value '" + p + "'");
            }
            rec.precip = v;
        }
        out.records.push_back(rec);
    }
    return out;
}

Table CsvReader::read_table(const std::string& path, const std::string& time_column) const {
    std::ifstream f = open_in(path);
    Table t;
    t.columns = read_header(f, path);
    const size_t tcol = t.column_index(time_column);

    std::string line;
    size_t lineno = 1;
    while (std::getline(f, line)) {
        ++lineno;
        if (trim(line).empty()) continue;
        auto fields = split_csv_line(line);
        fields.resize(t.columns.size());
        std::vector<Cell> row;
        row.reserve(fields.size());
        for (size_t c=0; c<fields.size(); ++c) {
            const std::string s = trim(fields[c]);
            std::int64_t iv = 0;
            double dv = 0.0;
            Timestamp ts;
            if (is_missing(s)) row.emplace_back(std::monostate{});
            else if (c == tcol) {
                if (!try_parse_timestamp(s, ts)) {
                    std::cerr << path << ":" << lineno << ": unparseable time '" << s << "'\n";
                    row.emplace_back(std::monostate{});
                } else {
                    row.emplace_back(ts);
                }
            }
            else if (parse_int(s, iv)) row.emplace_back(iv);
            else if (parse_double(s, dv)) row.emplace_back(dv);
            else row.emplace_back(s);
        }
        t.rows.push_back(std::move(row));
    }
    return t;
}

static std::string quote(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string q = "\"";
    for (char c : s) { if (c == '"') q += '"'; q += c; }
    return q + "\"";
}

void CsvWriter::write(const std::string& path, const AntecedentSeries& ante,
                      const std::vector<std::optional<Weather>>& labels) const
{
    std::ofstream f = open_out(path);
    f << "timestamp,antecedent_" << ante.reducer << "_" << ante.period << "h,weather\n";
    for (size_t i=0; i<ante.times.size(); ++i) {
        f << format_timestamp(ante.times[i]) << ",";
        if (ante.values[i]) f << *ante.values[i];
        f << ",";
        if (i < labels.size() && labels[i]) f << to_string(*labels[i]);
        f << "\n";
    }
    std::cout << "✓ CSV: " << path << "\n";
}

void CsvWriter::write(const std::string& path, const EventSegmentation& seg) const {
    std::ofstream f = open_out(path);
    f << "timestamp,precip,event_id,event_type\n";
    for (size_t i=0; i<seg.size(); ++i) {
        f << format_timestamp(seg.times[i]) << "," << seg.precip[i] << ","
          << seg.event_id[i] << "," << to_string(seg.event_type[i]) << "\n";
    }
    std::cout << "✓ CSV: " << path << "\n";
}

void CsvWriter::write(const std::string& path, const std::vector<EventSummary>& events) const {
    std::ofstream f = open_out(path);
    f << "event_id,event_type,start,end,duration_hours,total_depth,peak_intensity,mean_intensity\n";
    for (const auto& e : events) {
        f << e.event_id << "," << to_string(e.type) << ","
          << format_timestamp(e.start) << "," << format_timestamp(e.end) << ","
          << e.duration_hours << "," << e.total_depth << ","
          << e.peak_intensity << "," << e.mean_intensity << "\n";
    }
    std::cout << "✓ CSV: " << path << "\n";
}

void CsvWriter::write(const std::string& path, const Table& table) const {
    std::ofstream f = open_out(path);
    for (size_t c=0; c<table.columns.size(); ++c) {
        f << (c ? "," : "") << quote(table.columns[c]);
    }
    f << "\n";
    for (const auto& row : table.rows) {
        for (size_t c=0; c<row.size(); ++c) {
            f << (c ? "," : "") << quote(cell_to_string(row[c]));
        }
        f << "\n";
    }
    std::cout << "✓ CSV: " << path << "\n";
}

} // namespace rain
