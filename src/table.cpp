#include "rain/table.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace rain {

std::size_t Table::column_index(const std::string& name) const {
    const auto it = std::find(columns.begin(), columns.end(), name);
    if (it == columns.end()) throw std::runtime_error("no column named '" + name + "'");
    return static_cast<std::size_t>(it - columns.begin());
}

bool Table::has_column(const std::string& name) const {
    return std::find(columns.begin(), columns.end(), name) != columns.end();
}

namespace {
struct CellPrinter {
    std::string operator()(std::monostate) const { return {}; }
    std::string operator()(std::int64_t v) const { return std::to_string(v); }
    std::string operator()(double v) const {
        std::ostringstream os;
        os << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
        return os.str();
    }
    std::string operator()(const std::string& v) const { return v; }
    std::string operator()(Timestamp t) const { return format_timestamp(t); }
};
} // namespace

std::string cell_to_string(const Cell& c) {
    return std::visit(CellPrinter{}, c);
}

} // namespace rain
