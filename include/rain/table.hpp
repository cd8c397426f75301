#pragma once
#include "rain/util.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace rain {

// Empty cells are std::monostate.
using Cell = std::variant<std::monostate, std::int64_t, double, std::string, Timestamp>;

struct Table {
    std::vector<std::string> columns;
    std::vector<std::vector<Cell>> rows;

    // Throws std::runtime_error if the column does not exist.
    std::size_t column_index(const std::string& name) const;
    bool has_column(const std::string& name) const;
};

std::string cell_to_string(const Cell& c);

} // namespace rain
