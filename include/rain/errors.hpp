#pragma once
#include "rain/util.hpp"

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace rain {

enum class ErrorKind {
    UnorderedOrDuplicateTimestamp,
    DiscontinuousSeries,
    MissingValue,
    NegativeValue,
    InvalidWindowParameters
};

const char* to_string(ErrorKind k);

// Raised by the validator and the aggregator. Carries the failed check and
// where it failed so a caller can diagnose without re-running.
class SeriesError : public std::runtime_error {
public:
    SeriesError(ErrorKind kind, const std::string& what,
                std::size_t index = 0,
                std::vector<Timestamp> timestamps = {},
                std::chrono::seconds gap = std::chrono::seconds{0});

    ErrorKind kind() const { return kind_; }
    // Index of the first offending record.
    std::size_t index() const { return index_; }
    const std::vector<Timestamp>& timestamps() const { return timestamps_; }
    // Distance between the two records around a discontinuity, or how far
    // past the hour a misaligned first record sits.
    std::chrono::seconds gap() const { return gap_; }

private:
    ErrorKind kind_;
    std::size_t index_;
    std::vector<Timestamp> timestamps_;
    std::chrono::seconds gap_;
};

} // namespace rain
