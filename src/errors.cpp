#include "rain/errors.hpp"

#include <utility>

namespace rain {

const char* to_string(ErrorKind k) {
    switch (k) {
    case ErrorKind::UnorderedOrDuplicateTimestamp: return "UnorderedOrDuplicateTimestamp";
    case ErrorKind::DiscontinuousSeries:           return "DiscontinuousSeries";
    case ErrorKind::MissingValue:                  return "MissingValue";
    case ErrorKind::NegativeValue:                 return "NegativeValue";
    case ErrorKind::InvalidWindowParameters:       return "InvalidWindowParameters";
    }
    return "Unknown";
}

SeriesError::SeriesError(ErrorKind kind, const std::string& what,
                         std::size_t index,
                         std::vector<Timestamp> timestamps,
                         std::chrono::seconds gap)
    : std::runtime_error(std::string(to_string(kind)) + ": " + what),
      kind_(kind), index_(index), timestamps_(std::move(timestamps)), gap_(gap) {}

} // namespace rain
