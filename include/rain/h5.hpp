#pragma once
#include "rain/series.hpp"

#include <string>

namespace rain {

class H5SeriesReader {
public:
    // Reads a 1-D precipitation dataset. Timestamps come from a /time
    // dataset (epoch seconds) if present, else from the Xstart/Xspacing
    // attributes. NaN samples become missing values.
    HourlySeries read(const std::string& h5file) const;
};

} // namespace rain
