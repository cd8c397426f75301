#include "rain/antecedent.hpp"
#include "rain/errors.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace rain {

Reducer parse_reducer(const std::string& name) {
    if (name == "sum")  return Reducer::Sum;
    if (name == "max")  return Reducer::Max;
    if (name == "min")  return Reducer::Min;
    if (name == "mean") return Reducer::Mean;
    throw std::runtime_error("unknown reducer: " + name);
}

const char* to_string(Reducer r) {
    switch (r) {
    case Reducer::Sum:  return "sum";
    case Reducer::Max:  return "max";
    case Reducer::Min:  return "min";
    case Reducer::Mean: return "mean";
    }
    return "sum";
}

static ReduceFn make_reducer(Reducer r) {
    using It = std::vector<double>::const_iterator;
    switch (r) {
    case Reducer::Max:
        return [](It first, It last) { return *std::max_element(first, last); };
    case Reducer::Min:
        return [](It first, It last) { return *std::min_element(first, last); };
    case Reducer::Mean:
        return [](It first, It last) {
            return std::accumulate(first, last, 0.0) / static_cast<double>(last - first);
        };
    case Reducer::Sum:
        break;
    }
    return [](It first, It last) { return std::accumulate(first, last, 0.0); };
}

AntecedentSeries aggregate(const ValidSeries& series, int period, int delay, Reducer reducer) {
    return aggregate(series, period, delay, make_reducer(reducer), to_string(reducer));
}

AntecedentSeries aggregate(const ValidSeries& series, int period, int delay,
                           const ReduceFn& reducer, const std::string& name)
{
    if (period <= 0 || delay < 0) {
        throw SeriesError(ErrorKind::InvalidWindowParameters,
                          "period must be > 0 and delay >= 0 (got period=" + std::to_string(period)
                          + ", delay=" + std::to_string(delay) + ")");
    }
    if (!reducer) throw std::invalid_argument("aggregate: empty reducer");

    AntecedentSeries out;
    out.times = series.times();
    out.values.assign(series.size(), std::nullopt);
    out.period = period;
    out.delay = delay;
    out.reducer = name;

    const auto& p = series.precip();
    const long long span = static_cast<long long>(period) + delay - 1;
    for (size_t i=0; i<p.size(); ++i) {
        const long long lo = static_cast<long long>(i) - span;
        if (lo < 0) continue;
        const auto first = p.begin() + lo;
        out.values[i] = reducer(first, first + period);
    }
    return out;
}

} // namespace rain
