#include "rain/util.hpp"
#include <sys/stat.h>
#ifdef _WIN32
  #include <direct.h>
#endif
#include <cstdio>
#include <stdexcept>
#include <string>

namespace rain {

void ensure_dir(const std::string& path) {
#ifdef _WIN32
    _mkdir(path.c_str());
#else
    ::mkdir(path.c_str(), 0755);
#endif
}

bool is_http_url(const std::string& s) {
    return s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0;
}

// Howard Hinnant's civil calendar conversions.
static long long days_from_civil(long long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

static void civil_from_days(long long z, long long& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe/1460 + doe/36524 - doe/146096) / 365;
    const unsigned doy = doe - (365*yoe + yoe/4 - yoe/100);
    const unsigned mp = (5*doy + 2) / 153;
    d = doy - (153*mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<long long>(yoe) + era * 400 + (m <= 2);
}

static bool is_leap(long long y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

bool try_parse_timestamp(const std::string& s, Timestamp& out) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    char sep = 0;
    int consumed = 0;
    const int n = std::sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d%n", &y, &mo, &d, &sep, &h, &mi, &consumed);
    if (n < 6 || (sep != ' ' && sep != 'T')) return false;
    std::string rest = s.substr(static_cast<size_t>(consumed));
    if (!rest.empty()) {
        int more = 0;
        if (std::sscanf(rest.c_str(), ":%2d%n", &sec, &more) != 1) return false;
        rest = rest.substr(static_cast<size_t>(more));
        if (rest == "Z") rest.clear();
        if (!rest.empty()) return false;
    }

    static const int mdays[] = {31,28,31,30,31,30,31,31,30,31,30,31};
    if (mo < 1 || mo > 12 || d < 1) return false;
    const int maxd = (mo == 2 && is_leap(y)) ? 29 : mdays[mo - 1];
    if (d > maxd || h > 23 || mi > 59 || sec > 59 || h < 0 || mi < 0 || sec < 0) return false;

    const long long days = days_from_civil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d));
    out = Timestamp{std::chrono::seconds{days * 86400 + h * 3600LL + mi * 60LL + sec}};
    return true;
}

Timestamp parse_timestamp(const std::string& s) {
    Timestamp t;
    if (!try_parse_timestamp(s, t)) throw std::runtime_error("invalid timestamp: '" + s + "'");
    return t;
}

std::string format_timestamp(Timestamp t) {
    long long secs = t.time_since_epoch().count();
    long long days = secs / 86400;
    long long rem = secs % 86400;
    if (rem < 0) { rem += 86400; --days; }
    long long y = 0; unsigned m = 0, d = 0;
    civil_from_days(days, y, m, d);
    char buf[32];
    std::snprintf(buf, sizeof buf, "%04lld-%02u-%02u %02lld:%02lld:%02lld",
                  y, m, d, rem / 3600, (rem % 3600) / 60, rem % 60);
    return buf;
}

Timestamp floor_to_hour(Timestamp t) {
    return std::chrono::floor<std::chrono::hours>(t);
}

} // namespace rain
