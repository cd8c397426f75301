#pragma once
#include <string>

namespace rain {

class HttpClient {
public:
    // Seconds before a stalled transfer is abandoned; 0 waits forever.
    long timeout_s = 120;

    // Download a gauge export to outdir; returns local filepath. Throws on
    // HTTP error or an empty response. A failed download leaves no file behind.
    std::string download_to(const std::string& url, const std::string& outdir) const;

    // File name for a downloaded export: the last path segment of the URL
    // without query or fragment, "gauge" if there is none, ".csv" appended
    // when it has no extension.
    static std::string local_name(const std::string& url);
};

} // namespace rain
