#pragma once
#include <stdexcept>
#include <string>

namespace rain {

struct Args {
    std::string source;
    std::string outdir = "out";
    int period = 24;
    int delay = 0;
    std::string reducer = "sum";
    double threshold = 0.1;
    int merge_gap = 0;
    std::string samples;
    std::string time_column = "timestamp";
    std::string prefix = "precip";
    bool no_download = false;
};

// Thrown by parse_args for bad command lines.
struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

class App {
public:
    int run(int argc, char** argv);
    static Args parse_args(int argc, char** argv);
private:
    static void usage(const char* prog);
};

} // namespace rain
