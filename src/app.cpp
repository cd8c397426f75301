#include "rain/app.hpp"
#include "rain/antecedent.hpp"
#include "rain/csv.hpp"
#include "rain/errors.hpp"
#include "rain/events.hpp"
#include "rain/h5.hpp"
#include "rain/http.hpp"
#include "rain/plot.hpp"
#include "rain/series.hpp"
#include "rain/util.hpp"
#include "rain/weather.hpp"

#include <H5Cpp.h>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace rain {

void App::usage(const char* prog) {
    std::cerr <<
        "Usage:\n"
        "  " << prog << " <url_or_csv_or_hdf5> [--out outdir] [--period 24] [--delay 0]\n"
        "      [--reducer sum|max|min|mean] [--threshold 0.1] [--merge-gap 0]\n"
        "      [--samples file.csv] [--time-column timestamp] [--prefix precip] [--no-download]\n\n"
        "Examples:\n"
        "  " << prog << " gauge.csv --period 48 --threshold 0.25\n"
        "  " << prog << " gauge.h5 --samples grab_samples.csv --time-column collected\n";
}

static int to_int(const std::string& k, const char* v) {
    try {
        size_t used = 0;
        const int n = std::stoi(v, &used);
        if (used != std::string(v).size()) throw std::invalid_argument(v);
        return n;
    } catch (const std::logic_error&) {
        throw UsageError("invalid integer for " + k + ": " + v);
    }
}

static double to_double(const std::string& k, const char* v) {
    try {
        size_t used = 0;
        const double d = std::stod(v, &used);
        if (used != std::string(v).size()) throw std::invalid_argument(v);
        return d;
    } catch (const std::logic_error&) {
        throw UsageError("invalid number for " + k + ": " + v);
    }
}

Args App::parse_args(int argc, char** argv) {
    if (argc < 2) throw UsageError("no input given");
    Args a;
    a.source = argv[1];
    for (int i=2; i<argc; ++i) {
        std::string k = argv[i];
        if (k=="--out" && i+1<argc) { a.outdir = argv[++i]; }
        else if (k=="--period" && i+1<argc) { a.period = to_int(k, argv[++i]); }
        else if (k=="--delay" && i+1<argc) { a.delay = to_int(k, argv[++i]); }
        else if (k=="--reducer" && i+1<argc) { a.reducer = argv[++i]; }
        else if (k=="--threshold" && i+1<argc) { a.threshold = to_double(k, argv[++i]); }
        else if (k=="--merge-gap" && i+1<argc) { a.merge_gap = to_int(k, argv[++i]); }
        else if (k=="--samples" && i+1<argc) { a.samples = argv[++i]; }
        else if (k=="--time-column" && i+1<argc) { a.time_column = argv[++i]; }
        else if (k=="--prefix" && i+1<argc) { a.prefix = argv[++i]; }
        else if (k=="--no-download") { a.no_download = true; }
        else { throw UsageError("Unknown arg: " + k); }
    }
    if (a.period <= 0) throw UsageError("--period must be at least 1 hour");
    if (a.delay < 0) throw UsageError("--delay must not be negative");
    if (a.merge_gap < 0) throw UsageError("--merge-gap must not be negative");
    try {
        parse_reducer(a.reducer);
    } catch (const std::runtime_error& e) {
        throw UsageError(e.what());
    }
    return a;
}

static bool has_suffix(const std::string& s, const std::string& suf) {
    return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

static HourlySeries load_series(const std::string& path) {
    if (has_suffix(path, ".h5") || has_suffix(path, ".hdf5")) {
        H5SeriesReader reader;
        return reader.read(path);
    }
    CsvReader reader;
    return reader.read_series(path);
}

int App::run(int argc, char** argv) {
    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n";
        usage(argc > 0 ? argv[0] : "rainevents");
        return 1;
    }

    try {
        std::string path = args.source;

        if (is_http_url(args.source)) {
            if (args.no_download) {
                std::cerr << "URL provided with --no-download. Nothing to do.\n";
                return 1;
            }
            HttpClient http;
            path = http.download_to(args.source, args.outdir);
        }

        const HourlySeries raw = load_series(path);
        const ValidSeries series = validate(raw);
        std::cout << "Series: " << raw.source << "\n"
                  << "Hours: " << series.size();
        if (!series.empty()) {
            std::cout << " (" << format_timestamp(series.times().front())
                      << " .. " << format_timestamp(series.times().back()) << ")";
        }
        std::cout << "\n";

        ensure_dir(args.outdir);

        const AntecedentSeries ante = aggregate(series, args.period, args.delay, parse_reducer(args.reducer));
        CsvWriter csv;
        csv.write(args.outdir + "/antecedent.csv", ante, classify(ante, args.threshold));

        SegmentOptions sopt;
        sopt.merge_dry_gap_hours = args.merge_gap;
        const EventSegmentation seg = segment(series, sopt);
        const std::vector<EventSummary> events = summarize(seg);
        csv.write(args.outdir + "/events.csv", seg);
        csv.write(args.outdir + "/summary.csv", events);

        const auto wet = std::count_if(events.begin(), events.end(),
                                       [](const EventSummary& e) { return e.type == Weather::Wet; });
        std::cout << "Events: " << events.size() << " (" << wet << " wet, "
                  << (static_cast<long>(events.size()) - wet) << " dry)\n";

        if (!args.samples.empty()) {
            CsvReader reader;
            const Table samples = reader.read_table(args.samples, args.time_column);
            WeatherOptions wopt;
            wopt.period = args.period;
            wopt.delay = args.delay;
            wopt.threshold = args.threshold;
            wopt.column_prefix = args.prefix;
            wopt.reducer = parse_reducer(args.reducer);
            const WeatherJoin joined = append_weather(samples, args.time_column, series, wopt);
            const JoinCoverage& cov = joined.coverage;
            if (!cov.complete()) {
                std::cerr << "Warning: " << cov.unannotated() << " of " << cov.rows
                          << " sample rows without weather (" << cov.unmatched_hour << " outside series, "
                          << cov.undefined_antecedent << " without enough history, "
                          << cov.no_timestamp << " without a time)\n";
            }
            csv.write(args.outdir + "/samples_weather.csv", joined.table);
        }

        SvgPlotter plot;
        plot.hyetograph(args.outdir + "/hyetograph.svg", 1200, 400, seg);

        std::cout << "Done. See " << args.outdir << "/summary.csv\n";
        return 0;
    } catch (const SeriesError& e) {
        if (e.kind() == ErrorKind::InvalidWindowParameters) {
            std::cerr << "Invalid parameters: " << e.what() << "\n";
            return 1;
        }
        std::cerr << "Invalid series: " << e.what() << "\n";
        return 2;
    } catch (const H5::Exception& e) {
        std::cerr << "HDF5 error: " << e.getDetailMsg() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}

} // namespace rain
