#include "rain/h5.hpp"

#include <H5Cpp.h>
#include <hdf5.h>
#include <H5Epublic.h>
#include <H5Lpublic.h>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace rain {

static bool dataset_exists(H5::H5File& f, const std::string& path) {
    H5E_auto2_t old_func;
    void* old_client;
    H5Eget_auto2(H5E_DEFAULT, &old_func, &old_client);
    H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
    const htri_t ex = H5Lexists(f.getId(), path.c_str(), H5P_DEFAULT);
    H5Eset_auto2(H5E_DEFAULT, old_func, old_client);
    return ex > 0;
}

static std::optional<double> try_attr_double(H5::DataSet& ds, const char* name) {
    if (H5Aexists(ds.getId(), name) <= 0) return std::nullopt;
    auto a = ds.openAttribute(name);
    const H5T_class_t cls = a.getTypeClass();
    if (cls == H5T_INTEGER) { long long v=0; a.read(H5::PredType::NATIVE_LLONG, &v); return static_cast<double>(v); }
    if (cls != H5T_FLOAT) return std::nullopt;
    H5::FloatType t = a.getFloatType();
    const size_t sz = t.getSize();
    if (sz == sizeof(double)) { double v=0; a.read(H5::PredType::NATIVE_DOUBLE, &v); return v; }
    else { float v=0; a.read(H5::PredType::NATIVE_FLOAT, &v); return static_cast<double>(v); }
}

static hsize_t extent_1d(H5::DataSet& ds, const std::string& name) {
    H5::DataSpace sp = ds.getSpace();
    if (sp.getSimpleExtentNdims() != 1) {
        throw std::runtime_error("dataset " + name + " is not 1D");
    }
    hsize_t npts = 0;
    sp.getSimpleExtentDims(&npts, nullptr);
    return npts;
}

HourlySeries H5SeriesReader::read(const std::string& h5file) const {
    H5::Exception::dontPrint();
    H5::H5File f(h5file, H5F_ACC_RDONLY);

    const std::vector<std::string> candidates = {
        "/precip", "precip",
        "/precipitation", "precipitation",
        "/rain", "rain",
        "/gauge/precip", "gauge/precip"
    };

    H5::DataSet ds;
    std::string used;
    bool found = false;
    for (const auto& c : candidates) {
        if (dataset_exists(f, c)) {
            ds = f.openDataSet(c);
            used = c;
            found = true;
            break;
        }
    }
    if (!found) throw std::runtime_error("no precipitation dataset found in: " + h5file);

    const hsize_t npts = extent_1d(ds, used);
    std::vector<double> depth(static_cast<size_t>(npts));
    ds.read(depth.data(), H5::PredType::NATIVE_DOUBLE);

    std::vector<long long> epoch(static_cast<size_t>(npts));
    if (dataset_exists(f, "/time")) {
        H5::DataSet tds = f.openDataSet("/time");
        if (extent_1d(tds, "/time") != npts) {
            throw std::runtime_error("/time and " + used + " differ in length");
        }
        tds.read(epoch.data(), H5::PredType::NATIVE_LLONG);
    } else {
        double t0 = 0.0, dt = 3600.0;
        if (auto a = try_attr_double(ds, "Xstart"); a)                t0 = *a;
        if (auto a = try_attr_double(ds, "Xspacing"); a && *a > 0)    dt = *a;
        for (size_t i=0; i<epoch.size(); ++i) {
            epoch[i] = static_cast<long long>(std::llround(t0 + static_cast<double>(i) * dt));
        }
    }

    HourlySeries out;
    out.source = h5file + ":" + used;
    out.records.reserve(depth.size());
    for (size_t i=0; i<depth.size(); ++i) {
        HourlyRecord rec;
        rec.timestamp = Timestamp{std::chrono::seconds{epoch[i]}};
        if (!std::isnan(depth[i])) rec.precip = depth[i];
        out.records.push_back(rec);
    }
    return out;
}

} // namespace rain
