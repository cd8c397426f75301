#include "rain/http.hpp"
#include "rain/util.hpp"

#include <curl/curl.h>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>

namespace rain {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

struct FileCloser {
    void operator()(FILE* f) const { std::fclose(f); }
};

// Counts bytes so an empty gauge export is caught without reopening the file.
struct Sink {
    FILE* fp = nullptr;
    curl_off_t bytes = 0;
};

size_t curl_writefile(void* ptr, size_t size, size_t nmemb, void* stream) {
    Sink* sink = static_cast<Sink*>(stream);
    const size_t n = fwrite(ptr, size, nmemb, sink->fp);
    sink->bytes += static_cast<curl_off_t>(n * size);
    return n * size;
}

} // namespace

std::string HttpClient::local_name(const std::string& url) {
    const std::string path = url.substr(0, url.find_first_of("?#"));
    const auto slash = path.find_last_of('/');
    std::string fname = (slash == std::string::npos) ? path : path.substr(slash + 1);
    if (path.find("://") != std::string::npos && slash != std::string::npos && slash > 0
        && path.compare(slash - 1, 2, "//") == 0) {
        fname.clear();  // bare host such as https://example.org
    }
    if (fname.empty()) fname = "gauge";
    if (fname.find('.') == std::string::npos) fname += ".csv";
    return fname;
}

std::string HttpClient::download_to(const std::string& url, const std::string& outdir) const {
    ensure_dir(outdir);
    const std::string outpath = outdir + "/" + local_name(url);
    const std::string partpath = outpath + ".part";

    curl_global_init(CURL_GLOBAL_DEFAULT);
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        curl_global_cleanup();
        throw std::runtime_error("curl init failed");
    }

    std::unique_ptr<FILE, FileCloser> fp(std::fopen(partpath.c_str(), "wb"));
    if (!fp) {
        curl.reset();
        curl_global_cleanup();
        throw std::runtime_error("cannot open output file: " + partpath);
    }

    Sink sink;
    sink.fp = fp.get();
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_writefile);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "rainevents/1.0");

    const CURLcode res = curl_easy_perform(curl.get());
    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    const bool flushed = std::fflush(fp.get()) == 0;
    fp.reset();
    curl.reset();
    curl_global_cleanup();

    std::string failure;
    if (res != CURLE_OK || code >= 400) {
        failure = "download failed (HTTP " + std::to_string(code) + "): " + curl_easy_strerror(res);
    } else if (!flushed) {
        failure = "cannot write " + partpath;
    } else if (sink.bytes == 0) {
        failure = "empty response from " + url;
    }
    if (!failure.empty()) {
        std::remove(partpath.c_str());
        throw std::runtime_error(failure);
    }

    if (std::rename(partpath.c_str(), outpath.c_str()) != 0) {
        std::remove(partpath.c_str());
        throw std::runtime_error("cannot move download into place: " + outpath);
    }

    std::printf("✓ Downloaded: %s (%lld bytes)\n", outpath.c_str(), static_cast<long long>(sink.bytes));
    return outpath;
}

} // namespace rain
