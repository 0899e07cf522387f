/// @file FitCache.cc
/// @brief MD5 fit hash, JSON cache entries and the flock based cache lock.

#include "FitCache.hh"
#include "RuntimeConfig.hh"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <stdexcept>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "TMD5.h"
#include "glog/logging.h"

namespace bkgfit {

namespace fs = std::filesystem;
namespace pt = boost::property_tree;

namespace {

void UpdateString(TMD5& md5, const std::string& s) {
    md5.Update(reinterpret_cast<const UChar_t*>(s.data()), static_cast<UInt_t>(s.size()));
}

void UpdateFloats(TMD5& md5, const std::vector<double>& values, const char* format) {
    char buffer[64];
    for (double v : values) {
        std::snprintf(buffer, sizeof(buffer), format, v);
        UpdateString(md5, buffer);
    }
}

// 17 significant digits so a stored double reads back bit-identical
std::string FormatExact(double v) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.17g", v);
    return buffer;
}

double ParseExact(const std::string& s) {
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str()) {
        throw std::runtime_error("malformed number '" + s + "'");
    }
    return v;
}

pt::ptree ToArray(const std::vector<double>& values) {
    pt::ptree array;
    for (double v : values) {
        pt::ptree item;
        item.put_value(FormatExact(v));
        array.push_back(std::make_pair("", item));
    }
    return array;
}

std::vector<double> FromArray(const pt::ptree& node, const std::string& key) {
    std::vector<double> out;
    const auto child = node.get_child_optional(key);
    if (!child) {
        return out;
    }
    for (const auto& item : *child) {
        out.push_back(ParseExact(item.second.data()));
    }
    return out;
}

pt::ptree ToTree(const FitResult& r) {
    pt::ptree tree;
    tree.put("hash", r.hash);
    tree.put("expression", r.expression);
    tree.put("method", r.method);
    tree.put("success", r.success);
    tree.put("fun", FormatExact(r.fun));
    tree.put("nfev", r.nfev);
    tree.put("message", r.message);
    tree.add_child("x", ToArray(r.x));
    tree.add_child("x_init", ToArray(r.xInit));
    tree.put("brute_force", r.bruteForce);
    pt::ptree starts;
    for (const auto& start : r.bruteStarts) {
        starts.push_back(std::make_pair("", ToArray(start)));
    }
    tree.add_child("brute_starts", starts);
    return tree;
}

FitResult FromTree(const pt::ptree& tree) {
    FitResult r;
    r.hash = tree.get<std::string>("hash", "");
    r.expression = tree.get<std::string>("expression", "");
    r.method = tree.get<std::string>("method", "");
    r.success = tree.get<bool>("success", false);
    r.fun = ParseExact(tree.get<std::string>("fun"));
    r.nfev = tree.get<int>("nfev", 0);
    r.message = tree.get<std::string>("message", "");
    r.x = FromArray(tree, "x");
    r.xInit = FromArray(tree, "x_init");
    r.bruteForce = tree.get<bool>("brute_force", false);
    if (const auto starts = tree.get_child_optional("brute_starts")) {
        for (const auto& item : *starts) {
            std::vector<double> start;
            for (const auto& v : item.second) {
                start.push_back(ParseExact(v.second.data()));
            }
            r.bruteStarts.push_back(std::move(start));
        }
    }
    return r;
}

}  // namespace

std::string MakeFitHash(const std::string& expression, const Histogram& histogram,
                        const std::optional<std::vector<double>>& initVals,
                        const std::optional<OptimizerSettings>& settings, const std::string& tag) {
    TMD5 md5;
    UpdateString(md5, expression);
    UpdateFloats(md5, histogram.Binning(), "%.5f");
    UpdateFloats(md5, histogram.Vals(), "%.5f");
    if (initVals) {
        UpdateFloats(md5, *initVals, "%.5f");
    }
    if (settings) {
        UpdateFloats(md5, {settings->tolerance}, "%.3f");
        UpdateString(md5, settings->method);
    }
    if (!tag.empty()) {
        UpdateString(md5, tag);
    }
    md5.Final();
    return md5.AsString();
}

// ---------------------------------------------------------------------------
// FitCache
// ---------------------------------------------------------------------------

FitCache::FitCache(std::string directory) : fDirectory(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(fDirectory, ec);
    if (ec) {
        throw std::runtime_error("FitCache: cannot create " + fDirectory + ": " + ec.message());
    }
}

std::string FitCache::PathFor(const std::string& hash) const {
    return (fs::path(fDirectory) / (hash + ".json")).string();
}

bool FitCache::Contains(const std::string& hash) const {
    return fs::exists(PathFor(hash));
}

std::optional<FitResult> FitCache::Get(const std::string& hash) const {
    const std::string path = PathFor(hash);
    if (!fs::exists(path)) {
        return std::nullopt;
    }
    try {
        pt::ptree tree;
        pt::read_json(path, tree);
        FitResult result = FromTree(tree);
        VLOG(1) << "Cache hit " << hash;
        return result;
    } catch (const std::exception& e) {
        throw std::runtime_error("FitCache: cannot read " + path + ": " + e.what());
    }
}

void FitCache::Write(const std::string& hash, const FitResult& result) const {
    const std::string path = PathFor(hash);
    const std::string tmp = path + ".tmp." + std::to_string(::getpid());
    try {
        pt::write_json(tmp, ToTree(result));
    } catch (const pt::json_parser_error& e) {
        throw std::runtime_error("FitCache: cannot write " + tmp + ": " + e.what());
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error("FitCache: cannot move entry into place at " + path);
    }
    LOG(INFO) << "Wrote fit " << hash << " to cache " << fDirectory;
}

// ---------------------------------------------------------------------------
// FileLock
// ---------------------------------------------------------------------------

FileLock::FileLock(std::string path) : fPath(std::move(path)) {
    fFd = ::open(fPath.c_str(), O_CREAT | O_RDWR, 0644);
    if (fFd < 0) {
        throw std::runtime_error("FileLock: cannot open " + fPath + ": " + std::strerror(errno));
    }
}

FileLock::~FileLock() {
    if (fFd >= 0) {
        ::close(fFd);  // releases any lock still held
    }
}

void FileLock::lock() {
    while (::flock(fFd, LOCK_EX) != 0) {
        if (errno != EINTR) {
            throw std::runtime_error("FileLock: cannot lock " + fPath + ": " + std::strerror(errno));
        }
    }
}

void FileLock::unlock() {
    if (::flock(fFd, LOCK_UN) != 0) {
        throw std::runtime_error("FileLock: cannot unlock " + fPath + ": " + std::strerror(errno));
    }
}

std::unique_ptr<FitCache> OpenConfiguredCache() {
    const RuntimeConfig& config = RuntimeConfig::Instance();
    if (!config.useCache) {
        LOG(INFO) << "Fit cache disabled";
        return nullptr;
    }
    return std::make_unique<FitCache>(config.cacheDirectory);
}

}  // namespace bkgfit
