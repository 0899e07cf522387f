/// @file FitCache.hh
/// @brief Persistent store of fit results keyed by a digest of the fit inputs.
///
/// One JSON file per hash lives in the cache directory. Entries are
/// append-only and written through a temporary file so a completed Write
/// survives a crash. The cache itself does not lock; processes sharing a
/// directory serialize their get/compute/write cycles through a CacheLock.

#ifndef BKGFIT_FIT_CACHE_HH
#define BKGFIT_FIT_CACHE_HH

#include "FitResult.hh"
#include "Histogram.hh"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bkgfit {

/// Optimizer settings that take part in the hash.
struct OptimizerSettings {
    double tolerance{0.0};
    std::string method;
};

/// MD5 hex digest of expression, binning and values ("%.5f"), init values
/// ("%.5f"), tolerance ("%.3f") and method when settings are given, and tag.
/// Bin errors are not part of the digest.
std::string MakeFitHash(const std::string& expression, const Histogram& histogram,
                        const std::optional<std::vector<double>>& initVals = std::nullopt,
                        const std::optional<OptimizerSettings>& settings = std::nullopt,
                        const std::string& tag = "");

class FitCache {
public:
    /// Creates the directory if needed.
    /// @throws std::runtime_error if it cannot be created
    explicit FitCache(std::string directory);

    const std::string& Directory() const { return fDirectory; }
    std::string PathFor(const std::string& hash) const;

    bool Contains(const std::string& hash) const;

    /// @throws std::runtime_error if the entry exists but cannot be parsed
    std::optional<FitResult> Get(const std::string& hash) const;

    /// @throws std::runtime_error on I/O failure
    void Write(const std::string& hash, const FitResult& result) const;

private:
    std::string fDirectory;
};

/// Cache in the configured cache_dir, or null when use_cache is off.
std::unique_ptr<FitCache> OpenConfiguredCache();

/// Exclusive lock around a cache get/compute/write cycle (BasicLockable).
class CacheLock {
public:
    virtual ~CacheLock() = default;
    virtual void lock() = 0;
    virtual void unlock() = 0;
};

/// Advisory POSIX flock on a lock file, shared between processes.
class FileLock : public CacheLock {
public:
    explicit FileLock(std::string path);
    ~FileLock() override;

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    void lock() override;
    void unlock() override;

    const std::string& Path() const { return fPath; }

private:
    std::string fPath;
    int fFd{-1};
};

}  // namespace bkgfit

#endif  // BKGFIT_FIT_CACHE_HH
