#ifndef BKGFIT_LOGGING_INIT_HH
#define BKGFIT_LOGGING_INIT_HH

#include <mutex>

namespace bkgfit {

// Thread-safe one-time initialization of Google logging for the fitting core
// and Ceres, configured from RuntimeConfig.
class LoggingInitializer {
public:
    static void InitializeOnce();

private:
    static std::once_flag init_flag_;
    static void DoInitialize();
};

} // namespace bkgfit

#endif // BKGFIT_LOGGING_INIT_HH
