#include "LoggingInit.hh"
#include "RuntimeConfig.hh"
#include "glog/logging.h"

namespace bkgfit {

// Static member definitions
std::once_flag LoggingInitializer::init_flag_;

void LoggingInitializer::InitializeOnce() {
    std::call_once(init_flag_, DoInitialize);
}

void LoggingInitializer::DoInitialize() {
    const RuntimeConfig& config = RuntimeConfig::Instance();
    google::InitGoogleLogging("bkgfit");
    FLAGS_logtostderr = true;
    FLAGS_minloglevel = config.logMinLevel;
    FLAGS_v = config.logVerbosity;
}

} // namespace bkgfit
