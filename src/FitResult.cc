/// @file FitResult.cc

#include "FitResult.hh"

#include <ostream>

namespace bkgfit {

namespace {

void PrintVector(std::ostream& os, const std::vector<double>& v) {
    os << "[";
    for (std::size_t i = 0; i < v.size(); ++i) {
        os << (i ? ", " : "") << v[i];
    }
    os << "]";
}

}  // namespace

std::ostream& operator<<(std::ostream& os, const FitResult& result) {
    os << "  method: " << result.method << "\n  success: " << (result.success ? "True" : "False")
       << "\n  fun: " << result.fun << "\n  x: ";
    PrintVector(os, result.x);
    os << "\n  x_init: ";
    PrintVector(os, result.xInit);
    os << "\n  nfev: " << result.nfev << "\n  message: " << result.message
       << "\n  hash: " << result.hash;
    if (result.bruteForce) {
        os << "\n  brute force starts: " << result.bruteStarts.size();
    }
    return os;
}

}  // namespace bkgfit
