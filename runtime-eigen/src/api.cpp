#include "../include/private_analytics_runtime_eigen/api.hpp"
#include "../include/private_analytics_runtime_eigen/mechanisms.hpp"
#include "../include/private_analytics_runtime_eigen/utilities.hpp"

#include <private_analytics/errors.hpp>
#include <private_analytics/logging.hpp>

#include <limits>
#include <stdexcept>

using namespace private_analytics;

extern "C" double laplace_mechanism(double value, double epsilon, double sensitivity) {
    try {
        return value + sampleLaplace(0., laplaceScale(epsilon, sensitivity));
    } catch (const std::invalid_argument& error) {
        logMessage(LogLevel::Warning, "api", error.what());
    } catch (const EntropyFailure& error) {
        logMessage(LogLevel::Error, "api", error.what());
    }
    return std::numeric_limits<double>::quiet_NaN();
}

extern "C" double gaussian_mechanism(double value, double epsilon, double delta, double sensitivity) {
    try {
        return value + sampleGaussian(0., gaussianSigma(epsilon, delta, sensitivity));
    } catch (const std::invalid_argument& error) {
        logMessage(LogLevel::Warning, "api", error.what());
    } catch (const EntropyFailure& error) {
        logMessage(LogLevel::Error, "api", error.what());
    }
    return std::numeric_limits<double>::quiet_NaN();
}
