
#include <openssl/rand.h>
#include <openssl/err.h>
#include <cmath>
#include <cstdint>
#include <utility>
#include <string>
#include <private_analytics/errors.hpp>
#include "../include/private_analytics_runtime_eigen/utilities.hpp"

namespace private_analytics {

namespace {

const double kTwoPi = 6.283185307179586;

std::uint64_t secureBits() {
    unsigned char buffer[sizeof(std::uint64_t)];

    if (RAND_bytes(buffer, sizeof(buffer)) != 1)
        throw EntropyFailure("OpenSSL failed with error code: " + std::to_string(ERR_get_error()));

    std::uint64_t bits = 0;
    for (unsigned char byte : buffer)
        bits = (bits << 8) | byte;
    return bits;
}

} // namespace

double sampleUniform() {
    // (k + 0.5) / 2^53 never reaches 0 or 1
    std::uint64_t mantissa = secureBits() >> 11;
    return (static_cast<double>(mantissa) + .5) / 9007199254740992.;
}

double sampleUniform(double low, double high) {
    if (high < low) std::swap(low, high);
    return low + (high - low) * sampleUniform();
}

double sampleLaplace(double mu, double scale) {
    double u = sampleUniform() - .5;
    double sign = u < 0 ? -1. : 1.;
    return mu - scale * sign * std::log(1. - 2. * std::abs(u));
}

Eigen::VectorXd sampleLaplace(Eigen::Index size, double scale) {
    Eigen::VectorXd noise(size);
    for (Eigen::Index i = 0; i < size; ++i)
        noise(i) = sampleLaplace(0., scale);
    return noise;
}

double sampleGaussian(double mu, double sigma) {
    double u1 = sampleUniform();
    double u2 = sampleUniform();
    return mu + sigma * std::sqrt(-2. * std::log(u1)) * std::cos(kTwoPi * u2);
}

// each uniform pair yields two independent normals
Eigen::VectorXd sampleGaussian(Eigen::Index size, double sigma) {
    Eigen::VectorXd noise(size);
    for (Eigen::Index i = 0; i < size; i += 2) {
        double radius = std::sqrt(-2. * std::log(sampleUniform()));
        double angle = kTwoPi * sampleUniform();
        noise(i) = sigma * radius * std::cos(angle);
        if (i + 1 < size) noise(i + 1) = sigma * radius * std::sin(angle);
    }
    return noise;
}

} // namespace private_analytics
