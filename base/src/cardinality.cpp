#include "../include/private_analytics/cardinality.hpp"
#include "../include/private_analytics/errors.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace private_analytics {

namespace {

const std::size_t kSaltBytes = 32;

unsigned int countLeadingZeros(std::uint64_t value, unsigned int width) {
    unsigned int zeros = 0;
    for (int bit = static_cast<int>(width) - 1; bit >= 0; --bit) {
        if (value & (std::uint64_t(1) << bit)) break;
        ++zeros;
    }
    return zeros;
}

} // namespace

ContributorHasher::ContributorHasher(std::string salt) : _salt{std::move(salt)} {}

ContributorHasher ContributorHasher::withRandomSalt() {
    unsigned char buffer[kSaltBytes];
    if (RAND_bytes(buffer, sizeof(buffer)) != 1)
        throw EntropyFailure("OpenSSL failed with error code: " + std::to_string(ERR_get_error()));
    return ContributorHasher(std::string(reinterpret_cast<const char*>(buffer), sizeof(buffer)));
}

std::uint64_t ContributorHasher::hash(const std::string& token) const {
    std::string salted = this->_salt + token;
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(salted.data()), salted.size(), digest);

    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i)
        value = (value << 8) | digest[i];
    return value;
}

CardinalitySketch::CardinalitySketch(unsigned int precision) : _precision(precision) {
    if (precision < 4 || precision > 16)
        throw std::invalid_argument("sketch precision must lie in [4, 16]");
    this->_registers.assign(std::size_t(1) << precision, 0);
}

void CardinalitySketch::add(std::uint64_t hash) {
    unsigned int remainingBits = 64 - this->_precision;
    std::size_t index = static_cast<std::size_t>(hash >> remainingBits);
    std::uint64_t remainder = hash & ((std::uint64_t(1) << remainingBits) - 1);

    auto rank = static_cast<std::uint8_t>(countLeadingZeros(remainder, remainingBits) + 1);
    this->_registers[index] = std::max(this->_registers[index], rank);
}

double CardinalitySketch::estimate() const {
    const double m = static_cast<double>(this->_registers.size());
    const double alpha = 0.7213 / (1. + 1.079 / m);

    double harmonic = 0.;
    std::size_t zeroRegisters = 0;
    for (std::uint8_t value : this->_registers) {
        harmonic += std::ldexp(1., -static_cast<int>(value));
        if (value == 0) ++zeroRegisters;
    }

    double raw = alpha * m * m / harmonic;
    // linear counting in the small range
    if (raw <= 2.5 * m && zeroRegisters > 0)
        return m * std::log(m / static_cast<double>(zeroRegisters));
    return raw;
}

std::uint64_t CardinalitySketch::occupied() const {
    return static_cast<std::uint64_t>(std::count_if(this->_registers.begin(), this->_registers.end(),
                                                    [](std::uint8_t value) { return value != 0; }));
}

std::uint64_t CardinalitySketch::exactLimit(unsigned int precision) {
    return (std::uint64_t(1) << precision) / 4;
}

std::uint64_t CardinalitySketch::lower_bound() const {
    // every occupied register holds at least one distinct contributor
    std::uint64_t floorCount = occupied();
    if (floorCount < exactLimit(this->_precision)) return floorCount;

    // three standard errors below the estimate, never below the occupied count
    const double m = static_cast<double>(this->_registers.size());
    double value = std::floor(estimate() * (1. - 3. * 1.04 / std::sqrt(m)));
    if (value <= static_cast<double>(floorCount)) return floorCount;
    return static_cast<std::uint64_t>(value);
}

bool CardinalitySketch::empty() const {
    return std::all_of(this->_registers.begin(), this->_registers.end(),
                       [](std::uint8_t value) { return value == 0; });
}

void CardinalitySketch::clear() {
    std::fill(this->_registers.begin(), this->_registers.end(), 0);
}

std::string CardinalitySketch::serialize() const {
    std::string bytes(1, static_cast<char>(this->_precision));
    bytes.append(this->_registers.begin(), this->_registers.end());
    return bytes;
}

CardinalitySketch CardinalitySketch::deserialize(const std::string& bytes) {
    if (bytes.empty())
        throw std::invalid_argument("empty sketch encoding");
    CardinalitySketch sketch(static_cast<unsigned char>(bytes[0]));
    if (bytes.size() != sketch._registers.size() + 1)
        throw std::invalid_argument("sketch encoding has the wrong register count");
    std::copy(bytes.begin() + 1, bytes.end(), sketch._registers.begin());
    return sketch;
}

} // namespace private_analytics
