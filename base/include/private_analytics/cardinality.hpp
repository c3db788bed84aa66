#ifndef PRIVATE_ANALYTICS_CARDINALITY_HPP
#define PRIVATE_ANALYTICS_CARDINALITY_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace private_analytics {

// Salted SHA-256 of a contributor token, truncated to 64 bits. The salt is
// process-local so hashes cannot be joined across devices or restarts.
class ContributorHasher {
    std::string _salt;
public:
    explicit ContributorHasher(std::string salt);
    static ContributorHasher withRandomSalt();

    std::uint64_t hash(const std::string& token) const;
};

// HyperLogLog distinct-count sketch. Only register maxima are kept; contributor
// identities cannot be recovered from it.
class CardinalitySketch {
    unsigned int _precision;
    std::vector<std::uint8_t> _registers;
public:
    static const unsigned int kDefaultPrecision = 12;

    explicit CardinalitySketch(unsigned int precision = kDefaultPrecision);

    void add(std::uint64_t hash);
    double estimate() const;

    // Never above the true distinct count while fewer than exactLimit()
    // registers are occupied; beyond that a rounded-down, three-sigma-low estimate.
    std::uint64_t lower_bound() const;

    // registers holding at least one contributor
    std::uint64_t occupied() const;

    // largest k for which lower_bound() >= k proves k distinct contributors
    static std::uint64_t exactLimit(unsigned int precision = kDefaultPrecision);

    bool empty() const;
    void clear();

    std::size_t register_count() const { return this->_registers.size(); }

    std::string serialize() const;
    static CardinalitySketch deserialize(const std::string& bytes);
};

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_CARDINALITY_HPP
