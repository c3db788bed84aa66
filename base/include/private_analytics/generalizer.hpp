#ifndef PRIVATE_ANALYTICS_GENERALIZER_HPP
#define PRIVATE_ANALYTICS_GENERALIZER_HPP

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "analytics.pb.h"
#include "config.hpp"
#include "types.hpp"

namespace private_analytics {

extern const char* const kRegionInternational;
extern const char* const kRegionUnknown;

// Maps raw contributor attributes to coarse, low-cardinality categories.
// Pure: the same attributes always give the same quasi-identifiers.
class QuasiIdentifierGeneralizer {
    int _minimum_age;
    std::string _home_country;
    std::vector<std::string> _age_bands;
public:
    explicit QuasiIdentifierGeneralizer(const Config& config);
    explicit QuasiIdentifierGeneralizer(int minimum_age, std::string home_country);

    // throws UngeneralizableInput when an attribute lacks the required precision
    QuasiIdentifiers generalize(const ContributorAttributes& attributes) const;

    std::string generalize_age(int age) const;
    std::string generalize_region(const boost::optional<std::string>& location) const;
    std::string generalize_platform(const std::string& platform) const;
    std::string generalize_app_version(const std::string& version) const;

    // grammar check used to catch generalization bugs before release
    bool is_generalized(const QuasiIdentifiers& identifiers) const;

    const std::vector<std::string>& age_bands() const { return this->_age_bands; }
};

const std::vector<std::string>& platformLabels();

// clinical severity bands; throw UngeneralizableInput outside 0-27 and 0-21
std::string phq9SeverityBucket(int score);
std::string gad7SeverityBucket(int score);

// Replaces the raw total score of an assessment_completed payload ("total_score" or
// "totalScore") with a "severity_bucket" label chosen by "assessment_type" (phq9 or gad7).
// Payloads without a score are returned unchanged.
FieldMap bucketAssessmentScore(const FieldMap& fields);

proto::QuasiIdentifiers toProto(const QuasiIdentifiers& identifiers);
QuasiIdentifiers fromProto(const proto::QuasiIdentifiers& identifiers);

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_GENERALIZER_HPP
