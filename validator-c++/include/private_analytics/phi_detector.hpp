#ifndef PRIVATE_ANALYTICS_PHI_DETECTOR_HPP
#define PRIVATE_ANALYTICS_PHI_DETECTOR_HPP

#include <regex>
#include <string>
#include <vector>

#include <analytics.pb.h>
#include <private_analytics/types.hpp>

namespace private_analytics {

enum class PhiCategory {
    None,
    DirectIdentifier,
    ClinicalTerminology,
    PersistentIdentifier,
    PreciseCoordinates,
    MillisecondTimestamp
};

std::string phiCategoryName(PhiCategory category);

// Folds full-width forms, dashes and ideographic spaces to ASCII and drops
// invisible format characters, so look-alike or split text cannot slip
// identifiers past the patterns. JSON \uXXXX escapes are decoded first.
std::string normalizeForScan(const std::string& text);

// JSON rendering scanned before release
std::string serializeForScan(const proto::AnonymizedEvent& event);
// field names and values of a buffered event
std::string serializeForScan(const GeneralizedEvent& event);

class PhiDetector {
    struct Pattern {
        PhiCategory category;
        std::regex expression;
    };
    std::vector<Pattern> _patterns;
public:
    // loads the maintained prohibited-pattern set
    explicit PhiDetector();

    void add_pattern(PhiCategory category, const std::string& expression);

    // category of the first matching pattern; None when the text is clean
    PhiCategory scan(const std::string& text) const;

    std::size_t pattern_count() const { return this->_patterns.size(); }
};

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_PHI_DETECTOR_HPP
