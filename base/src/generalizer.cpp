#include "../include/private_analytics/generalizer.hpp"
#include "../include/private_analytics/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <utility>

namespace private_analytics {

const char* const kRegionInternational = "INTL";
const char* const kRegionUnknown = "UNKNOWN";

namespace {

// five ten-year bands above the minimum age, then a top-coded band
const int kAgeBandWidth = 10;
const int kAgeBandCount = 5;

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

bool isAlphaCode(const std::string& value) {
    return value.size() == 2
           && std::isupper(static_cast<unsigned char>(value[0]))
           && std::isupper(static_cast<unsigned char>(value[1]));
}

const char* const kAssessmentTypeField = "assessment_type";
const char* const kSeverityBucketField = "severity_bucket";
const char* const kScoreFields[] = {"total_score", "totalScore"};

} // namespace

QuasiIdentifierGeneralizer::QuasiIdentifierGeneralizer(const Config& config)
        : QuasiIdentifierGeneralizer(config.minimum_age(), config.home_country()) {}

QuasiIdentifierGeneralizer::QuasiIdentifierGeneralizer(int minimum_age, std::string home_country)
        : _minimum_age(minimum_age), _home_country(toUpper(std::move(home_country))) {
    for (int band = 0; band < kAgeBandCount; ++band) {
        int low = this->_minimum_age + band * kAgeBandWidth;
        this->_age_bands.push_back(std::to_string(low) + "-" + std::to_string(low + kAgeBandWidth - 1));
    }
    this->_age_bands.push_back(std::to_string(this->_minimum_age + kAgeBandCount * kAgeBandWidth) + "+");
}

QuasiIdentifiers QuasiIdentifierGeneralizer::generalize(const ContributorAttributes& attributes) const {
    if (!attributes.age)
        throw UngeneralizableInput("age is missing");

    return QuasiIdentifiers(generalize_age(*attributes.age), generalize_region(attributes.location),
                            generalize_platform(attributes.platform),
                            generalize_app_version(attributes.app_version));
}

std::string QuasiIdentifierGeneralizer::generalize_age(int age) const {
    if (age < 0)
        throw UngeneralizableInput("age is negative");

    // the lowest band absorbs every age below the minimum
    int band = age < this->_minimum_age ? 0 : (age - this->_minimum_age) / kAgeBandWidth;
    return this->_age_bands[std::min(band, kAgeBandCount)];
}

std::string QuasiIdentifierGeneralizer::generalize_region(const boost::optional<std::string>& location) const {
    if (!location) return kRegionUnknown;

    std::string code = toUpper(trim(*location));
    std::replace(code.begin(), code.end(), '_', '-');

    std::string country = code.substr(0, code.find('-'));
    std::string subdivision = code.find('-') == std::string::npos ? "" : code.substr(code.find('-') + 1);

    if (!isAlphaCode(country)) return kRegionUnknown;
    if (country != this->_home_country) return kRegionInternational;
    if (!isAlphaCode(subdivision)) return kRegionUnknown;
    return subdivision;
}

std::string QuasiIdentifierGeneralizer::generalize_platform(const std::string& platform) const {
    std::string normalized = toLower(trim(platform));
    if (normalized.empty())
        throw UngeneralizableInput("platform is missing");

    if (normalized == "ios" || normalized == "ipados") return "iOS";
    if (normalized == "android") return "Android";
    if (normalized == "web") return "Web";
    return "Other";
}

std::string QuasiIdentifierGeneralizer::generalize_app_version(const std::string& version) const {
    // major.minor kept; patch, pre-release and build metadata dropped
    static const std::regex versionPattern(R"(^[vV]?(\d{1,4})\.(\d{1,4})(?:[.\-+].*)?$)");

    std::smatch match;
    std::string trimmed = trim(version);
    if (!std::regex_match(trimmed, match, versionPattern))
        throw UngeneralizableInput("app version lacks a numeric major.minor");

    return std::to_string(std::stoi(match[1].str())) + "." + std::to_string(std::stoi(match[2].str()));
}

bool QuasiIdentifierGeneralizer::is_generalized(const QuasiIdentifiers& identifiers) const {
    static const std::regex versionGrammar(R"(^(0|[1-9]\d{0,3})\.(0|[1-9]\d{0,3})$)");

    if (std::find(this->_age_bands.begin(), this->_age_bands.end(), identifiers.age_range()) == this->_age_bands.end())
        return false;

    bool regionValid = isAlphaCode(identifiers.region())
                       || identifiers.region() == kRegionInternational
                       || identifiers.region() == kRegionUnknown;
    if (!regionValid) return false;

    const auto& platforms = platformLabels();
    if (std::find(platforms.begin(), platforms.end(), identifiers.platform()) == platforms.end())
        return false;

    return std::regex_match(identifiers.app_version(), versionGrammar);
}

const std::vector<std::string>& platformLabels() {
    static const std::vector<std::string> labels = {"iOS", "Android", "Web", "Other"};
    return labels;
}

std::string phq9SeverityBucket(int score) {
    if (score < 0 || score > 27)
        throw UngeneralizableInput("PHQ-9 score is out of range");

    if (score <= 4) return "minimal";
    if (score <= 9) return "mild";
    if (score <= 14) return "moderate";
    if (score <= 19) return "moderate_severe";
    return "severe";
}

std::string gad7SeverityBucket(int score) {
    if (score < 0 || score > 21)
        throw UngeneralizableInput("GAD-7 score is out of range");

    if (score <= 4) return "minimal";
    if (score <= 9) return "mild";
    if (score <= 14) return "moderate";
    return "severe";
}

FieldMap bucketAssessmentScore(const FieldMap& fields) {
    FieldMap bucketed = fields;

    boost::optional<FieldValue> score;
    for (const char* name : kScoreFields) {
        auto found = bucketed.find(name);
        if (found == bucketed.end()) continue;
        if (!score) score = found->second;
        bucketed.erase(found);
    }
    if (!score) return bucketed;

    const double* value = boost::get<double>(&*score);
    if (!value || std::floor(*value) != *value)
        throw UngeneralizableInput("assessment score is not a whole number");

    auto type = bucketed.find(kAssessmentTypeField);
    const std::string* label = type == bucketed.end() ? nullptr : boost::get<std::string>(&type->second);
    std::string assessment = label ? toLower(trim(*label)) : "";

    // range checks happen before the cast
    if (*value < 0. || *value > 27.)
        throw UngeneralizableInput("assessment score is out of range");

    if (assessment == "phq9")
        bucketed[kSeverityBucketField] = phq9SeverityBucket(static_cast<int>(*value));
    else if (assessment == "gad7")
        bucketed[kSeverityBucketField] = gad7SeverityBucket(static_cast<int>(*value));
    else
        throw UngeneralizableInput("assessment score without a known assessment type");
    return bucketed;
}

proto::QuasiIdentifiers toProto(const QuasiIdentifiers& identifiers) {
    proto::QuasiIdentifiers message;
    message.set_age_range(identifiers.age_range());
    message.set_region(identifiers.region());
    message.set_platform(identifiers.platform());
    message.set_app_version(identifiers.app_version());
    return message;
}

QuasiIdentifiers fromProto(const proto::QuasiIdentifiers& identifiers) {
    return QuasiIdentifiers(identifiers.age_range(), identifiers.region(), identifiers.platform(),
                            identifiers.app_version());
}

} // namespace private_analytics
