#ifndef PRIVATE_ANALYTICS_TYPES_HPP
#define PRIVATE_ANALYTICS_TYPES_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

namespace private_analytics {

// fixed, reviewed event taxonomy raised by the instrumentation layer
enum class EventType {
    ScreenView,
    AppLifecycle,
    SyncOperation,
    ErrorOccurred,
    ExerciseCompleted,
    SessionDuration,
    AssessmentCompleted,
    CrisisIntervention
};

enum class SensitivityCategory {
    Low, Medium, High
};

boost::optional<EventType> parseEventType(const std::string& tag);
std::string eventTypeTag(EventType type);
SensitivityCategory categoryOf(EventType type);
std::string categoryName(SensitivityCategory category);

typedef boost::variant<double, std::string, bool> FieldValue;
typedef std::map<std::string, FieldValue> FieldMap;

bool isNumeric(const FieldValue& value);

struct ContributorAttributes {
    boost::optional<int> age;
    // ISO 3166 code, optionally with a subdivision ("US-CA")
    boost::optional<std::string> location;
    std::string platform;
    std::string app_version;
    // rotating install token, hashed into the cardinality sketch and never stored
    std::string contributor_token;
};

struct RawEvent {
    std::string event_type;
    FieldMap fields;
    ContributorAttributes contributor;
};

// Generalized categories of one contributor. Fixed at construction.
class QuasiIdentifiers {
    std::string _age_range;
    std::string _region;
    std::string _platform;
    std::string _app_version;
public:
    QuasiIdentifiers() = default;
    explicit QuasiIdentifiers(std::string age_range, std::string region, std::string platform,
                              std::string app_version);

    const std::string& age_range() const { return this->_age_range; }
    const std::string& region() const { return this->_region; }
    const std::string& platform() const { return this->_platform; }
    const std::string& app_version() const { return this->_app_version; }

    bool operator==(const QuasiIdentifiers& other) const;
    bool operator!=(const QuasiIdentifiers& other) const { return !(*this == other); }
};

// an event after generalization, as buffered by the k-anonymity engine
struct GeneralizedEvent {
    EventType type;
    FieldMap fields;
    QuasiIdentifiers quasi_identifiers;
    std::int64_t received_at_seconds = 0;
};

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_TYPES_HPP
