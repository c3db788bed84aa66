#include "../include/private_analytics/types.hpp"

#include <stdexcept>
#include <utility>

namespace private_analytics {

namespace {

struct EventTypeEntry {
    EventType type;
    const char* tag;
    SensitivityCategory category;
};

const EventTypeEntry kEventTypes[] = {
        {EventType::ScreenView, "screen_view", SensitivityCategory::Low},
        {EventType::AppLifecycle, "app_lifecycle_event", SensitivityCategory::Low},
        {EventType::ErrorOccurred, "error_occurred", SensitivityCategory::Low},
        {EventType::SyncOperation, "sync_operation_performed", SensitivityCategory::Medium},
        {EventType::ExerciseCompleted, "therapeutic_exercise_completed", SensitivityCategory::Medium},
        {EventType::SessionDuration, "session_duration", SensitivityCategory::Medium},
        {EventType::AssessmentCompleted, "assessment_completed", SensitivityCategory::High},
        {EventType::CrisisIntervention, "crisis_intervention_triggered", SensitivityCategory::High},
};

const EventTypeEntry& entryFor(EventType type) {
    for (const auto& entry : kEventTypes)
        if (entry.type == type) return entry;
    throw std::invalid_argument("EventType is not handled.");
}

struct IsNumericVisitor : public boost::static_visitor<bool> {
    bool operator()(double) const { return true; }
    bool operator()(const std::string&) const { return false; }
    bool operator()(bool) const { return false; }
};

} // namespace

boost::optional<EventType> parseEventType(const std::string& tag) {
    for (const auto& entry : kEventTypes)
        if (tag == entry.tag) return entry.type;
    return boost::none;
}

std::string eventTypeTag(EventType type) {
    return entryFor(type).tag;
}

SensitivityCategory categoryOf(EventType type) {
    return entryFor(type).category;
}

std::string categoryName(SensitivityCategory category) {
    switch (category) {
        case SensitivityCategory::Low: return "low";
        case SensitivityCategory::Medium: return "medium";
        case SensitivityCategory::High: return "high";
    }
    return "unknown";
}

bool isNumeric(const FieldValue& value) {
    return boost::apply_visitor(IsNumericVisitor(), value);
}

QuasiIdentifiers::QuasiIdentifiers(std::string age_range, std::string region, std::string platform,
                                   std::string app_version)
        : _age_range(std::move(age_range)), _region(std::move(region)),
          _platform(std::move(platform)), _app_version(std::move(app_version)) {}

bool QuasiIdentifiers::operator==(const QuasiIdentifiers& other) const {
    return this->_age_range == other._age_range && this->_region == other._region
           && this->_platform == other._platform && this->_app_version == other._app_version;
}

} // namespace private_analytics
