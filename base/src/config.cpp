#include "../include/private_analytics/config.hpp"
#include "../include/private_analytics/cardinality.hpp"
#include "../include/private_analytics/errors.hpp"

#include <google/protobuf/text_format.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace private_analytics {

std::vector<SensitivityBound> defaultSensitivityTable() {
    return {
            // counts are bounded by the most one contributor can report per event
            {"interaction_count", FieldKind::Count, 50.},
            {"screen_view_count", FieldKind::Count, 20.},
            {"sync_attempt_count", FieldKind::Count, 10.},
            {"error_count", FieldKind::Count, 10.},
            // maximum plausible session is four hours
            {"session_duration_seconds", FieldKind::Continuous, 14400.},
            {"exercise_duration_seconds", FieldKind::Continuous, 3600.},
            {"sync_duration_seconds", FieldKind::Continuous, 600.},
            {"assessment_duration_seconds", FieldKind::Continuous, 1800.},
    };
}

Config::Config() : Config(proto::PipelineConfig()) {}

Config::Config(const proto::PipelineConfig& proto) : _proto(proto) {
    if (this->_proto.sensitivity_size() == 0) {
        this->_sensitivity = defaultSensitivityTable();
    } else {
        for (const auto& entry : this->_proto.sensitivity()) {
            FieldKind kind = entry.kind() == proto::SensitivityEntry::COUNT
                             ? FieldKind::Count : FieldKind::Continuous;
            this->_sensitivity.push_back({entry.field(), kind, entry.bound()});
        }
    }
    validate();
}

Config Config::fromText(const std::string& text) {
    proto::PipelineConfig proto;
    if (!google::protobuf::TextFormat::ParseFromString(text, &proto))
        throw ConfigurationError("pipeline configuration is not valid text format");
    return Config(proto);
}

Config Config::fromFile(const std::string& path) {
    std::ifstream input(path);
    if (!input)
        throw ConfigurationError("cannot open pipeline configuration " + path);
    std::stringstream buffer;
    buffer << input.rdbuf();
    return fromText(buffer.str());
}

void Config::validate() const {
    const auto& p = this->_proto;
    if (p.k_threshold() < 2)
        throw ConfigurationError("k_threshold must be at least 2");
    if (p.k_threshold() > CardinalitySketch::exactLimit())
        throw ConfigurationError("k_threshold must not exceed " + std::to_string(CardinalitySketch::exactLimit()));
    if (!(p.epsilon_ceiling() > 0.))
        throw ConfigurationError("epsilon_ceiling must be positive");
    if (!(p.min_query_epsilon() > 0.) || p.min_query_epsilon() > p.epsilon_ceiling())
        throw ConfigurationError("min_query_epsilon must be positive and within the ceiling");

    for (double epsilon : {p.low_sensitivity_epsilon(), p.medium_sensitivity_epsilon(), p.high_sensitivity_epsilon()}) {
        if (epsilon < p.min_query_epsilon() || epsilon > p.epsilon_ceiling())
            throw ConfigurationError("category epsilon must lie between the query floor and the ceiling");
    }

    if (p.bucket_timeout_seconds() <= 0 || p.sweep_interval_seconds() <= 0
        || p.incident_scan_interval_seconds() <= 0 || p.incident_window_seconds() <= 0)
        throw ConfigurationError("timeouts and intervals must be positive");
    if (p.latency_ceiling_ms() <= 0)
        throw ConfigurationError("latency_ceiling_ms must be positive");
    if (p.max_payload_bytes() == 0)
        throw ConfigurationError("max_payload_bytes must be positive");
    if (p.minimum_age() < 0)
        throw ConfigurationError("minimum_age must not be negative");
    if (p.home_country().size() != 2)
        throw ConfigurationError("home_country must be an ISO 3166 alpha-2 code");
    if (p.budget_warning_fraction() < 0. || p.budget_warning_fraction() >= 1.)
        throw ConfigurationError("budget_warning_fraction must lie in [0, 1)");
    if (p.queue_capacity() == 0)
        throw ConfigurationError("queue_capacity must be positive");

    for (const auto& bound : this->_sensitivity) {
        if (bound.field.empty() || !(bound.bound > 0.))
            throw ConfigurationError("sensitivity entries need a field name and a positive bound");
    }
}

std::uint32_t Config::k_threshold() const { return this->_proto.k_threshold(); }
double Config::epsilon_ceiling() const { return this->_proto.epsilon_ceiling(); }
double Config::min_query_epsilon() const { return this->_proto.min_query_epsilon(); }

double Config::category_epsilon(SensitivityCategory category) const {
    switch (category) {
        case SensitivityCategory::Low: return this->_proto.low_sensitivity_epsilon();
        case SensitivityCategory::Medium: return this->_proto.medium_sensitivity_epsilon();
        case SensitivityCategory::High: return this->_proto.high_sensitivity_epsilon();
    }
    throw std::invalid_argument("SensitivityCategory is not handled.");
}

std::chrono::seconds Config::bucket_timeout() const {
    return std::chrono::seconds(this->_proto.bucket_timeout_seconds());
}
std::uint64_t Config::max_payload_bytes() const { return this->_proto.max_payload_bytes(); }
int Config::minimum_age() const { return this->_proto.minimum_age(); }
std::string Config::home_country() const { return this->_proto.home_country(); }

std::chrono::milliseconds Config::latency_ceiling() const {
    return std::chrono::milliseconds(this->_proto.latency_ceiling_ms());
}
std::chrono::seconds Config::sweep_interval() const {
    return std::chrono::seconds(this->_proto.sweep_interval_seconds());
}
std::chrono::seconds Config::incident_scan_interval() const {
    return std::chrono::seconds(this->_proto.incident_scan_interval_seconds());
}

std::uint32_t Config::expiry_rate_threshold() const { return this->_proto.expiry_rate_threshold(); }
std::uint32_t Config::transport_failure_threshold() const { return this->_proto.transport_failure_threshold(); }
std::chrono::seconds Config::incident_window() const {
    return std::chrono::seconds(this->_proto.incident_window_seconds());
}
double Config::budget_warning_fraction() const { return this->_proto.budget_warning_fraction(); }
bool Config::disable_pipeline_on_exhaustion() const { return this->_proto.disable_pipeline_on_exhaustion(); }
std::size_t Config::queue_capacity() const { return this->_proto.queue_capacity(); }

} // namespace private_analytics
