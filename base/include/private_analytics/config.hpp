#ifndef PRIVATE_ANALYTICS_CONFIG_HPP
#define PRIVATE_ANALYTICS_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "config.pb.h"
#include "types.hpp"

namespace private_analytics {

enum class FieldKind {
    Count, Continuous
};

struct SensitivityBound {
    std::string field;
    FieldKind kind;
    double bound;
};

// reviewed a priori bounds; never derived from observed values
std::vector<SensitivityBound> defaultSensitivityTable();

// Immutable for the life of the process. Validated on construction.
class Config {
    proto::PipelineConfig _proto;
    std::vector<SensitivityBound> _sensitivity;

    void validate() const;
public:
    explicit Config();
    explicit Config(const proto::PipelineConfig& proto);

    static Config fromText(const std::string& text);
    static Config fromFile(const std::string& path);

    const proto::PipelineConfig& get_proto() const { return this->_proto; }

    std::uint32_t k_threshold() const;
    double epsilon_ceiling() const;
    double min_query_epsilon() const;
    double category_epsilon(SensitivityCategory category) const;

    std::chrono::seconds bucket_timeout() const;
    std::uint64_t max_payload_bytes() const;
    int minimum_age() const;
    std::string home_country() const;

    std::chrono::milliseconds latency_ceiling() const;
    std::chrono::seconds sweep_interval() const;
    std::chrono::seconds incident_scan_interval() const;

    std::uint32_t expiry_rate_threshold() const;
    std::uint32_t transport_failure_threshold() const;
    std::chrono::seconds incident_window() const;
    double budget_warning_fraction() const;
    bool disable_pipeline_on_exhaustion() const;
    std::size_t queue_capacity() const;

    const std::vector<SensitivityBound>& sensitivity_table() const { return this->_sensitivity; }
};

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_CONFIG_HPP
