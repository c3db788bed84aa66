#ifndef PRIVATE_ANALYTICS_PIPELINE_INCIDENT_HPP
#define PRIVATE_ANALYTICS_PIPELINE_INCIDENT_HPP

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <boost/circular_buffer.hpp>

#include <private_analytics/audit.hpp>
#include <private_analytics/budget.hpp>
#include <private_analytics/clock.hpp>
#include <private_analytics/config.hpp>
#include <private_analytics/k_anonymity.hpp>
#include <private_analytics/phi_detector.hpp>

namespace private_analytics {

enum class IncidentSeverity {
    None, Warning, Critical
};

std::string incidentSeverityName(IncidentSeverity severity);

struct IncidentReport {
    IncidentSeverity severity = IncidentSeverity::None;
    std::vector<std::string> findings;
};

// Observes the pipeline off the hot path. A critical finding triggers the
// shutdown handler once; nothing here ever re-enables the pipeline.
class IncidentDetector {
    KAnonymityEngine& _engine;
    PrivacyBudgetManager& _budget;
    const PhiDetector& _phi;
    AuditLog& _audit;
    Clock& _clock;

    std::chrono::seconds _window;
    double _warning_fraction;
    bool _critical_on_exhaustion;

    std::mutex _mutex;
    // the newest threshold + 1 occurrences; the rate is exceeded when all fall inside the window
    boost::circular_buffer<TimePoint> _expirations;
    boost::circular_buffer<TimePoint> _transport_failures;
    std::function<void(const std::string&)> _shutdown;
    bool _triggered = false;

    bool over_rate(const boost::circular_buffer<TimePoint>& events, TimePoint now) const;
public:
    explicit IncidentDetector(const Config& config, KAnonymityEngine& engine, PrivacyBudgetManager& budget,
                              const PhiDetector& phi, AuditLog& audit, Clock& clock);

    void set_shutdown_handler(std::function<void(const std::string&)> handler);

    void record_expirations(std::size_t count);

    // callback for the transport collaborator; not fatal by itself
    void report_transport_failure(const std::string& reason);

    IncidentReport scan();

    bool triggered();
};

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_PIPELINE_INCIDENT_HPP
