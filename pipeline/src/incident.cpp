#include "../include/private_analytics_pipeline/incident.hpp"

#include <sstream>
#include <stdexcept>

#include <private_analytics/logging.hpp>

namespace private_analytics {

std::string incidentSeverityName(IncidentSeverity severity) {
    switch (severity) {
        case IncidentSeverity::None: return "none";
        case IncidentSeverity::Warning: return "warning";
        case IncidentSeverity::Critical: return "critical";
    }
    throw std::invalid_argument("incident severity is not handled.");
}

IncidentDetector::IncidentDetector(const Config& config, KAnonymityEngine& engine, PrivacyBudgetManager& budget,
                                   const PhiDetector& phi, AuditLog& audit, Clock& clock)
        : _engine(engine), _budget(budget), _phi(phi), _audit(audit), _clock(clock),
          _window(config.incident_window()),
          _warning_fraction(config.budget_warning_fraction()),
          _critical_on_exhaustion(config.disable_pipeline_on_exhaustion()),
          _expirations(config.expiry_rate_threshold() + 1),
          _transport_failures(config.transport_failure_threshold() + 1) {}

void IncidentDetector::set_shutdown_handler(std::function<void(const std::string&)> handler) {
    std::lock_guard<std::mutex> lock(this->_mutex);
    this->_shutdown = std::move(handler);
}

void IncidentDetector::record_expirations(std::size_t count) {
    std::lock_guard<std::mutex> lock(this->_mutex);
    TimePoint now = this->_clock.now();
    for (std::size_t i = 0; i < count; ++i)
        this->_expirations.push_back(now);
}

void IncidentDetector::report_transport_failure(const std::string& reason) {
    logMessage(LogLevel::Warning, "incident", "transport failure reported: " + reason);
    this->_audit.record(proto::INCIDENT, "transport failure");

    std::lock_guard<std::mutex> lock(this->_mutex);
    this->_transport_failures.push_back(this->_clock.now());
}

bool IncidentDetector::over_rate(const boost::circular_buffer<TimePoint>& events, TimePoint now) const {
    return events.full() && now - events.front() <= this->_window;
}

IncidentReport IncidentDetector::scan() {
    IncidentReport report;
    auto raise = [&report](IncidentSeverity severity, const std::string& finding) {
        if (severity > report.severity) report.severity = severity;
        report.findings.push_back(finding);
    };

    PhiCategory residual = PhiCategory::None;
    this->_engine.visit_pending([this, &residual](const GeneralizedEvent& event) {
        if (residual != PhiCategory::None) return;
        residual = this->_phi.scan(serializeForScan(event));
    });
    if (residual != PhiCategory::None)
        raise(IncidentSeverity::Critical, "residual PHI in buffered events category=" + phiCategoryName(residual));

    if (this->_budget.exhausted())
        raise(this->_critical_on_exhaustion ? IncidentSeverity::Critical : IncidentSeverity::Warning,
              "privacy budget exhausted");
    else if (this->_budget.remaining_epsilon() < this->_warning_fraction * this->_budget.ceiling())
        raise(IncidentSeverity::Warning, "privacy budget near exhaustion");

    std::function<void(const std::string&)> shutdown;
    bool trigger = false;
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        TimePoint now = this->_clock.now();
        if (over_rate(this->_expirations, now))
            raise(IncidentSeverity::Critical, "bucket expirations over rate threshold");
        if (over_rate(this->_transport_failures, now))
            raise(IncidentSeverity::Critical, "transport failures over rate threshold");

        if (report.severity == IncidentSeverity::Critical && !this->_triggered) {
            this->_triggered = true;
            trigger = true;
            shutdown = this->_shutdown;
        }
    }

    for (const auto& finding : report.findings)
        logMessage(report.severity == IncidentSeverity::Critical ? LogLevel::Error : LogLevel::Warning,
                   "incident", finding);

    if (trigger) {
        std::ostringstream detail;
        detail << "critical incident:";
        for (const auto& finding : report.findings) detail << " [" << finding << "]";
        this->_audit.record(proto::INCIDENT, detail.str());
        if (shutdown) shutdown(detail.str());
    }
    return report;
}

bool IncidentDetector::triggered() {
    std::lock_guard<std::mutex> lock(this->_mutex);
    return this->_triggered;
}

} // namespace private_analytics
