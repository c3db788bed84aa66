#include "../include/private_analytics/guarantee.hpp"

#include <private_analytics/logging.hpp>

#include <cmath>

namespace private_analytics {

namespace {

// only reviewed tags reach the audit log
std::string auditedEventType(const proto::AnonymizedEvent& event) {
    return parseEventType(event.event_type()) ? event.event_type() : "unrecognized";
}

} // namespace

std::string guaranteeFailureName(GuaranteeFailure failure) {
    switch (failure) {
        case GuaranteeFailure::None: return "none";
        case GuaranteeFailure::PHIDetected: return "phi_detected";
        case GuaranteeFailure::MissingCardinality: return "missing_cardinality";
        case GuaranteeFailure::InsufficientCardinality: return "insufficient_cardinality";
        case GuaranteeFailure::MissingEpsilon: return "missing_epsilon";
        case GuaranteeFailure::MissingMechanism: return "missing_mechanism";
        case GuaranteeFailure::UngeneralizedIdentifiers: return "ungeneralized_identifiers";
        case GuaranteeFailure::PayloadTooLarge: return "payload_too_large";
    }
    return "unknown";
}

GuaranteeChecker::GuaranteeChecker(const Config& config, const PhiDetector& phi,
                                   const QuasiIdentifierGeneralizer& generalizer, AuditLog& audit)
        : _phi(phi), _generalizer(generalizer), _audit(audit),
          _k(config.k_threshold()), _max_payload_bytes(config.max_payload_bytes()) {}

GuaranteeResult GuaranteeChecker::evaluate(const proto::AnonymizedEvent& event) const {
    GuaranteeResult result;

    // 1. prohibited content
    result.phi_category = this->_phi.scan(serializeForScan(event));
    if (result.phi_category != PhiCategory::None) {
        result.failure = GuaranteeFailure::PHIDetected;
        return result;
    }

    // 2. k-anonymity
    if (event.bucket_cardinality() == 0) {
        result.failure = GuaranteeFailure::MissingCardinality;
        return result;
    }
    if (event.bucket_cardinality() < this->_k) {
        result.failure = GuaranteeFailure::InsufficientCardinality;
        return result;
    }

    // 3. differential privacy
    if (!(event.epsilon() > 0.) || !std::isfinite(event.epsilon())) {
        result.failure = GuaranteeFailure::MissingEpsilon;
        return result;
    }
    if (event.noised_fields().empty()) {
        result.failure = GuaranteeFailure::MissingMechanism;
        return result;
    }
    for (const auto& field : event.noised_fields()) {
        if (field.second.mechanism() == proto::MECHANISM_UNSPECIFIED) {
            result.failure = GuaranteeFailure::MissingMechanism;
            return result;
        }
    }

    // 4. generalization grammar
    if (!event.has_quasi_identifiers()
        || !this->_generalizer.is_generalized(fromProto(event.quasi_identifiers()))) {
        result.failure = GuaranteeFailure::UngeneralizedIdentifiers;
        return result;
    }

    // 5. payload size
    if (event.ByteSizeLong() >= this->_max_payload_bytes) {
        result.failure = GuaranteeFailure::PayloadTooLarge;
        return result;
    }
    return result;
}

GuaranteeResult GuaranteeChecker::check(const proto::AnonymizedEvent& event) {
    GuaranteeResult result = evaluate(event);
    if (result.failure == GuaranteeFailure::PHIDetected) {
        this->_audit.record(proto::BLOCK, "PHIDetected category=" + phiCategoryName(result.phi_category)
                                          + " event_type=" + auditedEventType(event));
        logMessage(LogLevel::Warning, "guarantee", "blocked event: " + phiCategoryName(result.phi_category));
    } else if (!result.passed()) {
        this->_audit.record(proto::VIOLATION, "GuaranteeViolation reason=" + guaranteeFailureName(result.failure)
                                              + " event_type=" + auditedEventType(event));
        logMessage(LogLevel::Warning, "guarantee", "blocked event: " + guaranteeFailureName(result.failure));
    }
    return result;
}

} // namespace private_analytics
