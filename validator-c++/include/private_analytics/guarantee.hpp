#ifndef PRIVATE_ANALYTICS_GUARANTEE_HPP
#define PRIVATE_ANALYTICS_GUARANTEE_HPP

#include <cstdint>
#include <string>

#include <analytics.pb.h>
#include <private_analytics/audit.hpp>
#include <private_analytics/config.hpp>
#include <private_analytics/generalizer.hpp>

#include "phi_detector.hpp"

namespace private_analytics {

enum class GuaranteeFailure {
    None,
    PHIDetected,
    MissingCardinality,
    InsufficientCardinality,
    MissingEpsilon,
    MissingMechanism,
    UngeneralizedIdentifiers,
    PayloadTooLarge
};

std::string guaranteeFailureName(GuaranteeFailure failure);

struct GuaranteeResult {
    GuaranteeFailure failure = GuaranteeFailure::None;
    PhiCategory phi_category = PhiCategory::None;

    bool passed() const { return this->failure == GuaranteeFailure::None; }
};

// The single gate in front of the transport. Checks run in a fixed order and
// stop at the first failure; there is no way to skip a check.
class GuaranteeChecker {
    const PhiDetector& _phi;
    const QuasiIdentifierGeneralizer& _generalizer;
    AuditLog& _audit;
    std::uint32_t _k;
    std::uint64_t _max_payload_bytes;

    GuaranteeResult evaluate(const proto::AnonymizedEvent& event) const;
public:
    explicit GuaranteeChecker(const Config& config, const PhiDetector& phi,
                              const QuasiIdentifierGeneralizer& generalizer, AuditLog& audit);

    // every failure is audited; PHI blocks record the category, never the content
    GuaranteeResult check(const proto::AnonymizedEvent& event);
};

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_GUARANTEE_HPP
