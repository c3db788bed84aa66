#include "analytics.pb.h"

#include "../include/private_analytics/api.hpp"
#include "../include/private_analytics/guarantee.hpp"
#include "../include/private_analytics/phi_detector.hpp"

#include <private_analytics/clock.hpp>
#include <private_analytics/errors.hpp>
#include <private_analytics/logging.hpp>
#include <private_analytics/storage.hpp>

#include <stdexcept>
#include <string>

using namespace private_analytics;

int detect_phi(const char* buffer, size_t length) {
    static const PhiDetector detector;

    // a scan that cannot complete reports the strictest outcome
    try {
        return static_cast<int>(detector.scan(std::string(buffer, length)));
    } catch (const std::exception& error) {
        logMessage(LogLevel::Error, "api", error.what());
        return static_cast<int>(PhiCategory::DirectIdentifier);
    }
}

int validate_anonymized_event(const char* buffer, size_t length, unsigned int k, size_t max_payload_bytes) {
    proto::AnonymizedEvent event;
    if (!event.ParseFromArray(buffer, static_cast<int>(length))) return -1;

    try {
        proto::PipelineConfig proto;
        proto.set_k_threshold(k);
        proto.set_max_payload_bytes(max_payload_bytes);
        Config config(proto);

        PhiDetector detector;
        QuasiIdentifierGeneralizer generalizer(config);
        MemoryAuditStore store;
        SystemClock clock;
        AuditLog audit(store, clock);

        return static_cast<int>(GuaranteeChecker(config, detector, generalizer, audit).check(event).failure);
    } catch (const ConfigurationError& error) {
        logMessage(LogLevel::Warning, "api", error.what());
        return -1;
    } catch (const std::runtime_error& error) {
        logMessage(LogLevel::Error, "api", error.what());
        return static_cast<int>(GuaranteeFailure::PHIDetected);
    }
}
