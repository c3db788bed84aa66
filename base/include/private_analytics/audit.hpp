#ifndef PRIVATE_ANALYTICS_AUDIT_HPP
#define PRIVATE_ANALYTICS_AUDIT_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "audit.pb.h"
#include "clock.hpp"
#include "storage.hpp"

namespace private_analytics {

std::string auditCategoryName(proto::AuditCategory category);

// Append-only, retained locally, never transmitted verbatim. Appends are serialized.
class AuditLog {
    AuditStore& _store;
    Clock& _clock;
    std::mutex _mutex;
    std::uint64_t _sequence = 0;
    std::size_t _failures = 0;
public:
    explicit AuditLog(AuditStore& store, Clock& clock);

    // a rejected append is logged and counted, never thrown to the event path
    void record(proto::AuditCategory category, const std::string& detail);
    std::size_t failures();

    std::vector<proto::AuditLogEntry> entries();
    std::size_t count(proto::AuditCategory category);
};

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_AUDIT_HPP
