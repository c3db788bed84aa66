#include "../include/private_analytics/audit.hpp"
#include "../include/private_analytics/logging.hpp"

namespace private_analytics {

std::string auditCategoryName(proto::AuditCategory category) {
    return proto::AuditCategory_Name(category);
}

AuditLog::AuditLog(AuditStore& store, Clock& clock) : _store(store), _clock(clock) {
    // resume numbering after entries persisted by earlier processes
    for (const auto& entry : this->_store.entries())
        if (entry.sequence() >= this->_sequence) this->_sequence = entry.sequence() + 1;
}

void AuditLog::record(proto::AuditCategory category, const std::string& detail) {
    std::lock_guard<std::mutex> lock(this->_mutex);

    proto::AuditLogEntry entry;
    entry.set_timestamp_millis(toMillis(this->_clock.now()));
    entry.set_category(category);
    entry.set_detail(detail);
    entry.set_sequence(this->_sequence);

    if (!this->_store.append(entry)) {
        logMessage(LogLevel::Error, "audit", "failed to append " + auditCategoryName(category) + " entry");
        ++this->_failures;
        return;
    }
    ++this->_sequence;
}

std::size_t AuditLog::failures() {
    std::lock_guard<std::mutex> lock(this->_mutex);
    return this->_failures;
}

std::vector<proto::AuditLogEntry> AuditLog::entries() {
    std::lock_guard<std::mutex> lock(this->_mutex);
    return this->_store.entries();
}

std::size_t AuditLog::count(proto::AuditCategory category) {
    std::size_t total = 0;
    for (const auto& entry : entries())
        if (entry.category() == category) ++total;
    return total;
}

} // namespace private_analytics
