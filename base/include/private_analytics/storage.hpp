#ifndef PRIVATE_ANALYTICS_STORAGE_HPP
#define PRIVATE_ANALYTICS_STORAGE_HPP

#include <mutex>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "audit.pb.h"
#include "budget.pb.h"

namespace private_analytics {

// Encrypted-at-rest storage is provided by the host; these interfaces only
// require durable writes and available reads. State never leaves the device.
class BudgetStore {
public:
    virtual ~BudgetStore() = default;
    // none when no state was ever committed; throws StorageFailure when it is unreadable
    virtual boost::optional<proto::PrivacyBudgetState> load() = 0;
    // returns only once the state is durably committed
    virtual bool commit(const proto::PrivacyBudgetState& state) = 0;
};

class AuditStore {
public:
    virtual ~AuditStore() = default;
    virtual bool append(const proto::AuditLogEntry& entry) = 0;
    virtual std::vector<proto::AuditLogEntry> entries() = 0;
};

class FileBudgetStore : public BudgetStore {
    std::string _path;
public:
    explicit FileBudgetStore(std::string path);
    boost::optional<proto::PrivacyBudgetState> load() override;
    bool commit(const proto::PrivacyBudgetState& state) override;
};

class FileAuditStore : public AuditStore {
    std::string _path;
    std::mutex _mutex;
public:
    explicit FileAuditStore(std::string path);
    bool append(const proto::AuditLogEntry& entry) override;
    std::vector<proto::AuditLogEntry> entries() override;
};

class MemoryBudgetStore : public BudgetStore {
    std::mutex _mutex;
    boost::optional<proto::PrivacyBudgetState> _state;
    bool _fail_commits = false;
    std::size_t _commit_count = 0;
public:
    boost::optional<proto::PrivacyBudgetState> load() override;
    bool commit(const proto::PrivacyBudgetState& state) override;

    void set_fail_commits(bool state);
    std::size_t get_commit_count();
};

class MemoryAuditStore : public AuditStore {
    std::mutex _mutex;
    std::vector<proto::AuditLogEntry> _entries;
public:
    bool append(const proto::AuditLogEntry& entry) override;
    std::vector<proto::AuditLogEntry> entries() override;
};

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_STORAGE_HPP
