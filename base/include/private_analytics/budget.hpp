#ifndef PRIVATE_ANALYTICS_BUDGET_HPP
#define PRIVATE_ANALYTICS_BUDGET_HPP

#include <cstdint>
#include <mutex>
#include <set>
#include <string>

#include <boost/optional.hpp>

#include "audit.hpp"
#include "budget.pb.h"
#include "clock.hpp"
#include "config.hpp"
#include "storage.hpp"
#include "types.hpp"

namespace private_analytics {

std::int64_t toNanoEpsilon(double epsilon);
double fromNanoEpsilon(std::int64_t units);

// Lifetime differential-privacy budget. Allocations are serialized by one lock
// and debited durably before they are returned.
class PrivacyBudgetManager {
    std::int64_t _ceiling;
    std::int64_t _floor;
    double _category_epsilon[3];

    BudgetStore& _store;
    AuditLog& _audit;
    Clock& _clock;

    std::mutex _mutex;
    proto::PrivacyBudgetState _state;
    std::set<SensitivityCategory> _exhausted_categories;
    bool _halted = false;

    enum class Failure {
        None, BelowFloor, Insufficient, Halted, CommitFailed
    };
    Failure allocate_locked(std::int64_t units);
public:
    explicit PrivacyBudgetManager(const Config& config, BudgetStore& store, AuditLog& audit, Clock& clock);

    // all or nothing; none means the caller must drop the event
    boost::optional<double> allocate(double epsilon);

    // allocates the recommended slice; a category that could not be served stays
    // exhausted until reset
    boost::optional<double> allocate(SensitivityCategory category);

    double recommended_epsilon(SensitivityCategory category) const;
    double recommended_epsilon(EventType type) const;

    double remaining_epsilon();
    double ceiling() const { return fromNanoEpsilon(this->_ceiling); }
    double query_floor() const { return fromNanoEpsilon(this->_floor); }
    std::uint64_t allocation_count();

    // remaining budget below the query floor; terminal until reset
    bool exhausted();
    bool category_exhausted(SensitivityCategory category);

    // administrative action: restores the ceiling, audited
    bool reset(const std::string& reason);

    // emergency shutdown: no further allocation in this process
    void halt();
    bool halted();
};

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_BUDGET_HPP
