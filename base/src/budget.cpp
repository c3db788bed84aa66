#include "../include/private_analytics/budget.hpp"
#include "../include/private_analytics/errors.hpp"
#include "../include/private_analytics/logging.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace private_analytics {

namespace {

const double kNanoPerEpsilon = 1e9;

std::size_t categoryIndex(SensitivityCategory category) {
    return static_cast<std::size_t>(category);
}

std::string formatEpsilon(std::int64_t units) {
    std::ostringstream stream;
    stream << fromNanoEpsilon(units);
    return stream.str();
}

} // namespace

std::int64_t toNanoEpsilon(double epsilon) {
    return std::llround(epsilon * kNanoPerEpsilon);
}

double fromNanoEpsilon(std::int64_t units) {
    return static_cast<double>(units) / kNanoPerEpsilon;
}

PrivacyBudgetManager::PrivacyBudgetManager(const Config& config, BudgetStore& store, AuditLog& audit, Clock& clock)
        : _ceiling(toNanoEpsilon(config.epsilon_ceiling())), _floor(toNanoEpsilon(config.min_query_epsilon())),
          _category_epsilon{config.category_epsilon(SensitivityCategory::Low),
                            config.category_epsilon(SensitivityCategory::Medium),
                            config.category_epsilon(SensitivityCategory::High)},
          _store(store), _audit(audit), _clock(clock) {

    boost::optional<proto::PrivacyBudgetState> stored = this->_store.load();
    if (stored) {
        this->_state = *stored;
        // a lowered ceiling caps what remains; a raised one never refunds spent budget
        if (this->_state.ceiling_nano_epsilon() != this->_ceiling) {
            logMessage(LogLevel::Warning, "budget", "configured ceiling differs from the persisted ceiling");
            this->_state.set_ceiling_nano_epsilon(this->_ceiling);
            this->_state.set_remaining_nano_epsilon(std::min(this->_state.remaining_nano_epsilon(), this->_ceiling));
            if (!this->_store.commit(this->_state))
                throw StorageFailure("cannot commit the adjusted privacy budget");
        }
        return;
    }

    this->_state.set_ceiling_nano_epsilon(this->_ceiling);
    this->_state.set_remaining_nano_epsilon(this->_ceiling);
    this->_state.set_updated_at_seconds(toSeconds(this->_clock.now()));
    if (!this->_store.commit(this->_state))
        throw StorageFailure("cannot commit the initial privacy budget");
}

PrivacyBudgetManager::Failure PrivacyBudgetManager::allocate_locked(std::int64_t units) {
    if (this->_halted) return Failure::Halted;
    if (units < this->_floor) return Failure::BelowFloor;
    if (units > this->_state.remaining_nano_epsilon()) return Failure::Insufficient;

    proto::PrivacyBudgetState next = this->_state;
    next.set_remaining_nano_epsilon(this->_state.remaining_nano_epsilon() - units);
    next.set_allocation_count(this->_state.allocation_count() + 1);
    next.set_updated_at_seconds(toSeconds(this->_clock.now()));

    // the debit only exists once it is durable
    if (!this->_store.commit(next)) {
        logMessage(LogLevel::Error, "budget", "allocation dropped: budget commit failed");
        return Failure::CommitFailed;
    }
    this->_state = next;

    this->_audit.record(proto::ALLOCATION, "epsilon=" + formatEpsilon(units)
                                           + " remaining=" + formatEpsilon(next.remaining_nano_epsilon()));
    if (next.remaining_nano_epsilon() < this->_floor) {
        logMessage(LogLevel::Warning, "budget", "privacy budget exhausted");
        this->_audit.record(proto::ALLOCATION, "budget exhausted");
    }
    return Failure::None;
}

boost::optional<double> PrivacyBudgetManager::allocate(double epsilon) {
    if (!(epsilon > 0.) || !std::isfinite(epsilon)) return boost::none;

    std::lock_guard<std::mutex> lock(this->_mutex);
    std::int64_t units = toNanoEpsilon(epsilon);
    if (allocate_locked(units) != Failure::None) return boost::none;
    return fromNanoEpsilon(units);
}

boost::optional<double> PrivacyBudgetManager::allocate(SensitivityCategory category) {
    std::lock_guard<std::mutex> lock(this->_mutex);
    if (this->_exhausted_categories.count(category)) return boost::none;

    std::int64_t units = toNanoEpsilon(recommended_epsilon(category));
    Failure failure = allocate_locked(units);
    if (failure == Failure::Insufficient) {
        this->_exhausted_categories.insert(category);
        this->_audit.record(proto::ALLOCATION, "category " + categoryName(category) + " exhausted");
    }
    if (failure != Failure::None) return boost::none;
    return fromNanoEpsilon(units);
}

double PrivacyBudgetManager::recommended_epsilon(SensitivityCategory category) const {
    return this->_category_epsilon[categoryIndex(category)];
}

double PrivacyBudgetManager::recommended_epsilon(EventType type) const {
    return recommended_epsilon(categoryOf(type));
}

double PrivacyBudgetManager::remaining_epsilon() {
    std::lock_guard<std::mutex> lock(this->_mutex);
    return fromNanoEpsilon(this->_state.remaining_nano_epsilon());
}

std::uint64_t PrivacyBudgetManager::allocation_count() {
    std::lock_guard<std::mutex> lock(this->_mutex);
    return this->_state.allocation_count();
}

bool PrivacyBudgetManager::exhausted() {
    std::lock_guard<std::mutex> lock(this->_mutex);
    return this->_state.remaining_nano_epsilon() < this->_floor;
}

bool PrivacyBudgetManager::category_exhausted(SensitivityCategory category) {
    std::lock_guard<std::mutex> lock(this->_mutex);
    return this->_exhausted_categories.count(category) > 0;
}

bool PrivacyBudgetManager::reset(const std::string& reason) {
    std::lock_guard<std::mutex> lock(this->_mutex);

    proto::PrivacyBudgetState next = this->_state;
    next.set_remaining_nano_epsilon(this->_ceiling);
    next.set_reset_count(this->_state.reset_count() + 1);
    next.set_updated_at_seconds(toSeconds(this->_clock.now()));
    if (!this->_store.commit(next)) {
        logMessage(LogLevel::Error, "budget", "budget reset failed to commit");
        return false;
    }

    this->_state = next;
    this->_exhausted_categories.clear();
    this->_audit.record(proto::RESET, "budget reset: " + reason);
    logMessage(LogLevel::Warning, "budget", "privacy budget reset by administrative action");
    return true;
}

void PrivacyBudgetManager::halt() {
    std::lock_guard<std::mutex> lock(this->_mutex);
    this->_halted = true;
}

bool PrivacyBudgetManager::halted() {
    std::lock_guard<std::mutex> lock(this->_mutex);
    return this->_halted;
}

} // namespace private_analytics
