#ifndef PRIVATE_ANALYTICS_K_ANONYMITY_HPP
#define PRIVATE_ANALYTICS_K_ANONYMITY_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/optional.hpp>

#include "audit.hpp"
#include "cardinality.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "types.hpp"

namespace private_analytics {

// empty -> accumulating -> ready -> flushed, or accumulating -> expired
enum class BucketState {
    Empty, Accumulating, Ready, Flushed, Expired
};

std::string bucketStateName(BucketState state);

// deterministic across processes and devices
std::uint64_t bucketKey(const QuasiIdentifiers& identifiers);

struct AnonymizationBucket {
    std::uint64_t key = 0;
    CardinalitySketch sketch;
    BucketState state = BucketState::Empty;
    std::vector<GeneralizedEvent> pending;
    TimePoint created_at;
    TimePoint last_event_at;
    std::mutex mutex;
};

enum class AssignStatus {
    Buffered, Released, Rejected
};

struct BucketOutcome {
    AssignStatus status = AssignStatus::Rejected;
    std::uint64_t key = 0;
    // rounded-down cardinality estimate after this event
    std::uint64_t cardinality = 0;
    // populated on release, in arrival order
    std::vector<GeneralizedEvent> released;
};

struct SweepReport {
    std::size_t expired_buckets = 0;
    std::size_t discarded_events = 0;
    std::size_t evicted_buckets = 0;
};

class KAnonymityEngine {
    std::uint32_t _k;
    std::chrono::seconds _timeout;
    ContributorHasher _hasher;
    AuditLog& _audit;
    Clock& _clock;

    // arena of buckets indexed by key; slots are reused after eviction
    std::mutex _index_mutex;
    std::vector<std::shared_ptr<AnonymizationBucket>> _arena;
    std::vector<std::size_t> _free_slots;
    std::unordered_map<std::uint64_t, std::size_t> _index;

    std::atomic<bool> _halted;

    std::shared_ptr<AnonymizationBucket> acquire(std::uint64_t key);
    void evict(std::size_t slot);
public:
    explicit KAnonymityEngine(const Config& config, AuditLog& audit, Clock& clock);
    explicit KAnonymityEngine(const Config& config, AuditLog& audit, Clock& clock, ContributorHasher hasher);

    BucketOutcome assign(GeneralizedEvent event, const std::string& contributor_token);

    // expires accumulating buckets older than the timeout; their events are destroyed
    SweepReport sweep();

    // stops all flushing; later assignments are rejected
    void halt();
    bool halted() const { return this->_halted.load(); }

    // destroys every buffered event; returns how many were destroyed
    std::size_t purge();

    std::size_t bucket_count();
    std::size_t pending_count();
    boost::optional<BucketState> state_of(const QuasiIdentifiers& identifiers);
    void visit_pending(const std::function<void(const GeneralizedEvent&)>& visitor);

    std::uint32_t get_k() const { return this->_k; }
};

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_K_ANONYMITY_HPP
