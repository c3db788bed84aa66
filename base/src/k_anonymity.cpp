#include "../include/private_analytics/k_anonymity.hpp"
#include "../include/private_analytics/logging.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <utility>

namespace private_analytics {

namespace {

std::string keyHex(std::uint64_t key) {
    std::ostringstream stream;
    stream << std::hex << std::setw(16) << std::setfill('0') << key;
    return stream.str();
}

} // namespace

std::string bucketStateName(BucketState state) {
    switch (state) {
        case BucketState::Empty: return "empty";
        case BucketState::Accumulating: return "accumulating";
        case BucketState::Ready: return "ready";
        case BucketState::Flushed: return "flushed";
        case BucketState::Expired: return "expired";
    }
    return "unknown";
}

std::uint64_t bucketKey(const QuasiIdentifiers& identifiers) {
    // unit separators keep field boundaries unambiguous
    std::string canonical = identifiers.age_range() + '\x1f' + identifiers.region() + '\x1f'
                            + identifiers.platform() + '\x1f' + identifiers.app_version();

    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(canonical.data()), canonical.size(), digest);

    std::uint64_t key = 0;
    for (int i = 0; i < 8; ++i)
        key = (key << 8) | digest[i];
    return key;
}

KAnonymityEngine::KAnonymityEngine(const Config& config, AuditLog& audit, Clock& clock)
        : KAnonymityEngine(config, audit, clock, ContributorHasher::withRandomSalt()) {}

KAnonymityEngine::KAnonymityEngine(const Config& config, AuditLog& audit, Clock& clock, ContributorHasher hasher)
        : _k(config.k_threshold()), _timeout(config.bucket_timeout()), _hasher(std::move(hasher)),
          _audit(audit), _clock(clock), _halted(false) {}

std::shared_ptr<AnonymizationBucket> KAnonymityEngine::acquire(std::uint64_t key) {
    std::lock_guard<std::mutex> lock(this->_index_mutex);

    auto found = this->_index.find(key);
    if (found != this->_index.end())
        return this->_arena[found->second];

    auto bucket = std::make_shared<AnonymizationBucket>();
    bucket->key = key;
    bucket->created_at = this->_clock.now();
    bucket->last_event_at = bucket->created_at;

    std::size_t slot;
    if (!this->_free_slots.empty()) {
        slot = this->_free_slots.back();
        this->_free_slots.pop_back();
        this->_arena[slot] = bucket;
    } else {
        slot = this->_arena.size();
        this->_arena.push_back(bucket);
    }
    this->_index[key] = slot;
    return bucket;
}

// caller holds _index_mutex
void KAnonymityEngine::evict(std::size_t slot) {
    this->_index.erase(this->_arena[slot]->key);
    this->_arena[slot].reset();
    this->_free_slots.push_back(slot);
}

BucketOutcome KAnonymityEngine::assign(GeneralizedEvent event, const std::string& contributor_token) {
    BucketOutcome outcome;
    outcome.key = bucketKey(event.quasi_identifiers);
    if (this->_halted) return outcome;

    std::uint64_t contributor = this->_hasher.hash(contributor_token);

    while (true) {
        auto bucket = acquire(outcome.key);
        std::lock_guard<std::mutex> lock(bucket->mutex);

        // evicted by a concurrent sweep between lookup and lock
        if (bucket->state == BucketState::Expired) continue;
        if (this->_halted) return outcome;

        bucket->last_event_at = this->_clock.now();
        bucket->sketch.add(contributor);
        bucket->pending.push_back(std::move(event));
        if (bucket->state == BucketState::Empty) bucket->state = BucketState::Accumulating;

        outcome.cardinality = bucket->sketch.lower_bound();
        if (outcome.cardinality < this->_k) {
            outcome.status = AssignStatus::Buffered;
            return outcome;
        }

        if (bucket->state == BucketState::Accumulating) {
            bucket->state = BucketState::Ready;
            logMessage(LogLevel::Debug, "k-anonymity", "bucket " + keyHex(outcome.key) + " ready with "
                                                      + std::to_string(bucket->pending.size()) + " events");
        }

        // flushed the instant it becomes ready
        outcome.released.swap(bucket->pending);
        bucket->state = BucketState::Flushed;
        outcome.status = AssignStatus::Released;
        return outcome;
    }
}

SweepReport KAnonymityEngine::sweep() {
    SweepReport report;
    TimePoint now = this->_clock.now();

    std::lock_guard<std::mutex> indexLock(this->_index_mutex);
    for (std::size_t slot = 0; slot < this->_arena.size(); ++slot) {
        auto bucket = this->_arena[slot];
        if (!bucket) continue;

        std::lock_guard<std::mutex> lock(bucket->mutex);
        if (now - bucket->created_at <= this->_timeout) continue;

        if (bucket->state == BucketState::Accumulating) {
            std::size_t discarded = bucket->pending.size();
            bucket->pending.clear();
            bucket->sketch.clear();
            bucket->state = BucketState::Expired;
            evict(slot);

            ++report.expired_buckets;
            report.discarded_events += discarded;
            this->_audit.record(proto::EXPIRY, "bucket " + keyHex(bucket->key) + " expired before reaching k; "
                                               + std::to_string(discarded) + " events destroyed");
        } else if (bucket->state == BucketState::Flushed) {
            bucket->state = BucketState::Expired;
            evict(slot);
            ++report.evicted_buckets;
        }
    }

    if (report.expired_buckets > 0)
        logMessage(LogLevel::Info, "k-anonymity", "sweep expired " + std::to_string(report.expired_buckets)
                                                 + " buckets, destroyed " + std::to_string(report.discarded_events) + " events");
    return report;
}

void KAnonymityEngine::halt() {
    this->_halted = true;
}

std::size_t KAnonymityEngine::purge() {
    std::size_t destroyed = 0;

    std::lock_guard<std::mutex> indexLock(this->_index_mutex);
    for (std::size_t slot = 0; slot < this->_arena.size(); ++slot) {
        auto bucket = this->_arena[slot];
        if (!bucket) continue;

        std::lock_guard<std::mutex> lock(bucket->mutex);
        destroyed += bucket->pending.size();
        bucket->pending.clear();
        bucket->sketch.clear();
        bucket->state = BucketState::Expired;
        evict(slot);
    }
    return destroyed;
}

std::size_t KAnonymityEngine::bucket_count() {
    std::lock_guard<std::mutex> lock(this->_index_mutex);
    return this->_index.size();
}

std::size_t KAnonymityEngine::pending_count() {
    std::size_t total = 0;
    visit_pending([&total](const GeneralizedEvent&) { ++total; });
    return total;
}

boost::optional<BucketState> KAnonymityEngine::state_of(const QuasiIdentifiers& identifiers) {
    std::lock_guard<std::mutex> indexLock(this->_index_mutex);
    auto found = this->_index.find(bucketKey(identifiers));
    if (found == this->_index.end()) return boost::none;

    auto bucket = this->_arena[found->second];
    std::lock_guard<std::mutex> lock(bucket->mutex);
    return bucket->state;
}

void KAnonymityEngine::visit_pending(const std::function<void(const GeneralizedEvent&)>& visitor) {
    std::lock_guard<std::mutex> indexLock(this->_index_mutex);
    for (const auto& bucket : this->_arena) {
        if (!bucket) continue;
        std::lock_guard<std::mutex> lock(bucket->mutex);
        for (const auto& event : bucket->pending) visitor(event);
    }
}

} // namespace private_analytics
