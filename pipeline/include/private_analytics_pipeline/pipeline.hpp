#ifndef PRIVATE_ANALYTICS_PIPELINE_PIPELINE_HPP
#define PRIVATE_ANALYTICS_PIPELINE_PIPELINE_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <private_analytics/audit.hpp>
#include <private_analytics/budget.hpp>
#include <private_analytics/cardinality.hpp>
#include <private_analytics/clock.hpp>
#include <private_analytics/config.hpp>
#include <private_analytics/generalizer.hpp>
#include <private_analytics/guarantee.hpp>
#include <private_analytics/k_anonymity.hpp>
#include <private_analytics/phi_detector.hpp>
#include <private_analytics/storage.hpp>
#include <private_analytics/types.hpp>
#include <private_analytics_runtime_eigen/mechanisms.hpp>

#include "incident.hpp"
#include "queue.hpp"
#include "scheduler.hpp"
#include "transport.hpp"

namespace private_analytics {

// init -> active -> disabled; disabled is terminal for the process
enum class PipelineState {
    Initialized, Active, Disabled
};

std::string pipelineStateName(PipelineState state);

enum class DropReason {
    None,
    UnknownEventType,
    UngeneralizableInput,
    BucketNotReady,
    BudgetExhausted,
    UndeclaredNumericField,
    PHIDetected,
    GuaranteeViolation,
    LatencyExceeded,
    PipelineDisabled,
    EntropyFailure,
    TransportFailure,
    InternalFailure
};

std::string dropReasonName(DropReason reason);

struct ProcessOutcome {
    // why the submitted event went no further; BucketNotReady when it was buffered
    DropReason reason = DropReason::None;
    // events of the released batch handed to the transport
    std::size_t delivered = 0;
    // events of the released batch that were dropped, in batch order
    std::vector<DropReason> dropped;
};

// The pipeline context. Constructed once by the application and passed by
// reference to the instrumentation layer; owns every stage and their shared state.
class AnalyticsPipeline {
    Config _config;
    Clock& _clock;
    Transport& _transport;

    AuditLog _audit;
    QuasiIdentifierGeneralizer _generalizer;
    KAnonymityEngine _engine;
    PrivacyBudgetManager _budget;
    NoiseGenerator _noise;
    PhiDetector _phi;
    GuaranteeChecker _guarantee;
    IncidentDetector _incidents;
    Scheduler _scheduler;

    EventQueue<RawEvent> _queue;
    std::thread _worker;

    std::mutex _lifecycle_mutex;
    std::atomic<PipelineState> _state;
    std::atomic<std::size_t> _delivered;

    bool active() const { return this->_state.load() == PipelineState::Active; }
    bool within_ceiling(TimePoint started, const std::string& stage);
    DropReason release(GeneralizedEvent event, std::uint64_t cardinality);
    ProcessOutcome process_checked(const RawEvent& raw);
    void shutdown(const std::string& detail);
    void sweep();
public:
    explicit AnalyticsPipeline(const Config& config, BudgetStore& budget_store, AuditStore& audit_store,
                               Transport& transport, Clock& clock);
    explicit AnalyticsPipeline(const Config& config, BudgetStore& budget_store, AuditStore& audit_store,
                               Transport& transport, Clock& clock, ContributorHasher hasher);
    ~AnalyticsPipeline();

    AnalyticsPipeline(const AnalyticsPipeline&) = delete;
    AnalyticsPipeline& operator=(const AnalyticsPipeline&) = delete;

    // initialized -> active without background threads; process() and
    // run_background_tasks() are then driven by the caller
    void activate();

    // activate() plus the worker and scheduler threads
    void start();

    // joins the background threads; queued events are discarded
    void stop();

    // fire-and-forget; false when the event was not queued
    bool submit(RawEvent event);

    ProcessOutcome process(const RawEvent& event);

    // runs the periodic tasks that are due
    std::size_t run_background_tasks();

    // consent withdrawal: buffered events are purged, nothing further is processed
    void disable(const std::string& reason);

    // critical incident: allocation and flushing halt, buffers are purged
    void emergency_shutdown(const std::string& reason);

    // transport collaborator callback
    void report_transport_failure(const std::string& reason);

    PipelineState state() const { return this->_state.load(); }
    std::size_t delivered_count() const { return this->_delivered.load(); }

    const Config& get_config() const { return this->_config; }
    AuditLog& get_audit() { return this->_audit; }
    KAnonymityEngine& get_engine() { return this->_engine; }
    PrivacyBudgetManager& get_budget() { return this->_budget; }
    IncidentDetector& get_incidents() { return this->_incidents; }
    Scheduler& get_scheduler() { return this->_scheduler; }
};

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_PIPELINE_PIPELINE_HPP
