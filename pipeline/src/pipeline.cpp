#include "../include/private_analytics_pipeline/pipeline.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include <private_analytics/errors.hpp>
#include <private_analytics/logging.hpp>

namespace private_analytics {

namespace {

const std::chrono::milliseconds kSchedulerPoll(1000);

void copyCategoricalFields(const FieldMap& fields, proto::AnonymizedEvent& event) {
    for (const auto& field : fields) {
        proto::CategoricalField categorical;
        if (const std::string* label = boost::get<std::string>(&field.second))
            categorical.set_label(*label);
        else if (const bool* flag = boost::get<bool>(&field.second))
            categorical.set_flag(*flag);
        else
            continue;
        (*event.mutable_categorical_fields())[field.first] = categorical;
    }
}

} // namespace

std::string pipelineStateName(PipelineState state) {
    switch (state) {
        case PipelineState::Initialized: return "initialized";
        case PipelineState::Active: return "active";
        case PipelineState::Disabled: return "disabled";
    }
    throw std::invalid_argument("pipeline state is not handled.");
}

std::string dropReasonName(DropReason reason) {
    switch (reason) {
        case DropReason::None: return "none";
        case DropReason::UnknownEventType: return "UnknownEventType";
        case DropReason::UngeneralizableInput: return "UngeneralizableInput";
        case DropReason::BucketNotReady: return "BucketNotReady";
        case DropReason::BudgetExhausted: return "BudgetExhausted";
        case DropReason::UndeclaredNumericField: return "UndeclaredNumericField";
        case DropReason::PHIDetected: return "PHIDetected";
        case DropReason::GuaranteeViolation: return "GuaranteeViolation";
        case DropReason::LatencyExceeded: return "LatencyExceeded";
        case DropReason::PipelineDisabled: return "PipelineDisabled";
        case DropReason::EntropyFailure: return "EntropyFailure";
        case DropReason::TransportFailure: return "TransportFailure";
        case DropReason::InternalFailure: return "InternalFailure";
    }
    throw std::invalid_argument("drop reason is not handled.");
}

AnalyticsPipeline::AnalyticsPipeline(const Config& config, BudgetStore& budget_store, AuditStore& audit_store,
                                     Transport& transport, Clock& clock)
        : AnalyticsPipeline(config, budget_store, audit_store, transport, clock, ContributorHasher::withRandomSalt()) {}

AnalyticsPipeline::AnalyticsPipeline(const Config& config, BudgetStore& budget_store, AuditStore& audit_store,
                                     Transport& transport, Clock& clock, ContributorHasher hasher)
        : _config(config), _clock(clock), _transport(transport),
          _audit(audit_store, clock),
          _generalizer(_config),
          _engine(_config, _audit, clock, std::move(hasher)),
          _budget(_config, budget_store, _audit, clock),
          _noise(_config),
          _guarantee(_config, _phi, _generalizer, _audit),
          _incidents(_config, _engine, _budget, _phi, _audit, clock),
          _scheduler(clock),
          _queue(_config.queue_capacity()),
          _state(PipelineState::Initialized),
          _delivered(0) {

    this->_incidents.set_shutdown_handler([this](const std::string& reason) { emergency_shutdown(reason); });

    this->_scheduler.add_task("sweep", std::chrono::duration_cast<std::chrono::milliseconds>(
            this->_config.sweep_interval()), [this]() { sweep(); });
    this->_scheduler.add_task("incident_scan", std::chrono::duration_cast<std::chrono::milliseconds>(
            this->_config.incident_scan_interval()), [this]() { this->_incidents.scan(); });

    // background work yields while the event queue is backing up
    this->_scheduler.set_pressure_check([this]() {
        return this->_queue.size() * 4 >= this->_queue.capacity() * 3;
    });
}

AnalyticsPipeline::~AnalyticsPipeline() {
    stop();
}

void AnalyticsPipeline::activate() {
    std::lock_guard<std::mutex> lock(this->_lifecycle_mutex);
    if (this->_state.load() == PipelineState::Disabled) {
        logMessage(LogLevel::Warning, "pipeline", "activation refused: pipeline is disabled");
        return;
    }
    if (this->_state.exchange(PipelineState::Active) == PipelineState::Initialized)
        logMessage(LogLevel::Info, "pipeline", "pipeline active");
}

void AnalyticsPipeline::start() {
    activate();

    std::lock_guard<std::mutex> lock(this->_lifecycle_mutex);
    if (this->_state.load() != PipelineState::Active || this->_worker.joinable()) return;

    this->_worker = std::thread([this]() {
        RawEvent event;
        while (this->_queue.pop(event)) process(event);
    });
    this->_scheduler.start(kSchedulerPoll);
}

void AnalyticsPipeline::stop() {
    std::size_t discarded = this->_queue.clear();
    this->_queue.close();
    this->_scheduler.stop();
    if (this->_worker.joinable()) this->_worker.join();

    if (discarded > 0)
        logMessage(LogLevel::Info, "pipeline", "stopped with " + std::to_string(discarded) + " queued events discarded");
}

bool AnalyticsPipeline::submit(RawEvent event) {
    if (!active()) return false;
    if (!this->_queue.try_push(std::move(event))) {
        logMessage(LogLevel::Warning, "pipeline", "event queue full, event dropped");
        return false;
    }
    return true;
}

std::size_t AnalyticsPipeline::run_background_tasks() {
    return this->_scheduler.run_due();
}

bool AnalyticsPipeline::within_ceiling(TimePoint started, const std::string& stage) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(this->_clock.now() - started);
    if (elapsed <= this->_config.latency_ceiling()) return true;

    logMessage(LogLevel::Warning, "pipeline", "latency ceiling exceeded during " + stage + ", event aborted");
    this->_audit.record(proto::PERFORMANCE, "latency ceiling exceeded stage=" + stage
                                            + " elapsed_ms=" + std::to_string(elapsed.count()));
    return false;
}

ProcessOutcome AnalyticsPipeline::process(const RawEvent& event) {
    try {
        return process_checked(event);
    } catch (const UngeneralizableInput& error) {
        logMessage(LogLevel::Info, "pipeline", std::string("event dropped: ") + error.what());
        this->_audit.record(proto::REJECTION, "UngeneralizableInput");
        ProcessOutcome outcome;
        outcome.reason = DropReason::UngeneralizableInput;
        return outcome;
    } catch (const EntropyFailure& error) {
        logMessage(LogLevel::Error, "pipeline", std::string("event dropped: ") + error.what());
        this->_audit.record(proto::REJECTION, "EntropyFailure");
        ProcessOutcome outcome;
        outcome.reason = DropReason::EntropyFailure;
        return outcome;
    } catch (const std::exception& error) {
        logMessage(LogLevel::Error, "pipeline", std::string("event dropped: ") + error.what());
        this->_audit.record(proto::REJECTION, "InternalFailure");
        ProcessOutcome outcome;
        outcome.reason = DropReason::InternalFailure;
        return outcome;
    }
}

ProcessOutcome AnalyticsPipeline::process_checked(const RawEvent& raw) {
    ProcessOutcome outcome;
    TimePoint started = this->_clock.now();

    if (!active()) {
        outcome.reason = DropReason::PipelineDisabled;
        return outcome;
    }

    boost::optional<EventType> type = parseEventType(raw.event_type);
    if (!type) {
        logMessage(LogLevel::Warning, "pipeline", "rejected event with an unrecognized type");
        this->_audit.record(proto::REJECTION, "UnknownEventType");
        outcome.reason = DropReason::UnknownEventType;
        return outcome;
    }

    FieldMap fields = *type == EventType::AssessmentCompleted ? bucketAssessmentScore(raw.fields) : raw.fields;

    boost::optional<std::string> undeclared = this->_noise.undeclared_field(fields);
    if (undeclared) {
        logMessage(LogLevel::Warning, "pipeline", "dropped " + eventTypeTag(*type) + ": numeric field "
                                                 + *undeclared + " has no reviewed sensitivity");
        this->_audit.record(proto::REJECTION, "UndeclaredNumericField event_type=" + eventTypeTag(*type));
        outcome.reason = DropReason::UndeclaredNumericField;
        return outcome;
    }

    GeneralizedEvent event;
    event.type = *type;
    event.fields = std::move(fields);
    event.quasi_identifiers = this->_generalizer.generalize(raw.contributor);
    event.received_at_seconds = toSeconds(this->_clock.now());

    if (!within_ceiling(started, "generalization")) {
        outcome.reason = DropReason::LatencyExceeded;
        return outcome;
    }

    BucketOutcome bucket = this->_engine.assign(std::move(event), raw.contributor.contributor_token);
    switch (bucket.status) {
        case AssignStatus::Rejected:
            outcome.reason = DropReason::PipelineDisabled;
            return outcome;
        case AssignStatus::Buffered:
            outcome.reason = DropReason::BucketNotReady;
            return outcome;
        case AssignStatus::Released:
            break;
    }

    for (auto& released : bucket.released) {
        DropReason reason = release(std::move(released), bucket.cardinality);
        if (reason == DropReason::None)
            ++outcome.delivered;
        else
            outcome.dropped.push_back(reason);
    }
    return outcome;
}

DropReason AnalyticsPipeline::release(GeneralizedEvent event, std::uint64_t cardinality) {
    TimePoint started = this->_clock.now();
    try {
        if (!active()) return DropReason::PipelineDisabled;

        SensitivityCategory category = categoryOf(event.type);
        boost::optional<double> epsilon = this->_budget.allocate(category);
        if (!epsilon) {
            DropReason reason = this->_budget.halted() ? DropReason::PipelineDisabled : DropReason::BudgetExhausted;
            bool exhausted = this->_budget.exhausted() || this->_budget.category_exhausted(category);
            if (exhausted && this->_config.disable_pipeline_on_exhaustion())
                emergency_shutdown("privacy budget exhausted");
            return reason;
        }

        proto::AnonymizedEvent anonymized;
        anonymized.set_event_type(eventTypeTag(event.type));
        *anonymized.mutable_quasi_identifiers() = toProto(event.quasi_identifiers);
        for (const auto& noised : this->_noise.noise(event.fields, *epsilon))
            (*anonymized.mutable_noised_fields())[noised.first] = noised.second;
        copyCategoricalFields(event.fields, anonymized);
        anonymized.set_bucket_cardinality(cardinality);
        anonymized.set_epsilon(*epsilon);
        anonymized.set_release_hour(toSeconds(this->_clock.now()) / 3600);

        GuaranteeResult result = this->_guarantee.check(anonymized);
        if (result.failure == GuaranteeFailure::PHIDetected) return DropReason::PHIDetected;
        if (!result.passed()) return DropReason::GuaranteeViolation;

        if (!within_ceiling(started, "release")) return DropReason::LatencyExceeded;
        if (!active()) return DropReason::PipelineDisabled;

        try {
            this->_transport.deliver(std::make_unique<const proto::AnonymizedEvent>(std::move(anonymized)));
        } catch (const std::exception& error) {
            report_transport_failure(error.what());
            return DropReason::TransportFailure;
        }
        ++this->_delivered;
        return DropReason::None;
    } catch (const EntropyFailure& error) {
        logMessage(LogLevel::Error, "pipeline", std::string("released event dropped: ") + error.what());
        this->_audit.record(proto::REJECTION, "EntropyFailure event_type=" + eventTypeTag(event.type));
        return DropReason::EntropyFailure;
    } catch (const UndeclaredNumericField& error) {
        logMessage(LogLevel::Warning, "pipeline", std::string("released event dropped: ") + error.what());
        this->_audit.record(proto::REJECTION, "UndeclaredNumericField event_type=" + eventTypeTag(event.type));
        return DropReason::UndeclaredNumericField;
    } catch (const std::exception& error) {
        logMessage(LogLevel::Error, "pipeline", std::string("released event dropped: ") + error.what());
        this->_audit.record(proto::REJECTION, "InternalFailure event_type=" + eventTypeTag(event.type));
        return DropReason::InternalFailure;
    }
}

void AnalyticsPipeline::sweep() {
    SweepReport report = this->_engine.sweep();
    if (report.expired_buckets > 0) this->_incidents.record_expirations(report.expired_buckets);
}

void AnalyticsPipeline::shutdown(const std::string& detail) {
    std::lock_guard<std::mutex> lock(this->_lifecycle_mutex);
    if (this->_state.exchange(PipelineState::Disabled) == PipelineState::Disabled) return;

    this->_engine.halt();
    this->_budget.halt();
    std::size_t purged = this->_engine.purge();
    std::size_t discarded = this->_queue.clear();
    this->_queue.close();

    this->_audit.record(proto::SHUTDOWN, detail + " purged=" + std::to_string(purged)
                                         + " discarded=" + std::to_string(discarded));
}

void AnalyticsPipeline::disable(const std::string& reason) {
    logMessage(LogLevel::Info, "pipeline", "pipeline disabled: " + reason);
    shutdown("pipeline disabled: " + reason);
}

void AnalyticsPipeline::emergency_shutdown(const std::string& reason) {
    logMessage(LogLevel::Error, "pipeline", "emergency shutdown: " + reason);
    shutdown("emergency shutdown: " + reason);
}

void AnalyticsPipeline::report_transport_failure(const std::string& reason) {
    this->_incidents.report_transport_failure(reason);
}

} // namespace private_analytics
