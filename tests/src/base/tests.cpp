#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>
#include <map>
#include <random>
#include <set>
#include <thread>

#include <private_analytics/audit.hpp>
#include <private_analytics/budget.hpp>
#include <private_analytics/cardinality.hpp>
#include <private_analytics/errors.hpp>
#include <private_analytics/generalizer.hpp>
#include <private_analytics/k_anonymity.hpp>
#include <private_analytics/logging.hpp>
#include <private_analytics/storage.hpp>

#include "../../include/tests/main.hpp"

using namespace private_analytics;

class FailingAuditStore : public AuditStore {
public:
    bool append(const proto::AuditLogEntry&) override { return false; }
    std::vector<proto::AuditLogEntry> entries() override { return {}; }
};

TEST_CASE("Config_Defaults", "[Config]") {
    Config config;

    REQUIRE(config.k_threshold() == 5);
    REQUIRE(config.epsilon_ceiling() == Approx(1.0));
    REQUIRE(config.min_query_epsilon() == Approx(0.001));
    REQUIRE(config.category_epsilon(SensitivityCategory::Low) == Approx(0.01));
    REQUIRE(config.category_epsilon(SensitivityCategory::Medium) == Approx(0.05));
    REQUIRE(config.category_epsilon(SensitivityCategory::High) == Approx(0.1));
    REQUIRE(config.bucket_timeout() == std::chrono::hours(24));
    REQUIRE(config.max_payload_bytes() == 10240);
    REQUIRE(config.latency_ceiling() == std::chrono::milliseconds(50));
    REQUIRE(config.home_country() == "US");
    REQUIRE(config.sensitivity_table().size() == 8);
}

TEST_CASE("Config_TextFormat", "[Config]") {
    Config config = Config::fromText(
            "k_threshold: 10\n"
            "epsilon_ceiling: 2.0\n"
            "bucket_timeout_seconds: 3600\n"
            "sensitivity { field: \"steps\" kind: COUNT bound: 100 }\n");

    REQUIRE(config.k_threshold() == 10);
    REQUIRE(config.epsilon_ceiling() == Approx(2.0));
    REQUIRE(config.bucket_timeout() == std::chrono::hours(1));
    REQUIRE(config.sensitivity_table().size() == 1);
    REQUIRE(config.sensitivity_table()[0].field == "steps");
    REQUIRE(config.sensitivity_table()[0].kind == FieldKind::Count);
}

TEST_CASE("Config_Rejected", "[Config]") {
    REQUIRE_THROWS_AS(Config::fromText("k_threshold: 1"), ConfigurationError);
    REQUIRE_THROWS_AS(Config::fromText("k_threshold: 1025"), ConfigurationError);
    REQUIRE(Config::fromText("k_threshold: 1024").k_threshold() == 1024);
    REQUIRE_THROWS_AS(Config::fromText("epsilon_ceiling: 0"), ConfigurationError);
    REQUIRE_THROWS_AS(Config::fromText("high_sensitivity_epsilon: 5.0"), ConfigurationError);
    REQUIRE_THROWS_AS(Config::fromText("home_country: \"USA\""), ConfigurationError);
    REQUIRE_THROWS_AS(Config::fromText("sensitivity { field: \"x\" kind: COUNT bound: 0 }"), ConfigurationError);
    REQUIRE_THROWS_AS(Config::fromText("not a field"), ConfigurationError);
    REQUIRE_THROWS_AS(Config::fromFile("/nonexistent/pipeline.cfg"), ConfigurationError);
}

TEST_CASE("Generalizer_AgeBoundary", "[Generalizer]") {
    QuasiIdentifierGeneralizer generalizer(18, "US");

    REQUIRE(generalizer.generalize_age(18) == "18-27");
    REQUIRE(generalizer.generalize_age(17) == "18-27");
    REQUIRE(generalizer.generalize_age(13) == "18-27");
    REQUIRE(generalizer.generalize_age(27) == "18-27");
    REQUIRE(generalizer.generalize_age(28) == "28-37");
    REQUIRE(generalizer.generalize_age(67) == "58-67");
    REQUIRE(generalizer.generalize_age(68) == "68+");
    REQUIRE(generalizer.generalize_age(104) == "68+");
    REQUIRE(generalizer.age_bands().size() == 6);
    REQUIRE_THROWS_AS(generalizer.generalize_age(-1), UngeneralizableInput);
}

TEST_CASE("Generalizer_Region", "[Generalizer]") {
    QuasiIdentifierGeneralizer generalizer(18, "US");

    REQUIRE(generalizer.generalize_region(std::string("US-CA")) == "CA");
    REQUIRE(generalizer.generalize_region(std::string(" us_ny ")) == "NY");
    REQUIRE(generalizer.generalize_region(std::string("GB")) == kRegionInternational);
    REQUIRE(generalizer.generalize_region(std::string("GB-LND")) == kRegionInternational);
    REQUIRE(generalizer.generalize_region(std::string("US")) == kRegionUnknown);
    REQUIRE(generalizer.generalize_region(std::string("US-California")) == kRegionUnknown);
    REQUIRE(generalizer.generalize_region(std::string("37.77,-122.41")) == kRegionUnknown);
    REQUIRE(generalizer.generalize_region(boost::none) == kRegionUnknown);
}

TEST_CASE("Generalizer_PlatformAndVersion", "[Generalizer]") {
    QuasiIdentifierGeneralizer generalizer(18, "US");

    REQUIRE(generalizer.generalize_platform("iPadOS") == "iOS");
    REQUIRE(generalizer.generalize_platform("ANDROID") == "Android");
    REQUIRE(generalizer.generalize_platform("web") == "Web");
    REQUIRE(generalizer.generalize_platform("tizen") == "Other");
    REQUIRE_THROWS_AS(generalizer.generalize_platform("  "), UngeneralizableInput);

    REQUIRE(generalizer.generalize_app_version("v2.13.4") == "2.13");
    REQUIRE(generalizer.generalize_app_version("1.0-beta.2") == "1.0");
    REQUIRE(generalizer.generalize_app_version("3.1+build.77") == "3.1");
    REQUIRE(generalizer.generalize_app_version("01.02") == "1.2");
    REQUIRE_THROWS_AS(generalizer.generalize_app_version("1"), UngeneralizableInput);
    REQUIRE_THROWS_AS(generalizer.generalize_app_version("latest"), UngeneralizableInput);
}

TEST_CASE("Generalizer_Idempotent", "[Generalizer]") {
    QuasiIdentifierGeneralizer generalizer(Config{});
    ContributorAttributes attributes = make_attributes(30, "US-CA", "ios", "1.0.3");

    QuasiIdentifiers first = generalizer.generalize(attributes);
    QuasiIdentifiers second = generalizer.generalize(attributes);

    REQUIRE(first == second);
    REQUIRE(first == make_scenario_identifiers());
    REQUIRE(generalizer.is_generalized(first));

    attributes.age = boost::none;
    REQUIRE_THROWS_AS(generalizer.generalize(attributes), UngeneralizableInput);
}

TEST_CASE("Generalizer_Grammar", "[Generalizer]") {
    QuasiIdentifierGeneralizer generalizer(18, "US");
    QuasiIdentifiers identifiers = make_scenario_identifiers();
    REQUIRE(generalizer.is_generalized(identifiers));

    REQUIRE_FALSE(generalizer.is_generalized(QuasiIdentifiers("29", "CA", "iOS", "1.0")));
    REQUIRE_FALSE(generalizer.is_generalized(QuasiIdentifiers("28-37", "US-CA", "iOS", "1.0")));
    REQUIRE_FALSE(generalizer.is_generalized(QuasiIdentifiers("28-37", "CA", "iOS", "1.0.3")));
    REQUIRE_FALSE(generalizer.is_generalized(QuasiIdentifiers("28-37", "CA", "iPhone14,2", "1.0")));
    REQUIRE_FALSE(generalizer.is_generalized(QuasiIdentifiers()));

    REQUIRE(generalizer.is_generalized(fromProto(toProto(identifiers))));
}

TEST_CASE("QuasiIdentifiers_Value", "[Generalizer]") {
    QuasiIdentifiers identifiers("38-47", "INTL", "Android", "2.4");
    REQUIRE(identifiers.age_range() == "38-47");
    REQUIRE(identifiers.region() == "INTL");
    REQUIRE(identifiers.platform() == "Android");
    REQUIRE(identifiers.app_version() == "2.4");

    QuasiIdentifiers copy = identifiers;
    REQUIRE(copy == identifiers);
    copy = make_scenario_identifiers();
    REQUIRE(copy != identifiers);
    REQUIRE(identifiers.region() == "INTL");

    REQUIRE(QuasiIdentifiers("38-47", "INTL", "Android", "2.5") != identifiers);
    REQUIRE(QuasiIdentifiers() == QuasiIdentifiers("", "", "", ""));
}

TEST_CASE("Generalizer_SeverityBuckets", "[Generalizer]") {
    REQUIRE(phq9SeverityBucket(0) == "minimal");
    REQUIRE(phq9SeverityBucket(4) == "minimal");
    REQUIRE(phq9SeverityBucket(5) == "mild");
    REQUIRE(phq9SeverityBucket(9) == "mild");
    REQUIRE(phq9SeverityBucket(10) == "moderate");
    REQUIRE(phq9SeverityBucket(14) == "moderate");
    REQUIRE(phq9SeverityBucket(15) == "moderate_severe");
    REQUIRE(phq9SeverityBucket(19) == "moderate_severe");
    REQUIRE(phq9SeverityBucket(20) == "severe");
    REQUIRE(phq9SeverityBucket(27) == "severe");
    REQUIRE_THROWS_AS(phq9SeverityBucket(28), UngeneralizableInput);
    REQUIRE_THROWS_AS(phq9SeverityBucket(-1), UngeneralizableInput);

    REQUIRE(gad7SeverityBucket(4) == "minimal");
    REQUIRE(gad7SeverityBucket(5) == "mild");
    REQUIRE(gad7SeverityBucket(9) == "mild");
    REQUIRE(gad7SeverityBucket(10) == "moderate");
    REQUIRE(gad7SeverityBucket(14) == "moderate");
    REQUIRE(gad7SeverityBucket(15) == "severe");
    REQUIRE(gad7SeverityBucket(19) == "severe");
    REQUIRE(gad7SeverityBucket(20) == "severe");
    REQUIRE(gad7SeverityBucket(21) == "severe");
    REQUIRE_THROWS_AS(gad7SeverityBucket(22), UngeneralizableInput);
}

TEST_CASE("Generalizer_AssessmentScore", "[Generalizer]") {
    FieldMap phq;
    phq["assessment_type"] = std::string("phq9");
    phq["totalScore"] = 15.;
    phq["assessment_duration_seconds"] = 300.;

    FieldMap bucketed = bucketAssessmentScore(phq);
    REQUIRE(bucketed.count("totalScore") == 0);
    REQUIRE(boost::get<std::string>(bucketed.at("severity_bucket")) == "moderate_severe");
    REQUIRE(boost::get<std::string>(bucketed.at("assessment_type")) == "phq9");
    REQUIRE(boost::get<double>(bucketed.at("assessment_duration_seconds")) == 300.);

    FieldMap gad;
    gad["assessment_type"] = std::string("GAD7");
    gad["total_score"] = 14.;
    bucketed = bucketAssessmentScore(gad);
    REQUIRE(bucketed.count("total_score") == 0);
    REQUIRE(boost::get<std::string>(bucketed.at("severity_bucket")) == "moderate");

    // both spellings present: neither survives
    gad["totalScore"] = 3.;
    bucketed = bucketAssessmentScore(gad);
    REQUIRE(bucketed.count("total_score") == 0);
    REQUIRE(bucketed.count("totalScore") == 0);

    FieldMap unscored;
    unscored["assessment_type"] = std::string("phq9");
    REQUIRE((bucketAssessmentScore(unscored) == unscored));

    FieldMap untyped;
    untyped["total_score"] = 12.;
    REQUIRE_THROWS_AS(bucketAssessmentScore(untyped), UngeneralizableInput);

    FieldMap fractional = phq;
    fractional["totalScore"] = 12.5;
    REQUIRE_THROWS_AS(bucketAssessmentScore(fractional), UngeneralizableInput);

    FieldMap textual = phq;
    textual["totalScore"] = std::string("15");
    REQUIRE_THROWS_AS(bucketAssessmentScore(textual), UngeneralizableInput);

    FieldMap gadHigh;
    gadHigh["assessment_type"] = std::string("gad7");
    gadHigh["total_score"] = 25.;
    REQUIRE_THROWS_AS(bucketAssessmentScore(gadHigh), UngeneralizableInput);
}

TEST_CASE("Sketch_SmallCountsExact", "[Cardinality]") {
    ContributorHasher hasher = make_test_hasher();
    std::vector<std::string> tokens = make_contributors(hasher, 40);

    CardinalitySketch sketch;
    REQUIRE(sketch.empty());
    REQUIRE(sketch.lower_bound() == 0);
    REQUIRE(sketch.register_count() == 4096);

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        sketch.add(hasher.hash(tokens[i]));
        REQUIRE(sketch.lower_bound() == i + 1);
    }

    // repeated contributors do not count twice
    for (const auto& token : tokens) sketch.add(hasher.hash(token));
    REQUIRE(sketch.lower_bound() == tokens.size());

    sketch.clear();
    REQUIRE(sketch.empty());
}

TEST_CASE("Sketch_LargeCountsApproximate", "[Cardinality]") {
    ContributorHasher hasher = make_test_hasher();
    CardinalitySketch sketch;

    const std::size_t contributors = 50000;
    for (std::size_t i = 0; i < contributors; ++i)
        sketch.add(hasher.hash("install-" + std::to_string(i)));

    REQUIRE(sketch.lower_bound() > contributors * 0.85);
    REQUIRE(sketch.lower_bound() < contributors * 1.05);
    REQUIRE(sketch.lower_bound() <= sketch.estimate());
}

TEST_CASE("Sketch_NoCollisionBias", "[Cardinality]") {
    // linear counting alone would report more than 300 here
    ContributorHasher hasher = make_test_hasher();
    CardinalitySketch sketch;
    for (const auto& token : make_contributors(hasher, 300)) sketch.add(hasher.hash(token));

    REQUIRE(sketch.estimate() > 300.);
    REQUIRE(sketch.occupied() == 300);
    REQUIRE(sketch.lower_bound() == 300);
    REQUIRE(CardinalitySketch::exactLimit() == 1024);
}

TEST_CASE("Sketch_NeverOvercounts", "[Cardinality]") {
    std::mt19937 random(90);
    std::uniform_int_distribution<int> device(0, 1999);

    for (int trial = 0; trial < 40; ++trial) {
        ContributorHasher hasher = ContributorHasher::withRandomSalt();
        CardinalitySketch sketch;
        std::set<int> distinct;

        for (int i = 0; i < 1500; ++i) {
            int token = device(random);
            distinct.insert(token);
            sketch.add(hasher.hash("device-" + std::to_string(token)));
            if (distinct.size() <= CardinalitySketch::exactLimit())
                REQUIRE(sketch.lower_bound() <= distinct.size());
        }
    }
}

TEST_CASE("Sketch_Serialization", "[Cardinality]") {
    ContributorHasher hasher = make_test_hasher();
    CardinalitySketch sketch;
    for (const auto& token : make_contributors(hasher, 7)) sketch.add(hasher.hash(token));

    CardinalitySketch restored = CardinalitySketch::deserialize(sketch.serialize());
    REQUIRE(restored.lower_bound() == 7);

    REQUIRE_THROWS_AS(CardinalitySketch::deserialize(""), std::invalid_argument);
    REQUIRE_THROWS_AS(CardinalitySketch::deserialize(std::string(5, '\x0c')), std::invalid_argument);
    REQUIRE_THROWS_AS(CardinalitySketch(20), std::invalid_argument);
}

TEST_CASE("Hasher_Salted", "[Cardinality]") {
    ContributorHasher first("salt-a");
    ContributorHasher second("salt-b");

    REQUIRE(first.hash("token") == first.hash("token"));
    REQUIRE(first.hash("token") != first.hash("other"));
    REQUIRE(first.hash("token") != second.hash("token"));

    ContributorHasher random = ContributorHasher::withRandomSalt();
    REQUIRE(random.hash("token") != first.hash("token"));
}

TEST_CASE("Bucket_ReleasesAtK", "[KAnonymity]") {
    // four matching events wait; the fifth releases all five with cardinality 5
    MemoryAuditStore store;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(store, clock);
    ContributorHasher hasher = make_test_hasher();
    KAnonymityEngine engine(make_test_config(5), audit, clock, hasher);

    QuasiIdentifiers identifiers = make_scenario_identifiers();
    std::vector<std::string> contributors = make_contributors(hasher, 5);

    for (std::size_t i = 0; i < 4; ++i) {
        BucketOutcome outcome = engine.assign(make_generalized_event(identifiers), contributors[i]);
        REQUIRE(outcome.status == AssignStatus::Buffered);
        REQUIRE(outcome.cardinality == i + 1);
        REQUIRE(outcome.released.empty());
    }
    REQUIRE(*engine.state_of(identifiers) == BucketState::Accumulating);
    REQUIRE(engine.pending_count() == 4);

    BucketOutcome fifth = engine.assign(make_generalized_event(identifiers), contributors[4]);
    REQUIRE(fifth.status == AssignStatus::Released);
    REQUIRE(fifth.cardinality == 5);
    REQUIRE(fifth.released.size() == 5);
    for (const auto& event : fifth.released) REQUIRE(event.quasi_identifiers == identifiers);

    REQUIRE(*engine.state_of(identifiers) == BucketState::Flushed);
    REQUIRE(bucketStateName(*engine.state_of(identifiers)) == "flushed");
    REQUIRE(engine.pending_count() == 0);
    REQUIRE(engine.get_k() == 5);
}

TEST_CASE("Bucket_DistinctContributorsOnly", "[KAnonymity]") {
    MemoryAuditStore store;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(store, clock);
    ContributorHasher hasher = make_test_hasher();
    KAnonymityEngine engine(make_test_config(5), audit, clock, hasher);

    QuasiIdentifiers identifiers = make_scenario_identifiers();
    for (int i = 0; i < 12; ++i) {
        BucketOutcome outcome = engine.assign(make_generalized_event(identifiers), "same-install");
        REQUIRE(outcome.status == AssignStatus::Buffered);
        REQUIRE(outcome.cardinality == 1);
    }
    REQUIRE(engine.pending_count() == 12);
}

TEST_CASE("Bucket_ReleasesAfterFlush", "[KAnonymity]") {
    MemoryAuditStore store;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(store, clock);
    ContributorHasher hasher = make_test_hasher();
    KAnonymityEngine engine(make_test_config(3), audit, clock, hasher);

    QuasiIdentifiers identifiers = make_scenario_identifiers();
    std::vector<std::string> contributors = make_contributors(hasher, 4);
    for (std::size_t i = 0; i < 3; ++i) engine.assign(make_generalized_event(identifiers), contributors[i]);

    BucketOutcome later = engine.assign(make_generalized_event(identifiers), contributors[3]);
    REQUIRE(later.status == AssignStatus::Released);
    REQUIRE(later.released.size() == 1);
    REQUIRE(later.cardinality == 4);

    BucketOutcome repeat = engine.assign(make_generalized_event(identifiers), contributors[0]);
    REQUIRE(repeat.status == AssignStatus::Released);
    REQUIRE(repeat.cardinality == 4);
}

TEST_CASE("Bucket_SeparateKeys", "[KAnonymity]") {
    MemoryAuditStore store;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(store, clock);
    ContributorHasher hasher = make_test_hasher();
    KAnonymityEngine engine(make_test_config(5), audit, clock, hasher);

    QuasiIdentifiers california = make_scenario_identifiers();
    QuasiIdentifiers newYork("28-37", "NY", "iOS", "1.0");

    REQUIRE(bucketKey(california) == bucketKey(make_scenario_identifiers()));
    REQUIRE(bucketKey(california) != bucketKey(newYork));

    engine.assign(make_generalized_event(california), "a");
    engine.assign(make_generalized_event(newYork), "b");
    REQUIRE(engine.bucket_count() == 2);
    REQUIRE(engine.pending_count() == 2);
}

TEST_CASE("Bucket_ExpiresAfterTimeout", "[KAnonymity]") {
    // three events, then silence for 24 hours and 1 minute
    MemoryAuditStore store;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(store, clock);
    ContributorHasher hasher = make_test_hasher();
    KAnonymityEngine engine(make_test_config(5), audit, clock, hasher);

    QuasiIdentifiers identifiers = make_scenario_identifiers();
    std::vector<std::string> contributors = make_contributors(hasher, 5);
    for (std::size_t i = 0; i < 3; ++i) engine.assign(make_generalized_event(identifiers), contributors[i]);

    clock.advance(std::chrono::hours(23));
    SweepReport early = engine.sweep();
    REQUIRE(early.expired_buckets == 0);
    REQUIRE(engine.pending_count() == 3);

    clock.advance(std::chrono::hours(1) + std::chrono::minutes(1));
    SweepReport report = engine.sweep();
    REQUIRE(report.expired_buckets == 1);
    REQUIRE(report.discarded_events == 3);
    REQUIRE(engine.pending_count() == 0);
    REQUIRE_FALSE(engine.state_of(identifiers).is_initialized());
    REQUIRE(audit.count(proto::EXPIRY) == 1);

    // nothing of the expired bucket carries over
    BucketOutcome fresh = engine.assign(make_generalized_event(identifiers), contributors[3]);
    REQUIRE(fresh.status == AssignStatus::Buffered);
    REQUIRE(fresh.cardinality == 1);
}

TEST_CASE("Bucket_FlushedEvicted", "[KAnonymity]") {
    MemoryAuditStore store;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(store, clock);
    ContributorHasher hasher = make_test_hasher();
    KAnonymityEngine engine(make_test_config(2), audit, clock, hasher);

    QuasiIdentifiers identifiers = make_scenario_identifiers();
    std::vector<std::string> contributors = make_contributors(hasher, 2);
    engine.assign(make_generalized_event(identifiers), contributors[0]);
    engine.assign(make_generalized_event(identifiers), contributors[1]);

    clock.advance(std::chrono::hours(25));
    SweepReport report = engine.sweep();
    REQUIRE(report.evicted_buckets == 1);
    REQUIRE(report.expired_buckets == 0);
    REQUIRE(engine.bucket_count() == 0);
    REQUIRE(audit.count(proto::EXPIRY) == 0);
}

TEST_CASE("Bucket_HaltAndPurge", "[KAnonymity]") {
    MemoryAuditStore store;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(store, clock);
    ContributorHasher hasher = make_test_hasher();
    KAnonymityEngine engine(make_test_config(5), audit, clock, hasher);

    std::vector<std::string> contributors = make_contributors(hasher, 5);
    for (std::size_t i = 0; i < 4; ++i)
        engine.assign(make_generalized_event(make_scenario_identifiers()), contributors[i]);

    engine.halt();
    BucketOutcome outcome = engine.assign(make_generalized_event(make_scenario_identifiers()), contributors[4]);
    REQUIRE(outcome.status == AssignStatus::Rejected);
    REQUIRE(outcome.released.empty());

    REQUIRE(engine.purge() == 4);
    REQUIRE(engine.pending_count() == 0);
    REQUIRE(engine.bucket_count() == 0);
}

TEST_CASE("Bucket_NoReleaseBelowK", "[KAnonymity]") {
    MemoryAuditStore store;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(store, clock);
    const std::uint32_t k = 40;
    KAnonymityEngine engine(make_test_config(k), audit, clock, ContributorHasher::withRandomSalt());

    QuasiIdentifierGeneralizer generalizer(18, "US");
    std::vector<std::string> regions = {"US-CA", "US-NY", "US-TX", "GB"};
    std::vector<std::string> platforms = {"ios", "android"};

    std::mt19937 random(20231114);
    std::uniform_int_distribution<int> age(16, 80);
    std::uniform_int_distribution<std::size_t> region(0, regions.size() - 1);
    std::uniform_int_distribution<std::size_t> platform(0, platforms.size() - 1);
    std::uniform_int_distribution<int> contributor(0, 300);

    // true distinct contributors per bucket, which the engine never sees
    std::map<std::uint64_t, std::set<std::string>> distinct;
    std::size_t released = 0;
    std::size_t releases = 0;
    for (int i = 0; i < 3000; ++i) {
        ContributorAttributes attributes = make_attributes(age(random), regions[region(random)],
                                                           platforms[platform(random)], "2.4.1");
        GeneralizedEvent event = make_generalized_event(generalizer.generalize(attributes));
        std::string token = "install-" + std::to_string(contributor(random));
        distinct[bucketKey(event.quasi_identifiers)].insert(token);

        BucketOutcome outcome = engine.assign(std::move(event), token);
        if (outcome.status == AssignStatus::Released) {
            REQUIRE(outcome.cardinality >= k);
            REQUIRE(distinct[outcome.key].size() >= k);
            released += outcome.released.size();
            ++releases;
        } else {
            REQUIRE(outcome.released.empty());
        }
    }
    REQUIRE(releases > 0);
    REQUIRE(released + engine.pending_count() == 3000);
}

TEST_CASE("Bucket_LargeKNeedsKContributors", "[KAnonymity]") {
    // k - 1 random contributors never release, whatever the salt
    const std::uint32_t k = 100;
    std::mt19937_64 random(4242);
    QuasiIdentifiers identifiers = make_scenario_identifiers();

    for (int trial = 0; trial < 200; ++trial) {
        MemoryAuditStore store;
        ManualClock clock(kTestEpochMillis);
        AuditLog audit(store, clock);
        KAnonymityEngine engine(make_test_config(k), audit, clock, ContributorHasher::withRandomSalt());

        for (std::uint32_t i = 0; i + 1 < k; ++i) {
            BucketOutcome outcome = engine.assign(make_generalized_event(identifiers),
                                                  "install-" + std::to_string(random()));
            REQUIRE(outcome.status == AssignStatus::Buffered);
        }
        REQUIRE(engine.pending_count() == k - 1);
    }
}

TEST_CASE("Bucket_ConcurrentProducers", "[KAnonymity]") {
    MemoryAuditStore store;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(store, clock);
    ContributorHasher hasher = make_test_hasher();
    KAnonymityEngine engine(make_test_config(5), audit, clock, hasher);

    const int producers = 8;
    const int eventsPerProducer = 50;
    std::vector<std::size_t> released(producers, 0);
    std::vector<std::thread> threads;

    for (int producer = 0; producer < producers; ++producer) {
        threads.emplace_back([&, producer]() {
            for (int i = 0; i < eventsPerProducer; ++i) {
                BucketOutcome outcome = engine.assign(make_generalized_event(make_scenario_identifiers()),
                                                      "producer-" + std::to_string(producer));
                released[producer] += outcome.released.size();
            }
        });
    }
    for (auto& thread : threads) thread.join();

    std::size_t total = engine.pending_count();
    for (std::size_t count : released) total += count;
    REQUIRE(total == producers * eventsPerProducer);
}

TEST_CASE("Budget_RejectsOverdraw", "[Budget]") {
    // ceiling 1.0: 0.8 is granted, 0.3 is not, 0.2 remains
    MemoryBudgetStore budgetStore;
    MemoryAuditStore auditStore;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(auditStore, clock);
    PrivacyBudgetManager budget(make_test_config(), budgetStore, audit, clock);

    REQUIRE(budget.remaining_epsilon() == Approx(1.0));
    REQUIRE(*budget.allocate(0.8) == Approx(0.8));
    REQUIRE_FALSE(budget.allocate(0.3));
    REQUIRE(budget.remaining_epsilon() == Approx(0.2));
    REQUIRE(budget.allocation_count() == 1);
    REQUIRE(audit.count(proto::ALLOCATION) == 1);
    // initial state plus the granted debit
    REQUIRE(budgetStore.get_commit_count() == 2);
}

TEST_CASE("Budget_Composition", "[Budget]") {
    MemoryBudgetStore budgetStore;
    MemoryAuditStore auditStore;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(auditStore, clock);
    PrivacyBudgetManager budget(make_test_config(), budgetStore, audit, clock);

    std::vector<double> requests = {0.05, 0.1, 0.01, 0.3, 0.25, 0.2, 0.15, 0.07};
    std::int64_t granted = 0;
    for (double request : requests) {
        boost::optional<double> epsilon = budget.allocate(request);
        if (epsilon) granted += toNanoEpsilon(*epsilon);
        REQUIRE(granted <= toNanoEpsilon(budget.ceiling()));
        REQUIRE(toNanoEpsilon(budget.remaining_epsilon()) == toNanoEpsilon(budget.ceiling()) - granted);
    }
    REQUIRE_FALSE(budget.allocate(0.15));
}

TEST_CASE("Budget_InvalidRequests", "[Budget]") {
    MemoryBudgetStore budgetStore;
    MemoryAuditStore auditStore;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(auditStore, clock);
    PrivacyBudgetManager budget(make_test_config(), budgetStore, audit, clock);

    REQUIRE_FALSE(budget.allocate(0.0));
    REQUIRE_FALSE(budget.allocate(-0.1));
    REQUIRE_FALSE(budget.allocate(std::nan("")));
    REQUIRE_FALSE(budget.allocate(0.0005));
    REQUIRE(budget.remaining_epsilon() == Approx(1.0));
    REQUIRE(budget.allocation_count() == 0);
}

TEST_CASE("Budget_Exhaustion", "[Budget]") {
    MemoryBudgetStore budgetStore;
    MemoryAuditStore auditStore;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(auditStore, clock);
    PrivacyBudgetManager budget(make_test_config(), budgetStore, audit, clock);

    REQUIRE(budget.allocate(0.9995));
    REQUIRE(budget.exhausted());
    REQUIRE_FALSE(budget.allocate(0.001));
    REQUIRE(budget.remaining_epsilon() == Approx(0.0005));
}

TEST_CASE("Budget_CommitFailure", "[Budget]") {
    MemoryBudgetStore budgetStore;
    MemoryAuditStore auditStore;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(auditStore, clock);
    PrivacyBudgetManager budget(make_test_config(), budgetStore, audit, clock);

    budgetStore.set_fail_commits(true);
    REQUIRE_FALSE(budget.allocate(0.2));
    REQUIRE(budget.remaining_epsilon() == Approx(1.0));
    REQUIRE(audit.count(proto::ALLOCATION) == 0);

    budgetStore.set_fail_commits(false);
    REQUIRE(budget.allocate(0.2));
    REQUIRE(budgetStore.load()->remaining_nano_epsilon() == toNanoEpsilon(0.8));
}

TEST_CASE("Budget_PersistsAcrossRestart", "[Budget]") {
    MemoryBudgetStore budgetStore;
    MemoryAuditStore auditStore;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(auditStore, clock);

    {
        PrivacyBudgetManager budget(make_test_config(), budgetStore, audit, clock);
        REQUIRE(budget.allocate(0.3));
    }
    PrivacyBudgetManager restarted(make_test_config(), budgetStore, audit, clock);
    REQUIRE(restarted.remaining_epsilon() == Approx(0.7));
    REQUIRE(restarted.allocation_count() == 1);

    // a lowered ceiling caps what remains; a raised one never refunds
    PrivacyBudgetManager lowered(make_test_config("epsilon_ceiling: 0.5"), budgetStore, audit, clock);
    REQUIRE(lowered.remaining_epsilon() == Approx(0.5));
    PrivacyBudgetManager raised(make_test_config("epsilon_ceiling: 2.0"), budgetStore, audit, clock);
    REQUIRE(raised.remaining_epsilon() == Approx(0.5));
}

TEST_CASE("Budget_FileStore", "[Budget]") {
    const std::string path = "private_analytics_budget_test.pb";
    std::remove(path.c_str());

    MemoryAuditStore auditStore;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(auditStore, clock);
    {
        FileBudgetStore store(path);
        REQUIRE_FALSE(store.load().is_initialized());
        PrivacyBudgetManager budget(make_test_config(), store, audit, clock);
        REQUIRE(budget.allocate(0.25));
    }
    {
        FileBudgetStore store(path);
        PrivacyBudgetManager budget(make_test_config(), store, audit, clock);
        REQUIRE(budget.remaining_epsilon() == Approx(0.75));
    }

    // an unreadable state never becomes a fresh budget
    {
        std::ofstream corrupt(path, std::ios::binary | std::ios::trunc);
        corrupt << "\xff\xff\xff\xff not a budget";
    }
    FileBudgetStore store(path);
    REQUIRE_THROWS_AS(PrivacyBudgetManager(make_test_config(), store, audit, clock), StorageFailure);
    std::remove(path.c_str());
}

TEST_CASE("Budget_CategoryExhaustion", "[Budget]") {
    MemoryBudgetStore budgetStore;
    MemoryAuditStore auditStore;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(auditStore, clock);
    PrivacyBudgetManager budget(make_test_config("epsilon_ceiling: 0.25"), budgetStore, audit, clock);

    REQUIRE(budget.recommended_epsilon(EventType::AssessmentCompleted) == Approx(0.1));
    REQUIRE(budget.allocate(SensitivityCategory::High));
    REQUIRE(budget.allocate(SensitivityCategory::High));
    REQUIRE_FALSE(budget.allocate(SensitivityCategory::High));
    REQUIRE(budget.category_exhausted(SensitivityCategory::High));

    // lower categories still fit in what remains
    REQUIRE_FALSE(budget.category_exhausted(SensitivityCategory::Low));
    REQUIRE(*budget.allocate(SensitivityCategory::Low) == Approx(0.01));
    REQUIRE(budget.remaining_epsilon() == Approx(0.04));
}

TEST_CASE("Budget_Reset", "[Budget]") {
    MemoryBudgetStore budgetStore;
    MemoryAuditStore auditStore;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(auditStore, clock);
    PrivacyBudgetManager budget(make_test_config("epsilon_ceiling: 0.15"), budgetStore, audit, clock);

    REQUIRE(budget.allocate(SensitivityCategory::High));
    REQUIRE_FALSE(budget.allocate(SensitivityCategory::High));

    REQUIRE(budget.reset("annual review"));
    REQUIRE(budget.remaining_epsilon() == Approx(0.15));
    REQUIRE_FALSE(budget.category_exhausted(SensitivityCategory::High));
    REQUIRE(budget.allocate(SensitivityCategory::High));
    REQUIRE(audit.count(proto::RESET) == 1);
    REQUIRE(budgetStore.load()->reset_count() == 1);
}

TEST_CASE("Budget_Halted", "[Budget]") {
    MemoryBudgetStore budgetStore;
    MemoryAuditStore auditStore;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(auditStore, clock);
    PrivacyBudgetManager budget(make_test_config(), budgetStore, audit, clock);

    budget.halt();
    REQUIRE(budget.halted());
    REQUIRE_FALSE(budget.allocate(0.1));
    REQUIRE(budget.remaining_epsilon() == Approx(1.0));
}

TEST_CASE("Budget_ConcurrentAllocation", "[Budget]") {
    MemoryBudgetStore budgetStore;
    MemoryAuditStore auditStore;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(auditStore, clock);
    PrivacyBudgetManager budget(make_test_config(), budgetStore, audit, clock);

    const int workers = 8;
    std::vector<int> granted(workers, 0);
    std::vector<std::thread> threads;
    for (int worker = 0; worker < workers; ++worker) {
        threads.emplace_back([&, worker]() {
            for (int i = 0; i < 200; ++i)
                if (budget.allocate(0.001)) ++granted[worker];
        });
    }
    for (auto& thread : threads) thread.join();

    int total = 0;
    for (int count : granted) total += count;
    REQUIRE(total == 1000);
    REQUIRE(budgetStore.load()->remaining_nano_epsilon() == 0);
    REQUIRE(budget.exhausted());
}

TEST_CASE("Audit_Sequence", "[Audit]") {
    MemoryAuditStore store;
    ManualClock clock(kTestEpochMillis);
    {
        AuditLog audit(store, clock);
        audit.record(proto::ALLOCATION, "epsilon=0.1");
        audit.record(proto::BLOCK, "PHIDetected category=clinical_terminology");
    }
    AuditLog resumed(store, clock);
    resumed.record(proto::RESET, "budget reset");

    std::vector<proto::AuditLogEntry> entries = resumed.entries();
    REQUIRE(entries.size() == 3);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        REQUIRE(entries[i].sequence() == i);
        REQUIRE(entries[i].timestamp_millis() == kTestEpochMillis);
    }
    REQUIRE(resumed.count(proto::BLOCK) == 1);
    REQUIRE(auditCategoryName(proto::BLOCK) == "BLOCK");
}

TEST_CASE("Audit_FileStore", "[Audit]") {
    const std::string path = "private_analytics_audit_test.log";
    std::remove(path.c_str());
    ManualClock clock(kTestEpochMillis);

    {
        FileAuditStore store(path);
        AuditLog audit(store, clock);
        audit.record(proto::EXPIRY, "bucket expired");
        audit.record(proto::SHUTDOWN, "emergency shutdown");
    }

    FileAuditStore store(path);
    std::vector<proto::AuditLogEntry> entries = store.entries();
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].category() == proto::EXPIRY);
    REQUIRE(entries[1].detail() == "emergency shutdown");
    REQUIRE(entries[1].sequence() == 1);
    std::remove(path.c_str());
}

TEST_CASE("Audit_FailedAppend", "[Audit]") {
    FailingAuditStore store;
    ManualClock clock(kTestEpochMillis);
    AuditLog audit(store, clock);

    audit.record(proto::BLOCK, "PHIDetected category=direct_identifier");
    REQUIRE(audit.failures() == 1);
}

TEST_CASE("Logging_Sink", "[Logging]") {
    std::vector<std::string> lines;
    setLogSink([&lines](LogLevel level, const std::string& component, const std::string& message) {
        lines.push_back(logLevelName(level) + " " + component + " " + message);
    });
    setLogLevel(LogLevel::Warning);

    logMessage(LogLevel::Info, "budget", "not shown");
    logMessage(LogLevel::Error, "budget", "shown");

    setLogLevel(LogLevel::Info);
    setLogSink(LogSink());

    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "ERROR budget shown");
}

TEST_CASE("EventTypes_Taxonomy", "[Types]") {
    REQUIRE(*parseEventType("assessment_completed") == EventType::AssessmentCompleted);
    REQUIRE_FALSE(parseEventType("mood_journal_entry").is_initialized());
    REQUIRE(eventTypeTag(EventType::CrisisIntervention) == "crisis_intervention_triggered");
    REQUIRE(categoryOf(EventType::ScreenView) == SensitivityCategory::Low);
    REQUIRE(categoryOf(EventType::SessionDuration) == SensitivityCategory::Medium);
    REQUIRE(categoryOf(EventType::CrisisIntervention) == SensitivityCategory::High);
    REQUIRE(isNumeric(FieldValue(2.)));
    REQUIRE_FALSE(isNumeric(FieldValue(std::string("5-10 min"))));
}
