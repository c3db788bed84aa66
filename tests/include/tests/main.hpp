#ifndef PRIVATE_ANALYTICS_TESTS_MAIN_HPP
#define PRIVATE_ANALYTICS_TESTS_MAIN_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/optional/optional_io.hpp>

#include <analytics.pb.h>
#include <private_analytics/cardinality.hpp>
#include <private_analytics/clock.hpp>
#include <private_analytics/config.hpp>
#include <private_analytics/types.hpp>
#include <private_analytics_pipeline/transport.hpp>

// 2023-11-14T22:13:20Z
const std::int64_t kTestEpochMillis = 1700000000000;

private_analytics::Config make_test_config(std::uint32_t k = 5);
private_analytics::Config make_test_config(const std::string& text);

private_analytics::ContributorHasher make_test_hasher();

// tokens whose hashes land in distinct sketch registers, so small counts are exact
std::vector<std::string> make_contributors(const private_analytics::ContributorHasher& hasher, std::size_t count);

private_analytics::ContributorAttributes make_attributes(int age = 30, const std::string& location = "US-CA",
                                                         const std::string& platform = "ios",
                                                         const std::string& version = "1.0.3");

private_analytics::RawEvent make_raw_event(const std::string& type, const private_analytics::FieldMap& fields,
                                           const std::string& contributor);

private_analytics::GeneralizedEvent make_generalized_event(const private_analytics::QuasiIdentifiers& identifiers);

private_analytics::QuasiIdentifiers make_scenario_identifiers();

// passes every guarantee check with the default configuration
private_analytics::proto::AnonymizedEvent make_releasable_event(std::uint64_t cardinality = 5);

class RecordingTransport : public private_analytics::Transport {
    std::mutex _mutex;
    std::vector<std::unique_ptr<const private_analytics::proto::AnonymizedEvent>> _delivered;
public:
    // runs before each delivery is recorded; may throw to simulate a failed send
    std::function<void(const private_analytics::proto::AnonymizedEvent&)> on_deliver;

    void deliver(std::unique_ptr<const private_analytics::proto::AnonymizedEvent> event) override;

    std::size_t count();
    std::vector<private_analytics::proto::AnonymizedEvent> delivered();
};

// advances by a fixed step every time it is read
class SteppingClock : public private_analytics::Clock {
    std::mutex _mutex;
    private_analytics::TimePoint _now;
    std::chrono::milliseconds _step;
public:
    explicit SteppingClock(std::chrono::milliseconds step);
    private_analytics::TimePoint now() override;
};

#endif //PRIVATE_ANALYTICS_TESTS_MAIN_HPP
