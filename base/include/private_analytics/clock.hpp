#ifndef PRIVATE_ANALYTICS_CLOCK_HPP
#define PRIVATE_ANALYTICS_CLOCK_HPP

#include <atomic>
#include <chrono>
#include <cstdint>

namespace private_analytics {

typedef std::chrono::system_clock::time_point TimePoint;

class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() override;
};

// advanced explicitly; lets timeouts and schedules be tested without waiting
class ManualClock : public Clock {
    std::atomic<std::int64_t> _millis;
public:
    explicit ManualClock(std::int64_t start_millis = 0);
    TimePoint now() override;
    void advance(std::chrono::milliseconds delta);
    void set(TimePoint point);
};

std::int64_t toSeconds(TimePoint point);
std::int64_t toMillis(TimePoint point);

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_CLOCK_HPP
