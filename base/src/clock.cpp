#include "../include/private_analytics/clock.hpp"

namespace private_analytics {

TimePoint SystemClock::now() {
    return std::chrono::system_clock::now();
}

ManualClock::ManualClock(std::int64_t start_millis) : _millis(start_millis) {}

TimePoint ManualClock::now() {
    return TimePoint(std::chrono::milliseconds(this->_millis.load()));
}

void ManualClock::advance(std::chrono::milliseconds delta) {
    this->_millis += delta.count();
}

void ManualClock::set(TimePoint point) {
    this->_millis = toMillis(point);
}

std::int64_t toSeconds(TimePoint point) {
    return std::chrono::duration_cast<std::chrono::seconds>(point.time_since_epoch()).count();
}

std::int64_t toMillis(TimePoint point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(point.time_since_epoch()).count();
}

} // namespace private_analytics
