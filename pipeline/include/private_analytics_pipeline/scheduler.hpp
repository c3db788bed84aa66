#ifndef PRIVATE_ANALYTICS_PIPELINE_SCHEDULER_HPP
#define PRIVATE_ANALYTICS_PIPELINE_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <private_analytics/clock.hpp>

namespace private_analytics {

// One cooperative loop owning every periodic background task. Tasks never
// overlap and run in registration order when several are due together.
class Scheduler {
    struct Task {
        std::string name;
        std::chrono::milliseconds period;
        std::function<void()> action;
        TimePoint next_due;
        std::size_t runs = 0;
        std::size_t skips = 0;
    };

    Clock& _clock;
    std::mutex _mutex;
    std::vector<Task> _tasks;
    std::function<bool()> _under_pressure;

    std::mutex _loop_mutex;
    std::condition_variable _wake;
    bool _stopping = false;
    std::thread _thread;

    const Task* find(const std::string& name) const;
public:
    explicit Scheduler(Clock& clock);
    ~Scheduler();

    // first run is due one period after registration
    void add_task(const std::string& name, std::chrono::milliseconds period, std::function<void()> action);

    // while the predicate holds, due tasks are skipped until their next period
    void set_pressure_check(std::function<bool()> check);

    // runs every task due at the clock's current time; returns how many ran
    std::size_t run_due();

    void start(std::chrono::milliseconds poll_interval);
    void stop();

    std::size_t run_count(const std::string& name);
    std::size_t skip_count(const std::string& name);
    std::size_t task_count();
};

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_PIPELINE_SCHEDULER_HPP
