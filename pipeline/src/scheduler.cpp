#include "../include/private_analytics_pipeline/scheduler.hpp"

#include <exception>
#include <stdexcept>

#include <private_analytics/logging.hpp>

namespace private_analytics {

Scheduler::Scheduler(Clock& clock) : _clock(clock) {}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::add_task(const std::string& name, std::chrono::milliseconds period, std::function<void()> action) {
    if (period.count() <= 0)
        throw std::invalid_argument("task period must be positive: " + name);

    std::lock_guard<std::mutex> lock(this->_mutex);
    Task task;
    task.name = name;
    task.period = period;
    task.action = std::move(action);
    task.next_due = this->_clock.now() + period;
    this->_tasks.push_back(std::move(task));
}

void Scheduler::set_pressure_check(std::function<bool()> check) {
    std::lock_guard<std::mutex> lock(this->_mutex);
    this->_under_pressure = std::move(check);
}

std::size_t Scheduler::run_due() {
    std::lock_guard<std::mutex> lock(this->_mutex);
    TimePoint now = this->_clock.now();
    std::size_t ran = 0;

    for (auto& task : this->_tasks) {
        if (now < task.next_due) continue;

        // a missed period is not replayed
        while (task.next_due <= now) task.next_due += task.period;

        if (this->_under_pressure && this->_under_pressure()) {
            ++task.skips;
            logMessage(LogLevel::Debug, "scheduler", "skipped " + task.name + " under resource pressure");
            continue;
        }

        try {
            task.action();
        } catch (const std::exception& error) {
            logMessage(LogLevel::Error, "scheduler", task.name + " failed: " + error.what());
        }
        ++task.runs;
        ++ran;
    }
    return ran;
}

void Scheduler::start(std::chrono::milliseconds poll_interval) {
    std::lock_guard<std::mutex> lock(this->_loop_mutex);
    if (this->_thread.joinable()) return;
    this->_stopping = false;

    this->_thread = std::thread([this, poll_interval]() {
        std::unique_lock<std::mutex> loop(this->_loop_mutex);
        while (!this->_stopping) {
            loop.unlock();
            run_due();
            loop.lock();
            this->_wake.wait_for(loop, poll_interval, [this]() { return this->_stopping; });
        }
    });
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(this->_loop_mutex);
        this->_stopping = true;
        this->_wake.notify_all();
    }
    if (this->_thread.joinable() && this->_thread.get_id() != std::this_thread::get_id())
        this->_thread.join();
}

const Scheduler::Task* Scheduler::find(const std::string& name) const {
    for (const auto& task : this->_tasks)
        if (task.name == name) return &task;
    return nullptr;
}

std::size_t Scheduler::run_count(const std::string& name) {
    std::lock_guard<std::mutex> lock(this->_mutex);
    const Task* task = find(name);
    return task ? task->runs : 0;
}

std::size_t Scheduler::skip_count(const std::string& name) {
    std::lock_guard<std::mutex> lock(this->_mutex);
    const Task* task = find(name);
    return task ? task->skips : 0;
}

std::size_t Scheduler::task_count() {
    std::lock_guard<std::mutex> lock(this->_mutex);
    return this->_tasks.size();
}

} // namespace private_analytics
