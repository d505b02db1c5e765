#include "core/task_group.h"
#include "logger.h"
#include <exception>

namespace live_relay {

const char* task_outcome_name(TaskOutcome outcome) {
    switch (outcome) {
        case TaskOutcome::Running:   return "running";
        case TaskOutcome::Completed: return "completed";
        case TaskOutcome::Cancelled: return "cancelled";
        case TaskOutcome::Failed:    return "failed";
        default: return "unknown";
    }
}

TaskGroup::TaskGroup(StopToken token) : token_(std::move(token)) {}

TaskGroup::~TaskGroup() {
    cancel();
    join_all();
}

void TaskGroup::set_on_finished(FinishedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_finished_ = std::move(callback);
}

void TaskGroup::spawn(const std::string& name, TaskFn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t index = reports_.size();
    TaskReport report;
    report.name = name;
    reports_.push_back(report);
    threads_.emplace_back([this, index, fn = std::move(fn)] { run_task(index, fn); });
}

void TaskGroup::run_task(size_t index, const TaskFn& fn) {
    TaskOutcome outcome = TaskOutcome::Completed;
    std::string error;
    std::string name;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        name = reports_[index].name;
    }
    Logger::set_thread_tag(name);

    try {
        fn(token_);
        if (token_.stop_requested()) {
            outcome = TaskOutcome::Cancelled;
        }
    } catch (const std::exception& e) {
        outcome = TaskOutcome::Failed;
        error = e.what();
    } catch (...) {
        outcome = TaskOutcome::Failed;
        error = "unknown exception";
    }

    TaskReport report;
    FinishedCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reports_[index].outcome = outcome;
        reports_[index].error = error;
        report = reports_[index];
        callback = on_finished_;
    }

    if (outcome == TaskOutcome::Failed) {
        Logger::error("Task failed: " + error);
    } else {
        Logger::debug(std::string("Task ") + task_outcome_name(outcome));
    }

    if (callback) {
        callback(report);
    }
}

void TaskGroup::cancel() {
    token_.request_stop();
}

void TaskGroup::join_all() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threads.swap(threads_);
    }
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

std::vector<TaskReport> TaskGroup::reports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reports_;
}

size_t TaskGroup::running_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& report : reports_) {
        if (report.outcome == TaskOutcome::Running) {
            ++count;
        }
    }
    return count;
}

} // namespace live_relay
