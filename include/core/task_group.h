#pragma once

/**
 * @file task_group.h
 * @brief Named worker threads sharing one stop token
 */

#include "core/stop_token.h"
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace live_relay {

enum class TaskOutcome {
    Running,
    Completed,   ///< returned on its own
    Cancelled,   ///< returned after stop was requested
    Failed       ///< threw; error holds the reason
};

const char* task_outcome_name(TaskOutcome outcome);

struct TaskReport {
    std::string name;
    TaskOutcome outcome = TaskOutcome::Running;
    std::string error;
};

/**
 * @brief Owns a set of task threads and records how each one ended
 *
 * Exceptions escaping a task are caught on its thread, logged with the task
 * name and recorded as Failed. Returning after stop was requested counts as
 * Cancelled, not as an error. The finished callback runs on the task's own
 * thread and must not join the group.
 */
class TaskGroup {
public:
    using TaskFn = std::function<void(const StopToken&)>;
    using FinishedCallback = std::function<void(const TaskReport&)>;

    explicit TaskGroup(StopToken token);
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void set_on_finished(FinishedCallback callback);

    void spawn(const std::string& name, TaskFn fn);

    /// Request cooperative stop of every task.
    void cancel();

    /// Wait for every spawned task to return.
    void join_all();

    std::vector<TaskReport> reports() const;
    size_t running_count() const;

    const StopToken& token() const { return token_; }

private:
    void run_task(size_t index, const TaskFn& fn);

    StopToken token_;
    FinishedCallback on_finished_;
    mutable std::mutex mutex_;
    std::vector<TaskReport> reports_;
    std::vector<std::thread> threads_;
};

} // namespace live_relay
