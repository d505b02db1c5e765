#include "mcp/tool_call_executor.h"
#include "logger.h"
#include <chrono>

namespace live_relay {
namespace mcp {

ToolCallExecutor::ToolCallExecutor(ToolHostRegistry& registry, size_t max_concurrent)
    : registry_(registry), running_(true) {
    if (max_concurrent == 0) {
        max_concurrent = 1;
    }
    for (size_t i = 0; i < max_concurrent; ++i) {
        worker_threads_.emplace_back(&ToolCallExecutor::worker_thread, this);
    }
}

ToolCallExecutor::~ToolCallExecutor() {
    shutdown();

    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

bool ToolCallExecutor::execute_async(const ToolCallRequest& request, ToolCallCallback callback) {
    if (!running_) {
        Logger::warn("[MCP] Executor is shut down, dropping call " + request.server + "/" + request.tool);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_queue_.push(CallTask{request, std::move(callback)});
    }
    queue_cv_.notify_one();
    return true;
}

bool ToolCallExecutor::is_idle() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.empty() && active_calls_ == 0;
}

size_t ToolCallExecutor::pending_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.size() + active_calls_;
}

bool ToolCallExecutor::wait_for_completion(int timeout_ms) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    auto idle = [this] { return task_queue_.empty() && active_calls_ == 0; };
    if (timeout_ms > 0) {
        return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
    }
    idle_cv_.wait(lock, idle);
    return true;
}

void ToolCallExecutor::shutdown() {
    running_ = false;
    queue_cv_.notify_all();
}

void ToolCallExecutor::worker_thread() {
    Logger::set_thread_tag("tool_call");
    while (true) {
        CallTask task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return !task_queue_.empty() || !running_;
            });

            if (task_queue_.empty()) {
                break;  // shut down and drained
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
            active_calls_++;
        }

        run_call(task);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_calls_--;
        }
        idle_cv_.notify_all();
    }
}

void ToolCallExecutor::run_call(const CallTask& task) {
    const auto& request = task.request;
    Logger::debug("[MCP] Executing " + request.server + "/" + request.tool);
    auto start = std::chrono::steady_clock::now();

    ToolCallResult result;
    try {
        result = registry_.execute_tool(request.server, request.tool, request.params);
    } catch (const std::exception& e) {
        Logger::error("[MCP] Exception in " + request.server + "/" + request.tool + ": " + e.what());
        result = ToolCallResult::error_result(request.server, request.tool, e.what());
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    Logger::debug("[MCP] " + request.server + "/" + request.tool + " finished in " +
                  std::to_string(elapsed) + "ms (" + (result.success ? "ok" : result.error) + ")");

    if (task.callback) {
        try {
            task.callback(result);
        } catch (const std::exception& e) {
            Logger::error(std::string("[MCP] Tool result callback threw: ") + e.what());
        }
    }
}

} // namespace mcp
} // namespace live_relay
