#pragma once

#include "mcp/tool.h"
#include "mcp/tool_host_registry.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace live_relay {
namespace mcp {

struct ToolCallRequest {
    std::string server;
    std::string tool;
    nlohmann::json params = nlohmann::json::object();
};

using ToolCallCallback = std::function<void(const ToolCallResult&)>;

/**
 * @brief Runs tool calls on worker threads
 *
 * Keeps the controller's command loop responsive while a tool server takes
 * up to its request timeout to answer. Callbacks run on a worker thread.
 */
class ToolCallExecutor {
public:
    /**
     * @param registry Must outlive the executor
     * @param max_concurrent Number of worker threads
     */
    explicit ToolCallExecutor(ToolHostRegistry& registry, size_t max_concurrent = 1);

    /// Finishes queued calls, then joins the workers
    ~ToolCallExecutor();

    ToolCallExecutor(const ToolCallExecutor&) = delete;
    ToolCallExecutor& operator=(const ToolCallExecutor&) = delete;

    /**
     * @brief Queue a call
     * @return false after shutdown(); the callback is then not invoked
     */
    bool execute_async(const ToolCallRequest& request, ToolCallCallback callback);

    bool is_idle() const;
    size_t pending_count() const;

    /**
     * @brief Wait for queued and running calls to finish
     * @param timeout_ms 0 waits indefinitely
     * @return false on timeout
     */
    bool wait_for_completion(int timeout_ms = 0);

    /// Stop accepting calls; queued calls still run
    void shutdown();

private:
    struct CallTask {
        ToolCallRequest request;
        ToolCallCallback callback;
    };

    void worker_thread();
    void run_call(const CallTask& task);

    ToolHostRegistry& registry_;
    std::atomic<bool> running_;
    size_t active_calls_ = 0;  // guarded by queue_mutex_

    std::queue<CallTask> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;

    std::vector<std::thread> worker_threads_;
};

} // namespace mcp
} // namespace live_relay
