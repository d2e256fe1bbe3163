#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/CancellationToken.h"
#include "tools/ToolRegistry.h"

/**
 * @brief Line-delimited JSON request dispatcher behind `prism serve`.
 *
 * Requests:
 *   {"id": 1, "method": "tools/list"}
 *   {"id": 2, "method": "tools/call", "params": {"name": "type_hierarchy", "arguments": {...}}}
 *   {"id": 3, "method": "cancel", "params": {"id": 2}}
 *
 * tools/call requests are queued and run by a fixed set of worker threads,
 * each with its own cancellation token, so a later cancel line can reach a
 * running or still queued call. An id may be in flight only once.
 * Responses are {"id", "result"} or {"id", "error"}, passed to the sink one
 * at a time.
 */
class RequestServer {
public:
    using Sink = std::function<void(const nlohmann::json&)>;

    static constexpr size_t DEFAULT_WORKERS = 4;

    RequestServer(ToolRegistry& tools, Sink sink, size_t workerCount = DEFAULT_WORKERS);
    ~RequestServer();

    RequestServer(const RequestServer&) = delete;
    RequestServer& operator=(const RequestServer&) = delete;

    void handleLine(const std::string& line);

    // Runs every queued call to completion, then joins the workers.
    void shutdown();

    size_t inFlight() const;

private:
    struct Job {
        nlohmann::json id;
        std::string name;
        nlohmann::json arguments;
        std::shared_ptr<CancellationToken> token;
    };

    void dispatch(const nlohmann::json& request);
    void enqueueCall(const nlohmann::json& id, const nlohmann::json& params);
    void cancel(const nlohmann::json& id);
    void workerLoop();
    void send(const nlohmann::json& message);
    void sendError(const nlohmann::json& id, int code, const std::string& message);

    ToolRegistry& tools;
    Sink sink;

    std::mutex sinkMtx;
    mutable std::mutex mtx;
    std::condition_variable cv;
    std::deque<Job> queue;
    // Keyed by the dumped request id.
    std::map<std::string, std::shared_ptr<CancellationToken>> pending;
    bool stopping = false;
    std::vector<std::thread> workers;
};
