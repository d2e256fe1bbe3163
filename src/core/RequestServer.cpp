#include "core/RequestServer.h"
#include <algorithm>
#include <utility>
#include "utils/Logger.h"

namespace {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
}

RequestServer::RequestServer(ToolRegistry& tools, Sink sink, size_t workerCount)
    : tools(tools), sink(std::move(sink)) {
    workerCount = std::max<size_t>(1, workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(&RequestServer::workerLoop, this);
    }
}

RequestServer::~RequestServer() {
    shutdown();
}

void RequestServer::handleLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) return;

    nlohmann::json request;
    try {
        request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        sendError(nullptr, PARSE_ERROR, std::string("Parse error: ") + e.what());
        return;
    }

    try {
        dispatch(request);
    } catch (const nlohmann::json::exception& e) {
        nlohmann::json id = request.is_object() ? request.value("id", nlohmann::json()) : nlohmann::json();
        sendError(id, INVALID_REQUEST, std::string("Invalid request: ") + e.what());
    }
}

void RequestServer::dispatch(const nlohmann::json& request) {
    nlohmann::json id = request.value("id", nlohmann::json());
    std::string method = request.value("method", "");
    nlohmann::json params = request.value("params", nlohmann::json::object());

    if (method == "tools/list") {
        send({{"id", id}, {"result", {{"tools", tools.listToolSchemas()}}}});
    } else if (method == "tools/call") {
        enqueueCall(id, params);
    } else if (method == "cancel") {
        cancel(params.value("id", nlohmann::json()));
    } else {
        sendError(id, METHOD_NOT_FOUND, "Method not found: " + method);
    }
}

void RequestServer::enqueueCall(const nlohmann::json& id, const nlohmann::json& params) {
    Job job;
    job.id = id;
    job.name = params.value("name", "");
    job.arguments = params.value("arguments", nlohmann::json::object());
    job.token = std::make_shared<CancellationToken>();

    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (stopping) return;
        accepted = pending.emplace(id.dump(), job.token).second;
        if (accepted) queue.push_back(std::move(job));
    }

    if (!accepted) {
        sendError(id, INVALID_REQUEST, "Request id " + id.dump() + " is already in flight");
        return;
    }
    cv.notify_one();
}

void RequestServer::cancel(const nlohmann::json& id) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = pending.find(id.dump());
    if (it != pending.end()) {
        it->second->cancel();
        Logger::getInstance().debug("Cancel requested for " + id.dump());
    }
}

void RequestServer::workerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mtx);
            cv.wait(lock, [this] { return stopping || !queue.empty(); });
            if (queue.empty()) return;
            job = std::move(queue.front());
            queue.pop_front();
        }

        nlohmann::json result = tools.executeTool(job.name, job.arguments, *job.token);

        {
            std::lock_guard<std::mutex> lock(mtx);
            pending.erase(job.id.dump());
        }
        send({{"id", job.id}, {"result", result}});
    }
}

void RequestServer::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (stopping) return;
        stopping = true;
    }
    cv.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) worker.join();
    }
}

size_t RequestServer::inFlight() const {
    std::lock_guard<std::mutex> lock(mtx);
    return pending.size();
}

void RequestServer::send(const nlohmann::json& message) {
    std::lock_guard<std::mutex> lock(sinkMtx);
    sink(message);
}

void RequestServer::sendError(const nlohmann::json& id, int code, const std::string& message) {
    send({{"id", id}, {"error", {{"code", code}, {"message", message}}}});
}
