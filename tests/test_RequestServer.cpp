/**
 * serve 请求循环测试：固定工作线程池、重复 id、取消排队中的调用。
 */
#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/RequestServer.h"
#include "tools/ToolRegistry.h"

using namespace std::chrono_literals;

namespace {

// Records which worker thread ran each call.
class EchoTool : public ITool {
public:
  std::string getName() const override { return "echo"; }
  std::string getDescription() const override { return "Returns its arguments"; }
  nlohmann::json getSchema() const override { return {{"type", "object"}}; }

  nlohmann::json execute(const nlohmann::json& args, const CancellationToken&) override {
    {
      std::lock_guard<std::mutex> lock(mtx);
      threads.insert(std::this_thread::get_id());
    }
    return {{"content", {{{"type", "text"}, {"text", args.dump()}}}}};
  }

  size_t threadCount() {
    std::lock_guard<std::mutex> lock(mtx);
    return threads.size();
  }

private:
  std::mutex mtx;
  std::set<std::thread::id> threads;
};

// Blocks every call until opened or until the call's token is cancelled.
class GateTool : public ITool {
public:
  std::string getName() const override { return "gate"; }
  std::string getDescription() const override { return "Waits for the test to open it"; }
  nlohmann::json getSchema() const override { return {{"type", "object"}}; }

  nlohmann::json execute(const nlohmann::json&, const CancellationToken& cancel) override {
    std::unique_lock<std::mutex> lock(mtx);
    ++started;
    cv.notify_all();
    while (!open && !cancel.isCancelled()) {
      cv.wait_for(lock, 5ms);
    }
    if (cancel.isCancelled()) {
      return ToolRegistry::errorResponse("Operation cancelled", -32800, "cancelled");
    }
    return {{"content", {{{"type", "text"}, {"text", "opened"}}}}};
  }

  void release() {
    std::lock_guard<std::mutex> lock(mtx);
    open = true;
    cv.notify_all();
  }

  bool waitStarted(int n) {
    std::unique_lock<std::mutex> lock(mtx);
    return cv.wait_for(lock, 5s, [&] { return started >= n; });
  }

private:
  std::mutex mtx;
  std::condition_variable cv;
  int started = 0;
  bool open = false;
};

class Collector {
public:
  RequestServer::Sink sink() {
    return [this](const nlohmann::json& message) {
      {
        std::lock_guard<std::mutex> lock(mtx);
        messages.push_back(message);
      }
      cv.notify_all();
    };
  }

  bool waitFor(size_t n) {
    std::unique_lock<std::mutex> lock(mtx);
    return cv.wait_for(lock, 5s, [&] { return messages.size() >= n; });
  }

  std::vector<nlohmann::json> all() {
    std::lock_guard<std::mutex> lock(mtx);
    return messages;
  }

  nlohmann::json byId(const nlohmann::json& id) {
    std::lock_guard<std::mutex> lock(mtx);
    for (const auto& m : messages) {
      if (m["id"] == id) return m;
    }
    return nullptr;
  }

private:
  std::mutex mtx;
  std::condition_variable cv;
  std::vector<nlohmann::json> messages;
};

std::string callLine(int id, const std::string& tool) {
  return nlohmann::json{{"id", id}, {"method", "tools/call"}, {"params", {{"name", tool}, {"arguments", {{"n", id}}}}}}
      .dump();
}

} // namespace

class RequestServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto e = std::make_unique<EchoTool>();
    auto g = std::make_unique<GateTool>();
    echo = e.get();
    gate = g.get();
    registry.registerTool(std::move(e));
    registry.registerTool(std::move(g));
  }

  ToolRegistry registry;
  EchoTool* echo = nullptr;
  GateTool* gate = nullptr;
  Collector out;
};

TEST_F(RequestServerTest, ManyCallsShareTheWorkerPool) {
  RequestServer server(registry, out.sink(), 2);
  for (int i = 1; i <= 50; ++i) {
    server.handleLine(callLine(i, "echo"));
  }
  server.shutdown();

  ASSERT_EQ(out.all().size(), 50u);
  EXPECT_LE(echo->threadCount(), 2u);
  EXPECT_EQ(server.inFlight(), 0u);
  auto reply = out.byId(17);
  ASSERT_TRUE(reply.is_object());
  EXPECT_EQ(reply["result"]["content"][0]["text"], R"({"n":17})");
}

TEST_F(RequestServerTest, DuplicateInFlightIdIsRejected) {
  RequestServer server(registry, out.sink(), 2);
  server.handleLine(callLine(7, "gate"));
  ASSERT_TRUE(gate->waitStarted(1));

  server.handleLine(callLine(7, "gate"));
  ASSERT_TRUE(out.waitFor(1));
  auto rejected = out.all()[0];
  EXPECT_EQ(rejected["id"], 7);
  EXPECT_EQ(rejected["error"]["code"], -32600);
  EXPECT_EQ(server.inFlight(), 1u);

  // The original call is still the one a cancel reaches.
  server.handleLine(R"({"id": 8, "method": "cancel", "params": {"id": 7}})");
  ASSERT_TRUE(out.waitFor(2));
  auto finished = out.all()[1];
  EXPECT_EQ(finished["id"], 7);
  EXPECT_EQ(finished["result"]["isError"], true);
  EXPECT_EQ(finished["result"]["code"], -32800);

  server.shutdown();
  EXPECT_EQ(server.inFlight(), 0u);
  EXPECT_EQ(out.all().size(), 2u);
}

TEST_F(RequestServerTest, CancelReachesQueuedCall) {
  RequestServer server(registry, out.sink(), 1);
  server.handleLine(callLine(1, "gate"));
  ASSERT_TRUE(gate->waitStarted(1));
  // Only one worker, so call 2 waits in the queue.
  server.handleLine(callLine(2, "gate"));
  server.handleLine(R"({"id": 3, "method": "cancel", "params": {"id": 2}})");
  gate->release();

  ASSERT_TRUE(out.waitFor(2));
  server.shutdown();

  auto first = out.byId(1);
  EXPECT_EQ(first["result"]["content"][0]["text"], "opened");
  auto second = out.byId(2);
  EXPECT_EQ(second["result"]["code"], -32800);
}

TEST_F(RequestServerTest, ProtocolErrors) {
  RequestServer server(registry, out.sink(), 1);
  server.handleLine("{oops");
  server.handleLine(R"({"id": 1, "method": "tools/explode"})");
  server.handleLine("[1, 2]");
  server.handleLine("   ");
  server.handleLine(R"({"id": 2, "method": "tools/list"})");
  server.shutdown();

  auto messages = out.all();
  ASSERT_EQ(messages.size(), 4u);
  EXPECT_EQ(messages[0]["error"]["code"], -32700);
  EXPECT_TRUE(messages[0]["id"].is_null());
  EXPECT_EQ(messages[1]["error"]["code"], -32601);
  EXPECT_EQ(messages[1]["id"], 1);
  EXPECT_EQ(messages[2]["error"]["code"], -32600);
  EXPECT_EQ(messages[3]["result"]["tools"].size(), 2u);
}
