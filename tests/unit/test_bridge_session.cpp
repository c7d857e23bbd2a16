#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "backend/backend_client.hpp"
#include "core/errors/bridge_errors.hpp"
#include "fake_backend.hpp"
#include "runtime/bridge_session.hpp"
#include "session/response_writer.hpp"
#include "tools/tool_dispatcher.hpp"
#include "tools/tool_registry.hpp"

namespace {

using bridge::core::errors::BridgeError;
using bridge::core::errors::ErrorCategory;
using bridge::core::errors::get_error;
using bridge::core::errors::get_value;
using bridge::core::errors::is_error;
using bridge::runtime::BridgeSession;
using bridge::session::ResponseWriter;
using bridge::testing::FakeBackend;
using bridge::tools::default_tool_entries;
using bridge::tools::ToolDispatcher;
using bridge::tools::ToolRegistry;
using nlohmann::json;

std::shared_ptr<const ToolDispatcher> make_dispatcher(
    std::shared_ptr<bridge::backend::BackendClient> backend) {
    auto registry = ToolRegistry::create(default_tool_entries());
    return std::make_shared<const ToolDispatcher>(get_value(registry), std::move(backend));
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

struct SessionRun {
    bridge::core::errors::Result<bridge::runtime::SessionStats> result;
    std::vector<std::string> lines;
};

SessionRun run_session(std::shared_ptr<bridge::backend::BackendClient> backend,
                       const std::string& input, std::size_t max_in_flight = 4) {
    std::istringstream in(input);
    std::ostringstream out;
    auto writer = std::make_shared<ResponseWriter>(out, nullptr);
    BridgeSession session(make_dispatcher(std::move(backend)), writer, max_in_flight);
    auto result = session.run(in);
    return SessionRun{result, split_lines(out.str())};
}

TEST(BridgeSessionTest, ExecuteTaskScenarioForwardsAndWrapsResult) {
    auto backend = std::make_shared<FakeBackend>(FakeBackend::reply({{"status", "ok"}}));
    auto run = run_session(backend, R"({"tool":"execute_task","arguments":{"cmd":"noop"}})" "\n");

    ASSERT_FALSE(is_error(run.result));
    ASSERT_EQ(run.lines.size(), 1u);
    EXPECT_EQ(run.lines[0], R"({"result":{"status":"ok"}})");
    EXPECT_EQ(backend->calls(), 1);
}

TEST(BridgeSessionTest, NotImplementedScenarioSkipsBackend) {
    auto backend = std::make_shared<FakeBackend>();
    auto run = run_session(backend, R"({"tool":"capture_screenshot","arguments":{}})" "\n");

    ASSERT_FALSE(is_error(run.result));
    ASSERT_EQ(run.lines.size(), 1u);
    EXPECT_EQ(run.lines[0], R"({"error":"capture_screenshot not implemented"})");
    EXPECT_EQ(backend->calls(), 0);
}

TEST(BridgeSessionTest, UnknownToolScenario) {
    auto backend = std::make_shared<FakeBackend>();
    auto run = run_session(backend, R"({"tool":"launch_rocket","arguments":{}})" "\n");

    ASSERT_EQ(run.lines.size(), 1u);
    EXPECT_EQ(run.lines[0], R"({"error":"Unknown tool: launch_rocket"})");
    EXPECT_EQ(backend->calls(), 0);
}

TEST(BridgeSessionTest, EchoRoundTripThroughWholePipeline) {
    auto backend = std::make_shared<FakeBackend>(FakeBackend::echo());
    auto run = run_session(backend, R"({"tool":"execute_task","arguments":{"a":1,"b":"x"}})" "\n");

    ASSERT_EQ(run.lines.size(), 1u);
    EXPECT_EQ(json::parse(run.lines[0]), json({{"result", {{"a", 1}, {"b", "x"}}}}));
}

TEST(BridgeSessionTest, MalformedLinesStillProduceOneLineEach) {
    auto backend = std::make_shared<FakeBackend>(FakeBackend::reply({{"status", "ok"}}));
    const std::string input =
        "\n"
        "not json at all\n"
        R"({"arguments":{}})" "\n"
        R"({"tool":"execute_task","arguments":{}})" "\n"
        "[1,2,3]";  // no trailing newline

    auto run = run_session(backend, input);
    ASSERT_FALSE(is_error(run.result));
    ASSERT_EQ(run.lines.size(), 5u);
    EXPECT_EQ(run.lines[0], R"({"error":"Empty request line"})");
    EXPECT_EQ(json::parse(run.lines[1]).at("error").get<std::string>().rfind("Invalid JSON: ", 0), 0u);
    EXPECT_EQ(run.lines[2], R"({"error":"Missing tool field"})");
    EXPECT_EQ(run.lines[3], R"({"result":{"status":"ok"}})");
    EXPECT_EQ(run.lines[4], R"({"error":"Request must be a JSON object"})");
    EXPECT_EQ(backend->calls(), 1);

    const auto& stats = get_value(run.result);
    EXPECT_EQ(stats.lines_in, 5u);
    EXPECT_EQ(stats.lines_out, 5u);
    EXPECT_EQ(stats.failures, 4u);
}

TEST(BridgeSessionTest, OutputOrderMatchesInputWhenBackendFinishesOutOfOrder) {
    auto backend = std::make_shared<FakeBackend>(FakeBackend::delayed_echo());
    std::string input;
    constexpr int kLines = 6;
    for (int i = 0; i < kLines; ++i) {
        json request = {{"tool", "execute_task"},
                        {"arguments", {{"id", i}, {"delay_ms", (kLines - i) * 40}}}};
        input += request.dump() + "\n";
        if (i == 2) {
            input += "garbage\n";
        }
    }

    auto run = run_session(backend, input, kLines);
    ASSERT_FALSE(is_error(run.result));
    ASSERT_EQ(run.lines.size(), static_cast<std::size_t>(kLines + 1));

    std::vector<int> ids;
    for (const auto& line : run.lines) {
        const auto parsed = json::parse(line);
        if (parsed.contains("result")) {
            ids.push_back(parsed.at("result").at("id").get<int>());
        } else {
            ids.push_back(-1);
        }
    }
    EXPECT_EQ(ids, (std::vector<int>{0, 1, 2, -1, 3, 4, 5}));
}

TEST(BridgeSessionTest, InFlightWorkIsBoundedButConcurrent) {
    // Each call blocks until two calls have been inside the backend together
    // once. A serial session never gets there and fails on the peak check.
    std::mutex mutex;
    std::condition_variable cv;
    int active = 0;
    int peak = 0;
    auto backend = std::make_shared<FakeBackend>(
        [&](const std::string&, const json& body) -> bridge::core::errors::Result<json> {
            std::unique_lock<std::mutex> lock(mutex);
            peak = std::max(peak, ++active);
            cv.notify_all();
            static_cast<void>(cv.wait_for(lock, std::chrono::seconds(5), [&] { return peak >= 2; }));
            --active;
            return body;
        });

    std::string input;
    for (int i = 0; i < 8; ++i) {
        input += R"({"tool":"execute_task","arguments":{"n":)" + std::to_string(i) + "}}\n";
    }

    auto run = run_session(backend, input, 3);
    ASSERT_FALSE(is_error(run.result));
    EXPECT_EQ(run.lines.size(), 8u);
    EXPECT_EQ(backend->calls(), 8);
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_GE(peak, 2);
    EXPECT_LE(peak, 3);
}

TEST(BridgeSessionTest, ProcessLineConvertsExceptionsToFailure) {
    auto backend = std::make_shared<FakeBackend>(
        [](const std::string&, const json&) -> bridge::core::errors::Result<json> {
            throw std::runtime_error("responder exploded");
        });
    std::ostringstream out;
    BridgeSession session(make_dispatcher(backend), std::make_shared<ResponseWriter>(out, nullptr));

    auto outcome = session.process_line(R"({"tool":"execute_task","arguments":{}})");
    ASSERT_TRUE(is_error(outcome));
    EXPECT_EQ(get_error(outcome).category, ErrorCategory::Internal);
    EXPECT_EQ(get_error(outcome).message, "Internal error: responder exploded");
}

TEST(BridgeSessionTest, LostOutputEndsSessionWithError) {
    auto backend = std::make_shared<FakeBackend>();
    std::istringstream in(R"({"tool":"capture_screenshot"})" "\n"
                          R"({"tool":"compare_images"})" "\n");
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    BridgeSession session(make_dispatcher(backend), std::make_shared<ResponseWriter>(out, nullptr));

    auto result = session.run(in);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "output_closed");
}

TEST(BridgeSessionTest, EmptyInputProducesNoOutput) {
    auto run = run_session(std::make_shared<FakeBackend>(), "");
    ASSERT_FALSE(is_error(run.result));
    EXPECT_TRUE(run.lines.empty());
    EXPECT_EQ(get_value(run.result).lines_in, 0u);
}

TEST(BridgeSessionTest, UnreachableBackendScenarioYieldsTransportError) {
    bridge::backend::CurlGlobalScope curl_scope;
    ASSERT_TRUE(curl_scope.ok());

    // Reserve a loopback port and release it so nothing listens there.
    const int fd = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ASSERT_EQ(bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len), 0);
    const int port = ntohs(addr.sin_port);
    static_cast<void>(close(fd));

    bridge::backend::BackendConfig config;
    config.base_url = "http://127.0.0.1:" + std::to_string(port);
    config.timeout_ms = 2000;
    config.connect_timeout_ms = 1000;
    auto backend = std::make_shared<bridge::backend::CurlBackendClient>(config);

    auto run = run_session(backend, R"({"tool":"execute_task","arguments":{"cmd":"noop"}})" "\n");
    ASSERT_FALSE(is_error(run.result));
    ASSERT_EQ(run.lines.size(), 1u);

    const auto response = json::parse(run.lines[0]);
    ASSERT_TRUE(response.contains("error"));
    EXPECT_FALSE(response.contains("result"));
    EXPECT_EQ(response.at("error").get<std::string>().rfind("Backend unreachable: ", 0), 0u);
}

}  // namespace
