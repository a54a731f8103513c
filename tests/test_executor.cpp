#include <catch2/catch_test_macros.hpp>
#include "executor.hpp"
#include "config.hpp"
#include "mock_http_client.hpp"
#include "recording_process_runner.hpp"
#include <filesystem>
#include <thread>
#include <type_traits>
#include <unistd.h>

using namespace toolcage;
namespace fs = std::filesystem;

static std::string make_temp_dir() {
    auto path = fs::temp_directory_path() / "toolcage_exec_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

struct ExecutorFixture {
    std::string dir = make_temp_dir();
    Config config;
    RecordingProcessRunner runner;
    MockHttpClient http;

    ExecutorFixture() { config.workspace = dir; }
    ~ExecutorFixture() { fs::remove_all(dir); }
};

TEST_CASE("ToolExecutor: neither copyable nor movable", "[executor]") {
    REQUIRE_FALSE(std::is_copy_constructible_v<ToolExecutor>);
    REQUIRE_FALSE(std::is_copy_assignable_v<ToolExecutor>);
    REQUIRE_FALSE(std::is_move_constructible_v<ToolExecutor>);
    REQUIRE_FALSE(std::is_move_assignable_v<ToolExecutor>);
}

TEST_CASE("ToolExecutor: workspace must exist", "[executor]") {
    ExecutorFixture f;
    f.config.workspace = f.dir + "/missing";
    REQUIRE_THROWS(ToolExecutor(f.config, f.runner, f.http));
}

TEST_CASE("ToolExecutor: unknown tool", "[executor]") {
    ExecutorFixture f;
    ToolExecutor executor(f.config, f.runner, f.http);
    auto result = executor.execute("teleport", {{"to", "mars"}});
    REQUIRE(result.is_error());
    REQUIRE(result.error().kind == ErrorKind::UnknownTool);
    REQUIRE(result.to_json() == nlohmann::json{{"error", "Unknown tool: teleport"}});
}

TEST_CASE("ToolExecutor: non-object arguments are rejected", "[executor]") {
    ExecutorFixture f;
    ToolExecutor executor(f.config, f.runner, f.http);
    auto result = executor.execute("read_file", nlohmann::json::array({"a"}));
    REQUIRE(result.is_error());
    REQUIRE(result.error().kind == ErrorKind::Validation);
}

TEST_CASE("ToolExecutor: wrongly typed field is rejected", "[executor]") {
    ExecutorFixture f;
    ToolExecutor executor(f.config, f.runner, f.http);
    auto result = executor.execute("write_file", {{"path", 42}, {"content", "x"}});
    REQUIRE(result.is_error());
    REQUIRE(result.error().kind == ErrorKind::Validation);
}

TEST_CASE("ToolExecutor: write, list and read through dispatch", "[executor]") {
    ExecutorFixture f;
    ToolExecutor executor(f.config, f.runner, f.http);

    auto written = executor.execute("write_file", {{"path", "notes/todo.txt"},
                                                   {"content", "buy peanuts\n"}});
    REQUIRE_FALSE(written.is_error());
    REQUIRE_FALSE(written.to_json().contains("error"));

    auto listed = executor.execute("list_directory", {{"path", "notes"}});
    REQUIRE_FALSE(listed.is_error());
    REQUIRE(listed.payload()["items"][0]["name"] == "todo.txt");

    auto read = executor.execute("read_file", {{"path", "notes/todo.txt"}});
    REQUIRE_FALSE(read.is_error());
    REQUIRE(read.payload()["content"] == "buy peanuts\n");
}

TEST_CASE("ToolExecutor: traversal is blocked for every file tool", "[executor]") {
    ExecutorFixture f;
    ToolExecutor executor(f.config, f.runner, f.http);

    for (const char* tool : {"read_file", "list_directory"}) {
        auto result = executor.execute(tool, {{"path", "../../etc"}});
        REQUIRE(result.is_error());
        REQUIRE(result.error().kind == ErrorKind::Confinement);
    }
    auto write = executor.execute("write_file", {{"path", "../x.txt"}, {"content", "x"}});
    REQUIRE(write.is_error());
    REQUIRE(write.error().kind == ErrorKind::Confinement);
}

TEST_CASE("ToolExecutor: shell goes through policy then runner", "[executor]") {
    ExecutorFixture f;
    f.runner.next_output = ProcessOutput{"file.txt\n", "", 0, true};
    ToolExecutor executor(f.config, f.runner, f.http);

    auto blocked = executor.execute("shell", {{"cmd", "sudo ls"}});
    REQUIRE(blocked.is_error());
    REQUIRE(f.runner.commands.empty());

    auto result = executor.execute("shell", {{"cmd", "ls -la"}});
    REQUIRE_FALSE(result.is_error());
    REQUIRE(std::get<ShellCommand>(f.runner.commands.back()).line == "ls -la");
    REQUIRE(f.runner.last_dir == executor.path_guard().root());
    REQUIRE(f.runner.last_timeout == std::chrono::seconds(f.config.timeouts.shell));
    REQUIRE(result.payload()["stdout"] == "file.txt\n");
}

TEST_CASE("ToolExecutor: git files may be a whitespace-separated string", "[executor]") {
    ExecutorFixture f;
    ToolExecutor executor(f.config, f.runner, f.http);

    auto result = executor.execute("git", {{"action", "add"}, {"files", "a.txt b.txt"}});
    REQUIRE_FALSE(result.is_error());
    REQUIRE(f.runner.last_argv() ==
            std::vector<std::string>{"git", "add", "--", "a.txt", "b.txt"});
}

TEST_CASE("ToolExecutor: docker uses its own timeout", "[executor]") {
    ExecutorFixture f;
    f.config.timeouts.docker = 90;
    ToolExecutor executor(f.config, f.runner, f.http);

    REQUIRE_FALSE(executor.execute("docker", {{"action", "images"}}).is_error());
    REQUIRE(f.runner.last_timeout == std::chrono::seconds(90));
}

TEST_CASE("ToolExecutor: http_request uses the injected client", "[executor]") {
    ExecutorFixture f;
    f.http.next_response.status_code = 200;
    f.http.next_response.body = R"({"pong":true})";
    ToolExecutor executor(f.config, f.runner, f.http);

    auto result = executor.execute("http_request",
                                   {{"method", "get"}, {"url", "http://localhost/ping"}});
    REQUIRE_FALSE(result.is_error());
    REQUIRE(result.payload()["body"]["pong"] == true);
}

TEST_CASE("ToolExecutor: null arguments behave like an empty object", "[executor]") {
    ExecutorFixture f;
    ToolExecutor executor(f.config, f.runner, f.http);
    auto result = executor.execute("git", nullptr);
    REQUIRE(result.is_error());
    REQUIRE(result.error().message == "Missing required parameter: action");
}

TEST_CASE("ToolExecutor: concurrent writes to distinct files", "[executor]") {
    ExecutorFixture f;
    ToolExecutor executor(f.config, f.runner, f.http);

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&executor, i]() {
            executor.execute("write_file", {{"path", "t/" + std::to_string(i) + ".txt"},
                                            {"content", std::to_string(i)}});
        });
    }
    for (auto& t : threads) t.join();

    auto listed = executor.execute("list_directory", {{"path", "t"}});
    REQUIRE_FALSE(listed.is_error());
    REQUIRE(listed.payload()["count"] == 8);
}

TEST_CASE("ToolExecutor::tool_specs: seven function schemas", "[executor]") {
    auto specs = ToolExecutor::tool_specs();
    REQUIRE(specs.size() == 7);
    std::vector<std::string> names;
    for (const auto& spec : specs) {
        REQUIRE(spec["type"] == "function");
        REQUIRE(spec["function"]["parameters"]["type"] == "object");
        names.push_back(spec["function"]["name"].get<std::string>());
    }
    REQUIRE(names == std::vector<std::string>{"shell", "read_file", "write_file",
                                              "list_directory", "http_request", "git",
                                              "docker"});
}

TEST_CASE("tool_call_name: names each call", "[executor]") {
    ToolCall call;
    REQUIRE_FALSE(parse_tool_call("list_directory", {{"path", "."}}, call).has_value());
    REQUIRE(tool_call_name(call) == "list_directory");
    REQUIRE_FALSE(parse_tool_call("warp", nlohmann::json::object(), call).has_value());
    REQUIRE(tool_call_name(call) == "warp");
}
