#include <catch2/catch_test_macros.hpp>
#include "sandbox/command_builder.hpp"

using namespace toolcage;
using Argv = std::vector<std::string>;

static GitCall git(const std::string& action) {
    GitCall call;
    call.action = action;
    return call;
}

static DockerCall docker(const std::string& action) {
    DockerCall call;
    call.action = action;
    return call;
}

// ── git ──────────────────────────────────────────────────────────

TEST_CASE("CommandBuilder: git read-only actions", "[builder]") {
    Argv argv;
    REQUIRE_FALSE(CommandBuilder::build_git(git("status"), argv).has_value());
    REQUIRE(argv == Argv{"git", "status"});
    REQUIRE_FALSE(CommandBuilder::build_git(git("log"), argv).has_value());
    REQUIRE(argv == Argv{"git", "log", "--oneline", "-10"});
    REQUIRE_FALSE(CommandBuilder::build_git(git("remote"), argv).has_value());
    REQUIRE(argv == Argv{"git", "remote", "-v"});
}

TEST_CASE("CommandBuilder: git add defaults to dot", "[builder]") {
    Argv argv;
    REQUIRE_FALSE(CommandBuilder::build_git(git("add"), argv).has_value());
    REQUIRE(argv == Argv{"git", "add", "--", "."});
}

TEST_CASE("CommandBuilder: git add lists files after separator", "[builder]") {
    auto call = git("add");
    call.files = {"a.txt", "src/b.cpp"};
    Argv argv;
    REQUIRE_FALSE(CommandBuilder::build_git(call, argv).has_value());
    REQUIRE(argv == Argv{"git", "add", "--", "a.txt", "src/b.cpp"});
}

TEST_CASE("CommandBuilder: commit message stays one element", "[builder]") {
    auto call = git("commit");
    call.message = "fix\"; rm -rf / #";
    Argv argv;
    REQUIRE_FALSE(CommandBuilder::build_git(call, argv).has_value());
    REQUIRE(argv.size() == 4);
    REQUIRE(argv[3] == "fix\"; rm -rf / #");
}

TEST_CASE("CommandBuilder: commit requires message", "[builder]") {
    Argv argv;
    auto err = CommandBuilder::build_git(git("commit"), argv);
    REQUIRE(err.has_value());
    REQUIRE(err->kind == ErrorKind::Validation);
    REQUIRE(err->message == "Git action 'commit' requires 'message'");
}

TEST_CASE("CommandBuilder: checkout requires branch", "[builder]") {
    Argv argv;
    auto err = CommandBuilder::build_git(git("checkout"), argv);
    REQUIRE(err.has_value());
    REQUIRE(err->message == "Git action 'checkout' requires 'branch'");
}

TEST_CASE("CommandBuilder: push with branch targets origin", "[builder]") {
    auto call = git("push");
    call.branch = "main";
    Argv argv;
    REQUIRE_FALSE(CommandBuilder::build_git(call, argv).has_value());
    REQUIRE(argv == Argv{"git", "push", "origin", "main"});
}

TEST_CASE("CommandBuilder: option-like values are rejected", "[builder]") {
    Argv argv;
    auto checkout = git("checkout");
    checkout.branch = "--orphan";
    REQUIRE(CommandBuilder::build_git(checkout, argv).has_value());

    auto add = git("add");
    add.files = {"-A"};
    REQUIRE(CommandBuilder::build_git(add, argv).has_value());

    auto logs = docker("logs");
    logs.service = "--help";
    REQUIRE(CommandBuilder::build_docker(logs, argv).has_value());
}

TEST_CASE("CommandBuilder: unknown git action is a policy error", "[builder]") {
    Argv argv;
    auto err = CommandBuilder::build_git(git("gc"), argv);
    REQUIRE(err.has_value());
    REQUIRE(err->kind == ErrorKind::Policy);
    REQUIRE(err->message.find("Git action not allowed: gc") == 0);
    REQUIRE(err->message.find("status") != std::string::npos);
}

// ── docker ───────────────────────────────────────────────────────

TEST_CASE("CommandBuilder: docker logs needs service", "[builder]") {
    Argv argv;
    auto err = CommandBuilder::build_docker(docker("logs"), argv);
    REQUIRE(err.has_value());
    REQUIRE(err->message == "Docker action 'logs' requires 'service'");

    auto call = docker("logs");
    call.service = "web";
    REQUIRE_FALSE(CommandBuilder::build_docker(call, argv).has_value());
    REQUIRE(argv == Argv{"docker", "logs", "--tail", "100", "web"});
}

TEST_CASE("CommandBuilder: compose_up detaches by default", "[builder]") {
    Argv argv;
    REQUIRE_FALSE(CommandBuilder::build_docker(docker("compose_up"), argv).has_value());
    REQUIRE(argv == Argv{"docker-compose", "up", "-d"});

    auto call = docker("compose_up");
    call.detach = false;
    REQUIRE_FALSE(CommandBuilder::build_docker(call, argv).has_value());
    REQUIRE(argv == Argv{"docker-compose", "up"});
}

TEST_CASE("CommandBuilder: compose_logs service is optional", "[builder]") {
    Argv argv;
    REQUIRE_FALSE(CommandBuilder::build_docker(docker("compose_logs"), argv).has_value());
    REQUIRE(argv == Argv{"docker-compose", "logs", "--tail", "100"});
}

TEST_CASE("CommandBuilder: unknown docker action is a policy error", "[builder]") {
    Argv argv;
    auto err = CommandBuilder::build_docker(docker("rm"), argv);
    REQUIRE(err.has_value());
    REQUIRE(err->kind == ErrorKind::Policy);
    REQUIRE(err->message.find("Docker action not allowed: rm") == 0);
}
