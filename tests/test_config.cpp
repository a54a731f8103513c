#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <algorithm>
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace toolcage;

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "toolcage_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

static const char* const kEnvVars[] = {
    "WORK_DIR", "TOOLCAGE_WORK_DIR", "TOOLCAGE_MODEL",
    "TOOLCAGE_CACHE_ENABLED", "TOOLCAGE_CACHE_DIR", "TOOLCAGE_CACHE_TTL",
    "TOOLCAGE_SHELL_TIMEOUT", "TOOLCAGE_DOCKER_TIMEOUT",
};

// Points HOME at a temp dir and clears every override variable
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        for (const char* name : kEnvVars) unsetenv(name);
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        for (const char* name : kEnvVars) unsetenv(name);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.toolcage/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.toolcage");
        std::ofstream f(config_path());
        f << content;
    }
};

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values", "[config]") {
    Config cfg;
    REQUIRE(cfg.workspace.empty());
    REQUIRE(cfg.model == "qwen2.5:7b");
    REQUIRE(cfg.timeouts.shell == 30);
    REQUIRE(cfg.timeouts.docker == 60);
    REQUIRE(cfg.security.reject_command_chaining);
    REQUIRE(cfg.security.max_file_size == 10 * 1024 * 1024);
    REQUIRE(cfg.cache.enabled);
    REQUIRE(cfg.cache.ttl == 3600);
}

TEST_CASE("SecurityConfig: default allowlist and patterns", "[config]") {
    SecurityConfig sec;
    REQUIRE(sec.allowed_commands.count("ls") == 1);
    REQUIRE(sec.allowed_commands.count("git") == 1);
    REQUIRE(sec.allowed_commands.count("rm") == 0);
    REQUIRE(std::find(sec.forbidden_patterns.begin(), sec.forbidden_patterns.end(),
                      "rm -rf") != sec.forbidden_patterns.end());
}

TEST_CASE("Config::defaults_json: round-trips through from_json", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    Config plain;
    REQUIRE(cfg.model == plain.model);
    REQUIRE(cfg.security.allowed_commands == plain.security.allowed_commands);
    REQUIRE(cfg.security.forbidden_patterns == plain.security.forbidden_patterns);
    REQUIRE(cfg.security.max_output_bytes == plain.security.max_output_bytes);
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every section", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "workspace": "/srv/agent",
        "model": "llama3",
        "timeouts": { "shell": 5, "git": 7, "docker": 120, "http": 9 },
        "security": {
            "allowed_commands": ["ls", "sleep"],
            "forbidden_patterns": ["secret"],
            "reject_command_chaining": false,
            "max_file_size": 1024,
            "max_output_bytes": 512
        },
        "cache": { "enabled": false, "dir": "/var/cache/tc", "ttl": 60 }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.workspace == "/srv/agent");
    REQUIRE(cfg.model == "llama3");
    REQUIRE(cfg.timeouts.shell == 5);
    REQUIRE(cfg.timeouts.git == 7);
    REQUIRE(cfg.timeouts.docker == 120);
    REQUIRE(cfg.timeouts.http == 9);
    REQUIRE(cfg.security.allowed_commands == std::set<std::string>{"ls", "sleep"});
    REQUIRE(cfg.security.forbidden_patterns == std::vector<std::string>{"secret"});
    REQUIRE_FALSE(cfg.security.reject_command_chaining);
    REQUIRE(cfg.security.max_file_size == 1024);
    REQUIRE(cfg.security.max_output_bytes == 512);
    REQUIRE_FALSE(cfg.cache.enabled);
    REQUIRE(cfg.cache.dir == "/var/cache/tc");
    REQUIRE(cfg.cache.ttl == 60);
}

TEST_CASE("Config::from_json: in-memory integers are accepted", "[config]") {
    nlohmann::json j;
    j["timeouts"]["shell"] = 12;
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.timeouts.shell == 12);
}

TEST_CASE("Config::from_json: invalid values keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "model": 42,
        "timeouts": { "shell": -5, "docker": "slow" },
        "cache": { "enabled": "yes" }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.model == "qwen2.5:7b");
    REQUIRE(cfg.timeouts.shell == 30);
    REQUIRE(cfg.timeouts.docker == 60);
    REQUIRE(cfg.cache.enabled);
}

TEST_CASE("Config::from_json: out-of-range and zero timeouts keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "timeouts": { "shell": 0, "git": 4294967296, "docker": 18446744073709551615 },
        "security": { "max_output_bytes": 5000000000 },
        "cache": { "ttl": 0 }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.timeouts.shell == 30);
    REQUIRE(cfg.timeouts.git == 30);
    REQUIRE(cfg.timeouts.docker == 60);
    REQUIRE(cfg.security.max_output_bytes == 65536);
    REQUIRE(cfg.cache.ttl == 0);
}

TEST_CASE("Config::from_json: largest uint32 value is accepted", "[config]") {
    nlohmann::json j;
    j["timeouts"]["http"] = 4294967295u;
    REQUIRE(Config::from_json(j).timeouts.http == 4294967295u);
}

TEST_CASE("Config::from_json: non-object yields defaults", "[config]") {
    Config cfg = Config::from_json(nlohmann::json::array());
    REQUIRE(cfg.model == "qwen2.5:7b");
}

// ── Derived paths ────────────────────────────────────────────────

TEST_CASE("Config::workspace_root: falls back to current directory", "[config]") {
    Config cfg;
    REQUIRE(cfg.workspace_root() == std::filesystem::current_path().string());
    cfg.workspace = "/srv/agent";
    REQUIRE(cfg.workspace_root() == "/srv/agent");
}

TEST_CASE("Config::cache_dir: defaults under the workspace", "[config]") {
    Config cfg;
    cfg.workspace = "/srv/agent";
    REQUIRE(cfg.cache_dir() == "/srv/agent/.toolcage_cache");
    cfg.cache.dir = "/tmp/elsewhere";
    REQUIRE(cfg.cache_dir() == "/tmp/elsewhere");
}

// ── load ─────────────────────────────────────────────────────────

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "workspace": "/srv/agent",
        "model": "llama3",
        "timeouts": { "shell": 10 }
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.workspace == "/srv/agent");
    REQUIRE(cfg.model == "llama3");
    REQUIRE(cfg.timeouts.shell == 10);
    REQUIRE(cfg.timeouts.docker == 60);
}

TEST_CASE("Config::load: missing file creates defaults", "[config]") {
    ConfigTestGuard g;
    Config cfg = Config::load();
    REQUIRE(cfg.model == "qwen2.5:7b");
    REQUIRE(std::filesystem::exists(g.config_path()));

    std::ifstream f(g.config_path());
    auto written = nlohmann::json::parse(f);
    REQUIRE(written == Config::defaults_json());
}

TEST_CASE("Config::load: partial file gains new defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"model": "llama3"})");
    Config::load();

    std::ifstream f(g.config_path());
    auto migrated = nlohmann::json::parse(f);
    REQUIRE(migrated["model"] == "llama3");
    REQUIRE(migrated.contains("security"));
    REQUIRE(migrated["cache"]["ttl"] == 3600);
}

TEST_CASE("Config::load: malformed file yields defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("{ not json");
    Config cfg = Config::load();
    REQUIRE(cfg.model == "qwen2.5:7b");
}

TEST_CASE("Config::load: environment overrides the file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"workspace": "/from/file", "model": "llama3"})");

    setenv("TOOLCAGE_WORK_DIR", "/from/env", 1);
    setenv("TOOLCAGE_MODEL", "mistral", 1);
    setenv("TOOLCAGE_CACHE_ENABLED", "false", 1);
    setenv("TOOLCAGE_CACHE_TTL", "10", 1);
    setenv("TOOLCAGE_SHELL_TIMEOUT", "3", 1);
    setenv("TOOLCAGE_DOCKER_TIMEOUT", "300", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.workspace == "/from/env");
    REQUIRE(cfg.model == "mistral");
    REQUIRE_FALSE(cfg.cache.enabled);
    REQUIRE(cfg.cache.ttl == 10);
    REQUIRE(cfg.timeouts.shell == 3);
    REQUIRE(cfg.timeouts.docker == 300);
}

TEST_CASE("Config::load: TOOLCAGE_WORK_DIR wins over WORK_DIR", "[config]") {
    ConfigTestGuard g;
    setenv("WORK_DIR", "/legacy", 1);
    REQUIRE(Config::load().workspace == "/legacy");

    setenv("TOOLCAGE_WORK_DIR", "/preferred", 1);
    REQUIRE(Config::load().workspace == "/preferred");
}

TEST_CASE("Config::load: invalid numeric override throws", "[config]") {
    ConfigTestGuard g;
    setenv("TOOLCAGE_SHELL_TIMEOUT", "soon", 1);
    REQUIRE_THROWS_AS(Config::load(), std::runtime_error);
}

TEST_CASE("Config::load: negative, zero and oversized overrides throw", "[config]") {
    ConfigTestGuard g;
    for (const char* value : {"-1", "0", "4294967296", "99999999999999999999999", "10s", ""}) {
        setenv("TOOLCAGE_SHELL_TIMEOUT", value, 1);
        REQUIRE_THROWS_AS(Config::load(), std::runtime_error);
    }
    unsetenv("TOOLCAGE_SHELL_TIMEOUT");

    setenv("TOOLCAGE_DOCKER_TIMEOUT", "-5", 1);
    REQUIRE_THROWS_AS(Config::load(), std::runtime_error);
    unsetenv("TOOLCAGE_DOCKER_TIMEOUT");

    setenv("TOOLCAGE_CACHE_TTL", "0", 1);
    REQUIRE(Config::load().cache.ttl == 0);
}

// ── load_from ────────────────────────────────────────────────────

TEST_CASE("Config::load_from: explicit file", "[config]") {
    ConfigTestGuard g;
    std::string path = g.dir + "/custom.json";
    {
        std::ofstream f(path);
        f << R"({"model": "phi3", "cache": {"enabled": false}})";
    }
    Config cfg = Config::load_from(path);
    REQUIRE(cfg.model == "phi3");
    REQUIRE_FALSE(cfg.cache.enabled);
    REQUIRE(cfg.security.allowed_commands.count("ls") == 1);
}

TEST_CASE("Config::load_from: missing or malformed file throws", "[config]") {
    ConfigTestGuard g;
    REQUIRE_THROWS_AS(Config::load_from(g.dir + "/absent.json"), std::runtime_error);

    std::string path = g.dir + "/broken.json";
    {
        std::ofstream f(path);
        f << "{";
    }
    REQUIRE_THROWS_AS(Config::load_from(path), std::runtime_error);
    REQUIRE_FALSE(std::filesystem::exists(g.dir + "/absent.json"));
}
