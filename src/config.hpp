#pragma once
#include <string>
#include <cstdint>
#include <set>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolcage {

// Per-tool wall-clock bounds, in seconds
struct TimeoutConfig {
    uint32_t shell = 30;
    uint32_t git = 30;
    uint32_t docker = 60;
    uint32_t http = 30;
};

struct SecurityConfig {
    std::set<std::string> allowed_commands;
    std::vector<std::string> forbidden_patterns;
    bool reject_command_chaining = true;  // ; && || ` $( and newlines
    uint64_t max_file_size = 10 * 1024 * 1024;
    uint32_t max_output_bytes = 65536;    // per captured stream

    SecurityConfig();
};

struct CacheConfig {
    bool enabled = true;
    std::string dir;  // empty = <workspace>/.toolcage_cache
    uint32_t ttl = 3600;
};

struct Config {
    std::string workspace;  // empty = current directory
    std::string model = "qwen2.5:7b";

    TimeoutConfig timeouts;
    SecurityConfig security;
    CacheConfig cache;

    // Load from ~/.toolcage/config.json + env vars
    static Config load();

    // Load from an explicit file + env vars. A missing file is not created.
    static Config load_from(const std::string& path);

    // Build from an already parsed JSON document (no env overrides)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Workspace root, falling back to the current directory
    std::string workspace_root() const;

    // Cache directory, falling back to <workspace>/.toolcage_cache
    std::string cache_dir() const;
};

} // namespace toolcage
