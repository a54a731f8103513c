#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace toolcage {

static const char* const kDefaultAllowedCommands[] = {
    "ls", "cat", "head", "tail", "grep", "find", "pwd", "whoami",
    "df", "du", "wc", "file", "stat", "tree",
    "python3", "python", "pip", "node", "npm", "npx",
    "git", "docker", "docker-compose",
    "curl", "wget", "ping", "which", "echo", "env", "printenv",
    "date", "uname", "hostname", "sort", "uniq", "cut", "tr",
    "mkdir", "touch", "cp", "mv",
};

// Matched case-insensitively as substrings; a trailing space also matches
// end of input.
static const char* const kDefaultForbiddenPatterns[] = {
    "rm -rf", "rm -r", "rmdir", "dd ", "mkfs", "fdisk", "format",
    "kill", "killall", "shutdown", "reboot", "halt", "poweroff",
    "sudo", "su ", "chmod", "chown",
    ">/dev/", "> /dev/", "| bash", "|bash", "| sh", "|sh ",
    "eval ", "exec ",
};

SecurityConfig::SecurityConfig()
    : allowed_commands(std::begin(kDefaultAllowedCommands),
                       std::end(kDefaultAllowedCommands)),
      forbidden_patterns(std::begin(kDefaultForbiddenPatterns),
                         std::end(kDefaultForbiddenPatterns)) {}

nlohmann::json Config::defaults_json() {
    SecurityConfig security;
    return {
        {"workspace", ""},
        {"model", "qwen2.5:7b"},
        {"timeouts", {
            {"shell", 30},
            {"git", 30},
            {"docker", 60},
            {"http", 30}
        }},
        {"security", {
            {"allowed_commands", security.allowed_commands},
            {"forbidden_patterns", security.forbidden_patterns},
            {"reject_command_chaining", true},
            {"max_file_size", security.max_file_size},
            {"max_output_bytes", security.max_output_bytes}
        }},
        {"cache", {
            {"enabled", true},
            {"dir", ""},
            {"ttl", 3600}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string_list(const nlohmann::json& j, const char* field,
                             std::vector<std::string>& out) {
    if (!j.contains(field) || !j[field].is_array()) return;
    out.clear();
    for (const auto& item : j[field]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
}

// Accepts any integer that fits T, signed or unsigned in the JSON model.
// Out-of-range values (and 0 when `positive`) keep the default.
template <typename T>
static void read_uint(const nlohmann::json& j, const char* field, T& out,
                      bool positive = false) {
    if (!j.contains(field) || !j[field].is_number_integer()) return;

    const auto& value = j[field];
    bool in_range = value.is_number_unsigned()
        ? value.get<uint64_t>() <= std::numeric_limits<T>::max()
        : value.get<int64_t>() >= 0 &&
              static_cast<uint64_t>(value.get<int64_t>()) <= std::numeric_limits<T>::max();
    if (in_range && positive && value.get<uint64_t>() == 0) in_range = false;
    if (!in_range) {
        std::cerr << "[config] Ignoring out-of-range " << field << ": " << value.dump() << "\n";
        return;
    }
    out = value.get<T>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("workspace") && j["workspace"].is_string())
        cfg.workspace = expand_home(j["workspace"].get<std::string>());
    if (j.contains("model") && j["model"].is_string())
        cfg.model = j["model"].get<std::string>();

    if (j.contains("timeouts") && j["timeouts"].is_object()) {
        auto& t = j["timeouts"];
        read_uint(t, "shell", cfg.timeouts.shell, true);
        read_uint(t, "git", cfg.timeouts.git, true);
        read_uint(t, "docker", cfg.timeouts.docker, true);
        read_uint(t, "http", cfg.timeouts.http, true);
    }

    if (j.contains("security") && j["security"].is_object()) {
        auto& s = j["security"];
        if (s.contains("allowed_commands") && s["allowed_commands"].is_array()) {
            std::vector<std::string> list;
            read_string_list(s, "allowed_commands", list);
            cfg.security.allowed_commands = std::set<std::string>(list.begin(), list.end());
        }
        read_string_list(s, "forbidden_patterns", cfg.security.forbidden_patterns);
        if (s.contains("reject_command_chaining") && s["reject_command_chaining"].is_boolean())
            cfg.security.reject_command_chaining = s["reject_command_chaining"].get<bool>();
        read_uint(s, "max_file_size", cfg.security.max_file_size);
        read_uint(s, "max_output_bytes", cfg.security.max_output_bytes);
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        if (c.contains("enabled") && c["enabled"].is_boolean())
            cfg.cache.enabled = c["enabled"].get<bool>();
        if (c.contains("dir") && c["dir"].is_string())
            cfg.cache.dir = expand_home(c["dir"].get<std::string>());
        read_uint(c, "ttl", cfg.cache.ttl);
    }

    return cfg;
}

static bool parse_env_bool(const char* v) {
    std::string s = to_lower(v);
    return s == "1" || s == "true" || s == "yes";
}

// Decimal digits only, within uint32_t; 0 is rejected unless allow_zero
static uint32_t parse_env_uint(const char* name, const char* v, bool allow_zero) {
    std::string s = trim(v);
    bool digits = !s.empty() && s.find_first_not_of("0123456789") == std::string::npos;
    unsigned long long n = 0;
    if (digits) {
        try {
            n = std::stoull(s);
        } catch (const std::out_of_range&) {
            digits = false;
        }
    }
    if (!digits || n > std::numeric_limits<uint32_t>::max() || (n == 0 && !allow_zero)) {
        throw std::runtime_error(std::string("Invalid value for ") + name + ": " + v);
    }
    return static_cast<uint32_t>(n);
}

// Environment variables always override the config file
static void apply_env_overrides(Config& cfg) {
    if (const char* v = std::getenv("WORK_DIR"))
        cfg.workspace = v;
    if (const char* v = std::getenv("TOOLCAGE_WORK_DIR"))
        cfg.workspace = v;
    if (const char* v = std::getenv("TOOLCAGE_MODEL"))
        cfg.model = v;
    if (const char* v = std::getenv("TOOLCAGE_CACHE_ENABLED"))
        cfg.cache.enabled = parse_env_bool(v);
    if (const char* v = std::getenv("TOOLCAGE_CACHE_DIR"))
        cfg.cache.dir = v;
    if (const char* v = std::getenv("TOOLCAGE_CACHE_TTL"))
        cfg.cache.ttl = parse_env_uint("TOOLCAGE_CACHE_TTL", v, true);
    if (const char* v = std::getenv("TOOLCAGE_SHELL_TIMEOUT"))
        cfg.timeouts.shell = parse_env_uint("TOOLCAGE_SHELL_TIMEOUT", v, false);
    if (const char* v = std::getenv("TOOLCAGE_DOCKER_TIMEOUT"))
        cfg.timeouts.docker = parse_env_uint("TOOLCAGE_DOCKER_TIMEOUT", v, false);
}

Config Config::load() {
    std::string config_path = expand_home("~/.toolcage/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    apply_env_overrides(cfg);
    return cfg;
}

Config Config::load_from(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }

    Config cfg = from_json(merge_defaults(j, defaults_json()));
    apply_env_overrides(cfg);
    return cfg;
}

std::string Config::workspace_root() const {
    if (!workspace.empty()) return workspace;
    return std::filesystem::current_path().string();
}

std::string Config::cache_dir() const {
    if (!cache.dir.empty()) return cache.dir;
    return (std::filesystem::path(workspace_root()) / ".toolcage_cache").string();
}

} // namespace toolcage
