#pragma once
#include "../tool.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace toolcage {

// Full command line interpreted by /bin/sh. Only ever built from a command
// that passed CommandPolicy.
struct ShellCommand {
    std::string line;
};

// Executed directly; no shell re-parses the elements.
struct ArgvCommand {
    std::vector<std::string> argv;
};

using Command = std::variant<ShellCommand, ArgvCommand>;

struct ProcessOutput {
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = -1;
    bool success = false;
};

// Injectable for testing
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Returns a Timeout error if the wall-clock bound is exceeded and a
    // Spawn error if the process could not be started. A non-zero exit is
    // not an error; it is reported through `out`.
    virtual std::optional<ToolError> run(const Command& command,
                                         const std::filesystem::path& working_dir,
                                         std::chrono::seconds timeout,
                                         ProcessOutput& out) = 0;
};

// fork/exec implementation with separate stdout/stderr pipes
class PosixProcessRunner : public ProcessRunner {
public:
    explicit PosixProcessRunner(size_t max_output_bytes = 65536)
        : max_output_bytes_(max_output_bytes) {}

    std::optional<ToolError> run(const Command& command,
                                 const std::filesystem::path& working_dir,
                                 std::chrono::seconds timeout,
                                 ProcessOutput& out) override;

private:
    size_t max_output_bytes_;
};

// Human-readable rendering for logs and error messages
std::string describe_command(const Command& command);

} // namespace toolcage
