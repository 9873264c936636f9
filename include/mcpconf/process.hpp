#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace mcpconf {

struct ProcessResult {
    bool started = false;      // false if the program could not be executed
    bool timed_out = false;
    int exit_code = -1;        // valid when started && !timed_out
    std::string output;        // combined stdout and stderr

    [[nodiscard]] bool succeeded() const { return started && !timed_out && exit_code == 0; }
};

/// Run program (looked up in PATH) and wait for it. A child still running
/// when the timeout expires is killed.
[[nodiscard]] ProcessResult run_process(const std::string& program,
                                        const std::vector<std::string>& args,
                                        std::chrono::milliseconds timeout);

/// Start program in its own session without waiting for it.
/// Returns false if it could not be executed.
[[nodiscard]] bool spawn_detached(const std::string& program,
                                  const std::vector<std::string>& args);

} // namespace mcpconf
