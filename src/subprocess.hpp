#pragma once
#include <string>
#include <vector>

namespace toolbelt {

struct CommandResult {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    std::string error;      // empty on clean exit with status 0

    bool success() const { return error.empty() && exit_code == 0; }
};

// Run argv[0] (searched on PATH) with the given arguments, no shell involved.
// The child's stdin is /dev/null so it can never read the agent's protocol
// stream. Blocks until the child exits; there is no timeout.
CommandResult run_command(const std::vector<std::string>& argv, const std::string& cwd = "");

} // namespace toolbelt
