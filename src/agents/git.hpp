#pragma once
#include "../subprocess.hpp"
#include "../tool.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace spdlog { class logger; }

namespace toolbelt {

// Runs argv with the given working directory. Swappable so tests never
// need a git binary.
using CommandRunner = std::function<CommandResult(const std::vector<std::string>& argv,
                                                  const std::string& cwd)>;

// Tool table of the git agent. repository_path is the base parameter, so
// file operands are contained relative to the repository.
std::vector<ToolDefinition> git_tools();

// Reject options that make git spawn arbitrary programs (--exec,
// --upload-pack, -c, ...), exact or in "--opt=value" form, any case.
// Returns the error message for the first offending value.
std::optional<std::string> check_flags(const std::vector<std::string>& flags);

// Reject free-form operands (remote, branch, target, url, commits, ...)
// that git would parse as options. rev-parse `args` are options by nature
// and go through check_flags() instead.
std::optional<std::string> check_operands(const Arguments& args);

// True if dir/.git exists as a directory or a regular file (worktree,
// submodule).
bool is_git_repository(const std::string& dir);

class GitBackend : public ToolBackend {
public:
    explicit GitBackend(spdlog::logger& log, CommandRunner runner = run_command);

    ToolResult execute(const std::string& tool_name, const Arguments& args) override;

private:
    ToolResult run_git(const std::vector<std::string>& git_args, const std::string& cwd);

    spdlog::logger& log_;
    CommandRunner runner_;
};

} // namespace toolbelt
