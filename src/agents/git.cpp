#include "git.hpp"
#include "../util.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <unordered_map>

namespace fs = std::filesystem;

namespace toolbelt {

// ── Tool table ──────────────────────────────────────────────────

static ParamSpec repo_param() {
    return required(sandboxed(string_param("repository_path",
        "Path to the git repository (working directory for the command)")));
}

static ParamSpec flags_param() {
    return string_array_param("flags", "Additional flags passed directly to the git command");
}

// Tool operating on an existing repository: repository_path first, flags last
static ToolDefinition repo_tool(const std::string& name, const std::string& description,
                                std::vector<ParamSpec> params = {}) {
    ToolDefinition def;
    def.name = name;
    def.description = description;
    def.params.push_back(repo_param());
    for (auto& p : params) def.params.push_back(std::move(p));
    def.params.push_back(flags_param());
    def.base_param = "repository_path";
    return def;
}

std::vector<ToolDefinition> git_tools() {
    ParamSpec add_paths = with_default(sandboxed(string_array_param("paths",
        "File paths or patterns to add (e.g. [\".\", \"*.cpp\", \"src/\"])")),
        nlohmann::json::array({"."}));
    ParamSpec commits = required(string_array_param("commits", "Commit SHAs to cherry-pick"));
    commits.min_items = 1;
    ParamSpec remote = with_default(string_param("remote", "Remote name"), "origin");

    ToolDefinition clone;
    clone.name = "git_clone";
    clone.description = "Clone a repository into a new directory.";
    clone.params = {
        required(string_param("url", "Repository URL to clone")),
        sandboxed(string_param("path", "Local path to clone into (optional)")),
        flags_param(),
    };

    ToolDefinition init;
    init.name = "git_init";
    init.description = "Initialize a new Git repository. Supports flags like --bare, "
                       "--initial-branch, etc.";
    init.params = {
        with_default(sandboxed(string_param("path",
            "Path where to initialize the repository (defaults to the current directory)")),
            "."),
        flags_param(),
    };

    return {
        repo_tool("git_status", "Show the working tree status. Supports flags like --short, "
                  "--branch, --porcelain, etc."),
        repo_tool("git_log", "Show commit logs. Supports flags like --oneline, --graph, --all, "
                  "-n, --author, --since, --format, etc."),
        repo_tool("git_diff", "Show changes between commits, commit and working tree, etc. "
                  "Supports flags like --staged, --cached, --stat, --name-only, etc.",
                  {string_param("target", "Commit, branch, or path to diff against "
                                "(e.g. 'HEAD~1', 'main', 'file.cpp')")}),
        repo_tool("git_show", "Show various types of objects (commits, tags, etc.). Supports "
                  "flags like --stat, --format, etc.",
                  {string_param("object", "Object to show (commit SHA, tag, HEAD, etc.). "
                                "Defaults to HEAD.")}),
        repo_tool("git_blame", "Show what revision and author last modified each line of a file.",
                  {required(sandboxed(string_param("file", "File to annotate")))}),
        repo_tool("git_add", "Add file contents to the staging area. Supports flags like -A, "
                  "--all, --force, --dry-run, etc.",
                  {add_paths}),
        repo_tool("git_commit", "Record changes to the repository. Supports flags like --amend, "
                  "--no-verify, --signoff, --allow-empty, etc.",
                  {required(string_param("message", "Commit message"))}),
        repo_tool("git_reset", "Reset current HEAD to the specified state. Supports --soft, "
                  "--mixed, --hard.",
                  {string_param("target", "Commit or reference to reset to (e.g. 'HEAD~1')")}),
        repo_tool("git_restore", "Restore working tree files. Supports --staged, --source, "
                  "--worktree, etc.",
                  {sandboxed(string_array_param("paths", "File paths to restore"))}),
        repo_tool("git_rm", "Remove files from the working tree and the index. Supports "
                  "--cached, --force, -r, etc.",
                  {required(sandboxed(string_array_param("paths", "File paths to remove")))}),
        repo_tool("git_mv", "Move or rename a file, directory, or symlink.",
                  {required(sandboxed(string_param("source", "Source path"))),
                   required(sandboxed(string_param("destination", "Destination path")))}),
        repo_tool("git_branch", "List, create, or delete branches. Supports flags like -d, -D, "
                  "-m, --all, -r, etc.",
                  {string_param("branch_name", "Branch name (omit to list branches)")}),
        repo_tool("git_checkout", "Switch branches or restore working tree files. Supports "
                  "flags like -b, -B, --track, etc.",
                  {string_param("target", "Branch name, commit, tag, or file path to checkout")}),
        repo_tool("git_switch", "Switch branches. Supports flags like -c (create), -d (detach), "
                  "etc.",
                  {string_param("branch", "Branch name to switch to")}),
        repo_tool("git_merge", "Join two or more development histories together. Supports "
                  "flags like --no-ff, --squash, --abort, etc.",
                  {string_param("branch", "Branch to merge into the current branch")}),
        repo_tool("git_rebase", "Reapply commits on top of another base tip. Supports flags "
                  "like --onto, --abort, --continue, --skip, etc.",
                  {string_param("target", "Branch or commit to rebase onto")}),
        repo_tool("git_cherry_pick", "Apply the changes introduced by existing commits. "
                  "Supports flags like --no-commit, --abort, --continue, etc.",
                  {commits}),
        repo_tool("git_remote", "Manage remote repositories. Subcommands: add, remove, rename, "
                  "get-url, set-url, or omit to list.",
                  {string_param("subcommand", "Remote subcommand (add, remove, rename, get-url, "
                                "set-url, or omit to list)"),
                   string_param("name", "Name of the remote (e.g. 'origin')"),
                   string_param("url", "Remote URL (for add/set-url)")}),
        repo_tool("git_fetch", "Download objects and refs from a remote repository. Supports "
                  "flags like --all, --prune, --tags, etc.",
                  {remote}),
        repo_tool("git_pull", "Fetch from and integrate with another repository or branch. "
                  "Supports flags like --rebase, --no-rebase, --ff-only, etc.",
                  {remote, string_param("branch", "Branch to pull (omit to pull the current "
                                        "tracking branch)")}),
        repo_tool("git_push", "Update remote refs along with associated objects. Supports "
                  "flags like --force, --tags, --set-upstream, --delete, etc.",
                  {remote, string_param("branch", "Branch name to push (omit to push the "
                                        "current branch)")}),
        clone,
        repo_tool("git_tag", "Create, list, or delete tags. Supports flags like -a, -m, -d, -l, "
                  "--sort, etc.",
                  {string_param("tag_name", "Tag name (omit to list tags)"),
                   string_param("message", "Tag message (for annotated tags with -a)")}),
        repo_tool("git_stash", "Stash changes in a dirty working directory. Subcommands: push, "
                  "pop, apply, list, drop, show, clear.",
                  {with_default(string_param("subcommand", "Stash subcommand (push, pop, apply, "
                                             "list, drop, show, clear)"), "push"),
                   string_param("message", "Stash message (for push)")}),
        repo_tool("git_clean", "Remove untracked files from the working tree. Supports flags "
                  "like -f, -d, -n (dry-run), -x, etc."),
        init,
        repo_tool("git_rev_parse", "Parse revision or other git info, e.g. the current branch "
                  "(--abbrev-ref HEAD) or the repository root (--show-toplevel).",
                  {required(string_array_param("args", "Arguments to git rev-parse "
                                               "(e.g. ['--abbrev-ref', 'HEAD'])"))}),
        repo_tool("git_ls_files", "Show information about files in the index and working tree. "
                  "Supports flags like --modified, --deleted, --others, --ignored, etc."),
    };
}

// ── Checks ──────────────────────────────────────────────────────

static const char* const kDangerousFlags[] = {
    "--exec", "--upload-pack", "--receive-pack", "--config", "-c", "--ext-diff", "--run",
};

std::optional<std::string> check_flags(const std::vector<std::string>& flags) {
    for (const auto& flag : flags) {
        std::string lower = flag;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        for (const char* prefix : kDangerousFlags) {
            std::string p = prefix;
            if (lower == p || lower.rfind(p + "=", 0) == 0) {
                return "flag \"" + flag + "\" is not allowed for security reasons";
            }
        }
    }
    return std::nullopt;
}

static const char* const kOperandArgs[] = {
    "target", "object", "branch_name", "branch", "subcommand", "name", "url",
    "remote", "tag_name", "commits",
};

std::optional<std::string> check_operands(const Arguments& args) {
    for (const char* name : kOperandArgs) {
        std::vector<std::string> values = args.strings(name);
        if (auto single = args.opt_str(name)) values.push_back(*single);
        for (const auto& value : values) {
            if (!value.empty() && value[0] == '-') {
                return std::string(name) + " must not start with '-': " + value;
            }
        }
    }
    return check_flags(args.strings("args"));
}

bool is_git_repository(const std::string& dir) {
    std::error_code ec;
    auto st = fs::status(fs::path(dir) / ".git", ec);
    if (ec) return false;
    return st.type() == fs::file_type::directory || st.type() == fs::file_type::regular;
}

// ── Command assembly ────────────────────────────────────────────

namespace {

enum class Shape {
    Simple,      // sub flags
    Operand,     // sub flags [operand]
    Paths,       // sub flags paths...
    Blame,       // blame flags file
    Commit,      // commit flags -m message
    Move,        // mv flags source destination
    CherryPick,  // cherry-pick flags commits...
    Remote,      // remote [subcommand [name] [url]] flags
    Fetch,       // fetch flags [remote]
    PullPush,    // sub flags [remote] [branch]
    Tag,         // tag flags [name] [-m message]
    Stash,       // stash [subcommand] flags [-m message]
    RevParse,    // rev-parse flags args...
};

struct GitCommand {
    const char* subcommand;
    Shape shape;
    const char* operand;    // argument name for Shape::Operand
};

const std::unordered_map<std::string, GitCommand>& repo_commands() {
    static const std::unordered_map<std::string, GitCommand> commands = {
        {"git_status",      {"status", Shape::Simple, nullptr}},
        {"git_log",         {"log", Shape::Simple, nullptr}},
        {"git_diff",        {"diff", Shape::Operand, "target"}},
        {"git_show",        {"show", Shape::Operand, "object"}},
        {"git_blame",       {"blame", Shape::Blame, nullptr}},
        {"git_add",         {"add", Shape::Paths, nullptr}},
        {"git_commit",      {"commit", Shape::Commit, nullptr}},
        {"git_reset",       {"reset", Shape::Operand, "target"}},
        {"git_restore",     {"restore", Shape::Paths, nullptr}},
        {"git_rm",          {"rm", Shape::Paths, nullptr}},
        {"git_mv",          {"mv", Shape::Move, nullptr}},
        {"git_branch",      {"branch", Shape::Operand, "branch_name"}},
        {"git_checkout",    {"checkout", Shape::Operand, "target"}},
        {"git_switch",      {"switch", Shape::Operand, "branch"}},
        {"git_merge",       {"merge", Shape::Operand, "branch"}},
        {"git_rebase",      {"rebase", Shape::Operand, "target"}},
        {"git_cherry_pick", {"cherry-pick", Shape::CherryPick, nullptr}},
        {"git_remote",      {"remote", Shape::Remote, nullptr}},
        {"git_fetch",       {"fetch", Shape::Fetch, nullptr}},
        {"git_pull",        {"pull", Shape::PullPush, nullptr}},
        {"git_push",        {"push", Shape::PullPush, nullptr}},
        {"git_tag",         {"tag", Shape::Tag, nullptr}},
        {"git_stash",       {"stash", Shape::Stash, nullptr}},
        {"git_clean",       {"clean", Shape::Simple, nullptr}},
        {"git_rev_parse",   {"rev-parse", Shape::RevParse, nullptr}},
        {"git_ls_files",    {"ls-files", Shape::Simple, nullptr}},
    };
    return commands;
}

void append(std::vector<std::string>& out, const std::vector<std::string>& values) {
    out.insert(out.end(), values.begin(), values.end());
}

void append_if_set(std::vector<std::string>& out, const Arguments& args, const char* name) {
    std::string value = args.str(name);
    if (!value.empty()) out.push_back(value);
}

// Build the git argument list for a repository tool. Sandboxed operands are
// passed in their resolved absolute form after "--", so git sees exactly the
// path that was checked and never parses one as an option.
std::optional<ToolResult> build_repo_command(const GitCommand& cmd, const Arguments& args,
                                             std::vector<std::string>& out) {
    auto flags = args.strings("flags");
    out.push_back(cmd.subcommand);

    switch (cmd.shape) {
        case Shape::Simple:
            append(out, flags);
            break;
        case Shape::Operand:
            append(out, flags);
            append_if_set(out, args, cmd.operand);
            break;
        case Shape::Paths: {
            append(out, flags);
            auto paths = args.strings("paths");
            if (!paths.empty()) {
                out.push_back("--");
                append(out, paths);
            }
            break;
        }
        case Shape::Blame:
            append(out, flags);
            out.push_back("--");
            out.push_back(args.str("file"));
            break;
        case Shape::Commit:
            if (args.str("message").empty()) return ToolResult::error("message is required");
            append(out, flags);
            out.push_back("-m");
            out.push_back(args.str("message"));
            break;
        case Shape::Move:
            append(out, flags);
            out.push_back("--");
            out.push_back(args.str("source"));
            out.push_back(args.str("destination"));
            break;
        case Shape::CherryPick:
            append(out, flags);
            append(out, args.strings("commits"));
            break;
        case Shape::Remote:
            if (!args.str("subcommand").empty()) {
                out.push_back(args.str("subcommand"));
                append_if_set(out, args, "name");
                append_if_set(out, args, "url");
            }
            append(out, flags);
            break;
        case Shape::Fetch:
            append(out, flags);
            append_if_set(out, args, "remote");
            break;
        case Shape::PullPush:
            append(out, flags);
            append_if_set(out, args, "remote");
            append_if_set(out, args, "branch");
            break;
        case Shape::Tag:
            append(out, flags);
            append_if_set(out, args, "tag_name");
            if (!args.str("message").empty()) {
                out.push_back("-m");
                out.push_back(args.str("message"));
            }
            break;
        case Shape::Stash: {
            std::string sub = args.str("subcommand");
            if (!sub.empty()) out.push_back(sub);
            append(out, flags);
            if ((sub.empty() || sub == "push") && !args.str("message").empty()) {
                out.push_back("-m");
                out.push_back(args.str("message"));
            }
            break;
        }
        case Shape::RevParse:
            append(out, flags);
            append(out, args.strings("args"));
            break;
    }
    return std::nullopt;
}

} // namespace

// ── Backend ─────────────────────────────────────────────────────

GitBackend::GitBackend(spdlog::logger& log, CommandRunner runner)
    : log_(log), runner_(std::move(runner)) {}

ToolResult GitBackend::execute(const std::string& tool_name, const Arguments& args) {
    if (auto err = check_flags(args.strings("flags"))) return ToolResult::error(*err);
    if (auto err = check_operands(args)) return ToolResult::error(*err);

    // clone and init create repositories, so they run outside one and get the
    // contained absolute target path
    if (tool_name == "git_clone") {
        if (args.str("url").empty()) return ToolResult::error("url is required");
        std::vector<std::string> git_args = {"clone"};
        append(git_args, args.strings("flags"));
        git_args.push_back(args.str("url"));
        append_if_set(git_args, args, "path");
        return run_git(git_args, "");
    }
    if (tool_name == "git_init") {
        std::vector<std::string> git_args = {"init"};
        append(git_args, args.strings("flags"));
        git_args.push_back(args.str("path"));
        return run_git(git_args, "");
    }

    auto it = repo_commands().find(tool_name);
    if (it == repo_commands().end()) {
        throw std::invalid_argument("No git handler for tool: " + tool_name);
    }

    std::string repo = args.str("repository_path");
    if (!is_git_repository(repo)) {
        return ToolResult::error("not a git repository: " + args.original("repository_path"));
    }

    std::vector<std::string> git_args;
    if (auto err = build_repo_command(it->second, args, git_args)) return *err;
    return run_git(git_args, repo);
}

ToolResult GitBackend::run_git(const std::vector<std::string>& git_args, const std::string& cwd) {
    std::vector<std::string> argv = {"git"};
    append(argv, git_args);

    std::string command = "git";
    for (const auto& a : git_args) command += " " + a;
    log_.info("Executing: {} (cwd: {})", command, cwd);

    CommandResult r = runner_(argv, cwd);

    nlohmann::ordered_json out;
    out["command"] = command;
    out["success"] = r.success();
    out["stdout"] = trim(r.stdout_text);
    if (!r.success()) {
        std::string err_text = trim(r.stderr_text);
        if (!err_text.empty()) out["stderr"] = err_text;
        out["error"] = r.error.empty() ? "exit status " + std::to_string(r.exit_code) : r.error;
        log_.warn("Git command failed: {}", out["error"].get<std::string>());
        if (!err_text.empty()) log_.warn("Git stderr: {}", err_text);
    } else {
        log_.info("Git command succeeded, stdout length: {} bytes",
                  out["stdout"].get<std::string>().size());
    }

    std::string text = out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    if (!r.success()) return ToolResult::error(text);
    return ToolResult::text(text);
}

} // namespace toolbelt
