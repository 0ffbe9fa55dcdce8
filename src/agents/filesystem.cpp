#include "filesystem.hpp"
#include "../util.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fnmatch.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unordered_map>

namespace fs = std::filesystem;

namespace toolbelt {

// ── Tool table ──────────────────────────────────────────────────

static ParamSpec path_param() {
    return required(sandboxed(string_param("path")));
}

static ParamSpec exclude_patterns_param() {
    return with_default(string_array_param("excludePatterns",
                                           "Glob patterns of entries to skip"),
                        nlohmann::json::array());
}

static std::vector<ParamSpec> read_text_params() {
    return {
        path_param(),
        number_param("head", "If provided, returns only the first N lines of the file"),
        number_param("tail", "If provided, returns only the last N lines of the file"),
    };
}

std::vector<ToolDefinition> filesystem_tools() {
    ParamSpec paths = required(sandboxed(string_array_param("paths",
        "Array of file paths to read, each inside an allowed directory")));
    paths.min_items = 1;

    ParamSpec edits = required(string_param("edits", "Replacements to apply in order"));
    edits.type = ParamType::ObjectArray;
    edits.item_fields = {"oldText", "newText"};

    ParamSpec sort_by = with_default(string_param("sortBy", "Sort entries by name or size"),
                                     "name");
    sort_by.enum_values = {"name", "size"};

    return {
        {"read_text_file",
         "Read the complete contents of a file as text. Use 'head' to read only the "
         "first N lines or 'tail' for the last N lines. Only works within allowed "
         "directories.",
         read_text_params(), ""},
        {"read_file",
         "Read the complete contents of a file as text. DEPRECATED: use read_text_file "
         "instead.",
         read_text_params(), ""},
        {"read_media_file",
         "Read an image or audio file. Returns the base64 encoded data and MIME type. "
         "Only works within allowed directories.",
         {path_param()}, ""},
        {"read_multiple_files",
         "Read several files in one call. Each file's content is returned under its "
         "path; a failed read of one file does not stop the others. Only works within "
         "allowed directories.",
         {paths}, ""},
        {"write_file",
         "Create a new file or overwrite an existing one. Parent directories are "
         "created as needed. Only works within allowed directories.",
         {path_param(), required(string_param("content"))}, ""},
        {"edit_file",
         "Replace exact text in a file. Every edit must match; all occurrences of each "
         "oldText are replaced. Returns a diff of the changes. Only works within "
         "allowed directories.",
         {path_param(), edits,
          with_default(bool_param("dryRun", "Preview changes without writing"), false)},
         ""},
        {"create_directory",
         "Create a directory, including missing parents. Succeeds silently if it "
         "already exists. Only works within allowed directories.",
         {path_param()}, ""},
        {"list_directory",
         "List the entries of a directory with [FILE] and [DIR] prefixes. Only works "
         "within allowed directories.",
         {path_param()}, ""},
        {"list_directory_with_sizes",
         "List the entries of a directory with [FILE] and [DIR] prefixes and file "
         "sizes, followed by totals. Only works within allowed directories.",
         {path_param(), sort_by}, ""},
        {"directory_tree",
         "Recursive tree of files and directories as JSON. Each entry has 'name' and "
         "'type' (file/directory); directories also have 'children'. Only works "
         "within allowed directories.",
         {path_param(), exclude_patterns_param()}, ""},
        {"move_file",
         "Move or rename a file or directory. Fails if the destination exists. Both "
         "source and destination must be within allowed directories.",
         {required(sandboxed(string_param("source"))),
          required(sandboxed(string_param("destination")))}, ""},
        {"search_files",
         "Recursively search for files and directories matching a glob pattern. "
         "'*.ext' matches by name at any depth; patterns containing '/' match the "
         "path relative to the search root. Returns full paths. Only searches within "
         "allowed directories.",
         {path_param(), required(string_param("pattern")), exclude_patterns_param()}, ""},
        {"get_file_info",
         "Metadata of a file or directory: size, modification time, permissions and "
         "type. Only works within allowed directories.",
         {path_param()}, ""},
        {"list_allowed_directories",
         "List the directories this server may access. Their subdirectories are "
         "accessible too.",
         {}, ""},
    };
}

// ── Helpers ─────────────────────────────────────────────────────

std::string mime_type_for(const std::string& path) {
    static const std::unordered_map<std::string, std::string> types = {
        {".png", "image/png"},   {".jpg", "image/jpeg"},   {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},   {".webp", "image/webp"},  {".bmp", "image/bmp"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},  {".wav", "audio/wav"},    {".ogg", "audio/ogg"},
        {".flac", "audio/flac"},
    };
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = types.find(ext);
    return it == types.end() ? "application/octet-stream" : it->second;
}

bool glob_match(const std::string& pattern, const std::string& relative,
                const std::string& base_name) {
    if (pattern.find('/') == std::string::npos) {
        return fnmatch(pattern.c_str(), base_name.c_str(), 0) == 0;
    }
    if (fnmatch(pattern.c_str(), relative.c_str(), 0) == 0) return true;
    if (pattern.rfind("**/", 0) == 0) {
        return glob_match(pattern.substr(3), relative, base_name);
    }
    return false;
}

static bool excluded_by(const std::vector<std::string>& patterns,
                        const std::string& name, const std::string& relative) {
    for (const auto& p : patterns) {
        if (fnmatch(p.c_str(), name.c_str(), FNM_PATHNAME) == 0) return true;
        if (fnmatch(p.c_str(), relative.c_str(), FNM_PATHNAME) == 0) return true;
    }
    return false;
}

// Read a whole file. Returns an error result on failure.
static std::optional<ToolResult> read_whole_file(const std::string& path, std::string& out) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return ToolResult::error("Failed to read file: " + path + ": is a directory");
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return ToolResult::error("Failed to read file: " + path + ": " + std::strerror(errno));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return ToolResult::error("Failed to read file: " + path);
    }
    out = ss.str();
    return std::nullopt;
}

// Split on '\n' keeping a trailing empty piece, so joining restores the text
static std::vector<std::string> split_keep_empty(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

static std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

static size_t line_count(double n) {
    if (!(n > 0)) return 0;
    if (n >= static_cast<double>(SIZE_MAX)) return SIZE_MAX;
    return static_cast<size_t>(n);
}

static bool is_dir_entry(const fs::directory_entry& entry) {
    std::error_code ec;
    return entry.symlink_status(ec).type() == fs::file_type::directory;
}

// Directory entries sorted by name. Symlinks are reported as what they are.
static std::optional<ToolResult> read_directory(const std::string& path,
                                                std::vector<fs::directory_entry>& out) {
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) return ToolResult::error("Failed to read directory: " + ec.message());
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) return ToolResult::error("Failed to read directory: " + ec.message());
        out.push_back(*it);
    }
    std::sort(out.begin(), out.end(), [](const fs::directory_entry& a,
                                          const fs::directory_entry& b) {
        return a.path().filename().string() < b.path().filename().string();
    });
    return std::nullopt;
}

static std::string pad_right(const std::string& s, size_t width) {
    return s.size() >= width ? s : s + std::string(width - s.size(), ' ');
}

static std::string pad_left(const std::string& s, size_t width) {
    return s.size() >= width ? s : std::string(width - s.size(), ' ') + s;
}

static nlohmann::json build_tree(const fs::path& root, const fs::path& current,
                                 const std::vector<std::string>& excludes) {
    nlohmann::json entries = nlohmann::json::array();
    std::vector<fs::directory_entry> children;
    if (read_directory(current.string(), children)) return entries;

    for (const auto& child : children) {
        std::string name = child.path().filename().string();
        std::string rel = child.path().lexically_relative(root).string();
        if (excluded_by(excludes, name, rel)) continue;

        nlohmann::json node = {{"name", name}};
        if (is_dir_entry(child)) {
            node["type"] = "directory";
            node["children"] = build_tree(root, child.path(), excludes);
        } else {
            node["type"] = "file";
        }
        entries.push_back(std::move(node));
    }
    return entries;
}

// ── Backend ─────────────────────────────────────────────────────

FilesystemBackend::FilesystemBackend(const PathSandbox& sandbox) : sandbox_(sandbox) {}

ToolResult FilesystemBackend::execute(const std::string& tool_name, const Arguments& args) {
    using Handler = ToolResult (FilesystemBackend::*)(const Arguments&);
    static const std::unordered_map<std::string, Handler> handlers = {
        {"read_text_file", &FilesystemBackend::read_text_file},
        {"read_file", &FilesystemBackend::read_text_file},
        {"read_media_file", &FilesystemBackend::read_media_file},
        {"read_multiple_files", &FilesystemBackend::read_multiple_files},
        {"write_file", &FilesystemBackend::write_file},
        {"edit_file", &FilesystemBackend::edit_file},
        {"create_directory", &FilesystemBackend::create_directory},
        {"list_directory", &FilesystemBackend::list_directory},
        {"list_directory_with_sizes", &FilesystemBackend::list_directory_with_sizes},
        {"directory_tree", &FilesystemBackend::directory_tree},
        {"move_file", &FilesystemBackend::move_file},
        {"search_files", &FilesystemBackend::search_files},
        {"get_file_info", &FilesystemBackend::get_file_info},
        {"list_allowed_directories", &FilesystemBackend::list_allowed_directories},
    };
    auto it = handlers.find(tool_name);
    if (it == handlers.end()) {
        throw std::invalid_argument("No filesystem handler for tool: " + tool_name);
    }
    return (this->*(it->second))(args);
}

ToolResult FilesystemBackend::read_text_file(const Arguments& args) {
    std::string text;
    if (auto err = read_whole_file(args.str("path"), text)) return *err;

    // head wins when both are given
    if (auto head = args.opt_number("head")) {
        auto lines = split_keep_empty(text);
        size_t n = line_count(*head);
        if (n < lines.size()) lines.resize(n);
        text = join(lines, "\n");
    } else if (auto tail = args.opt_number("tail")) {
        auto lines = split_keep_empty(text);
        size_t n = line_count(*tail);
        if (n < lines.size()) lines.erase(lines.begin(), lines.end() - static_cast<long>(n));
        text = join(lines, "\n");
    }
    return ToolResult::text(text);
}

ToolResult FilesystemBackend::read_media_file(const Arguments& args) {
    std::string path = args.str("path");
    std::string data;
    if (auto err = read_whole_file(path, data)) return *err;

    ContentItem item;
    item.mime_type = mime_type_for(path);
    if (item.mime_type.rfind("image/", 0) == 0) {
        item.type = "image";
    } else if (item.mime_type.rfind("audio/", 0) == 0) {
        item.type = "audio";
    } else {
        item.type = "blob";
    }
    item.data = base64_encode(data);

    ToolResult result;
    result.content.push_back(std::move(item));
    return result;
}

ToolResult FilesystemBackend::read_multiple_files(const Arguments& args) {
    auto resolved = args.strings("paths");
    auto shown = args.original_strings("paths");

    std::vector<std::string> sections;
    for (size_t i = 0; i < resolved.size(); ++i) {
        const std::string& label = i < shown.size() ? shown[i] : resolved[i];
        std::string content;
        if (auto err = read_whole_file(resolved[i], content)) {
            sections.push_back(label + ": Error - " + err->first_text());
            continue;
        }
        sections.push_back(label + ":\n" + content + "\n");
    }
    return ToolResult::text(join(sections, "\n---\n"));
}

ToolResult FilesystemBackend::write_file(const Arguments& args) {
    fs::path path = args.str("path");
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) return ToolResult::error("Failed to create parent directory: " + ec.message());
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return ToolResult::error(std::string("Failed to write file: ") + std::strerror(errno));
    }
    file << args.str("content");
    file.close();
    if (file.fail()) return ToolResult::error("Failed to write file: " + path.string());

    return ToolResult::text("Successfully wrote to " + args.original("path"));
}

ToolResult FilesystemBackend::edit_file(const Arguments& args) {
    std::string path = args.str("path");
    std::string original;
    if (auto err = read_whole_file(path, original)) return *err;

    std::string modified = original;
    auto edits = args.objects("edits");
    for (size_t i = 0; i < edits.size(); ++i) {
        std::string old_text = edits[i]["oldText"].get<std::string>();
        std::string new_text = edits[i]["newText"].get<std::string>();
        if (old_text.empty()) {
            return ToolResult::error("Edit " + std::to_string(i + 1) + ": oldText must not be empty");
        }
        size_t pos = modified.find(old_text);
        if (pos == std::string::npos) {
            return ToolResult::error("Edit " + std::to_string(i + 1) +
                                     ": could not find text to replace");
        }
        while (pos != std::string::npos) {
            modified.replace(pos, old_text.size(), new_text);
            pos = modified.find(old_text, pos + new_text.size());
        }
    }

    std::string diff = line_diff(original, modified, args.original("path"));

    if (!args.flag("dryRun")) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return ToolResult::error(std::string("Failed to write file: ") + std::strerror(errno));
        }
        file << modified;
        file.close();
        if (file.fail()) return ToolResult::error("Failed to write file: " + path);
    }
    return ToolResult::text(diff);
}

ToolResult FilesystemBackend::create_directory(const Arguments& args) {
    std::string path = args.str("path");
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) return ToolResult::error("Failed to create directory: " + ec.message());
    if (!fs::is_directory(path, ec)) {
        return ToolResult::error("Failed to create directory: " + path + " exists and is not a directory");
    }
    return ToolResult::text("Successfully created directory " + args.original("path"));
}

ToolResult FilesystemBackend::list_directory(const Arguments& args) {
    std::vector<fs::directory_entry> entries;
    if (auto err = read_directory(args.str("path"), entries)) return *err;

    std::vector<std::string> lines;
    for (const auto& entry : entries) {
        lines.push_back(std::string(is_dir_entry(entry) ? "[DIR]" : "[FILE]") + " " +
                        entry.path().filename().string());
    }
    return ToolResult::text(join(lines, "\n"));
}

ToolResult FilesystemBackend::list_directory_with_sizes(const Arguments& args) {
    std::vector<fs::directory_entry> entries;
    if (auto err = read_directory(args.str("path"), entries)) return *err;

    struct Row {
        std::string name;
        bool is_dir = false;
        uint64_t size = 0;
    };
    std::vector<Row> rows;
    uint64_t total_size = 0;
    int total_files = 0;
    int total_dirs = 0;

    for (const auto& entry : entries) {
        Row row{entry.path().filename().string(), is_dir_entry(entry), 0};
        if (row.is_dir) {
            ++total_dirs;
        } else {
            std::error_code ec;
            if (entry.symlink_status(ec).type() == fs::file_type::regular) {
                uint64_t size = entry.file_size(ec);
                if (!ec) row.size = size;
            }
            total_size += row.size;
            ++total_files;
        }
        rows.push_back(std::move(row));
    }

    if (args.str("sortBy") == "size") {
        std::stable_sort(rows.begin(), rows.end(),
                         [](const Row& a, const Row& b) { return a.size > b.size; });
    }

    std::vector<std::string> lines;
    for (const auto& row : rows) {
        std::string prefix = row.is_dir ? "[DIR]" : "[FILE]";
        std::string size = row.is_dir ? "" : pad_left(format_size(row.size), 10);
        lines.push_back(prefix + " " + pad_right(row.name, 30) + " " + size);
    }
    lines.push_back("");
    lines.push_back("Total: " + std::to_string(total_files) + " files, " +
                    std::to_string(total_dirs) + " directories");
    lines.push_back("Combined size: " + format_size(total_size));
    return ToolResult::text(join(lines, "\n"));
}

ToolResult FilesystemBackend::directory_tree(const Arguments& args) {
    fs::path root = args.str("path");
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return ToolResult::error("Failed to build directory tree: " + root.string() +
                                 " is not a directory");
    }
    std::vector<fs::directory_entry> top;
    if (auto err = read_directory(root.string(), top)) {
        return ToolResult::error("Failed to build directory tree: " + err->first_text());
    }
    return ToolResult::text(build_tree(root, root, args.strings("excludePatterns")).dump(2));
}

ToolResult FilesystemBackend::move_file(const Arguments& args) {
    std::string source = args.str("source");
    std::string destination = args.str("destination");

    std::error_code ec;
    if (fs::exists(fs::symlink_status(destination, ec))) {
        return ToolResult::error("Failed to move file: destination already exists: " +
                                 args.original("destination"));
    }
    fs::rename(source, destination, ec);
    if (ec) return ToolResult::error("Failed to move file: " + ec.message());

    return ToolResult::text("Successfully moved " + args.original("source") + " to " +
                            args.original("destination"));
}

// Depth-first walk below `current`. Unreadable directories are skipped so one
// bad subtree does not end the search.
static void search_tree(const fs::path& root, const fs::path& current,
                        const std::string& pattern, const std::vector<std::string>& excludes,
                        std::vector<std::string>& matches) {
    std::vector<fs::directory_entry> children;
    if (read_directory(current.string(), children)) return;

    for (const auto& child : children) {
        const fs::path& path = child.path();
        std::string name = path.filename().string();
        std::string rel = path.lexically_relative(root).string();

        bool skip = false;
        for (const auto& excl : excludes) {
            if (fnmatch(excl.c_str(), rel.c_str(), FNM_PATHNAME) == 0) {
                skip = true;
                break;
            }
        }
        if (skip) continue;

        if (glob_match(pattern, rel, name)) matches.push_back(path.string());
        if (is_dir_entry(child)) search_tree(root, path, pattern, excludes, matches);
    }
}

ToolResult FilesystemBackend::search_files(const Arguments& args) {
    fs::path root = args.str("path");
    std::vector<fs::directory_entry> top;
    if (auto err = read_directory(root.string(), top)) {
        return ToolResult::error("Search failed: " + err->first_text());
    }

    std::vector<std::string> matches;
    search_tree(root, root, args.str("pattern"), args.strings("excludePatterns"), matches);

    if (matches.empty()) return ToolResult::text("No matches found");
    return ToolResult::text(join(matches, "\n"));
}

ToolResult FilesystemBackend::get_file_info(const Arguments& args) {
    std::string path = args.str("path");
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return ToolResult::error("Failed to get file info: " + args.original("path") + ": " +
                                 std::strerror(errno));
    }

    std::string name = fs::path(path).filename().string();
    if (name.empty()) name = path;

    std::vector<std::string> lines = {
        "name: " + name,
        "size: " + format_size(static_cast<uint64_t>(st.st_size)),
        "modified: " + format_time_rfc3339(st.st_mtime),
        "accessed: " + format_time_rfc3339(st.st_atime),
        "mode: " + format_mode(st.st_mode),
        std::string("isDirectory: ") + (S_ISDIR(st.st_mode) ? "true" : "false"),
        std::string("isFile: ") + (S_ISREG(st.st_mode) ? "true" : "false"),
    };
    return ToolResult::text(join(lines, "\n"));
}

ToolResult FilesystemBackend::list_allowed_directories(const Arguments&) {
    return ToolResult::text("Allowed directories:\n" + join(sandbox_.roots(), "\n"));
}

} // namespace toolbelt
