#pragma once
#include "../sandbox.hpp"
#include "../tool.hpp"
#include <string>
#include <vector>

namespace toolbelt {

// Tool table of the filesystem agent. Every path-shaped parameter is
// sandboxed, so the backend only ever receives resolved paths.
std::vector<ToolDefinition> filesystem_tools();

// Local filesystem operations behind the filesystem agent's tools.
class FilesystemBackend : public ToolBackend {
public:
    explicit FilesystemBackend(const PathSandbox& sandbox);

    ToolResult execute(const std::string& tool_name, const Arguments& args) override;

private:
    ToolResult read_text_file(const Arguments& args);
    ToolResult read_media_file(const Arguments& args);
    ToolResult read_multiple_files(const Arguments& args);
    ToolResult write_file(const Arguments& args);
    ToolResult edit_file(const Arguments& args);
    ToolResult create_directory(const Arguments& args);
    ToolResult list_directory(const Arguments& args);
    ToolResult list_directory_with_sizes(const Arguments& args);
    ToolResult directory_tree(const Arguments& args);
    ToolResult move_file(const Arguments& args);
    ToolResult search_files(const Arguments& args);
    ToolResult get_file_info(const Arguments& args);
    ToolResult list_allowed_directories(const Arguments& args);

    const PathSandbox& sandbox_;
};

// MIME type for a file extension (".png" -> "image/png"), or
// "application/octet-stream" when unknown. Case-insensitive.
std::string mime_type_for(const std::string& path);

// Glob match used by search_files: patterns without '/' match the entry's
// base name; patterns with '/' match the path relative to the search root,
// and a leading "**/" also matches at the top level.
bool glob_match(const std::string& pattern, const std::string& relative,
                const std::string& base_name);

} // namespace toolbelt
