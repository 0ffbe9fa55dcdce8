#include "sandbox.hpp"
#include "util.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace toolbelt {

static std::string strip_trailing_separator(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

PathSandbox::PathSandbox(std::vector<std::string> roots) {
    for (auto& root : roots) {
        root = strip_trailing_separator(std::move(root));
        if (std::find(roots_.begin(), roots_.end(), root) == roots_.end()) {
            roots_.push_back(std::move(root));
        }
    }
}

std::vector<std::string> PathSandbox::canonical_roots(const std::vector<std::string>& dirs,
                                                      std::vector<std::string>* skipped) {
    std::vector<std::string> result;
    for (const auto& dir : dirs) {
        std::string expanded = expand_home(trim(dir));
        if (expanded.empty()) continue;

        std::error_code ec;
        fs::path abs = fs::absolute(expanded, ec);
        fs::path real;
        if (!ec) real = fs::canonical(abs, ec);
        if (ec || !fs::is_directory(real, ec) || ec) {
            if (skipped) skipped->push_back(dir);
            continue;
        }

        std::string root = strip_trailing_separator(real.lexically_normal().string());
        if (std::find(result.begin(), result.end(), root) == result.end()) {
            result.push_back(std::move(root));
        }
    }
    return result;
}

std::string resolve_existing_prefix(const std::string& absolute, const std::string& candidate) {
    fs::path abs(absolute);
    fs::path existing = abs.root_path();
    std::vector<fs::path> remaining;
    bool broken = false;

    for (const auto& part : abs.relative_path()) {
        if (part.empty() || part == ".") continue;
        if (broken) {
            if (part != "..") {
                remaining.push_back(part);
                continue;
            }
            // ".." cancels a missing component; once the tail is gone the
            // walk is back on existing ground and resolves physically again
            remaining.pop_back();
            if (remaining.empty()) broken = false;
            continue;
        }
        if (part == "..") {
            // existing is already physical, so its lexical parent is the real parent
            existing = existing.parent_path();
            continue;
        }

        fs::path next = existing / part;
        std::error_code ec;
        fs::file_status st = fs::symlink_status(next, ec);
        if (ec || !fs::exists(st)) {
            broken = true;
            remaining.push_back(part);
            continue;
        }

        fs::path real = fs::canonical(next, ec);
        if (ec) {
            // dangling or looping symlink on an existing component
            throw AccessDenied(candidate);
        }
        existing = real;
    }

    fs::path result = existing;
    for (const auto& part : remaining) {
        result /= part;
    }
    return result.lexically_normal().string();
}

std::string PathSandbox::resolve(const std::string& candidate, const std::string& base) const {
    if (candidate.empty()) throw AccessDenied(candidate);

    fs::path path(expand_home(candidate));
    if (path.is_relative()) {
        fs::path base_dir;
        if (!base.empty()) {
            base_dir = base;
        } else {
            std::error_code ec;
            base_dir = fs::current_path(ec);
            if (ec) throw AccessDenied(candidate);
        }
        path = base_dir / path;
    }

    std::error_code ec;
    fs::path real = fs::canonical(path, ec);
    std::string resolved = ec ? resolve_existing_prefix(path.string(), candidate)
                              : real.string();

    resolved = strip_trailing_separator(fs::path(resolved).lexically_normal().string());
    if (!contains(resolved)) {
        throw AccessDenied(candidate);
    }
    return resolved;
}

bool PathSandbox::allows(const std::string& candidate, const std::string& base) const {
    try {
        resolve(candidate, base);
        return true;
    } catch (const AccessDenied&) {
        return false;
    }
}

bool PathSandbox::contains(const std::string& resolved) const {
    for (const auto& root : roots_) {
        if (root == "/") return true;
        if (resolved == root) return true;
        if (resolved.size() > root.size() &&
            resolved.compare(0, root.size(), root) == 0 &&
            resolved[root.size()] == '/') {
            return true;
        }
    }
    return false;
}

} // namespace toolbelt
