#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace toolbelt {

// Thrown when a candidate path resolves outside every allowed root, or cannot
// be resolved at all. Carries the candidate exactly as the caller supplied it.
class AccessDenied : public std::runtime_error {
public:
    explicit AccessDenied(const std::string& candidate)
        : std::runtime_error("path outside allowed directories: " + candidate),
          candidate_(candidate) {}

    const std::string& candidate() const { return candidate_; }

private:
    std::string candidate_;
};

// Containment check for user-supplied paths against a fixed set of roots.
//
// Roots are canonical absolute directories. A candidate is accepted iff its
// symlink-resolved, lexically clean form equals a root or lies below one on a
// path-separator boundary. Candidates that do not exist yet are resolved
// through their longest existing prefix, so a symlinked directory partway
// down a not-yet-created path cannot redirect a write outside the roots.
class PathSandbox {
public:
    PathSandbox() = default;

    // Roots must already be canonical (see canonical_roots()).
    explicit PathSandbox(std::vector<std::string> roots);

    // Canonicalize candidate root directories: expand "~", make absolute,
    // resolve symlinks, strip trailing separators. Entries that do not exist
    // or are not directories are dropped and reported through `skipped`.
    static std::vector<std::string> canonical_roots(
        const std::vector<std::string>& dirs,
        std::vector<std::string>* skipped = nullptr);

    // Resolve and check a candidate. Relative candidates are taken against
    // `base` when given, otherwise against the current working directory.
    // Throws AccessDenied on rejection.
    std::string resolve(const std::string& candidate, const std::string& base = "") const;

    // Non-throwing form of resolve().
    bool allows(const std::string& candidate, const std::string& base = "") const;

    // True if an already-resolved path is a root or below one.
    bool contains(const std::string& resolved) const;

    const std::vector<std::string>& roots() const { return roots_; }
    bool empty() const { return roots_.empty(); }

private:
    std::vector<std::string> roots_;
};

// Resolve symlinks on the longest existing prefix of an absolute path and
// re-append the remaining components unresolved. ".." inside the existing
// prefix is applied to the physical (resolved) parent, never lexically.
// Throws AccessDenied if an existing component cannot be resolved.
std::string resolve_existing_prefix(const std::string& absolute, const std::string& candidate);

} // namespace toolbelt
