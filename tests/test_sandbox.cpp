#include <catch2/catch_test_macros.hpp>
#include "sandbox.hpp"
#include "test_support.hpp"
#include <filesystem>

using namespace toolbelt;
using namespace toolbelt_test;
namespace fs = std::filesystem;

// Layout shared by most tests:
//   <tmp>/sandbox            allowed root
//   <tmp>/sandbox/sub/a.txt
//   <tmp>/sandbox/link   ->  <tmp>/outside
//   <tmp>/sandbox2           sibling sharing the root as a string prefix
//   <tmp>/outside/secret.txt
struct SandboxFixture {
    TempDir tmp;
    std::string root;
    std::string outside;

    SandboxFixture() {
        root = tmp / "sandbox";
        outside = tmp / "outside";
        write_file(root + "/sub/a.txt", "a");
        write_file(outside + "/secret.txt", "secret");
        write_file(tmp / "sandbox2/x", "x");
        fs::create_directory_symlink(outside, root + "/link");
    }

    PathSandbox sandbox() const { return PathSandbox({root}); }
};

// ── Containment ─────────────────────────────────────────────────

TEST_CASE("PathSandbox: accepts the root itself and descendants", "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    REQUIRE(sb.resolve(f.root) == f.root);
    REQUIRE(sb.resolve(f.root + "/sub") == f.root + "/sub");
    REQUIRE(sb.resolve(f.root + "/sub/a.txt") == f.root + "/sub/a.txt");
}

TEST_CASE("PathSandbox: rejects sibling sharing the root as string prefix", "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    REQUIRE_THROWS_AS(sb.resolve(f.tmp / "sandbox2/x"), AccessDenied);
    REQUIRE_FALSE(sb.allows(f.tmp / "sandbox2"));
}

TEST_CASE("PathSandbox: rejects paths outside every root", "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    REQUIRE_FALSE(sb.allows("/etc/passwd"));
    REQUIRE_FALSE(sb.allows(f.outside + "/secret.txt"));
    REQUIRE_FALSE(sb.allows(f.tmp.path));
}

TEST_CASE("PathSandbox: dot-dot escape is rejected", "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    REQUIRE_FALSE(sb.allows(f.root + "/../etc/passwd"));
    REQUIRE_FALSE(sb.allows(f.root + "/../../../../../../etc/passwd"));
    REQUIRE_FALSE(sb.allows(f.root + "/sub/../../outside/secret.txt"));
}

TEST_CASE("PathSandbox: dot-dot that stays inside is accepted", "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    REQUIRE(sb.resolve(f.root + "/sub/../sub/a.txt") == f.root + "/sub/a.txt");
    REQUIRE(sb.resolve(f.root + "/./sub/./a.txt") == f.root + "/sub/a.txt");
}

// ── Symlinks ────────────────────────────────────────────────────

TEST_CASE("PathSandbox: symlink to outside is rejected", "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    REQUIRE_FALSE(sb.allows(f.root + "/link"));
    REQUIRE_FALSE(sb.allows(f.root + "/link/secret.txt"));
}

TEST_CASE("PathSandbox: non-existent leaf under a symlink to outside is rejected",
          "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    REQUIRE_FALSE(sb.allows(f.root + "/link/file.txt"));
    REQUIRE_FALSE(sb.allows(f.root + "/link/new/dir/file.txt"));
}

TEST_CASE("PathSandbox: dot-dot after a symlink uses the link target's parent",
          "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    // link/.. is <tmp>, not <root>; a lexical clean first would say <root>/...
    write_file(f.root + "/inside.txt", "in");
    REQUIRE_FALSE(sb.allows(f.root + "/link/../inside.txt"));
    REQUIRE_FALSE(sb.allows(f.root + "/link/../etc"));
    REQUIRE_FALSE(sb.allows(f.root + "/link/../sandbox2/x"));
}

TEST_CASE("PathSandbox: dot-dot over a missing component still resolves later symlinks",
          "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    REQUIRE_FALSE(sb.allows(f.root + "/missing/../link/secret.txt"));
    REQUIRE_FALSE(sb.allows(f.root + "/missing/../link/new.txt"));
    REQUIRE_FALSE(sb.allows(f.root + "/missing/deeper/../../link/secret.txt"));
    REQUIRE_FALSE(sb.allows("missing/../link/secret.txt", f.root));

    REQUIRE(sb.resolve(f.root + "/missing/../sub/a.txt") == f.root + "/sub/a.txt");
    REQUIRE(sb.resolve(f.root + "/missing/../sub/new.txt") == f.root + "/sub/new.txt");
    REQUIRE(sb.resolve(f.root + "/sub/missing/x/../y.txt") == f.root + "/sub/missing/y.txt");
}

TEST_CASE("PathSandbox: symlink that stays inside the root is accepted", "[sandbox]") {
    SandboxFixture f;
    fs::create_directory_symlink(f.root + "/sub", f.root + "/sublink");
    auto sb = f.sandbox();
    REQUIRE(sb.resolve(f.root + "/sublink/a.txt") == f.root + "/sub/a.txt");
    REQUIRE(sb.resolve(f.root + "/sublink/new.txt") == f.root + "/sub/new.txt");
}

TEST_CASE("PathSandbox: dangling symlink is rejected", "[sandbox]") {
    SandboxFixture f;
    fs::create_symlink(f.tmp / "nowhere", f.root + "/dangling");
    auto sb = f.sandbox();
    REQUIRE_FALSE(sb.allows(f.root + "/dangling"));
    REQUIRE_FALSE(sb.allows(f.root + "/dangling/file.txt"));
}

TEST_CASE("PathSandbox: root given through a symlink is canonicalized", "[sandbox]") {
    SandboxFixture f;
    fs::create_directory_symlink(f.root, f.tmp / "alias");
    auto roots = PathSandbox::canonical_roots({f.tmp / "alias"});
    REQUIRE(roots.size() == 1);
    REQUIRE(roots[0] == f.root);

    PathSandbox sb(roots);
    REQUIRE(sb.resolve(f.tmp / "alias/sub/a.txt") == f.root + "/sub/a.txt");
}

// ── Non-existent paths ──────────────────────────────────────────

TEST_CASE("PathSandbox: non-existent leaf with existing parent is accepted", "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    REQUIRE(sb.resolve(f.root + "/sub/new.txt") == f.root + "/sub/new.txt");
}

TEST_CASE("PathSandbox: several missing components are accepted", "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    REQUIRE(sb.resolve(f.root + "/x/y/z.txt") == f.root + "/x/y/z.txt");
}

TEST_CASE("PathSandbox: dot-dot inside the missing tail is cleaned", "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    REQUIRE(sb.resolve(f.root + "/x/../y.txt") == f.root + "/y.txt");
    REQUIRE_FALSE(sb.allows(f.root + "/x/../../escape.txt"));
}

// ── Relative candidates ─────────────────────────────────────────

TEST_CASE("PathSandbox: relative candidate resolves against base", "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    REQUIRE(sb.resolve("sub/a.txt", f.root) == f.root + "/sub/a.txt");
    REQUIRE(sb.resolve("a.txt", f.root + "/sub") == f.root + "/sub/a.txt");
    REQUIRE_FALSE(sb.allows("../outside/secret.txt", f.root));
}

TEST_CASE("PathSandbox: relative candidate resolves against working directory",
          "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    CwdGuard cwd(f.root + "/sub");
    REQUIRE(sb.resolve("a.txt") == f.root + "/sub/a.txt");
    REQUIRE(sb.resolve(".") == f.root + "/sub");
    REQUIRE_FALSE(sb.allows("../../outside"));
}

TEST_CASE("PathSandbox: home-relative candidate is expanded", "[sandbox]") {
    SandboxFixture f;
    EnvGuard home("HOME", f.root.c_str());
    auto sb = f.sandbox();
    REQUIRE(sb.resolve("~/sub/a.txt") == f.root + "/sub/a.txt");
    REQUIRE(sb.resolve("~") == f.root);
}

// ── Edge cases ──────────────────────────────────────────────────

TEST_CASE("PathSandbox: empty candidate is denied", "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    REQUIRE_THROWS_AS(sb.resolve(""), AccessDenied);
}

TEST_CASE("PathSandbox: trailing separator is stripped", "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    REQUIRE(sb.resolve(f.root + "/sub/") == f.root + "/sub");
}

TEST_CASE("PathSandbox: filesystem root allows everything", "[sandbox]") {
    PathSandbox sb({"/"});
    REQUIRE(sb.contains("/etc/passwd"));
    REQUIRE(sb.contains("/"));
}

TEST_CASE("PathSandbox: multiple roots", "[sandbox]") {
    SandboxFixture f;
    PathSandbox sb({f.root, f.outside});
    REQUIRE(sb.allows(f.outside + "/secret.txt"));
    REQUIRE(sb.allows(f.root + "/sub/a.txt"));
    REQUIRE_FALSE(sb.allows(f.tmp / "sandbox2/x"));
}

TEST_CASE("AccessDenied: carries the original candidate", "[sandbox]") {
    SandboxFixture f;
    auto sb = f.sandbox();
    try {
        sb.resolve("/etc/../etc/passwd");
        FAIL("expected AccessDenied");
    } catch (const AccessDenied& e) {
        REQUIRE(e.candidate() == "/etc/../etc/passwd");
        REQUIRE(std::string(e.what()) ==
                "path outside allowed directories: /etc/../etc/passwd");
    }
}

// ── canonical_roots ─────────────────────────────────────────────

TEST_CASE("canonical_roots: skips missing and non-directory entries", "[sandbox]") {
    SandboxFixture f;
    std::vector<std::string> skipped;
    auto roots = PathSandbox::canonical_roots(
        {f.root, f.tmp / "missing", f.root + "/sub/a.txt"}, &skipped);
    REQUIRE(roots.size() == 1);
    REQUIRE(roots[0] == f.root);
    REQUIRE(skipped.size() == 2);
}

TEST_CASE("canonical_roots: deduplicates and strips trailing separators", "[sandbox]") {
    SandboxFixture f;
    auto roots = PathSandbox::canonical_roots({f.root + "/", f.root, f.root + "/sub/.."});
    REQUIRE(roots.size() == 1);
    REQUIRE(roots[0] == f.root);
}

TEST_CASE("canonical_roots: expands home", "[sandbox]") {
    SandboxFixture f;
    EnvGuard home("HOME", f.tmp.path.c_str());
    auto roots = PathSandbox::canonical_roots({"~/sandbox"});
    REQUIRE(roots.size() == 1);
    REQUIRE(roots[0] == f.root);
}

TEST_CASE("resolve_existing_prefix: keeps missing tail unresolved", "[sandbox]") {
    SandboxFixture f;
    REQUIRE(resolve_existing_prefix(f.root + "/sub/missing/x.txt", "c") ==
            f.root + "/sub/missing/x.txt");
    REQUIRE(resolve_existing_prefix(f.root + "/link/missing", "c") ==
            f.outside + "/missing");
    REQUIRE(resolve_existing_prefix(f.root + "/missing/../link/secret.txt", "c") ==
            f.outside + "/secret.txt");
}
