#include <cassert>
#include <string>
#include <vector>

#include "vfs/glob.hpp"
#include "vfs/path.hpp"

namespace paths = vshell::paths;

namespace {

void test_resolve_normalizes() {
    assert(paths::resolve("/a/./b/../c//d/") == "/a/c/d");
    assert(paths::resolve("") == "/");
    assert(paths::resolve("/..") == "/");
    assert(paths::resolve("../../x") == "/x");
    assert(paths::resolve("relative/path") == "/relative/path");
}

void test_resolve_is_idempotent() {
    const std::vector<std::string> inputs{"/", "/a/b/../c", "x/./y", "/../..", "//a//b//", "/a/b/c/../../d"};
    for (const auto &input : inputs) {
        const std::string once = paths::resolve(input);
        assert(paths::resolve(once) == once);
    }
}

void test_resolve_from_base() {
    assert(paths::resolve_from("/home/user", "docs") == "/home/user/docs");
    assert(paths::resolve_from("/home/user", "../other") == "/home/other");
    assert(paths::resolve_from("/home/user", "/etc") == "/etc");
    assert(paths::resolve_from("/home/user", ".") == "/home/user");
}

void test_join_dirname_basename() {
    const std::vector<std::string> inputs{"/a/b/c.txt", "/x", "/deep/er/path"};
    for (const auto &input : inputs) {
        assert(paths::join(paths::dirname(input), paths::basename(input)) == paths::resolve(input));
    }

    assert(paths::dirname("/") == "/");
    assert(paths::dirname("/top") == "/");
    assert(paths::basename("/") == "");
    assert(paths::basename("/a/report.txt", ".txt") == "report");
    assert(paths::join("/a", "../b") == "/b");
}

void test_extname() {
    assert(paths::extname("/a/b.tar.gz") == ".gz");
    assert(paths::extname("/a/.profile") == "");
    assert(paths::extname("/a/noext") == "");
}

void test_split() {
    assert(paths::split("/a//b/c/") == std::vector<std::string>({"a", "b", "c"}));
    assert(paths::split("/").empty());
}

void test_is_within_and_relative_to() {
    assert(paths::is_within("/a/b", "/a"));
    assert(paths::is_within("/a", "/a"));
    assert(paths::is_within("/anything", "/"));
    assert(!paths::is_within("/ab", "/a"));
    assert(!paths::is_within("/a", "/a/b"));

    assert(paths::relative_to("/mnt/data/x", "/mnt/data") == "/x");
    assert(paths::relative_to("/mnt/data", "/mnt/data") == "/");
    assert(paths::relative_to("/x/y", "/") == "/x/y");
}

void test_wildcard_match() {
    assert(vshell::wildcard_match("*.txt", "notes.txt"));
    assert(!vshell::wildcard_match("*.txt", "notes.md"));
    assert(vshell::wildcard_match("a*b*c", "axxbyyc"));
    assert(vshell::wildcard_match("*", ""));
    assert(vshell::wildcard_match("exact", "exact"));
    assert(!vshell::wildcard_match("exact", "exactly"));
    assert(vshell::has_wildcard("*.log"));
    assert(!vshell::has_wildcard("plain"));
}

} // namespace

int main() {
    test_resolve_normalizes();
    test_resolve_is_idempotent();
    test_resolve_from_base();
    test_join_dirname_basename();
    test_extname();
    test_split();
    test_is_within_and_relative_to();
    test_wildcard_match();

    return 0;
}
