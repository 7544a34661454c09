#include <cassert>
#include <memory>
#include <string>
#include <vector>

#include "core/command.hpp"
#include "execution/redirection.hpp"
#include "vfs/memory_provider.hpp"
#include "vfs/vfs.hpp"

using vshell::FsErrorCode;
using vshell::Redirection;
using vshell::RedirectionKind;
using vshell::RedirectionSet;
using vshell::VirtualFileSystem;

namespace {

VirtualFileSystem make_vfs() {
    VirtualFileSystem vfs(std::make_unique<vshell::MemoryProvider>());
    assert(vfs.create_dir("/work").has_value());
    return vfs;
}

Redirection to_file(RedirectionKind kind, std::string path, int source = 1) {
    return Redirection{.kind = kind, .target = std::move(path), .source_descriptor = source};
}

void test_stdout_redirection_truncates_before_the_run() {
    auto vfs = make_vfs();
    assert(vfs.write_file("/work/out.txt", "stale").has_value());

    std::vector<Redirection> redirections{to_file(RedirectionKind::Output, "out.txt")};
    auto set = RedirectionSet::open(vfs, "/work", redirections);
    assert(set.has_value());
    assert(set->redirects_stdout());
    assert(vfs.read_file("/work/out.txt").value().empty());

    std::string out;
    std::string err;
    assert(set->route("hello\n", "oops\n", out, err).has_value());
    assert(out.empty());
    assert(err == "oops\n");
    assert(vfs.read_file("/work/out.txt").value() == "hello\n");
}

void test_append_keeps_existing_content() {
    auto vfs = make_vfs();
    assert(vfs.write_file("/work/log", "one\n").has_value());

    std::vector<Redirection> redirections{to_file(RedirectionKind::Append, "/work/log")};
    auto set = RedirectionSet::open(vfs, "/", redirections);
    assert(set.has_value());

    std::string out;
    std::string err;
    assert(set->route("two\n", "", out, err).has_value());
    assert(vfs.read_file("/work/log").value() == "one\ntwo\n");
}

void test_stderr_redirection_and_append() {
    auto vfs = make_vfs();

    std::vector<Redirection> first{to_file(RedirectionKind::Error, "errors", 2)};
    auto truncating = RedirectionSet::open(vfs, "/work", first);
    assert(truncating.has_value());
    assert(!truncating->redirects_stdout());

    std::string out;
    std::string err;
    assert(truncating->route("visible\n", "first error line\n", out, err).has_value());
    assert(out == "visible\n");
    assert(err.empty());

    std::vector<Redirection> second{to_file(RedirectionKind::ErrorAppend, "errors", 2)};
    auto appending = RedirectionSet::open(vfs, "/work", second);
    assert(appending.has_value());
    assert(appending->route("", "second error line\n", out, err).has_value());

    assert(vfs.read_file("/work/errors").value() == "first error line\nsecond error line\n");
}

void test_stderr_duplicated_into_stdout_file() {
    auto vfs = make_vfs();

    std::vector<Redirection> redirections{
        to_file(RedirectionKind::Output, "both"),
        Redirection{.kind = RedirectionKind::Error, .target = 1, .source_descriptor = 2},
    };
    auto set = RedirectionSet::open(vfs, "/work", redirections);
    assert(set.has_value());

    std::string out;
    std::string err;
    assert(set->route("out\n", "err\n", out, err).has_value());
    assert(out.empty());
    assert(err.empty());
    assert(vfs.read_file("/work/both").value() == "out\nerr\n");
}

void test_input_redirection() {
    auto vfs = make_vfs();
    assert(vfs.write_file("/work/in.txt", "line 1\nline 2\n").has_value());

    std::vector<Redirection> redirections{to_file(RedirectionKind::Input, "in.txt", 0)};
    auto set = RedirectionSet::open(vfs, "/work", redirections);
    assert(set.has_value());
    assert(set->input() == "line 1\nline 2\n");

    std::vector<Redirection> missing{to_file(RedirectionKind::Input, "nope.txt", 0)};
    auto failed = RedirectionSet::open(vfs, "/work", missing);
    assert(!failed.has_value());
    assert(failed.error().code == FsErrorCode::NotFound);
}

void test_invalid_redirection_path_reports_error() {
    auto vfs = make_vfs();

    std::vector<Redirection> redirections{to_file(RedirectionKind::Output, "/no/such/directory/out.txt")};
    auto set = RedirectionSet::open(vfs, "/", redirections);
    assert(!set.has_value());
    assert(set.error().code == FsErrorCode::NotFound);
    assert(!set.error().message().empty());

    std::vector<Redirection> into_directory{to_file(RedirectionKind::Output, "/work")};
    assert(RedirectionSet::open(vfs, "/", into_directory).error().code == FsErrorCode::IsDirectory);
}

void test_unknown_descriptor_is_rejected() {
    auto vfs = make_vfs();

    std::vector<Redirection> redirections{Redirection{.kind = RedirectionKind::Output, .target = 7, .source_descriptor = 1}};
    auto set = RedirectionSet::open(vfs, "/", redirections);
    assert(!set.has_value());
    assert(set.error().code == FsErrorCode::InvalidPath);
}

} // namespace

int main() {
    test_stdout_redirection_truncates_before_the_run();
    test_append_keeps_existing_content();
    test_stderr_redirection_and_append();
    test_stderr_duplicated_into_stdout_file();
    test_input_redirection();
    test_invalid_redirection_path_reports_error();
    test_unknown_descriptor_is_rejected();

    return 0;
}
