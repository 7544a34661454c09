#include <cassert>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "session/expander.hpp"
#include "vfs/memory_provider.hpp"
#include "vfs/vfs.hpp"

using vshell::Assignment;
using vshell::EnvironmentMap;
using vshell::Expander;
using vshell::ExpansionScope;
using vshell::Quoting;
using vshell::Word;
using vshell::WordPart;

namespace {

using Fields = std::vector<std::string>;

Word word(std::string text, Quoting quoting = Quoting::None, bool substitution = false) {
    return Word{.parts = {WordPart{.text = std::move(text), .quoting = quoting, .substitution = substitution}}};
}

const EnvironmentMap kEnvironment{{"HOME", "/home/user"}, {"NAME", "world"}, {"EMPTY", ""}, {"LIST", "a b  c"}};

ExpansionScope make_scope() {
    return ExpansionScope{.environment = kEnvironment, .home = "/home/user", .cwd = "/home/user", .last_exit_code = 3};
}

void test_variables() {
    Expander expander(make_scope());

    assert(expander.expand_text("hello $NAME") == "hello world");
    assert(expander.expand_text("${NAME}s") == "worlds");
    assert(expander.expand_text("${MISSING:-fallback}") == "fallback");
    assert(expander.expand_text("${NAME:-fallback}") == "world");
    assert(expander.expand_text("status $?") == "status 3");
    assert(expander.expand_text("\\$NAME") == "$NAME");
    assert(expander.expand_text("cost $5") == "cost $5");
    assert(expander.expand_text("$MISSING") == "");
}

void test_tilde() {
    Expander expander(make_scope());

    assert(expander.expand_tilde("~") == "/home/user");
    assert(expander.expand_tilde("~/docs") == "/home/user/docs");
    assert(expander.expand_tilde("a~b") == "a~b");
    assert(expander.expand_word(word("~/x")) == Fields({"/home/user/x"}));
    assert(expander.expand_word(word("~", Quoting::Single)) == Fields({"~"}));
}

void test_quoting() {
    Expander expander(make_scope());

    assert(expander.expand_word(word("$NAME", Quoting::Single)) == Fields({"$NAME"}));
    assert(expander.expand_word(word("$LIST", Quoting::Double)) == Fields({"a b  c"}));
    assert(expander.expand_word(word("$LIST", Quoting::None, true)) == Fields({"a", "b", "c"}));
    assert(expander.expand_word(word("$EMPTY", Quoting::None, true)).empty());
    assert(expander.expand_word(word("$EMPTY", Quoting::Double)) == Fields({""}));
}

void test_adjacent_parts_form_one_word() {
    Expander expander(make_scope());

    Word joined{.parts = {
                    WordPart{.text = "$NAME", .quoting = Quoting::Double, .substitution = true},
                    WordPart{.text = "/file", .quoting = Quoting::None, .substitution = false},
                }};
    assert(expander.expand_word(joined) == Fields({"world/file"}));
}

void test_command_substitution() {
    std::vector<std::string> bodies;
    ExpansionScope scope = make_scope();
    scope.substitute = [&bodies](std::string_view body) {
        bodies.emplace_back(body);
        return std::string("one two\n\n");
    };
    Expander expander(std::move(scope));

    assert(expander.expand_text("[$(echo hi)]") == "[one two]");
    assert(expander.expand_text("[`pwd`]") == "[one two]");
    assert(expander.expand_text("$(echo $(inner))") == "one two");
    assert(bodies == Fields({"echo hi", "pwd", "echo $(inner)"}));

    assert(expander.expand_word(word("$(list)", Quoting::None, true)) == Fields({"one", "two"}));
}

void test_substitution_without_runner_is_empty() {
    Expander expander(make_scope());
    assert(expander.expand_text("a$(echo x)b") == "ab");
}

void test_assignments() {
    Expander expander(make_scope());

    assert(expander.expand_assignment(Assignment{.name = "X", .value = "~/$NAME"}) == "/home/user/world");
    assert(expander.expand_assignment(Assignment{.name = "X", .value = "$NAME", .quoting = Quoting::Single}) == "$NAME");
}

void test_globbing_against_the_filesystem() {
    vshell::VirtualFileSystem vfs(std::make_unique<vshell::MemoryProvider>());
    assert(vfs.create_dir("/home/user/docs", vshell::CreateDirOptions{.recursive = true}).has_value());
    assert(vfs.write_file("/home/user/a.txt", "").has_value());
    assert(vfs.write_file("/home/user/b.txt", "").has_value());
    assert(vfs.write_file("/home/user/docs/c.txt", "").has_value());

    ExpansionScope scope = make_scope();
    scope.vfs = &vfs;
    Expander expander(std::move(scope));

    assert(expander.expand_word(word("*.txt")) == Fields({"a.txt", "b.txt"}));
    assert(expander.expand_word(word("docs/*.txt")) == Fields({"docs/c.txt"}));
    assert(expander.expand_word(word("/home/user/*.txt")) == Fields({"/home/user/a.txt", "/home/user/b.txt"}));
    assert(expander.expand_word(word("*.md")) == Fields({"*.md"}));
    assert(expander.expand_word(word("*.txt", Quoting::Double)) == Fields({"*.txt"}));

    const auto fields = expander.expand_words({word("echo"), word("*.txt")});
    assert(fields == Fields({"echo", "a.txt", "b.txt"}));
}

} // namespace

int main() {
    test_variables();
    test_tilde();
    test_quoting();
    test_adjacent_parts_form_one_word();
    test_command_substitution();
    test_substitution_without_runner_is_empty();
    test_assignments();
    test_globbing_against_the_filesystem();

    return 0;
}
