#include <cassert>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "session/kernel.hpp"

using vshell::ConsoleSession;
using vshell::ExecutionResult;
using vshell::Kernel;
using vshell::ShellConfig;

namespace {

struct Shell {
    std::ostringstream log;
    Kernel kernel;
    ConsoleSession &session;

    Shell() : kernel(config(), log), session(open(kernel)) {}

    static ShellConfig config() {
        ShellConfig config;
        config.persist = false;
        return config;
    }

    static ConsoleSession &open(Kernel &kernel) {
        auto booted = kernel.boot();
        assert(booted.has_value());
        return kernel.create_session();
    }

    ExecutionResult run(std::string_view line) { return session.execute(line); }

    // Runs a line that must succeed and returns its stdout.
    std::string out(std::string_view line) {
        auto result = session.execute(line);
        assert(result.ok());
        return result.out;
    }
};

void test_echo() {
    Shell shell;
    assert(shell.out("echo hello   world") == "hello world\n");
    assert(shell.out("echo -n no newline") == "no newline");
    assert(shell.out("echo -e 'a\\tb\\nc'") == "a\tb\nc\n");
    assert(shell.out("echo 'a\\tb'") == "a\\tb\n");
    assert(shell.out("echo") == "\n");
}

void test_cd_and_pwd() {
    Shell shell;
    assert(shell.out("pwd") == "/home/user\n");

    assert(shell.out("cd /tmp") == "");
    assert(shell.out("pwd") == "/tmp\n");
    assert(shell.out("cd -") == "/home/user\n");
    assert(shell.out("cd /tmp; cd; pwd") == "/home/user\n");
    assert(shell.out("cd ~/; pwd") == "/home/user\n");

    auto missing = shell.run("cd missing");
    assert(missing.exit_code == 1);
    assert(missing.err == "cd: missing: No such file or directory\n");

    auto file = shell.run("cd README.txt");
    assert(file.err == "cd: README.txt: Not a directory\n");
}

void test_cd_dash_without_oldpwd() {
    Shell shell;
    auto result = shell.run("cd -");
    assert(result.exit_code == 1);
    assert(result.err == "cd: OLDPWD not set\n");
}

void test_ls() {
    Shell shell;
    assert(shell.out("mkdir docs; touch .hidden notes.txt") == "");

    assert(shell.out("ls") == "README.txt\ndocs\nnotes.txt\n");
    assert(shell.out("ls -a") == ".\n..\n.hidden\nREADME.txt\ndocs\nnotes.txt\n");
    assert(shell.out("ls -r") == "notes.txt\ndocs\nREADME.txt\n");
    assert(shell.out("ls notes.txt") == "notes.txt\n");
    assert(shell.out("ls docs notes.txt") == "notes.txt\n\ndocs:\n");

    const std::string long_listing = shell.out("ls -l docs/..");
    assert(long_listing.starts_with("total "));
    assert(long_listing.find("drwxr-xr-x  2 user user      0 ") != std::string::npos);
    assert(long_listing.find("-rw-r--r--  1 user user      0 ") != std::string::npos);

    assert(shell.out("ln -s notes.txt link; ls -l link").ends_with(" link -> notes.txt\n"));

    auto missing = shell.run("ls nope");
    assert(missing.exit_code == 2);
    assert(missing.err == "ls: cannot access 'nope': No such file or directory\n");

    assert(shell.run("ls -z").exit_code == 2);
}

void test_mkdir_rmdir_rm() {
    Shell shell;

    assert(shell.run("mkdir a/b").exit_code == 1);
    assert(shell.out("mkdir -p a/b/c") == "");
    assert(shell.out("mkdir -p a/b") == "");
    assert(shell.out("mkdir -m 700 private; stat private").find("Access: (0700/drwx------)") != std::string::npos);

    auto exists = shell.run("mkdir a");
    assert(exists.err == "mkdir: cannot create directory 'a': File exists\n");

    auto not_empty = shell.run("rmdir a");
    assert(not_empty.err == "rmdir: failed to remove 'a': Directory not empty\n");
    assert(shell.out("rmdir a/b/c") == "");

    auto directory = shell.run("rm a");
    assert(directory.err == "rm: cannot remove 'a': Is a directory\n");
    assert(shell.out("rm -r a") == "");
    assert(!shell.kernel.vfs().exists("/home/user/a"));

    assert(shell.run("rm ghost").exit_code == 1);
    assert(shell.out("rm -f ghost") == "");
}

void test_touch_cat_and_redirects() {
    Shell shell;
    assert(shell.out("echo hello > f.txt") == "");
    assert(shell.out("cat f.txt") == "hello\n");
    assert(shell.out("touch f.txt; cat f.txt") == "hello\n");
    assert(shell.out("echo world >> f.txt; cat -n f.txt") == "     1\thello\n     2\tworld\n");
    assert(shell.out("cat -E f.txt") == "hello$\nworld$\n");
    assert(shell.out("cat f.txt f.txt | wc -l") == "      4\n");

    auto partial = shell.run("cat missing f.txt");
    assert(partial.exit_code == 1);
    assert(partial.out == "hello\nworld\n");
    assert(partial.err == "cat: missing: No such file or directory\n");
}

void test_cp_and_mv() {
    Shell shell;
    assert(shell.out("echo data > f; mkdir d") == "");

    assert(shell.out("cp f g; cat g") == "data\n");
    assert(shell.out("cp f d; cat d/f") == "data\n");

    auto directory = shell.run("cp d e");
    assert(directory.exit_code == 1);
    assert(directory.err == "cp: 'd': Is a directory\n");

    assert(shell.out("cp -r d e; cat e/f") == "data\n");

    assert(shell.out("mv g h; cat h") == "data\n");
    assert(!shell.kernel.vfs().exists("/home/user/g"));

    assert(shell.out("mv h e; ls e") == "f\nh\n");

    auto into_itself = shell.run("mv d d/inner");
    assert(into_itself.err == "mv: cannot move or copy 'd' into itself\n");

    auto not_directory = shell.run("cp f e/f f");
    assert(not_directory.err == "cp: target 'f' is not a directory\n");
}

void test_mv_across_mounts() {
    Shell shell;
    assert(shell.out("mount /mnt/scratch; echo moved > f; mv f /mnt/scratch") == "");
    assert(shell.out("cat /mnt/scratch/f") == "moved\n");
    assert(!shell.kernel.vfs().exists("/home/user/f"));
}

void test_links() {
    Shell shell;
    assert(shell.out("echo target > t; ln -s t l; readlink l; cat l") == "t\ntarget\n");

    auto exists = shell.run("ln -s t l");
    assert(exists.exit_code == 1);
    assert(shell.out("ln -sf README.txt l; readlink l") == "README.txt\n");

    auto hard = shell.run("ln t hard");
    assert(hard.err == "ln: hard links are not supported, use -s\n");

    assert(shell.run("readlink t").exit_code == 1);
}

void test_chmod_chown_stat() {
    Shell shell;
    assert(shell.out("touch f; chmod 640 f; chown alice:staff f") == "");

    const std::string status = shell.out("stat f");
    assert(status.starts_with("  File: f\n"));
    assert(status.find("Type: regular file") != std::string::npos);
    assert(status.find("Access: (0640/-rw-r-----)  Uid: alice  Gid: staff") != std::string::npos);

    assert(shell.out("chown bob f; stat f").find("Uid: bob  Gid: staff") != std::string::npos);

    assert(shell.run("chmod 999 f").exit_code == 2);
    assert(shell.run("chmod 644 nope").err == "chmod: cannot access 'nope': No such file or directory\n");
    assert(shell.run("stat nope").exit_code == 1);
}

void test_find() {
    Shell shell;
    assert(shell.out("mkdir -p src/lib; touch src/main.cpp src/lib/util.cpp src/lib/util.hpp") == "");

    assert(shell.out("find src") == "src\nsrc/lib\nsrc/lib/util.cpp\nsrc/lib/util.hpp\nsrc/main.cpp\n");
    assert(shell.out("find src -name '*.cpp'") == "src/lib/util.cpp\nsrc/main.cpp\n");
    assert(shell.out("find src -type d") == "src\nsrc/lib\n");
    assert(shell.out("find src -maxdepth 1") == "src\nsrc/lib\nsrc/main.cpp\n");

    assert(shell.run("find src -type x").exit_code == 2);
    assert(shell.run("find src -bogus").exit_code == 2);
}

void test_mount_and_umount() {
    Shell shell;
    assert(shell.out("mount -r /mnt/ro") == "");
    assert(shell.out("mount") == "memory on / type memory (rw)\nmemory on /mnt/ro type memory (ro)\n");

    auto denied = shell.run("touch /mnt/ro/file");
    assert(denied.err == "touch: cannot touch '/mnt/ro/file': Permission denied\n");

    assert(shell.run("mount -t s3 /mnt/other").exit_code == 2);

    assert(shell.out("umount /mnt/ro") == "");
    auto unknown = shell.run("umount /mnt/ro");
    assert(unknown.err == "umount: /mnt/ro: No such file or directory\n");
}

void test_text_filters() {
    Shell shell;
    assert(shell.out("echo -e 'apple\\nbanana\\ncherry\\nAvocado' > fruits") == "");

    assert(shell.out("grep an fruits") == "banana\n");
    assert(shell.out("grep -n an fruits") == "2:banana\n");
    assert(shell.out("grep -c A fruits") == "1\n");
    assert(shell.out("grep -ic A fruits") == "3\n");
    assert(shell.out("grep -v a fruits") == "cherry\n");
    assert(shell.out("cat fruits | grep '^b'") == "banana\n");
    assert(shell.out("grep an fruits fruits") == "fruits:banana\nfruits:banana\n");
    assert(shell.run("grep zzz fruits").exit_code == 1);
    assert(shell.run("grep '(' fruits").exit_code == 2);

    assert(shell.out("head -n 2 fruits") == "apple\nbanana\n");
    assert(shell.out("tail -n 1 fruits") == "Avocado\n");
    assert(shell.out("tail -2 fruits") == "cherry\nAvocado\n");
    assert(shell.out("cat fruits | head -n 1") == "apple\n");

    assert(shell.out("wc fruits") == "      4       4      28 fruits\n");
    assert(shell.out("wc -l < fruits") == "      4\n");
}

void test_grep_long_lines_and_unsafe_patterns() {
    Shell shell;
    const std::string long_line(200000, 'a');
    assert(shell.kernel.vfs().write_file("/home/user/long", long_line + "\nshort\n").has_value());

    // Plain text patterns never reach the regex engine.
    assert(shell.out("grep -c aaa long") == "1\n");
    assert(shell.out("grep -ic SHORT long") == "1\n");

    auto regex = shell.run("grep '.*' long");
    assert(regex.exit_code == 2);
    assert(regex.out.empty());
    assert(regex.err == "grep: long: line 1 is longer than 2048 bytes, use a plain text pattern\n");

    auto counted = shell.run("grep -c 'a+b' long");
    assert(counted.exit_code == 2);
    assert(counted.out.empty());

    // Nested and stacked quantifiers are matched as text.
    assert(shell.out("echo '(a+)+' > odd; grep '(a+)+' odd") == "(a+)+\n");
    assert(shell.run("grep 'a**' odd").exit_code == 1);

    auto oversized = shell.run("grep " + std::string(1001, 'x') + " odd");
    assert(oversized.exit_code == 2);
    assert(oversized.err == "grep: pattern too long (max 1000 characters)\n");
}

void test_environment_builtins() {
    Shell shell;
    assert(shell.out("export GREETING=hi; echo $GREETING") == "hi\n");
    assert(shell.out("env | grep GREETING") == "GREETING=hi\n");
    assert(shell.out("export -p | grep GREETING") == "export GREETING='hi'\n");

    assert(shell.out("LOCAL=1 export LOCAL; echo $LOCAL") == "1\n");

    auto invalid = shell.run("export 1abc=2");
    assert(invalid.exit_code == 1);
    assert(invalid.err == "export: '1abc=2': not a valid identifier\n");

    assert(shell.out("unset GREETING; echo \"[$GREETING]\"") == "[]\n");
}

void test_alias_and_type() {
    Shell shell;
    assert(shell.out("alias greet='echo hello'") == "");
    assert(shell.out("greet world") == "hello world\n");
    assert(shell.out("alias") == "alias greet='echo hello'\n");
    assert(shell.out("alias greet") == "alias greet='echo hello'\n");

    assert(shell.out("type greet") == "greet is aliased to `echo hello'\n");
    assert(shell.out("type echo") == "echo is a shell builtin\n");
    auto unknown = shell.run("type nope");
    assert(unknown.exit_code == 1);
    assert(unknown.out == "nope: not found\n");

    assert(shell.run("alias foo='nope'").err == "alias: nope: unknown command\n");
    assert(shell.run("alias echo='ls'").err == "alias: echo: name is already a command\n");

    assert(shell.out("unalias greet") == "");
    assert(shell.run("greet").exit_code == 127);
    assert(shell.run("unalias greet").err == "unalias: greet: not found\n");
}

void test_which() {
    Shell shell;
    assert(shell.out("which cat") == "cat: shell built-in command\n");

    assert(shell.out("echo '#!' > /usr/bin/tool; chmod 755 /usr/bin/tool; which tool") == "/usr/bin/tool\n");
    assert(shell.out("touch /usr/bin/cat; chmod 755 /usr/bin/cat; which -a cat") ==
           "cat: shell built-in command\n/usr/bin/cat\n");

    auto missing = shell.run("which nope");
    assert(missing.exit_code == 1);
    assert(missing.err == "which: nope: not found\n");
}

void test_history_builtin() {
    Shell shell;
    shell.run("echo one");
    shell.run("echo two");

    assert(shell.out("history") == "    1  echo one\n    2  echo two\n    3  history\n");
    assert(shell.out("history 1") == "    4  history 1\n");
    assert(shell.run("history x").exit_code == 1);

    assert(shell.out("history -w /tmp/saved") == "");
    assert(shell.kernel.vfs().read_file("/tmp/saved").value().starts_with("echo one\necho two\n"));

    assert(shell.out("history -c") == "");
    assert(shell.session.history().empty());

    assert(shell.out("history -r /tmp/saved") == "");
    assert(shell.session.history().at(0) == "history -r /tmp/saved");
    assert(shell.session.history().at(1) == "echo one");
}

void test_help() {
    Shell shell;
    const std::string listing = shell.out("help");
    assert(listing.starts_with("Available commands:\n"));
    assert(listing.find("  mkdir ") != std::string::npos);

    assert(shell.out("help cd") == "cd: cd [DIR | - | ~]\n    Change the working directory\n");
    assert(shell.run("help nope").exit_code == 1);
}

void test_date() {
    Shell shell;
    assert(shell.out("date +%Y").size() == 5);
    assert(shell.out("date -I").find('T') == 10);
    assert(shell.run("date +{}").exit_code == 2);
    assert(shell.run("date yesterday").exit_code == 2);
}

void test_conditionals() {
    Shell shell;
    assert(shell.out("mkdir dir; echo data > file; touch empty; ln -s file link") == "");

    assert(shell.run("test -e file").exit_code == 0);
    assert(shell.run("test -e ghost").exit_code == 1);
    assert(shell.run("test -d dir").exit_code == 0);
    assert(shell.run("test -d file").exit_code == 1);
    assert(shell.run("test -f file").exit_code == 0);
    assert(shell.run("test -f dir").exit_code == 1);
    assert(shell.run("test -s file").exit_code == 0);
    assert(shell.run("test -s empty").exit_code == 1);
    assert(shell.run("test -L link").exit_code == 0);
    assert(shell.run("test -L file").exit_code == 1);

    assert(shell.run("test abc = abc").exit_code == 0);
    assert(shell.run("test abc = abd").exit_code == 1);
    assert(shell.run("test abc != abd").exit_code == 0);
    assert(shell.run("test -z \"$NOPE\"").exit_code == 0);
    assert(shell.run("test -n word").exit_code == 0);
    assert(shell.run("test word").exit_code == 0);
    assert(shell.run("test").exit_code == 1);
    assert(shell.run("test ! -e ghost").exit_code == 0);

    assert(shell.run("test 10 -eq 10").exit_code == 0);
    assert(shell.run("test 3 -lt 10").exit_code == 0);
    assert(shell.run("test 10 -lt 3").exit_code == 1);
    assert(shell.run("test -2 -ge -5").exit_code == 0);

    auto not_a_number = shell.run("test ten -eq 10");
    assert(not_a_number.exit_code == 2);
    assert(not_a_number.err == "test: ten: integer expression expected\n");

    auto unknown = shell.run("test a -like b");
    assert(unknown.exit_code == 2);
    assert(unknown.err == "test: -like: binary operator expected\n");

    assert(shell.run("[ -d dir ]").exit_code == 0);
    assert(shell.run("[ 1 -eq 2 ]").exit_code == 1);

    auto unclosed = shell.run("[ -d dir");
    assert(unclosed.exit_code == 2);
    assert(unclosed.err == "[: missing ']'\n");

    assert(shell.out("[ -d dir ] && echo yes || echo no") == "yes\n");
    assert(shell.out("test -f dir && echo yes || echo no") == "no\n");
}

void test_true_false_clear() {
    Shell shell;
    assert(shell.run("true").exit_code == 0);
    assert(shell.run("false").exit_code == 1);
    assert(shell.out("clear") == "\x1b[2J\x1b[H");
}

} // namespace

int main() {
    test_echo();
    test_cd_and_pwd();
    test_cd_dash_without_oldpwd();
    test_ls();
    test_mkdir_rmdir_rm();
    test_touch_cat_and_redirects();
    test_cp_and_mv();
    test_mv_across_mounts();
    test_links();
    test_chmod_chown_stat();
    test_find();
    test_mount_and_umount();
    test_text_filters();
    test_grep_long_lines_and_unsafe_patterns();
    test_environment_builtins();
    test_alias_and_type();
    test_which();
    test_history_builtin();
    test_help();
    test_date();
    test_conditionals();
    test_true_false_clear();

    return 0;
}
