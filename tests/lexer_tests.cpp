#include <cassert>
#include <string>
#include <vector>

#include "core/lexer.hpp"

using vshell::Lexer;
using vshell::Quoting;
using vshell::Token;
using vshell::TokenKind;

namespace {

std::vector<TokenKind> kinds_of(const std::vector<Token> &tokens) {
    std::vector<TokenKind> kinds;
    for (const auto &token : tokens) {
        kinds.push_back(token.kind);
    }
    return kinds;
}

void test_pipeline_with_redirection() {
    const auto tokens = Lexer{}.tokenize("ls -la | grep foo > out.txt");

    const std::vector<TokenKind> expected{TokenKind::Word, TokenKind::Word,        TokenKind::Pipe,
                                          TokenKind::Word, TokenKind::Word,        TokenKind::RedirectOut,
                                          TokenKind::Word, TokenKind::EndOfInput};
    assert(kinds_of(tokens) == expected);
    assert(tokens[0].text == "ls");
    assert(tokens[1].text == "-la");
    assert(tokens[4].text == "foo");
    assert(tokens[6].text == "out.txt");
}

void test_positions_are_tracked() {
    const auto tokens = Lexer{}.tokenize("echo a\n  cat b");

    assert(tokens[0].line == 1 && tokens[0].column == 1);
    assert(tokens[1].byte_offset == 5 && tokens[1].byte_length == 1);
    assert(tokens[2].kind == TokenKind::Newline);
    assert(tokens[3].text == "cat");
    assert(tokens[3].line == 2 && tokens[3].column == 3);
}

void test_quotes_and_escapes() {
    const auto tokens = Lexer{}.tokenize(R"(echo 'a $b' "c \"d\"" e\ f)");

    assert(tokens[1].kind == TokenKind::QuotedString);
    assert(tokens[1].text == "a $b");
    assert(tokens[1].quoting == Quoting::Single);

    assert(tokens[2].text == "c \"d\"");
    assert(tokens[2].quoting == Quoting::Double);

    // `e\ f` is three adjacent tokens: e, the escaped blank, f.
    assert(tokens[3].text == "e");
    assert(tokens[4].kind == TokenKind::QuotedString && tokens[4].text == " ");
    assert(tokens[5].text == "f");
    assert(tokens[4].byte_offset == tokens[3].byte_end());
}

void test_unterminated_quote_is_best_effort() {
    const auto tokens = Lexer{}.tokenize("echo \"open");

    assert(tokens.size() == 3);
    assert(tokens[1].kind == TokenKind::QuotedString);
    assert(tokens[1].text == "open");
    assert(tokens.back().kind == TokenKind::EndOfInput);
}

void test_operators() {
    const auto tokens = Lexer{}.tokenize("a && b || c; d & e >> f 2> g 2>> h < i");

    const std::vector<TokenKind> expected{
        TokenKind::Word,      TokenKind::And,         TokenKind::Word, TokenKind::Or,
        TokenKind::Word,      TokenKind::Semicolon,   TokenKind::Word, TokenKind::Background,
        TokenKind::Word,      TokenKind::RedirectAppend, TokenKind::Word, TokenKind::RedirectErr,
        TokenKind::Word,      TokenKind::RedirectErrAppend, TokenKind::Word, TokenKind::RedirectIn,
        TokenKind::Word,      TokenKind::EndOfInput,
    };
    assert(kinds_of(tokens) == expected);
}

void test_descriptor_digits_only_at_word_start() {
    const auto inside = Lexer{}.tokenize("echo hi1>out");
    assert(inside[1].text == "hi1");
    assert(inside[2].kind == TokenKind::RedirectOut);

    const auto leading = Lexer{}.tokenize("echo 2>err");
    assert(leading[1].kind == TokenKind::RedirectErr);
    assert(leading[2].text == "err");
}

void test_descriptor_duplication() {
    const auto tokens = Lexer{}.tokenize("cmd 2>&1 >&2 & x");

    const std::vector<TokenKind> expected{
        TokenKind::Word, TokenKind::RedirectErr, TokenKind::Word,       TokenKind::RedirectOut,
        TokenKind::Word, TokenKind::Background,  TokenKind::Word,       TokenKind::EndOfInput,
    };
    assert(kinds_of(tokens) == expected);
    assert(tokens[1].text == "2>&");
    assert(tokens[2].text == "1");
    assert(tokens[3].text == ">&");
    assert(tokens[4].text == "2");
}

void test_variables_and_substitutions() {
    const auto tokens = Lexer{}.tokenize("echo $HOME ${USER} $? $(ls -l) `pwd` $");

    assert(tokens[1].kind == TokenKind::Variable && tokens[1].text == "$HOME");
    assert(tokens[2].kind == TokenKind::Variable && tokens[2].text == "${USER}");
    assert(tokens[3].kind == TokenKind::Variable && tokens[3].text == "$?");
    assert(tokens[4].kind == TokenKind::Variable && tokens[4].text == "$(ls -l)");
    assert(tokens[5].kind == TokenKind::Variable && tokens[5].text == "`pwd`");
    assert(tokens[6].kind == TokenKind::Word && tokens[6].text == "$");
}

void test_assignments() {
    const auto tokens = Lexer{}.tokenize("A=1 B='x y' C=\"$D\" echo E=2 3=4");

    assert(tokens[0].kind == TokenKind::Assignment && tokens[0].text == "A=1");
    assert(tokens[1].kind == TokenKind::Assignment && tokens[1].text == "B=x y");
    assert(tokens[1].quoting == Quoting::Single);
    assert(tokens[2].kind == TokenKind::Assignment && tokens[2].text == "C=$D");
    assert(tokens[2].quoting == Quoting::None);
    assert(tokens[3].kind == TokenKind::Word);
    assert(tokens[4].kind == TokenKind::Assignment);
    assert(tokens[5].kind == TokenKind::Word && tokens[5].text == "3=4");
}

void test_comments_and_blank_input() {
    const auto commented = Lexer{}.tokenize("echo hi # ignored | not a pipe");
    assert(commented.size() == 3);

    const auto blank = Lexer{}.tokenize("   \t ");
    assert(blank.size() == 1);
    assert(blank.front().kind == TokenKind::EndOfInput);
}

void test_identifier_validation() {
    assert(vshell::is_valid_identifier("PATH"));
    assert(vshell::is_valid_identifier("_x1"));
    assert(!vshell::is_valid_identifier("1x"));
    assert(!vshell::is_valid_identifier("a-b"));
    assert(!vshell::is_valid_identifier(""));
}

} // namespace

int main() {
    test_pipeline_with_redirection();
    test_positions_are_tracked();
    test_quotes_and_escapes();
    test_unterminated_quote_is_best_effort();
    test_operators();
    test_descriptor_digits_only_at_word_start();
    test_descriptor_duplication();
    test_variables_and_substitutions();
    test_assignments();
    test_comments_and_blank_input();
    test_identifier_validation();

    return 0;
}
