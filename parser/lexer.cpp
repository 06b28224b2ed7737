#include "lexer.hpp"
#include "errors.hpp"
#include <cctype>

namespace marktree {
namespace parser {

namespace {

constexpr int kMaxHeaderLevel = 5;

bool is_text_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

TokenType header_type(int level) {
    switch (level) {
        case 1: return TokenType::Header1;
        case 2: return TokenType::Header2;
        case 3: return TokenType::Header3;
        case 4: return TokenType::Header4;
        default: return TokenType::Header5;
    }
}

}  // namespace

Lexer::Lexer(std::string_view input, LexerOptions options)
    : input_(input), options_(options) {}

bool Lexer::at_end() const {
    return current() == '\0';
}

char Lexer::current() const {
    if (pos_ >= input_.size()) return '\0';
    return input_[pos_];
}

char Lexer::peek_char(size_t offset) const {
    if (pos_ + offset >= input_.size()) return '\0';
    return input_[pos_ + offset];
}

void Lexer::advance() {
    if (at_end()) {
        return;
    }
    if (current() == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    pos_++;
}

void Lexer::advance(size_t count) {
    for (size_t i = 0; i < count; ++i) {
        advance();
    }
}

Token Lexer::next_token() {
    uint32_t start_line = line_;
    uint32_t start_column = column_;

    char c = current();

    switch (c) {
        case '\0':
            return Token{TokenType::EndOfInput, "", start_line, start_column};
        case ' ':
            advance();
            return Token{TokenType::Space, " ", start_line, start_column};
        case '_':
            advance();
            return Token{TokenType::Italic, "_", start_line, start_column};
        case '\n':
            advance();
            return Token{TokenType::Newline, "\n", start_line, start_column};
        case '*':
            if (peek_char() == '*') {
                advance(2);
                return Token{TokenType::Bold, "**", start_line, start_column};
            }
            // Only the doubled form is a delimiter
            throw LexicalError(c, pos_, start_line, start_column);
        case '-':
            if (peek_char(1) == '-' && peek_char(2) == '-') {
                advance(3);
                return Token{TokenType::LineBreak, "---", start_line, start_column};
            }
            advance();
            return Token{TokenType::UnorderedListMarker, "-", start_line, start_column};
        case '#':
            return scan_header();
        case '`':
            return scan_backtick();
    }

    if (is_text_char(c)) {
        return scan_string();
    }

    throw LexicalError(c, pos_, start_line, start_column);
}

Token Lexer::scan_header() {
    uint32_t start_line = line_;
    uint32_t start_column = column_;

    std::string text;
    while (current() == '#') {
        text += current();
        advance();
    }

    // Runs longer than the deepest level collapse onto it
    int level = static_cast<int>(text.size());
    if (level > kMaxHeaderLevel) {
        level = kMaxHeaderLevel;
    }
    return Token{header_type(level), text, start_line, start_column};
}

Token Lexer::scan_backtick() {
    uint32_t start_line = line_;
    uint32_t start_column = column_;

    if (peek_char(1) == '`' && peek_char(2) == '`') {
        advance(3);
        return Token{TokenType::CodeFence, "```", start_line, start_column};
    }
    advance();
    return Token{TokenType::Monospace, "`", start_line, start_column};
}

Token Lexer::scan_string() {
    uint32_t start_line = line_;
    uint32_t start_column = column_;

    std::string text;
    while (is_text_char(current()) || (options_.spaces_in_text && current() == ' ')) {
        text += current();
        advance();
    }
    return Token{TokenType::String, text, start_line, start_column};
}

}  // namespace parser
}  // namespace marktree
