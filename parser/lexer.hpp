#ifndef MARKTREE_PARSER_LEXER_HPP
#define MARKTREE_PARSER_LEXER_HPP

#include "token.hpp"
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace marktree {
namespace parser {

struct LexerOptions {
    // Let a String token run on over spaces once it has started
    bool spaces_in_text = false;
};

// Pull-based scanner over an in-memory document. The input is not copied and
// must outlive the lexer.
class Lexer {
public:
    explicit Lexer(std::string_view input, LexerOptions options = {});

    // Returns EndOfInput forever once the input is exhausted.
    // Throws LexicalError on a character that starts no token.
    Token next_token();

    bool at_end() const;
    size_t position() const { return pos_; }

private:
    std::string_view input_;
    LexerOptions options_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;

    void advance();
    void advance(size_t count);
    char current() const;
    char peek_char(size_t offset = 1) const;

    Token scan_header();
    Token scan_backtick();
    Token scan_string();
};

}  // namespace parser
}  // namespace marktree

#endif // MARKTREE_PARSER_LEXER_HPP
