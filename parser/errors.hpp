#ifndef MARKTREE_PARSER_ERRORS_HPP
#define MARKTREE_PARSER_ERRORS_HPP

#include "token.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace marktree {
namespace parser {

// An input character that does not begin any valid token
class LexicalError : public std::runtime_error {
public:
    LexicalError(char character, size_t offset, uint32_t line, uint32_t column);

    char character() const { return character_; }
    size_t offset() const { return offset_; }
    uint32_t line() const { return line_; }
    uint32_t column() const { return column_; }

private:
    char character_;
    size_t offset_;
    uint32_t line_;
    uint32_t column_;
};

// The current token matches no alternative of the active grammar rule.
// expected() is empty when the rule had several alternatives.
class SyntaxError : public std::runtime_error {
public:
    SyntaxError(std::optional<TokenType> expected, Token actual);

    const std::optional<TokenType>& expected() const { return expected_; }
    const Token& actual() const { return actual_; }

private:
    std::optional<TokenType> expected_;
    Token actual_;
};

struct ParseError {
    enum class Kind { Lexical, Syntax };

    Kind kind;
    std::string message;
    uint32_t line = 0;
    uint32_t column = 0;
};

const char* error_kind_name(ParseError::Kind kind);

}  // namespace parser
}  // namespace marktree

#endif // MARKTREE_PARSER_ERRORS_HPP
