#include "errors.hpp"
#include <sstream>
#include <utility>

namespace marktree {
namespace parser {

namespace {

std::string describe_character(char c) {
    switch (c) {
        case '\t': return "\\t";
        case '\r': return "\\r";
        default: break;
    }
    if (static_cast<unsigned char>(c) < 0x20 || static_cast<unsigned char>(c) >= 0x7f) {
        std::ostringstream oss;
        oss << "\\x" << std::hex << static_cast<int>(static_cast<unsigned char>(c));
        return oss.str();
    }
    return std::string(1, c);
}

std::string lexical_message(char character, size_t offset, uint32_t line, uint32_t column) {
    std::ostringstream oss;
    oss << "Invalid character '" << describe_character(character) << "' at offset " << offset
        << " (line " << line << ", column " << column << ")";
    return oss.str();
}

std::string syntax_message(const std::optional<TokenType>& expected, const Token& actual) {
    std::ostringstream oss;
    if (expected) {
        oss << "Expected " << token_type_name(*expected) << " but got "
            << token_type_name(actual.type);
    } else {
        oss << "Unexpected token " << token_type_name(actual.type);
    }
    if (!actual.text.empty() && actual.type != TokenType::Newline) {
        oss << " '" << actual.text << "'";
    }
    oss << " at line " << actual.line << ", column " << actual.column;
    return oss.str();
}

}  // namespace

LexicalError::LexicalError(char character, size_t offset, uint32_t line, uint32_t column)
    : std::runtime_error(lexical_message(character, offset, line, column)),
      character_(character),
      offset_(offset),
      line_(line),
      column_(column) {}

SyntaxError::SyntaxError(std::optional<TokenType> expected, Token actual)
    : std::runtime_error(syntax_message(expected, actual)),
      expected_(expected),
      actual_(std::move(actual)) {}

const char* error_kind_name(ParseError::Kind kind) {
    switch (kind) {
        case ParseError::Kind::Lexical: return "Lexical";
        case ParseError::Kind::Syntax: return "Syntax";
    }
    return "Syntax";
}

}  // namespace parser
}  // namespace marktree
