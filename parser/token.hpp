#ifndef MARKTREE_PARSER_TOKEN_HPP
#define MARKTREE_PARSER_TOKEN_HPP

#include <cstdint>
#include <string>

namespace marktree {
namespace parser {

enum class TokenType {
    // Text
    String, Space, Newline,

    // Inline emphasis
    Bold, Italic, Monospace,

    // Block markers
    UnorderedListMarker,
    Header1, Header2, Header3, Header4, Header5,
    CodeFence, LineBreak,

    // Special
    EndOfInput, Untyped
};

struct Token {
    TokenType type = TokenType::Untyped;
    std::string text;
    uint32_t line = 0;
    uint32_t column = 0;

    // Source coordinates are diagnostics only and do not take part in equality
    bool operator==(const Token& other) const {
        return type == other.type && text == other.text;
    }
};

const char* token_type_name(TokenType type);

bool is_header(TokenType type);

// 1..5 for Header1..Header5, 0 otherwise
int header_level(TokenType type);

}  // namespace parser
}  // namespace marktree

#endif // MARKTREE_PARSER_TOKEN_HPP
