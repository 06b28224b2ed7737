#include "token.hpp"

namespace marktree {
namespace parser {

const char* token_type_name(TokenType type) {
    switch (type) {
        case TokenType::String: return "String";
        case TokenType::Space: return "Space";
        case TokenType::Newline: return "Newline";
        case TokenType::Bold: return "Bold";
        case TokenType::Italic: return "Italic";
        case TokenType::Monospace: return "Monospace";
        case TokenType::UnorderedListMarker: return "UnorderedListMarker";
        case TokenType::Header1: return "Header1";
        case TokenType::Header2: return "Header2";
        case TokenType::Header3: return "Header3";
        case TokenType::Header4: return "Header4";
        case TokenType::Header5: return "Header5";
        case TokenType::CodeFence: return "CodeFence";
        case TokenType::LineBreak: return "LineBreak";
        case TokenType::EndOfInput: return "EndOfInput";
        case TokenType::Untyped: return "Untyped";
    }
    return "Untyped";
}

bool is_header(TokenType type) {
    return header_level(type) != 0;
}

int header_level(TokenType type) {
    switch (type) {
        case TokenType::Header1: return 1;
        case TokenType::Header2: return 2;
        case TokenType::Header3: return 3;
        case TokenType::Header4: return 4;
        case TokenType::Header5: return 5;
        default: return 0;
    }
}

}  // namespace parser
}  // namespace marktree
