#ifndef MARKTREE_PARSER_MARKDOWN_HPP
#define MARKTREE_PARSER_MARKDOWN_HPP

#include "ast.hpp"
#include "errors.hpp"
#include "lexer.hpp"
#include <string_view>
#include <variant>
#include <vector>

namespace marktree {
namespace parser {

// Either the Document node or the single error that aborted the parse
using ParseResult = std::variant<ast::Node, ParseError>;

ParseResult parse_markdown(std::string_view input, LexerOptions options = {});

// Lexes the whole input; the last token is the only EndOfInput.
// Throws LexicalError.
std::vector<Token> tokenize(std::string_view input, LexerOptions options = {});

}  // namespace parser
}  // namespace marktree

#endif // MARKTREE_PARSER_MARKDOWN_HPP
