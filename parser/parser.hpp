#ifndef MARKTREE_PARSER_PARSER_HPP
#define MARKTREE_PARSER_PARSER_HPP

#include "lexer.hpp"
#include "ast.hpp"
#include <cstddef>
#include <vector>

namespace marktree {
namespace parser {

// Recursive-descent parser with one token of lookahead. Errors are not
// recovered from: LexicalError and SyntaxError propagate out of
// parse_document() and no partial tree is returned.
class Parser {
public:
    // Primes the lookahead, so a lexical error in the first token throws here
    explicit Parser(Lexer lexer);

    ast::Node parse_document();

    // Bold and italic spans open deeper than this are a syntax error
    static constexpr size_t MAX_EMPHASIS_DEPTH = 1000;

private:
    Lexer lexer_;
    Token current_;
    size_t emphasis_depth_ = 0;

    void advance();
    bool check(TokenType type) const;
    void expect(TokenType type);
    void enter_emphasis();

    ast::Node parse_block();
    ast::Node parse_text();
    ast::Node parse_space_run();
    ast::Node parse_newline();
    ast::Node parse_bold();
    ast::Node parse_italic();
    std::vector<ast::Node> parse_inner_bold();
    std::vector<ast::Node> parse_inner_italic();
    ast::Node parse_monospace();
    ast::Node parse_code_block();
    ast::Node parse_header();
    ast::Node parse_unordered_list();
    ast::Node parse_list_item();
};

}  // namespace parser
}  // namespace marktree

#endif // MARKTREE_PARSER_PARSER_HPP
