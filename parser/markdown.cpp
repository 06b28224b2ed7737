#include "markdown.hpp"
#include "parser.hpp"
#include "logging.hpp"

namespace marktree {
namespace parser {

ParseResult parse_markdown(std::string_view input, LexerOptions options) {
    auto log = marktree::logging::get_logger();
    log->debug("Parsing {} bytes (spaces_in_text={})", input.size(), options.spaces_in_text);

    try {
        Parser parser(Lexer(input, options));
        return parser.parse_document();
    } catch (const LexicalError& e) {
        log->debug("Lexical error: {}", e.what());
        return ParseError{ParseError::Kind::Lexical, e.what(), e.line(), e.column()};
    } catch (const SyntaxError& e) {
        log->debug("Syntax error: {}", e.what());
        return ParseError{ParseError::Kind::Syntax, e.what(), e.actual().line, e.actual().column};
    }
}

std::vector<Token> tokenize(std::string_view input, LexerOptions options) {
    Lexer lexer(input, options);
    std::vector<Token> tokens;
    do {
        tokens.push_back(lexer.next_token());
    } while (tokens.back().type != TokenType::EndOfInput);
    return tokens;
}

}  // namespace parser
}  // namespace marktree
