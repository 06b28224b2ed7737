#include "parser.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <string>
#include <utility>

namespace marktree {
namespace parser {

Parser::Parser(Lexer lexer) : lexer_(std::move(lexer)) {
    advance();
}

void Parser::advance() {
    current_ = lexer_.next_token();
}

bool Parser::check(TokenType type) const {
    return current_.type == type;
}

void Parser::expect(TokenType type) {
    if (!check(type)) {
        throw SyntaxError(type, current_);
    }
    advance();
}

void Parser::enter_emphasis() {
    if (emphasis_depth_ >= MAX_EMPHASIS_DEPTH) {
        marktree::logging::get_logger()->debug(
            "Parser: emphasis nested deeper than {} at line {}, column {}",
            MAX_EMPHASIS_DEPTH, current_.line, current_.column);
        throw SyntaxError(std::nullopt, current_);
    }
    ++emphasis_depth_;
}

ast::Node Parser::parse_document() {
    auto log = marktree::logging::get_logger();

    ast::Node document;
    document.kind = ast::NodeKind::Document;
    document.token = Token{TokenType::Untyped, "Root", 1, 1};

    while (!check(TokenType::EndOfInput)) {
        document.children.push_back(parse_block());
        log->trace("Parser: block {} is {}", document.children.size(),
                   ast::node_kind_name(document.children.back().kind));
    }

    log->debug("Parser: document has {} top-level blocks, {} nodes",
               document.children.size(), ast::count_nodes(document));
    return document;
}

ast::Node Parser::parse_block() {
    switch (current_.type) {
        case TokenType::String:
            return parse_text();
        case TokenType::Space:
            return parse_space_run();
        case TokenType::Monospace:
            return parse_monospace();
        case TokenType::CodeFence:
            return parse_code_block();
        case TokenType::Italic:
            return parse_italic();
        case TokenType::Bold:
            return parse_bold();
        case TokenType::Newline:
            return parse_newline();
        case TokenType::UnorderedListMarker:
            return parse_unordered_list();
        case TokenType::Header1:
        case TokenType::Header2:
        case TokenType::Header3:
        case TokenType::Header4:
        case TokenType::Header5:
            return parse_header();
        case TokenType::EndOfInput: {
            ast::Node node;
            node.kind = ast::NodeKind::Void;
            node.token = current_;
            return node;
        }
        default:
            throw SyntaxError(std::nullopt, current_);
    }
}

// Collapses a run of String and Space tokens into a single Text node
ast::Node Parser::parse_text() {
    ast::Node node;
    node.kind = ast::NodeKind::Text;
    node.token = Token{TokenType::String, "", current_.line, current_.column};

    while (check(TokenType::String) || check(TokenType::Space)) {
        node.token.text += current_.text;
        advance();
    }
    return node;
}

ast::Node Parser::parse_space_run() {
    ast::Node node = parse_text();
    if (node.token.text.find_first_not_of(' ') == std::string::npos) {
        node.kind = ast::NodeKind::Space;
        node.token.type = TokenType::Space;
    }
    return node;
}

ast::Node Parser::parse_newline() {
    ast::Node node;
    node.kind = ast::NodeKind::NewLine;
    node.token = current_;
    expect(TokenType::Newline);
    return node;
}

ast::Node Parser::parse_bold() {
    ast::Node node;
    node.kind = ast::NodeKind::Bold;
    node.token = current_;

    enter_emphasis();
    expect(TokenType::Bold);
    node.children = parse_inner_bold();
    expect(TokenType::Bold);
    --emphasis_depth_;

    return node;
}

ast::Node Parser::parse_italic() {
    ast::Node node;
    node.kind = ast::NodeKind::Italic;
    node.token = current_;

    enter_emphasis();
    expect(TokenType::Italic);
    node.children = parse_inner_italic();
    expect(TokenType::Italic);
    --emphasis_depth_;

    return node;
}

// Bold may hold italic spans but never another bold span directly
std::vector<ast::Node> Parser::parse_inner_bold() {
    std::vector<ast::Node> nodes;
    while (check(TokenType::Italic) || check(TokenType::String) || check(TokenType::Space)) {
        if (check(TokenType::Italic)) {
            nodes.push_back(parse_italic());
        } else {
            nodes.push_back(parse_text());
        }
    }
    return nodes;
}

std::vector<ast::Node> Parser::parse_inner_italic() {
    std::vector<ast::Node> nodes;
    while (check(TokenType::Bold) || check(TokenType::String) || check(TokenType::Space)) {
        if (check(TokenType::Bold)) {
            nodes.push_back(parse_bold());
        } else {
            nodes.push_back(parse_text());
        }
    }
    return nodes;
}

ast::Node Parser::parse_monospace() {
    ast::Node node;
    node.kind = ast::NodeKind::Monospace;
    node.token = current_;

    expect(TokenType::Monospace);
    node.children.push_back(parse_text());
    expect(TokenType::Monospace);

    return node;
}

ast::Node Parser::parse_code_block() {
    ast::Node node;
    node.kind = ast::NodeKind::Code;
    node.token = current_;

    expect(TokenType::CodeFence);
    node.language_name = current_.text;
    expect(TokenType::String);
    expect(TokenType::Newline);

    // The body is kept verbatim up to the closing fence
    ast::Node body;
    body.kind = ast::NodeKind::Text;
    body.token = Token{TokenType::String, "", current_.line, current_.column};
    while (!check(TokenType::CodeFence) && !check(TokenType::EndOfInput)) {
        body.token.text += current_.text;
        advance();
    }
    node.children.push_back(std::move(body));

    expect(TokenType::CodeFence);
    return node;
}

ast::Node Parser::parse_header() {
    if (!is_header(current_.type)) {
        throw SyntaxError(std::nullopt, current_);
    }

    ast::Node node;
    node.kind = ast::header_kind(current_.type);
    node.token = current_;

    advance();
    expect(TokenType::Space);
    node.children.push_back(parse_text());

    return node;
}

ast::Node Parser::parse_unordered_list() {
    ast::Node root;
    root.kind = ast::NodeKind::UnorderedListRoot;
    root.token = Token{TokenType::Untyped, "list", current_.line, current_.column};

    while (check(TokenType::UnorderedListMarker)) {
        root.children.push_back(parse_list_item());
    }
    return root;
}

ast::Node Parser::parse_list_item() {
    ast::Node item;
    item.kind = ast::NodeKind::UnorderedListItem;
    item.token = current_;

    expect(TokenType::UnorderedListMarker);
    expect(TokenType::Space);

    switch (current_.type) {
        case TokenType::Italic:
            item.children.push_back(parse_italic());
            break;
        case TokenType::Bold:
            item.children.push_back(parse_bold());
            break;
        case TokenType::String:
        case TokenType::Space:
            item.children.push_back(parse_text());
            break;
        case TokenType::Monospace:
            item.children.push_back(parse_monospace());
            break;
        default:
            item.children.push_back(parse_header());
            break;
    }

    // The line ending belongs to the item so the next marker line joins the list
    if (check(TokenType::Newline)) {
        advance();
    }
    return item;
}

}  // namespace parser
}  // namespace marktree
