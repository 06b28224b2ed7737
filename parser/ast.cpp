#include "ast.hpp"
#include <stdexcept>

namespace marktree {
namespace parser {
namespace ast {

const char* node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Document: return "Document";
        case NodeKind::Text: return "Text";
        case NodeKind::Space: return "Space";
        case NodeKind::NewLine: return "NewLine";
        case NodeKind::Bold: return "Bold";
        case NodeKind::Italic: return "Italic";
        case NodeKind::Monospace: return "Monospace";
        case NodeKind::Code: return "Code";
        case NodeKind::Header1: return "Header1";
        case NodeKind::Header2: return "Header2";
        case NodeKind::Header3: return "Header3";
        case NodeKind::Header4: return "Header4";
        case NodeKind::Header5: return "Header5";
        case NodeKind::UnorderedListRoot: return "UnorderedListRoot";
        case NodeKind::UnorderedListItem: return "UnorderedListItem";
        case NodeKind::Void: return "Void";
    }
    return "Void";
}

bool is_header(NodeKind kind) {
    return header_level(kind) != 0;
}

int header_level(NodeKind kind) {
    switch (kind) {
        case NodeKind::Header1: return 1;
        case NodeKind::Header2: return 2;
        case NodeKind::Header3: return 3;
        case NodeKind::Header4: return 4;
        case NodeKind::Header5: return 5;
        default: return 0;
    }
}

NodeKind header_kind(TokenType type) {
    switch (type) {
        case TokenType::Header1: return NodeKind::Header1;
        case TokenType::Header2: return NodeKind::Header2;
        case TokenType::Header3: return NodeKind::Header3;
        case TokenType::Header4: return NodeKind::Header4;
        case TokenType::Header5: return NodeKind::Header5;
        default:
            throw std::invalid_argument(std::string("Not a header token: ") + token_type_name(type));
    }
}

size_t count_nodes(const Node& node) {
    size_t total = 1;
    for (const auto& child : node.children) {
        total += count_nodes(child);
    }
    return total;
}

}  // namespace ast
}  // namespace parser
}  // namespace marktree
