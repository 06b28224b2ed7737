#ifndef MARKTREE_PARSER_AST_HPP
#define MARKTREE_PARSER_AST_HPP

#include "token.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace marktree {
namespace parser {
namespace ast {

enum class NodeKind {
    Document,

    // Inline
    Text, Space, NewLine,
    Bold, Italic, Monospace,

    // Block
    Code,
    Header1, Header2, Header3, Header4, Header5,
    UnorderedListRoot, UnorderedListItem,

    // Placeholder for an unhandled end of input, never has children
    Void
};

struct Node {
    NodeKind kind = NodeKind::Void;
    Token token;                               // Synthetic Untyped token for structural nodes
    std::vector<Node> children;                // Document order, owned by this node
    std::optional<std::string> language_name;  // Code nodes only

    const std::string& text() const { return token.text; }
};

const char* node_kind_name(NodeKind kind);

bool is_header(NodeKind kind);
int header_level(NodeKind kind);

// Header1..Header5 for the matching header token; throws std::invalid_argument otherwise
NodeKind header_kind(TokenType type);

// Counts the node itself and all of its descendants
size_t count_nodes(const Node& node);

}  // namespace ast
}  // namespace parser
}  // namespace marktree

#endif // MARKTREE_PARSER_AST_HPP
