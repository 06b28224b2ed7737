#ifndef MARKTREE_SERIALIZATION_AST_JSON_HPP
#define MARKTREE_SERIALIZATION_AST_JSON_HPP

#include <nlohmann/json.hpp>
#include <parser/ast.hpp>
#include <serialization/token_json.hpp>
#include <string>
#include <vector>

namespace marktree::parser::ast {

// Unknown names map to Void
NLOHMANN_JSON_SERIALIZE_ENUM(NodeKind, {
    {NodeKind::Void, "Void"},
    {NodeKind::Document, "Document"},
    {NodeKind::Text, "Text"},
    {NodeKind::Space, "Space"},
    {NodeKind::NewLine, "NewLine"},
    {NodeKind::Bold, "Bold"},
    {NodeKind::Italic, "Italic"},
    {NodeKind::Monospace, "Monospace"},
    {NodeKind::Code, "Code"},
    {NodeKind::Header1, "Header1"},
    {NodeKind::Header2, "Header2"},
    {NodeKind::Header3, "Header3"},
    {NodeKind::Header4, "Header4"},
    {NodeKind::Header5, "Header5"},
    {NodeKind::UnorderedListRoot, "UnorderedListRoot"},
    {NodeKind::UnorderedListItem, "UnorderedListItem"},
})

inline void to_json(nlohmann::json& j, const Node& node) {
    j["kind"] = node.kind;
    j["token"] = node.token;
    if (node.language_name.has_value()) {
        j["language"] = node.language_name.value();
    }
    j["children"] = nlohmann::json::array();
    for (const auto& child : node.children) {
        j["children"].push_back(nlohmann::json(child));
    }
}

inline void from_json(const nlohmann::json& j, Node& node) {
    node.kind = j.at("kind").get<NodeKind>();
    node.token = j.at("token").get<Token>();
    if (j.contains("language")) {
        node.language_name = j["language"].get<std::string>();
    } else {
        node.language_name.reset();
    }
    node.children.clear();
    if (j.contains("children")) {
        for (const auto& child_j : j["children"]) {
            node.children.push_back(child_j.get<Node>());
        }
    }
}

}  // namespace marktree::parser::ast

#endif // MARKTREE_SERIALIZATION_AST_JSON_HPP
