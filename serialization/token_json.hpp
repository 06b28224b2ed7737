#ifndef MARKTREE_SERIALIZATION_TOKEN_JSON_HPP
#define MARKTREE_SERIALIZATION_TOKEN_JSON_HPP

#include <nlohmann/json.hpp>
#include <parser/token.hpp>

namespace marktree::parser {

NLOHMANN_JSON_SERIALIZE_ENUM(TokenType, {
    {TokenType::Untyped, "Untyped"},
    {TokenType::String, "String"},
    {TokenType::Space, "Space"},
    {TokenType::Newline, "Newline"},
    {TokenType::Bold, "Bold"},
    {TokenType::Italic, "Italic"},
    {TokenType::Monospace, "Monospace"},
    {TokenType::UnorderedListMarker, "UnorderedListMarker"},
    {TokenType::Header1, "Header1"},
    {TokenType::Header2, "Header2"},
    {TokenType::Header3, "Header3"},
    {TokenType::Header4, "Header4"},
    {TokenType::Header5, "Header5"},
    {TokenType::CodeFence, "CodeFence"},
    {TokenType::LineBreak, "LineBreak"},
    {TokenType::EndOfInput, "EndOfInput"},
})

inline void to_json(nlohmann::json& j, const Token& token) {
    j = {
        {"type", token.type},
        {"text", token.text},
        {"line", token.line},
        {"column", token.column}
    };
}

inline void from_json(const nlohmann::json& j, Token& token) {
    token.type = j.at("type").get<TokenType>();
    token.text = j.value("text", "");
    token.line = j.value("line", 0u);
    token.column = j.value("column", 0u);
}

}  // namespace marktree::parser

#endif // MARKTREE_SERIALIZATION_TOKEN_JSON_HPP
