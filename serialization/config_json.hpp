#ifndef MARKTREE_SERIALIZATION_CONFIG_JSON_HPP
#define MARKTREE_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <common/config.hpp>
#include <serialization/json_serialization.hpp>
#include <string>

namespace marktree {

namespace parser {

inline void to_json(nlohmann::json& j, const LexerOptions& options) {
    j = {
        {"spaces_in_text", options.spaces_in_text}
    };
}

inline void from_json(const nlohmann::json& j, LexerOptions& options) {
    options.spaces_in_text = j.value("spaces_in_text", false);
}

}  // namespace parser

namespace render {

inline void to_json(nlohmann::json& j, const RenderOptions& options) {
    j = {
        {"indent_width", options.indent_width},
        {"document_tag", options.document_tag}
    };
}

inline void from_json(const nlohmann::json& j, RenderOptions& options) {
    options.indent_width = j.value("indent_width", 3u);
    options.document_tag = j.value("document_tag", "html");
}

}  // namespace render

inline void to_json(nlohmann::json& j, const Config& config) {
    j = {
        {"lexer", config.lexer},
        {"render", config.render}
    };
}

inline void from_json(const nlohmann::json& j, Config& config) {
    if (j.contains("lexer")) {
        config.lexer = j["lexer"].get<parser::LexerOptions>();
    }
    if (j.contains("render")) {
        config.render = j["render"].get<render::RenderOptions>();
    }
}

inline Config load_config(const std::string& path) {
    return json::read_json_file(path).get<Config>();
}

}  // namespace marktree

#endif // MARKTREE_SERIALIZATION_CONFIG_JSON_HPP
