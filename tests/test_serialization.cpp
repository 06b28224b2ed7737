#include <serialization/ast_json.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/token_json.hpp>
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace marktree;
using namespace marktree::parser;
using ast::NodeKind;

// ============== Tokens ==============

TEST(TokenJson, Fields) {
    Token token{TokenType::Bold, "**", 2, 5};

    nlohmann::json j = token;
    EXPECT_EQ(j["type"], "Bold");
    EXPECT_EQ(j["text"], "**");
    EXPECT_EQ(j["line"], 2);
    EXPECT_EQ(j["column"], 5);

    Token back = j.get<Token>();
    EXPECT_EQ(back, token);
    EXPECT_EQ(back.line, 2u);
    EXPECT_EQ(back.column, 5u);
}

TEST(TokenJson, TokenStream) {
    nlohmann::json j = tokenize("# a");

    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 4u);
    EXPECT_EQ(j[0]["type"], "Header1");
    EXPECT_EQ(j[1]["type"], "Space");
    EXPECT_EQ(j[3]["type"], "EndOfInput");
}

// ============== AST ==============

TEST(AstJson, CodeNodeCarriesLanguage) {
    auto document = test::parse_ok("```py\nx\n```\ny");

    nlohmann::json j = document;
    EXPECT_EQ(j["kind"], "Document");
    ASSERT_EQ(j["children"].size(), 3u);
    EXPECT_EQ(j["children"][0]["kind"], "Code");
    EXPECT_EQ(j["children"][0]["language"], "py");
    EXPECT_FALSE(j["children"][2].contains("language"));
    EXPECT_EQ(j["children"][2]["token"]["text"], "y");
}

TEST(AstJson, RoundTrip) {
    auto document = test::parse_ok("# T\n- **a _b_**\n- `c`\n```sh\nls\n```\n");

    nlohmann::json j = document;
    auto restored = j.get<ast::Node>();

    test::expect_same_tree(document, restored);
    EXPECT_EQ(ast::count_nodes(document), ast::count_nodes(restored));
}

TEST(AstJson, MissingKindThrows) {
    nlohmann::json j = {{"token", {{"type", "String"}, {"text", "x"}}}};

    EXPECT_THROW(j.get<ast::Node>(), nlohmann::json::exception);
}

// ============== Config ==============

TEST(ConfigJson, Defaults) {
    Config config = nlohmann::json::object().get<Config>();

    EXPECT_FALSE(config.lexer.spaces_in_text);
    EXPECT_EQ(config.render.indent_width, 3u);
    EXPECT_EQ(config.render.document_tag, "html");
}

TEST(ConfigJson, PartialOverride) {
    nlohmann::json j = {
        {"lexer", {{"spaces_in_text", true}}},
        {"render", {{"indent_width", 2}}}
    };

    Config config = j.get<Config>();
    EXPECT_TRUE(config.lexer.spaces_in_text);
    EXPECT_EQ(config.render.indent_width, 2u);
    EXPECT_EQ(config.render.document_tag, "html");
}

TEST(ConfigJson, WritesAllKeys) {
    Config config;
    config.render.document_tag = "body";

    nlohmann::json j = config;
    EXPECT_EQ(j["lexer"]["spaces_in_text"], false);
    EXPECT_EQ(j["render"]["indent_width"], 3);
    EXPECT_EQ(j["render"]["document_tag"], "body");
}

TEST(ConfigJson, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "marktree_test_config.json";
    json::write_json_file(path.string(), {{"render", {{"document_tag", "main"}}}});

    Config config = load_config(path.string());
    EXPECT_EQ(config.render.document_tag, "main");
    EXPECT_EQ(config.render.indent_width, 3u);

    std::filesystem::remove(path);
}

TEST(ConfigJson, MissingFileThrows) {
    EXPECT_THROW(load_config("/nonexistent/marktree/config.json"), std::runtime_error);
}

// ============== Envelope ==============

TEST(SerializedData, EnvelopeFields) {
    json::SerializedData data;
    data.step = "ast";
    data.source_file = "doc.md";
    data.stats = {{"node_count", 3}};
    data.data = nlohmann::json::array();

    nlohmann::json j = data.to_json();
    EXPECT_EQ(j["version"], json::SERIALIZATION_VERSION);
    EXPECT_EQ(j["step"], "ast");
    EXPECT_FALSE(j.contains("timestamp"));
    EXPECT_FALSE(j.contains("config"));

    auto back = json::SerializedData::from_json(j);
    EXPECT_EQ(back.step, "ast");
    EXPECT_EQ(back.source_file, "doc.md");
    EXPECT_EQ(back.stats["node_count"], 3);
}

TEST(SerializedData, MissingDataThrows) {
    nlohmann::json j = {{"step", "ast"}};

    EXPECT_THROW(json::SerializedData::from_json(j), std::runtime_error);
}

TEST(SerializedData, FileRoundTrip) {
    auto document = test::parse_ok("# Title\n**bold** text");
    auto path = std::filesystem::temp_directory_path() / "marktree_test_ast.json";

    json::SerializedData data;
    data.step = "ast";
    data.timestamp = json::get_timestamp();
    data.source_file = "doc.md";
    data.config = nlohmann::json(Config{});
    data.data = nlohmann::json(document);
    data.stats = {{"node_count", ast::count_nodes(document)}};
    json::write_serialized(path.string(), data);

    auto back = json::read_serialized(path.string());
    EXPECT_EQ(back.version, json::SERIALIZATION_VERSION);
    EXPECT_EQ(back.step, "ast");
    EXPECT_EQ(back.timestamp, data.timestamp);
    EXPECT_EQ(back.source_file, "doc.md");
    EXPECT_EQ(back.config["render"]["document_tag"], "html");
    EXPECT_EQ(back.stats["node_count"], ast::count_nodes(document));
    test::expect_same_tree(document, back.data.get<ast::Node>());

    std::filesystem::remove(path);
}

TEST(SerializedData, ReadInvalidJsonThrows) {
    auto path = std::filesystem::temp_directory_path() / "marktree_test_invalid.json";
    {
        std::ofstream file(path);
        file << "{ \"step\": ";
    }

    EXPECT_THROW(json::read_serialized(path.string()), std::runtime_error);

    std::filesystem::remove(path);
}
