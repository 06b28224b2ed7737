#include "html_renderer.hpp"
#include "markdown.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <string>
#include <utility>

using namespace marktree;
using namespace marktree::parser;
using namespace marktree::render;
using ast::NodeKind;

namespace {

std::string to_html(const std::string& input, RenderOptions options = {}) {
    HtmlRenderer renderer(std::move(options));
    return renderer.render(test::parse_ok(input));
}

}  // namespace

// ============== Document Layout ==============

TEST(HtmlRenderer, PlainText) {
    EXPECT_EQ(to_html("Hello"),
              "<html>\n"
              "<span>Hello</span>\n"
              "</html>\n");
}

TEST(HtmlRenderer, EmptyDocument) {
    EXPECT_EQ(to_html(""), "<html>\n</html>\n");
}

TEST(HtmlRenderer, BoldIndentsChildren) {
    EXPECT_EQ(to_html("**Hello**"),
              "<html>\n"
              "<strong>\n"
              "   <span>Hello</span>\n"
              "</strong>\n"
              "</html>\n");
}

TEST(HtmlRenderer, NestedEmphasis) {
    EXPECT_EQ(to_html("_**Hi**_"),
              "<html>\n"
              "<i>\n"
              "   <strong>\n"
              "      <span>Hi</span>\n"
              "   </strong>\n"
              "</i>\n"
              "</html>\n");
}

TEST(HtmlRenderer, Header) {
    EXPECT_EQ(to_html("### Title"),
              "<html>\n"
              "<h3>\n"
              "   <span>Title</span>\n"
              "</h3>\n"
              "</html>\n");
}

TEST(HtmlRenderer, AllHeaderLevels) {
    EXPECT_STREQ(tag_for(NodeKind::Header1), "h1");
    EXPECT_STREQ(tag_for(NodeKind::Header2), "h2");
    EXPECT_STREQ(tag_for(NodeKind::Header3), "h3");
    EXPECT_STREQ(tag_for(NodeKind::Header4), "h4");
    EXPECT_STREQ(tag_for(NodeKind::Header5), "h5");
    EXPECT_EQ(tag_for(NodeKind::Text), nullptr);
    EXPECT_EQ(tag_for(NodeKind::Code), nullptr);
}

TEST(HtmlRenderer, UnorderedList) {
    EXPECT_EQ(to_html("- a\n- b"),
              "<html>\n"
              "<ul>\n"
              "   <li>\n"
              "      <span>a</span>\n"
              "   </li>\n"
              "   <li>\n"
              "      <span>b</span>\n"
              "   </li>\n"
              "</ul>\n"
              "</html>\n");
}

TEST(HtmlRenderer, NewLineAndMonospace) {
    EXPECT_EQ(to_html("a\n`b`"),
              "<html>\n"
              "<span>a</span>\n"
              "<br>\n"
              "<code>\n"
              "   <span>b</span>\n"
              "</code>\n"
              "</html>\n");
}

TEST(HtmlRenderer, SpaceRun) {
    EXPECT_EQ(to_html("  "),
              "<html>\n"
              "<span>  </span>\n"
              "</html>\n");
}

TEST(HtmlRenderer, CodeBlockIsVerbatim) {
    EXPECT_EQ(to_html("```cpp\nint x\n  y\n```"),
              "<html>\n"
              "<pre><code class=\"language-cpp\">int x\n  y\n</code></pre>\n"
              "</html>\n");
}

// ============== Options ==============

TEST(HtmlRenderer, IndentWidth) {
    RenderOptions options;
    options.indent_width = 2;

    EXPECT_EQ(to_html("**a**", options),
              "<html>\n"
              "<strong>\n"
              "  <span>a</span>\n"
              "</strong>\n"
              "</html>\n");
}

TEST(HtmlRenderer, NoWrapperAndNoIndent) {
    RenderOptions options;
    options.indent_width = 0;
    options.document_tag = "";

    EXPECT_EQ(to_html("_x_", options),
              "<i>\n"
              "<span>x</span>\n"
              "</i>\n");
}

TEST(HtmlRenderer, CustomDocumentTag) {
    RenderOptions options;
    options.document_tag = "body";

    EXPECT_EQ(to_html("x", options), "<body>\n<span>x</span>\n</body>\n");
}

// ============== Hand-built Trees ==============

TEST(HtmlRenderer, SubtreeHasNoWrapper) {
    auto document = test::parse_ok("**a**");
    ASSERT_EQ(document.children.size(), 1u);

    HtmlRenderer renderer;
    EXPECT_EQ(renderer.render(document.children[0]),
              "<strong>\n"
              "   <span>a</span>\n"
              "</strong>\n");
}

TEST(HtmlRenderer, TextIsNotEscaped) {
    ast::Node text;
    text.kind = NodeKind::Text;
    text.token = Token{TokenType::String, "<b>&", 1, 1};

    HtmlRenderer renderer;
    EXPECT_EQ(renderer.render(text), "<span><b>&</span>\n");
}

TEST(HtmlRenderer, VoidRendersNothing) {
    ast::Node document;
    document.kind = NodeKind::Document;
    ast::Node placeholder;
    placeholder.kind = NodeKind::Void;
    document.children.push_back(placeholder);

    HtmlRenderer renderer;
    EXPECT_EQ(renderer.render(document), "<html>\n</html>\n");
}

TEST(HtmlRenderer, CodeWithoutLanguageHasNoClass) {
    ast::Node code;
    code.kind = NodeKind::Code;
    code.language_name = "";
    ast::Node body;
    body.kind = NodeKind::Text;
    body.token = Token{TokenType::String, "x", 1, 1};
    code.children.push_back(body);

    HtmlRenderer renderer;
    EXPECT_EQ(renderer.render(code), "<pre><code>x</code></pre>\n");
}
