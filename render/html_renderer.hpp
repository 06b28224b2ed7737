#ifndef MARKTREE_RENDER_HTML_RENDERER_HPP
#define MARKTREE_RENDER_HTML_RENDERER_HPP

#include <parser/ast.hpp>
#include <cstdint>
#include <sstream>
#include <string>

namespace marktree {
namespace render {

struct RenderOptions {
    uint32_t indent_width = 3;          // Spaces per nesting level
    std::string document_tag = "html";  // Empty omits the document wrapper
};

// Tree walk from an AST to HTML text. Text content is written as-is; no
// escaping of HTML-special characters is applied.
class HtmlRenderer {
public:
    explicit HtmlRenderer(RenderOptions options = {});

    std::string render(const parser::ast::Node& root) const;

private:
    RenderOptions options_;

    void render_node(const parser::ast::Node& node, uint32_t depth, std::ostringstream& out) const;
    void render_children(const parser::ast::Node& node, uint32_t depth, std::ostringstream& out) const;
    void write_line(std::ostringstream& out, uint32_t depth, const std::string& text) const;
};

// Tag name for container kinds, nullptr for kinds without a tag pair
const char* tag_for(parser::ast::NodeKind kind);

}  // namespace render
}  // namespace marktree

#endif // MARKTREE_RENDER_HTML_RENDERER_HPP
