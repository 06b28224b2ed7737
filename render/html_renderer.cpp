#include "html_renderer.hpp"
#include <common/logging.hpp>
#include <utility>

namespace marktree {
namespace render {

using parser::ast::Node;
using parser::ast::NodeKind;

const char* tag_for(NodeKind kind) {
    switch (kind) {
        case NodeKind::Bold: return "strong";
        case NodeKind::Italic: return "i";
        case NodeKind::Monospace: return "code";
        case NodeKind::Header1: return "h1";
        case NodeKind::Header2: return "h2";
        case NodeKind::Header3: return "h3";
        case NodeKind::Header4: return "h4";
        case NodeKind::Header5: return "h5";
        case NodeKind::UnorderedListRoot: return "ul";
        case NodeKind::UnorderedListItem: return "li";
        default: return nullptr;
    }
}

HtmlRenderer::HtmlRenderer(RenderOptions options) : options_(std::move(options)) {}

std::string HtmlRenderer::render(const Node& root) const {
    auto log = marktree::logging::get_logger();
    std::ostringstream out;

    if (root.kind == NodeKind::Document) {
        bool wrap = !options_.document_tag.empty();
        if (wrap) {
            out << "<" << options_.document_tag << ">\n";
        }
        render_children(root, 0, out);
        if (wrap) {
            out << "</" << options_.document_tag << ">\n";
        }
    } else {
        render_node(root, 0, out);
    }

    std::string html = out.str();
    log->debug("HtmlRenderer: {} nodes rendered to {} bytes",
               parser::ast::count_nodes(root), html.size());
    return html;
}

void HtmlRenderer::render_children(const Node& node, uint32_t depth, std::ostringstream& out) const {
    for (const auto& child : node.children) {
        render_node(child, depth, out);
    }
}

void HtmlRenderer::render_node(const Node& node, uint32_t depth, std::ostringstream& out) const {
    switch (node.kind) {
        case NodeKind::Text:
        case NodeKind::Space:
            write_line(out, depth, "<span>" + node.text() + "</span>");
            return;

        case NodeKind::NewLine:
            write_line(out, depth, "<br>");
            return;

        case NodeKind::Code: {
            std::string open = "<pre><code";
            if (node.language_name && !node.language_name->empty()) {
                open += " class=\"language-" + *node.language_name + "\"";
            }
            open += ">";
            std::string body = node.children.empty() ? std::string() : node.children.front().text();
            write_line(out, depth, open + body + "</code></pre>");
            return;
        }

        case NodeKind::Void:
            return;

        case NodeKind::Document:
            render_children(node, depth, out);
            return;

        default:
            break;
    }

    const char* tag = tag_for(node.kind);
    write_line(out, depth, std::string("<") + tag + ">");
    render_children(node, depth + 1, out);
    write_line(out, depth, std::string("</") + tag + ">");
}

void HtmlRenderer::write_line(std::ostringstream& out, uint32_t depth, const std::string& text) const {
    out << std::string(static_cast<size_t>(depth) * options_.indent_width, ' ') << text << '\n';
}

}  // namespace render
}  // namespace marktree
