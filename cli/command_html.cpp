#include "cli_common.hpp"
#include <parser/markdown.hpp>
#include <render/html_renderer.hpp>

namespace marktree::cli {

int command_html(int argc, char** argv) {
    auto log = marktree::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: marktree html <input.md> [-o <output.html>] [-c <config.json>]\n";
            return 1;
        }

        Config config = prepare_command(ctx);
        log->info("Rendering: {}", ctx.input_path);

        std::string input = read_file(ctx.input_path);
        parser::ParseResult result = parser::parse_markdown(input, config.lexer);

        // A failed parse is reported as-is, nothing is rendered
        if (auto* error = std::get_if<parser::ParseError>(&result)) {
            log->error("{} error: {}", parser::error_kind_name(error->kind), error->message);
            std::cerr << parser::error_kind_name(error->kind) << " error: " << error->message << "\n";
            return 1;
        }

        render::HtmlRenderer renderer(config.render);
        std::string html = renderer.render(std::get<parser::ast::Node>(result));

        write_output(ctx, html);

        if (!ctx.output_path.empty()) {
            log->info("Wrote {} ({} bytes)", ctx.output_path, html.size());
        }
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace marktree::cli
