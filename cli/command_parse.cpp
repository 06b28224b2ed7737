#include "cli_common.hpp"
#include <parser/markdown.hpp>
#include <serialization/ast_json.hpp>
#include <serialization/json_serialization.hpp>

namespace marktree::cli {

int command_parse(int argc, char** argv) {
    auto log = marktree::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: marktree parse <input.md> [-o <output.ast.json>] [-c <config.json>]\n";
            return 1;
        }

        Config config = prepare_command(ctx);
        log->info("Parsing: {}", ctx.input_path);

        std::string input = read_file(ctx.input_path);
        parser::ParseResult result = parser::parse_markdown(input, config.lexer);

        if (auto* error = std::get_if<parser::ParseError>(&result)) {
            log->error("{} error: {}", parser::error_kind_name(error->kind), error->message);
            std::cerr << parser::error_kind_name(error->kind) << " error: " << error->message << "\n";
            return 1;
        }

        const auto& document = std::get<parser::ast::Node>(result);

        json::SerializedData data;
        data.step = "ast";
        data.timestamp = json::get_timestamp();
        data.source_file = ctx.input_path;
        data.config = nlohmann::json(config);
        data.data = nlohmann::json(document);
        data.stats = {
            {"node_count", parser::ast::count_nodes(document)},
            {"block_count", document.children.size()}
        };

        write_serialized_output(ctx, data);

        log->info("Parsed {} top-level blocks", document.children.size());
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace marktree::cli
