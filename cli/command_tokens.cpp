#include "cli_common.hpp"
#include <parser/errors.hpp>
#include <parser/markdown.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/token_json.hpp>

namespace marktree::cli {

int command_tokens(int argc, char** argv) {
    auto log = marktree::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: marktree tokens <input.md> [-o <output.tokens.json>] [-c <config.json>]\n";
            return 1;
        }

        Config config = prepare_command(ctx);
        log->info("Lexing: {}", ctx.input_path);

        std::string input = read_file(ctx.input_path);
        std::vector<parser::Token> tokens = parser::tokenize(input, config.lexer);

        json::SerializedData data;
        data.step = "tokens";
        data.timestamp = json::get_timestamp();
        data.source_file = ctx.input_path;
        data.config = nlohmann::json(config);
        data.data = nlohmann::json(tokens);
        data.stats = {
            {"token_count", tokens.size()},
            {"input_bytes", input.size()}
        };

        write_serialized_output(ctx, data);

        log->info("Lexed {} tokens", tokens.size());
        return 0;

    } catch (const parser::LexicalError& e) {
        log->error("Lexical error: {}", e.what());
        std::cerr << "Lexical error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace marktree::cli
