#ifndef MARKTREE_CLI_COMMON_HPP
#define MARKTREE_CLI_COMMON_HPP

#include <common/config.hpp>
#include <common/logging.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace marktree::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
};

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                ctx.output_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-o/--output requires an argument");
            }
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                ctx.config_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-c/--config requires an argument");
            }
        } else if (!arg.empty() && arg[0] != '-') {
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

// Applies --verbose and loads the -c config file, defaults otherwise
inline Config prepare_command(const CommandContext& ctx) {
    auto log = marktree::logging::get_logger();
    if (ctx.verbose) {
        log->set_level(spdlog::level::debug);
    }

    Config config;
    if (ctx.config_path) {
        config = load_config(*ctx.config_path);
        log->info("Using configuration from {}", *ctx.config_path);
    }
    return config;
}

inline std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

// Writes to the output path, or to stdout when none was given
inline void write_output(const CommandContext& ctx, const std::string& content) {
    if (ctx.output_path.empty()) {
        std::cout << content;
    } else {
        write_file(ctx.output_path, content);
    }
}

// Serialized envelope to the output path, or to stdout when none was given
inline void write_serialized_output(const CommandContext& ctx, const json::SerializedData& data) {
    if (ctx.output_path.empty()) {
        std::cout << data.to_json().dump(2) << "\n";
    } else {
        json::write_serialized(ctx.output_path, data);
    }
}

// Command function declarations
int command_tokens(int argc, char** argv);
int command_parse(int argc, char** argv);
int command_html(int argc, char** argv);

}  // namespace marktree::cli

#endif // MARKTREE_CLI_COMMON_HPP
