#include <iostream>
#include <string>

#include <cli/cli_common.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> <input.md> [options]\n";
    std::cerr << "\n";
    std::cerr << "Converts constrained Markdown to an AST and to HTML.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  tokens      Write the token stream as JSON\n";
    std::cerr << "  parse       Write the syntax tree as JSON\n";
    std::cerr << "  html        Render the document as HTML\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output FILE   Output file (defaults to stdout)\n";
    std::cerr << "  -c, --config FILE   JSON configuration (lexer, render)\n";
    std::cerr << "  -v, --verbose       Debug logging\n";
    std::cerr << "  -h, --help          Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  MARKTREE_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "tokens") {
        return marktree::cli::command_tokens(argc, argv);
    }
    if (command == "parse") {
        return marktree::cli::command_parse(argc, argv);
    }
    if (command == "html") {
        return marktree::cli::command_html(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
