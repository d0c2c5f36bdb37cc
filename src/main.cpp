#include "journal/util.hpp"
#include "ledger/command_dispatcher.hpp"
#include "ledger/engine.hpp"
#include "ledger/engine_config.hpp"

#include <cstddef>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

struct CommandLine {
    std::optional<std::string> input_path;
    std::optional<std::string> journal_path;
    bool show_help = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--input FILE] [--journal FILE]\n"
              << "Reads one JSON request per line (stdin unless --input is given)\n"
              << "and writes one JSON response per line to stdout.\n"
              << "--journal overrides LEDGER_JOURNAL_PATH; pass an empty value to run in memory." << std::endl;
}

std::optional<CommandLine> parse_command_line(int argc, char** argv) {
    CommandLine options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if ((arg == "--input" || arg == "--journal") && i + 1 < argc) {
            (arg == "--input" ? options.input_path : options.journal_path) = argv[++i];
        } else {
            std::cerr << "[Main] Unrecognised argument: " << arg << std::endl;
            return std::nullopt;
        }
    }
    return options;
}

} // namespace

int main(int argc, char** argv) {
    const auto options = parse_command_line(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 2;
    }
    if (options->show_help) {
        print_usage(argv[0]);
        return 0;
    }

    journal::load_env_file(".env");
    auto config = ledger::EngineConfig::from_env();
    if (options->journal_path) {
        config.journal_path = *options->journal_path;
    }

    std::ifstream input_file;
    if (options->input_path) {
        input_file.open(*options->input_path);
        if (!input_file.is_open()) {
            std::cerr << "[Main] Cannot open input file " << *options->input_path << std::endl;
            return 1;
        }
    }
    std::istream& input = options->input_path ? static_cast<std::istream&>(input_file) : std::cin;

    try {
        ledger::Engine engine{config};
        engine.load();
        ledger::CommandDispatcher dispatcher{engine};

        std::string line;
        std::size_t handled = 0;
        while (std::getline(input, line)) {
            if (journal::trim(line).empty()) {
                continue;
            }
            std::cout << dispatcher.handle_line(line).dump() << std::endl;
            ++handled;
        }
        std::clog << "[Main] Handled " << handled << " requests" << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "[Main] Fatal: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
