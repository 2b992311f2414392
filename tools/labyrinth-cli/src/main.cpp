#include "commands.hpp"
#include <iostream>
#include <string>
#include <cstring>

using namespace labyrinth::cli;

void print_version() {
    std::cout << "Labyrinth CLI v0.1.0\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return static_cast<int>(Result::InvalidArgs);
    }

    std::string command = argv[1];

    // Handle version flag
    if (command == "--version" || command == "-v") {
        print_version();
        return 0;
    }

    // Handle help
    if (command == "help" || command == "--help" || command == "-h") {
        cmd_help();
        return 0;
    }

    if (command == "validate") {
        if (argc < 3) {
            std::cerr << "Error: 'validate' requires a content directory\n";
            std::cerr << "Usage: labyrinth-cli validate <content-dir>\n";
            return static_cast<int>(Result::InvalidArgs);
        }
        return static_cast<int>(cmd_validate(argv[2]));
    }

    if (command == "play") {
        if (argc < 3) {
            std::cerr << "Error: 'play' requires a content directory\n";
            std::cerr << "Usage: labyrinth-cli play <content-dir> [--config <file>] [--save-dir <dir>]\n";
            return static_cast<int>(Result::InvalidArgs);
        }

        std::string content_dir = argv[2];
        std::string config_path;
        std::string save_dir;

        // Parse optional arguments
        for (int i = 3; i < argc; ++i) {
            if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                config_path = argv[++i];
            } else if (std::strcmp(argv[i], "--save-dir") == 0 && i + 1 < argc) {
                save_dir = argv[++i];
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                return static_cast<int>(Result::InvalidArgs);
            }
        }

        return static_cast<int>(cmd_play(content_dir, config_path, save_dir));
    }

    if (command == "stats") {
        if (argc < 3) {
            std::cerr << "Error: 'stats' requires a save directory\n";
            std::cerr << "Usage: labyrinth-cli stats <save-dir>\n";
            return static_cast<int>(Result::InvalidArgs);
        }
        return static_cast<int>(cmd_stats(argv[2]));
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'labyrinth-cli help' for usage information.\n";
    return static_cast<int>(Result::InvalidArgs);
}
