#pragma once

#include <string>

namespace labyrinth::cli {

// Command result codes
enum class Result {
    Success = 0,
    InvalidArgs = 1,
    FileError = 2,
    DataError = 3,
    RuntimeError = 4
};

// labyrinth-cli validate <content-dir>
// Loads the content and lists every violation
Result cmd_validate(const std::string& content_dir);

// labyrinth-cli play <content-dir> [--config <file>] [--save-dir <dir>]
// Interactive line-oriented session
Result cmd_play(const std::string& content_dir, const std::string& config_path, const std::string& save_dir);

// labyrinth-cli stats <save-dir>
// Summarizes every saved slot in the directory
Result cmd_stats(const std::string& save_dir);

// labyrinth-cli help
void cmd_help();

} // namespace labyrinth::cli
