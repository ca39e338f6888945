#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace clipshelf {

struct AppConfig {
    std::string library_dir = ".";
    // Empty means <library_dir>/metadata.db
    std::string database_path;
    int tick_interval_ms = 20;
    float volume = 0.8f;
    bool show_help = false;

    std::string command;
    std::vector<std::string> arguments;

    std::string resolved_database_path() const;
};

// Global options must precede the command. Everything after the command is
// passed through as its arguments. Throws InvalidArgument.
AppConfig parse_arguments(int argc, const char* const argv[]);

// Command argument parsers. Both throw InvalidArgument naming the argument.
size_t parse_count(const std::string& text, const std::string& name,
                   size_t max_value = std::numeric_limits<size_t>::max());
double parse_number(const std::string& text, const std::string& name);

void print_usage();

}
