#include "config.hpp"
#include "errors.hpp"
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace clipshelf {

namespace {

std::string require_value(int argc, const char* const argv[], int& i, const std::string& option) {
    if (i + 1 >= argc) {
        throw InvalidArgument(option + " requires a value");
    }
    return argv[++i];
}

int parse_int(const std::string& text, const std::string& option) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw InvalidArgument(option + " expects an integer, got '" + text + "'");
    }
    if (consumed != text.size()) {
        throw InvalidArgument(option + " expects an integer, got '" + text + "'");
    }
    return value;
}

float parse_float(const std::string& text, const std::string& option) {
    size_t consumed = 0;
    float value = 0.0f;
    try {
        value = std::stof(text, &consumed);
    } catch (const std::exception&) {
        throw InvalidArgument(option + " expects a number, got '" + text + "'");
    }
    if (consumed != text.size()) {
        throw InvalidArgument(option + " expects a number, got '" + text + "'");
    }
    return value;
}

}

size_t parse_count(const std::string& text, const std::string& name, size_t max_value) {
    size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::out_of_range&) {
        throw InvalidArgument(name + " is out of range, got '" + text + "'");
    } catch (const std::invalid_argument&) {
        throw InvalidArgument(name + " must be a number, got '" + text + "'");
    }
    if (consumed != text.size() || value < 0) {
        throw InvalidArgument(name + " must be a non-negative number, got '" + text + "'");
    }
    if (static_cast<unsigned long long>(value) > max_value) {
        throw InvalidArgument(name + " must be at most " + std::to_string(max_value) + ", got '" + text + "'");
    }
    return static_cast<size_t>(value);
}

double parse_number(const std::string& text, const std::string& name) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw InvalidArgument(name + " must be a number, got '" + text + "'");
    }
    if (consumed != text.size() || !std::isfinite(value)) {
        throw InvalidArgument(name + " must be a number, got '" + text + "'");
    }
    return value;
}

std::string AppConfig::resolved_database_path() const {
    if (!database_path.empty()) {
        return database_path;
    }
    return (std::filesystem::path(library_dir) / "metadata.db").string();
}

AppConfig parse_arguments(int argc, const char* const argv[]) {
    AppConfig config;

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--library" || arg == "-l") {
            config.library_dir = require_value(argc, argv, i, arg);
        } else if (arg == "--database" || arg == "-d") {
            config.database_path = require_value(argc, argv, i, arg);
        } else if (arg == "--tick-ms") {
            config.tick_interval_ms = parse_int(require_value(argc, argv, i, arg), arg);
            if (config.tick_interval_ms <= 0) {
                throw InvalidArgument("--tick-ms must be positive");
            }
        } else if (arg == "--volume") {
            config.volume = parse_float(require_value(argc, argv, i, arg), arg);
            if (config.volume < 0.0f || config.volume > 1.0f) {
                throw InvalidArgument("--volume must be between 0 and 1");
            }
        } else if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw InvalidArgument("Unknown option: " + arg);
        } else {
            break;
        }
    }

    if (i < argc) {
        config.command = argv[i++];
        for (; i < argc; ++i) {
            config.arguments.emplace_back(argv[i]);
        }
    }

    if (config.command == "help") {
        config.show_help = true;
    }
    if (config.command.empty() && !config.show_help) {
        throw InvalidArgument("No command given");
    }

    return config;
}

void print_usage() {
    std::cout << "Usage: clipshelf [options] <command> [arguments]\n";
    std::cout << "Options:\n";
    std::cout << "  --library <dir>, -l <dir>      Sound library directory (default: .)\n";
    std::cout << "  --database <file>, -d <file>   Metadata database (default: <library>/metadata.db)\n";
    std::cout << "  --tick-ms <n>                  Playback tick interval in ms (default: 20)\n";
    std::cout << "  --volume <v>                   Playback volume 0..1 (default: 0.8)\n";
    std::cout << "  --help, -h                     Show this help message\n";
    std::cout << "\nCommands:\n";
    std::cout << "  scan                           Reconcile the database with the library\n";
    std::cout << "  list                           List clips with their stats and tags\n";
    std::cout << "  info <path>                    Show one clip's metadata\n";
    std::cout << "  tag <path> <tag>...            Replace a clip's tags\n";
    std::cout << "  describe <path> <text>         Replace a clip's description\n";
    std::cout << "  find <tag>                     List clips carrying a tag\n";
    std::cout << "  tags                           List every tag in use\n";
    std::cout << "  search [keyword]               List clips whose file name contains the keyword\n";
    std::cout << "  waveform <path> [width]        Print a peak waveform\n";
    std::cout << "  crop <path> <start> <end> <out>      Save frames [start, end) to out\n";
    std::cout << "  reverse <path> <out> [start end]     Save a reversed copy\n";
    std::cout << "  remove-region <path> <start> <end> <out>  Save a copy without [start, end)\n";
    std::cout << "  gate <path> <threshold-db> <out>     Silence samples below the threshold\n";
    std::cout << "  filter <path> lowpass|highpass <hz> <out>          Butterworth filter\n";
    std::cout << "  filter <path> bandpass <low-hz> <high-hz> <out>    Butterworth band-pass\n";
    std::cout << "  pitch <path> <semitones> <out>       Shift the pitch, keeping the duration\n";
    std::cout << "  speed <path> fast|slow|<factor> <out> Change playback speed (fast = 2, slow = 0.5)\n";
    std::cout << "  snippet <path> <out> [seed]          Save a random stretch of at least a second\n";
    std::cout << "  play <path> [start end] [--reverse]  Play a clip or a frame range on the default device\n";
    std::cout << "  rename <old> <new>             Rename a clip, keeping its metadata\n";
    std::cout << "  delete <path>                  Delete a clip and its metadata\n";
    std::cout << "  import <source>                Copy a .wav into the library\n";
    std::cout << "\nExamples:\n";
    std::cout << "  clipshelf --library ~/sounds scan\n";
    std::cout << "  clipshelf tag kick.wav drums short\n";
    std::cout << "  clipshelf play --reverse kick.wav\n";
    std::cout << "  clipshelf filter kick.wav lowpass 800 kick-dull.wav\n";
}

}
