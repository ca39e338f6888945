#include <gtest/gtest.h>
#include "config.hpp"
#include "errors.hpp"
#include <limits>
#include <string>
#include <vector>

using namespace clipshelf;

namespace {

AppConfig parse(std::vector<const char*> args) {
    args.insert(args.begin(), "clipshelf");
    return parse_arguments(static_cast<int>(args.size()), args.data());
}

}

TEST(ConfigTest, Defaults) {
    AppConfig config = parse({"list"});
    EXPECT_EQ(config.library_dir, ".");
    EXPECT_EQ(config.tick_interval_ms, 20);
    EXPECT_FLOAT_EQ(config.volume, 0.8f);
    EXPECT_EQ(config.command, "list");
    EXPECT_TRUE(config.arguments.empty());
    EXPECT_FALSE(config.show_help);
}

TEST(ConfigTest, DatabaseDefaultsIntoLibrary) {
    AppConfig config = parse({"--library", "/tmp/sounds", "scan"});
    EXPECT_EQ(config.resolved_database_path(), "/tmp/sounds/metadata.db");

    AppConfig explicit_db = parse({"--library", "/tmp/sounds", "--database", "/var/db/clips.db", "scan"});
    EXPECT_EQ(explicit_db.resolved_database_path(), "/var/db/clips.db");
}

TEST(ConfigTest, GlobalOptions) {
    AppConfig config = parse({"-l", "lib", "--tick-ms", "10", "--volume", "0.5", "play", "kick.wav"});
    EXPECT_EQ(config.library_dir, "lib");
    EXPECT_EQ(config.tick_interval_ms, 10);
    EXPECT_FLOAT_EQ(config.volume, 0.5f);
    EXPECT_EQ(config.command, "play");
    EXPECT_EQ(config.arguments, std::vector<std::string>{"kick.wav"});
}

TEST(ConfigTest, OptionsAfterCommandBelongToIt) {
    AppConfig config = parse({"play", "--reverse", "kick.wav"});
    EXPECT_EQ(config.command, "play");
    EXPECT_EQ(config.arguments, (std::vector<std::string>{"--reverse", "kick.wav"}));
}

TEST(ConfigTest, Help) {
    EXPECT_TRUE(parse({"--help"}).show_help);
    EXPECT_TRUE(parse({"-h"}).show_help);
    EXPECT_TRUE(parse({"help"}).show_help);
}

TEST(ConfigTest, InvalidArguments) {
    EXPECT_THROW(parse({}), InvalidArgument);
    EXPECT_THROW(parse({"--bogus", "list"}), InvalidArgument);
    EXPECT_THROW(parse({"--library"}), InvalidArgument);
    EXPECT_THROW(parse({"--tick-ms", "fast", "list"}), InvalidArgument);
    EXPECT_THROW(parse({"--tick-ms", "0", "list"}), InvalidArgument);
    EXPECT_THROW(parse({"--tick-ms", "10ms", "list"}), InvalidArgument);
    EXPECT_THROW(parse({"--volume", "2", "list"}), InvalidArgument);
}

TEST(ArgumentParsingTest, CountsAreNonNegativeIntegers) {
    EXPECT_EQ(parse_count("0", "start"), 0u);
    EXPECT_EQ(parse_count("48000", "start"), 48000u);

    EXPECT_THROW(parse_count("-1", "start"), InvalidArgument);
    EXPECT_THROW(parse_count("12abc", "start"), InvalidArgument);
    EXPECT_THROW(parse_count("", "start"), InvalidArgument);
    EXPECT_THROW(parse_count("99999999999999999999999", "start"), InvalidArgument);
}

TEST(ArgumentParsingTest, CountAboveTheLimitIsRejectedNotWrapped) {
    const size_t int_max = static_cast<size_t>(std::numeric_limits<int>::max());
    EXPECT_EQ(parse_count("2147483647", "width", int_max), int_max);

    try {
        parse_count("4294967297", "width", int_max);
        FAIL() << "expected InvalidArgument";
    } catch (const InvalidArgument& e) {
        EXPECT_NE(std::string(e.what()).find("width"), std::string::npos);
    }
}

TEST(ArgumentParsingTest, Numbers) {
    EXPECT_DOUBLE_EQ(parse_number("-12.5", "threshold"), -12.5);
    EXPECT_DOUBLE_EQ(parse_number("2", "factor"), 2.0);

    EXPECT_THROW(parse_number("loud", "threshold"), InvalidArgument);
    EXPECT_THROW(parse_number("3dB", "threshold"), InvalidArgument);
    EXPECT_THROW(parse_number("nan", "threshold"), InvalidArgument);
}
