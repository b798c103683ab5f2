#include <cassert>
#include <iostream>
#include <vector>

#include "test_harness.hpp"
#include "../src/cli/args.hpp"

using namespace splash;

int failures = 0;

static Args parse(std::vector<const char*> argv) {
    argv.insert(argv.begin(), "ascii-splash");
    return parse_args(static_cast<int>(argv.size()), const_cast<char**>(argv.data()));
}

TEST(no_arguments) {
    Args args = parse({});
    assert(args.pattern.empty());
    assert(args.theme.empty());
    assert(args.fps == 0);
    assert(!args.no_mouse);
    assert(!args.show_help);
}

TEST(short_and_long_options) {
    Args args = parse({"-p", "matrix", "--theme", "fire", "-f", "45", "--quality", "high"});
    assert(args.pattern == "matrix");
    assert(args.theme == "fire");
    assert(args.fps == 45);
    assert(args.quality == "high");

    args = parse({"--pattern", "plasma", "-t", "monochrome", "--fps", "120", "-q", "low"});
    assert(args.pattern == "plasma");
    assert(args.theme == "monochrome");
    assert(args.fps == 120);
    assert(args.quality == "low");
}

TEST(flags) {
    Args args = parse({"--no-mouse", "--no-status", "--debug", "--profile-live",
                       "--color", "256", "--config", "/tmp/c.toml"});
    assert(args.no_mouse);
    assert(args.no_status);
    assert(args.debug);
    assert(args.profile_live);
    assert(args.color_mode == "256");
    assert(args.config_path == "/tmp/c.toml");
}

TEST(invalid_values_are_dropped) {
    Args args = parse({"-p", "fireworks", "-t", "neon", "-f", "500", "-q", "ultra", "--color", "8"});
    assert(args.pattern.empty());
    assert(args.theme.empty());
    assert(args.fps == 0);
    assert(args.quality.empty());
    assert(args.color_mode.empty());

    args = parse({"-f", "0"});
    assert(args.fps == 0);
    args = parse({"-f", "abc"});
    assert(args.fps == 0);
}

TEST(missing_value_is_ignored) {
    Args args = parse({"--pattern"});
    assert(args.pattern.empty());
    args = parse({"--config", ""});
    assert(args.config_path.empty());
}

TEST(help_stops_parsing) {
    Args args = parse({"-h", "-p", "matrix"});
    assert(args.show_help);
    assert(args.pattern.empty());
    assert(parse({"--help"}).show_help);
}

int main() {
    std::cout << "=== Args Tests ===\n\n";

    RUN_TEST(no_arguments);
    RUN_TEST(short_and_long_options);
    RUN_TEST(flags);
    RUN_TEST(invalid_values_are_dropped);
    RUN_TEST(missing_value_is_ignored);
    RUN_TEST(help_stops_parsing);

    std::cout << "\n=== Results: " << failures << " failures ===\n";
    return failures > 0 ? 1 : 0;
}
