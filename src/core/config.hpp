#pragma once

#include "terminal/terminal.hpp"
#include <optional>
#include <string>

namespace splash {

constexpr int CONFIG_VERSION = 1;

struct ConfigUi {
    bool status_bar = true;
    int toast_duration_ms = 3000;
    bool show_welcome = true;
};

struct ConfigTerminal {
    std::string color_mode = "auto";    // auto, truecolor, 256, 16
};

struct ConfigDebug {
    bool overlay = false;
    bool profile_live = false;
};

struct Config {
    int version = CONFIG_VERSION;
    std::string pattern = "waves";
    std::string theme = "ocean";
    std::string quality = "medium";     // low, medium, high
    std::optional<int> fps;             // overrides quality when set
    bool mouse_enabled = true;

    ConfigUi ui;
    ConfigTerminal terminal;
    ConfigDebug debug;

    std::string config_path;

    int effective_fps() const;
    // COLORTERM/TERM detection for "auto".
    ColorMode effective_color_mode() const;
    bool validate(std::string& error) const;

    static Config defaults();
    static std::optional<Config> load(const std::string& path);
    static std::optional<Config> load_default();
    static std::string default_config_path();
    static std::string default_config_dir();
};

// Returns 0 for an unknown quality name.
int quality_fps(const std::string& quality);
// Next level up (direction > 0) or down, stopping at low and high.
std::string step_quality(const std::string& quality, int direction);
std::optional<ColorMode> parse_color_mode(const std::string& name);

Config merge_config(Config base, const Config& override);
Config apply_cli_overrides(Config config, const struct Args& args);

}
