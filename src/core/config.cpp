#include "core/config.hpp"
#include "cli/args.hpp"
#include "patterns/registry.hpp"
#include "patterns/theme.hpp"
#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>

#include <pwd.h>
#include <unistd.h>

namespace splash {

namespace {

std::string get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
}

std::string get_config_home() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
}

}

int quality_fps(const std::string& quality) {
    if (quality == "low") return 15;
    if (quality == "medium") return 30;
    if (quality == "high") return 60;
    return 0;
}

std::string step_quality(const std::string& quality, int direction) {
    static const char* const levels[] = {"low", "medium", "high"};
    int index = 1;
    for (int i = 0; i < 3; ++i) {
        if (quality == levels[i]) index = i;
    }
    if (direction > 0 && index < 2) ++index;
    else if (direction < 0 && index > 0) --index;
    return levels[index];
}

std::optional<ColorMode> parse_color_mode(const std::string& name) {
    if (name == "truecolor" || name == "24bit") return ColorMode::Truecolor;
    if (name == "256") return ColorMode::Ansi256;
    if (name == "16") return ColorMode::Ansi16;
    return std::nullopt;
}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_config_home() + "/ascii-splash";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

int Config::effective_fps() const {
    if (fps) return *fps;
    const int q = quality_fps(quality);
    return q > 0 ? q : 30;
}

ColorMode Config::effective_color_mode() const {
    if (auto mode = parse_color_mode(terminal.color_mode)) return *mode;
    return Terminal::detect_color_mode();
}

bool Config::validate(std::string& error) const {
    if (version != CONFIG_VERSION) {
        error = "config_version must be " + std::to_string(CONFIG_VERSION);
        return false;
    }
    if (fps && (*fps < 1 || *fps > 120)) {
        error = "fps must be between 1 and 120";
        return false;
    }
    if (quality_fps(quality) == 0) {
        error = "quality must be 'low', 'medium', or 'high'";
        return false;
    }
    if (!PatternRegistry::is_pattern_name(pattern)) {
        error = "pattern must be one of 'waves', 'starfield', 'matrix', 'plasma'";
        return false;
    }
    if (!is_theme_name(theme)) {
        error = "theme must be one of 'ocean', 'matrix', 'starlight', 'fire', 'monochrome'";
        return false;
    }
    if (ui.toast_duration_ms < 100 || ui.toast_duration_ms > 60000) {
        error = "ui.toast_duration_ms must be between 100 and 60000";
        return false;
    }
    if (terminal.color_mode != "auto" && !parse_color_mode(terminal.color_mode)) {
        error = "terminal.color_mode must be 'auto', 'truecolor', '256', or '16'";
        return false;
    }
    return true;
}

std::optional<Config> Config::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["config_version"].value<int>()) cfg.version = *v;
        if (auto v = tbl["fps"].value<int>()) cfg.fps = *v;
        if (auto v = tbl["pattern"].value<std::string>()) cfg.pattern = *v;
        if (auto v = tbl["theme"].value<std::string>()) cfg.theme = *v;
        if (auto v = tbl["quality"].value<std::string>()) cfg.quality = *v;
        if (auto v = tbl["mouse_enabled"].value<bool>()) cfg.mouse_enabled = *v;

        if (auto ui = tbl["ui"]) {
            if (auto v = ui["status_bar"].value<bool>()) cfg.ui.status_bar = *v;
            if (auto v = ui["toast_duration_ms"].value<int>()) cfg.ui.toast_duration_ms = *v;
            if (auto v = ui["show_welcome"].value<bool>()) cfg.ui.show_welcome = *v;
        }

        if (auto terminal = tbl["terminal"]) {
            if (auto v = terminal["color_mode"].value<std::string>()) {
                cfg.terminal.color_mode = *v;
            } else if (auto n = terminal["color_mode"].value<int>()) {
                cfg.terminal.color_mode = std::to_string(*n);
            }
        }

        if (auto debug = tbl["debug"]) {
            if (auto v = debug["overlay"].value<bool>()) cfg.debug.overlay = *v;
            if (auto v = debug["profile_live"].value<bool>()) cfg.debug.profile_live = *v;
        }

        std::string error;
        if (!cfg.validate(error)) {
            return std::nullopt;
        }

        return cfg;
    } catch (const toml::parse_error&) {
        return std::nullopt;
    }
}

std::optional<Config> Config::load_default() {
    return load(default_config_path());
}

Config merge_config(Config base, const Config& override) {
    const Config defaults = Config::defaults();
    Config result = base;

    if (override.pattern != defaults.pattern) result.pattern = override.pattern;
    if (override.theme != defaults.theme) result.theme = override.theme;
    if (override.quality != defaults.quality) result.quality = override.quality;
    if (override.fps) result.fps = override.fps;
    if (override.mouse_enabled != defaults.mouse_enabled) result.mouse_enabled = override.mouse_enabled;

    if (override.ui.status_bar != defaults.ui.status_bar) result.ui.status_bar = override.ui.status_bar;
    if (override.ui.toast_duration_ms != defaults.ui.toast_duration_ms)
        result.ui.toast_duration_ms = override.ui.toast_duration_ms;
    if (override.ui.show_welcome != defaults.ui.show_welcome) result.ui.show_welcome = override.ui.show_welcome;

    if (override.terminal.color_mode != defaults.terminal.color_mode)
        result.terminal.color_mode = override.terminal.color_mode;

    if (override.debug.overlay) result.debug.overlay = true;
    if (override.debug.profile_live) result.debug.profile_live = true;

    if (!override.config_path.empty()) result.config_path = override.config_path;
    return result;
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (!args.pattern.empty()) config.pattern = args.pattern;
    if (!args.theme.empty()) config.theme = args.theme;
    if (!args.quality.empty()) {
        config.quality = args.quality;
        // An explicit quality on the command line beats an fps from the file.
        if (args.fps == 0) config.fps.reset();
    }
    if (args.fps > 0) config.fps = args.fps;
    if (args.no_mouse) config.mouse_enabled = false;
    if (args.no_status) config.ui.status_bar = false;
    if (!args.color_mode.empty()) config.terminal.color_mode = args.color_mode;
    if (args.debug) config.debug.overlay = true;
    if (args.profile_live) config.debug.profile_live = true;
    if (!args.config_path.empty()) config.config_path = args.config_path;
    return config;
}

}
