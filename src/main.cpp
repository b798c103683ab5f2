#include "cli/args.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "engine/scheduler.hpp"
#include "patterns/registry.hpp"
#include "patterns/theme.hpp"
#include "render/output_emitter.hpp"
#include "terminal/input.hpp"
#include "terminal/output.hpp"
#include "terminal/terminal.hpp"
#include "ui/overlays.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>

#include <unistd.h>

namespace {

volatile std::sig_atomic_t g_quit_requested = 0;
splash::OutputEmitter* g_emitter = nullptr;

constexpr int kMinInteractiveFps = 10;
constexpr int kMaxInteractiveFps = 60;
constexpr int kFpsStep = 5;

void on_quit_signal(int) {
    g_quit_requested = 1;
}

void on_fatal_signal(int sig) {
    if (g_emitter) g_emitter->cleanup();
    // SA_RESETHAND restored the default action.
    std::raise(sig);
}

void on_terminate() {
    if (g_emitter) g_emitter->cleanup();
    std::abort();
}

void install_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sigemptyset(&sa.sa_mask);
    sa.sa_handler = on_quit_signal;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);

    sa.sa_handler = on_fatal_signal;
    sa.sa_flags = SA_RESETHAND;
    for (int sig : {SIGSEGV, SIGBUS, SIGFPE, SIGILL, SIGABRT}) {
        sigaction(sig, &sa, nullptr);
    }
}

struct Session {
    const splash::Config& config;
    splash::OutputEmitter& emitter;
    splash::Clock clock;
    const splash::Theme* theme;
    splash::PatternRegistry registry;
    size_t pattern_index;
    std::string quality;
    splash::Scheduler scheduler;
    splash::Overlays ui;
    splash::InputReader input;
    splash::MoveThrottle move_throttle;

    Session(const splash::Config& cfg, splash::OutputEmitter& em, splash::Clock clk)
        : config(cfg),
          emitter(em),
          clock(std::move(clk)),
          theme(&splash::theme_by_name(cfg.theme)),
          registry(*theme),
          pattern_index(registry.index_of(cfg.pattern)),
          quality(cfg.quality),
          scheduler(em, registry.at(pattern_index), cfg.effective_fps(), clock),
          ui(cfg.ui.toast_duration_ms),
          input(STDIN_FILENO, clock) {
        ui.status.set_visible(cfg.ui.status_bar);
        scheduler.set_reserved_rows(cfg.ui.status_bar ? 1 : 0);
        ui.debug.set_visible(cfg.debug.overlay);
    }

    splash::Pattern& pattern() { return scheduler.pattern(); }

    void select_pattern(size_t index) {
        if (index == pattern_index) return;
        pattern_index = index;
        scheduler.set_pattern(registry.at(index));
        ui.toasts.info("Pattern: " + pattern().name());
    }

    void step_preset(int direction) {
        const auto presets = pattern().presets();
        if (presets.empty()) {
            ui.toasts.warning(pattern().name() + " has no presets");
            return;
        }
        const int current = pattern().current_preset();
        auto it = std::find_if(presets.begin(), presets.end(),
                               [current](const splash::PatternPreset& p) { return p.id == current; });
        long pos = it == presets.end() ? (direction > 0 ? -1 : 0) : it - presets.begin();
        const long n = static_cast<long>(presets.size());
        pos = ((pos + direction) % n + n) % n;

        const splash::PatternPreset& preset = presets[static_cast<size_t>(pos)];
        if (pattern().apply_preset(preset.id)) {
            ui.toasts.info("Preset " + std::to_string(preset.id) + ": " + preset.name);
        }
    }

    void change_fps(int delta) {
        const int current = static_cast<int>(std::lround(scheduler.fps()));
        const int fps = std::clamp(current + delta, kMinInteractiveFps, kMaxInteractiveFps);
        if (fps == current) return;
        scheduler.set_fps(fps);
        ui.toasts.info("Target " + std::to_string(fps) + " fps");
    }

    void step_quality(int direction) {
        const std::string next = splash::step_quality(quality, direction);
        if (next == quality) return;
        quality = next;
        scheduler.set_fps(splash::quality_fps(quality));
        std::string label = quality;
        std::transform(label.begin(), label.end(), label.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        ui.toasts.info("Quality: " + label + " (" + std::to_string(splash::quality_fps(quality)) + " fps)");
    }

    void cycle_theme() {
        theme = &splash::next_theme(*theme);
        registry.set_theme(*theme);
        ui.toasts.info("Theme: " + theme->display_name);
    }

    void handle_key(const splash::InputEvent& ev) {
        if (ev.key == splash::Key::CtrlC) {
            scheduler.stop();
            return;
        }
        if (ev.key == splash::Key::Escape) {
            if (ui.help.visible()) {
                ui.help.hide();
            } else {
                scheduler.stop();
            }
            return;
        }
        if (ev.key != splash::Key::Char) return;

        const uint32_t ch = ev.ch;
        if (ch == 'q' || ch == 'Q') {
            scheduler.stop();
        } else if (ch == ' ') {
            scheduler.pause();
        } else if (ch >= '1' && ch <= '9') {
            const size_t index = ch - '1';
            if (index < registry.size()) select_pattern(index);
        } else if (ch == 'n') {
            select_pattern(registry.next(pattern_index));
        } else if (ch == 'b') {
            select_pattern(registry.prev(pattern_index));
        } else if (ch == '.') {
            step_preset(1);
        } else if (ch == ',') {
            step_preset(-1);
        } else if (ch == '+' || ch == '=') {
            change_fps(kFpsStep);
        } else if (ch == '-' || ch == '_') {
            change_fps(-kFpsStep);
        } else if (ch == '[') {
            step_quality(-1);
        } else if (ch == ']') {
            step_quality(1);
        } else if (ch == 't') {
            cycle_theme();
        } else if (ch == '?') {
            ui.help.toggle();
        } else if (ch == 'd') {
            ui.debug.toggle();
        }
    }

    void handle_mouse(const splash::InputEvent& ev) {
        if (!emitter.mouse_enabled()) return;
        switch (ev.type) {
            case splash::InputType::MouseMove:
                scheduler.set_mouse_position(ev.pos);
                if (move_throttle.accept(clock())) pattern().on_mouse_move(ev.pos);
                break;
            case splash::InputType::MouseClick:
                scheduler.set_mouse_position(ev.pos);
                if (ev.button == 0) pattern().on_mouse_click(ev.pos);
                break;
            default:
                break;
        }
    }

    void draw_ui() {
        const splash::PerformanceTelemetry& telemetry = scheduler.telemetry();
        const double measured = telemetry.history_size() > 0 ? telemetry.metrics().fps : scheduler.fps();
        const splash::StatusBarState state{pattern().name(), pattern().current_preset(), theme->name,
                                           static_cast<int>(std::lround(measured)), scheduler.paused()};
        ui.draw(emitter.buffer(), clock(), state, telemetry, pattern());
    }

    void profile_frame() {
        const splash::FrameMetrics m = scheduler.telemetry().metrics();
        std::cerr << std::fixed << std::setprecision(3)
                  << "{\"frame\":" << scheduler.frame_count()
                  << ",\"ms\":" << m.frame_time
                  << ",\"fps\":" << m.fps
                  << ",\"update_ms\":" << m.update_time
                  << ",\"pattern_ms\":" << m.pattern_render_time
                  << ",\"render_ms\":" << m.render_time
                  << ",\"cells\":" << m.changed_cells
                  << "}\n";
    }

    void idle() {
        if (g_quit_requested) {
            scheduler.stop();
            return;
        }

        if (emitter.poll_resize()) ui.invalidate();

        for (const splash::InputEvent& ev : input.poll()) {
            if (ev.type == splash::InputType::Key) {
                handle_key(ev);
            } else {
                handle_mouse(ev);
            }
            if (!scheduler.running()) return;
        }

        // No frames are produced while paused, so overlay changes go out here.
        if (scheduler.paused()) {
            draw_ui();
            emitter.emit(emitter.buffer().get_changes());
        }
    }

    void run() {
        scheduler.set_after_render_callback([this] {
            draw_ui();
            if (config.debug.profile_live) profile_frame();
        });
        if (config.ui.show_welcome) {
            ui.toasts.info("ascii-splash: press ? for help");
        }

        scheduler.start();
        scheduler.run([this] { idle(); });
    }
};

void print_perf_summary(const splash::PerformanceTelemetry& telemetry, double wall_seconds) {
    const splash::FrameStats stats = telemetry.stats();
    if (stats.total_frames == 0 || wall_seconds <= 0.0) {
        std::cerr << "[PERF] no frames rendered.\n";
        return;
    }
    std::cerr << std::fixed << std::setprecision(2)
              << "[PERF] frames=" << stats.total_frames
              << ", wall_s=" << wall_seconds
              << ", effective_fps=" << static_cast<double>(stats.total_frames) / wall_seconds
              << ", dropped=" << stats.total_dropped_frames
              << "\n";
    std::cerr << std::fixed << std::setprecision(2)
              << "[PERF_FPS] avg=" << stats.avg_fps
              << ", min=" << stats.min_fps
              << ", max=" << stats.max_fps
              << ", p5=" << telemetry.percentile(5)
              << ", p50=" << telemetry.percentile(50)
              << ", p95=" << telemetry.percentile(95)
              << ", avg_frame_ms=" << stats.avg_frame_time
              << "\n";
}

}

int main(int argc, char* argv[]) {
    splash::Args args = splash::parse_args(argc, argv);

    if (args.show_help) {
        splash::print_help(argv[0]);
        return 0;
    }

    splash::Config config = splash::Config::defaults();
    if (!args.config_path.empty()) {
        auto loaded = splash::Config::load(args.config_path);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << args.config_path << "\n";
            return 1;
        }
        config = splash::merge_config(config, *loaded);
    } else {
        const std::string default_path = splash::Config::default_config_path();
        std::error_code ec;
        if (std::filesystem::exists(default_path, ec)) {
            if (auto loaded_default = splash::Config::load(default_path)) {
                config = splash::merge_config(config, *loaded_default);
            } else {
                std::cerr << "Warning: Ignoring invalid config file: " << default_path << "\n";
            }
        }
    }
    config = splash::apply_cli_overrides(config, args);

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }

    if (!isatty(STDOUT_FILENO)) {
        std::cerr << "Error: stdout is not a terminal\n";
        return 1;
    }

    splash::FdOutput output(STDOUT_FILENO);
    splash::Terminal terminal(output, STDIN_FILENO, STDOUT_FILENO);
    splash::OutputEmitter emitter(terminal, config.effective_color_mode());

    g_emitter = &emitter;
    install_signal_handlers();
    std::set_terminate(on_terminate);

    splash::Clock clock = splash::steady_clock_ms();
    const double session_start = clock();
    int status = 0;

    try {
        const bool raw = emitter.initialize(config.mouse_enabled);
        Session session(config, emitter, clock);
        if (!raw) session.ui.toasts.warning("Keyboard input is line buffered");
        session.run();

        emitter.cleanup();
        g_emitter = nullptr;
        print_perf_summary(session.scheduler.telemetry(), (clock() - session_start) / 1000.0);
    } catch (const std::exception& e) {
        emitter.cleanup();
        g_emitter = nullptr;
        std::cerr << "Error: " << e.what() << "\n";
        status = 1;
    }

    return status;
}
