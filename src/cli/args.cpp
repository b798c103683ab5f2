#include "cli/args.hpp"
#include "core/config.hpp"
#include "patterns/registry.hpp"
#include "patterns/theme.hpp"
#include <cstring>
#include <cstdlib>
#include <cstdio>

namespace splash {

static int clamp_int(int val, int min_val, int max_val, int default_val) {
    if (val < min_val || val > max_val) return default_val;
    return val;
}

static bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }

        if (strcmp(arg, "-p") == 0 || strcmp(arg, "--pattern") == 0) {
            if (i + 1 < argc) {
                std::string name = argv[++i];
                if (PatternRegistry::is_pattern_name(name)) {
                    args.pattern = name;
                }
            }
        }
        else if (strcmp(arg, "-f") == 0 || strcmp(arg, "--fps") == 0) {
            if (i + 1 < argc) args.fps = clamp_int(std::atoi(argv[++i]), 1, 120, 0);
        }
        else if (strcmp(arg, "-t") == 0 || strcmp(arg, "--theme") == 0) {
            if (i + 1 < argc) {
                std::string name = argv[++i];
                if (is_theme_name(name)) {
                    args.theme = name;
                }
            }
        }
        else if (strcmp(arg, "-q") == 0 || strcmp(arg, "--quality") == 0) {
            if (i + 1 < argc) {
                std::string q = argv[++i];
                if (quality_fps(q) > 0) {
                    args.quality = q;
                }
            }
        }
        else if (strcmp(arg, "--color") == 0) {
            if (i + 1 < argc) {
                std::string mode = argv[++i];
                if (mode == "auto" || parse_color_mode(mode)) {
                    args.color_mode = mode;
                }
            }
        }
        else if (strcmp(arg, "--config") == 0) {
            if (i + 1 < argc) {
                args.config_path = argv[++i];
                if (!validate_path(args.config_path)) {
                    args.config_path.clear();
                }
            }
        }
        else if (strcmp(arg, "--no-mouse") == 0) {
            args.no_mouse = true;
        }
        else if (strcmp(arg, "--no-status") == 0) {
            args.no_status = true;
        }
        else if (strcmp(arg, "--debug") == 0) {
            args.debug = true;
        }
        else if (strcmp(arg, "--profile-live") == 0) {
            args.profile_live = true;
        }
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS]\n\n", prog);
    printf("Animated terminal screensaver.\n\n");
    printf("OPTIONS:\n");
    printf("  -p, --pattern <NAME>    Pattern: waves, starfield, matrix, plasma (default: waves)\n");
    printf("  -f, --fps <N>           Target FPS (range: 1-120, overrides --quality)\n");
    printf("  -t, --theme <NAME>      Theme: ocean, matrix, starlight, fire, monochrome\n");
    printf("  -q, --quality <LEVEL>   Quality preset: low (15fps), medium (30fps), high (60fps)\n");
    printf("      --no-mouse          Disable mouse interaction\n");
    printf("      --no-status         Hide the status bar\n");
    printf("      --color <MODE>      Color mode: auto, truecolor, 256, 16\n");
    printf("      --config <FILE>     Config file path (default: %s)\n", Config::default_config_path().c_str());
    printf("      --debug             Show the debug overlay\n");
    printf("      --profile-live      Output per-frame profiling as JSONL to stderr\n");
    printf("  -h, --help              Show this help\n");
    printf("\nINTERACTIVE CONTROLS:\n");
    printf("  SPACE                   Pause/resume\n");
    printf("  q/Esc/Ctrl-C            Quit\n");
    printf("  1-4                     Select pattern\n");
    printf("  n / b                   Next/previous pattern\n");
    printf("  . / ,                   Next/previous preset\n");
    printf("  + / -                   Increase/decrease FPS (10-60)\n");
    printf("  t                       Cycle theme\n");
    printf("  ?                       Toggle help\n");
    printf("  d                       Toggle debug overlay\n");
}

}
