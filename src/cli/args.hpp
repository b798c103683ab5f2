#pragma once

#include <string>

namespace splash {

struct Args {
    std::string pattern;
    std::string theme;
    std::string quality;
    std::string color_mode;     // auto, truecolor, 256, 16
    std::string config_path;

    int fps = 0;                // 0 = not given

    bool no_mouse = false;
    bool no_status = false;
    bool debug = false;
    bool profile_live = false;

    bool show_help = false;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
