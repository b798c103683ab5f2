#include "ui/help_overlay.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace splash {

namespace {
    const Color kBackground{20, 20, 30};
    const Color kBorder{80, 120, 180};
    const Color kTitle{100, 180, 255};
    const Color kKey{255, 200, 100};
    const Color kText{180, 180, 180};

    struct HelpItem {
        const char* key;
        const char* description;
    };

    struct HelpSection {
        const char* title;
        std::vector<HelpItem> items;
    };

    const std::vector<HelpSection> kSections = {
        {"QUICK CONTROLS", {
            {"1-4", "Select pattern"},
            {"n / b", "Next/Previous pattern"},
            {". / ,", "Next/Prev preset"},
            {"+ / -", "Faster/Slower (10-60 fps)"},
            {"[ / ]", "Lower/Raise quality"},
            {"t", "Cycle themes"},
            {"SPACE", "Pause/Resume"},
            {"d", "Debug overlay"},
            {"?", "Toggle help"},
            {"q / ESC", "Quit"},
        }},
        {"MOUSE", {
            {"Move", "Interactive effects"},
            {"Click", "Ripple/burst/interact"},
        }},
    };

    constexpr int kKeyColumn = 10;
}

void HelpOverlay::toggle() {
    visible_ = !visible_;
    dirty_ = true;
}

void HelpOverlay::show() {
    if (visible_) return;
    visible_ = true;
    dirty_ = true;
}

void HelpOverlay::hide() {
    if (!visible_) return;
    visible_ = false;
    dirty_ = true;
}

Rect HelpOverlay::layout(Size screen) {
    Rect r;
    r.width = std::min(MAX_WIDTH, screen.width - 4);
    r.height = std::min(MAX_HEIGHT, screen.height - 4);
    r.x = (screen.width - r.width) / 2;
    r.y = (screen.height - r.height) / 2;
    if (r.width < 20 || r.height < 5) return Rect{};
    return r;
}

bool HelpOverlay::render(FrameBuffer& fb) {
    if (!dirty_ && fb.size() == drawn_size_) return false;

    if (fb.size() == drawn_size_) draw::clear(fb, drawn_);
    drawn_ = Rect{};
    drawn_size_ = fb.size();
    dirty_ = false;

    if (!visible_) return true;

    const Rect r = layout(fb.size());
    if (r.empty()) return true;
    draw(fb, r);
    drawn_ = r;
    return true;
}

void HelpOverlay::draw(FrameBuffer& fb, const Rect& r) {
    draw::fill(fb, r, Cell(' ', kBackground));
    draw::border(fb, r, kBorder);

    const std::string title = " ascii-splash Help ";
    draw::text(fb, r.x + (r.width - static_cast<int>(title.size())) / 2, r.y, title, kTitle, r.width - 2);

    const int inner = r.width - 4;
    const int last_row = r.y + r.height - 2;
    int y = r.y + 2;
    for (const HelpSection& section : kSections) {
        if (y > last_row) break;
        draw::text(fb, r.x + 2, y++, section.title, kTitle, inner);
        for (const HelpItem& item : section.items) {
            if (y > last_row) break;
            draw::text(fb, r.x + 4, y, item.key, kKey, std::max(0, inner - 2));
            const int desc_x = r.x + 4 + kKeyColumn;
            draw::text(fb, desc_x, y, item.description, kText, std::max(0, r.x + r.width - 2 - desc_x));
            ++y;
        }
        ++y;
    }

    const std::string footer = "[ESC/?: close]";
    draw::text(fb, r.x + (r.width - static_cast<int>(footer.size())) / 2, r.y + r.height - 1,
               footer, kText, r.width - 2);
}

}
