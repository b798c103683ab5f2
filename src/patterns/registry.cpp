#include "patterns/registry.hpp"
#include "patterns/matrix.hpp"
#include "patterns/plasma.hpp"
#include "patterns/starfield.hpp"
#include "patterns/waves.hpp"
#include <algorithm>

namespace splash {

PatternRegistry::PatternRegistry(const Theme& theme) {
    patterns_.push_back(std::make_unique<WavePattern>(theme));
    patterns_.push_back(std::make_unique<StarfieldPattern>(theme));
    patterns_.push_back(std::make_unique<MatrixPattern>());
    patterns_.push_back(std::make_unique<PlasmaPattern>(theme));
}

const std::vector<std::string>& PatternRegistry::names() {
    static const std::vector<std::string> all = {"waves", "starfield", "matrix", "plasma"};
    return all;
}

bool PatternRegistry::is_pattern_name(const std::string& name) {
    const auto& all = names();
    return std::find(all.begin(), all.end(), name) != all.end();
}

size_t PatternRegistry::index_of(const std::string& name) const {
    for (size_t i = 0; i < patterns_.size(); ++i) {
        if (patterns_[i]->name() == name) return i;
    }
    return 0;
}

void PatternRegistry::set_theme(const Theme& theme) {
    for (auto& p : patterns_) p->set_theme(theme);
}

}
