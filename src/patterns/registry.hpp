#pragma once

#include "patterns/pattern.hpp"
#include "patterns/theme.hpp"
#include <memory>
#include <string>
#include <vector>

namespace splash {

// The selectable patterns in key order (1 = waves ... 4 = plasma).
class PatternRegistry {
public:
    explicit PatternRegistry(const Theme& theme);

    static const std::vector<std::string>& names();
    static bool is_pattern_name(const std::string& name);

    size_t size() const { return patterns_.size(); }
    Pattern& at(size_t index) { return *patterns_.at(index); }
    // Unknown names map to index 0.
    size_t index_of(const std::string& name) const;
    size_t next(size_t index) const { return (index + 1) % patterns_.size(); }
    size_t prev(size_t index) const { return (index + patterns_.size() - 1) % patterns_.size(); }

    void set_theme(const Theme& theme);

private:
    std::vector<std::unique_ptr<Pattern>> patterns_;
};

}
