#pragma once
#include <cstddef>
#include <cstdio>
#include <functional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// DebugPanel — provider registry for the F3 overlay.
//
// Stored as a World resource. Modules call watch(section, label, fn) at
// install time; DebugSystem evaluates every provider each render frame and
// draws the results as a sectioned text overlay.
//
// Zero engine dependencies — safe to include in any target.
// ---------------------------------------------------------------------------

struct DebugPanel {
    using Provider = std::function<std::string()>;

    struct Row {
        std::string label;
        Provider    fn;
    };

    struct Section {
        std::string      title;
        std::vector<Row> rows;
    };

    bool visible = false;

    void toggle() { visible = !visible; }

    // Register a named provider under a section heading.
    // Creates the section if it does not already exist.
    void watch(const std::string& section,
               const std::string& label,
               Provider fn) {
        for (auto& s : sections_) {
            if (s.title == section) {
                s.rows.push_back({label, std::move(fn)});
                return;
            }
        }
        sections_.push_back({section, {{label, std::move(fn)}}});
    }

    std::size_t row_count() const {
        std::size_t n = 0;
        for (const auto& s : sections_) n += s.rows.size();
        return n;
    }

    const std::vector<Section>& sections() const { return sections_; }

    // "%.2f" followed by an optional unit, e.g. fixed(0.2f, "s") -> "0.20 s".
    static std::string fixed(float value, const char* unit = nullptr) {
        char b[32];
        if (unit) std::snprintf(b, sizeof(b), "%.2f %s", value, unit);
        else      std::snprintf(b, sizeof(b), "%.2f", value);
        return b;
    }

private:
    std::vector<Section> sections_;
};
