#pragma once
#include <optional>
#include <string>

namespace ts {

enum class Mode { Recording, Inference };

inline const char* modeName(Mode mode) {
    switch (mode) {
    case Mode::Recording:
        return "recording";
    case Mode::Inference:
        return "inference";
    }
    return "recording";
}

inline std::optional<Mode> modeFromName(const std::string& name) {
    if (name == "recording")
        return Mode::Recording;
    if (name == "inference")
        return Mode::Inference;
    return std::nullopt;
}

// Which window manager receives feature samples. Switching is a plain state
// change; refreshing anything that shows the mode is up to the caller.
class ModeController {
public:
    explicit ModeController(Mode initial = Mode::Recording) : m_mode(initial) {}

    // Returns true if the mode actually changed.
    bool switchTo(Mode mode) {
        if (mode == m_mode)
            return false;
        m_mode = mode;
        ++m_transitions;
        return true;
    }

    Mode mode() const { return m_mode; }
    bool recording() const { return m_mode == Mode::Recording; }
    bool inference() const { return m_mode == Mode::Inference; }
    unsigned transitions() const { return m_transitions; }

private:
    Mode m_mode;
    unsigned m_transitions{0};
};

} // namespace ts
