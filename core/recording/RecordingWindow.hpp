#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include "core/features/FeatureExtractor.hpp"
#include "core/recording/WindowStore.hpp"
#include "utils/Logger.hpp"

namespace ts {

enum class RecordingStep {
    Ignored,       // no window is filling
    Appended,
    Persisted,     // window completed and stored
    PersistFailed  // window completed, store rejected it, window dropped
};

// Collects one labeled window of kWindowSize samples at a time and hands it
// to the store once full. Idle -> Filling -> Idle.
class RecordingWindowManager {
public:
    explicit RecordingWindowManager(WindowStore& store) : m_store(store) {}

    // Returns false, leaving everything untouched, if a window is already
    // filling.
    bool start(WindowLabel label) {
        if (m_filling)
            return false;
        m_buffer.clear();
        m_buffer.reserve(kWindowSize);
        m_label = label;
        m_filling = true;
        return true;
    }

    RecordingStep onSample(const FeatureSample& sample) {
        if (!m_filling)
            return RecordingStep::Ignored;
        m_buffer.push_back(sample);
        if (m_buffer.size() < kWindowSize)
            return RecordingStep::Appended;
        return finalize();
    }

    // Drops a partially filled window without storing it.
    bool cancel() {
        if (!m_filling)
            return false;
        m_filling = false;
        m_buffer.clear();
        return true;
    }

    bool filling() const { return m_filling; }
    std::size_t size() const { return m_buffer.size(); }
    WindowLabel label() const { return m_label; }
    const std::vector<FeatureSample>& samples() const { return m_buffer; }
    const std::string& lastSavedPath() const { return m_lastSavedPath; }

private:
    RecordingStep finalize() {
        RecordedWindow window{m_label, std::move(m_buffer)};
        m_buffer.clear();
        m_filling = false;

        std::string path;
        if (!m_store.save(window, &path)) {
            TS_LOG(LogLevel::Warn,
                   std::string("Discarding '") + labelName(window.label) + "' window after failed save");
            return RecordingStep::PersistFailed;
        }
        m_lastSavedPath = path;
        TS_LOG(LogLevel::Info, "Window saved: " + path);
        return RecordingStep::Persisted;
    }

    WindowStore& m_store;
    std::vector<FeatureSample> m_buffer;
    WindowLabel m_label{WindowLabel::Background};
    bool m_filling{false};
    std::string m_lastSavedPath;
};

} // namespace ts
