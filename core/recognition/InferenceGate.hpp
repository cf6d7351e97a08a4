#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include "core/features/FeatureExtractor.hpp"
#include "core/recognition/TapClassifier.hpp"
#include "utils/Logger.hpp"

namespace ts {

struct GateConfig {
    std::string actionLabel{"tap"};
    float threshold{1.9f};
    std::chrono::milliseconds cooldown{1000};
};

enum class GateStatus {
    NotReady,             // no usable classifier
    Accumulating,         // window not full yet
    Waiting,              // classified, nothing to fire
    Fired,
    CoolingDown,          // classified while an earlier fire is still cooling down
    ClassificationFailed
};

struct GateUpdate {
    GateStatus status{GateStatus::NotReady};
    std::size_t filled{0};
    std::optional<ClassificationResult> result;
};

// Sliding window over the three feature streams, classifier invocation and
// the threshold/cooldown rule that turns scores into discrete actions.
class InferenceGate {
public:
    // Must run the callback after the delay on the same thread that feeds
    // the gate.
    using CooldownScheduler = std::function<void(std::chrono::milliseconds, std::function<void()>)>;

    InferenceGate(TapClassifier* classifier, GateConfig config, CooldownScheduler scheduler)
        : m_classifier(classifier), m_config(std::move(config)), m_scheduler(std::move(scheduler)) {}

    GateUpdate onSample(const FeatureSample& sample) {
        GateUpdate update;
        if (!m_classifier || !m_classifier->ready()) {
            update.status = GateStatus::NotReady;
            return update;
        }

        push(m_velocity, sample.relativeVelocityY);
        push(m_acceleration, sample.relativeAccelerationY);
        push(m_stability, sample.palmStabilityScore);
        update.filled = filled();

        if (!warm()) {
            update.status = GateStatus::Accumulating;
            return update;
        }

        ++m_classifications;
        update.result = m_classifier->classify(tensor());
        if (!update.result) {
            update.status = GateStatus::ClassificationFailed;
            return update;
        }

        const ClassificationResult& r = *update.result;
        if (m_cooldownActive) {
            update.status = GateStatus::CoolingDown;
        } else if (r.label == m_config.actionLabel && r.confidence >= m_config.threshold) {
            update.status = GateStatus::Fired;
            startCooldown();
        } else {
            update.status = GateStatus::Waiting;
        }
        return update;
    }

    // Clears the three streams; the cooldown keeps running.
    void resetWindow() {
        m_velocity.clear();
        m_acceleration.clear();
        m_stability.clear();
    }

    void expireCooldown() { m_cooldownActive = false; }

    FeatureTensor tensor() const {
        FeatureTensor t;
        for (std::size_t i = 0; i < m_velocity.size(); ++i) {
            t.at(FeatureChannel::Velocity, i) = m_velocity[i];
            t.at(FeatureChannel::Acceleration, i) = m_acceleration[i];
            t.at(FeatureChannel::Stability, i) = m_stability[i];
        }
        return t;
    }

    bool warm() const {
        return m_velocity.size() == kWindowSize && m_acceleration.size() == kWindowSize &&
               m_stability.size() == kWindowSize;
    }
    std::size_t filled() const { return m_velocity.size(); }
    bool cooldownActive() const { return m_cooldownActive; }
    std::chrono::steady_clock::time_point cooldownUntil() const { return m_cooldownUntil; }
    std::uint64_t classifications() const { return m_classifications; }
    const GateConfig& config() const { return m_config; }

    const std::deque<float>& velocity() const { return m_velocity; }
    const std::deque<float>& acceleration() const { return m_acceleration; }
    const std::deque<float>& stability() const { return m_stability; }

private:
    static void push(std::deque<float>& stream, float value) {
        if (stream.size() >= kWindowSize)
            stream.pop_front();
        stream.push_back(value);
    }

    void startCooldown() {
        m_cooldownActive = true;
        m_cooldownUntil = std::chrono::steady_clock::now() + m_config.cooldown;
        // A stale timer from an earlier fire must not end this cooldown.
        const std::uint64_t generation = ++m_cooldownGeneration;
        if (!m_scheduler) {
            TS_LOG(LogLevel::Warn, "No cooldown timer; cooldown will not expire");
            return;
        }
        m_scheduler(m_config.cooldown, [this, generation] {
            if (generation == m_cooldownGeneration)
                expireCooldown();
        });
    }

    TapClassifier* m_classifier;
    GateConfig m_config;
    CooldownScheduler m_scheduler;
    std::deque<float> m_velocity;
    std::deque<float> m_acceleration;
    std::deque<float> m_stability;
    bool m_cooldownActive{false};
    std::chrono::steady_clock::time_point m_cooldownUntil{};
    std::uint64_t m_cooldownGeneration{0};
    std::uint64_t m_classifications{0};
};

} // namespace ts
