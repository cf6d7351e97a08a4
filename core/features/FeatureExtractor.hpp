#pragma once
#include <cmath>
#include <cstddef>
#include <optional>
#include <vector>
#include "core/input/HandLandmarks.hpp"

namespace ts {

// Samples per recording window and per inference stream.
constexpr std::size_t kWindowSize = 25;

// Per-frame kinematics of the index fingertip relative to the wrist.
struct FeatureSample {
    float relativeVelocityY{0.f};
    float relativeAccelerationY{0.f};
    float palmStabilityScore{0.f};
};

// Turns consecutive landmark observations into feature samples. Keeps the
// previous present landmark set and the previous relative velocity; both are
// dropped as soon as the hand disappears, so no feature ever spans a gap.
class FeatureExtractor {
public:
    FeatureSample extract(const HandObservation& obs) {
        if (!obs.present()) {
            reset();
            return {};
        }

        if (!m_previous) {
            m_previous = obs.landmarks;
            return {};
        }

        const std::vector<Landmark>& last = *m_previous;
        const std::vector<Landmark>& cur = obs.landmarks;

        const float indexVel = cur[LandmarkIndex::IndexTip].y - last[LandmarkIndex::IndexTip].y;
        const float wristVel = cur[LandmarkIndex::Wrist].y - last[LandmarkIndex::Wrist].y;
        const float middleVel = cur[LandmarkIndex::MiddleMcp].y - last[LandmarkIndex::MiddleMcp].y;
        const float ringVel = cur[LandmarkIndex::RingMcp].y - last[LandmarkIndex::RingMcp].y;
        const float pinkyVel = cur[LandmarkIndex::PinkyMcp].y - last[LandmarkIndex::PinkyMcp].y;

        FeatureSample sample;
        // Subtracting the wrist cancels whole-arm motion.
        sample.relativeVelocityY = indexVel - wristVel;
        sample.relativeAccelerationY = sample.relativeVelocityY - m_previousVelocity.value_or(0.f);
        sample.palmStabilityScore = std::fabs(wristVel) + std::fabs(middleVel) +
                                    std::fabs(ringVel) + std::fabs(pinkyVel);

        m_previous = cur;
        m_previousVelocity = sample.relativeVelocityY;
        return sample;
    }

    void reset() {
        m_previous.reset();
        m_previousVelocity.reset();
    }

    bool hasHistory() const { return m_previous.has_value(); }
    std::optional<float> previousVelocity() const { return m_previousVelocity; }

private:
    std::optional<std::vector<Landmark>> m_previous;
    std::optional<float> m_previousVelocity;
};

} // namespace ts
