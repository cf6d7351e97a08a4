#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ts {

// Normalized hand landmark as delivered by the detector.
struct Landmark {
    float x;
    float y;
    float z;
};

// MediaPipe hand indexing.
struct LandmarkIndex {
    static constexpr std::size_t Wrist = 0;
    static constexpr std::size_t IndexTip = 8;
    static constexpr std::size_t MiddleMcp = 9;
    static constexpr std::size_t RingMcp = 13;
    static constexpr std::size_t PinkyMcp = 17;
};

// Fewer landmarks than this and the hand counts as absent.
constexpr std::size_t kMinPresentLandmarks = 18;

// One detector answer for one submitted frame.
struct HandObservation {
    int64_t timestampMs{0};
    std::vector<Landmark> landmarks;
    std::string error;

    bool failed() const { return !error.empty(); }
    bool present() const { return !failed() && landmarks.size() >= kMinPresentLandmarks; }

    static HandObservation absent(int64_t timestampMs) {
        HandObservation obs;
        obs.timestampMs = timestampMs;
        return obs;
    }

    static HandObservation detectorError(int64_t timestampMs, std::string message) {
        HandObservation obs;
        obs.timestampMs = timestampMs;
        obs.error = std::move(message);
        return obs;
    }
};

} // namespace ts
