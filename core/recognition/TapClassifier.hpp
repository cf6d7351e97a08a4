#pragma once
#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/features/FeatureExtractor.hpp"

namespace ts {

constexpr std::size_t kFeatureChannels = 3;

enum class FeatureChannel : std::size_t { Velocity = 0, Acceleration = 1, Stability = 2 };

// Model input: channel-major, time-minor, oldest sample first.
struct FeatureTensor {
    std::array<float, kFeatureChannels * kWindowSize> values{};

    float& at(FeatureChannel channel, std::size_t t) {
        return values[static_cast<std::size_t>(channel) * kWindowSize + t];
    }
    float at(FeatureChannel channel, std::size_t t) const {
        return values[static_cast<std::size_t>(channel) * kWindowSize + t];
    }
};

struct ClassificationResult {
    std::string label;
    float confidence{0.f};
    std::unordered_map<std::string, float> scores;
};

// Picks the highest scoring label. With softmax the scores are turned into
// probabilities first; otherwise they are reported as the model emits them.
inline std::optional<ClassificationResult> resultFromScores(const std::vector<std::string>& labels,
                                                            const float* scores, std::size_t count,
                                                            bool softmax) {
    if (labels.empty() || count != labels.size())
        return std::nullopt;

    std::vector<float> values(scores, scores + count);
    for (float v : values)
        if (!std::isfinite(v))
            return std::nullopt;

    if (softmax) {
        const float maxScore = *std::max_element(values.begin(), values.end());
        float sum = 0.f;
        for (float& v : values) {
            v = std::exp(v - maxScore);
            sum += v;
        }
        for (float& v : values)
            v /= sum;
    }

    ClassificationResult result;
    std::size_t best = 0;
    for (std::size_t i = 0; i < count; ++i) {
        result.scores[labels[i]] = values[i];
        if (values[i] > values[best])
            best = i;
    }
    result.label = labels[best];
    result.confidence = values[best];
    return result;
}

// Anything that can score a feature window.
class TapClassifier {
public:
    virtual ~TapClassifier() = default;

    virtual bool ready() const = 0;

    // nullopt when the call fails; the caller skips the frame.
    virtual std::optional<ClassificationResult> classify(const FeatureTensor& tensor) = 0;
};

} // namespace ts
