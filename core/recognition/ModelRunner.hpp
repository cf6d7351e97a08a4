#pragma once
#include <array>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <onnxruntime_cxx_api.h>
#include "core/recognition/TapClassifier.hpp"
#include "utils/Logger.hpp"

namespace ts {

// ONNX Runtime backed tap classifier. Expects a model taking a [1, 3, 25]
// float tensor and producing one score per label.
class ModelRunner : public TapClassifier {
public:
    explicit ModelRunner(std::vector<std::string> labels = {"background", "tap"},
                         bool softmax = false)
        : m_labels(std::move(labels)), m_softmax(softmax) {}

    bool loadModel(const std::string& path) {
        m_modelPath = path;
        m_session.reset();
        m_inputName.clear();
        m_outputName.clear();

        // Check the file first so a missing model is reported as such rather
        // than as a runtime parse error.
        std::ifstream file(path, std::ios::binary);
        if (!file.good()) {
            TS_LOG(LogLevel::Error, "Model " + path + " not found");
            return false;
        }

        Ort::SessionOptions opts;
        opts.SetIntraOpNumThreads(1);
        try {
            m_session.emplace(m_env, path.c_str(), opts);
            if (m_session->GetInputCount() < 1 || m_session->GetOutputCount() < 1) {
                TS_LOG(LogLevel::Error, "Model " + path + " has no input or output");
                m_session.reset();
                return false;
            }
            Ort::AllocatorWithDefaultOptions allocator;
            m_inputName = m_session->GetInputNameAllocated(0, allocator).get();
            m_outputName = m_session->GetOutputNameAllocated(0, allocator).get();

            const std::vector<int64_t> shape =
                m_session->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
            if (!acceptsInputShape(shape)) {
                TS_LOG(LogLevel::Error, "Model " + path + " does not take a [1, 3, 25] input");
                m_session.reset();
                return false;
            }
        } catch (const Ort::Exception& e) {
            TS_LOG(LogLevel::Error,
                   "ONNX Runtime could not load " + path + ": " + e.what());
            m_session.reset();
            return false;
        }
        TS_LOG(LogLevel::Info, "Loaded tap model " + path);
        return true;
    }

    bool ready() const override { return m_session.has_value(); }

    std::optional<ClassificationResult> classify(const FeatureTensor& tensor) override {
        if (!m_session)
            return std::nullopt;

        std::array<float, kFeatureChannels * kWindowSize> input = tensor.values;
        std::array<int64_t, 3> shape{1, static_cast<int64_t>(kFeatureChannels),
                                     static_cast<int64_t>(kWindowSize)};
        try {
            Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
            Ort::Value value = Ort::Value::CreateTensor<float>(mem, input.data(), input.size(),
                                                               shape.data(), shape.size());
            const char* inputName = m_inputName.c_str();
            const char* outputName = m_outputName.c_str();
            auto outputs = m_session->Run(Ort::RunOptions{nullptr}, &inputName, &value, 1,
                                          &outputName, 1);
            if (outputs.empty() || !outputs.front().IsTensor()) {
                TS_LOG(LogLevel::Warn, "Model returned no score tensor");
                return std::nullopt;
            }
            auto info = outputs.front().GetTensorTypeAndShapeInfo();
            if (info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
                TS_LOG(LogLevel::Warn, "Model scores are not float");
                return std::nullopt;
            }
            const std::size_t count = info.GetElementCount();
            auto result = resultFromScores(m_labels, outputs.front().GetTensorData<float>(), count,
                                           m_softmax);
            if (!result)
                TS_LOG(LogLevel::Warn, "Model produced " + std::to_string(count) + " scores for " +
                                           std::to_string(m_labels.size()) + " labels");
            return result;
        } catch (const Ort::Exception& e) {
            TS_LOG(LogLevel::Warn, std::string("Tap model inference failed: ") + e.what());
            return std::nullopt;
        }
    }

    const std::string& modelPath() const { return m_modelPath; }
    const std::vector<std::string>& labels() const { return m_labels; }

private:
    static bool acceptsInputShape(const std::vector<int64_t>& shape) {
        if (shape.size() != 3)
            return false;
        auto matches = [](int64_t dim, int64_t expected) { return dim < 0 || dim == expected; };
        return matches(shape[0], 1) && matches(shape[1], static_cast<int64_t>(kFeatureChannels)) &&
               matches(shape[2], static_cast<int64_t>(kWindowSize));
    }

    std::vector<std::string> m_labels;
    bool m_softmax{false};
    std::string m_modelPath;
    std::string m_inputName;
    std::string m_outputName;
    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "tapsense"};
    std::optional<Ort::Session> m_session;
};

} // namespace ts
