#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <QMetaObject>
#include <QObject>
#include <QThread>
#include <QTimer>

#include "core/config/SessionConfig.hpp"
#include "core/features/FeatureExtractor.hpp"
#include "core/input/HandLandmarks.hpp"
#include "core/recognition/InferenceGate.hpp"
#include "core/recognition/TapClassifier.hpp"
#include "core/recording/RecordingWindow.hpp"
#include "core/session/ErrorKind.hpp"
#include "core/session/ModeController.hpp"
#include "utils/Logger.hpp"

namespace ts {

struct ActionEvent {
  float confidence{0.f};
  int64_t timestampMs{0};
};

// One tap-detection session: extractor, mode, recording window and inference
// gate. All state is owned by the thread of context(); submit() and the
// request*() calls may come from any thread and are queued onto it, as is the
// cooldown expiry timer. The process*/switchMode/startRecording calls run
// synchronously and must only be made on that thread.
class GestureSession {
public:
  struct Observers {
    std::function<void(const std::string &)> status;
    std::function<void(const ActionEvent &)> action;
    std::function<void(Mode)> modeChanged;
    std::function<void(WindowLabel, const std::string &)> windowSaved;
    std::function<void(ErrorKind, const std::string &)> error;
  };

  // classifier may be null; the gate then reports not-ready. An empty
  // scheduler uses a single-shot QTimer on context().
  GestureSession(const SessionConfig &config, TapClassifier *classifier, WindowStore &store,
                 InferenceGate::CooldownScheduler scheduler = {})
      : m_config(config), m_mode(config.initialMode), m_recorder(store),
        m_gate(classifier, config.gateConfig(),
               scheduler ? std::move(scheduler) : qtScheduler()) {}

  GestureSession(const GestureSession &) = delete;
  GestureSession &operator=(const GestureSession &) = delete;

  void setObservers(Observers observers) { m_observers = std::move(observers); }

  QObject *context() { return m_context.get(); }
  void moveToThread(QThread *thread) { m_context->moveToThread(thread); }

  // Queued entry points.
  void submit(HandObservation obs) {
    QMetaObject::invokeMethod(
        m_context.get(), [this, obs = std::move(obs)] { processObservation(obs); },
        Qt::QueuedConnection);
  }

  void requestMode(Mode mode) {
    QMetaObject::invokeMethod(
        m_context.get(), [this, mode] { switchMode(mode); }, Qt::QueuedConnection);
  }

  void requestRecording(WindowLabel label) {
    QMetaObject::invokeMethod(
        m_context.get(), [this, label] { startRecording(label); }, Qt::QueuedConnection);
  }

  // Runs fn on the session thread after everything queued before it.
  void post(std::function<void()> fn) {
    QMetaObject::invokeMethod(m_context.get(), std::move(fn), Qt::QueuedConnection);
  }

  void processObservation(const HandObservation &obs) {
    ++m_frames;
    if (obs.failed())
      TS_LOG(LogLevel::Warn, "Landmark detector error: " + obs.error);

    const FeatureSample sample = m_extractor.extract(obs);
    if (!obs.present()) {
      report(ErrorKind::HandAbsent, "hand not detected at " + std::to_string(obs.timestampMs) + " ms");
      setStatus(m_mode.inference() ? "Waiting for hand" : "Ready to record");
      return;
    }

    if (m_mode.recording())
      handleRecording(sample);
    else
      handleInference(sample, obs.timestampMs);
  }

  bool switchMode(Mode mode) {
    const Mode previous = m_mode.mode();
    if (!m_mode.switchTo(mode))
      return false;
    TS_LOG(LogLevel::Info, std::string("Mode ") + modeName(previous) + " -> " + modeName(mode));

    if (m_config.resetOnModeSwitch) {
      if (previous == Mode::Recording && m_recorder.cancel())
        TS_LOG(LogLevel::Info, "Abandoned unfinished recording window");
      if (mode == Mode::Inference)
        m_gate.resetWindow();
    }

    if (m_observers.modeChanged)
      m_observers.modeChanged(mode);
    setStatus(mode == Mode::Recording ? "Ready to record" : "Inference mode active");
    return true;
  }

  bool startRecording(WindowLabel label) {
    if (!m_recorder.start(label)) {
      report(ErrorKind::RecordingInProgress,
             std::string("'") + labelName(m_recorder.label()) + "' window still filling (" +
                 std::to_string(m_recorder.size()) + "/" + std::to_string(kWindowSize) + ")");
      setStatus("Recording in progress, wait for the current window");
      return false;
    }
    // Each window starts from a clean extractor.
    m_extractor.reset();
    setStatus(std::string("Recording '") + labelName(label) + "' window (0/" +
              std::to_string(kWindowSize) + ")");
    return true;
  }

  Mode mode() const { return m_mode.mode(); }
  const FeatureExtractor &extractor() const { return m_extractor; }
  const RecordingWindowManager &recorder() const { return m_recorder; }
  const InferenceGate &gate() const { return m_gate; }
  const std::string &status() const { return m_status; }
  uint64_t frames() const { return m_frames; }
  uint64_t actionsFired() const { return m_actionsFired; }
  uint64_t windowsSaved() const { return m_windowsSaved; }

private:
  InferenceGate::CooldownScheduler qtScheduler() {
    return [this](std::chrono::milliseconds delay, std::function<void()> done) {
      QTimer::singleShot(static_cast<int>(delay.count()), m_context.get(), std::move(done));
    };
  }

  void handleRecording(const FeatureSample &sample) {
    const WindowLabel label = m_recorder.label();
    switch (m_recorder.onSample(sample)) {
    case RecordingStep::Ignored:
      setStatus("Ready to record");
      break;
    case RecordingStep::Appended:
      setStatus(std::string("Recording '") + labelName(label) + "' window (" +
                std::to_string(m_recorder.size()) + "/" + std::to_string(kWindowSize) + ")");
      break;
    case RecordingStep::Persisted:
      ++m_windowsSaved;
      if (m_observers.windowSaved)
        m_observers.windowSaved(label, m_recorder.lastSavedPath());
      setStatus("Window saved, ready for the next one");
      break;
    case RecordingStep::PersistFailed:
      report(ErrorKind::PersistenceFailure,
             std::string("'") + labelName(label) + "' window could not be saved");
      setStatus("Window save failed");
      break;
    }
  }

  void handleInference(const FeatureSample &sample, int64_t timestampMs) {
    const GateUpdate update = m_gate.onSample(sample);
    switch (update.status) {
    case GateStatus::NotReady:
      if (!m_warnedNotReady) {
        report(ErrorKind::ClassifierUnavailable, "no tap model loaded; inference disabled");
        m_warnedNotReady = true;
      }
      setStatus("Model not ready");
      break;
    case GateStatus::Accumulating:
      setStatus("Buffering (" + std::to_string(update.filled) + "/" +
                std::to_string(kWindowSize) + ")");
      break;
    case GateStatus::ClassificationFailed:
      report(ErrorKind::ClassificationFailure,
             "classifier failed at " + std::to_string(timestampMs) + " ms");
      setStatus("Classification failed");
      break;
    case GateStatus::Waiting:
      setStatus("Waiting for tap");
      break;
    case GateStatus::CoolingDown:
      break;
    case GateStatus::Fired: {
      ActionEvent event{update.result->confidence, timestampMs};
      ++m_actionsFired;
      TS_LOG(LogLevel::Info, "Tap detected, confidence " + std::to_string(event.confidence));
      if (m_observers.action)
        m_observers.action(event);
      setStatus("TAP! (" + std::to_string(event.confidence) + ")");
      break;
    }
    }
  }

  void report(ErrorKind kind, const std::string &detail) {
    TS_LOG(logLevelFor(kind), std::string(errorName(kind)) + ": " + detail);
    if (m_observers.error)
      m_observers.error(kind, detail);
  }

  void setStatus(const std::string &status) {
    if (status == m_status)
      return;
    m_status = status;
    if (m_observers.status)
      m_observers.status(m_status);
  }

  SessionConfig m_config;
  FeatureExtractor m_extractor;
  ModeController m_mode;
  RecordingWindowManager m_recorder;
  InferenceGate m_gate;
  Observers m_observers;
  std::string m_status;
  bool m_warnedNotReady{false};
  uint64_t m_frames{0};
  uint64_t m_actionsFired{0};
  uint64_t m_windowsSaved{0};
  // Destroyed first, taking pending calls and cooldown timers with it.
  std::unique_ptr<QObject> m_context{std::make_unique<QObject>()};
};

} // namespace ts
