#include "core/session/GestureSession.hpp"
#include "tests/TestSupport.hpp"
#include <cassert>
#include <string>
#include <vector>

using ts::test::makeHand;
using ts::test::near;

namespace {

struct Recorded {
    std::vector<std::string> statuses;
    std::vector<ts::ActionEvent> actions;
    std::vector<ts::Mode> modes;
    std::vector<std::string> saved;
    std::vector<ts::ErrorKind> errors;

    ts::GestureSession::Observers observers() {
        ts::GestureSession::Observers o;
        o.status = [this](const std::string& s) { statuses.push_back(s); };
        o.action = [this](const ts::ActionEvent& e) { actions.push_back(e); };
        o.modeChanged = [this](ts::Mode m) { modes.push_back(m); };
        o.windowSaved = [this](ts::WindowLabel, const std::string& path) { saved.push_back(path); };
        o.error = [this](ts::ErrorKind k, const std::string&) { errors.push_back(k); };
        return o;
    }

    std::size_t count(ts::ErrorKind kind) const {
        std::size_t n = 0;
        for (ts::ErrorKind k : errors)
            n += k == kind ? 1 : 0;
        return n;
    }
};

ts::SessionConfig inferenceConfig() {
    ts::SessionConfig cfg;
    cfg.initialMode = ts::Mode::Inference;
    return cfg;
}

// Fingertip moving up 0.05 per frame while the rest of the hand holds still.
void feedRisingTip(ts::GestureSession& session, int frames, int64_t t0 = 0) {
    for (int i = 0; i < frames; ++i)
        session.processObservation(makeHand(t0 + i * 33, 0.9f - 0.05f * static_cast<float>(i)));
}

} // namespace

int main() {
    // Twenty-five consecutive frames produce exactly one classification over
    // the whole window, oldest first.
    {
        ts::test::FakeClassifier clf;
        ts::test::MemoryWindowStore store;
        ts::test::ManualScheduler timer;
        ts::GestureSession session(inferenceConfig(), &clf, store, timer.scheduler());
        Recorded rec;
        session.setObservers(rec.observers());

        feedRisingTip(session, 24);
        assert(clf.calls() == 0);
        assert(session.status() == "Buffering (24/25)");
        session.processObservation(makeHand(24 * 33, 0.9f - 0.05f * 24.f));
        assert(clf.calls() == 1);

        const ts::FeatureTensor& t = clf.lastTensor();
        assert(t.at(ts::FeatureChannel::Velocity, 0) == 0.f);
        for (std::size_t k = 1; k < ts::kWindowSize; ++k)
            assert(near(t.at(ts::FeatureChannel::Velocity, k), -0.05f));
        assert(t.at(ts::FeatureChannel::Acceleration, 0) == 0.f);
        assert(near(t.at(ts::FeatureChannel::Acceleration, 1), -0.05f));
        for (std::size_t k = 2; k < ts::kWindowSize; ++k)
            assert(near(t.at(ts::FeatureChannel::Acceleration, k), 0.f));
        for (std::size_t k = 0; k < ts::kWindowSize; ++k)
            assert(t.at(ts::FeatureChannel::Stability, k) == 0.f);
        assert(session.status() == "Waiting for tap");
        assert(session.frames() == 25);
    }

    // Firing: one action per qualifying frame outside the cooldown.
    {
        ts::test::FakeClassifier clf;
        ts::test::MemoryWindowStore store;
        ts::test::ManualScheduler timer;
        ts::GestureSession session(inferenceConfig(), &clf, store, timer.scheduler());
        Recorded rec;
        session.setObservers(rec.observers());
        clf.answer("tap", 2.0f);

        feedRisingTip(session, 25);
        assert(rec.actions.size() == 1);
        assert(rec.actions[0].confidence == 2.0f && rec.actions[0].timestampMs == 24 * 33);
        assert(session.actionsFired() == 1);
        const std::string fired = session.status();
        assert(fired.rfind("TAP!", 0) == 0);

        session.processObservation(makeHand(1000));
        assert(rec.actions.size() == 1);
        assert(session.status() == fired);

        timer.runAll();
        session.processObservation(makeHand(2100));
        assert(rec.actions.size() == 2);
    }

    // Hand loss does not touch the inference window but resets the extractor.
    {
        ts::test::FakeClassifier clf;
        ts::test::MemoryWindowStore store;
        ts::test::ManualScheduler timer;
        ts::GestureSession session(inferenceConfig(), &clf, store, timer.scheduler());
        Recorded rec;
        session.setObservers(rec.observers());
        feedRisingTip(session, 10);
        session.processObservation(ts::HandObservation::absent(400));
        assert(session.gate().filled() == 10);
        assert(!session.extractor().hasHistory());
        assert(session.status() == "Waiting for hand");
        assert(rec.count(ts::ErrorKind::HandAbsent) == 1);

        session.processObservation(ts::HandObservation::detectorError(433, "camera stalled"));
        assert(session.gate().filled() == 10);
        assert(rec.count(ts::ErrorKind::HandAbsent) == 2);
        assert(session.frames() == 12);
    }

    // No classifier: reported once, nothing buffered.
    {
        ts::test::MemoryWindowStore store;
        ts::test::ManualScheduler timer;
        ts::GestureSession session(inferenceConfig(), nullptr, store, timer.scheduler());
        Recorded rec;
        session.setObservers(rec.observers());
        feedRisingTip(session, 30);
        assert(rec.count(ts::ErrorKind::ClassifierUnavailable) == 1);
        assert(session.status() == "Model not ready");
        assert(session.gate().filled() == 0);
    }

    // Recording: a labeled window of 25 samples, then back to idle.
    {
        ts::test::FakeClassifier clf;
        ts::test::MemoryWindowStore store;
        ts::test::ManualScheduler timer;
        ts::GestureSession session(ts::SessionConfig{}, &clf, store, timer.scheduler());
        Recorded rec;
        session.setObservers(rec.observers());
        assert(session.mode() == ts::Mode::Recording);

        session.processObservation(makeHand(0));
        assert(session.status() == "Ready to record");
        assert(session.extractor().hasHistory());

        assert(session.startRecording(ts::WindowLabel::Tap));
        assert(!session.extractor().hasHistory());
        assert(session.status() == "Recording 'tap' window (0/25)");

        feedRisingTip(session, 10, 33);
        assert(session.recorder().size() == 10);
        assert(session.status() == "Recording 'tap' window (10/25)");

        assert(!session.startRecording(ts::WindowLabel::Background));
        assert(rec.count(ts::ErrorKind::RecordingInProgress) == 1);
        assert(session.recorder().label() == ts::WindowLabel::Tap);
        assert(session.recorder().size() == 10);

        // Absent frames are not part of the window.
        session.processObservation(ts::HandObservation::absent(400));
        assert(session.recorder().size() == 10);

        feedRisingTip(session, 15, 433);
        assert(store.saves() == 1 && session.windowsSaved() == 1);
        assert(store.last().label == ts::WindowLabel::Tap);
        assert(store.last().samples.size() == ts::kWindowSize);
        assert(store.last().samples[0].relativeVelocityY == 0.f);
        assert(store.last().samples[10].relativeVelocityY == 0.f);
        assert(rec.saved.size() == 1 && rec.saved[0] == "memory/tap_1");
        assert(!session.recorder().filling());
        assert(clf.calls() == 0);

        store.setFail(true);
        assert(session.startRecording(ts::WindowLabel::Background));
        feedRisingTip(session, 25, 2000);
        assert(rec.count(ts::ErrorKind::PersistenceFailure) == 1);
        assert(session.windowsSaved() == 1);
        assert(session.status() == "Window save failed");
    }

    // Mode switches: observer, status, and the reset policy.
    {
        ts::test::FakeClassifier clf;
        ts::test::MemoryWindowStore store;
        ts::test::ManualScheduler timer;
        ts::GestureSession session(ts::SessionConfig{}, &clf, store, timer.scheduler());
        Recorded rec;
        session.setObservers(rec.observers());

        assert(session.startRecording(ts::WindowLabel::Tap));
        feedRisingTip(session, 5);
        assert(session.switchMode(ts::Mode::Inference));
        assert(!session.switchMode(ts::Mode::Inference));
        assert(rec.modes.size() == 1 && rec.modes[0] == ts::Mode::Inference);
        assert(session.status() == "Inference mode active");
        assert(!session.recorder().filling());

        clf.answer("tap", 2.f);
        feedRisingTip(session, 25, 200);
        assert(rec.actions.size() == 1);
        assert(session.gate().cooldownActive());

        assert(session.switchMode(ts::Mode::Recording));
        assert(session.switchMode(ts::Mode::Inference));
        assert(session.gate().filled() == 0);
        // Cooldown outlives the mode switch.
        assert(session.gate().cooldownActive());
        assert(store.saves() == 0);
    }

    // Without the reset policy the window survives the round trip.
    {
        ts::SessionConfig cfg;
        cfg.resetOnModeSwitch = false;
        ts::test::FakeClassifier clf;
        ts::test::MemoryWindowStore store;
        ts::test::ManualScheduler timer;
        ts::GestureSession session(cfg, &clf, store, timer.scheduler());

        assert(session.startRecording(ts::WindowLabel::Tap));
        feedRisingTip(session, 5);
        session.switchMode(ts::Mode::Inference);
        assert(session.recorder().filling() && session.recorder().size() == 5);
        feedRisingTip(session, 7, 500);
        session.switchMode(ts::Mode::Recording);
        session.switchMode(ts::Mode::Inference);
        assert(session.gate().filled() == 7);
    }

    // Repeated identical statuses are delivered once.
    {
        ts::test::MemoryWindowStore store;
        ts::test::ManualScheduler timer;
        ts::GestureSession session(ts::SessionConfig{}, nullptr, store, timer.scheduler());
        Recorded rec;
        session.setObservers(rec.observers());
        for (int i = 0; i < 5; ++i)
            session.processObservation(ts::HandObservation::absent(i * 33));
        assert(rec.statuses.size() == 1 && rec.statuses[0] == "Ready to record");
    }
    return 0;
}
