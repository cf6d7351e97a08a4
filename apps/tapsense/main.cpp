#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QMetaObject>
#include <QString>
#include <QThread>
#include <QTimer>
#include <chrono>
#include <memory>
#include <string>
#include "core/config/SessionConfig.hpp"
#include "core/input/LandmarkReplaySource.hpp"
#include "core/recognition/ModelRunner.hpp"
#include "core/recording/WindowStore.hpp"
#include "core/session/GestureSession.hpp"
#include "utils/Logger.hpp"

namespace {

void dispatch(const ts::ReplayEvent &event, ts::GestureSession &session) {
    switch (event.kind) {
    case ts::ReplayEvent::Kind::Frame:
        session.submit(event.observation);
        break;
    case ts::ReplayEvent::Kind::StartRecording:
        session.requestRecording(event.label);
        break;
    case ts::ReplayEvent::Kind::SwitchMode:
        session.requestMode(event.mode);
        break;
    }
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("tapsense"));
    QCommandLineParser parser;
    parser.setApplicationDescription("Tap gesture recording and detection from hand landmarks");
    parser.addHelpOption();
    parser.addPositionalArgument("recording", "Landmark recording to replay (JSON Lines)");

    QCommandLineOption configOpt({"c", "config"}, "Session config file", "path",
                                 "config/tapsense.json");
    QCommandLineOption modelOpt({"m", "model"}, "ONNX tap model", "path");
    QCommandLineOption modeOpt("mode", "Initial mode (recording|inference)", "mode");
    QCommandLineOption thresholdOpt({"t", "threshold"}, "Tap score threshold", "score");
    QCommandLineOption cooldownOpt("cooldown-ms", "Cooldown after a tap", "ms");
    QCommandLineOption outputOpt({"o", "output-dir"}, "Where recorded windows go", "dir");
    QCommandLineOption fpsOpt("fps", "Replay frame rate, 0 for as fast as possible", "rate",
                              "30");
    QCommandLineOption logLevelOpt("log-level", "DEBUG, INFO, WARN or ERROR", "level");

    parser.addOption(configOpt);
    parser.addOption(modelOpt);
    parser.addOption(modeOpt);
    parser.addOption(thresholdOpt);
    parser.addOption(cooldownOpt);
    parser.addOption(outputOpt);
    parser.addOption(fpsOpt);
    parser.addOption(logLevelOpt);

    parser.process(app);

    ts::SessionConfig config;
    if (!ts::loadSessionConfig(parser.value(configOpt), config))
        TS_LOG(ts::LogLevel::Info, "Using built-in defaults, no config at " +
                                       parser.value(configOpt).toStdString());
    ts::setLogLevel(config.logLevel);

    if (parser.isSet(logLevelOpt)) {
        auto level = ts::parseLogLevel(parser.value(logLevelOpt).toStdString());
        if (!level) {
            TS_LOG(ts::LogLevel::Error, "Unknown log level " + parser.value(logLevelOpt).toStdString());
            return 2;
        }
        ts::setLogLevel(*level);
    }
    if (parser.isSet(modelOpt))
        config.modelPath = parser.value(modelOpt).toStdString();
    if (parser.isSet(outputOpt))
        config.outputDir = parser.value(outputOpt).toStdString();
    if (parser.isSet(modeOpt)) {
        auto mode = ts::modeFromName(parser.value(modeOpt).toStdString());
        if (!mode) {
            TS_LOG(ts::LogLevel::Error, "Unknown mode " + parser.value(modeOpt).toStdString());
            return 2;
        }
        config.initialMode = *mode;
    }
    if (parser.isSet(thresholdOpt)) {
        bool ok = false;
        const float threshold = parser.value(thresholdOpt).toFloat(&ok);
        if (!ok) {
            TS_LOG(ts::LogLevel::Error, "Bad threshold " + parser.value(thresholdOpt).toStdString());
            return 2;
        }
        config.threshold = threshold;
    }
    if (parser.isSet(cooldownOpt)) {
        bool ok = false;
        const int ms = parser.value(cooldownOpt).toInt(&ok);
        if (!ok || ms <= 0) {
            TS_LOG(ts::LogLevel::Error, "Bad cooldown " + parser.value(cooldownOpt).toStdString());
            return 2;
        }
        config.cooldown = std::chrono::milliseconds(ms);
    }
    bool fpsOk = false;
    const double fps = parser.value(fpsOpt).toDouble(&fpsOk);
    if (!fpsOk || fps < 0.0) {
        TS_LOG(ts::LogLevel::Error, "Bad fps " + parser.value(fpsOpt).toStdString());
        return 2;
    }
    if (!ts::thresholdReachable(config))
        TS_LOG(ts::LogLevel::Warn, "threshold " + std::to_string(config.threshold) +
                                       " can never be reached with softmax scores");

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        parser.showHelp(2);
    }

    // The replay stands in for the landmark detector: failing to open it is
    // as fatal as a detector that cannot start.
    ts::LandmarkReplaySource replay;
    if (!replay.load(args.front()))
        return 1;

    ts::ModelRunner runner(config.labels, config.softmax);
    const bool modelLoaded = runner.loadModel(config.modelPath);
    if (!modelLoaded) {
        if (config.initialMode == ts::Mode::Inference) {
            TS_LOG(ts::LogLevel::Error, "Cannot start in inference mode without a tap model");
            return 1;
        }
        TS_LOG(ts::LogLevel::Warn, "No tap model; inference will report not ready");
    }

    ts::JsonWindowStore store(QString::fromStdString(config.outputDir));
    QThread worker;
    worker.setObjectName(QStringLiteral("session"));
    auto session = std::make_unique<ts::GestureSession>(config, modelLoaded ? &runner : nullptr,
                                                        store);
    ts::GestureSession::Observers observers;
    observers.status = [](const std::string &status) {
        TS_LOG(ts::LogLevel::Info, "Status: " + status);
    };
    observers.action = [](const ts::ActionEvent &event) {
        TS_LOG(ts::LogLevel::Info, "ACTION tap at " + std::to_string(event.timestampMs) +
                                       " ms (confidence " + std::to_string(event.confidence) + ")");
    };
    observers.modeChanged = [](ts::Mode mode) {
        TS_LOG(ts::LogLevel::Info, std::string("Now in ") + ts::modeName(mode) + " mode");
    };
    observers.windowSaved = [](ts::WindowLabel label, const std::string &path) {
        TS_LOG(ts::LogLevel::Info, std::string(ts::labelName(label)) + " window -> " + path);
    };
    session->setObservers(std::move(observers));
    session->moveToThread(&worker);
    worker.start();

    QTimer pump;
    const int intervalMs = fps > 0.0 ? static_cast<int>(1000.0 / fps) : 0;
    pump.setInterval(intervalMs);
    QObject::connect(&pump, &QTimer::timeout, &app, [&]() {
        if (replay.atEnd()) {
            pump.stop();
            // Queued behind every submitted frame, so all of them are done.
            session->post([&app]() {
                QMetaObject::invokeMethod(&app, []() { QCoreApplication::quit(); },
                                          Qt::QueuedConnection);
            });
            return;
        }
        dispatch(replay.next(), *session);
    });
    pump.start();

    const int rc = app.exec();
    worker.quit();
    worker.wait();

    TS_LOG(ts::LogLevel::Info, "Frames " + std::to_string(session->frames()) + ", taps " +
                                   std::to_string(session->actionsFired()) + ", windows saved " +
                                   std::to_string(session->windowsSaved()) + ", replay lines skipped " +
                                   std::to_string(replay.skipped()));
    session.reset();
    return rc;
}
