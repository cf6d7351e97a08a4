#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>
#include <vector>

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>

#include "core/recognition/InferenceGate.hpp"
#include "core/session/ModeController.hpp"
#include "utils/Logger.hpp"

namespace ts {

struct SessionConfig {
  std::string modelPath{"models/tap_detector.onnx"};
  std::vector<std::string> labels{"background", "tap"};
  std::string actionLabel{"tap"};
  float threshold{1.9f};
  bool softmax{false};
  std::chrono::milliseconds cooldown{1000};
  std::string outputDir{"data/windows"};
  Mode initialMode{Mode::Recording};
  bool resetOnModeSwitch{true};
  LogLevel logLevel{LogLevel::Info};

  GateConfig gateConfig() const {
    GateConfig gate;
    gate.actionLabel = actionLabel;
    gate.threshold = threshold;
    gate.cooldown = cooldown;
    return gate;
  }
};

inline QJsonObject readJsonObject(const QString &path) {
  QFile file(path);
  if (!file.open(QIODevice::ReadOnly))
    return {};
  QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
  if (!doc.isObject())
    return {};
  return doc.object();
}

// Applies every valid key of obj to config. Invalid values are logged and
// leave the previous value in place.
inline void applyConfigObject(const QJsonObject &obj, SessionConfig &config) {
  if (obj.value(QStringLiteral("model")).isString())
    config.modelPath = obj.value(QStringLiteral("model")).toString().toStdString();
  if (obj.value(QStringLiteral("output_dir")).isString())
    config.outputDir = obj.value(QStringLiteral("output_dir")).toString().toStdString();
  if (obj.value(QStringLiteral("softmax")).isBool())
    config.softmax = obj.value(QStringLiteral("softmax")).toBool();
  if (obj.value(QStringLiteral("reset_on_mode_switch")).isBool())
    config.resetOnModeSwitch = obj.value(QStringLiteral("reset_on_mode_switch")).toBool();

  std::string actionLabel = config.actionLabel;
  if (obj.value(QStringLiteral("action_label")).isString())
    actionLabel = obj.value(QStringLiteral("action_label")).toString().toStdString();

  std::vector<std::string> labels = config.labels;
  const QJsonValue labelsValue = obj.value(QStringLiteral("labels"));
  if (labelsValue.isArray()) {
    labels.clear();
    for (const QJsonValue &entry : labelsValue.toArray()) {
      if (entry.isString())
        labels.push_back(entry.toString().toStdString());
    }
  }
  if (!labels.empty() &&
      std::find(labels.begin(), labels.end(), actionLabel) != labels.end()) {
    config.labels = labels;
    config.actionLabel = actionLabel;
  } else {
    TS_LOG(LogLevel::Warn, "Ignoring labels/action_label: '" + actionLabel +
                               "' is not one of the classifier labels");
  }

  const QJsonValue threshold = obj.value(QStringLiteral("threshold"));
  if (threshold.isDouble()) {
    const double value = threshold.toDouble();
    if (std::isfinite(value))
      config.threshold = static_cast<float>(value);
    else
      TS_LOG(LogLevel::Warn, "Ignoring non-finite threshold");
  }

  const QJsonValue cooldown = obj.value(QStringLiteral("cooldown_ms"));
  if (cooldown.isDouble()) {
    const int ms = cooldown.toInt();
    if (ms > 0)
      config.cooldown = std::chrono::milliseconds(ms);
    else
      TS_LOG(LogLevel::Warn, "Ignoring cooldown_ms " + std::to_string(ms));
  }

  const QJsonValue mode = obj.value(QStringLiteral("mode"));
  if (mode.isString()) {
    if (auto parsed = modeFromName(mode.toString().toStdString()))
      config.initialMode = *parsed;
    else
      TS_LOG(LogLevel::Warn, "Unknown mode " + mode.toString().toStdString());
  }

  const QJsonValue level = obj.value(QStringLiteral("log_level"));
  if (level.isString()) {
    if (auto parsed = parseLogLevel(level.toString().toStdString()))
      config.logLevel = *parsed;
    else
      TS_LOG(LogLevel::Warn, "Unknown log_level " + level.toString().toStdString());
  }
}

// Returns false if the file is missing or not a JSON object; config then
// keeps its defaults.
inline bool loadSessionConfig(const QString &path, SessionConfig &config) {
  QFile file(path);
  if (!file.exists())
    return false;
  const QJsonObject obj = readJsonObject(path);
  if (obj.isEmpty()) {
    TS_LOG(LogLevel::Warn, "Config " + path.toStdString() + " is not a JSON object");
    return false;
  }
  applyConfigObject(obj, config);
  return true;
}

// Softmax scores live in [0, 1]; the default threshold is on the raw scale.
inline bool thresholdReachable(const SessionConfig &config) {
  return !config.softmax || config.threshold <= 1.f;
}

} // namespace ts
