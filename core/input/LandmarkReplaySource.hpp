#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <QByteArray>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QString>

#include "core/input/HandLandmarks.hpp"
#include "core/recording/WindowStore.hpp"
#include "core/session/ModeController.hpp"
#include "utils/Logger.hpp"

namespace ts {

// One line of a recorded landmark stream: either a detector answer or an
// operator command issued at that point of the stream.
struct ReplayEvent {
  enum class Kind { Frame, StartRecording, SwitchMode };

  Kind kind{Kind::Frame};
  HandObservation observation;
  WindowLabel label{WindowLabel::Background};
  Mode mode{Mode::Recording};
};

// Reads a JSON Lines landmark recording:
//   {"t": 33, "landmarks": [[x, y, z], ...]}   frame, empty list = no hand
//   {"t": 66, "error": "..."}                  detector error
//   {"command": "record", "label": "tap"}
//   {"command": "mode", "mode": "inference"}
// Malformed lines are logged and skipped.
class LandmarkReplaySource {
public:
  bool load(const QString &path) {
    m_events.clear();
    m_position = 0;
    m_skipped = 0;
    m_lastTimestamp = 0;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
      TS_LOG(LogLevel::Error, "Cannot open landmark recording " + path.toStdString());
      return false;
    }
    int lineNo = 0;
    while (!file.atEnd()) {
      const QByteArray line = file.readLine().trimmed();
      ++lineNo;
      if (line.isEmpty() || line.startsWith('#'))
        continue;
      if (!parseLine(line, lineNo))
        ++m_skipped;
    }
    TS_LOG(LogLevel::Info, "Loaded " + std::to_string(m_events.size()) + " replay events from " +
                               path.toStdString());
    return true;
  }

  bool parseLine(const QByteArray &line, int lineNo = 0) {
    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(line, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
      warn(lineNo, "not a JSON object");
      return false;
    }
    const QJsonObject obj = doc.object();

    ReplayEvent event;
    const QString command = obj.value(QStringLiteral("command")).toString();
    if (command == QStringLiteral("record")) {
      auto label = labelFromName(obj.value(QStringLiteral("label")).toString().toStdString());
      if (!label) {
        warn(lineNo, "unknown recording label");
        return false;
      }
      event.kind = ReplayEvent::Kind::StartRecording;
      event.label = *label;
    } else if (command == QStringLiteral("mode")) {
      auto mode = modeFromName(obj.value(QStringLiteral("mode")).toString().toStdString());
      if (!mode) {
        warn(lineNo, "unknown mode");
        return false;
      }
      event.kind = ReplayEvent::Kind::SwitchMode;
      event.mode = *mode;
    } else if (!command.isEmpty()) {
      warn(lineNo, "unknown command " + command.toStdString());
      return false;
    } else {
      const int64_t t = static_cast<int64_t>(obj.value(QStringLiteral("t")).toDouble(0.0));
      if (t < m_lastTimestamp) {
        warn(lineNo, "frame out of time order");
        return false;
      }
      m_lastTimestamp = t;
      event.kind = ReplayEvent::Kind::Frame;
      if (obj.contains(QStringLiteral("error"))) {
        event.observation = HandObservation::detectorError(
            t, obj.value(QStringLiteral("error")).toString().toStdString());
      } else if (!parseLandmarks(obj.value(QStringLiteral("landmarks")).toArray(), t,
                                 event.observation)) {
        warn(lineNo, "bad landmark triple");
        return false;
      }
    }
    m_events.push_back(std::move(event));
    return true;
  }

  bool atEnd() const { return m_position >= m_events.size(); }
  const ReplayEvent &next() { return m_events[m_position++]; }
  void rewind() { m_position = 0; }

  const std::vector<ReplayEvent> &events() const { return m_events; }
  std::size_t skipped() const { return m_skipped; }

private:
  static bool parseLandmarks(const QJsonArray &points, int64_t t, HandObservation &obs) {
    obs = HandObservation::absent(t);
    obs.landmarks.reserve(static_cast<std::size_t>(points.size()));
    for (const QJsonValue &value : points) {
      const QJsonArray p = value.toArray();
      if (p.size() < 2 || !p.at(0).isDouble() || !p.at(1).isDouble())
        return false;
      obs.landmarks.push_back({static_cast<float>(p.at(0).toDouble()),
                               static_cast<float>(p.at(1).toDouble()),
                               static_cast<float>(p.at(2).toDouble(0.0))});
    }
    return true;
  }

  static void warn(int lineNo, const std::string &what) {
    TS_LOG(LogLevel::Warn, "Replay line " + std::to_string(lineNo) + ": " + what);
  }

  std::vector<ReplayEvent> m_events;
  std::size_t m_position{0};
  std::size_t m_skipped{0};
  int64_t m_lastTimestamp{0};
};

} // namespace ts
