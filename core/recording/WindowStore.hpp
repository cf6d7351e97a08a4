#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>

#include "core/features/FeatureExtractor.hpp"
#include "utils/Logger.hpp"

namespace ts {

enum class WindowLabel { Tap, Background };

inline const char *labelName(WindowLabel label) {
  switch (label) {
  case WindowLabel::Tap:
    return "tap";
  case WindowLabel::Background:
    return "background";
  }
  return "background";
}

inline std::optional<WindowLabel> labelFromName(const std::string &name) {
  if (name == "tap")
    return WindowLabel::Tap;
  if (name == "background")
    return WindowLabel::Background;
  return std::nullopt;
}

// A completed training window, oldest sample first.
struct RecordedWindow {
  WindowLabel label{WindowLabel::Background};
  std::vector<FeatureSample> samples;
};

// Durable destination for completed windows.
class WindowStore {
public:
  virtual ~WindowStore() = default;
  virtual bool save(const RecordedWindow &window, std::string *savedPath = nullptr) = 0;
};

// Writes each window as <label>_window_<capture time>.json into one directory.
class JsonWindowStore : public WindowStore {
public:
  explicit JsonWindowStore(const QString &directory) : m_directory(directory) {}

  bool save(const RecordedWindow &window, std::string *savedPath = nullptr) override {
    if (!m_directory.exists() && !m_directory.mkpath(QStringLiteral("."))) {
      TS_LOG(LogLevel::Error,
             "Cannot create window directory " + m_directory.absolutePath().toStdString());
      return false;
    }

    const QString path = uniquePath(fileNameFor(window.label, QDateTime::currentDateTime()));
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
      TS_LOG(LogLevel::Error, "Cannot open " + path.toStdString() + ": " +
                                  file.errorString().toStdString());
      return false;
    }

    const QByteArray data = QJsonDocument(toJson(window)).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
      TS_LOG(LogLevel::Error, "Short write to " + path.toStdString() + ": " +
                                  file.errorString().toStdString());
      file.close();
      file.remove();
      return false;
    }
    file.close();

    if (savedPath)
      *savedPath = path.toStdString();
    return true;
  }

  QDir directory() const { return m_directory; }

  static QString fileNameFor(WindowLabel label, const QDateTime &capturedAt) {
    return QStringLiteral("%1_window_%2.json")
        .arg(QString::fromLatin1(labelName(label)))
        .arg(capturedAt.toString(QStringLiteral("yyyyMMdd_HHmmss_zzz")));
  }

  static QJsonArray toJson(const RecordedWindow &window) {
    QJsonArray samples;
    for (const FeatureSample &s : window.samples) {
      QJsonObject obj;
      obj.insert(QStringLiteral("relativeYVelocity"), static_cast<double>(s.relativeVelocityY));
      obj.insert(QStringLiteral("relativeYAcceleration"),
                 static_cast<double>(s.relativeAccelerationY));
      obj.insert(QStringLiteral("palmStabilityScore"), static_cast<double>(s.palmStabilityScore));
      samples.append(obj);
    }
    return samples;
  }

private:
  // Windows completed within the same millisecond get a numeric suffix.
  QString uniquePath(const QString &fileName) const {
    QString path = m_directory.filePath(fileName);
    const QString stem = fileName.chopped(5);
    for (int n = 1; QFile::exists(path); ++n)
      path = m_directory.filePath(QStringLiteral("%1_%2.json").arg(stem).arg(n));
    return path;
  }

  QDir m_directory;
};

} // namespace ts
