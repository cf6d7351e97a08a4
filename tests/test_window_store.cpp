#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QTemporaryDir>
#include <cassert>
#include <string>
#include "core/recording/WindowStore.hpp"

namespace {

ts::RecordedWindow sampleWindow(ts::WindowLabel label) {
  ts::RecordedWindow w;
  w.label = label;
  for (std::size_t i = 0; i < ts::kWindowSize; ++i)
    w.samples.push_back({0.25f * static_cast<float>(i), -0.5f, 1.0f});
  return w;
}

} // namespace

int main() {
  QTemporaryDir tmp;
  assert(tmp.isValid());

  // Missing directories are created on first save.
  const QString dir = tmp.filePath(QStringLiteral("windows/nested"));
  ts::JsonWindowStore store(dir);
  std::string path;
  assert(store.save(sampleWindow(ts::WindowLabel::Tap), &path));
  assert(QFileInfo(QString::fromStdString(path)).absolutePath() == QDir(dir).absolutePath());

  const QString name = QFileInfo(QString::fromStdString(path)).fileName();
  const QRegularExpression pattern(QStringLiteral("^tap_window_\\d{8}_\\d{6}_\\d{3}\\.json$"));
  assert(pattern.match(name).hasMatch());

  QFile file(QString::fromStdString(path));
  assert(file.open(QIODevice::ReadOnly));
  const QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
  assert(doc.isArray());
  const QJsonArray samples = doc.array();
  assert(samples.size() == static_cast<int>(ts::kWindowSize));
  const QJsonObject first = samples.at(0).toObject();
  assert(first.size() == 3);
  assert(first.contains(QStringLiteral("relativeYVelocity")));
  assert(first.contains(QStringLiteral("relativeYAcceleration")));
  assert(first.contains(QStringLiteral("palmStabilityScore")));
  assert(samples.at(4).toObject().value(QStringLiteral("relativeYVelocity")).toDouble() == 1.0);
  assert(samples.at(4).toObject().value(QStringLiteral("relativeYAcceleration")).toDouble() == -0.5);

  const QDateTime when(QDate(2024, 3, 7), QTime(9, 5, 1, 42));
  assert(ts::JsonWindowStore::fileNameFor(ts::WindowLabel::Background, when) ==
         QStringLiteral("background_window_20240307_090501_042.json"));

  // Saving without asking for the path works too.
  assert(store.save(sampleWindow(ts::WindowLabel::Background)));

  // Back-to-back saves never overwrite each other.
  ts::JsonWindowStore burst(tmp.filePath(QStringLiteral("burst")));
  for (int i = 0; i < 5; ++i)
    assert(burst.save(sampleWindow(ts::WindowLabel::Tap)));
  assert(QDir(tmp.filePath(QStringLiteral("burst"))).entryList(QDir::Files).size() == 5);

  // A regular file where the directory should be makes every save fail.
  QFile blocker(tmp.filePath(QStringLiteral("blocked")));
  assert(blocker.open(QIODevice::WriteOnly));
  blocker.write("x");
  blocker.close();
  ts::JsonWindowStore broken(tmp.filePath(QStringLiteral("blocked/windows")));
  std::string untouched = "unchanged";
  assert(!broken.save(sampleWindow(ts::WindowLabel::Tap), &untouched));
  assert(untouched == "unchanged");

  assert(ts::labelFromName("tap") == ts::WindowLabel::Tap);
  assert(ts::labelFromName("background") == ts::WindowLabel::Background);
  assert(!ts::labelFromName("sfondo"));
  return 0;
}
