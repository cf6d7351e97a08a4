#include <QCoreApplication>
#include <QElapsedTimer>
#include <QThread>
#include <atomic>
#include <cassert>
#include <thread>
#include "core/session/GestureSession.hpp"
#include "tests/TestSupport.hpp"

using ts::test::makeHand;

namespace {

template <typename Pred>
bool pumpUntil(Pred done, int timeoutMs = 5000) {
  QElapsedTimer clock;
  clock.start();
  while (!done()) {
    if (clock.elapsed() > timeoutMs)
      return false;
    QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
    QThread::msleep(1);
  }
  return true;
}

} // namespace

int main(int argc, char **argv) {
  QCoreApplication app(argc, argv);

  ts::SessionConfig cfg;
  cfg.initialMode = ts::Mode::Inference;
  cfg.cooldown = std::chrono::milliseconds(200);

  ts::test::FakeClassifier clf;
  clf.answer("tap", 2.f);
  ts::test::MemoryWindowStore store;
  // Default scheduler: a real single-shot timer on the session thread.
  ts::GestureSession session(cfg, &clf, store);

  std::atomic<int> actions{0};
  ts::GestureSession::Observers observers;
  observers.action = [&actions](const ts::ActionEvent &) { ++actions; };
  session.setObservers(std::move(observers));

  // Producers on another thread return without waiting for processing.
  std::thread producer([&session] {
    for (int i = 0; i < 25; ++i)
      session.submit(makeHand(i * 33));
  });
  producer.join();
  assert(session.frames() == 0);

  assert(pumpUntil([&] { return session.frames() == 25; }));
  assert(actions == 1);
  assert(session.gate().cooldownActive());

  // The cooldown timer fires on its own after the configured delay.
  assert(pumpUntil([&] { return !session.gate().cooldownActive(); }));
  session.submit(makeHand(2000));
  assert(pumpUntil([&] { return session.frames() == 26; }));
  assert(actions == 2);

  // Commands are serialized with frames in submission order.
  session.requestMode(ts::Mode::Recording);
  session.requestRecording(ts::WindowLabel::Background);
  for (int i = 0; i < 25; ++i)
    session.submit(makeHand(3000 + i * 33));
  bool done = false;
  session.post([&done] { done = true; });
  assert(pumpUntil([&] { return done; }));
  assert(session.mode() == ts::Mode::Recording);
  assert(store.saves() == 1 && store.last().label == ts::WindowLabel::Background);
  return 0;
}
