#pragma once

#include <QObject>
#include <QCoreApplication>
#include <QPointer>
#include <QThread>
#include <QTimer>

#include <chrono>
#include <memory>
#include <stdexcept>

#include <clicky/core/config.hpp>
#include <clicky/core/log.hpp>
#include <clicky/core/pump.hpp>
#include <clicky/core/runtime.hpp>
#include <clicky/core/subscription.hpp>

namespace clicky {
namespace qt {

// Drives a foreground_pump from a QTimer living on the GUI thread.
// The pump must have been created on that same thread.
// The returned subscription stops the timer; so does destroying `target`.
template <class Rep, class Period>
inline subscription drive_pump(foreground_pump& pump,
                               std::chrono::duration<Rep, Period> interval,
                               QObject* target = QCoreApplication::instance())
{
  using namespace std::chrono;
  const auto ms = duration_cast<milliseconds>(interval).count();

  QPointer<QObject> guard(target ? target : QCoreApplication::instance());
  if (guard && guard->thread() != QThread::currentThread()) {
    throw std::logic_error("clicky::qt::drive_pump must be called on the target's thread");
  }

  auto timer = std::make_shared<QTimer>();
  timer->setInterval(static_cast<int>(ms));
  timer->setSingleShot(false);

  QObject::connect(timer.get(), &QTimer::timeout, timer.get(), [&pump]{
    try {
      pump.tick();
    } catch (const std::exception& e) {
      log::get()->error("pump tick failed: {}", e.what());
    }
  });

  if (guard) {
    std::weak_ptr<QTimer> weak = timer;
    QObject::connect(guard, &QObject::destroyed, timer.get(), [weak]{
      if (auto t = weak.lock()) t->stop();
    });
  }

  timer->start();

  return subscription([timer]{
    if (timer->isActive()) timer->stop();
  });
}

// Same, with the interval taken from the runtime's options
inline subscription drive(runtime& rt, QObject* target = QCoreApplication::instance()) {
  return drive_pump(rt.pump(), rt.config().pump_interval, target);
}

} // namespace qt
} // namespace clicky
