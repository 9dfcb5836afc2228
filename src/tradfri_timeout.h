#pragma once

#include <algorithm>
#include <chrono>
#include <utility>

#include <QObject>
#include <QTimer>

namespace tradfri {

// Runs functor on context's thread after at least duration. A zero duration
// queues the call behind pending events instead of running it inline.
// Destroying context before the timeout cancels the call. A null context
// runs the functor on the calling thread and is never cancelled.
template <typename Functor>
void delay(std::chrono::milliseconds duration, const QObject *context, Functor &&functor)
{
    const std::chrono::milliseconds effective = std::max(duration, std::chrono::milliseconds(0));
    QTimer::singleShot(effective, Qt::PreciseTimer, context, std::forward<Functor>(functor));
}

template <typename Functor>
void delay(int durationMs, const QObject *context, Functor &&functor)
{
    delay(std::chrono::milliseconds(durationMs), context, std::forward<Functor>(functor));
}

} // namespace tradfri
