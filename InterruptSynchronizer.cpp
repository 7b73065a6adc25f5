#include "InterruptSynchronizer.h"
#include <QDeadlineTimer>
#include <QMutexLocker>

InterruptSynchronizer::WaitResult InterruptSynchronizer::wait(int timeoutMs) {
    QMutexLocker locker(&mutex);
    const QDeadlineTimer deadline = timeoutMs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever)
                                                  : QDeadlineTimer(timeoutMs);
    while (slot == 0 && !cancelled) {
        if (!condition.wait(&mutex, deadline)) {
            // Spurious wakeups land here too, recheck before giving up
            if (slot == 0 && !cancelled && deadline.hasExpired()) {
                return WaitResult::TimedOut;
            }
        }
    }
    if (cancelled) {
        return WaitResult::Cancelled;
    }
    slot = 0;
    return WaitResult::Signalled;
}

void InterruptSynchronizer::release() {
    QMutexLocker locker(&mutex);
    slot = 1;
    condition.wakeAll();
}

void InterruptSynchronizer::cancel() {
    QMutexLocker locker(&mutex);
    cancelled = true;
    condition.wakeAll();
}

void InterruptSynchronizer::reset() {
    QMutexLocker locker(&mutex);
    slot = 0;
    cancelled = false;
}

bool InterruptSynchronizer::isSignalled() const {
    QMutexLocker locker(&mutex);
    return slot != 0;
}
