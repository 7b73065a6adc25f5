#pragma once
#include <QMutex>
#include <QWaitCondition>

// Single-slot signal that turns an instrument service request into a
// blocking wait. release() may be called from the driver callback thread.
class InterruptSynchronizer {
public:
    enum class WaitResult {
        Signalled,
        TimedOut,
        Cancelled
    };

    InterruptSynchronizer() = default;
    InterruptSynchronizer(const InterruptSynchronizer &) = delete;
    InterruptSynchronizer &operator=(const InterruptSynchronizer &) = delete;

    // Negative timeout waits forever.
    WaitResult wait(int timeoutMs = -1);
    void release();
    void cancel();
    void reset();
    bool isSignalled() const;

private:
    mutable QMutex mutex;
    QWaitCondition condition;
    int slot = 0;
    bool cancelled = false;
};
