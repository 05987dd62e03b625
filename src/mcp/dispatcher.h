#pragma once
#include "core.h"
#include <QObject>
#include <QFuture>
#include <QMutex>
#include <QPromise>
#include <deque>
#include <functional>

class QTimer;

namespace cadb {

/**
 * Hands commands from any thread to the thread that owns this object (the
 * host UI thread) and runs them there one at a time, in arrival order.
 *
 * enqueue() is thread-safe and returns a future that resolves exactly once.
 * The UI thread drains through a QTimer tick that enqueue() wakes, or by
 * calling drainOne() directly.
 */
class Dispatcher : public QObject {
    Q_OBJECT
public:
    using Handler = std::function<Result(const Command&)>;

    explicit Dispatcher(Handler handler, QObject* parent = nullptr);
    ~Dispatcher() override;

    QFuture<Result> enqueue(const Command& cmd);

    // Runs at most one queued command. Returns true if more are waiting.
    // Off the owning thread, or while a command is executing, runs nothing.
    bool drainOne();

    // Resolves everything still queued with ShutdownError. Later enqueue()
    // calls resolve immediately with BridgeClosed.
    void shutdown();
    bool isShutDown() const;

    int     pendingCount() const;
    quint64 enqueuedCount() const;

    void setTickInterval(int ms);
    int  tickInterval() const;

signals:
    void commandFinished(quint64 commandId, bool ok);

private slots:
    void wake();
    void onTick();

private:
    struct Entry {
        Command          cmd;
        QPromise<Result> promise;
    };

    Handler           m_handler;
    QTimer*           m_timer = nullptr;
    mutable QMutex    m_mutex;
    std::deque<Entry> m_queue;          // guarded by m_mutex
    bool              m_shutdown = false; // guarded by m_mutex
    quint64           m_enqueued = 0;     // guarded by m_mutex
    bool              m_draining = false; // owning thread only
};

} // namespace cadb
