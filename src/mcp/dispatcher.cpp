#include "dispatcher.h"
#include <QDebug>
#include <QThread>
#include <QTimer>

namespace cadb {

namespace {

void resolve(QPromise<Result>& promise, const Result& r) {
    promise.addResult(r);
    promise.finish();
}

} // namespace

Dispatcher::Dispatcher(Handler handler, QObject* parent)
    : QObject(parent), m_handler(std::move(handler))
{
    m_timer = new QTimer(this);
    m_timer->setInterval(0);
    connect(m_timer, &QTimer::timeout, this, &Dispatcher::onTick);
}

Dispatcher::~Dispatcher() {
    shutdown();
}

// ════════════════════════════════════════════════════════════════════
// Producer side (any thread)
// ════════════════════════════════════════════════════════════════════

QFuture<Result> Dispatcher::enqueue(const Command& cmd) {
    QPromise<Result> promise;
    QFuture<Result> future = promise.future();
    promise.start();

    bool queued = false;
    {
        QMutexLocker lock(&m_mutex);
        if (!m_shutdown) {
            m_queue.push_back(Entry{cmd, std::move(promise)});
            ++m_enqueued;
            queued = true;
        }
    }

    if (!queued) {
        resolve(promise, Result::failure(cmd.id, ErrorKind::BridgeClosed,
                                         QStringLiteral("Bridge is shut down")));
        return future;
    }

    QMetaObject::invokeMethod(this, &Dispatcher::wake, Qt::QueuedConnection);
    return future;
}

// ════════════════════════════════════════════════════════════════════
// Consumer side (owning thread)
// ════════════════════════════════════════════════════════════════════

void Dispatcher::wake() {
    if (!m_timer->isActive() && pendingCount() > 0)
        m_timer->start();
}

void Dispatcher::onTick() {
    if (m_draining) return;   // nested event loop inside a command
    if (!drainOne())
        m_timer->stop();
}

bool Dispatcher::drainOne() {
    if (QThread::currentThread() != thread()) {
        qWarning() << "[Dispatcher] drainOne called off the UI thread; ignored";
        return false;
    }
    if (m_draining) return false;

    Entry entry;
    {
        QMutexLocker lock(&m_mutex);
        if (m_queue.empty()) return false;
        entry = std::move(m_queue.front());
        m_queue.pop_front();
    }

    m_draining = true;
    Result r;
    try {
        r = m_handler(entry.cmd);
    } catch (const std::exception& e) {
        r = Result::failure(entry.cmd.id, ErrorKind::ExecutionError, QString::fromUtf8(e.what()));
    } catch (...) {
        qWarning() << "[Dispatcher] Non-standard exception from command" << entry.cmd.id;
        r = Result::failure(entry.cmd.id, ErrorKind::ExecutionError,
                            QStringLiteral("Unknown exception in command handler"));
    }
    m_draining = false;

    r.commandId = entry.cmd.id;
    resolve(entry.promise, r);
    emit commandFinished(entry.cmd.id, r.ok());

    QMutexLocker lock(&m_mutex);
    return !m_queue.empty();
}

void Dispatcher::shutdown() {
    std::deque<Entry> dropped;
    {
        QMutexLocker lock(&m_mutex);
        if (m_shutdown) return;
        m_shutdown = true;
        dropped.swap(m_queue);
    }
    if (QThread::currentThread() == thread())
        m_timer->stop();

    for (auto& e : dropped) {
        resolve(e.promise, Result::failure(e.cmd.id, ErrorKind::ShutdownError,
                                           QStringLiteral("Host is shutting down")));
        emit commandFinished(e.cmd.id, false);
    }
    qDebug() << "[Dispatcher] Shut down;" << dropped.size() << "queued command(s) rejected";
}

bool Dispatcher::isShutDown() const {
    QMutexLocker lock(&m_mutex);
    return m_shutdown;
}

int Dispatcher::pendingCount() const {
    QMutexLocker lock(&m_mutex);
    return int(m_queue.size());
}

quint64 Dispatcher::enqueuedCount() const {
    QMutexLocker lock(&m_mutex);
    return m_enqueued;
}

void Dispatcher::setTickInterval(int ms) {
    m_timer->setInterval(qMax(0, ms));
}

int Dispatcher::tickInterval() const {
    return m_timer->interval();
}

} // namespace cadb
