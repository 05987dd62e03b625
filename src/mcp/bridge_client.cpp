#include "bridge_client.h"
#include "operations.h"
#include <QDeadlineTimer>
#include <QDebug>
#include <QTcpSocket>
#include <QThread>

namespace cadb {

BridgeClient::BridgeClient(const ClientConfig& config)
    : m_config(config), m_framer(config.maxFrameBytes)
{}

BridgeClient::~BridgeClient() {
    close();
}

// ════════════════════════════════════════════════════════════════════
// Connection management
// ════════════════════════════════════════════════════════════════════

bool BridgeClient::isConnected() const {
    return m_socket && m_socket->state() == QAbstractSocket::ConnectedState;
}

// Caps a wait of `ms` by what is left of `deadline`.
static int boundedWait(int ms, const QDeadlineTimer& deadline) {
    if (deadline.isForever()) return ms;
    return int(qBound<qint64>(0, deadline.remainingTime(), ms));
}

bool BridgeClient::connectOnce(int waitMs, QString* error) {
    m_socket = std::make_unique<QTcpSocket>();
    m_socket->connectToHost(m_config.host, m_config.port);
    if (!m_socket->waitForConnected(waitMs)) {
        *error = QStringLiteral("Cannot connect to %1:%2: %3")
                     .arg(m_config.host).arg(m_config.port).arg(m_socket->errorString());
        m_socket.reset();
        return false;
    }
    m_socket->setSocketOption(QAbstractSocket::LowDelayOption, 1);
    m_framer.clear();
    qDebug() << "[Client] Connected to" << m_config.host << m_config.port;
    return true;
}

bool BridgeClient::ensureConnected(const QDeadlineTimer& deadline, QString* error) {
    if (isConnected()) {
        // A peer that went away while we were idle shows up on a zero-wait poll
        m_socket->waitForReadyRead(0);
        if (m_socket->bytesAvailable() > 0) {
            qWarning() << "[Client] Discarding" << m_socket->bytesAvailable() << "unsolicited bytes";
            m_socket->readAll();
        }
        if (isConnected()) return true;
        qDebug() << "[Client] Idle connection was closed by the host; reconnecting";
    }
    dropConnection();

    int delay = m_config.backoffMs;
    const int attempts = qMax(1, m_config.connectAttempts);
    for (int attempt = 1; attempt <= attempts; attempt++) {
        if (deadline.hasExpired()) {
            *error = QStringLiteral("Cannot connect to %1:%2 in time").arg(m_config.host).arg(m_config.port);
            return false;
        }
        if (connectOnce(boundedWait(m_config.connectTimeoutMs, deadline), error)) return true;
        qDebug() << "[Client] Connect attempt" << attempt << "of" << attempts << "failed:" << *error;
        if (attempt < attempts && delay > 0) {
            QThread::msleep(ulong(boundedWait(delay, deadline)));
            delay *= 2;
        }
    }
    return false;
}

void BridgeClient::dropConnection() {
    if (!m_socket) return;
    m_socket->abort();
    m_socket.reset();
    m_framer.clear();
}

void BridgeClient::close() {
    if (m_closed) return;
    dropConnection();
    m_closed = true;
}

// ════════════════════════════════════════════════════════════════════
// Calls
// ════════════════════════════════════════════════════════════════════

Result BridgeClient::execute(const QString& code, int timeoutMs) {
    return call(executeMethodName(), QJsonObject{{"code", code}}, timeoutMs);
}

Result BridgeClient::call(const QString& method, const QJsonObject& params, int timeoutMs) {
    if (m_closed)
        return Result::failure(0, ErrorKind::BridgeClosed, QStringLiteral("Client is closed"));

    // The deadline covers connecting as well as the exchange
    const int limit = timeoutMs < 0 ? m_config.timeoutMs : timeoutMs;
    QDeadlineTimer deadline = limit > 0 ? QDeadlineTimer(limit) : QDeadlineTimer(QDeadlineTimer::Forever);
    const qint64 id = m_nextId++;
    const int attempts = qMax(1, m_config.connectAttempts);

    for (int attempt = 1;; attempt++) {
        QString err;
        if (!ensureConnected(deadline, &err)) {
            if (deadline.hasExpired())
                return Result::failure(0, ErrorKind::Timeout,
                    QStringLiteral("%1: no connection within %2 ms: %3").arg(method).arg(limit).arg(err));
            return Result::failure(0, ErrorKind::ConnectionLost, err);
        }

        bool refused = false;
        Result r = exchange(id, method, params, deadline, limit, &refused);
        if (!refused || attempt >= attempts || deadline.hasExpired()) return r;

        // Turned away before the request was read, so sending it again is safe
        qDebug() << "[Client] Host is serving another client; retry" << attempt << "of" << attempts - 1;
        QThread::msleep(ulong(boundedWait(m_config.backoffMs * attempt, deadline)));
    }
}

Result BridgeClient::exchange(qint64 id, const QString& method, const QJsonObject& params,
                              const QDeadlineTimer& deadline, int limit, bool* refused) {
    auto timedOut = [&]() {
        // Abort so a late response cannot be taken for the next call's
        dropConnection();
        return Result::failure(0, ErrorKind::Timeout,
            QStringLiteral("%1: no response within %2 ms").arg(method).arg(limit));
    };
    auto lost = [&](const QString& what) {
        dropConnection();
        return Result::failure(0, ErrorKind::ConnectionLost,
            QStringLiteral("%1: %2").arg(method, what));
    };

    m_socket->write(encodeRequest(id, method, params));
    while (m_socket->bytesToWrite() > 0) {
        if (m_socket->waitForBytesWritten(int(deadline.remainingTime()))) continue;
        if (!isConnected()) return lost(QStringLiteral("connection lost while sending"));
        if (deadline.hasExpired()) return timedOut();
    }

    QString err;
    for (;;) {
        QByteArray line;
        while (m_framer.next(&line)) {
            QJsonValue rid;
            Result r;
            if (!decodeResponse(line, &rid, &r, &err)) {
                dropConnection();
                return Result::failure(0, ErrorKind::ProtocolError, err);
            }
            if (rid.toInteger(-1) == id)
                return r;
            // Frame-level errors carry no id; only one request is outstanding
            if (rid.isNull() && !r.ok()) {
                if (r.errorKind == ErrorKind::ConnectionLost) {
                    *refused = true;
                    dropConnection();
                }
                return r;
            }
            qWarning() << "[Client] Ignoring response for id" << rid;
        }
        if (m_framer.overflow()) {
            dropConnection();
            return Result::failure(0, ErrorKind::ProtocolError,
                                   QStringLiteral("Response exceeds %1 bytes").arg(m_config.maxFrameBytes));
        }
        if (deadline.hasExpired()) return timedOut();

        if (!m_socket->waitForReadyRead(int(deadline.remainingTime()))) {
            if (m_socket->bytesAvailable() > 0) {
                m_framer.append(m_socket->readAll());
                continue;
            }
            if (!isConnected()) return lost(QStringLiteral("connection lost while waiting for the response"));
            continue;   // deadline checked above
        }
        m_framer.append(m_socket->readAll());
    }
}

} // namespace cadb
