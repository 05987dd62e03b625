#include "transport_server.h"
#include "dispatcher.h"
#include "operations.h"
#include <QDebug>
#include <QHostAddress>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>

namespace cadb {

// Bytes pulled from the socket per read. While a request is in flight
// nothing is read, so the socket buffer fills and TCP pushes back.
static constexpr qint64 kReadChunk = 1024 * 1024;

TransportServer::TransportServer(Dispatcher* dispatcher, const OperationRegistry* registry,
                                 const BridgeConfig& config, QObject* parent)
    : QObject(parent), m_dispatcher(dispatcher), m_registry(registry), m_config(config)
{
    m_framer.setMaxBytes(config.maxFrameBytes);
}

TransportServer::~TransportServer() {
    close();
}

// ════════════════════════════════════════════════════════════════════
// Lifecycle (I/O thread)
// ════════════════════════════════════════════════════════════════════

bool TransportServer::listen() {
    if (m_server) return true;

    QHostAddress addr;
    if (m_config.host.compare(QLatin1String("localhost"), Qt::CaseInsensitive) == 0)
        addr = QHostAddress::LocalHost;
    else if (!addr.setAddress(m_config.host)) {
        qWarning() << "[Transport] Invalid listen address:" << m_config.host;
        return false;
    }

    m_server = new QTcpServer(this);
    if (!m_server->listen(addr, m_config.port)) {
        qWarning() << "[Transport] Failed to listen on" << m_config.host << m_config.port
                   << ":" << m_server->errorString();
        delete m_server;
        m_server = nullptr;
        return false;
    }
    m_server->setMaxPendingConnections(1);
    connect(m_server, &QTcpServer::newConnection,
            this, &TransportServer::onNewConnection);

    m_waitTimer = new QTimer(this);
    m_waitTimer->setSingleShot(true);
    connect(m_waitTimer, &QTimer::timeout,
            this, &TransportServer::onServerWaitExpired);

    m_port = m_server->serverPort();
    qDebug() << "[Transport] Listening on" << m_config.host << m_port.load();
    return true;
}

void TransportServer::close() {
    dropClient();
    if (m_server) {
        m_server->close();
        delete m_server;
        m_server = nullptr;
        qDebug() << "[Transport] Server closed";
    }
    delete m_waitTimer;
    m_waitTimer = nullptr;
    m_port = 0;
}

// ════════════════════════════════════════════════════════════════════
// Connection handling
// ════════════════════════════════════════════════════════════════════

void TransportServer::onNewConnection() {
    while (QTcpSocket* pending = m_server->nextPendingConnection()) {
        if (m_client) {
            if (m_config.connectionPolicy == ConnectionPolicy::Reject) {
                // Told before anything is read, so the newcomer may safely retry
                qDebug() << "[Transport] Rejecting second client";
                pending->write(encodeResponse(QJsonValue(),
                    Result::failure(0, ErrorKind::ConnectionLost,
                                    QStringLiteral("Another client is connected"))));
                connect(pending, &QTcpSocket::disconnected, pending, &QObject::deleteLater);
                pending->disconnectFromHost();
                continue;
            }
            qDebug() << "[Transport] Replacing previous client";
            dropClient();
        }

        m_client = pending;
        m_client->setSocketOption(QAbstractSocket::LowDelayOption, 1);
        m_client->setReadBufferSize(kReadChunk);
        m_framer.clear();
        m_hasClient = true;

        connect(m_client, &QTcpSocket::readyRead,
                this, &TransportServer::onReadyRead);
        connect(m_client, &QTcpSocket::disconnected,
                this, &TransportServer::onDisconnected);

        qDebug() << "[Transport] Client connected from" << m_client->peerAddress().toString();
        emit clientConnected();

        // Bytes may have arrived before the signals were connected
        if (m_client->bytesAvailable() > 0)
            processPending();
    }
}

void TransportServer::onReadyRead() {
    auto* sock = qobject_cast<QTcpSocket*>(sender());
    if (sock && sock != m_client) return;
    if (!m_client || m_watcher) return;
    processPending();
}

void TransportServer::onDisconnected() {
    auto* sock = qobject_cast<QTcpSocket*>(sender());
    if (!sock || sock != m_client) return;
    qDebug() << "[Transport] Client disconnected";
    dropClient();
}

void TransportServer::dropClient(bool graceful) {
    abandonInFlight();
    if (!m_client) return;

    QTcpSocket* old = m_client;
    m_client = nullptr;
    m_framer.clear();
    m_hasClient = false;

    old->disconnect(this);
    if (graceful && old->state() == QAbstractSocket::ConnectedState) {
        // Let the last frame reach the peer before the socket goes away
        connect(old, &QTcpSocket::disconnected, old, &QObject::deleteLater);
        old->disconnectFromHost();
    } else {
        old->abort();
        old->deleteLater();
    }
    emit clientDisconnected();
}

// The command keeps running on the UI thread; its result is discarded.
void TransportServer::abandonInFlight() {
    if (m_waitTimer) m_waitTimer->stop();
    if (!m_watcher) return;
    m_watcher->disconnect(this);
    m_watcher->deleteLater();
    m_watcher = nullptr;
    m_inFlightId = QJsonValue();
}

// ════════════════════════════════════════════════════════════════════
// Request processing
// ════════════════════════════════════════════════════════════════════

void TransportServer::processPending() {
    QByteArray line;
    while (m_client && !m_watcher) {
        if (m_framer.next(&line)) {
            handleLine(line);
            continue;
        }
        if (m_framer.overflow() || m_client->bytesAvailable() <= 0) break;
        m_framer.append(m_client->read(kReadChunk));
    }

    if (m_client && m_framer.overflow()) {
        qWarning() << "[Transport] Frame exceeds" << m_framer.maxBytes() << "bytes; closing connection";
        sendLine(encodeResponse(QJsonValue(),
            Result::failure(0, ErrorKind::ProtocolError,
                            QStringLiteral("Frame exceeds %1 bytes").arg(m_framer.maxBytes()))));
        dropClient(true);
    }
}

void TransportServer::handleLine(const QByteArray& line) {
    qDebug() << "[Transport] <<" << line.left(200);

    WireRequest req;
    QString err;
    if (!decodeRequest(line, &req, &err)) {
        sendLine(encodeResponse(req.id, Result::failure(0, ErrorKind::ProtocolError, err)));
        return;
    }

    ValidationResult v = m_registry->validate(req.method, req.params);
    if (!v.ok) {
        sendLine(encodeResponse(req.id, Result::failure(0, v.kind, v.error)));
        return;
    }

    Command cmd = toCommand(m_nextCommandId++, req);
    m_inFlightId = req.id;
    m_watcher = new QFutureWatcher<Result>(this);
    connect(m_watcher, &QFutureWatcher<Result>::finished,
            this, &TransportServer::onCommandFinished);
    m_watcher->setFuture(m_dispatcher->enqueue(cmd));

    if (m_config.serverWaitMs > 0)
        m_waitTimer->start(m_config.serverWaitMs);
}

void TransportServer::onCommandFinished() {
    auto* watcher = static_cast<QFutureWatcher<Result>*>(sender());
    if (watcher != m_watcher) return;

    Result r = watcher->future().resultCount() > 0
        ? watcher->result()
        : Result::failure(0, ErrorKind::ShutdownError, QStringLiteral("Command was dropped"));
    QJsonValue id = m_inFlightId;

    m_waitTimer->stop();
    m_watcher->deleteLater();
    m_watcher = nullptr;
    m_inFlightId = QJsonValue();

    sendLine(encodeResponse(id, r));
    processPending();
}

void TransportServer::onServerWaitExpired() {
    if (!m_watcher) return;
    QJsonValue id = m_inFlightId;
    qWarning() << "[Transport] UI thread did not answer within" << m_config.serverWaitMs << "ms";
    abandonInFlight();
    sendLine(encodeResponse(id, Result::failure(0, ErrorKind::Timeout,
        QStringLiteral("Host did not finish the command within %1 ms").arg(m_config.serverWaitMs))));
    processPending();
}

void TransportServer::sendLine(const QByteArray& data) {
    if (!m_client) return;
    qDebug() << "[Transport] >>" << data.left(200).trimmed();
    m_client->write(data);
    m_client->flush();
}

} // namespace cadb
