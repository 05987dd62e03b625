#pragma once
#include "config.h"
#include "core.h"
#include "wire.h"
#include <QObject>
#include <QFutureWatcher>
#include <QJsonValue>
#include <atomic>

class QTcpServer;
class QTcpSocket;
class QTimer;

namespace cadb {

class Dispatcher;
class OperationRegistry;

/**
 * TCP endpoint of the bridge. Lives on its own I/O thread; touches host
 * state only through Dispatcher::enqueue().
 *
 * One client at a time, one request at a time: further lines from the
 * client stay unread in the socket until the in-flight response has been
 * written, so a pipelining client is held back by TCP flow control.
 * Malformed frames, unknown methods and bad arguments are answered here and
 * never reach the dispatcher.
 */
class TransportServer : public QObject {
    Q_OBJECT
public:
    TransportServer(Dispatcher* dispatcher, const OperationRegistry* registry,
                    const BridgeConfig& config, QObject* parent = nullptr);
    ~TransportServer() override;

    // Thread-safe
    quint16 serverPort() const { return m_port.load(); }
    bool    hasClient() const  { return m_hasClient.load(); }

public slots:
    // Must run on the thread this object lives in.
    bool listen();
    void close();

signals:
    void clientConnected();
    void clientDisconnected();

private slots:
    void onNewConnection();
    void onReadyRead();
    void onDisconnected();
    void onCommandFinished();
    void onServerWaitExpired();

private:
    void processPending();
    void handleLine(const QByteArray& line);
    void sendLine(const QByteArray& data);
    void abandonInFlight();
    void dropClient(bool graceful = false);

    Dispatcher*              m_dispatcher;
    const OperationRegistry* m_registry;
    BridgeConfig             m_config;

    QTcpServer*  m_server = nullptr;
    QTcpSocket*  m_client = nullptr;
    LineFramer   m_framer;

    // In-flight request
    QFutureWatcher<Result>* m_watcher = nullptr;
    QJsonValue              m_inFlightId;
    QTimer*                 m_waitTimer = nullptr;

    std::atomic<quint64> m_nextCommandId{1};
    std::atomic<quint16> m_port{0};
    std::atomic<bool>    m_hasClient{false};
};

} // namespace cadb
