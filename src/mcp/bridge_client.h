#pragma once
#include "config.h"
#include "core.h"
#include "wire.h"
#include <QJsonObject>
#include <QString>
#include <memory>

class QDeadlineTimer;
class QTcpSocket;

namespace cadb {

/**
 * Blocking client for the bridge, used from outside the host process.
 *
 * Connects lazily on the first call and re-establishes a dropped idle
 * connection (connectAttempts tries, exponential backoff). The call timeout
 * covers connecting too. A request that was already written is never re-sent:
 * losing the connection while waiting yields ConnectionLost, running out of
 * time yields Timeout. In both cases the host may or may not have executed
 * the command. The one exception is a host using the Reject policy, which
 * answers a refused newcomer with an id-less ConnectionLost before reading
 * anything; such a call is retried up to connectAttempts times.
 *
 * Not thread-safe; use one client per thread.
 */
class BridgeClient {
public:
    explicit BridgeClient(const ClientConfig& config = ClientConfig::fromEnvironment());
    ~BridgeClient();

    BridgeClient(const BridgeClient&) = delete;
    BridgeClient& operator=(const BridgeClient&) = delete;

    // timeoutMs < 0 uses the configured timeout, 0 waits forever.
    Result call(const QString& method, const QJsonObject& params = QJsonObject(),
                int timeoutMs = -1);
    Result execute(const QString& code, int timeoutMs = -1);

    void close();
    bool isClosed() const { return m_closed; }
    bool isConnected() const;

    const ClientConfig& config() const { return m_config; }

private:
    bool ensureConnected(const QDeadlineTimer& deadline, QString* error);
    bool connectOnce(int waitMs, QString* error);
    Result exchange(qint64 id, const QString& method, const QJsonObject& params,
                    const QDeadlineTimer& deadline, int limit, bool* refused);
    void dropConnection();

    ClientConfig                m_config;
    std::unique_ptr<QTcpSocket> m_socket;
    LineFramer                  m_framer;
    qint64                      m_nextId = 1;
    bool                        m_closed = false;
};

} // namespace cadb
