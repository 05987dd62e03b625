#pragma once
#include "config.h"
#include "core.h"
#include "operations.h"
#include <QObject>
#include <QFuture>
#include <QJsonObject>
#include <atomic>
#include <memory>

class QThread;

namespace cadb {

class CommandExecutor;
class Dispatcher;
class HostContext;
class TransportServer;

/**
 * In-process MCP bridge of the host application.
 *
 * Owns the operation registry, the executor (with its script session), the
 * UI-thread dispatcher and the TCP transport on its own I/O thread. Must be
 * created on the UI thread; start()/stop() are UI-thread calls.
 */
class McpBridge : public QObject {
    Q_OBJECT
public:
    explicit McpBridge(HostContext* host, const BridgeConfig& config = BridgeConfig(),
                       QObject* parent = nullptr);
    ~McpBridge() override;

    // Add host operations before start(); read-only while running.
    OperationRegistry& registry() { return m_registry; }

    const BridgeConfig& config() const { return m_config; }
    void setConfig(const BridgeConfig& config);   // applied on next start()

    bool start();
    void stop();
    bool isRunning() const { return m_transport != nullptr; }
    quint16 serverPort() const;
    bool hasClient() const;

    // Resolves queued work with ShutdownError and refuses further commands.
    // Connected to QCoreApplication::aboutToQuit.
    void shutdown();

    Dispatcher*      dispatcher() const { return m_dispatcher; }
    CommandExecutor& executor() { return *m_executor; }

    // Local submissions (script console) take the same queue as remote ones.
    QFuture<Result> submit(const QString& method, const QJsonObject& params);
    QFuture<Result> submitCode(const QString& source);

signals:
    void runningChanged(bool running);
    void clientConnected();
    void clientDisconnected();
    void commandFinished(quint64 commandId, bool ok);

private:
    void applyConfig();

    HostContext*                     m_host;
    BridgeConfig                     m_config;
    OperationRegistry                m_registry;
    std::unique_ptr<CommandExecutor> m_executor;
    Dispatcher*                      m_dispatcher = nullptr;
    QThread*                         m_ioThread   = nullptr;
    TransportServer*                 m_transport  = nullptr;
    std::atomic<quint64>             m_localIds{quint64(1) << 62};
};

} // namespace cadb
