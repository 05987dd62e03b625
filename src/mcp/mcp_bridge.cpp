#include "mcp_bridge.h"
#include "dispatcher.h"
#include "executor.h"
#include "transport_server.h"
#include "hostcontext.h"
#include <QCoreApplication>
#include <QDebug>
#include <QPromise>
#include <QThread>

namespace cadb {

namespace {

QFuture<Result> readyFuture(const Result& r) {
    QPromise<Result> promise;
    QFuture<Result> future = promise.future();
    promise.start();
    promise.addResult(r);
    promise.finish();
    return future;
}

} // namespace

// ════════════════════════════════════════════════════════════════════
// Construction / lifecycle
// ════════════════════════════════════════════════════════════════════

McpBridge::McpBridge(HostContext* host, const BridgeConfig& config, QObject* parent)
    : QObject(parent), m_host(host), m_config(config)
{
    registerBuiltinOperations(m_registry);
    m_executor = std::make_unique<CommandExecutor>(m_registry);

    m_dispatcher = new Dispatcher([this](const Command& cmd) {
        return m_executor->execute(cmd, *m_host);
    }, this);
    connect(m_dispatcher, &Dispatcher::commandFinished,
            this, &McpBridge::commandFinished);

    if (QCoreApplication::instance()) {
        connect(QCoreApplication::instance(), &QCoreApplication::aboutToQuit,
                this, &McpBridge::shutdown);
    }
    applyConfig();
}

McpBridge::~McpBridge() {
    shutdown();
}

void McpBridge::setConfig(const BridgeConfig& config) {
    m_config = config;
    if (!isRunning()) applyConfig();
}

void McpBridge::applyConfig() {
    m_executor->setAutoCreateDocument(m_config.autoCreateDocument);
    m_executor->script().setTimeLimit(m_config.scriptTimeLimitMs);
    m_dispatcher->setTickInterval(m_config.tickIntervalMs);
}

bool McpBridge::start() {
    if (m_transport) return true;
    if (m_dispatcher->isShutDown()) {
        qWarning() << "[Bridge] Cannot start after shutdown";
        return false;
    }
    applyConfig();

    m_ioThread = new QThread(this);
    m_ioThread->setObjectName(QStringLiteral("cadb-io"));
    m_transport = new TransportServer(m_dispatcher, &m_registry, m_config);
    m_transport->moveToThread(m_ioThread);

    connect(m_transport, &TransportServer::clientConnected,
            this, &McpBridge::clientConnected, Qt::QueuedConnection);
    connect(m_transport, &TransportServer::clientDisconnected,
            this, &McpBridge::clientDisconnected, Qt::QueuedConnection);

    m_ioThread->start();

    bool ok = false;
    QMetaObject::invokeMethod(m_transport, &TransportServer::listen,
                              Qt::BlockingQueuedConnection, &ok);
    if (!ok) {
        m_ioThread->quit();
        m_ioThread->wait();
        delete m_transport;
        m_transport = nullptr;
        delete m_ioThread;
        m_ioThread = nullptr;
        return false;
    }

    qDebug() << "[Bridge] MCP server listening on" << m_config.host << serverPort();
    emit runningChanged(true);
    return true;
}

void McpBridge::stop() {
    if (!m_transport) return;

    QMetaObject::invokeMethod(m_transport, &TransportServer::close,
                              Qt::BlockingQueuedConnection);
    m_ioThread->quit();
    m_ioThread->wait();
    delete m_transport;
    m_transport = nullptr;
    delete m_ioThread;
    m_ioThread = nullptr;

    // Script globals live for one server session
    m_executor->script().reset();

    qDebug() << "[Bridge] MCP server stopped";
    emit runningChanged(false);
}

void McpBridge::shutdown() {
    // Resolve queued work first so the transport can still answer it
    if (!m_dispatcher->isShutDown())
        m_dispatcher->shutdown();
    stop();
}

quint16 McpBridge::serverPort() const {
    return m_transport ? m_transport->serverPort() : 0;
}

bool McpBridge::hasClient() const {
    return m_transport && m_transport->hasClient();
}

// ════════════════════════════════════════════════════════════════════
// Local submissions
// ════════════════════════════════════════════════════════════════════

QFuture<Result> McpBridge::submit(const QString& method, const QJsonObject& params) {
    quint64 id = m_localIds++;
    ValidationResult v = m_registry.validate(method, params);
    if (!v.ok)
        return readyFuture(Result::failure(id, v.kind, v.error));
    if (method == executeMethodName())
        return m_dispatcher->enqueue(Command::code(id, params.value("code").toString()));
    return m_dispatcher->enqueue(Command::structured(id, method, params));
}

QFuture<Result> McpBridge::submitCode(const QString& source) {
    return m_dispatcher->enqueue(Command::code(m_localIds++, source));
}

} // namespace cadb
