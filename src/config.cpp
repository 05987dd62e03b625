#include "config.h"
#include <QSettings>
#include <QDebug>

namespace cadb {

namespace {

QString envString(const char* name) {
    return qEnvironmentVariableIsSet(name) ? qEnvironmentVariable(name) : QString();
}

bool envPort(const char* name, quint16* out) {
    QString v = envString(name);
    if (v.isEmpty()) return false;
    bool ok = false;
    uint p = v.toUInt(&ok);
    if (!ok || p == 0 || p > 65535) {
        qWarning() << "[Config] Ignoring invalid" << name << "=" << v;
        return false;
    }
    *out = static_cast<quint16>(p);
    return true;
}

} // namespace

const char* connectionPolicyToString(ConnectionPolicy p) {
    return p == ConnectionPolicy::Reject ? "reject" : "replace";
}

ConnectionPolicy connectionPolicyFromString(const QString& s) {
    return s.compare(QLatin1String("reject"), Qt::CaseInsensitive) == 0
        ? ConnectionPolicy::Reject : ConnectionPolicy::Replace;
}

BridgeConfig BridgeConfig::load(QSettings& s) {
    BridgeConfig c;
    c.host               = s.value("bridge/host", c.host).toString();
    bool portOk = false;
    uint port = s.value("bridge/port", c.port).toUInt(&portOk);
    if (portOk && port > 0 && port <= 65535)
        c.port = static_cast<quint16>(port);
    else
        qWarning() << "[Config] Ignoring invalid bridge/port =" << s.value("bridge/port").toString();
    c.autoStart          = s.value("bridge/autoStart", c.autoStart).toBool();
    c.connectionPolicy   = connectionPolicyFromString(
        s.value("bridge/connectionPolicy", connectionPolicyToString(c.connectionPolicy)).toString());
    c.autoCreateDocument = s.value("bridge/autoCreateDocument", c.autoCreateDocument).toBool();
    c.tickIntervalMs     = qMax(0, s.value("bridge/tickIntervalMs", c.tickIntervalMs).toInt());
    c.serverWaitMs       = qMax(0, s.value("bridge/serverWaitMs", c.serverWaitMs).toInt());
    c.maxFrameBytes      = s.value("bridge/maxFrameBytes", c.maxFrameBytes).toLongLong();
    c.scriptTimeLimitMs  = qMax(0, s.value("bridge/scriptTimeLimitMs", c.scriptTimeLimitMs).toInt());
    if (c.maxFrameBytes <= 0) c.maxFrameBytes = BridgeConfig().maxFrameBytes;
    c.applyEnvironment();
    return c;
}

BridgeConfig BridgeConfig::load() {
    QSettings settings("CadBridge", "CadBridge");
    return load(settings);
}

void BridgeConfig::save(QSettings& s) const {
    s.setValue("bridge/host", host);
    s.setValue("bridge/port", port);
    s.setValue("bridge/autoStart", autoStart);
    s.setValue("bridge/connectionPolicy", connectionPolicyToString(connectionPolicy));
    s.setValue("bridge/autoCreateDocument", autoCreateDocument);
    s.setValue("bridge/tickIntervalMs", tickIntervalMs);
    s.setValue("bridge/serverWaitMs", serverWaitMs);
    s.setValue("bridge/maxFrameBytes", maxFrameBytes);
    s.setValue("bridge/scriptTimeLimitMs", scriptTimeLimitMs);
}

void BridgeConfig::applyEnvironment() {
    QString h = envString("CADB_HOST");
    if (!h.isEmpty()) host = h;
    envPort("CADB_PORT", &port);
}

ClientConfig ClientConfig::fromEnvironment() {
    ClientConfig c;
    QString h = envString("CADB_HOST");
    if (!h.isEmpty()) c.host = h;
    envPort("CADB_PORT", &c.port);

    QString t = envString("CADB_TIMEOUT_MS");
    if (!t.isEmpty()) {
        bool ok = false;
        int ms = t.toInt(&ok);
        if (ok && ms > 0) c.timeoutMs = ms;
        else qWarning() << "[Config] Ignoring invalid CADB_TIMEOUT_MS =" << t;
    }
    return c;
}

} // namespace cadb
