#pragma once
#include <QString>
#include <cstdint>

class QSettings;

namespace cadb {

enum class ConnectionPolicy : uint8_t {
    Replace,   // a new client evicts the live one
    Reject     // a new client is closed while one is live
};

const char* connectionPolicyToString(ConnectionPolicy p);
ConnectionPolicy connectionPolicyFromString(const QString& s);

// Host-side bridge settings. Stored under "bridge/" in QSettings,
// CADB_HOST / CADB_PORT override the endpoint.
struct BridgeConfig {
    QString          host               = QStringLiteral("127.0.0.1");
    quint16          port               = 9876;
    bool             autoStart          = true;
    ConnectionPolicy connectionPolicy   = ConnectionPolicy::Replace;
    bool             autoCreateDocument = true;
    int              tickIntervalMs     = 0;
    int              serverWaitMs       = 0;     // 0 = wait for the UI thread indefinitely
    qint64           maxFrameBytes      = 64LL * 1024 * 1024;
    int              scriptTimeLimitMs  = 30000; // 0 = unlimited

    static BridgeConfig load(QSettings& settings);
    static BridgeConfig load();
    void save(QSettings& settings) const;
    void applyEnvironment();
};

// External-process client settings: CADB_HOST, CADB_PORT, CADB_TIMEOUT_MS.
struct ClientConfig {
    QString host             = QStringLiteral("127.0.0.1");
    quint16 port             = 9876;
    int     timeoutMs        = 30000;
    int     connectTimeoutMs = 2000;
    int     connectAttempts  = 3;
    int     backoffMs        = 200;
    qint64  maxFrameBytes    = 64LL * 1024 * 1024;

    static ClientConfig fromEnvironment();
};

} // namespace cadb
