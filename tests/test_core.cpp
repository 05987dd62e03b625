#include <QtTest/QTest>
#include <QSettings>
#include <QTemporaryDir>
#include "core.h"
#include "config.h"

using namespace cadb;

class TestCore : public QObject {
    Q_OBJECT
private slots:
    void init() {
        qunsetenv("CADB_HOST");
        qunsetenv("CADB_PORT");
        qunsetenv("CADB_TIMEOUT_MS");
    }

    void testErrorKindStringRoundTrip() {
        for (const auto& m : kErrorMeta) {
            bool ok = false;
            QCOMPARE(errorKindFromString(QString::fromLatin1(m.name), &ok), m.kind);
            QVERIFY(ok);
        }
        bool ok = true;
        errorKindFromString("NotAKind", &ok);
        QVERIFY(!ok);
    }

    void testTransportKindsAreFlagged() {
        QVERIFY(errorMeta(ErrorKind::Timeout)->transport);
        QVERIFY(errorMeta(ErrorKind::ConnectionLost)->transport);
        QVERIFY(errorMeta(ErrorKind::BridgeClosed)->transport);
        QVERIFY(!errorMeta(ErrorKind::ExecutionError)->transport);
        QVERIFY(!errorMeta(ErrorKind::NoActiveContext)->transport);
    }

    void testOperationErrorDefaultsToExecutionError() {
        OperationError e(QStringLiteral("boom"));
        QCOMPARE(e.kind(), ErrorKind::ExecutionError);
        QCOMPARE(e.message(), QString("boom"));

        OperationError inv(ErrorKind::InvalidArguments, "bad radius");
        QCOMPARE(inv.kind(), ErrorKind::InvalidArguments);
        QCOMPARE(QString(inv.what()), QString("bad radius"));
    }

    void testCommandFactories() {
        Command s = Command::structured(7, "ping", QJsonObject{{"a", 1}});
        QCOMPARE(s.id, uint64_t(7));
        QCOMPARE(s.kind, CommandKind::Structured);
        QCOMPARE(s.method, QString("ping"));
        QCOMPARE(s.params.value("a").toInt(), 1);
        QVERIFY(s.issuedAt > 0);

        Command c = Command::code(8, "x = 1");
        QCOMPARE(c.kind, CommandKind::Code);
        QCOMPARE(c.method, QString("execute"));
        QCOMPARE(c.source, QString("x = 1"));
        QCOMPARE(c.params.value("code").toString(), QString("x = 1"));
    }

    void testResultFactories() {
        Result ok = Result::success(3, QJsonValue(42), "out\n");
        QVERIFY(ok.ok());
        QCOMPARE(ok.commandId, uint64_t(3));
        QCOMPARE(ok.value.toInt(), 42);
        QCOMPARE(ok.stdoutText, QString("out\n"));
        QCOMPARE(ok.errorKind, ErrorKind::None);

        Result bad = Result::failure(4, ErrorKind::Timeout, "late");
        QVERIFY(!bad.ok());
        QCOMPARE(bad.errorKind, ErrorKind::Timeout);
        QCOMPARE(bad.errorMessage, QString("late"));
        QVERIFY(bad.value.isNull());
    }

    void testBridgeConfigDefaults() {
        BridgeConfig c;
        QCOMPARE(c.host, QString("127.0.0.1"));
        QCOMPARE(c.port, quint16(9876));
        QCOMPARE(c.connectionPolicy, ConnectionPolicy::Replace);
        QVERIFY(c.autoCreateDocument);
        QCOMPARE(c.serverWaitMs, 0);
    }

    void testBridgeConfigSaveLoad() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QSettings settings(dir.filePath("cadb.ini"), QSettings::IniFormat);

        BridgeConfig c;
        c.host = "0.0.0.0";
        c.port = 12001;
        c.autoStart = false;
        c.connectionPolicy = ConnectionPolicy::Reject;
        c.autoCreateDocument = false;
        c.serverWaitMs = 1500;
        c.scriptTimeLimitMs = 0;
        c.save(settings);

        BridgeConfig r = BridgeConfig::load(settings);
        QCOMPARE(r.host, QString("0.0.0.0"));
        QCOMPARE(r.port, quint16(12001));
        QCOMPARE(r.autoStart, false);
        QCOMPARE(r.connectionPolicy, ConnectionPolicy::Reject);
        QCOMPARE(r.autoCreateDocument, false);
        QCOMPARE(r.serverWaitMs, 1500);
        QCOMPARE(r.scriptTimeLimitMs, 0);
    }

    void testOutOfRangeStoredPortIsIgnored() {
        QTemporaryDir dir;
        QSettings settings(dir.filePath("cadb.ini"), QSettings::IniFormat);
        settings.setValue("bridge/port", 70000);
        QCOMPARE(BridgeConfig::load(settings).port, BridgeConfig().port);

        settings.setValue("bridge/port", "abc");
        QCOMPARE(BridgeConfig::load(settings).port, BridgeConfig().port);

        settings.setValue("bridge/port", 4464);
        QCOMPARE(BridgeConfig::load(settings).port, quint16(4464));
    }

    void testEnvironmentOverridesEndpoint() {
        QTemporaryDir dir;
        QSettings settings(dir.filePath("cadb.ini"), QSettings::IniFormat);
        BridgeConfig c;
        c.port = 12001;
        c.save(settings);

        qputenv("CADB_HOST", "localhost");
        qputenv("CADB_PORT", "23456");
        BridgeConfig r = BridgeConfig::load(settings);
        QCOMPARE(r.host, QString("localhost"));
        QCOMPARE(r.port, quint16(23456));

        qputenv("CADB_PORT", "99999");
        r = BridgeConfig::load(settings);
        QCOMPARE(r.port, quint16(12001));
    }

    void testClientConfigFromEnvironment() {
        ClientConfig d = ClientConfig::fromEnvironment();
        QCOMPARE(d.port, quint16(9876));
        QCOMPARE(d.timeoutMs, 30000);

        qputenv("CADB_PORT", "4000");
        qputenv("CADB_TIMEOUT_MS", "250");
        ClientConfig c = ClientConfig::fromEnvironment();
        QCOMPARE(c.port, quint16(4000));
        QCOMPARE(c.timeoutMs, 250);

        qputenv("CADB_TIMEOUT_MS", "soon");
        QCOMPARE(ClientConfig::fromEnvironment().timeoutMs, 30000);
    }

    void testConnectionPolicyStrings() {
        QCOMPARE(connectionPolicyFromString("reject"), ConnectionPolicy::Reject);
        QCOMPARE(connectionPolicyFromString("REPLACE"), ConnectionPolicy::Replace);
        QCOMPARE(connectionPolicyFromString("garbage"), ConnectionPolicy::Replace);
        QCOMPARE(QString(connectionPolicyToString(ConnectionPolicy::Reject)), QString("reject"));
    }
};

QTEST_GUILESS_MAIN(TestCore)
#include "test_core.moc"
