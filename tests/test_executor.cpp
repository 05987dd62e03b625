#include <QtTest/QTest>
#include <QElapsedTimer>
#include <QJsonArray>
#include "executor.h"
#include "operations.h"
#include "workspace.h"

using namespace cadb;

class TestExecutor : public QObject {
    Q_OBJECT

    OperationRegistry* m_reg = nullptr;
    CommandExecutor*   m_exec = nullptr;
    Workspace*         m_ws = nullptr;
    uint64_t           m_nextId = 1;

    Result code(const QString& src) {
        return m_exec->execute(Command::code(m_nextId++, src), *m_ws);
    }

private slots:
    void init() {
        m_reg = new OperationRegistry;
        registerBuiltinOperations(*m_reg);
        m_exec = new CommandExecutor(*m_reg);
        m_ws = new Workspace;
    }

    void cleanup() {
        delete m_ws;
        delete m_exec;
        delete m_reg;
    }

    void testAssignmentProducesNullValue() {
        Result r = code("x = 1 + 1");
        QVERIFY(r.ok());
        QVERIFY(r.value.isNull());
        QCOMPARE(r.stdoutText, QString());
    }

    void testGlobalsPersistBetweenRuns() {
        QVERIFY(code("x = 1 + 1").ok());
        Result r = code("print(x)");
        QVERIFY(r.ok());
        QCOMPARE(r.stdoutText, QString("2\n"));
    }

    void testPrintFormatting() {
        Result r = code("print('a', 1, true, nil)\nio.write('no newline')");
        QVERIFY(r.ok());
        QCOMPARE(r.stdoutText, QString("a\t1\ttrue\tnil\nno newline"));
    }

    void testReturnValueConversion() {
        QCOMPARE(code("return 42").value.toInt(), 42);
        QCOMPARE(code("return 1.5").value.toDouble(), 1.5);
        QCOMPARE(code("return 'hi'").value.toString(), QString("hi"));
        QCOMPARE(code("return {1, 2, 3}").value.toArray(), (QJsonArray{1, 2, 3}));

        QJsonObject o = code("return {name = 'Box', size = {1, 2}}").value.toObject();
        QCOMPARE(o.value("name").toString(), QString("Box"));
        QCOMPARE(o.value("size").toArray().size(), 2);

        QVERIFY(code("return {}").value.isObject());
        // Only the first value is kept
        QCOMPARE(code("return 1, 2").value.toInt(), 1);
    }

    void testUnrepresentableReturn() {
        Result r = code("return function() end");
        QVERIFY(!r.ok());
        QCOMPARE(r.errorKind, ErrorKind::ExecutionError);
        QVERIFY(r.errorMessage.contains("function"));
    }

    void testErrorKeepsOutputAndSessionRecovers() {
        Result r = code("print('before')\nerror('boom')");
        QVERIFY(!r.ok());
        QCOMPARE(r.errorKind, ErrorKind::ExecutionError);
        QCOMPARE(r.stdoutText, QString("before\n"));
        QVERIFY(r.errorMessage.contains("boom"));
        QVERIFY(r.errorMessage.contains("traceback"));

        Result next = code("print('after')");
        QVERIFY(next.ok());
        QCOMPARE(next.stdoutText, QString("after\n"));
    }

    void testSyntaxError() {
        Result r = code("this is not lua");
        QCOMPARE(r.errorKind, ErrorKind::ExecutionError);
        QVERIFY(r.errorMessage.startsWith("execute:"));
    }

    void testOutputIsPerRun() {
        QVERIFY(code("print('one')").ok());
        QCOMPARE(code("y = 3").stdoutText, QString());
    }

    void testNoActiveContextWhenAutoCreateOff() {
        m_exec->setAutoCreateDocument(false);
        Result r = code("print(1)");
        QVERIFY(!r.ok());
        QCOMPARE(r.errorKind, ErrorKind::NoActiveContext);
        QCOMPARE(m_ws->documentCount(), 0);
    }

    void testAutoCreatesDefaultDocument() {
        m_exec->setDefaultDocumentName("Scratch");
        Result r = code("return cad.document()");
        QVERIFY(r.ok());
        QCOMPARE(r.value.toString(), QString("Scratch"));
    }

    void testCadCall() {
        Result r = code(
            "local b = cad.call('create_primitive', {shape = 'Box', name = 'Block'})\n"
            "print(b.name, b.type)\n"
            "local info = cad.call('get_model_info')\n"
            "return #info.objects");
        QVERIFY2(r.ok(), qPrintable(r.errorMessage));
        QCOMPARE(r.stdoutText, QString("Block\tPart::Box\n"));
        QCOMPARE(r.value.toInt(), 1);
        QVERIFY(m_ws->activeDocument()->find("Block"));
    }

    void testCadCallErrorsAreCatchable() {
        Result r = code(
            "local ok, err = pcall(cad.call, 'delete_object', {object_name = 'Ghost'})\n"
            "return {ok = ok, err = err}");
        QVERIFY(r.ok());
        QJsonObject o = r.value.toObject();
        QCOMPARE(o.value("ok").toBool(), false);
        QVERIFY(o.value("err").toString().startsWith("ExecutionError: Object not found"));

        r = code("cad.call('no_such_op')");
        QVERIFY(!r.ok());
        QVERIFY(r.errorMessage.contains("UnknownMethod"));

        r = code("cad.call('execute', {code = 'x = 1'})");
        QVERIFY(!r.ok());
        QVERIFY(r.errorMessage.contains("InvalidArguments"));
    }

    void testCadOperations() {
        Result r = code("local ops = cad.operations()\n"
                        "local seen = {}\n"
                        "for _, n in ipairs(ops) do seen[n] = true end\n"
                        "return {ping = seen.ping == true, exec = seen.execute == true}");
        QVERIFY(r.ok());
        QCOMPARE(r.value.toObject().value("ping").toBool(), true);
        QCOMPARE(r.value.toObject().value("exec").toBool(), false);
    }

    void testOsExitIsRemoved() {
        Result r = code("return os.exit == nil");
        QVERIFY(r.ok());
        QCOMPARE(r.value.toBool(), true);
    }

    void testTimeLimit() {
        m_exec->script().setTimeLimit(200);
        QElapsedTimer t;
        t.start();
        Result r = code("while true do end");
        QVERIFY(!r.ok());
        QCOMPARE(r.errorKind, ErrorKind::ExecutionError);
        QVERIFY(r.errorMessage.contains("time limit"));
        QVERIFY(t.elapsed() < 5000);

        // The session survives the interruption
        QVERIFY(code("return 1").ok());
    }

    void testResetDropsGlobals() {
        QVERIFY(code("x = 5").ok());
        m_exec->script().reset();
        QVERIFY(!m_exec->script().isOpen());
        Result r = code("return x");
        QVERIFY(r.ok());
        QVERIFY(r.value.isNull());
    }

    void testStructuredExecuteRoutesToScript() {
        Result r = m_exec->execute(Command::structured(99, "execute", {{"code", "print('via op')"}}), *m_ws);
        QVERIFY(r.ok());
        QCOMPARE(r.stdoutText, QString("via op\n"));
    }

    void testUnknownStructuredMethod() {
        Result r = m_exec->execute(Command::structured(100, "frobnicate", {}), *m_ws);
        QCOMPARE(r.errorKind, ErrorKind::UnknownMethod);
        QCOMPARE(r.commandId, uint64_t(100));
    }

    void testHandlerExceptionsAreContained() {
        m_reg->add({"explode", "throws", {}, false,
            [](const QJsonObject&, HostContext&) -> QJsonValue {
                throw std::runtime_error("kaboom");
            }});
        Result r = m_exec->execute(Command::structured(1, "explode", {}), *m_ws);
        QCOMPARE(r.errorKind, ErrorKind::ExecutionError);
        QCOMPARE(r.errorMessage, QString("kaboom"));
    }
};

QTEST_MAIN(TestExecutor)
#include "test_executor.moc"
