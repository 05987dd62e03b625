// cadb-mcp-stdio: Bridges stdin/stdout to the CadBridge TCP endpoint.
// An MCP front end spawns this process; it forwards each request line to the
// bridge inside the running CadBridge host and prints the response line.
//
// stdin  (requests)  → BridgeClient → McpBridge (in CadBridge)
// stdout (responses) ← BridgeClient ← McpBridge (in CadBridge)
//
// Diagnostics go to stderr only; stdout carries protocol frames.

#include "mcp/bridge_client.h"
#include "mcp/wire.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#include <fcntl.h>
#endif

using namespace cadb;

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("cadb-mcp-stdio"));

#ifdef _WIN32
    _setmode(_fileno(stdin), _O_BINARY);
    _setmode(_fileno(stdout), _O_BINARY);
#endif

    ClientConfig cfg = ClientConfig::fromEnvironment();

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Forward newline-delimited JSON requests to a CadBridge host."));
    parser.addHelpOption();
    QCommandLineOption hostOpt(QStringLiteral("host"), QStringLiteral("Bridge host (default %1).").arg(cfg.host),
                               QStringLiteral("host"));
    QCommandLineOption portOpt(QStringLiteral("port"), QStringLiteral("Bridge port (default %1).").arg(cfg.port),
                               QStringLiteral("port"));
    QCommandLineOption timeoutOpt(QStringLiteral("timeout"),
                                  QStringLiteral("Per-request timeout in ms (default %1).").arg(cfg.timeoutMs),
                                  QStringLiteral("ms"));
    parser.addOption(hostOpt);
    parser.addOption(portOpt);
    parser.addOption(timeoutOpt);
    parser.process(app);

    if (parser.isSet(hostOpt)) cfg.host = parser.value(hostOpt);
    if (parser.isSet(portOpt)) {
        bool ok = false;
        uint port = parser.value(portOpt).toUInt(&ok);
        if (!ok || port == 0 || port > 65535) {
            fprintf(stderr, "[cadb-mcp-stdio] Invalid port: %s\n", qPrintable(parser.value(portOpt)));
            return 2;
        }
        cfg.port = quint16(port);
    }
    if (parser.isSet(timeoutOpt)) {
        bool ok = false;
        int ms = parser.value(timeoutOpt).toInt(&ok);
        if (!ok || ms < 0) {
            fprintf(stderr, "[cadb-mcp-stdio] Invalid timeout: %s\n", qPrintable(parser.value(timeoutOpt)));
            return 2;
        }
        cfg.timeoutMs = ms;
    }

    QFile in;
    if (!in.open(stdin, QIODevice::ReadOnly)) {
        fprintf(stderr, "[cadb-mcp-stdio] Cannot read stdin\n");
        return 1;
    }

    BridgeClient client(cfg);
    fprintf(stderr, "[cadb-mcp-stdio] Forwarding to %s:%u\n", qPrintable(cfg.host), unsigned(cfg.port));

    // One request at a time: read a line, wait for its answer, print it
    while (true) {
        // Blocking read; empty only at end of input
        QByteArray line = in.readLine();
        if (line.isEmpty()) break;
        line = line.trimmed();
        if (line.isEmpty()) continue;

        WireRequest req;
        QString err;
        QByteArray out;
        if (!decodeRequest(line, &req, &err)) {
            out = encodeResponse(req.id, Result::failure(0, ErrorKind::ProtocolError, err));
        } else {
            Result r = client.call(req.method, req.params);
            if (!r.ok())
                fprintf(stderr, "[cadb-mcp-stdio] %s: %s: %s\n", qPrintable(req.method),
                        errorKindToString(r.errorKind), qPrintable(r.errorMessage.left(200)));
            out = encodeResponse(req.id, r);
        }
        fwrite(out.constData(), 1, size_t(out.size()), stdout);
        fflush(stdout);
    }

    fprintf(stderr, "[cadb-mcp-stdio] stdin closed\n");
    client.close();
    return 0;
}
