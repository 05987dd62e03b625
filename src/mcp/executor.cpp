#include "executor.h"
#include "hostcontext.h"
#include "operations.h"
#include "scene.h"
#include <QDebug>

namespace cadb {

CommandExecutor::CommandExecutor(const OperationRegistry& registry)
    : m_registry(registry), m_script(&registry)
{}

Result CommandExecutor::execute(const Command& cmd, HostContext& host) {
    if (cmd.kind == CommandKind::Code)
        return runCode(cmd, host);
    return runStructured(cmd, host);
}

bool CommandExecutor::ensureDocument(HostContext& host, QString* error) {
    if (host.activeDocument()) return true;
    if (!m_autoCreate) {
        *error = QStringLiteral("No active document");
        return false;
    }
    Document* doc = host.createDocument(m_defaultDocName);
    if (!doc) {
        *error = QStringLiteral("Failed to create a default document");
        return false;
    }
    qDebug() << "[Executor] Created default document" << doc->name;
    return true;
}

Result CommandExecutor::runStructured(const Command& cmd, HostContext& host) {
    const OperationSpec* spec = m_registry.find(cmd.method);
    if (!spec)
        return Result::failure(cmd.id, ErrorKind::UnknownMethod,
                               QStringLiteral("Unknown method: %1").arg(cmd.method));

    // "execute" arriving as a structured command is routed to the script
    if (cmd.method == executeMethodName()) {
        ValidationResult v = OperationRegistry::validateArgs(*spec, cmd.params);
        if (!v.ok) return Result::failure(cmd.id, v.kind, v.error);
        return runCode(Command::code(cmd.id, cmd.params.value("code").toString()), host);
    }

    ValidationResult v = OperationRegistry::validateArgs(*spec, cmd.params);
    if (!v.ok) return Result::failure(cmd.id, v.kind, v.error);

    if (!spec->fn)
        return Result::failure(cmd.id, ErrorKind::UnknownMethod,
                               QStringLiteral("%1 has no handler").arg(cmd.method));

    QString err;
    if (spec->needsDocument && !ensureDocument(host, &err))
        return Result::failure(cmd.id, ErrorKind::NoActiveContext, err);

    try {
        return Result::success(cmd.id, spec->fn(cmd.params, host));
    } catch (const OperationError& e) {
        return Result::failure(cmd.id, e.kind(), e.message());
    } catch (const std::exception& e) {
        return Result::failure(cmd.id, ErrorKind::ExecutionError, QString::fromUtf8(e.what()));
    } catch (...) {
        return Result::failure(cmd.id, ErrorKind::ExecutionError,
                               QStringLiteral("%1 raised an unknown exception").arg(cmd.method));
    }
}

Result CommandExecutor::runCode(const Command& cmd, HostContext& host) {
    QString err;
    if (!ensureDocument(host, &err))
        return Result::failure(cmd.id, ErrorKind::NoActiveContext, err);

    ScriptSession::Outcome out = m_script.run(cmd.source, host);
    if (!out.ok) {
        qDebug() << "[Executor] Script failed:" << out.error.left(200);
        return Result::failure(cmd.id, ErrorKind::ExecutionError, out.error, out.output);
    }
    return Result::success(cmd.id, out.value, out.output);
}

} // namespace cadb
