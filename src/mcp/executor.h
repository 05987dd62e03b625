#pragma once
#include "core.h"
#include "scriptsession.h"
#include <QString>

namespace cadb {

class HostContext;
class OperationRegistry;

/**
 * Runs one command against the host on the UI thread and always produces
 * a Result. Structured commands go through the OperationRegistry; code
 * commands run in the persistent ScriptSession.
 */
class CommandExecutor {
public:
    explicit CommandExecutor(const OperationRegistry& registry);

    Result execute(const Command& cmd, HostContext& host);

    // Create a default document when a command needs one and none is open.
    void setAutoCreateDocument(bool on) { m_autoCreate = on; }
    bool autoCreateDocument() const { return m_autoCreate; }
    void setDefaultDocumentName(const QString& name) { m_defaultDocName = name; }

    ScriptSession&       script()       { return m_script; }
    const ScriptSession& script() const { return m_script; }

private:
    Result runStructured(const Command& cmd, HostContext& host);
    Result runCode(const Command& cmd, HostContext& host);
    bool ensureDocument(HostContext& host, QString* error);

    const OperationRegistry& m_registry;
    ScriptSession            m_script;
    bool                     m_autoCreate = true;
    QString                  m_defaultDocName = QStringLiteral("Unnamed");
};

} // namespace cadb
