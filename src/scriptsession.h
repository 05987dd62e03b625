#pragma once
#include <QElapsedTimer>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

struct lua_State;
struct lua_Debug;

namespace cadb {

class HostContext;
class OperationRegistry;

/**
 * Persistent Lua interpreter state for code commands.
 *
 * Globals survive between run() calls until reset(). Output of print() and
 * io.write() is captured per run. The script reaches the host through the
 * `cad` table:
 *
 *   cad.call(name [, args])  run a structured operation, returns its value
 *   cad.operations()         array of operation names
 *   cad.document()           name of the active document, or nil
 *
 * Must only be used on the UI thread.
 */
class ScriptSession {
public:
    struct Outcome {
        bool       ok = false;
        QJsonValue value;      // first value returned by the chunk, or null
        QString    output;     // captured print/io.write text
        QString    error;      // message with traceback when !ok
    };

    explicit ScriptSession(const OperationRegistry* registry = nullptr);
    ~ScriptSession();

    ScriptSession(const ScriptSession&) = delete;
    ScriptSession& operator=(const ScriptSession&) = delete;

    Outcome run(const QString& source, HostContext& host);

    // Wall-clock limit per run in ms; 0 disables it.
    void setTimeLimit(int ms) { m_timeLimitMs = ms; }
    int  timeLimit() const { return m_timeLimitMs; }

    // Drops all globals. The next run() starts from a fresh state.
    void reset();
    bool isOpen() const { return m_L != nullptr; }

private:
    bool open();
    void close();

    bool invokeOperation(const QString& name, const QJsonObject& args,
                         QJsonValue* value, QString* error);

    static ScriptSession* sessionOf(lua_State* L);
    static int luaPrint(lua_State* L);
    static int luaWrite(lua_State* L);
    static int luaCall(lua_State* L);
    static int luaOperations(lua_State* L);
    static int luaDocument(lua_State* L);
    static int luaMessageHandler(lua_State* L);
    static void luaTimeHook(lua_State* L, lua_Debug* ar);

    lua_State*               m_L = nullptr;
    const OperationRegistry* m_registry = nullptr;
    HostContext*             m_host = nullptr;    // set only during run()
    QString                  m_output;
    QElapsedTimer            m_clock;
    int                      m_timeLimitMs = 30000;
};

} // namespace cadb
