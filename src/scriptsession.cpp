#include "scriptsession.h"
#include "hostcontext.h"
#include "operations.h"
#include "scene.h"
#include <QDebug>
#include <QJsonArray>
#include <cmath>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
#include <lualib.h>
}

// The Lua C functions below raise errors with longjmp. No C++ object with a
// destructor may be alive in a frame that lua_error() unwinds, so C++ work
// happens in a nested scope and the error is raised after it closes.

namespace cadb {

namespace {

constexpr int kMaxDepth     = 32;
constexpr int kHookInterval = 10000;   // VM instructions between clock checks
constexpr int kStackReserve = 2 * kMaxDepth + 8;

// ── Lua <-> JSON ──

bool toJson(lua_State* L, int idx, QJsonValue* out, QString* err, int depth);

bool tableToJson(lua_State* L, int idx, QJsonValue* out, QString* err, int depth) {
    if (depth > kMaxDepth) {
        *err = QStringLiteral("table nesting deeper than %1").arg(kMaxDepth);
        return false;
    }
    idx = lua_absindex(L, idx);

    // Sequence iff every key is an integer in 1..n
    lua_Integer count = 0;
    bool sequence = true;
    lua_pushnil(L);
    while (lua_next(L, idx) != 0) {
        lua_pop(L, 1);
        count++;
        if (!lua_isinteger(L, -1) || lua_tointeger(L, -1) < 1) sequence = false;
    }
    if (sequence) {
        for (lua_Integer i = 1; i <= count; i++) {
            if (lua_rawgeti(L, idx, i) == LUA_TNIL) sequence = false;
            lua_pop(L, 1);
            if (!sequence) break;
        }
    }

    if (sequence && count > 0) {
        QJsonArray arr;
        for (lua_Integer i = 1; i <= count; i++) {
            lua_rawgeti(L, idx, i);
            QJsonValue v;
            bool ok = toJson(L, -1, &v, err, depth + 1);
            lua_pop(L, 1);
            if (!ok) return false;
            arr.append(v);
        }
        *out = arr;
        return true;
    }

    QJsonObject obj;
    lua_pushnil(L);
    while (lua_next(L, idx) != 0) {
        QString key;
        if (lua_type(L, -2) == LUA_TSTRING) {
            size_t len = 0;
            const char* s = lua_tolstring(L, -2, &len);
            key = QString::fromUtf8(s, int(len));
        } else if (lua_isinteger(L, -2)) {
            key = QString::number(lua_tointeger(L, -2));
        } else {
            *err = QStringLiteral("table key of type %1 is not representable")
                       .arg(QLatin1String(luaL_typename(L, -2)));
            lua_pop(L, 2);
            return false;
        }
        QJsonValue v;
        bool ok = toJson(L, -1, &v, err, depth + 1);
        lua_pop(L, 1);
        if (!ok) {
            lua_pop(L, 1);
            return false;
        }
        obj.insert(key, v);
    }
    *out = obj;
    return true;
}

bool toJson(lua_State* L, int idx, QJsonValue* out, QString* err, int depth) {
    switch (lua_type(L, idx)) {
    case LUA_TNIL:
    case LUA_TNONE:
        *out = QJsonValue();
        return true;
    case LUA_TBOOLEAN:
        *out = bool(lua_toboolean(L, idx));
        return true;
    case LUA_TNUMBER:
        if (lua_isinteger(L, idx)) *out = qint64(lua_tointeger(L, idx));
        else                       *out = double(lua_tonumber(L, idx));
        return true;
    case LUA_TSTRING: {
        size_t len = 0;
        const char* s = lua_tolstring(L, idx, &len);
        *out = QString::fromUtf8(s, int(len));
        return true;
    }
    case LUA_TTABLE:
        return tableToJson(L, idx, out, err, depth);
    default:
        *err = QStringLiteral("a %1 value is not representable")
                   .arg(QLatin1String(luaL_typename(L, idx)));
        return false;
    }
}

// Callers reserve kStackReserve slots first; nothing here raises.
void pushJson(lua_State* L, const QJsonValue& v, int depth = 0) {
    switch (v.type()) {
    case QJsonValue::Bool:
        lua_pushboolean(L, v.toBool());
        break;
    case QJsonValue::Double: {
        double d = v.toDouble();
        if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9.007199254740992e15)
            lua_pushinteger(L, lua_Integer(d));
        else
            lua_pushnumber(L, d);
        break;
    }
    case QJsonValue::String: {
        QByteArray utf8 = v.toString().toUtf8();
        lua_pushlstring(L, utf8.constData(), size_t(utf8.size()));
        break;
    }
    case QJsonValue::Array: {
        QJsonArray arr = v.toArray();
        lua_createtable(L, int(arr.size()), 0);
        if (depth >= kMaxDepth) break;
        for (int i = 0; i < arr.size(); i++) {
            pushJson(L, arr.at(i), depth + 1);
            lua_rawseti(L, -2, i + 1);
        }
        break;
    }
    case QJsonValue::Object: {
        QJsonObject obj = v.toObject();
        lua_createtable(L, 0, int(obj.size()));
        if (depth >= kMaxDepth) break;
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            pushJson(L, it.value(), depth + 1);
            lua_setfield(L, -2, it.key().toUtf8().constData());
        }
        break;
    }
    default:
        lua_pushnil(L);
        break;
    }
}

} // namespace

// ── Lifetime ──

ScriptSession::ScriptSession(const OperationRegistry* registry)
    : m_registry(registry) {}

ScriptSession::~ScriptSession() {
    close();
}

bool ScriptSession::open() {
    if (m_L) return true;

    m_L = luaL_newstate();
    if (!m_L) {
        qWarning() << "[Script] luaL_newstate failed";
        return false;
    }
    *static_cast<ScriptSession**>(lua_getextraspace(m_L)) = this;
    luaL_openlibs(m_L);

    lua_register(m_L, "print", &ScriptSession::luaPrint);

    lua_getglobal(m_L, "io");
    if (lua_istable(m_L, -1)) {
        lua_pushcfunction(m_L, &ScriptSession::luaWrite);
        lua_setfield(m_L, -2, "write");
    }
    lua_pop(m_L, 1);

    // The host process is not the script's to end
    lua_getglobal(m_L, "os");
    if (lua_istable(m_L, -1)) {
        lua_pushnil(m_L);
        lua_setfield(m_L, -2, "exit");
    }
    lua_pop(m_L, 1);

    static const luaL_Reg cadlib[] = {
        {"call",       &ScriptSession::luaCall},
        {"operations", &ScriptSession::luaOperations},
        {"document",   &ScriptSession::luaDocument},
        {nullptr, nullptr}
    };
    luaL_newlib(m_L, cadlib);
    lua_setglobal(m_L, "cad");

    qDebug() << "[Script] Lua state opened:" << LUA_RELEASE;
    return true;
}

void ScriptSession::close() {
    if (!m_L) return;
    lua_close(m_L);
    m_L = nullptr;
}

void ScriptSession::reset() {
    close();
    qDebug() << "[Script] Session reset";
}

ScriptSession* ScriptSession::sessionOf(lua_State* L) {
    return *static_cast<ScriptSession**>(lua_getextraspace(L));
}

// ── Run ──

ScriptSession::Outcome ScriptSession::run(const QString& source, HostContext& host) {
    Outcome out;
    if (!open()) {
        out.error = QStringLiteral("Lua interpreter unavailable");
        return out;
    }

    m_host = &host;
    m_output.clear();

    const int base = lua_gettop(m_L);
    lua_pushcfunction(m_L, &ScriptSession::luaMessageHandler);

    if (m_timeLimitMs > 0) {
        m_clock.start();
        lua_sethook(m_L, &ScriptSession::luaTimeHook, LUA_MASKCOUNT, kHookInterval);
    }

    QByteArray chunk = source.toUtf8();
    int rc = luaL_loadbufferx(m_L, chunk.constData(), size_t(chunk.size()), "=execute", "t");
    if (rc == LUA_OK)
        rc = lua_pcall(m_L, 0, LUA_MULTRET, base + 1);

    lua_sethook(m_L, nullptr, 0, 0);

    if (rc == LUA_OK) {
        out.ok = true;
        if (lua_gettop(m_L) > base + 1) {
            QString err;
            if (!lua_checkstack(m_L, kStackReserve)) {
                out.ok = false;
                out.error = QStringLiteral("return value: Lua stack exhausted");
            } else if (!toJson(m_L, base + 2, &out.value, &err, 0)) {
                out.ok = false;
                out.value = QJsonValue();
                out.error = QStringLiteral("return value: %1").arg(err);
            }
        }
    } else {
        const char* msg = lua_tostring(m_L, -1);
        out.error = msg ? QString::fromUtf8(msg) : QStringLiteral("unknown Lua error");
    }

    lua_settop(m_L, base);
    m_host = nullptr;
    out.output = m_output;
    m_output.clear();
    return out;
}

bool ScriptSession::invokeOperation(const QString& name, const QJsonObject& args,
                                    QJsonValue* value, QString* error) {
    auto fail = [&](ErrorKind kind, const QString& msg) {
        *error = QStringLiteral("%1: %2").arg(QLatin1String(errorKindToString(kind)), msg);
        return false;
    };

    if (name == executeMethodName())
        return fail(ErrorKind::InvalidArguments, QStringLiteral("execute cannot be called from a script"));
    if (!m_registry || !m_host)
        return fail(ErrorKind::NoActiveContext, QStringLiteral("no host attached"));

    ValidationResult v = m_registry->validate(name, args);
    if (!v.ok) return fail(v.kind, v.error);

    const OperationSpec* spec = m_registry->find(name);
    if (!spec->fn)
        return fail(ErrorKind::UnknownMethod, QStringLiteral("%1 is not callable").arg(name));
    if (spec->needsDocument && !m_host->activeDocument())
        return fail(ErrorKind::NoActiveContext, QStringLiteral("No active document"));

    try {
        *value = spec->fn(args, *m_host);
        return true;
    } catch (const OperationError& e) {
        return fail(e.kind(), e.message());
    } catch (const std::exception& e) {
        return fail(ErrorKind::ExecutionError, QString::fromUtf8(e.what()));
    }
}

// ── Lua C functions ──

int ScriptSession::luaPrint(lua_State* L) {
    ScriptSession* self = sessionOf(L);
    const int n = lua_gettop(L);
    for (int i = 1; i <= n; i++) {
        size_t len = 0;
        const char* s = luaL_tolstring(L, i, &len);
        if (i > 1) self->m_output.append(QLatin1Char('\t'));
        self->m_output.append(QString::fromUtf8(s, int(len)));
        lua_pop(L, 1);
    }
    self->m_output.append(QLatin1Char('\n'));
    return 0;
}

int ScriptSession::luaWrite(lua_State* L) {
    ScriptSession* self = sessionOf(L);
    const int n = lua_gettop(L);
    for (int i = 1; i <= n; i++) {
        size_t len = 0;
        const char* s = luaL_checklstring(L, i, &len);
        self->m_output.append(QString::fromUtf8(s, int(len)));
    }
    return 0;
}

int ScriptSession::luaCall(lua_State* L) {
    ScriptSession* self = sessionOf(L);
    const char* name = luaL_checkstring(L, 1);
    if (!lua_isnoneornil(L, 2))
        luaL_checktype(L, 2, LUA_TTABLE);
    lua_settop(L, 2);
    luaL_checkstack(L, kStackReserve, "cad.call");

    bool failed = false;
    {
        QJsonObject args;
        QString error;
        if (lua_istable(L, 2)) {
            QJsonValue converted;
            if (!toJson(L, 2, &converted, &error, 0)) {
                error = QStringLiteral("InvalidArguments: %1").arg(error);
                failed = true;
            } else if (converted.isArray()) {
                error = QStringLiteral("InvalidArguments: arguments must be a table with named fields");
                failed = true;
            } else {
                args = converted.toObject();
            }
        }

        QJsonValue value;
        if (!failed)
            failed = !self->invokeOperation(QString::fromUtf8(name), args, &value, &error);

        if (failed) {
            QByteArray msg = error.toUtf8();
            lua_pushlstring(L, msg.constData(), size_t(msg.size()));
        } else {
            pushJson(L, value);
        }
    }
    if (failed) return lua_error(L);
    return 1;
}

int ScriptSession::luaOperations(lua_State* L) {
    ScriptSession* self = sessionOf(L);
    lua_newtable(L);
    if (!self->m_registry) return 1;
    {
        const QStringList names = self->m_registry->names();
        int i = 1;
        for (const QString& n : names) {
            if (n == executeMethodName()) continue;
            QByteArray utf8 = n.toUtf8();
            lua_pushlstring(L, utf8.constData(), size_t(utf8.size()));
            lua_rawseti(L, -2, i++);
        }
    }
    return 1;
}

int ScriptSession::luaDocument(lua_State* L) {
    ScriptSession* self = sessionOf(L);
    Document* doc = self->m_host ? self->m_host->activeDocument() : nullptr;
    if (!doc) {
        lua_pushnil(L);
        return 1;
    }
    {
        QByteArray utf8 = doc->name.toUtf8();
        lua_pushlstring(L, utf8.constData(), size_t(utf8.size()));
    }
    return 1;
}

int ScriptSession::luaMessageHandler(lua_State* L) {
    const char* msg = lua_tostring(L, 1);
    if (!msg) {
        if (luaL_callmeta(L, 1, "__tostring") && lua_type(L, -1) == LUA_TSTRING)
            msg = lua_tostring(L, -1);
        else
            msg = lua_pushfstring(L, "(error object is a %s value)", luaL_typename(L, 1));
    }
    luaL_traceback(L, L, msg, 1);
    return 1;
}

void ScriptSession::luaTimeHook(lua_State* L, lua_Debug*) {
    ScriptSession* self = sessionOf(L);
    if (self->m_timeLimitMs > 0 && self->m_clock.elapsed() > self->m_timeLimitMs)
        luaL_error(L, "script time limit exceeded (%d ms)", self->m_timeLimitMs);
}

} // namespace cadb
