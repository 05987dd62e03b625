#pragma once
#include "core.h"
#include <QString>
#include <QStringList>
#include <QVector>
#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <functional>

namespace cadb {

class HostContext;

enum class ParamType : uint8_t {
    String, Number, Integer, Boolean, Array, Object, Vector3
};

const char* paramTypeToString(ParamType t);

struct ParamSpec {
    QString   name;
    ParamType type     = ParamType::String;
    bool      required = false;
    QString   description;
};

// Handlers run on the UI thread. They return the command's value and report
// failure by throwing OperationError.
using OperationFn = std::function<QJsonValue(const QJsonObject& args, HostContext& host)>;

struct OperationSpec {
    QString            name;
    QString            description;
    QVector<ParamSpec> params;
    bool               needsDocument = true;   // executor ensures an active document
    OperationFn        fn;

    QJsonObject describe() const;
};

struct ValidationResult {
    bool      ok = true;
    ErrorKind kind = ErrorKind::None;
    QString   error;
};

/**
 * Catalog of structured operations the executor can run.
 *
 * Populated on the UI thread before the bridge starts and read-only
 * afterwards, so the transport thread may look up and validate requests
 * without locking.
 */
class OperationRegistry {
public:
    bool add(OperationSpec spec);
    const OperationSpec* find(const QString& name) const;
    bool contains(const QString& name) const { return find(name) != nullptr; }
    QStringList names() const;
    QJsonArray describe() const;

    // Checks that the method exists and that `args` matches its parameter
    // shapes. Unknown argument keys are rejected.
    ValidationResult validate(const QString& method, const QJsonObject& args) const;
    static ValidationResult validateArgs(const OperationSpec& spec, const QJsonObject& args);

private:
    QVector<OperationSpec> m_ops;
    QHash<QString, int>    m_index;
};

// Structured operations of the reference host (documents, primitives,
// selection, introspection, capture, persistence) plus "execute".
void registerBuiltinOperations(OperationRegistry& registry);

// Name of the code-execution method.
inline const QString& executeMethodName() {
    static const QString s = QStringLiteral("execute");
    return s;
}

} // namespace cadb
