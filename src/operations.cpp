#include "operations.h"
#include "scene.h"
#include <QDebug>
#include <climits>
#include <cmath>

namespace cadb {

const char* paramTypeToString(ParamType t) {
    switch (t) {
    case ParamType::String:  return "string";
    case ParamType::Number:  return "number";
    case ParamType::Integer: return "integer";
    case ParamType::Boolean: return "boolean";
    case ParamType::Array:   return "array";
    case ParamType::Object:  return "object";
    case ParamType::Vector3: return "vector3";
    }
    return "unknown";
}

namespace {

bool matches(ParamType t, const QJsonValue& v) {
    switch (t) {
    case ParamType::String:  return v.isString();
    case ParamType::Number:  return v.isDouble();
    case ParamType::Integer: {
        if (!v.isDouble()) return false;
        // Handlers read integers with toInt(), so the range is that of int
        double d = v.toDouble();
        return std::isfinite(d) && std::floor(d) == d
            && d >= double(INT_MIN) && d <= double(INT_MAX);
    }
    case ParamType::Boolean: return v.isBool();
    case ParamType::Array:   return v.isArray();
    case ParamType::Object:  return v.isObject();
    case ParamType::Vector3: {
        QVector3D unused;
        return vecFromJson(v, &unused);
    }
    }
    return false;
}

} // namespace

QJsonObject OperationSpec::describe() const {
    QJsonObject props;
    QJsonArray required;
    for (const auto& p : params) {
        QJsonObject pj{{"type", paramTypeToString(p.type)}};
        if (!p.description.isEmpty()) pj["description"] = p.description;
        props[p.name] = pj;
        if (p.required) required.append(p.name);
    }
    QJsonObject schema{{"type", "object"}, {"properties", props}};
    if (!required.isEmpty()) schema["required"] = required;
    return QJsonObject{
        {"name", name},
        {"description", description},
        {"inputSchema", schema}
    };
}

bool OperationRegistry::add(OperationSpec spec) {
    if (m_index.contains(spec.name)) {
        qWarning() << "[Operations] Operation already registered:" << spec.name;
        return false;
    }
    m_index.insert(spec.name, m_ops.size());
    m_ops.append(std::move(spec));
    return true;
}

const OperationSpec* OperationRegistry::find(const QString& name) const {
    auto it = m_index.constFind(name);
    return it == m_index.constEnd() ? nullptr : &m_ops[it.value()];
}

QStringList OperationRegistry::names() const {
    QStringList out;
    for (const auto& op : m_ops) out.append(op.name);
    return out;
}

QJsonArray OperationRegistry::describe() const {
    QJsonArray out;
    for (const auto& op : m_ops) out.append(op.describe());
    return out;
}

ValidationResult OperationRegistry::validate(const QString& method, const QJsonObject& args) const {
    const OperationSpec* spec = find(method);
    if (!spec)
        return {false, ErrorKind::UnknownMethod, QStringLiteral("Unknown method: %1").arg(method)};
    return validateArgs(*spec, args);
}

ValidationResult OperationRegistry::validateArgs(const OperationSpec& spec, const QJsonObject& args) {
    for (const auto& p : spec.params) {
        if (!args.contains(p.name)) {
            if (p.required)
                return {false, ErrorKind::InvalidArguments,
                        QStringLiteral("%1: missing required argument '%2'").arg(spec.name, p.name)};
            continue;
        }
        if (!matches(p.type, args.value(p.name)))
            return {false, ErrorKind::InvalidArguments,
                    QStringLiteral("%1: argument '%2' must be %3")
                        .arg(spec.name, p.name, QString::fromLatin1(paramTypeToString(p.type)))};
    }
    for (auto it = args.begin(); it != args.end(); ++it) {
        bool known = false;
        for (const auto& p : spec.params)
            if (p.name == it.key()) { known = true; break; }
        if (!known)
            return {false, ErrorKind::InvalidArguments,
                    QStringLiteral("%1: unknown argument '%2'").arg(spec.name, it.key())};
    }
    return {};
}

} // namespace cadb
