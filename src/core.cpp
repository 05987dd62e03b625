#include "core.h"
#include <QDateTime>

namespace cadb {

Command Command::structured(uint64_t id, const QString& method, const QJsonObject& params) {
    Command c;
    c.id       = id;
    c.kind     = CommandKind::Structured;
    c.method   = method;
    c.params   = params;
    c.issuedAt = QDateTime::currentMSecsSinceEpoch();
    return c;
}

Command Command::code(uint64_t id, const QString& source) {
    Command c;
    c.id       = id;
    c.kind     = CommandKind::Code;
    c.method   = QStringLiteral("execute");
    c.params   = QJsonObject{{"code", source}};
    c.source   = source;
    c.issuedAt = QDateTime::currentMSecsSinceEpoch();
    return c;
}

Result Result::success(uint64_t id, const QJsonValue& value, const QString& out) {
    Result r;
    r.commandId  = id;
    r.status     = ResultStatus::Ok;
    r.value      = value;
    r.stdoutText = out;
    return r;
}

Result Result::failure(uint64_t id, ErrorKind kind, const QString& message, const QString& out) {
    Result r;
    r.commandId    = id;
    r.status       = ResultStatus::Error;
    r.errorKind    = kind;
    r.errorMessage = message;
    r.stdoutText   = out;
    return r;
}

} // namespace cadb
