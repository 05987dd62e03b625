#pragma once
#include <QString>
#include <QJsonObject>
#include <QJsonValue>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace cadb {

// ── Error taxonomy ──

enum class ErrorKind : uint8_t {
    None,
    ProtocolError,
    UnknownMethod,
    InvalidArguments,
    NoActiveContext,
    ExecutionError,
    ShutdownError,
    BridgeClosed,
    Timeout,
    ConnectionLost
};

struct ErrorMeta {
    ErrorKind   kind;
    const char* name;       // stable wire name
    bool        transport;  // raised by the transport/client, never by the host
};

inline constexpr ErrorMeta kErrorMeta[] = {
    // kind                          name                 transport
    {ErrorKind::None,             "None",             false},
    {ErrorKind::ProtocolError,    "ProtocolError",    true },
    {ErrorKind::UnknownMethod,    "UnknownMethod",    false},
    {ErrorKind::InvalidArguments, "InvalidArguments", false},
    {ErrorKind::NoActiveContext,  "NoActiveContext",  false},
    {ErrorKind::ExecutionError,   "ExecutionError",   false},
    {ErrorKind::ShutdownError,    "ShutdownError",    false},
    {ErrorKind::BridgeClosed,     "BridgeClosed",     true },
    {ErrorKind::Timeout,          "Timeout",          true },
    {ErrorKind::ConnectionLost,   "ConnectionLost",   true },
};

inline constexpr const ErrorMeta* errorMeta(ErrorKind k) {
    for (const auto& m : kErrorMeta)
        if (m.kind == k) return &m;
    return nullptr;
}

inline const char* errorKindToString(ErrorKind k) {
    auto* m = errorMeta(k);
    return m ? m->name : "Unknown";
}

inline ErrorKind errorKindFromString(const QString& s, bool* ok = nullptr) {
    for (const auto& m : kErrorMeta) {
        if (s == m.name) {
            if (ok) *ok = true;
            return m.kind;
        }
    }
    if (ok) *ok = false;
    return ErrorKind::ExecutionError;
}

// Thrown by operation handlers. The executor turns it into an error Result;
// it never leaves the UI thread's drain step.
class OperationError : public std::runtime_error {
public:
    OperationError(ErrorKind kind, const QString& message)
        : std::runtime_error(message.toStdString()), m_kind(kind) {}
    explicit OperationError(const QString& message)
        : OperationError(ErrorKind::ExecutionError, message) {}

    ErrorKind kind() const { return m_kind; }
    QString message() const { return QString::fromStdString(what()); }

private:
    ErrorKind m_kind;
};

// ── Command ──

enum class CommandKind : uint8_t { Structured, Code };

struct Command {
    uint64_t    id       = 0;
    CommandKind kind     = CommandKind::Structured;
    QString     method;          // operation name ("execute" for code)
    QJsonObject params;
    QString     source;          // code payload, Code commands only
    qint64      issuedAt = 0;    // ms since epoch

    static Command structured(uint64_t id, const QString& method, const QJsonObject& params);
    static Command code(uint64_t id, const QString& source);
};

// ── Result ──

enum class ResultStatus : uint8_t { Ok, Error };

struct Result {
    uint64_t     commandId = 0;
    ResultStatus status    = ResultStatus::Ok;
    QJsonValue   value;                 // null unless the command produced one
    QString      stdoutText;
    ErrorKind    errorKind = ErrorKind::None;
    QString      errorMessage;

    bool ok() const { return status == ResultStatus::Ok; }

    static Result success(uint64_t id, const QJsonValue& value = QJsonValue(),
                          const QString& out = {});
    static Result failure(uint64_t id, ErrorKind kind, const QString& message,
                          const QString& out = {});
};

} // namespace cadb
