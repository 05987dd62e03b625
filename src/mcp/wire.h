#pragma once
#include "core.h"
#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

namespace cadb {

// Newline-delimited compact JSON.
//
//   request:  {"id": any, "method": string, "params": object}
//   response: {"id": <echo>,
//              "result": {"value": any, "stdout": string} | null,
//              "error":  {"kind": string, "message": string, "stdout"?: string} | null}

struct WireRequest {
    QJsonValue  id;          // echoed verbatim, may be null
    QString     method;
    QJsonObject params;
};

bool decodeRequest(const QByteArray& line, WireRequest* out, QString* error);
QByteArray encodeRequest(const QJsonValue& id, const QString& method, const QJsonObject& params);

QByteArray encodeResponse(const QJsonValue& id, const Result& r);
bool decodeResponse(const QByteArray& line, QJsonValue* id, Result* out, QString* error);

// "execute" becomes a code command, everything else a structured one.
Command toCommand(uint64_t commandId, const WireRequest& req);

/**
 * Splits a byte stream into lines. A line (or an unterminated tail) longer
 * than maxBytes puts the framer into the overflow state; the connection is
 * expected to be dropped then.
 */
class LineFramer {
public:
    explicit LineFramer(qint64 maxBytes = 64 * 1024 * 1024) : m_max(maxBytes) {}

    void append(const QByteArray& data);
    // Next complete, non-blank line without its terminator.
    bool next(QByteArray* line);
    bool overflow() const { return m_overflow; }
    bool hasPending() const;
    qint64 bufferedBytes() const;
    void clear();

    void   setMaxBytes(qint64 n) { m_max = n; }
    qint64 maxBytes() const { return m_max; }

private:
    void clearBuffer();

    QByteArray m_buf;
    qsizetype  m_pos = 0;      // start of unconsumed bytes
    qsizetype  m_lastNl = -1;  // last '\n' in m_buf, -1 if none
    qint64     m_max;
    bool       m_overflow = false;
};

} // namespace cadb
