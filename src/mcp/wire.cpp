#include "wire.h"
#include "operations.h"
#include <QJsonDocument>
#include <QJsonParseError>

namespace cadb {

// ════════════════════════════════════════════════════════════════════
// Requests
// ════════════════════════════════════════════════════════════════════

bool decodeRequest(const QByteArray& line, WireRequest* out, QString* error) {
    QJsonParseError perr;
    QJsonDocument doc = QJsonDocument::fromJson(line, &perr);
    if (perr.error != QJsonParseError::NoError) {
        *error = QStringLiteral("Parse error: %1").arg(perr.errorString());
        return false;
    }
    if (!doc.isObject()) {
        *error = QStringLiteral("Request must be a JSON object");
        return false;
    }
    QJsonObject req = doc.object();
    out->id = req.contains("id") ? req.value("id") : QJsonValue();

    QJsonValue method = req.value("method");
    if (!method.isString() || method.toString().isEmpty()) {
        *error = QStringLiteral("Request needs a non-empty string 'method'");
        return false;
    }
    QJsonValue params = req.value("params");
    if (!params.isUndefined() && !params.isNull() && !params.isObject()) {
        *error = QStringLiteral("'params' must be an object");
        return false;
    }

    out->method = method.toString();
    out->params = params.toObject();
    return true;
}

QByteArray encodeRequest(const QJsonValue& id, const QString& method, const QJsonObject& params) {
    QJsonObject req{{"id", id}, {"method", method}, {"params", params}};
    QByteArray data = QJsonDocument(req).toJson(QJsonDocument::Compact);
    data.append('\n');
    return data;
}

Command toCommand(uint64_t commandId, const WireRequest& req) {
    if (req.method == executeMethodName())
        return Command::code(commandId, req.params.value("code").toString());
    return Command::structured(commandId, req.method, req.params);
}

// ════════════════════════════════════════════════════════════════════
// Responses
// ════════════════════════════════════════════════════════════════════

QByteArray encodeResponse(const QJsonValue& id, const Result& r) {
    QJsonObject resp{{"id", id}};
    if (r.ok()) {
        QJsonValue value = r.value.isUndefined() ? QJsonValue() : r.value;
        resp["result"] = QJsonObject{{"value", value}, {"stdout", r.stdoutText}};
        resp["error"]  = QJsonValue();
    } else {
        QJsonObject err{
            {"kind", QString::fromLatin1(errorKindToString(r.errorKind))},
            {"message", r.errorMessage}
        };
        if (!r.stdoutText.isEmpty()) err["stdout"] = r.stdoutText;
        resp["result"] = QJsonValue();
        resp["error"]  = err;
    }
    QByteArray data = QJsonDocument(resp).toJson(QJsonDocument::Compact);
    data.append('\n');
    return data;
}

bool decodeResponse(const QByteArray& line, QJsonValue* id, Result* out, QString* error) {
    QJsonParseError perr;
    QJsonDocument doc = QJsonDocument::fromJson(line, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        *error = QStringLiteral("Malformed response: %1")
                     .arg(perr.error != QJsonParseError::NoError ? perr.errorString()
                                                                 : QStringLiteral("not an object"));
        return false;
    }
    QJsonObject resp = doc.object();
    *id = resp.value("id");
    if (id->isUndefined()) *id = QJsonValue();

    QJsonValue errVal = resp.value("error");
    QJsonValue resVal = resp.value("result");
    if (errVal.isObject()) {
        QJsonObject err = errVal.toObject();
        bool known = false;
        ErrorKind kind = errorKindFromString(err.value("kind").toString(), &known);
        QString message = err.value("message").toString();
        if (!known)
            message = QStringLiteral("[%1] %2").arg(err.value("kind").toString(), message);
        *out = Result::failure(0, kind, message, err.value("stdout").toString());
        return true;
    }
    if (resVal.isObject()) {
        QJsonObject res = resVal.toObject();
        *out = Result::success(0, res.value("value"), res.value("stdout").toString());
        return true;
    }
    *error = QStringLiteral("Malformed response: neither 'result' nor 'error' present");
    return false;
}

// ════════════════════════════════════════════════════════════════════
// Framing
// ════════════════════════════════════════════════════════════════════

void LineFramer::append(const QByteArray& data) {
    if (m_overflow) return;
    if (m_pos > 0) {
        m_buf.remove(0, m_pos);
        m_lastNl = m_lastNl >= m_pos ? m_lastNl - m_pos : -1;
        m_pos = 0;
    }
    // Only the new bytes are searched
    qsizetype nl = data.lastIndexOf('\n');
    if (nl >= 0) m_lastNl = m_buf.size() + nl;
    m_buf.append(data);

    // A tail without a newline may not grow past the limit
    qsizetype tail = m_buf.size() - (m_lastNl + 1);
    if (m_max > 0 && tail > m_max) {
        m_overflow = true;
        clearBuffer();
    }
}

bool LineFramer::next(QByteArray* line) {
    while (!m_overflow && m_lastNl >= m_pos) {
        qsizetype idx = m_buf.indexOf('\n', m_pos);
        QByteArray raw = m_buf.mid(m_pos, idx - m_pos);
        m_pos = idx + 1;
        if (m_pos >= m_buf.size()) clearBuffer();
        if (m_max > 0 && raw.size() > m_max) {
            m_overflow = true;
            clearBuffer();
            return false;
        }
        raw = raw.trimmed();
        if (raw.isEmpty()) continue;
        *line = raw;
        return true;
    }
    return false;
}

bool LineFramer::hasPending() const {
    return !m_overflow && m_lastNl >= m_pos;
}

qint64 LineFramer::bufferedBytes() const {
    return m_buf.size() - m_pos;
}

void LineFramer::clear() {
    clearBuffer();
    m_overflow = false;
}

void LineFramer::clearBuffer() {
    m_buf.clear();
    m_pos = 0;
    m_lastNl = -1;
}

} // namespace cadb
