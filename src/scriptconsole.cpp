#include "scriptconsole.h"
#include "mcp/executor.h"
#include "mcp/mcp_bridge.h"
#include <QHBoxLayout>
#include <QJsonDocument>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QSettings>
#include <QShortcut>
#include <QSplitter>
#include <QVBoxLayout>
#include <Qsci/qsciscintilla.h>
#include <Qsci/qscilexerlua.h>

namespace cadb {

namespace {

QString valueText(const QJsonValue& v) {
    if (v.isObject())
        return QString::fromUtf8(QJsonDocument(v.toObject()).toJson(QJsonDocument::Indented));
    if (v.isArray())
        return QString::fromUtf8(QJsonDocument(v.toArray()).toJson(QJsonDocument::Indented));
    if (v.isString()) return v.toString();
    if (v.isBool())   return v.toBool() ? "true" : "false";
    if (v.isDouble()) return QString::number(v.toDouble(), 'g', 15);
    return QString();
}

} // namespace

ScriptConsole::ScriptConsole(McpBridge* bridge, QWidget* parent)
    : QWidget(parent), m_bridge(bridge)
{
    QFont f(QSettings("CadBridge", "CadBridge").value("font", "JetBrains Mono").toString(), 11);
    f.setFixedPitch(true);

    m_editor = new QsciScintilla(this);
    m_editor->setUtf8(true);
    m_editor->setFont(f);
    m_editor->setTabWidth(4);
    m_editor->setIndentationsUseTabs(false);
    m_editor->setAutoIndent(true);
    m_editor->setMarginType(0, QsciScintilla::NumberMargin);
    m_editor->setMarginWidth(0, "0000");
    m_editor->setMarginsFont(f);
    m_editor->setMarginWidth(1, 0);

    // Lexer first: setLexer() resets caret line and selection colors
    auto* lexer = new QsciLexerLua(m_editor);
    lexer->setDefaultFont(f);
    for (int i = 0; i <= 127; i++)
        lexer->setFont(f, i);
    m_editor->setLexer(lexer);
    m_editor->setBraceMatching(QsciScintilla::SloppyBraceMatch);
    m_editor->setCaretLineVisible(true);
    m_editor->setText("-- cad.call(name, args) runs an operation; print() goes to the output\n"
                      "local box = cad.call(\"create_primitive\", {shape = \"Box\"})\n"
                      "print(box.name, box.dimensions.volume)\n");

    m_output = new QPlainTextEdit(this);
    m_output->setReadOnly(true);
    m_output->setFont(f);
    m_output->setObjectName("scriptOutput");

    m_runBtn = new QPushButton("Run (Ctrl+Return)", this);
    auto* resetBtn = new QPushButton("Reset Session", this);
    auto* clearBtn = new QPushButton("Clear", this);
    connect(m_runBtn, &QPushButton::clicked, this, &ScriptConsole::runScript);
    connect(resetBtn, &QPushButton::clicked, this, &ScriptConsole::resetSession);
    connect(clearBtn, &QPushButton::clicked, m_output, &QPlainTextEdit::clear);

    auto* run = new QShortcut(QKeySequence(Qt::CTRL | Qt::Key_Return), m_editor);
    run->setContext(Qt::WidgetWithChildrenShortcut);
    connect(run, &QShortcut::activated, this, &ScriptConsole::runScript);

    auto* buttons = new QHBoxLayout;
    buttons->setContentsMargins(0, 0, 0, 0);
    buttons->addWidget(m_runBtn);
    buttons->addWidget(resetBtn);
    buttons->addStretch();
    buttons->addWidget(clearBtn);

    auto* split = new QSplitter(Qt::Vertical, this);
    split->addWidget(m_editor);
    split->addWidget(m_output);
    split->setStretchFactor(0, 3);
    split->setStretchFactor(1, 2);

    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(4, 4, 4, 4);
    layout->addWidget(split, 1);
    layout->addLayout(buttons);

    connect(&m_watcher, &QFutureWatcher<Result>::finished, this, &ScriptConsole::onFinished);
}

void ScriptConsole::runScript() {
    if (m_watcher.isRunning()) return;   // one local run at a time
    QString code = m_editor->hasSelectedText() ? m_editor->selectedText() : m_editor->text();
    if (code.trimmed().isEmpty()) return;
    m_runBtn->setEnabled(false);
    m_watcher.setFuture(m_bridge->submitCode(code));
}

void ScriptConsole::resetSession() {
    m_bridge->executor().script().reset();
    appendOutput("-- session reset --");
}

void ScriptConsole::onFinished() {
    m_runBtn->setEnabled(true);
    if (m_watcher.future().resultCount() == 0) return;
    Result r = m_watcher.result();

    if (!r.stdoutText.isEmpty())
        appendOutput(r.stdoutText.endsWith('\n') ? r.stdoutText.chopped(1) : r.stdoutText);
    if (r.ok()) {
        QString v = valueText(r.value);
        if (!v.isEmpty()) appendOutput("=> " + v);
    } else {
        appendOutput(QStringLiteral("%1: %2").arg(QLatin1String(errorKindToString(r.errorKind)),
                                                  r.errorMessage), true);
    }
    emit scriptFinished(r.ok());
}

void ScriptConsole::appendOutput(const QString& text, bool error) {
    if (error)
        m_output->appendHtml(QStringLiteral("<span style=\"color:#d04040\">%1</span>")
                                 .arg(text.toHtmlEscaped().replace('\n', "<br>")));
    else
        m_output->appendPlainText(text);
}

} // namespace cadb
