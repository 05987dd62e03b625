#pragma once
#include "core.h"
#include <QWidget>
#include <QFutureWatcher>

class QsciScintilla;
class QPlainTextEdit;
class QPushButton;

namespace cadb {

class McpBridge;

// Lua editor + output pane. Code goes through the bridge's dispatcher, so
// local runs share the script session and queue with remote clients.
class ScriptConsole : public QWidget {
    Q_OBJECT
public:
    explicit ScriptConsole(McpBridge* bridge, QWidget* parent = nullptr);

    QsciScintilla*  editor() const { return m_editor; }
    QPlainTextEdit* output() const { return m_output; }

public slots:
    void runScript();
    void resetSession();

signals:
    void scriptFinished(bool ok);

private:
    void onFinished();
    void appendOutput(const QString& text, bool error = false);

    McpBridge*             m_bridge;
    QsciScintilla*         m_editor  = nullptr;
    QPlainTextEdit*        m_output  = nullptr;
    QPushButton*           m_runBtn  = nullptr;
    QFutureWatcher<Result> m_watcher;
};

} // namespace cadb
