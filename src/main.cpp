#include "mainwindow.h"
#include "mcp/dispatcher.h"
#include "mcp/mcp_bridge.h"
#include "optionsdialog.h"
#include "scene.h"
#include "scriptconsole.h"
#include "viewport.h"
#include "workspace.h"
#include <QApplication>
#include <QAction>
#include <QFileDialog>
#include <QFileInfo>
#include <QFont>
#include <QColor>
#include <QFutureWatcher>
#include <QHeaderView>
#include <QMenuBar>
#include <QMessageBox>
#include <QSettings>
#include <QStatusBar>

namespace cadb {

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
{
    resize(1280, 800);

    m_config = BridgeConfig::load();

    m_workspace = new Workspace(this);
    m_viewport = new ViewportWidget(m_workspace, this);
    setCentralWidget(m_viewport);

    // Bridge before the docks: the console submits through it
    m_mcp = new McpBridge(m_workspace, m_config, this);

    createWorkspaceDock();
    createConsoleDock();
    createMenus();
    createStatusBar();

    connect(m_workspace, &Workspace::changed, this, [this]() {
        rebuildWorkspaceModel();
        updateWindowTitle();
    });
    connect(m_mcp, &McpBridge::runningChanged, this, &MainWindow::updateBridgeStatus);
    connect(m_mcp, &McpBridge::clientConnected, this, &MainWindow::updateBridgeStatus);
    connect(m_mcp, &McpBridge::clientDisconnected, this, &MainWindow::updateBridgeStatus);
    connect(m_mcp, &McpBridge::commandFinished, this, &MainWindow::updateBridgeStatus);

    if (m_config.autoStart && !m_mcp->start())
        m_statusLabel->setText(QStringLiteral("MCP server failed to start on %1:%2")
                                   .arg(m_config.host).arg(m_config.port));

    rebuildWorkspaceModel();
    updateWindowTitle();
    updateBridgeStatus();
}

template < typename...Args >
inline QAction* Qt5Qt6AddAction(QMenu* menu, const QString &text, const QKeySequence &shortcut, const QIcon &icon, Args&&...args)
{
    QAction *result = menu->addAction(icon, text);
    if (!shortcut.isEmpty())
        result->setShortcut(shortcut);
    QObject::connect(result, &QAction::triggered, std::forward<Args>(args)...);
    return result;
}

void MainWindow::createMenus() {
    // File
    auto* file = menuBar()->addMenu("&File");
    Qt5Qt6AddAction(file, "&New Document", QKeySequence::New, QIcon(), this, &MainWindow::newDocument);
    Qt5Qt6AddAction(file, "&Open...", QKeySequence::Open, QIcon(), this, &MainWindow::openFile);
    file->addSeparator();
    Qt5Qt6AddAction(file, "&Save", QKeySequence::Save, QIcon(), this, &MainWindow::saveFile);
    Qt5Qt6AddAction(file, "Save &As...", QKeySequence::SaveAs, QIcon(), this, &MainWindow::saveFileAs);
    file->addSeparator();
    Qt5Qt6AddAction(file, "&Close Document", QKeySequence(Qt::CTRL | Qt::Key_W), QIcon(), this, &MainWindow::closeFile);
    file->addSeparator();
    m_mcpAction = Qt5Qt6AddAction(file, m_mcp->isRunning() ? "Stop &MCP Server" : "Start &MCP Server",
                                  QKeySequence::UnknownKey, QIcon(), this, &MainWindow::toggleMcp);
    file->addSeparator();
    Qt5Qt6AddAction(file, "&Options...", QKeySequence::UnknownKey, QIcon(), this, &MainWindow::showOptionsDialog);
    file->addSeparator();
    Qt5Qt6AddAction(file, "E&xit", QKeySequence(Qt::Key_Close), QIcon(), this, &QMainWindow::close);

    // Create
    auto* create = menuBar()->addMenu("&Create");
    for (const auto& m : kPrimitiveMeta) {
        QString shape = QString::fromLatin1(m.name);
        Qt5Qt6AddAction(create, shape, QKeySequence::UnknownKey, QIcon(), this,
                        [this, shape]() { createPrimitive(shape); });
    }
    create->addSeparator();
    Qt5Qt6AddAction(create, "&Delete Selected", QKeySequence::Delete, QIcon(), this, &MainWindow::deleteSelection);

    // View
    auto* view = menuBar()->addMenu("&View");
    view->addAction(m_workspaceDock->toggleViewAction());
    view->addAction(m_consoleDock->toggleViewAction());

    // Help
    auto* help = menuBar()->addMenu("&Help");
    Qt5Qt6AddAction(help, "&About CadBridge", QKeySequence::UnknownKey, QIcon(), this, &MainWindow::about);
}

void MainWindow::createStatusBar() {
    m_statusLabel = new QLabel("Ready");
    m_statusLabel->setContentsMargins(10, 0, 0, 0);
    statusBar()->addWidget(m_statusLabel, 1);

    m_queueLabel = new QLabel;
    m_queueLabel->setContentsMargins(0, 0, 10, 0);
    statusBar()->addPermanentWidget(m_queueLabel);
}

// ── Bridge ──

void MainWindow::toggleMcp() {
    if (m_mcp->isRunning()) {
        m_mcp->stop();
        m_statusLabel->setText("MCP server stopped");
    } else if (m_mcp->start()) {
        m_statusLabel->setText(QStringLiteral("MCP server listening on %1:%2")
                                   .arg(m_mcp->config().host).arg(m_mcp->serverPort()));
    } else {
        m_statusLabel->setText("MCP server failed to start");
    }
    updateBridgeStatus();
}

void MainWindow::updateBridgeStatus() {
    m_mcpAction->setText(m_mcp->isRunning() ? "Stop &MCP Server" : "Start &MCP Server");
    QString state;
    if (!m_mcp->isRunning())
        state = "MCP: off";
    else
        state = QStringLiteral("MCP: %1:%2%3").arg(m_mcp->config().host).arg(m_mcp->serverPort())
                    .arg(m_mcp->hasClient() ? " (client)" : "");
    m_queueLabel->setText(QStringLiteral("%1  |  queued %2  |  total %3")
                              .arg(state)
                              .arg(m_mcp->dispatcher()->pendingCount())
                              .arg(m_mcp->dispatcher()->enqueuedCount()));
}

void MainWindow::showOptionsDialog() {
    OptionsDialog dlg(m_config, this);
    if (dlg.exec() != QDialog::Accepted) return;

    m_config = dlg.result();
    QSettings settings("CadBridge", "CadBridge");
    m_config.save(settings);
    m_mcp->setConfig(m_config);
    if (m_mcp->isRunning())
        m_statusLabel->setText("Settings saved; restart the MCP server to apply them");
    else
        m_statusLabel->setText("Settings saved");
}

// Local UI actions take the same queue as remote commands
void MainWindow::runLocal(const QString& method, const QJsonObject& params) {
    auto* watcher = new QFutureWatcher<Result>(this);
    connect(watcher, &QFutureWatcher<Result>::finished, this, [this, watcher, method]() {
        watcher->deleteLater();
        if (watcher->future().resultCount() == 0) return;
        Result r = watcher->result();
        updateWindowTitle();
        if (r.ok())
            m_statusLabel->setText(method + ": done");
        else
            m_statusLabel->setText(QStringLiteral("%1 failed: %2").arg(method, r.errorMessage));
    });
    watcher->setFuture(m_mcp->submit(method, params));
}

// ── Documents ──

void MainWindow::newDocument() {
    runLocal("new_document", {});
}

void MainWindow::openFile() {
    project_open();
}

void MainWindow::saveFile() {
    project_save(false);
}

void MainWindow::saveFileAs() {
    project_save(true);
}

void MainWindow::closeFile() {
    project_close();
}

bool MainWindow::project_open(const QString& path) {
    QString p = path;
    if (p.isEmpty())
        p = QFileDialog::getOpenFileName(this, "Open Document", {}, "CadBridge documents (*.cadb *.json);;All files (*)");
    if (p.isEmpty()) return false;
    runLocal("open_document", QJsonObject{{"path", p}});
    return true;
}

bool MainWindow::project_save(bool saveAs) {
    Document* doc = m_workspace->activeDocument();
    if (!doc) return false;
    QString p = doc->filePath;
    if (saveAs || p.isEmpty()) {
        p = QFileDialog::getSaveFileName(this, "Save Document", doc->name + ".cadb",
                                         "CadBridge documents (*.cadb *.json)");
        if (p.isEmpty()) return false;
    }
    runLocal("save_document", QJsonObject{{"path", p}});
    return true;
}

void MainWindow::project_close() {
    Document* doc = m_workspace->activeDocument();
    if (!doc) return;
    if (doc->modified) {
        auto answer = QMessageBox::question(this, "Close Document",
            QStringLiteral("%1 has unsaved changes. Close anyway?").arg(doc->name));
        if (answer != QMessageBox::Yes) return;
    }
    m_workspace->closeDocument(doc->name);
}

void MainWindow::createPrimitive(const QString& shape) {
    runLocal("create_primitive", QJsonObject{{"shape", shape}});
}

void MainWindow::deleteSelection() {
    Document* doc = m_workspace->activeDocument();
    if (!doc) return;
    QStringList names;
    for (const QString& s : doc->selection) {
        QString obj = s.section('.', 0, 0);
        if (!names.contains(obj)) names.append(obj);
    }
    for (const QString& n : names)
        runLocal("delete_object", QJsonObject{{"object_name", n}});
}

void MainWindow::about() {
    QMessageBox::about(this, "About CadBridge",
        "CadBridge\n\n"
        "A modeling host with an MCP bridge: remote clients run structured "
        "operations and Lua scripts on the UI thread over a local TCP connection.");
}

void MainWindow::updateWindowTitle() {
    Document* doc = m_workspace->activeDocument();
    if (!doc) {
        setWindowTitle("CadBridge");
        return;
    }
    QString name = doc->filePath.isEmpty() ? doc->name : QFileInfo(doc->filePath).fileName();
    if (doc->modified) name += " *";
    setWindowTitle(name + " - CadBridge");
}

// ── Workspace Dock ──

void MainWindow::createWorkspaceDock() {
    m_workspaceDock = new QDockWidget("Workspace", this);
    m_workspaceDock->setObjectName("WorkspaceDock");
    m_workspaceDock->setAllowedAreas(Qt::LeftDockWidgetArea | Qt::RightDockWidgetArea);
    m_workspaceDock->setFeatures(QDockWidget::DockWidgetClosable | QDockWidget::DockWidgetMovable);

    m_workspaceTree = new QTreeView(m_workspaceDock);
    m_workspaceModel = new QStandardItemModel(this);
    m_workspaceModel->setHorizontalHeaderLabels({"Name", "Type"});
    m_workspaceTree->setModel(m_workspaceModel);
    m_workspaceTree->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_workspaceTree->setExpandsOnDoubleClick(false);
    m_workspaceTree->header()->setStretchLastSection(true);

    // Double-click a document to activate it, an object to select it
    connect(m_workspaceTree, &QTreeView::doubleClicked, this, [this](const QModelIndex& index) {
        QModelIndex nameIdx = index.siblingAtColumn(0);
        QString docName = nameIdx.data(Qt::UserRole + 1).toString();
        QString objName = nameIdx.data(Qt::UserRole + 2).toString();
        if (objName.isEmpty()) {
            runLocal("set_active_document", QJsonObject{{"name", docName}});
            return;
        }
        Document* active = m_workspace->activeDocument();
        if (!active || active->name != docName) return;
        runLocal("select", QJsonObject{{"object_name", objName}});
    });

    m_workspaceDock->setWidget(m_workspaceTree);
    addDockWidget(Qt::LeftDockWidgetArea, m_workspaceDock);
}

void MainWindow::createConsoleDock() {
    m_consoleDock = new QDockWidget("Script Console", this);
    m_consoleDock->setObjectName("ConsoleDock");
    m_consoleDock->setAllowedAreas(Qt::BottomDockWidgetArea | Qt::RightDockWidgetArea);
    m_console = new ScriptConsole(m_mcp, m_consoleDock);
    m_consoleDock->setWidget(m_console);
    addDockWidget(Qt::BottomDockWidgetArea, m_consoleDock);
}

void MainWindow::rebuildWorkspaceModel() {
    m_workspaceModel->removeRows(0, m_workspaceModel->rowCount());
    Document* active = m_workspace->activeDocument();

    for (Document* doc : m_workspace->documents()) {
        auto* docItem = new QStandardItem(doc->modified ? doc->name + " *" : doc->name);
        docItem->setData(doc->name, Qt::UserRole + 1);
        if (doc == active) {
            QFont f = docItem->font();
            f.setBold(true);
            docItem->setFont(f);
        }
        auto* docType = new QStandardItem("Document");

        for (const auto& obj : doc->objects) {
            auto* objItem = new QStandardItem(obj.label.isEmpty() ? obj.name : obj.label);
            objItem->setData(doc->name, Qt::UserRole + 1);
            objItem->setData(obj.name, Qt::UserRole + 2);
            if (doc->selection.contains(obj.name))
                objItem->setForeground(QColor(0xf0, 0x9a, 0x20));
            auto* objType = new QStandardItem(QString::fromLatin1(primitiveToString(obj.kind)));
            docItem->appendRow({objItem, objType});
        }
        m_workspaceModel->appendRow({docItem, docType});
    }
    m_workspaceTree->expandAll();
}

} // namespace cadb

// ── Entry point ──

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("CadBridge");
    app.setOrganizationName("CadBridge");
    app.setStyle("Fusion");

    cadb::MainWindow window;
    window.show();

    return app.exec();
}
