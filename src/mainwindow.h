#pragma once
#include "config.h"
#include <QMainWindow>
#include <QLabel>
#include <QDockWidget>
#include <QTreeView>
#include <QStandardItemModel>
#include <QJsonObject>

namespace cadb {

class McpBridge;
class ScriptConsole;
class ViewportWidget;
class Workspace;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(QWidget* parent = nullptr);

    Workspace* workspace() const { return m_workspace; }
    McpBridge* bridge() const { return m_mcp; }

private slots:
    void newDocument();
    void openFile();
    void saveFile();
    void saveFileAs();
    void closeFile();
    void createPrimitive(const QString& shape);
    void deleteSelection();

    void about();
    void toggleMcp();
    void showOptionsDialog();

public:
    // Document lifecycle, shared by menus and tests
    bool project_open(const QString& path = {});
    bool project_save(bool saveAs = false);
    void project_close();

private:
    Workspace*      m_workspace = nullptr;
    ViewportWidget* m_viewport  = nullptr;
    ScriptConsole*  m_console   = nullptr;
    McpBridge*      m_mcp       = nullptr;
    QAction*        m_mcpAction = nullptr;
    QLabel*         m_statusLabel = nullptr;
    QLabel*         m_queueLabel  = nullptr;
    BridgeConfig    m_config;

    void createMenus();
    void createStatusBar();
    void updateWindowTitle();
    void updateBridgeStatus();
    void runLocal(const QString& method, const QJsonObject& params);

    // Workspace dock
    QDockWidget*        m_workspaceDock  = nullptr;
    QTreeView*          m_workspaceTree  = nullptr;
    QStandardItemModel* m_workspaceModel = nullptr;
    QDockWidget*        m_consoleDock    = nullptr;
    void createWorkspaceDock();
    void createConsoleDock();
    void rebuildWorkspaceModel();
};

} // namespace cadb
