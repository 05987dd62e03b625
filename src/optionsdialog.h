#pragma once
#include "config.h"
#include <QDialog>
#include <QLineEdit>
#include <QTreeWidget>
#include <QStackedWidget>
#include <QComboBox>
#include <QCheckBox>
#include <QHash>
#include <QSpinBox>

namespace cadb {

// Edits the persisted bridge settings. Changes to the endpoint take effect
// on the next server start.
class OptionsDialog : public QDialog {
    Q_OBJECT
public:
    explicit OptionsDialog(const BridgeConfig& current, QWidget* parent = nullptr);

    BridgeConfig result() const;

private:
    void filterTree(const QString& text);
    static QStringList collectPageKeywords(QWidget* page);

    BridgeConfig    m_base;   // fields without an editor pass through

    QLineEdit*      m_search         = nullptr;
    QTreeWidget*    m_tree           = nullptr;
    QStackedWidget* m_pages          = nullptr;
    QLineEdit*      m_hostEdit       = nullptr;
    QSpinBox*       m_portSpin       = nullptr;
    QComboBox*      m_policyCombo    = nullptr;
    QCheckBox*      m_autoStartCheck = nullptr;
    QCheckBox*      m_autoDocCheck   = nullptr;
    QSpinBox*       m_scriptSpin     = nullptr;
    QSpinBox*       m_waitSpin       = nullptr;
    QSpinBox*       m_tickSpin       = nullptr;

    // searchable keywords per leaf tree item
    QHash<QTreeWidgetItem*, QStringList> m_pageKeywords;
    // tree item → stacked widget page index
    QHash<QTreeWidgetItem*, int> m_itemPageIndex;
};

} // namespace cadb
