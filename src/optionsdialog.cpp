#include "optionsdialog.h"
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QFormLayout>
#include <QDialogButtonBox>
#include <QPushButton>
#include <QGroupBox>
#include <QLabel>
#include <QTreeWidgetItem>
#include <functional>

namespace cadb {

OptionsDialog::OptionsDialog(const BridgeConfig& current, QWidget* parent)
    : QDialog(parent), m_base(current)
{
    setWindowTitle("Options");
    setFixedSize(700, 450);

    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setSpacing(8);
    mainLayout->setContentsMargins(10, 10, 10, 10);

    auto* middleLayout = new QHBoxLayout;
    middleLayout->setSpacing(8);

    // Left column: search bar + tree
    auto* leftColumn = new QVBoxLayout;
    leftColumn->setSpacing(4);

    m_search = new QLineEdit;
    m_search->setPlaceholderText("Search Options (Ctrl+E)");
    m_search->setClearButtonEnabled(true);
    connect(m_search, &QLineEdit::textChanged, this, &OptionsDialog::filterTree);
    leftColumn->addWidget(m_search);

    m_tree = new QTreeWidget;
    m_tree->setHeaderHidden(true);
    m_tree->setRootIsDecorated(true);
    m_tree->setFixedWidth(200);

    auto* bridgeItem = new QTreeWidgetItem(m_tree, {"MCP Bridge"});
    auto* serverItem = new QTreeWidgetItem(bridgeItem, {"Server"});
    auto* execItem   = new QTreeWidgetItem(bridgeItem, {"Execution"});
    m_tree->expandAll();
    m_tree->setCurrentItem(serverItem);
    leftColumn->addWidget(m_tree, 1);

    middleLayout->addLayout(leftColumn);

    m_pages = new QStackedWidget;

    // -- Server page --
    auto* serverPage = new QWidget;
    auto* serverLayout = new QVBoxLayout(serverPage);
    serverLayout->setContentsMargins(0, 0, 0, 0);
    serverLayout->setSpacing(8);

    auto* endpointGroup = new QGroupBox("Endpoint");
    auto* endpointLayout = new QFormLayout(endpointGroup);
    endpointLayout->setSpacing(8);
    endpointLayout->setFieldGrowthPolicy(QFormLayout::ExpandingFieldsGrow);

    m_hostEdit = new QLineEdit(current.host);
    m_hostEdit->setObjectName("hostEdit");
    endpointLayout->addRow("Listen address:", m_hostEdit);

    m_portSpin = new QSpinBox;
    m_portSpin->setRange(1, 65535);
    m_portSpin->setValue(current.port ? current.port : 9876);
    m_portSpin->setObjectName("portSpin");
    endpointLayout->addRow("Port:", m_portSpin);

    auto* endpointDesc = new QLabel(
        "Address and TCP port the bridge listens on. CADB_HOST and CADB_PORT "
        "override these at startup. Default: 127.0.0.1:9876.");
    endpointDesc->setWordWrap(true);
    endpointLayout->addRow(endpointDesc);

    serverLayout->addWidget(endpointGroup);

    auto* connGroup = new QGroupBox("Connections");
    auto* connLayout = new QFormLayout(connGroup);
    connLayout->setSpacing(8);

    m_policyCombo = new QComboBox;
    m_policyCombo->addItem("Replace the connected client", int(ConnectionPolicy::Replace));
    m_policyCombo->addItem("Reject new clients", int(ConnectionPolicy::Reject));
    m_policyCombo->setCurrentIndex(current.connectionPolicy == ConnectionPolicy::Reject ? 1 : 0);
    m_policyCombo->setObjectName("policyCombo");
    connLayout->addRow("Second client:", m_policyCombo);

    m_autoStartCheck = new QCheckBox("Auto-start MCP server");
    m_autoStartCheck->setChecked(current.autoStart);
    connLayout->addRow(m_autoStartCheck);

    serverLayout->addWidget(connGroup);
    serverLayout->addStretch();

    m_pages->addWidget(serverPage);                      // index 0
    m_pageKeywords[serverItem] = collectPageKeywords(serverPage);

    // -- Execution page --
    auto* execPage = new QWidget;
    auto* execLayout = new QVBoxLayout(execPage);
    execLayout->setContentsMargins(0, 0, 0, 0);
    execLayout->setSpacing(8);

    auto* docGroup = new QGroupBox("Documents");
    auto* docLayout = new QVBoxLayout(docGroup);
    docLayout->setSpacing(4);

    m_autoDocCheck = new QCheckBox("Create a document when none is open");
    m_autoDocCheck->setChecked(current.autoCreateDocument);
    docLayout->addWidget(m_autoDocCheck);

    auto* docDesc = new QLabel(
        "When disabled, commands that need a document fail with NoActiveContext "
        "until one is created or opened.");
    docDesc->setWordWrap(true);
    docDesc->setContentsMargins(20, 0, 0, 0);  // indent under checkbox
    docLayout->addWidget(docDesc);

    execLayout->addWidget(docGroup);

    auto* limitGroup = new QGroupBox("Limits");
    auto* limitLayout = new QFormLayout(limitGroup);
    limitLayout->setSpacing(8);

    m_scriptSpin = new QSpinBox;
    m_scriptSpin->setRange(0, 3600000);
    m_scriptSpin->setSingleStep(1000);
    m_scriptSpin->setSuffix(" ms");
    m_scriptSpin->setSpecialValueText("Unlimited");
    m_scriptSpin->setValue(current.scriptTimeLimitMs);
    m_scriptSpin->setObjectName("scriptSpin");
    limitLayout->addRow("Script time limit:", m_scriptSpin);

    m_waitSpin = new QSpinBox;
    m_waitSpin->setRange(0, 3600000);
    m_waitSpin->setSingleStep(1000);
    m_waitSpin->setSuffix(" ms");
    m_waitSpin->setSpecialValueText("Unlimited");
    m_waitSpin->setValue(current.serverWaitMs);
    m_waitSpin->setObjectName("waitSpin");
    limitLayout->addRow("Server wait:", m_waitSpin);

    m_tickSpin = new QSpinBox;
    m_tickSpin->setRange(0, 1000);
    m_tickSpin->setSuffix(" ms");
    m_tickSpin->setValue(current.tickIntervalMs);
    m_tickSpin->setObjectName("tickSpin");
    limitLayout->addRow("Drain interval:", m_tickSpin);

    auto* limitDesc = new QLabel(
        "Scripts running longer than the time limit are aborted. The server wait "
        "answers Timeout when the UI thread does not finish a command in time.");
    limitDesc->setWordWrap(true);
    limitLayout->addRow(limitDesc);

    execLayout->addWidget(limitGroup);
    execLayout->addStretch();

    m_pages->addWidget(execPage);                        // index 1
    m_pageKeywords[execItem] = collectPageKeywords(execPage);

    middleLayout->addWidget(m_pages, 1);
    mainLayout->addLayout(middleLayout, 1);

    // Tree <-> page connection
    m_itemPageIndex[serverItem] = 0;
    m_itemPageIndex[execItem] = 1;
    connect(m_tree, &QTreeWidget::currentItemChanged, this,
            [this](QTreeWidgetItem* item, QTreeWidgetItem*) {
        if (!item) return;
        auto it = m_itemPageIndex.find(item);
        if (it != m_itemPageIndex.end())
            m_pages->setCurrentIndex(it.value());
    });

    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    mainLayout->addWidget(buttons);
}

BridgeConfig OptionsDialog::result() const {
    BridgeConfig r = m_base;
    QString host = m_hostEdit->text().trimmed();
    r.host               = host.isEmpty() ? BridgeConfig().host : host;
    r.port               = quint16(m_portSpin->value());
    r.connectionPolicy   = ConnectionPolicy(m_policyCombo->currentData().toInt());
    r.autoStart          = m_autoStartCheck->isChecked();
    r.autoCreateDocument = m_autoDocCheck->isChecked();
    r.scriptTimeLimitMs  = m_scriptSpin->value();
    r.serverWaitMs       = m_waitSpin->value();
    r.tickIntervalMs     = m_tickSpin->value();
    return r;
}

QStringList OptionsDialog::collectPageKeywords(QWidget* page) {
    QStringList keywords;
    for (auto* child : page->findChildren<QWidget*>()) {
        if (auto* label = qobject_cast<QLabel*>(child))
            keywords << label->text();
        else if (auto* cb = qobject_cast<QCheckBox*>(child))
            keywords << cb->text();
        else if (auto* gb = qobject_cast<QGroupBox*>(child))
            keywords << gb->title();
        else if (auto* combo = qobject_cast<QComboBox*>(child)) {
            for (int i = 0; i < combo->count(); ++i)
                keywords << combo->itemText(i);
        }
    }
    return keywords;
}

void OptionsDialog::filterTree(const QString& text) {
    std::function<bool(QTreeWidgetItem*)> filter = [&](QTreeWidgetItem* item) -> bool {
        bool anyChildVisible = false;
        for (int i = 0; i < item->childCount(); ++i) {
            if (filter(item->child(i)))
                anyChildVisible = true;
        }

        bool selfMatch = item->text(0).contains(text, Qt::CaseInsensitive);
        if (!selfMatch) {
            for (const auto& kw : m_pageKeywords.value(item)) {
                if (kw.contains(text, Qt::CaseInsensitive)) {
                    selfMatch = true;
                    break;
                }
            }
        }
        bool visible = selfMatch || anyChildVisible;
        item->setHidden(!visible);

        if (visible && item->childCount() > 0)
            item->setExpanded(true);

        return visible;
    };

    for (int i = 0; i < m_tree->topLevelItemCount(); ++i)
        filter(m_tree->topLevelItem(i));
}

} // namespace cadb
