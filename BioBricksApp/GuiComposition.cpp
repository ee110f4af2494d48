#include "GuiComposition.h"
#include <QHeaderView>
#include <QLineEdit>
#include <QVBoxLayout>
#include "CompositionPlotWidget.h"

namespace BioGui {
using namespace BioEngine;

static const char INVALID_NUMBER[]{"Enter a valid number"};

// =========================================================
// TABLE MODEL
// =========================================================

CompositionTableModel::CompositionTableModel(ConversionEngine *engine, QObject *p)
    : QAbstractTableModel(p)
    , m_engine(engine)
{
    // Набор строк фиксирован, меняются только значения
    connect(m_engine,
            &ConversionEngine::stateChanged,
            this,
            &CompositionTableModel::onStateChanged);
}

void CompositionTableModel::onStateChanged()
{
    const int rows = rowCount();
    if (rows == 0)
        return;
    emit dataChanged(index(0, Col_Quantity), index(rows - 1, Col_Share), {Qt::DisplayRole});
}

int CompositionTableModel::rowCount(const QModelIndex &) const
{
    return m_engine->orderedEntries().size();
}
int CompositionTableModel::columnCount(const QModelIndex &) const
{
    return Col_Count;
}

QVariant CompositionTableModel::data(const QModelIndex &idx, int role) const
{
    const auto entries = m_engine->orderedEntries();
    if (!idx.isValid() || idx.row() >= entries.size())
        return {};

    const MaterialEntry &entry = entries[idx.row()];

    if (role == Qt::DisplayRole) {
        switch (idx.column()) {
        case Col_Label:
            return entry.label;
        case Col_Quantity:
            return QString::number(entry.quantity, 'f', 2);
        case Col_Share:
            return QString::number(m_engine->share(entry.label), 'f', 0) + " %";
        }
    }

    if (role == Qt::EditRole && idx.column() == Col_Quantity)
        return entry.quantity;

    if (role == Qt::DecorationRole && idx.column() == Col_Label)
        return CompositionPlotWidget::entryColor(idx.row());

    if (role == Qt::TextAlignmentRole && idx.column() != Col_Label)
        return int(Qt::AlignRight | Qt::AlignVCenter);

    return {};
}

bool CompositionTableModel::setData(const QModelIndex &idx, const QVariant &val, int role)
{
    if (role != Qt::EditRole || idx.column() != Col_Quantity)
        return false;

    // Делегат передает текст как есть
    bool ok{false};
    double kg = val.toString().trimmed().toDouble(&ok);
    if (!ok) {
        emit invalidInput(INVALID_NUMBER);
        return false;
    }

    const QString label = index(idx.row(), Col_Label).data().toString();
    UpdateResult res = m_engine->updateValue(label, kg);
    if (res != UpdateResult::Ok) {
        emit invalidInput(resultText(res));
        return false;
    }
    // dataChanged придет через stateChanged
    return true;
}

QVariant CompositionTableModel::headerData(int sec, Qt::Orientation o, int r) const
{
    if (r == Qt::DisplayRole && o == Qt::Horizontal) {
        switch (sec) {
        case Col_Label:
            return "Material";
        case Col_Quantity:
            return "Quantity (kg)";
        case Col_Share:
            return "Share";
        }
    }
    return {};
}

Qt::ItemFlags CompositionTableModel::flags(const QModelIndex &idx) const
{
    if (!idx.isValid())
        return Qt::NoItemFlags;

    if (idx.column() == Col_Quantity)
        return Qt::ItemIsEnabled | Qt::ItemIsSelectable | Qt::ItemIsEditable;

    return Qt::ItemIsEnabled | Qt::ItemIsSelectable;
}

// =========================================================
// DELEGATE
// =========================================================

QuantityDelegate::QuantityDelegate(QObject *p)
    : QStyledItemDelegate(p)
{}

QWidget *QuantityDelegate::createEditor(QWidget *p,
                                        const QStyleOptionViewItem &,
                                        const QModelIndex &idx) const
{
    if (idx.column() != CompositionTableModel::Col_Quantity)
        return nullptr;
    return new QLineEdit(p);
}

void QuantityDelegate::setEditorData(QWidget *e, const QModelIndex &idx) const
{
    if (auto *le = qobject_cast<QLineEdit *>(e)) {
        double kg = idx.model()->data(idx, Qt::EditRole).toDouble();
        le->setText(QString::number(kg));
        le->selectAll();
    }
}

void QuantityDelegate::setModelData(QWidget *e, QAbstractItemModel *m, const QModelIndex &idx) const
{
    if (auto *le = qobject_cast<QLineEdit *>(e)) {
        m->setData(idx, le->text(), Qt::EditRole);
    }
}

// =========================================================
// WIDGET
// =========================================================

CompositionWidget::CompositionWidget(ConversionEngine *engine, QWidget *p)
    : QWidget(p)
    , m_engine(engine)
{
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);

    m_plot = new CompositionPlotWidget(this);
    m_plot->setMinimumHeight(180);
    layout->addWidget(m_plot, 1);

    m_model = new CompositionTableModel(engine, this);
    m_view = new QTableView(this);

    m_view->setModel(m_model);
    m_view->setItemDelegate(new QuantityDelegate(this));

    m_view->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_view->setAlternatingRowColors(true);
    m_view->verticalHeader()->setVisible(false);
    m_view->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
    m_view->horizontalHeader()->setSectionResizeMode(CompositionTableModel::Col_Share,
                                                     QHeaderView::ResizeToContents);
    layout->addWidget(m_view, 1);

    connect(m_model, &CompositionTableModel::invalidInput, this, &CompositionWidget::invalidInput);
    connect(m_engine, &ConversionEngine::stateChanged, this, &CompositionWidget::refreshPlot);

    refreshPlot();
}

void CompositionWidget::refreshPlot()
{
    m_plot->setComposition(m_engine->orderedEntries(), m_engine->totalAvailableWaste());
}

} // namespace BioGui
